#include <gtest/gtest.h>

#include "infra/Error.hpp"
#include "parser/DatalogParser.hpp"
#include "semana/ProgramAnalysis.hpp"

using namespace deltalog;

namespace {
std::vector<std::string> render(const std::vector<ast::Atom>& atoms) {
   std::vector<std::string> result;
   for (auto& a : atoms) result.push_back(a.toString());
   return result;
}
std::string semanticError(const ast::Program& program) {
   try {
      extractDeltaPredicates(program);
   } catch (const SemanticError& e) {
      return e.what();
   }
   return {};
}
}

TEST(ProgramAnalysis, SingleQuery) {
   auto program = DatalogParser::parse("p(X) :- q(X).\n?- p(X).\n");
   EXPECT_EQ(getQuery(program).getHead().toString(), "p(X)");
}

TEST(ProgramAnalysis, QueryCount) {
   try {
      getQuery(DatalogParser::parse("p(X) :- q(X)."));
      FAIL() << "expected a semantic error";
   } catch (const SemanticError& e) {
      EXPECT_STREQ(e.what(), "The program has no query");
   }
   try {
      getQuery(DatalogParser::parse("?- p(X).\n?- q(X)."));
      FAIL() << "expected a semantic error";
   } catch (const SemanticError& e) {
      EXPECT_STREQ(e.what(), "The program has more than one query");
   }
}

TEST(ProgramAnalysis, CanonicalDeltaPredicates) {
   auto program = DatalogParser::parse("+ins_price(N, A) :- offer(N, A).\n"
                                       "+ins_price(X, Y) :- bargain(X, Y).\n"
                                       "-old(K) :- old(K), K < 2000.\n");
   EXPECT_EQ(render(extractDeltaPredicates(program)), (std::vector<std::string>{"+ins_price(COL0, COL1)", "-old(COL0)"}));
}

TEST(ProgramAnalysis, DeltaPredicatesIgnoreRuleOrder) {
   auto first = DatalogParser::parse("+p(X) :- a(X).\n-p(X) :- b(X).\n");
   auto second = DatalogParser::parse("-p(X) :- b(X).\n+p(X) :- a(X).\n");
   EXPECT_EQ(render(extractDeltaPredicates(first)), render(extractDeltaPredicates(second)));
   EXPECT_EQ(render(extractDeltaPredicates(first)), (std::vector<std::string>{"+p(COL0)"}));
}

TEST(ProgramAnalysis, NoUpdate) {
   EXPECT_EQ(semanticError(DatalogParser::parse("p(X) :- q(X).\n?- p(X).")), "The program has no update");
   EXPECT_EQ(semanticError(DatalogParser::parse("+p(X) :- q(X).")), "");
}

TEST(ProgramAnalysis, TempAtoms) {
   ast::Atom atom("price", {ast::NamedVar{"N"}}, ast::Atom::Kind::DeltaDelete);
   EXPECT_EQ(makeTempAtom(atom).toString(), "-__temp__price(N)");
   EXPECT_EQ(canonicalizeAtom(ast::Atom("z", {})).toString(), "z()");
}

TEST(ProgramAnalysis, DeltaToPlain) {
   auto program = DatalogParser::parse("source p(a).\n"
                                       "+p(X) :- -q(X), not +r(X), X > 1.\n");
   auto plain = deltaToPlain(program);
   ASSERT_EQ(plain.statements.size(), 2u);
   EXPECT_EQ(plain.statements[0].toString(), "source p(a).");
   EXPECT_EQ(plain.statements[1].toString(), "p(X) :- q(X), not r(X), X > 1.");
   EXPECT_EQ(plain.statements[1].getSpan().line, 2u);
}

TEST(ProgramAnalysis, CollectVariables) {
   auto program = DatalogParser::parse("p(X) :- q(X, Y, 3), Z = 'a', not r(W), Y < V.");
   std::vector<std::string> names;
   for (auto& v : collectVariables(program.statements[0].getBody()))
      names.push_back(v.toString());
   EXPECT_EQ(names, (std::vector<std::string>{"V", "W", "X", "Y", "Z"}));
}
