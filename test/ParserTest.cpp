#include <gtest/gtest.h>

#include "infra/Error.hpp"
#include "parser/AST.hpp"
#include "parser/DatalogParser.hpp"

using namespace deltalog;

namespace {
ast::Program parse(std::string_view text) { return DatalogParser::parse(text, "test.dl"); }
}

TEST(Parser, StatementKinds) {
   auto program = parse("source price(name, amount).\n"
                        "cheap(N) :- price(N, A), A < 10.\n"
                        "?- cheap(X).\n");
   ASSERT_EQ(program.statements.size(), 3u);
   EXPECT_EQ(program.statements[0].getKind(), ast::Statement::Kind::Base);
   EXPECT_EQ(program.statements[1].getKind(), ast::Statement::Kind::Rule);
   EXPECT_EQ(program.statements[2].getKind(), ast::Statement::Kind::Query);
   EXPECT_EQ(program.statements[1].toString(), "cheap(N) :- price(N, A), A < 10.");
   EXPECT_EQ(program.statements[2].toString(), "?- cheap(X).");
}

TEST(Parser, DeltaHeadsAndNegation) {
   auto program = parse("+ins_price(N, A) :- new_price(N, A) and not price(N, _).\n"
                        "-price(N, A) :- price(N, A), A = 0.\n");
   ASSERT_EQ(program.statements.size(), 2u);
   auto& insert = program.statements[0];
   EXPECT_EQ(insert.getHead().getKind(), ast::Atom::Kind::DeltaInsert);
   ASSERT_EQ(insert.getBody().size(), 2u);
   EXPECT_EQ(insert.getBody()[1].getKind(), ast::Literal::Kind::Not);
   EXPECT_TRUE(insert.getBody()[1].getAtom().getArgs()[1].isAnonymous());

   auto& remove = program.statements[1];
   EXPECT_EQ(remove.getHead().getKind(), ast::Atom::Kind::DeltaDelete);
   EXPECT_EQ(remove.getBody()[1].getKind(), ast::Literal::Kind::Equal);
   EXPECT_EQ(remove.toString(), "-price(N, A) :- price(N, A), A = 0.");
}

TEST(Parser, Arguments) {
   auto program = parse("r(_1, X, 'it''s', -2.5, true, null, count(Y)) :- s(_1, X, Y).");
   auto& args = program.statements[0].getHead().getArgs();
   ASSERT_EQ(args.size(), 7u);
   EXPECT_EQ(args[0].getKind(), ast::Var::Kind::Numbered);
   EXPECT_EQ(args[0].toString(), "_1");
   EXPECT_EQ(args[1].getKind(), ast::Var::Kind::Named);
   ASSERT_TRUE(args[2].isConst());
   EXPECT_EQ(args[2].getConstant().getValue(), "it's");
   EXPECT_EQ(args[2].toString(), "'it''s'");
   EXPECT_EQ(args[3].getConstant().getKind(), ast::Constant::Kind::Float);
   EXPECT_EQ(args[3].getConstant().getValue(), "-2.5");
   EXPECT_EQ(args[4].getConstant().getKind(), ast::Constant::Kind::Bool);
   EXPECT_EQ(args[5].getConstant().getKind(), ast::Constant::Kind::Null);
   ASSERT_TRUE(args[6].isAggregate());
   EXPECT_EQ(args[6].getAggregate().function, "count");
   EXPECT_EQ(args[6].getAggregate().variable, "Y");
}

TEST(Parser, Comments) {
   auto program = parse("% a line comment\n"
                        "p(X) :- /* inline */ q(X).\n"
                        "/* spanning\n lines */ ?- p(X).");
   EXPECT_EQ(program.statements.size(), 2u);
}

TEST(Parser, ComparisonOperators) {
   auto program = parse("p(X) :- q(X), X <> 1, X != 2, X >= 3, 4 < X.");
   auto& body = program.statements[0].getBody();
   ASSERT_EQ(body.size(), 5u);
   EXPECT_EQ(body[1].getComparison().op, "<>");
   EXPECT_EQ(body[2].getComparison().op, "<>");
   EXPECT_EQ(body[3].getComparison().op, ">=");
   EXPECT_TRUE(body[4].getComparison().left.isConst());
}

TEST(Parser, StatementSpans) {
   auto program = parse("p(X) :- q(X).\n?- p(Y).");
   auto& rule = program.statements[0].getSpan();
   EXPECT_EQ(rule.file, "test.dl");
   EXPECT_EQ(rule.line, 1u);
   EXPECT_EQ(rule.begin, 0u);
   EXPECT_EQ(rule.end, 13u);
   auto& query = program.statements[1].getSpan();
   EXPECT_EQ(query.line, 2u);
   EXPECT_EQ(query.begin, 0u);
   EXPECT_EQ(query.end, 8u);
}

TEST(Parser, SyntaxError) {
   try {
      parse("p(X) :- q(X)");
      FAIL() << "expected a syntax error";
   } catch (const SyntaxError& e) {
      EXPECT_EQ(e.getMessage(), "expected '.', got end of input");
      EXPECT_EQ(e.getSpan().line, 1u);
      EXPECT_EQ(e.getSpan().begin, 0u);
      EXPECT_EQ(e.getSpan().end, 12u);
      EXPECT_STREQ(e.what(), "File \"test.dl\", line 1, characters 0-12: 'expected '.', got end of input'");
   }
}

TEST(Parser, SourceColumnsMustBeNamed) {
   EXPECT_THROW(parse("source price(name, 1)."), SyntaxError);
}

TEST(Parser, LexError) {
   try {
      parse("p(X) :- q(X) # .");
      FAIL() << "expected a lexical error";
   } catch (const LexError& e) {
      EXPECT_EQ(e.getLexeme(), "#");
      EXPECT_EQ(e.getSpan().begin, 13u);
      EXPECT_EQ(e.getSpan().end, 14u);
   }
   EXPECT_THROW(parse("p('abc) :- q(X)."), LexError);
   EXPECT_THROW(parse("p(X) :- q(X). /* open"), LexError);
}

TEST(Parser, NumberedVariableRange) {
   auto program = parse("p(_4294967295, _0, _01) :- e(_4294967295, _0, _01).");
   auto& args = program.statements[0].getHead().getArgs();
   EXPECT_EQ(args[0].getKind(), ast::Var::Kind::Numbered);
   EXPECT_EQ(args[0].toString(), "_4294967295");
   EXPECT_EQ(args[1].toString(), "_0");
   // A leading zero keeps the written name
   EXPECT_EQ(args[2].getKind(), ast::Var::Kind::Named);
   EXPECT_EQ(args[2].toString(), "_01");

   try {
      parse("source e(a, b).\np(_4294967296, _0) :- e(_4294967296, _0).");
      FAIL() << "expected a syntax error";
   } catch (const SyntaxError& e) {
      EXPECT_EQ(e.getSpan().line, 2u);
      EXPECT_NE(e.getMessage().find("numbered variable _4294967296 out of range"), std::string::npos);
   }
   // Digits followed by letters form an ordinary name
   EXPECT_EQ(parse("p(_99999999999x) :- e(_99999999999x).").statements[0].getHead().getArgs()[0].getKind(), ast::Var::Kind::Named);
}

TEST(Parser, SourceColumnsMustBeDistinct) {
   try {
      parse("source e(a, a).");
      FAIL() << "expected a syntax error";
   } catch (const SyntaxError& e) {
      EXPECT_EQ(e.getMessage(), "the column a of source e is declared twice, got '.'");
   }
}
