#include <gtest/gtest.h>

#include "infra/Error.hpp"
#include "parser/DatalogParser.hpp"
#include "semana/ColumnNames.hpp"
#include "semana/SymbolTable.hpp"
#include "semana/VariableTable.hpp"

using namespace deltalog;

namespace {
/// The goals of the first rule of a program
std::vector<ast::Atom> goalsOf(const ast::Program& program) {
   std::vector<ast::Atom> goals;
   for (auto& l : program.statements.front().getBody())
      if (l.getKind() == ast::Literal::Kind::Rel) goals.push_back(l.getAtom());
   return goals;
}
ColumnNameTable columnsOf(const ast::Program& program) {
   return ColumnNameTable::build(SymbolTable::extractExtensional(program), SymbolTable::extractIntensional(program));
}
}

TEST(VariableTable, SelfJoinOccurrences) {
   auto program = DatalogParser::parse("path(X, Z) :- edge(X, Y), edge(Y, Z).\n"
                                       "source edge(src, dst).\n");
   auto vars = VariableTable::build(columnsOf(program), goalsOf(program));

   EXPECT_EQ(vars.getVariables(), (std::vector<std::string>{"X", "Y", "Z"}));
   auto& y = *vars.lookup("Y");
   ASSERT_EQ(y.size(), 2u);
   // Most recent occurrence first
   EXPECT_EQ(y[0].toString(), "edge_a2_1.src");
   EXPECT_EQ(y[1].toString(), "edge_a2_0.dst");
   EXPECT_EQ(vars.lookup("Z")->front().getAlias(), "edge_a2_1");

   auto pairs = vars.getJoinPairs();
   ASSERT_EQ(pairs.size(), 1u);
   EXPECT_EQ(pairs[0].first.toString(), "edge_a2_0.dst");
   EXPECT_EQ(pairs[0].second.toString(), "edge_a2_1.src");
}

TEST(VariableTable, ConstantsAndAnonymousAreSkipped) {
   auto program = DatalogParser::parse("p(X) :- q(X, _, 3), r(_2).\n"
                                       "source q(a, b, c).\n"
                                       "source r(d).\n");
   auto vars = VariableTable::build(columnsOf(program), goalsOf(program));
   EXPECT_EQ(vars.getVariables(), (std::vector<std::string>{"X", "_2"}));
   EXPECT_EQ(vars.lookup("_2")->front(), (ColumnRef{"r", 1, 1, "d"}));
   EXPECT_FALSE(vars.contains("_"));
   EXPECT_TRUE(vars.getJoinPairs().empty());
}

TEST(VariableTable, AggregateInGoal) {
   auto program = DatalogParser::parse("p(X) :- q(X), r(count(X)).\n"
                                       "source q(a).\n"
                                       "source r(b).\n");
   try {
      VariableTable::build(columnsOf(program), goalsOf(program));
      FAIL() << "expected a semantic error";
   } catch (const SemanticError& e) {
      EXPECT_EQ(e.getPredicate(), "r/1");
      EXPECT_STREQ(e.what(), "Goal r/1 contains an aggregate function as a variable, which is only allowed in rule heads");
   }
}

TEST(VariableTable, UndefinedGoal) {
   auto program = DatalogParser::parse("p(X) :- missing(X).\n");
   EXPECT_THROW(VariableTable::build(columnsOf(program), goalsOf(program)), SemanticError);
}

TEST(VariableTable, JoinPairsFollowWrittenOrder) {
   VariableTable vars;
   vars.insert("X", ColumnRef{"a", 1, 0, "c"});
   vars.insert("X", ColumnRef{"b", 1, 1, "c"});
   vars.insert("X", ColumnRef{"c", 1, 2, "c"});
   auto pairs = vars.getJoinPairs();
   ASSERT_EQ(pairs.size(), 2u);
   EXPECT_EQ(pairs[0].first.predicate, "a");
   EXPECT_EQ(pairs[0].second.predicate, "b");
   EXPECT_EQ(pairs[1].first.predicate, "a");
   EXPECT_EQ(pairs[1].second.predicate, "c");
}
