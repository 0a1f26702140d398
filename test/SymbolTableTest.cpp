#include <gtest/gtest.h>

#include "infra/Error.hpp"
#include "parser/DatalogParser.hpp"
#include "semana/ColumnNames.hpp"
#include "semana/SymbolTable.hpp"

using namespace deltalog;

namespace {
const char* priceProgram = "source price(name, amount).\n"
                           "cheap(N) :- price(N, A), A < 10.\n"
                           "cheap(N) :- sale(N).\n"
                           "+price(N, A) :- offer(N, A).\n"
                           "?- cheap(X).\n";
}

TEST(SymbolTable, PartitionsStatements) {
   auto program = DatalogParser::parse(priceProgram);
   auto edb = SymbolTable::extractExtensional(program);
   auto idb = SymbolTable::extractIntensional(program);
   auto deltas = SymbolTable::extractDeltaRules(program);

   ASSERT_EQ(edb.getKeys(), (std::vector<PredicateKey>{{"price", 2}}));
   ASSERT_EQ(idb.getKeys(), (std::vector<PredicateKey>{{"cheap", 1}}));
   ASSERT_EQ(deltas.getKeys(), (std::vector<PredicateKey>{{"price", 2}}));

   // Base facts become rules without a body
   auto& fact = edb.lookup({"price", 2})->front();
   EXPECT_TRUE(fact.isRule());
   EXPECT_TRUE(fact.getBody().empty());
   EXPECT_EQ(fact.getSpan().line, 1u);

   // Rules keep their program order
   auto& rules = *idb.lookup({"cheap", 1});
   ASSERT_EQ(rules.size(), 2u);
   EXPECT_EQ(rules[0].getBody().size(), 2u);
   EXPECT_EQ(rules[1].getBody().size(), 1u);
}

TEST(SymbolTable, Lookup) {
   SymbolTable table;
   EXPECT_TRUE(table.empty());
   EXPECT_EQ(table.lookup({"p", 1}), nullptr);

   table.insert(ast::Statement::makeRule(ast::Atom("p", {ast::NamedVar{"X"}}), {}));
   table.insert(ast::Statement::makeRule(ast::Atom("p", {ast::NamedVar{"Y"}, ast::NamedVar{"Z"}}), {}));
   table.insert(ast::Statement::makeRule(ast::Atom("p", {ast::NamedVar{"W"}}), {}));
   EXPECT_EQ(table.size(), 2u);
   EXPECT_TRUE(table.contains({"p", 2}));
   EXPECT_FALSE(table.contains({"q", 1}));
   ASSERT_NE(table.lookup({"p", 1}), nullptr);
   EXPECT_EQ(table.lookup({"p", 1})->size(), 2u);
}

TEST(SymbolTable, RejectsNonRules) {
   SymbolTable table;
   EXPECT_THROW(table.insert(ast::Statement::makeQuery(ast::Atom("q", {}))), std::invalid_argument);
   EXPECT_THROW(table.insert(ast::Statement::makeBase(ast::Atom("b", {}))), std::invalid_argument);
}

TEST(ColumnNames, BaseFactsNameTheirColumns) {
   auto program = DatalogParser::parse(priceProgram);
   auto columns = ColumnNameTable::build(SymbolTable::extractExtensional(program), SymbolTable::extractIntensional(program));

   EXPECT_EQ(columns.getColumns({"price", 2}), (std::vector<std::string>{"name", "amount"}));
   EXPECT_EQ(columns.getColumns({"cheap", 1}), (std::vector<std::string>{"col0"}));
   EXPECT_EQ(columns.size(), 2u);
}

TEST(ColumnNames, DeclaredNamesTakePrecedence) {
   auto program = DatalogParser::parse("source edge(src, dst).\n"
                                       "edge(X, Y) :- link(X, Y).\n"
                                       "path(X, Y, Z) :- edge(X, Y), edge(Y, Z).\n");
   auto columns = ColumnNameTable::build(SymbolTable::extractExtensional(program), SymbolTable::extractIntensional(program));
   EXPECT_EQ(columns.getColumns({"edge", 2}), (std::vector<std::string>{"src", "dst"}));
   EXPECT_EQ(columns.getColumns({"path", 3}), (std::vector<std::string>{"col0", "col1", "col2"}));
   EXPECT_EQ(columns.getKeys(), (std::vector<PredicateKey>{{"edge", 2}, {"path", 3}}));
}

TEST(ColumnNames, UnknownPredicate) {
   ColumnNameTable columns;
   EXPECT_TRUE(columns.insert({"p", 1}, {"a"}));
   EXPECT_FALSE(columns.insert({"p", 1}, {"b"}));
   EXPECT_EQ(columns.getColumns({"p", 1}), (std::vector<std::string>{"a"}));
   EXPECT_EQ(columns.lookup({"q", 1}), nullptr);
   try {
      columns.getColumns({"q", 1});
      FAIL() << "expected a semantic error";
   } catch (const SemanticError& e) {
      EXPECT_STREQ(e.what(), "Predicate q/1 is not defined");
      EXPECT_EQ(e.getPredicate(), "q/1");
   }
}

TEST(ColumnNames, PositionalNames) {
   EXPECT_TRUE(ColumnNameTable::positionalNames(0).empty());
   EXPECT_EQ(ColumnNameTable::positionalNames(2), (std::vector<std::string>{"col0", "col1"}));
}

TEST(SymbolTable, IntensionalRulesHaveABody) {
   ast::Program program;
   program.statements.push_back(ast::Statement::makeRule(ast::Atom("fact", {ast::NamedVar{"X"}}), {}));
   program.statements.push_back(ast::Statement::makeRule(ast::Atom("derived", {ast::NamedVar{"X"}}), {ast::Literal::makeRelation(ast::Atom("fact", {ast::NamedVar{"X"}}))}));
   auto idb = SymbolTable::extractIntensional(program);
   EXPECT_EQ(idb.getKeys(), (std::vector<PredicateKey>{{"derived", 1}}));
   EXPECT_FALSE(idb.contains({"fact", 1}));
}
