#ifndef H_deltalog_SQLGenerator
#define H_deltalog_SQLGenerator
//---------------------------------------------------------------------------
#include "infra/Options.hpp"
#include "parser/AST.hpp"
#include "semana/ColumnNames.hpp"
#include "semana/SymbolTable.hpp"
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
class SQLWriter;
//---------------------------------------------------------------------------
/// Translate an analyzed program into SQL views
class SQLGenerator {
   private:
   /// The program
   const ast::Program& program;
   /// The options
   AnalysisOptions options;
   /// The base facts
   SymbolTable extensional;
   /// The steady state rules
   SymbolTable intensional;
   /// The update rules
   SymbolTable deltaRules;
   /// The column names
   ColumnNameTable columns;

   /// The column names of a rule head
   std::vector<std::string> getHeadColumns(const ast::Atom& head) const;
   /// The rules of a predicate in an order that puts dependencies first
   std::vector<PredicateKey> getViewOrder() const;
   /// Write a union of rules
   void translateUnion(SQLWriter& out, const std::vector<const ast::Statement*>& rules);

   public:
   /// Constructor. Builds the symbol and column tables of the program
   explicit SQLGenerator(const ast::Program& program, const AnalysisOptions& options = {});

   /// Translate a single rule into a select statement
   void translateRule(SQLWriter& out, const ast::Statement& rule);
   /// Create a view for every derived predicate
   void translateViews(SQLWriter& out);
   /// Select the result of the query
   void translateQuery(SQLWriter& out);
   /// Create a view for every update of the program
   void translateDeltas(SQLWriter& out);

   /// The relation that stores an atom
   static std::string getRelationName(const ast::Atom& atom);

   /// Access the column names
   const ColumnNameTable& getColumns() const { return columns; }
   /// Access the steady state rules
   const SymbolTable& getIntensional() const { return intensional; }
   /// Access the base facts
   const SymbolTable& getExtensional() const { return extensional; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
