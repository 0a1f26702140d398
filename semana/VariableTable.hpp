#ifndef H_deltalog_VariableTable
#define H_deltalog_VariableTable
//---------------------------------------------------------------------------
#include "infra/Options.hpp"
#include "parser/AST.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
class ColumnNameTable;
//---------------------------------------------------------------------------
/// A column of one atom occurrence within a rule body
struct ColumnRef {
   /// The predicate name
   std::string predicate;
   /// The predicate arity
   unsigned arity = 0;
   /// The position of the atom within the body
   unsigned occurrence = 0;
   /// The column name
   std::string column;

   /// The relation alias of the atom occurrence, name_a<arity>_<occurrence>
   std::string getAlias() const;
   /// The qualified form alias.column
   std::string toString() const;

   /// Comparison
   bool operator==(const ColumnRef& o) const { return (occurrence == o.occurrence) && (arity == o.arity) && (predicate == o.predicate) && (column == o.column); }
   /// Comparison
   bool operator!=(const ColumnRef& o) const { return !(*this == o); }
};
//---------------------------------------------------------------------------
/// The places within a rule body where each variable occurs
class VariableTable {
   private:
   /// The occurrences per variable name, most recent first
   std::unordered_map<std::string, std::vector<ColumnRef>> occurrences;

   public:
   /// Constructor
   explicit VariableTable(const AnalysisOptions& options = {});

   /// Record an occurrence of a variable
   void insert(const std::string& name, ColumnRef ref);

   /// Find the occurrences of a variable. Returns nullptr if it does not occur
   const std::vector<ColumnRef>* lookup(const std::string& name) const;
   /// Does the variable occur?
   bool contains(const std::string& name) const { return occurrences.count(name); }
   /// All variable names in sorted order
   std::vector<std::string> getVariables() const;
   /// The number of variables
   size_t size() const { return occurrences.size(); }
   /// The equi-join conditions implied by repeated variables. Every further occurrence is paired with the first
   std::vector<std::pair<ColumnRef, ColumnRef>> getJoinPairs() const;

   /// Collect the variable occurrences of the atoms of a rule body
   static VariableTable build(const ColumnNameTable& columns, const std::vector<ast::Atom>& atoms, const AnalysisOptions& options = {});
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
