#ifndef H_deltalog_ColumnNames
#define H_deltalog_ColumnNames
//---------------------------------------------------------------------------
#include "infra/Options.hpp"
#include "semana/Keys.hpp"
#include <string>
#include <unordered_map>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
class SymbolTable;
//---------------------------------------------------------------------------
/// The column names of every predicate, one per argument position
class ColumnNameTable {
   private:
   /// The columns per signature
   std::unordered_map<PredicateKey, std::vector<std::string>, PredicateKey::Hash> columns;

   public:
   /// Constructor
   explicit ColumnNameTable(const AnalysisOptions& options = {});

   /// Register the columns of a signature unless it is already known. Returns false if it was known
   bool insert(const PredicateKey& key, std::vector<std::string> names);

   /// Find the columns of a signature. Returns nullptr if unknown
   const std::vector<std::string>* lookup(const PredicateKey& key) const;
   /// Get the columns of a signature. Throws a SemanticError if unknown
   const std::vector<std::string>& getColumns(const PredicateKey& key) const;
   /// Is the signature known?
   bool contains(const PredicateKey& key) const { return columns.count(key); }
   /// All signatures in key order
   std::vector<PredicateKey> getKeys() const;
   /// The number of signatures
   size_t size() const { return columns.size(); }

   /// Derive the columns from the base facts and the rules. Names from base facts take precedence
   static ColumnNameTable build(const SymbolTable& extensional, const SymbolTable& intensional, const AnalysisOptions& options = {});
   /// The synthesized names col0..col(arity-1)
   static std::vector<std::string> positionalNames(unsigned arity);
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
