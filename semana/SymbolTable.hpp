#ifndef H_deltalog_SymbolTable
#define H_deltalog_SymbolTable
//---------------------------------------------------------------------------
#include "infra/Options.hpp"
#include "parser/AST.hpp"
#include "semana/Keys.hpp"
#include <unordered_map>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// The rules of a program grouped by the signature of their head
class SymbolTable {
   private:
   /// The rules per signature, in insertion order
   std::unordered_map<PredicateKey, std::vector<ast::Statement>, PredicateKey::Hash> entries;

   public:
   /// Constructor
   explicit SymbolTable(const AnalysisOptions& options = {});

   /// Add a rule. Throws std::invalid_argument for other statements
   void insert(const ast::Statement& rule);

   /// Find all rules for a signature. Returns nullptr if there are none
   const std::vector<ast::Statement>* lookup(const PredicateKey& key) const;
   /// Is the signature defined?
   bool contains(const PredicateKey& key) const { return entries.count(key); }
   /// All signatures in key order
   std::vector<PredicateKey> getKeys() const;
   /// The number of signatures
   size_t size() const { return entries.size(); }
   /// Is the table empty?
   bool empty() const { return entries.empty(); }

   /// Collect the rules with a body defining steady state relations
   static SymbolTable extractIntensional(const ast::Program& program, const AnalysisOptions& options = {});
   /// Collect the base facts as rules with an empty body
   static SymbolTable extractExtensional(const ast::Program& program, const AnalysisOptions& options = {});
   /// Collect the rules defining updates, keyed by the updated relation
   static SymbolTable extractDeltaRules(const ast::Program& program, const AnalysisOptions& options = {});
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
