#include "semana/SymbolTable.hpp"
#include <stdexcept>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
SymbolTable::SymbolTable(const AnalysisOptions& options)
// Constructor
{
   entries.reserve(options.tableCapacity);
}
//---------------------------------------------------------------------------
void SymbolTable::insert(const ast::Statement& rule)
// Add a rule
{
   if (!rule.isRule())
      throw invalid_argument("SymbolTable::insert called without a rule");

   auto key = PredicateKey::of(rule.getHead());
   if (auto iter = entries.find(key); iter != entries.end()) {
      auto rules = iter->second;
      rules.push_back(rule);
      iter->second = move(rules);
   } else {
      entries.emplace(move(key), vector<ast::Statement>{rule});
   }
}
//---------------------------------------------------------------------------
const vector<ast::Statement>* SymbolTable::lookup(const PredicateKey& key) const
// Find all rules for a signature
{
   auto iter = entries.find(key);
   if (iter != entries.end())
      return &(iter->second);
   return nullptr;
}
//---------------------------------------------------------------------------
vector<PredicateKey> SymbolTable::getKeys() const
// All signatures in key order
{
   KeySet keys;
   for (auto& e : entries)
      keys.insert(e.first);
   return {keys.begin(), keys.end()};
}
//---------------------------------------------------------------------------
SymbolTable SymbolTable::extractIntensional(const ast::Program& program, const AnalysisOptions& options)
// Collect the rules defining steady state relations
{
   SymbolTable idb(options);
   for (auto& s : program.statements) {
      switch (s.getKind()) {
         case ast::Statement::Kind::Rule:
            // Only rules with a body derive a relation
            if (!s.getHead().isDelta() && !s.getBody().empty())
               idb.insert(s);
            break;
         case ast::Statement::Kind::Query:
         case ast::Statement::Kind::Base: break;
      }
   }
   return idb;
}
//---------------------------------------------------------------------------
SymbolTable SymbolTable::extractExtensional(const ast::Program& program, const AnalysisOptions& options)
// Collect the base facts
{
   SymbolTable edb(options);
   for (auto& s : program.statements) {
      switch (s.getKind()) {
         case ast::Statement::Kind::Base: edb.insert(ast::Statement::makeRule(s.getHead(), {}, s.getSpan())); break;
         case ast::Statement::Kind::Rule:
         case ast::Statement::Kind::Query: break;
      }
   }
   return edb;
}
//---------------------------------------------------------------------------
SymbolTable SymbolTable::extractDeltaRules(const ast::Program& program, const AnalysisOptions& options)
// Collect the update rules
{
   SymbolTable deltas(options);
   for (auto& s : program.statements)
      if (s.isRule() && s.getHead().isDelta())
         deltas.insert(s);
   return deltas;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
