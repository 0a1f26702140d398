#include "semana/ColumnNames.hpp"
#include "infra/Error.hpp"
#include "semana/SymbolTable.hpp"
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
ColumnNameTable::ColumnNameTable(const AnalysisOptions& options)
// Constructor
{
   columns.reserve(options.tableCapacity);
}
//---------------------------------------------------------------------------
bool ColumnNameTable::insert(const PredicateKey& key, vector<string> names)
// Register the columns of a signature
{
   return columns.emplace(key, move(names)).second;
}
//---------------------------------------------------------------------------
const vector<string>* ColumnNameTable::lookup(const PredicateKey& key) const
// Find the columns of a signature
{
   auto iter = columns.find(key);
   if (iter != columns.end())
      return &(iter->second);
   return nullptr;
}
//---------------------------------------------------------------------------
const vector<string>& ColumnNameTable::getColumns(const PredicateKey& key) const
// Get the columns of a signature
{
   if (auto c = lookup(key)) return *c;
   throw SemanticError("Predicate " + key.toString() + " is not defined", key.toString());
}
//---------------------------------------------------------------------------
vector<PredicateKey> ColumnNameTable::getKeys() const
// All signatures in key order
{
   KeySet keys;
   for (auto& c : columns)
      keys.insert(c.first);
   return {keys.begin(), keys.end()};
}
//---------------------------------------------------------------------------
vector<string> ColumnNameTable::positionalNames(unsigned arity)
// The synthesized names
{
   vector<string> names;
   names.reserve(arity);
   for (unsigned index = 0; index != arity; ++index)
      names.push_back("col" + to_string(index));
   return names;
}
//---------------------------------------------------------------------------
ColumnNameTable ColumnNameTable::build(const SymbolTable& extensional, const SymbolTable& intensional, const AnalysisOptions& options)
// Derive the columns of all predicates
{
   ColumnNameTable result(options);

   // Base facts name their columns with the variables of the first declaration
   for (auto& key : extensional.getKeys()) {
      auto& head = extensional.lookup(key)->front().getHead();
      vector<string> names;
      names.reserve(head.getArity());
      for (auto& a : head.getArgs())
         names.push_back(a.toString());
      result.insert(key, move(names));
   }

   // Derived predicates get positional names
   for (auto& key : intensional.getKeys())
      if (!result.contains(key))
         result.insert(key, positionalNames(key.arity));

   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
