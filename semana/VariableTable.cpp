#include "semana/VariableTable.hpp"
#include "infra/Error.hpp"
#include "semana/ColumnNames.hpp"
#include "semana/Keys.hpp"
#include <algorithm>
#include <stdexcept>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
string ColumnRef::getAlias() const
// The relation alias of the atom occurrence
{
   return predicate + "_a" + to_string(arity) + "_" + to_string(occurrence);
}
//---------------------------------------------------------------------------
string ColumnRef::toString() const
// The qualified form
{
   return getAlias() + "." + column;
}
//---------------------------------------------------------------------------
VariableTable::VariableTable(const AnalysisOptions& options)
// Constructor
{
   occurrences.reserve(options.tableCapacity);
}
//---------------------------------------------------------------------------
void VariableTable::insert(const string& name, ColumnRef ref)
// Record an occurrence of a variable
{
   auto& refs = occurrences[name];
   refs.insert(refs.begin(), move(ref));
}
//---------------------------------------------------------------------------
const vector<ColumnRef>* VariableTable::lookup(const string& name) const
// Find the occurrences of a variable
{
   auto iter = occurrences.find(name);
   if (iter != occurrences.end())
      return &(iter->second);
   return nullptr;
}
//---------------------------------------------------------------------------
vector<string> VariableTable::getVariables() const
// All variable names in sorted order
{
   vector<string> names;
   names.reserve(occurrences.size());
   for (auto& o : occurrences)
      names.push_back(o.first);
   sort(names.begin(), names.end());
   return names;
}
//---------------------------------------------------------------------------
vector<pair<ColumnRef, ColumnRef>> VariableTable::getJoinPairs() const
// The equi-join conditions implied by repeated variables
{
   vector<pair<ColumnRef, ColumnRef>> result;
   for (auto& name : getVariables()) {
      auto& refs = occurrences.find(name)->second;
      // Pair in written order, the list itself is most recent first
      for (auto iter = refs.rbegin() + 1; iter < refs.rend(); ++iter)
         result.emplace_back(refs.back(), *iter);
   }
   return result;
}
//---------------------------------------------------------------------------
VariableTable VariableTable::build(const ColumnNameTable& columns, const vector<ast::Atom>& atoms, const AnalysisOptions& options)
// Collect the variable occurrences of the atoms of a rule body
{
   VariableTable result(options);
   unsigned occurrence = 0;
   for (auto& atom : atoms) {
      auto key = PredicateKey::of(atom);
      auto& names = columns.getColumns(key);
      if (names.size() != atom.getArity())
         throw logic_error("column count of " + key.toString() + " does not match its arity");

      auto& args = atom.getArgs();
      for (unsigned index = 0; index != args.size(); ++index) {
         auto& a = args[index];
         switch (a.getKind()) {
            case ast::Var::Kind::Named:
            case ast::Var::Kind::Numbered:
               result.insert(a.toString(), ColumnRef{atom.getName(), atom.getArity(), occurrence, names[index]});
               break;
            case ast::Var::Kind::Aggregate:
               throw SemanticError("Goal " + key.toString() + " contains an aggregate function as a variable, which is only allowed in rule heads", key.toString());
            case ast::Var::Kind::Anonymous:
            case ast::Var::Kind::Const: break;
         }
      }
      ++occurrence;
   }
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
