#include "semana/EqualityTable.hpp"
#include <algorithm>
#include <stdexcept>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
pair<ast::Var, ast::Constant> extractEqualityTuple(const ast::Literal& literal)
// Split an equality of the form var = const
{
   if (literal.getKind() != ast::Literal::Kind::Equal)
      throw invalid_argument("extractEqualityTuple called without an equality: " + literal.toString());

   auto& c = literal.getComparison();
   if (c.right.isConst() && !c.left.isConst())
      return {c.left, c.right.getConstant()};
   if (c.left.isConst() && !c.right.isConst())
      return {c.right, c.left.getConstant()};
   throw invalid_argument("equality " + literal.toString() + " is not of the form var = const");
}
//---------------------------------------------------------------------------
EqualityTable::EqualityTable(const AnalysisOptions& options)
// Constructor
{
   bindings.reserve(options.tableCapacity);
}
//---------------------------------------------------------------------------
void EqualityTable::insert(const string& name, ast::Constant value)
// Bind a variable
{
   bindings[name].push_back(move(value));
}
//---------------------------------------------------------------------------
ast::Constant EqualityTable::extract(const string& name)
// Consume the most recent binding of a variable
{
   auto iter = bindings.find(name);
   if (iter == bindings.end())
      throw out_of_range("variable " + name + " has no equality");

   auto value = move(iter->second.back());
   iter->second.pop_back();
   if (iter->second.empty())
      bindings.erase(iter);
   return value;
}
//---------------------------------------------------------------------------
const ast::Constant* EqualityTable::lookup(const string& name) const
// Get the most recent binding
{
   auto iter = bindings.find(name);
   if (iter != bindings.end())
      return &(iter->second.back());
   return nullptr;
}
//---------------------------------------------------------------------------
vector<string> EqualityTable::getVariables() const
// All bound variable names in sorted order
{
   vector<string> names;
   names.reserve(bindings.size());
   for (auto& b : bindings)
      names.push_back(b.first);
   sort(names.begin(), names.end());
   return names;
}
//---------------------------------------------------------------------------
EqualityTable EqualityTable::build(const vector<ast::Literal>& equalities, const AnalysisOptions& options)
// Build the table from equalities of the form var = const
{
   EqualityTable result(options);
   for (auto& e : equalities) {
      auto [var, value] = extractEqualityTuple(e);
      if (!var.isVariable())
         throw invalid_argument("EqualityTable::build called with equalities not of the form var = const");
      result.insert(var.toString(), move(value));
   }
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
