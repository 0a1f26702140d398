#include "semana/Keys.hpp"
#include <algorithm>
#include <functional>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
size_t PredicateKey::Hash::operator()(const PredicateKey& key) const
// Hash a signature
{
   return hash<string>()(key.name) ^ (static_cast<size_t>(key.arity) * 0x9e3779b97f4a7c15ull);
}
//---------------------------------------------------------------------------
int PredicateKey::compare(const PredicateKey& a, const PredicateKey& b)
// Compare two signatures
{
   int comp = a.name.compare(b.name);
   if (comp != 0) return (comp < 0) ? -1 : 1;
   if (a.arity != b.arity) return (a.arity < b.arity) ? -1 : 1;
   return 0;
}
//---------------------------------------------------------------------------
string PredicateKey::toString() const
// Render as name/arity
{
   return name + "/" + to_string(arity);
}
//---------------------------------------------------------------------------
string PredicateKey::getAlias() const
// The relational alias prefix
{
   return name + "_a" + to_string(arity);
}
//---------------------------------------------------------------------------
int compareVars(const ast::Var& a, const ast::Var& b)
// Compare two variables by their printed form
{
   int comp = a.toString().compare(b.toString());
   return (comp < 0) ? -1 : ((comp > 0) ? 1 : 0);
}
//---------------------------------------------------------------------------
int compareAtoms(const ast::Atom& a, const ast::Atom& b)
// Compare two atoms by signature
{
   return PredicateKey::compare(PredicateKey::of(a), PredicateKey::of(b));
}
//---------------------------------------------------------------------------
vector<PredicateKey> removeRepeatedKeys(vector<PredicateKey> keys)
// Sort a list of signatures and drop repetitions
{
   sort(keys.begin(), keys.end(), KeyLess());
   keys.erase(unique(keys.begin(), keys.end()), keys.end());
   return keys;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
