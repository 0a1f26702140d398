#ifndef H_deltalog_Keys
#define H_deltalog_Keys
//---------------------------------------------------------------------------
#include "parser/AST.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// The signature of a predicate
struct PredicateKey {
   /// The predicate name
   std::string name;
   /// The number of arguments
   unsigned arity = 0;

   /// Hash functor for hash tables keyed by signature
   struct Hash {
      size_t operator()(const PredicateKey& key) const;
   };

   /// The signature of an atom. Delta atoms map to the relation they update
   static PredicateKey of(const ast::Atom& atom) { return {atom.getName(), atom.getArity()}; }
   /// Compare two signatures, name first then arity. Returns <0, 0, or >0
   static int compare(const PredicateKey& a, const PredicateKey& b);

   /// Render as name/arity
   std::string toString() const;
   /// The relational alias prefix, name_a<arity>
   std::string getAlias() const;

   /// Comparison
   bool operator==(const PredicateKey& o) const { return compare(*this, o) == 0; }
   /// Comparison
   bool operator!=(const PredicateKey& o) const { return compare(*this, o) != 0; }
   /// Comparison
   bool operator<(const PredicateKey& o) const { return compare(*this, o) < 0; }
};
//---------------------------------------------------------------------------
/// Compare two variables by their printed form
int compareVars(const ast::Var& a, const ast::Var& b);
/// Compare two atoms by the signature of their predicate
int compareAtoms(const ast::Atom& a, const ast::Atom& b);
//---------------------------------------------------------------------------
/// Strict weak order on signatures
struct KeyLess {
   bool operator()(const PredicateKey& a, const PredicateKey& b) const { return PredicateKey::compare(a, b) < 0; }
};
/// Strict weak order on variables
struct VarLess {
   bool operator()(const ast::Var& a, const ast::Var& b) const { return compareVars(a, b) < 0; }
};
/// Strict weak order on atoms
struct AtomLess {
   bool operator()(const ast::Atom& a, const ast::Atom& b) const { return compareAtoms(a, b) < 0; }
};
//---------------------------------------------------------------------------
/// A set of signatures
using KeySet = std::set<PredicateKey, KeyLess>;
/// A set of variables
using VarSet = std::set<ast::Var, VarLess>;
/// A set of atoms, one per signature
using AtomSet = std::set<ast::Atom, AtomLess>;
//---------------------------------------------------------------------------
/// Sort a list of signatures and drop repetitions
std::vector<PredicateKey> removeRepeatedKeys(std::vector<PredicateKey> keys);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
