#ifndef H_deltalog_ProgramAnalysis
#define H_deltalog_ProgramAnalysis
//---------------------------------------------------------------------------
#include "parser/AST.hpp"
#include "semana/Keys.hpp"
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// Find the single query of a program. Throws a SemanticError if there is none or more than one
const ast::Statement& getQuery(const ast::Program& program);
/// The distinct update predicates of a program in key order, arguments replaced by COL0..COL(n-1). Throws a SemanticError if there is no update
std::vector<ast::Atom> extractDeltaPredicates(const ast::Program& program);
//---------------------------------------------------------------------------
/// Replace the arguments of an atom by the placeholders COL0..COL(n-1)
ast::Atom canonicalizeAtom(const ast::Atom& atom);
/// Prefix the predicate name with __temp__
ast::Atom makeTempAtom(const ast::Atom& atom);
/// Turn every delta atom of the rules into the plain atom of the same relation
ast::Program deltaToPlain(const ast::Program& program);
/// All variables occurring in a list of literals
VarSet collectVariables(const std::vector<ast::Literal>& literals);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
