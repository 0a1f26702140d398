#include "semana/ProgramAnalysis.hpp"
#include "infra/Error.hpp"
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
const ast::Statement& getQuery(const ast::Program& program)
// Find the single query of a program
{
   const ast::Statement* query = nullptr;
   for (auto& s : program.statements) {
      if (s.getKind() != ast::Statement::Kind::Query) continue;
      if (query) throw SemanticError("The program has more than one query");
      query = &s;
   }
   if (!query) throw SemanticError("The program has no query");
   return *query;
}
//---------------------------------------------------------------------------
ast::Atom canonicalizeAtom(const ast::Atom& atom)
// Replace the arguments of an atom by placeholders
{
   vector<ast::Var> args;
   args.reserve(atom.getArity());
   for (unsigned index = 0; index != atom.getArity(); ++index)
      args.emplace_back(ast::NamedVar{"COL" + to_string(index)});
   return atom.withArgs(move(args));
}
//---------------------------------------------------------------------------
vector<ast::Atom> extractDeltaPredicates(const ast::Program& program)
// The distinct update predicates of a program
{
   AtomSet deltas;
   for (auto& s : program.statements) {
      if (!s.isRule() || !s.getHead().isDelta()) continue;
      auto canonical = canonicalizeAtom(s.getHead());
      auto [iter, inserted] = deltas.insert(canonical);
      // Inserts and deletes of one relation share a signature, keep the insert form regardless of order
      if (!inserted && (canonical.getKind() < iter->getKind())) {
         deltas.erase(iter);
         deltas.insert(move(canonical));
      }
   }
   if (deltas.empty())
      throw SemanticError("The program has no update");
   return {deltas.begin(), deltas.end()};
}
//---------------------------------------------------------------------------
ast::Atom makeTempAtom(const ast::Atom& atom)
// Prefix the predicate name
{
   return atom.withName("__temp__" + atom.getName());
}
//---------------------------------------------------------------------------
ast::Program deltaToPlain(const ast::Program& program)
// Turn every delta atom of the rules into a plain atom
{
   auto toPlain = [](const ast::Atom& a) { return a.withKind(ast::Atom::Kind::Pred); };

   ast::Program result;
   result.statements.reserve(program.statements.size());
   for (auto& s : program.statements) {
      if (!s.isRule()) {
         result.statements.push_back(s);
         continue;
      }
      vector<ast::Literal> body;
      body.reserve(s.getBody().size());
      for (auto& l : s.getBody()) {
         switch (l.getKind()) {
            case ast::Literal::Kind::Rel: body.push_back(ast::Literal::makeRelation(toPlain(l.getAtom()))); break;
            case ast::Literal::Kind::Not: body.push_back(ast::Literal::makeNegation(toPlain(l.getAtom()))); break;
            case ast::Literal::Kind::Equal:
            case ast::Literal::Kind::Ineq: body.push_back(l); break;
         }
      }
      result.statements.push_back(ast::Statement::makeRule(toPlain(s.getHead()), move(body), s.getSpan()));
   }
   return result;
}
//---------------------------------------------------------------------------
VarSet collectVariables(const vector<ast::Literal>& literals)
// All variables occurring in a list of literals
{
   VarSet result;
   auto add = [&](const ast::Var& v) {
      if (!v.isConst()) result.insert(v);
   };
   for (auto& l : literals) {
      if (l.hasAtom()) {
         for (auto& a : l.getAtom().getArgs())
            add(a);
      } else {
         add(l.getComparison().left);
         add(l.getComparison().right);
      }
   }
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
