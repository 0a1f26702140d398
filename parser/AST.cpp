#include "parser/AST.hpp"
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog::ast {
//---------------------------------------------------------------------------
string Constant::toString() const
// The printed form
{
   if (kind != Kind::String)
      return value;

   string result = "'";
   for (char c : value) {
      if (c == '\'')
         result += "''";
      else
         result += c;
   }
   result += '\'';
   return result;
}
//---------------------------------------------------------------------------
string Var::toString() const
// The printed form
{
   switch (getKind()) {
      case Kind::Named: return get<NamedVar>(content).name;
      case Kind::Numbered: return "_" + to_string(get<NumberedVar>(content).number);
      case Kind::Anonymous: return "_";
      case Kind::Const: return getConstant().toString();
      case Kind::Aggregate: return getAggregate().function + "(" + getAggregate().variable + ")";
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
string Atom::toString() const
// The printed form
{
   string result;
   switch (kind) {
      case Kind::Pred: break;
      case Kind::DeltaInsert: result += '+'; break;
      case Kind::DeltaDelete: result += '-'; break;
   }
   result += name;
   result += '(';
   bool first = true;
   for (auto& a : args) {
      if (first)
         first = false;
      else
         result += ", ";
      result += a.toString();
   }
   result += ')';
   return result;
}
//---------------------------------------------------------------------------
string Literal::toString() const
// The printed form
{
   switch (kind) {
      case Kind::Rel: return getAtom().toString();
      case Kind::Not: return "not " + getAtom().toString();
      case Kind::Equal:
      case Kind::Ineq: {
         auto& c = getComparison();
         return c.left.toString() + " " + c.op + " " + c.right.toString();
      }
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
string Statement::toString() const
// The printed form
{
   switch (kind) {
      case Kind::Query: return "?- " + head.toString() + ".";
      case Kind::Base: return "source " + head.toString() + ".";
      case Kind::Rule: {
         string result = head.toString();
         if (!body.empty()) {
            result += " :- ";
            bool first = true;
            for (auto& l : body) {
               if (first)
                  first = false;
               else
                  result += ", ";
               result += l.toString();
            }
         }
         result += ".";
         return result;
      }
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
