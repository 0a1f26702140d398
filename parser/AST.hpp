#ifndef H_deltalog_AST
#define H_deltalog_AST
//---------------------------------------------------------------------------
#include "infra/Error.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog::ast {
//---------------------------------------------------------------------------
/// A constant value
class Constant {
   public:
   /// Possible constant kinds
   enum class Kind : uint8_t {
      Integer,
      Float,
      String,
      Bool,
      Null
   };

   private:
   /// The kind
   Kind kind;
   /// The value. Unquoted for strings
   std::string value;

   public:
   /// Constructor
   Constant(Kind kind, std::string value) : kind(kind), value(std::move(value)) {}

   /// Create an integer constant
   static Constant makeInteger(std::string digits) { return Constant(Kind::Integer, std::move(digits)); }
   /// Create a string constant
   static Constant makeString(std::string text) { return Constant(Kind::String, std::move(text)); }
   /// Create the null constant
   static Constant makeNull() { return Constant(Kind::Null, "null"); }

   /// Get the kind
   Kind getKind() const { return kind; }
   /// Get the raw value
   const std::string& getValue() const { return value; }
   /// The printed form
   std::string toString() const;

   /// Comparison
   bool operator==(const Constant& o) const { return (kind == o.kind) && (value == o.value); }
   /// Comparison
   bool operator!=(const Constant& o) const { return !(*this == o); }
};
//---------------------------------------------------------------------------
/// A user named variable
struct NamedVar {
   std::string name;
};
/// A positional variable
struct NumberedVar {
   unsigned number;
};
/// The anonymous variable
struct AnonVar {};
/// A constant in argument position
struct ConstVar {
   Constant value;
};
/// An aggregate function over a variable
struct AggVar {
   /// The function (min, max, sum, avg, count)
   std::string function;
   /// The aggregated variable
   std::string variable;
};
//---------------------------------------------------------------------------
/// An argument of an atom or an operand of a comparison
class Var {
   public:
   /// The possible forms, in the order of the content alternatives
   enum class Kind : uint8_t {
      Named,
      Numbered,
      Anonymous,
      Const,
      Aggregate
   };

   private:
   /// The content
   std::variant<NamedVar, NumberedVar, AnonVar, ConstVar, AggVar> content;

   public:
   /// Constructor
   Var(NamedVar v) : content(std::move(v)) {}
   /// Constructor
   Var(NumberedVar v) : content(v) {}
   /// Constructor
   Var(AnonVar v) : content(v) {}
   /// Constructor
   Var(ConstVar v) : content(std::move(v)) {}
   /// Constructor
   Var(AggVar v) : content(std::move(v)) {}

   /// Get the form
   Kind getKind() const { return static_cast<Kind>(content.index()); }
   /// Is a named or numbered variable? Only those take part in joins
   bool isVariable() const { return (getKind() == Kind::Named) || (getKind() == Kind::Numbered); }
   /// Is a constant?
   bool isConst() const { return getKind() == Kind::Const; }
   /// Is an aggregate?
   bool isAggregate() const { return getKind() == Kind::Aggregate; }
   /// Is the anonymous variable?
   bool isAnonymous() const { return getKind() == Kind::Anonymous; }

   /// Get the constant value
   const Constant& getConstant() const { return std::get<ConstVar>(content).value; }
   /// Get the aggregate
   const AggVar& getAggregate() const { return std::get<AggVar>(content); }

   /// The printed form. Identifies named and numbered variables
   std::string toString() const;
};
//---------------------------------------------------------------------------
/// A predicate application, either steady state or an update
class Atom {
   public:
   /// The head forms
   enum class Kind : uint8_t {
      Pred,
      DeltaInsert,
      DeltaDelete
   };

   private:
   /// The form
   Kind kind;
   /// The predicate name
   std::string name;
   /// The arguments
   std::vector<Var> args;

   public:
   /// Constructor
   Atom(std::string name, std::vector<Var> args, Kind kind = Kind::Pred) : kind(kind), name(std::move(name)), args(std::move(args)) {}

   /// Get the form
   Kind getKind() const { return kind; }
   /// Is an insert or delete atom?
   bool isDelta() const { return kind != Kind::Pred; }
   /// Get the predicate name
   const std::string& getName() const { return name; }
   /// Get the arguments
   const std::vector<Var>& getArgs() const { return args; }
   /// Get the arity
   unsigned getArity() const { return args.size(); }

   /// A copy with different arguments
   Atom withArgs(std::vector<Var> newArgs) const { return Atom(name, std::move(newArgs), kind); }
   /// A copy with a different name
   Atom withName(std::string newName) const { return Atom(std::move(newName), args, kind); }
   /// A copy with a different form
   Atom withKind(Kind newKind) const { return Atom(name, args, newKind); }

   /// The printed form
   std::string toString() const;
};
//---------------------------------------------------------------------------
/// A body literal
class Literal {
   public:
   /// The literal forms
   enum class Kind : uint8_t {
      Rel,
      Not,
      Equal,
      Ineq
   };
   /// A binary comparison
   struct Comparison {
      /// The operator (=, <>, <, <=, >, >=)
      std::string op;
      /// The operands
      Var left, right;
   };

   private:
   /// The form
   Kind kind;
   /// The content
   std::variant<Atom, Comparison> content;

   /// Constructor
   Literal(Kind kind, Atom atom) : kind(kind), content(std::move(atom)) {}
   /// Constructor
   Literal(Kind kind, Comparison comparison) : kind(kind), content(std::move(comparison)) {}

   public:
   /// A positive atom
   static Literal makeRelation(Atom atom) { return Literal(Kind::Rel, std::move(atom)); }
   /// A negated atom
   static Literal makeNegation(Atom atom) { return Literal(Kind::Not, std::move(atom)); }
   /// An equality
   static Literal makeEquality(Var left, Var right) { return Literal(Kind::Equal, Comparison{"=", std::move(left), std::move(right)}); }
   /// An inequality
   static Literal makeInequality(std::string op, Var left, Var right) { return Literal(Kind::Ineq, Comparison{std::move(op), std::move(left), std::move(right)}); }

   /// Get the form
   Kind getKind() const { return kind; }
   /// Does the literal contain an atom?
   bool hasAtom() const { return content.index() == 0; }
   /// Get the atom
   const Atom& getAtom() const { return std::get<Atom>(content); }
   /// Get the comparison
   const Comparison& getComparison() const { return std::get<Comparison>(content); }

   /// The printed form
   std::string toString() const;
};
//---------------------------------------------------------------------------
/// A statement of a program
class Statement {
   public:
   /// The statement forms
   enum class Kind : uint8_t {
      Rule,
      Query,
      Base
   };

   private:
   /// The form
   Kind kind;
   /// The head of a rule, or the atom of a query or base fact
   Atom head;
   /// The body (rules only)
   std::vector<Literal> body;
   /// The source location
   SourceSpan span;

   /// Constructor
   Statement(Kind kind, Atom head, std::vector<Literal> body, SourceSpan span) : kind(kind), head(std::move(head)), body(std::move(body)), span(std::move(span)) {}

   public:
   /// A rule
   static Statement makeRule(Atom head, std::vector<Literal> body, SourceSpan span = {}) { return Statement(Kind::Rule, std::move(head), std::move(body), std::move(span)); }
   /// A query
   static Statement makeQuery(Atom atom, SourceSpan span = {}) { return Statement(Kind::Query, std::move(atom), {}, std::move(span)); }
   /// A base fact
   static Statement makeBase(Atom atom, SourceSpan span = {}) { return Statement(Kind::Base, std::move(atom), {}, std::move(span)); }

   /// Get the form
   Kind getKind() const { return kind; }
   /// Is a rule?
   bool isRule() const { return kind == Kind::Rule; }
   /// Get the head (rules) or the atom (queries and base facts)
   const Atom& getHead() const { return head; }
   /// Get the body
   const std::vector<Literal>& getBody() const { return body; }
   /// Get the source location
   const SourceSpan& getSpan() const { return span; }

   /// The printed form
   std::string toString() const;
};
//---------------------------------------------------------------------------
/// A parsed program
struct Program {
   /// The statements in source order
   std::vector<Statement> statements;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
