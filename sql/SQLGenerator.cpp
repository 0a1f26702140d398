#include "sql/SQLGenerator.hpp"
#include "infra/Error.hpp"
#include "semana/EqualityTable.hpp"
#include "semana/ProgramAnalysis.hpp"
#include "semana/VariableTable.hpp"
#include "sql/SQLWriter.hpp"
#include <functional>
#include <unordered_map>
#include <unordered_set>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
void checkNoAggregate(const ast::Var& v, const ast::Statement& rule)
// Reject aggregates outside of rule heads
{
   if (v.isAggregate()) {
      auto key = PredicateKey::of(rule.getHead());
      throw SemanticError("Rule for " + key.toString() + " uses the aggregate " + v.toString() + " in a comparison, which is only allowed in rule heads", key.toString());
   }
}
//---------------------------------------------------------------------------
bool isConstantEquality(const ast::Literal::Comparison& c)
// Is the literal an equality between a variable and a constant?
{
   return (c.left.isVariable() && c.right.isConst()) || (c.left.isConst() && c.right.isVariable());
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
SQLGenerator::SQLGenerator(const ast::Program& program, const AnalysisOptions& options)
   : program(program), options(options), extensional(SymbolTable::extractExtensional(program, options)), intensional(SymbolTable::extractIntensional(program, options)), deltaRules(SymbolTable::extractDeltaRules(program, options)), columns(ColumnNameTable::build(extensional, intensional, options))
// Constructor
{
}
//---------------------------------------------------------------------------
string SQLGenerator::getRelationName(const ast::Atom& atom)
// The relation that stores an atom
{
   switch (atom.getKind()) {
      case ast::Atom::Kind::Pred: return atom.getName();
      case ast::Atom::Kind::DeltaInsert: return "ins_" + atom.getName();
      case ast::Atom::Kind::DeltaDelete: return "del_" + atom.getName();
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
vector<string> SQLGenerator::getHeadColumns(const ast::Atom& head) const
// The column names of a rule head
{
   if (auto c = columns.lookup(PredicateKey::of(head))) return *c;
   // Updates of relations that are neither declared nor derived
   return ColumnNameTable::positionalNames(head.getArity());
}
//---------------------------------------------------------------------------
void SQLGenerator::translateRule(SQLWriter& out, const ast::Statement& rule)
// Translate a single rule into a select statement
{
   auto headKey = PredicateKey::of(rule.getHead());

   // Split the body into goals, negated goals, and constraints
   vector<ast::Atom> goals, negations;
   vector<ast::Literal> constantEqualities;
   vector<const ast::Literal::Comparison*> comparisons;
   for (auto& l : rule.getBody()) {
      switch (l.getKind()) {
         case ast::Literal::Kind::Rel: goals.push_back(l.getAtom()); break;
         case ast::Literal::Kind::Not: negations.push_back(l.getAtom()); break;
         case ast::Literal::Kind::Equal:
         case ast::Literal::Kind::Ineq: {
            auto& c = l.getComparison();
            checkNoAggregate(c.left, rule);
            checkNoAggregate(c.right, rule);
            if ((l.getKind() == ast::Literal::Kind::Equal) && isConstantEquality(c))
               constantEqualities.push_back(l);
            else
               comparisons.push_back(&c);
            break;
         }
      }
   }
   auto vars = VariableTable::build(columns, goals, options);
   auto eqs = EqualityTable::build(constantEqualities, options);

   // Consume every equality exactly once. The most recent binding of a variable replaces it where it is not bound by a goal
   unordered_map<string, ast::Constant> constants;
   vector<pair<string, ast::Constant>> equalityConditions;
   for (auto& name : eqs.getVariables()) {
      while (eqs.contains(name)) {
         auto value = eqs.extract(name);
         if (!vars.contains(name) && !constants.count(name))
            constants.emplace(name, move(value));
         else
            equalityConditions.emplace_back(name, move(value));
      }
   }

   // An equality between variables binds a variable that no goal binds to the other side
   unordered_map<string, string> aliases;
   unordered_set<const ast::Literal::Comparison*> consumed;
   auto resolve = [&](string name) {
      for (auto iter = aliases.find(name); iter != aliases.end(); iter = aliases.find(name))
         name = iter->second;
      return name;
   };
   auto isBound = [&](const string& name) {
      auto target = resolve(name);
      return vars.contains(target) || constants.count(target);
   };
   for (bool changed = true; changed;) {
      changed = false;
      for (auto c : comparisons) {
         if ((c->op != "=") || !c->left.isVariable() || !c->right.isVariable() || consumed.count(c)) continue;
         auto left = c->left.toString(), right = c->right.toString();
         bool leftBound = isBound(left), rightBound = isBound(right);
         if (leftBound == rightBound) continue;
         if (leftBound)
            aliases.emplace(right, left);
         else
            aliases.emplace(left, right);
         consumed.insert(c);
         changed = true;
      }
   }

   auto writeVariable = [&](const string& variable) {
      auto name = resolve(variable);
      if (auto refs = vars.lookup(name)) {
         out.writeColumn(refs->back());
      } else if (auto iter = constants.find(name); iter != constants.end()) {
         out.writeConstant(iter->second);
      } else {
         throw SemanticError("Variable " + variable + " in a rule for " + headKey.toString() + " is not bound by a positive goal", headKey.toString());
      }
   };
   auto writeOperand = [&](const ast::Var& v) {
      if (v.isConst())
         out.writeConstant(v.getConstant());
      else
         writeVariable(v.toString());
   };

   // The result columns
   auto headColumns = getHeadColumns(rule.getHead());
   auto& headArgs = rule.getHead().getArgs();
   bool hasAggregates = false;
   out.write("select ");
   if (headArgs.empty())
      out.write("true");
   for (unsigned index = 0; index != headArgs.size(); ++index) {
      if (index) out.write(", ");
      auto& a = headArgs[index];
      if (a.isAggregate()) {
         hasAggregates = true;
         auto& agg = a.getAggregate();
         out.write(agg.function);
         out.write("(");
         writeVariable(agg.variable);
         out.write(")");
      } else {
         writeOperand(a);
      }
      out.write(" as ");
      out.writeIdentifier(headColumns[index]);
   }

   // The goals, aliased by occurrence
   for (unsigned index = 0; index != goals.size(); ++index) {
      auto& g = goals[index];
      out.write(index ? ", " : " from ");
      out.writeIdentifier(getRelationName(g));
      out.write(" as ");
      out.writeIdentifier(ColumnRef{g.getName(), g.getArity(), index, {}}.getAlias());
   }

   bool firstCondition = true;
   auto nextCondition = [&]() {
      out.write(firstCondition ? " where " : " and ");
      firstCondition = false;
   };

   // Repeated variables join their goals
   for (auto& [left, right] : vars.getJoinPairs()) {
      nextCondition();
      out.writeColumn(left);
      out.write(" = ");
      out.writeColumn(right);
   }

   // Constants within goals filter
   for (unsigned index = 0; index != goals.size(); ++index) {
      auto& g = goals[index];
      auto& names = columns.getColumns(PredicateKey::of(g));
      for (unsigned arg = 0; arg != g.getArity(); ++arg) {
         if (!g.getArgs()[arg].isConst()) continue;
         nextCondition();
         out.writeColumn(ColumnRef{g.getName(), g.getArity(), index, names[arg]});
         out.write(" = ");
         out.writeConstant(g.getArgs()[arg].getConstant());
      }
   }

   // Equalities that could not replace their variable
   for (auto& [name, value] : equalityConditions) {
      nextCondition();
      writeVariable(name);
      out.write(" = ");
      out.writeConstant(value);
   }

   // Remaining comparisons
   for (auto c : comparisons) {
      if (consumed.count(c)) continue;
      nextCondition();
      writeOperand(c->left);
      out.write(" ");
      out.write(c->op);
      out.write(" ");
      writeOperand(c->right);
   }

   // Negated goals
   for (unsigned index = 0; index != negations.size(); ++index) {
      auto& n = negations[index];
      auto key = PredicateKey::of(n);
      auto& names = columns.getColumns(key);
      string alias = key.getAlias() + "_not" + to_string(index);
      nextCondition();
      out.write("not exists (select * from ");
      out.writeIdentifier(getRelationName(n));
      out.write(" as ");
      out.writeIdentifier(alias);
      bool first = true;
      for (unsigned arg = 0; arg != n.getArity(); ++arg) {
         auto& a = n.getArgs()[arg];
         if (a.isAnonymous()) continue;
         if (a.isAggregate())
            throw SemanticError("Goal " + key.toString() + " contains an aggregate function as a variable, which is only allowed in rule heads", key.toString());
         out.write(first ? " where " : " and ");
         first = false;
         out.writeIdentifier(alias);
         out.write(".");
         out.writeIdentifier(names[arg]);
         out.write(" = ");
         writeOperand(a);
      }
      out.write(")");
   }

   // Aggregates group by the remaining result columns
   if (hasAggregates) {
      bool first = true;
      for (auto& a : headArgs) {
         if (!a.isVariable() || !vars.contains(resolve(a.toString()))) continue;
         out.write(first ? " group by " : ", ");
         first = false;
         writeOperand(a);
      }
   }
}
//---------------------------------------------------------------------------
void SQLGenerator::translateUnion(SQLWriter& out, const vector<const ast::Statement*>& rules)
// Write a union of rules
{
   bool first = true;
   for (auto r : rules) {
      if (!first) out.write(" union ");
      first = false;
      translateRule(out, *r);
   }
}
//---------------------------------------------------------------------------
vector<PredicateKey> SQLGenerator::getViewOrder() const
// The derived predicates, dependencies first
{
   enum class State { Visiting, Done };
   unordered_map<PredicateKey, State, PredicateKey::Hash> state;
   vector<PredicateKey> order;

   function<void(const PredicateKey&)> visit = [&](const PredicateKey& key) {
      if (auto iter = state.find(key); iter != state.end()) {
         if (iter->second == State::Done) return;
         throw SemanticError("Predicate " + key.toString() + " is defined recursively, which cannot be translated into a view", key.toString());
      }
      state[key] = State::Visiting;
      for (auto& r : *intensional.lookup(key))
         for (auto& l : r.getBody())
            if (l.hasAtom() && !l.getAtom().isDelta()) {
               auto dep = PredicateKey::of(l.getAtom());
               if (intensional.contains(dep))
                  visit(dep);
            }
      state[key] = State::Done;
      order.push_back(key);
   };
   for (auto& key : intensional.getKeys())
      visit(key);
   return order;
}
//---------------------------------------------------------------------------
void SQLGenerator::translateViews(SQLWriter& out)
// Create a view for every derived predicate
{
   for (auto& key : getViewOrder()) {
      vector<const ast::Statement*> rules;
      for (auto& r : *intensional.lookup(key))
         rules.push_back(&r);
      out.write("create view ");
      out.writeIdentifier(key.name);
      out.write(" as ");
      translateUnion(out, rules);
      out.write(";\n");
   }
}
//---------------------------------------------------------------------------
void SQLGenerator::translateQuery(SQLWriter& out)
// Select the result of the query
{
   auto& query = getQuery(program).getHead();
   auto& names = columns.getColumns(PredicateKey::of(query));
   ColumnRef base{query.getName(), query.getArity(), 0, {}};

   out.write("select * from ");
   out.writeIdentifier(getRelationName(query));
   out.write(" as ");
   out.writeIdentifier(base.getAlias());

   // Constants filter, repeated variables must agree
   unordered_map<string, unsigned> firstColumn;
   bool first = true;
   auto& args = query.getArgs();
   for (unsigned index = 0; index != args.size(); ++index) {
      auto& a = args[index];
      auto column = base;
      column.column = names[index];
      if (a.isConst()) {
         out.write(first ? " where " : " and ");
         first = false;
         out.writeColumn(column);
         out.write(" = ");
         out.writeConstant(a.getConstant());
      } else if (a.isVariable()) {
         auto [iter, inserted] = firstColumn.emplace(a.toString(), index);
         if (inserted) continue;
         out.write(first ? " where " : " and ");
         first = false;
         auto other = base;
         other.column = names[iter->second];
         out.writeColumn(other);
         out.write(" = ");
         out.writeColumn(column);
      }
   }
   out.write(";\n");
}
//---------------------------------------------------------------------------
void SQLGenerator::translateDeltas(SQLWriter& out)
// Create a view for every update of the program
{
   for (auto& delta : extractDeltaPredicates(program)) {
      auto key = PredicateKey::of(delta);
      vector<const ast::Statement*> inserts, deletes;
      for (auto& r : *deltaRules.lookup(key))
         (r.getHead().getKind() == ast::Atom::Kind::DeltaInsert ? inserts : deletes).push_back(&r);

      for (auto* rules : {&inserts, &deletes}) {
         if (rules->empty()) continue;
         out.write("create view ");
         out.writeIdentifier(getRelationName(rules->front()->getHead()));
         out.write(" as ");
         translateUnion(out, *rules);
         out.write(";\n");
      }
   }
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
