#ifndef H_deltalog_EqualityTable
#define H_deltalog_EqualityTable
//---------------------------------------------------------------------------
#include "infra/Options.hpp"
#include "parser/AST.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// The constants that variables of a rule body are bound to
class EqualityTable {
   private:
   /// The bindings per variable name. A later binding shadows the earlier ones
   std::unordered_map<std::string, std::vector<ast::Constant>> bindings;

   public:
   /// Constructor
   explicit EqualityTable(const AnalysisOptions& options = {});

   /// Bind a variable. Re-binding keeps the previous value underneath
   void insert(const std::string& name, ast::Constant value);
   /// Consume the most recent binding of a variable. Throws std::out_of_range if there is none
   ast::Constant extract(const std::string& name);

   /// Get the most recent binding without consuming it. Returns nullptr if there is none
   const ast::Constant* lookup(const std::string& name) const;
   /// Is the variable bound?
   bool contains(const std::string& name) const { return bindings.count(name); }
   /// All bound variable names in sorted order
   std::vector<std::string> getVariables() const;
   /// Is the table empty?
   bool empty() const { return bindings.empty(); }

   /// Build the table from equalities of the form var = const. Throws std::invalid_argument for any other form
   static EqualityTable build(const std::vector<ast::Literal>& equalities, const AnalysisOptions& options = {});
};
//---------------------------------------------------------------------------
/// Split an equality of the form var = const (or const = var). Throws std::invalid_argument for any other form
std::pair<ast::Var, ast::Constant> extractEqualityTuple(const ast::Literal& literal);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
