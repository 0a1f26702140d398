#ifndef H_deltalog_DatalogParser
#define H_deltalog_DatalogParser
//---------------------------------------------------------------------------
#include "parser/AST.hpp"
#include "parser/DatalogLexer.hpp"
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// A recursive descent parser for Datalog programs
class DatalogParser {
   private:
   using Token = DatalogLexer::Token;

   /// The lexer
   DatalogLexer lexer;
   /// The current token
   Token token;
   /// The content of the current token
   DatalogLexer::TokenInfo info;
   /// The end of the last consumed token
   const char* lastEnd;

   /// Move to the next token. Throws a LexError for unrecognized input
   void advance();
   /// The start of the current token
   const char* tokenBegin() const { return info.content.data(); }
   /// Report a syntax error spanning from begin to the end of the current token
   [[noreturn]] void reportError(const std::string& message, const char* begin);
   /// Consume a token of the expected kind
   void expect(Token expected, const char* description, const char* begin);

   /// Turn an identifier into a variable. Positional numbers beyond the unsigned range are a syntax error
   ast::Var makeVariable(std::string_view name, const char* begin);
   /// Is the token a comparison operator?
   static bool isComparison(Token token);
   /// Is the name an aggregate function?
   static bool isAggregateFunction(std::string_view name);

   /// Parse a statement
   ast::Statement parseStatement();
   /// Parse an atom after its optional sign
   ast::Atom parseAtom(ast::Atom::Kind kind, const char* begin);
   /// Parse an atom argument or a comparison operand
   ast::Var parseOperand();
   /// Parse a constant after an optional minus sign
   ast::Var parseNumber(bool negative, const char* begin);
   /// Parse a body literal
   ast::Literal parseLiteral();
   /// Parse the rest of a comparison after its left operand
   ast::Literal parseComparison(ast::Var left, const char* begin);
   /// Parse a rule body
   std::vector<ast::Literal> parseBody();

   public:
   /// Constructor
   explicit DatalogParser(std::string_view input, std::string fileName = "<input>");

   /// Parse the whole input
   ast::Program parseProgram();

   /// Parse the input
   static ast::Program parse(std::string_view input, std::string fileName = "<input>");
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
