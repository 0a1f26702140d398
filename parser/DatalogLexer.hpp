#ifndef H_deltalog_DatalogLexer
#define H_deltalog_DatalogLexer
//---------------------------------------------------------------------------
#include "infra/Error.hpp"
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// A lexer for Datalog programs
class DatalogLexer {
   public:
   /// A token
   enum class Token : unsigned {
      Eof,
      Error,
      ColonMinus,
      Comma,
      Dot,
      Equals,
      Float,
      Greater,
      GreaterEquals,
      Identifier,
      Integer,
      LParen,
      Less,
      LessEquals,
      Minus,
      NotEquals,
      Plus,
      QuestionMinus,
      RParen,
      String,
      UnterminatedLiteral,
      UnterminatedMultilineComment,
#define KEYWORD(A, B) B,
#include "parser/Keywords.hpp"
#undef KEYWORD
   };
   /// The content of a token
   struct TokenInfo {
      /// Possible token encodings
      enum class Encoding : unsigned {
         Raw,
         StringLiteral
      };

      /// The content
      std::string_view content;
      /// The encoding
      Encoding encoding;

      /// Get the content converted into a regular string
      std::string asString() const;
   };

   private:
   /// Get the next character
   unsigned nextChar();
   /// Retrieve the next character without consuming it
   inline unsigned peekChar();

   /// Get the next token
   Token nextImpl(TokenInfo& info);

   /// Lex an identifier
   Token lexIdentifier(TokenInfo& info);
   /// Lex a number
   Token lexNumber(TokenInfo& info);
   /// Lex a string literal
   Token lexStringLiteral(TokenInfo& info);

   private:
   /// The input
   std::string_view input;
   /// The file name for error messages
   std::string fileName;
   /// The current position
   const char* current;

   public:
   /// Constructor
   explicit DatalogLexer(std::string_view input, std::string fileName = "<input>");

   /// Access the full text
   std::string_view getFullText() const { return input; }
   /// Get the file name
   const std::string& getFileName() const { return fileName; }
   /// Get the current position
   const char* savePosition() const { return current; }
   /// Go back to a previously saved position
   void restorePosition(const char* p) { current = p; }

   /// Get the next token
   Token next(TokenInfo& info);

   /// Compute the location of a range of the input
   SourceSpan getSpan(const char* begin, const char* end) const;
   /// Check if a symbol is a keyword
   static bool isKeyword(std::string_view symbol);
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
