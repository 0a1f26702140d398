#ifndef H_deltalog_Error
#define H_deltalog_Error
//---------------------------------------------------------------------------
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// A region of the input
struct SourceSpan {
   /// The file name
   std::string file;
   /// The line of the first character (1-based)
   unsigned line = 0;
   /// The first character within its line (0-based)
   unsigned begin = 0;
   /// The character after the last one, relative to the start of its own line
   unsigned end = 0;
};
//---------------------------------------------------------------------------
/// Format a message with its location
std::string formatError(std::string_view message, const SourceSpan& span);
//---------------------------------------------------------------------------
/// An unrecognized token
class LexError : public std::runtime_error {
   /// The offending lexeme
   std::string lexeme;
   /// The location
   SourceSpan span;

   public:
   /// Constructor
   LexError(std::string lexeme, SourceSpan span);

   /// Get the lexeme
   const std::string& getLexeme() const { return lexeme; }
   /// Get the location
   const SourceSpan& getSpan() const { return span; }
};
//---------------------------------------------------------------------------
/// A grammar violation
class SyntaxError : public std::runtime_error {
   /// The message without location
   std::string message;
   /// The location of the non-terminal
   SourceSpan span;

   public:
   /// Constructor
   SyntaxError(std::string message, SourceSpan span);

   /// Get the raw message
   const std::string& getMessage() const { return message; }
   /// Get the location
   const SourceSpan& getSpan() const { return span; }
};
//---------------------------------------------------------------------------
/// A meaning-level violation found during analysis
class SemanticError : public std::runtime_error {
   /// The offending predicate signature, rendered as name/arity (if any)
   std::string predicate;

   public:
   /// Constructor
   explicit SemanticError(const std::string& message, std::string predicate = {}) : std::runtime_error(message), predicate(std::move(predicate)) {}

   /// Does the error name a predicate?
   bool hasPredicate() const { return !predicate.empty(); }
   /// Get the predicate signature
   const std::string& getPredicate() const { return predicate; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
