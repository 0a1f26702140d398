#include "parser/DatalogLexer.hpp"
#include <unordered_map>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
static auto getKeywordsTable()
// Build the keywords lookup table
{
   unordered_map<string_view, DatalogLexer::Token> res;
#define KEYWORD(A, B) res[A##sv] = DatalogLexer::Token::B;
#include "parser/Keywords.hpp"
#undef KEYWORD
   return res;
}
//---------------------------------------------------------------------------
static const auto keywordsHashTable = getKeywordsTable();
//---------------------------------------------------------------------------
static bool isIdentifierChar(unsigned c)
// Characters that may continue an identifier
{
   return ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z')) || ((c >= '0') && (c <= '9')) || (c == '_');
}
//---------------------------------------------------------------------------
static bool isDigit(unsigned c)
// Recognize decimal digits
{
   return (c >= '0') && (c <= '9');
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
DatalogLexer::DatalogLexer(string_view input, string fileName)
   : input(input), fileName(move(fileName)), current(input.data())
// Constructor
{
}
//---------------------------------------------------------------------------
DatalogLexer::Token DatalogLexer::next(TokenInfo& info)
// Get the next token
{
   return nextImpl(info);
}
//---------------------------------------------------------------------------
unsigned DatalogLexer::nextChar()
// Get the next character
{
   if (current == input.data() + input.size())
      return 0;

   unsigned c = (*current) & 0xFF;
   current += !!c;
   return c;
}
//---------------------------------------------------------------------------
unsigned DatalogLexer::peekChar()
// Retrieve the next character without consuming it
{
   return (current != input.data() + input.size()) ? ((*current) & 0xFF) : 0;
}
//---------------------------------------------------------------------------
DatalogLexer::Token DatalogLexer::nextImpl(TokenInfo& info)
// Get the next token
{
   auto limit = input.data() + input.size();
   while (true) {
      // Most tokens are single-character anyway, prepare for handling these directly
      auto old = current;
      unsigned c = nextChar();
      info.content = string_view(old, current - old);
      info.encoding = TokenInfo::Encoding::Raw;

      // Handle EOF
      if (!c) {
         if (current == limit) return Token::Eof;
         ++current;
         info.content = string_view(old, current - old);
         return Token::Error;
      }

      switch (c) {
         case 0x09:
         case 0x0A:
         case 0x0B:
         case 0x0C:
         case 0x0D:
         case 0x20: continue;
         case '%':
            // % starts a single-line comment
            while (current != limit) {
               c = *(current++);
               if ((c == '\n') || (c == '\r'))
                  break;
            }
            continue;
         case '/':
            // /* starts a multi-line comment
            if (peekChar() == '*') {
               ++current;
               unsigned c2 = 0;
               while (true) {
                  c = nextChar();
                  if (!c) {
                     info.content = string_view(old, current - old);
                     return Token::UnterminatedMultilineComment;
                  }
                  if ((c2 == '*') && (c == '/'))
                     break;
                  c2 = c;
               }
               continue;
            }
            return Token::Error;
         case '(': return Token::LParen;
         case ')': return Token::RParen;
         case ',': return Token::Comma;
         case '.': return Token::Dot;
         case '+': return Token::Plus;
         case '-': return Token::Minus;
         case '=': return Token::Equals;
         case ':':
            if (peekChar() == '-') {
               ++current;
               info.content = string_view(old, current - old);
               return Token::ColonMinus;
            }
            return Token::Error;
         case '?':
            if (peekChar() == '-') {
               ++current;
               info.content = string_view(old, current - old);
               return Token::QuestionMinus;
            }
            return Token::Error;
         case '!':
            if (peekChar() == '=') {
               ++current;
               info.content = string_view(old, current - old);
               return Token::NotEquals;
            }
            return Token::Error;
         case '<':
            c = peekChar();
            if ((c == '>') || (c == '=')) {
               ++current;
               info.content = string_view(old, current - old);
               return (c == '>') ? Token::NotEquals : Token::LessEquals;
            }
            return Token::Less;
         case '>':
            if (peekChar() == '=') {
               ++current;
               info.content = string_view(old, current - old);
               return Token::GreaterEquals;
            }
            return Token::Greater;
         case '\'': return lexStringLiteral(info);
         default:
            if (isDigit(c))
               return lexNumber(info);
            if (((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z')) || (c == '_'))
               return lexIdentifier(info);
            return Token::Error;
      }
   }
}
//---------------------------------------------------------------------------
DatalogLexer::Token DatalogLexer::lexIdentifier(TokenInfo& info)
// Lex an identifier
{
   while (isIdentifierChar(peekChar()))
      ++current;
   info.content = string_view(info.content.data(), current - info.content.data());

   // Our identifier could be a keyword, check that
   auto keywordInfo = keywordsHashTable.find(info.content);
   if (keywordInfo != keywordsHashTable.end())
      return keywordInfo->second;
   return Token::Identifier;
}
//---------------------------------------------------------------------------
DatalogLexer::Token DatalogLexer::lexNumber(TokenInfo& info)
// Lex a number
{
   auto begin = info.content.data();
   auto limit = input.data() + input.size();
   auto result = Token::Integer;

   // The integer part
   while (isDigit(peekChar()))
      ++current;

   // The fractional part. A dot without a digit behind it ends the statement
   if ((peekChar() == '.') && ((current + 1) < limit) && isDigit(current[1])) {
      ++current;
      while (isDigit(peekChar()))
         ++current;
      result = Token::Float;
   }

   // The exponent part
   unsigned c = peekChar();
   if ((c == 'e') || (c == 'E')) {
      auto beginExponent = current;
      ++current;
      c = peekChar();
      if ((c == '+') || (c == '-')) {
         ++current;
         c = peekChar();
      }
      if (isDigit(c)) {
         while (isDigit(peekChar()))
            ++current;
         result = Token::Float;
      } else {
         current = beginExponent;
      }
   }

   info.content = string_view(begin, current - begin);
   return result;
}
//---------------------------------------------------------------------------
DatalogLexer::Token DatalogLexer::lexStringLiteral(TokenInfo& info)
// Lex a string literal
{
   for (auto limit = input.data() + input.size(); current < limit;) {
      char c = *(current++);
      if (c == '\'') {
         // Escaped quote?
         if ((current < limit) && ((*current) == '\'')) {
            ++current;
            continue;
         }
         info.content = string_view(info.content.data(), current - info.content.data());
         info.encoding = TokenInfo::Encoding::StringLiteral;
         return Token::String;
      }
   }
   info.content = string_view(info.content.data(), current - info.content.data());
   return Token::UnterminatedLiteral;
}
//---------------------------------------------------------------------------
string DatalogLexer::TokenInfo::asString() const
// Get the content converted into a regular string
{
   switch (encoding) {
      case Encoding::Raw:
         return string(content.begin(), content.end());
      case Encoding::StringLiteral: {
         string result;
         for (auto iter = content.begin() + 1, limit = content.end() - 1; iter < limit; ++iter) {
            char c = *iter;
            // Handle quotes within the literal
            if (c == '\'')
               ++iter; // skip the doubled quote
            result += c;
         }
         return result;
      }
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
SourceSpan DatalogLexer::getSpan(const char* begin, const char* end) const
// Compute the location of a range of the input
{
   SourceSpan span;
   span.file = fileName;
   span.line = 1;
   const char* lineStart = input.data();
   for (auto iter = input.data(); iter < begin; ++iter)
      if ((*iter) == '\n') {
         ++span.line;
         lineStart = iter + 1;
      }
   span.begin = begin - lineStart;

   // The end is relative to the start of its own line
   for (auto iter = begin; iter < end; ++iter)
      if ((*iter) == '\n')
         lineStart = iter + 1;
   span.end = end - lineStart;
   return span;
}
//---------------------------------------------------------------------------
bool DatalogLexer::isKeyword(string_view symbol)
// Check if a symbol is a keyword
{
   return keywordsHashTable.find(symbol) != keywordsHashTable.end();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
