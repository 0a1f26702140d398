#include "infra/Error.hpp"
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
string formatError(string_view message, const SourceSpan& span)
// Format a message with its location
{
   string result = "File \"";
   result += span.file;
   result += "\", line ";
   result += to_string(span.line);
   result += ", characters ";
   result += to_string(span.begin);
   result += "-";
   result += to_string(span.end);
   result += ": '";
   result += message;
   result += "'";
   return result;
}
//---------------------------------------------------------------------------
LexError::LexError(string lexeme, SourceSpan span)
   : runtime_error(formatError(lexeme, span)), lexeme(move(lexeme)), span(move(span))
// Constructor
{
}
//---------------------------------------------------------------------------
SyntaxError::SyntaxError(string message, SourceSpan span)
   : runtime_error(formatError(message, span)), message(move(message)), span(move(span))
// Constructor
{
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
