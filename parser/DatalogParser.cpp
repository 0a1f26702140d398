#include "parser/DatalogParser.hpp"
#include "infra/Error.hpp"
#include <algorithm>
#include <limits>
#include <unordered_set>
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
DatalogParser::DatalogParser(string_view input, string fileName)
   : lexer(input, move(fileName)), token(Token::Eof), info{input.substr(0, 0), DatalogLexer::TokenInfo::Encoding::Raw}, lastEnd(input.data())
// Constructor
{
   advance();
}
//---------------------------------------------------------------------------
void DatalogParser::advance()
// Move to the next token
{
   lastEnd = info.content.data() + info.content.size();
   token = lexer.next(info);
   switch (token) {
      case Token::Error:
      case Token::UnterminatedLiteral:
      case Token::UnterminatedMultilineComment:
         throw LexError(string(info.content), lexer.getSpan(info.content.data(), info.content.data() + info.content.size()));
      default: break;
   }
}
//---------------------------------------------------------------------------
void DatalogParser::reportError(const string& message, const char* begin)
// Report a syntax error
{
   string fullMessage = message;
   if (token == Token::Eof)
      fullMessage += ", got end of input";
   else
      fullMessage += ", got '" + string(info.content) + "'";
   throw SyntaxError(move(fullMessage), lexer.getSpan(begin, info.content.data() + info.content.size()));
}
//---------------------------------------------------------------------------
void DatalogParser::expect(Token expected, const char* description, const char* begin)
// Consume a token of the expected kind
{
   if (token != expected)
      reportError(string("expected ") + description, begin);
   advance();
}
//---------------------------------------------------------------------------
ast::Var DatalogParser::makeVariable(string_view name, const char* begin)
// Turn an identifier into a variable
{
   if (name == "_")
      return ast::AnonVar{};

   // _<digits> is a positional variable. Leading zeros keep the name so that _01 and _1 stay distinct
   auto digits = name.substr(min<size_t>(name.size(), 1));
   bool numbered = (name[0] == '_') && !digits.empty() && ((digits[0] != '0') || (digits.size() == 1));
   for (char c : digits)
      numbered = numbered && (c >= '0') && (c <= '9');
   if (numbered) {
      unsigned number = 0;
      for (char c : digits) {
         unsigned digit = c - '0';
         if (number > (numeric_limits<unsigned>::max() - digit) / 10)
            reportError("numbered variable " + string(name) + " out of range", begin);
         number = number * 10 + digit;
      }
      return ast::NumberedVar{number};
   }
   return ast::NamedVar{string(name)};
}
//---------------------------------------------------------------------------
bool DatalogParser::isComparison(Token token)
// Is the token a comparison operator?
{
   switch (token) {
      case Token::Equals:
      case Token::NotEquals:
      case Token::Less:
      case Token::LessEquals:
      case Token::Greater:
      case Token::GreaterEquals: return true;
      default: return false;
   }
}
//---------------------------------------------------------------------------
bool DatalogParser::isAggregateFunction(string_view name)
// Is the name an aggregate function?
{
   return (name == "min") || (name == "max") || (name == "sum") || (name == "avg") || (name == "count");
}
//---------------------------------------------------------------------------
ast::Program DatalogParser::parseProgram()
// Parse the whole input
{
   ast::Program program;
   while (token != Token::Eof)
      program.statements.push_back(parseStatement());
   return program;
}
//---------------------------------------------------------------------------
ast::Statement DatalogParser::parseStatement()
// Parse a statement
{
   auto begin = tokenBegin();
   switch (token) {
      case Token::SOURCE: {
         advance();
         auto atom = parseAtom(ast::Atom::Kind::Pred, begin);
         unordered_set<string> names;
         for (auto& a : atom.getArgs()) {
            if (a.getKind() != ast::Var::Kind::Named)
               reportError("the columns of source " + atom.getName() + " must be named", begin);
            if (!names.insert(a.toString()).second)
               reportError("the column " + a.toString() + " of source " + atom.getName() + " is declared twice", begin);
         }
         expect(Token::Dot, "'.'", begin);
         return ast::Statement::makeBase(move(atom), lexer.getSpan(begin, lastEnd));
      }
      case Token::QuestionMinus: {
         advance();
         auto atom = parseAtom(ast::Atom::Kind::Pred, begin);
         expect(Token::Dot, "'.'", begin);
         return ast::Statement::makeQuery(move(atom), lexer.getSpan(begin, lastEnd));
      }
      default: {
         auto kind = ast::Atom::Kind::Pred;
         if (token == Token::Plus) {
            kind = ast::Atom::Kind::DeltaInsert;
            advance();
         } else if (token == Token::Minus) {
            kind = ast::Atom::Kind::DeltaDelete;
            advance();
         }
         auto head = parseAtom(kind, begin);
         expect(Token::ColonMinus, "':-'", begin);
         auto body = parseBody();
         expect(Token::Dot, "'.'", begin);
         return ast::Statement::makeRule(move(head), move(body), lexer.getSpan(begin, lastEnd));
      }
   }
}
//---------------------------------------------------------------------------
ast::Atom DatalogParser::parseAtom(ast::Atom::Kind kind, const char* begin)
// Parse an atom
{
   if (token != Token::Identifier)
      reportError("expected a predicate name", begin);
   auto name = info.asString();
   advance();

   // Zero-ary predicates may omit the parentheses
   vector<ast::Var> args;
   if (token == Token::LParen) {
      advance();
      if (token != Token::RParen) {
         args.push_back(parseOperand());
         while (token == Token::Comma) {
            advance();
            args.push_back(parseOperand());
         }
      }
      expect(Token::RParen, "')'", begin);
   }
   return ast::Atom(move(name), move(args), kind);
}
//---------------------------------------------------------------------------
ast::Var DatalogParser::parseNumber(bool negative, const char* begin)
// Parse a numeric constant
{
   if ((token != Token::Integer) && (token != Token::Float))
      reportError("expected a number", begin);
   auto kind = (token == Token::Integer) ? ast::Constant::Kind::Integer : ast::Constant::Kind::Float;
   string value = negative ? "-" : "";
   value += info.asString();
   advance();
   return ast::ConstVar{ast::Constant(kind, move(value))};
}
//---------------------------------------------------------------------------
ast::Var DatalogParser::parseOperand()
// Parse an atom argument or a comparison operand
{
   auto begin = tokenBegin();
   switch (token) {
      case Token::Identifier: {
         auto name = info.asString();
         advance();
         if (token != Token::LParen)
            return makeVariable(name, begin);

         // An aggregate over a variable
         if (!isAggregateFunction(name))
            reportError("unknown aggregate function '" + name + "'", begin);
         advance();
         if (token != Token::Identifier)
            reportError("expected a variable", begin);
         auto variable = info.asString();
         advance();
         expect(Token::RParen, "')'", begin);
         return ast::AggVar{move(name), move(variable)};
      }
      case Token::Integer:
      case Token::Float: return parseNumber(false, begin);
      case Token::Minus:
         advance();
         return parseNumber(true, begin);
      case Token::String: {
         ast::Var result = ast::ConstVar{ast::Constant::makeString(info.asString())};
         advance();
         return result;
      }
      case Token::TRUE_P:
      case Token::FALSE_P: {
         ast::Var result = ast::ConstVar{ast::Constant(ast::Constant::Kind::Bool, info.asString())};
         advance();
         return result;
      }
      case Token::NULL_P:
         advance();
         return ast::ConstVar{ast::Constant::makeNull()};
      default: reportError("expected an argument", begin);
   }
}
//---------------------------------------------------------------------------
ast::Literal DatalogParser::parseComparison(ast::Var left, const char* begin)
// Parse the rest of a comparison
{
   string op;
   switch (token) {
      case Token::Equals: op = "="; break;
      case Token::NotEquals: op = "<>"; break;
      case Token::Less: op = "<"; break;
      case Token::LessEquals: op = "<="; break;
      case Token::Greater: op = ">"; break;
      case Token::GreaterEquals: op = ">="; break;
      default: reportError("expected a comparison operator", begin);
   }
   advance();
   auto right = parseOperand();
   if (op == "=")
      return ast::Literal::makeEquality(move(left), move(right));
   return ast::Literal::makeInequality(move(op), move(left), move(right));
}
//---------------------------------------------------------------------------
ast::Literal DatalogParser::parseLiteral()
// Parse a body literal
{
   auto begin = tokenBegin();
   switch (token) {
      case Token::NOT: {
         advance();
         auto kind = ast::Atom::Kind::Pred;
         if (token == Token::Plus) {
            kind = ast::Atom::Kind::DeltaInsert;
            advance();
         } else if (token == Token::Minus) {
            kind = ast::Atom::Kind::DeltaDelete;
            advance();
         }
         return ast::Literal::makeNegation(parseAtom(kind, begin));
      }
      case Token::Plus:
         advance();
         return ast::Literal::makeRelation(parseAtom(ast::Atom::Kind::DeltaInsert, begin));
      case Token::Minus:
         advance();
         // A negative number starts a comparison, anything else is a delete atom
         if ((token == Token::Integer) || (token == Token::Float))
            return parseComparison(parseNumber(true, begin), begin);
         return ast::Literal::makeRelation(parseAtom(ast::Atom::Kind::DeltaDelete, begin));
      case Token::Identifier: {
         // Look behind the identifier to distinguish atoms from comparisons
         auto savedPosition = lexer.savePosition();
         auto savedInfo = info;
         auto savedEnd = lastEnd;
         advance();
         bool comparison = isComparison(token);
         lexer.restorePosition(savedPosition);
         token = Token::Identifier;
         info = savedInfo;
         lastEnd = savedEnd;

         if (!comparison)
            return ast::Literal::makeRelation(parseAtom(ast::Atom::Kind::Pred, begin));
         return parseComparison(parseOperand(), begin);
      }
      default: return parseComparison(parseOperand(), begin);
   }
}
//---------------------------------------------------------------------------
vector<ast::Literal> DatalogParser::parseBody()
// Parse a rule body
{
   vector<ast::Literal> body;
   body.push_back(parseLiteral());
   while ((token == Token::Comma) || (token == Token::AND)) {
      advance();
      body.push_back(parseLiteral());
   }
   return body;
}
//---------------------------------------------------------------------------
ast::Program DatalogParser::parse(string_view input, string fileName)
// Parse the input
{
   DatalogParser parser(input, move(fileName));
   return parser.parseProgram();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
