#include "sql/SQLWriter.hpp"
#include "parser/AST.hpp"
#include "semana/VariableTable.hpp"
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
SQLWriter::SQLWriter()
// Constructor
{
}
//---------------------------------------------------------------------------
SQLWriter::~SQLWriter()
// Destructor
{
}
//---------------------------------------------------------------------------
void SQLWriter::write(std::string_view sql)
// Write a SQL fragment
{
   result += sql;
}
//---------------------------------------------------------------------------
void SQLWriter::writeIdentifier(std::string_view identifier)
// Write an identifier, quoting as needed
{
   result += '"';
   for (char c : identifier) {
      if (c == '"') {
         result += "\"\"";
      } else {
         result += c;
      }
   }
   result += '"';
}
//---------------------------------------------------------------------------
void SQLWriter::writeColumn(const ColumnRef& column)
// Write a qualified column reference
{
   writeIdentifier(column.getAlias());
   result += '.';
   writeIdentifier(column.column);
}
//---------------------------------------------------------------------------
void SQLWriter::writeString(std::string_view str)
// Write a string literal
{
   result += '\'';
   for (char c : str) {
      if (c == '\'') {
         result += "''";
      } else {
         result += c;
      }
   }
   result += '\'';
}
//---------------------------------------------------------------------------
void SQLWriter::writeConstant(const ast::Constant& value)
// Write a constant
{
   switch (value.getKind()) {
      case ast::Constant::Kind::Integer:
      case ast::Constant::Kind::Float: result += value.getValue(); break;
      case ast::Constant::Kind::String: writeString(value.getValue()); break;
      case ast::Constant::Kind::Bool: result += value.getValue(); break;
      case ast::Constant::Kind::Null: result += "null"; break;
   }
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
