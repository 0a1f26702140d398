#ifndef H_deltalog_SQLWriter
#define H_deltalog_SQLWriter
//---------------------------------------------------------------------------
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
struct ColumnRef;
//---------------------------------------------------------------------------
namespace ast {
class Constant;
}
//---------------------------------------------------------------------------
/// Helper class to generate SQL
class SQLWriter {
   private:
   /// The result buffer
   std::string result;

   public:
   /// Constructor
   SQLWriter();
   /// Destructor
   ~SQLWriter();

   /// Write a SQL fragment
   void write(std::string_view sql);
   /// Write an identifier, quoting as needed
   void writeIdentifier(std::string_view identifier);
   /// Write a qualified column reference
   void writeColumn(const ColumnRef& column);
   /// Write a string literal
   void writeString(std::string_view str);
   /// Write a constant
   void writeConstant(const ast::Constant& value);

   /// Get the result
   std::string getResult() const { return result; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
