#include "parser/AST.hpp"
#include "parser/DatalogParser.hpp"
#include "sql/SQLGenerator.hpp"
#include "sql/SQLWriter.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
//---------------------------------------------------------------------------
using namespace std;
using namespace deltalog;
//---------------------------------------------------------------------------
// (c) 2026 The DeltaLog Authors
//---------------------------------------------------------------------------
static string readFiles(unsigned count, char* files[]) {
   ostringstream output;
   for (unsigned i = 0; i != count; i++) {
      ifstream in(files[i]);
      if (!in.is_open()) {
         cerr << "unable to read " << files[i] << endl;
         exit(1);
      }
      output << in.rdbuf();
      output << "\n";
   }
   return output.str();
}
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
   bool updates = (argc > 1) && (strcmp(argv[1], "--updates") == 0);
   int first = updates ? 2 : 1;
   if (argc <= first) {
      cerr << "usage: " << argv[0] << " [--updates] file..." << endl;
      return 1;
   }

   string fileName = (argc - first == 1) ? argv[first] : "<input>";
   string source = readFiles(argc - first, argv + first);
   ast::Program program;
   try {
      program = DatalogParser::parse(source, fileName);
   } catch (const exception& e) {
      cerr << e.what() << endl;
      return 1;
   }

   try {
      SQLGenerator generator(program);
      SQLWriter sql;
      generator.translateViews(sql);
      if (updates)
         generator.translateDeltas(sql);
      else
         generator.translateQuery(sql);
      cout << sql.getResult();
   } catch (const exception& e) {
      cerr << e.what() << endl;
      return 1;
   }

   return 0;
}
