#ifndef H_deltalog_Options
#define H_deltalog_Options
//---------------------------------------------------------------------------
// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace deltalog {
//---------------------------------------------------------------------------
/// Settings shared by all analysis passes of one compilation
struct AnalysisOptions {
   /// The default initial capacity of a table
   static constexpr unsigned defaultTableCapacity = 500;

   /// The number of entries every table reserves up front
   unsigned tableCapacity = defaultTableCapacity;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
