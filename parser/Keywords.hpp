// DeltaLog
// (c) 2026 The DeltaLog Authors
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
// Keyword list: KEYWORD(spelling, token)
KEYWORD("and", AND)
KEYWORD("false", FALSE_P)
KEYWORD("not", NOT)
KEYWORD("null", NULL_P)
KEYWORD("source", SOURCE)
KEYWORD("true", TRUE_P)
