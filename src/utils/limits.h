#pragma once

// Fallback macro definitions so editors/LSPs don’t flag these as undefined
// when compile_definitions from CMake aren’t visible to the indexer.

#ifndef SQLSCOPE_DEFAULT_ROW_LIMIT
#define SQLSCOPE_DEFAULT_ROW_LIMIT 1000
#endif

#ifndef SQLSCOPE_MAX_ROW_LIMIT
#define SQLSCOPE_MAX_ROW_LIMIT 100000
#endif

#ifndef SQLSCOPE_DEFAULT_PORT
#define SQLSCOPE_DEFAULT_PORT 8765
#endif

#ifndef SQLSCOPE_DEFAULT_POLL_MS
#define SQLSCOPE_DEFAULT_POLL_MS 1000
#endif
