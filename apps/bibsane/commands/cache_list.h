#pragma once

// cmd_cache_list: print the journal abbreviations stored in a SQLite cache.
// Usage: bibsane cache-list --cache <path> [--json]
int cmd_cache_list(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
