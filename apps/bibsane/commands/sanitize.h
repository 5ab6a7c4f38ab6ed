#pragma once

// cmd_sanitize: clean, merge and filter a bibliography.
// Usage: bibsane [sanitize] <entries.json>... [--keys <file>] [--config <file.yaml>]
//                [--out <file.bib>] [--report <file.json>] [--quiet]
int cmd_sanitize(int argc, char* argv[], int start);  // NOLINT(modernize-avoid-c-arrays)
