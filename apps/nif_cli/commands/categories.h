#pragma once

// cmd_categories: print the admitted leading-digit table.
// Usage: nif_cli categories [--json]
int cmd_categories(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
