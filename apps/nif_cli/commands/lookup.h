#pragma once

// cmd_lookup: validate a candidate locally, then look it up in a registry.
// Usage: nif_cli lookup <candidate> [--registry-file <path>] [--json] [--normalize]
//
// Without --registry-file no registry is configured and the lookup reports
// "unreachable"; the local verdict is still printed.
int cmd_lookup(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
