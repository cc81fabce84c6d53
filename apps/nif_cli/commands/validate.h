#pragma once

// cmd_validate: validate one or more candidates locally.
// Usage: nif_cli validate <candidate>... [--json] [--normalize]
// Exit code 0 iff every candidate is valid.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
