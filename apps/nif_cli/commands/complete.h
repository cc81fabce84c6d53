#pragma once

// cmd_complete: append the check digit to eight leading digits.
// Usage: nif_cli complete <first-eight-digits>
int cmd_complete(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
