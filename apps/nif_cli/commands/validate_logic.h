#pragma once

#include <string>
#include <vector>

// execute_validate: inspect each candidate locally and print one verdict per line,
// or a JSON array when json is set. Returns 0 iff every candidate is valid.
int execute_validate(const std::vector<std::string>& candidates, bool normalize, bool json);
