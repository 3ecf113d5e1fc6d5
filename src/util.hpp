#pragma once
#include <string>
#include <cstdint>

namespace decaf {

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Parse a strictly positive decimal integer that fits in uint32_t
// (surrounding whitespace allowed). Leaves out untouched on failure.
bool parse_positive_uint(const std::string& s, uint32_t& out);

} // namespace decaf
