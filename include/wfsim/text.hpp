#pragma once
#include <optional>
#include <string>
#include <vector>

namespace wfsim {

// Strip leading/trailing whitespace.
std::string trim(const std::string& s);

// Split on sep with no quoting; every field is trimmed.
std::vector<std::string> split_fields(const std::string& line, char sep = ',');

// Whole-string numeric parses. nullopt on trailing junk, overflow or a
// non-finite double.
std::optional<double> parse_double(const std::string& s);
std::optional<int> parse_int(const std::string& s);

} // namespace wfsim
