#pragma once
#include <string>
#include <vector>

namespace fam {

// Quotes a field when it contains a comma, quote or line break.
std::string csvField(const std::string& value);

// Splits one CSV record (RFC 4180 quoting, no embedded line breaks).
std::vector<std::string> parseCsvLine(const std::string& line);

} // namespace fam
