#ifndef LIMCALC_TEXT_H
#define LIMCALC_TEXT_H

#include <string>

namespace limcalc {

// Small string helpers shared by the input stages. ASCII-only case
// handling; multi-byte UTF-8 sequences pass through untouched.

std::string trim_copy(const std::string& value);

void replace_all(std::string& target, const std::string& from, const std::string& to);

std::string to_lower_ascii(const std::string& value);

bool iequals_at(const std::string& text, size_t pos, const std::string& word);

// Number of Unicode code points in a UTF-8 string
size_t code_point_length(const std::string& text);

} // namespace limcalc

#endif // LIMCALC_TEXT_H
