#ifndef LIMCALC_SANITIZER_H
#define LIMCALC_SANITIZER_H

#include <string>

namespace limcalc {

constexpr size_t kDefaultMaxInputLength = 500;

// Placeholder left where a denylisted substring was removed
extern const char* const kSanitizedPlaceholder;

// Trims the input, enforces the length bound (code points) and replaces
// every case-insensitive occurrence of a denylisted substring with "[?]".
// Throws InputError(INPUT_TOO_LONG).
std::string sanitize(const std::string& raw, size_t max_length = kDefaultMaxInputLength);

// True when the text contains a denylisted substring
bool contains_denylisted(const std::string& text);

} // namespace limcalc

#endif // LIMCALC_SANITIZER_H
