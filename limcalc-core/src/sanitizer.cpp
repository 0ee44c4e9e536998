#include "limcalc/sanitizer.h"
#include "limcalc/errors.h"
#include "limcalc/text.h"

namespace limcalc {

const char* const kSanitizedPlaceholder = "[?]";

namespace {

// Longest first so "subprocess" wins over shorter overlapping entries
const char* const kDenylist[] = {
    "subprocess", "builtins", "getattr", "setattr", "delattr", "globals",
    "compile", "locals", "import", "lambda", "system", "exec", "eval",
    "open", "file", "os.", "sys.", "__"
};

size_t match_at(const std::string& text, size_t pos) {
    for (const char* entry : kDenylist) {
        const std::string word(entry);
        if (iequals_at(text, pos, word)) {
            return word.size();
        }
    }
    return 0;
}

} // namespace

std::string sanitize(const std::string& raw, size_t max_length) {
    const std::string trimmed = trim_copy(raw);
    const size_t length = code_point_length(trimmed);
    if (length > max_length) {
        throw InputError(InputErrorCode::INPUT_TOO_LONG,
                         "Input exceeds maximum length of " + std::to_string(max_length) +
                         " characters (got " + std::to_string(length) + ")");
    }

    std::string out;
    out.reserve(trimmed.size());
    size_t pos = 0;
    while (pos < trimmed.size()) {
        const size_t matched = match_at(trimmed, pos);
        if (matched > 0) {
            out += kSanitizedPlaceholder;
            pos += matched;
        } else {
            out.push_back(trimmed[pos]);
            pos += 1;
        }
    }
    return out;
}

bool contains_denylisted(const std::string& text) {
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (match_at(text, pos) > 0) {
            return true;
        }
    }
    return false;
}

} // namespace limcalc
