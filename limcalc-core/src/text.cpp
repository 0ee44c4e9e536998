#include "limcalc/text.h"
#include <cctype>

namespace limcalc {

std::string trim_copy(const std::string& value) {
    size_t begin = 0;
    size_t finish = value.size();
    while (begin < finish && std::isspace(static_cast<unsigned char>(value[begin]))) {
        begin += 1;
    }
    while (finish > begin && std::isspace(static_cast<unsigned char>(value[finish - 1]))) {
        finish -= 1;
    }
    return value.substr(begin, finish - begin);
}

void replace_all(std::string& target, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    size_t pos = 0;
    while ((pos = target.find(from, pos)) != std::string::npos) {
        target.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string to_lower_ascii(const std::string& value) {
    std::string out = value;
    for (char& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool iequals_at(const std::string& text, size_t pos, const std::string& word) {
    if (pos + word.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < word.size(); ++i) {
        const auto a = static_cast<unsigned char>(text[pos + i]);
        const auto b = static_cast<unsigned char>(word[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

size_t code_point_length(const std::string& text) {
    size_t count = 0;
    for (char ch : text) {
        // Continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace limcalc
