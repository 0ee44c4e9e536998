#include "limcalc/normalizer.h"
#include "limcalc/errors.h"
#include "limcalc/text.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace limcalc {

namespace {

const std::string kRootGlyph = "√";
const std::string kPiGlyph = "π";
const std::string kInfinityGlyph = "∞";

enum class ChunkKind {
    NUMBER,
    WORD,
    GLYPH,
    SPACE,
    OTHER
};

struct Chunk {
    ChunkKind kind;
    std::string text;
};

struct FunctionSpelling {
    const char* spelling;   // lower case
    const char* canonical;
};

const FunctionSpelling kFunctionSpellings[] = {
    {"sin", "sin"}, {"cos", "cos"}, {"tan", "tan"},
    {"cot", "cot"}, {"sec", "sec"}, {"csc", "csc"},
    {"arcsin", "asin"}, {"arccos", "acos"}, {"arctan", "atan"},
    {"asin", "asin"}, {"acos", "acos"}, {"atan", "atan"},
    {"exp", "exp"}, {"log", "log"}, {"ln", "ln"}, {"sqrt", "sqrt"},
    {"abs", "abs"}, {"sign", "sign"}, {"floor", "floor"},
    {"ceil", "ceiling"}, {"ceiling", "ceiling"}, {"heaviside", "Heaviside"},
    {"pow", "pow"}
};

bool lookup_function(const std::string& word, std::string& canonical) {
    const std::string lower = to_lower_ascii(word);
    for (const auto& entry : kFunctionSpellings) {
        if (lower == entry.spelling) {
            canonical = entry.canonical;
            return true;
        }
    }
    return false;
}

bool is_function_word(const Chunk& chunk) {
    if (chunk.kind == ChunkKind::GLYPH) {
        return chunk.text == kRootGlyph;
    }
    std::string unused;
    return chunk.kind == ChunkKind::WORD && lookup_function(chunk.text, unused);
}

bool is_other(const Chunk& chunk, const char* text) {
    return chunk.kind == ChunkKind::OTHER && chunk.text == text;
}

bool starts_operand(const Chunk& chunk) {
    return chunk.kind == ChunkKind::NUMBER || chunk.kind == ChunkKind::WORD ||
           chunk.kind == ChunkKind::GLYPH;
}

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool is_exponent_start(const std::string& text, size_t pos) {
    if (pos >= text.length() || (text[pos] != 'e' && text[pos] != 'E')) {
        return false;
    }
    size_t next = pos + 1;
    if (next < text.length() && (text[next] == '+' || text[next] == '-')) {
        ++next;
    }
    return next < text.length() && is_digit(text[next]);
}

std::vector<Chunk> split_chunks(const std::string& text) {
    std::vector<Chunk> chunks;
    size_t pos = 0;
    const size_t n = text.size();

    while (pos < n) {
        const auto ch = static_cast<unsigned char>(text[pos]);
        const size_t start = pos;

        if (std::isspace(ch)) {
            while (pos < n && std::isspace(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            chunks.push_back({ChunkKind::SPACE, text.substr(start, pos - start)});
        } else if (is_digit(text[pos]) || (text[pos] == '.' && pos + 1 < n && is_digit(text[pos + 1]))) {
            while (pos < n && (is_digit(text[pos]) || text[pos] == '.')) {
                ++pos;
            }
            // Scientific notation stays one number
            if (is_exponent_start(text, pos)) {
                ++pos;
                if (text[pos] == '+' || text[pos] == '-') {
                    ++pos;
                }
                while (pos < n && is_digit(text[pos])) {
                    ++pos;
                }
            }
            chunks.push_back({ChunkKind::NUMBER, text.substr(start, pos - start)});
        } else if (std::isalpha(ch)) {
            while (pos < n && std::isalpha(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            chunks.push_back({ChunkKind::WORD, text.substr(start, pos - start)});
        } else {
            pos += std::min(utf8_sequence_length(ch), n - pos);
            std::string piece = text.substr(start, pos - start);
            const bool glyph = piece == kRootGlyph || piece == kPiGlyph || piece == kInfinityGlyph;
            chunks.push_back({glyph ? ChunkKind::GLYPH : ChunkKind::OTHER, std::move(piece)});
        }
    }
    return chunks;
}

size_t next_significant(const std::vector<Chunk>& chunks, size_t pos, size_t end) {
    while (pos < end && chunks[pos].kind == ChunkKind::SPACE) {
        ++pos;
    }
    return pos;
}

// Index one past the ')' matching the '(' at open, npos when unbalanced
size_t group_end(const std::vector<Chunk>& chunks, size_t open, size_t end) {
    int depth = 0;
    for (size_t i = open; i < end; ++i) {
        if (is_other(chunks[i], "(")) {
            depth++;
        } else if (is_other(chunks[i], ")")) {
            depth--;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return std::string::npos;
}

// Extent of the operand starting at start: a parenthesized group, a
// function applied to its argument, or a run of adjacent value tokens
size_t atom_end(const std::vector<Chunk>& chunks, size_t start, size_t end) {
    if (start >= end) {
        return start;
    }
    const Chunk& chunk = chunks[start];

    if (is_other(chunk, "(")) {
        const size_t stop = group_end(chunks, start, end);
        return stop == std::string::npos ? end : stop;
    }

    if (is_function_word(chunk)) {
        const size_t next = next_significant(chunks, start + 1, end);
        if (next < end && (is_other(chunks[next], "(") || starts_operand(chunks[next]))) {
            return atom_end(chunks, next, end);
        }
        return start + 1;
    }

    size_t pos = start;
    while (pos < end && starts_operand(chunks[pos]) && !is_function_word(chunks[pos])) {
        ++pos;
    }
    return pos;
}

std::string render_functions(const std::vector<Chunk>& chunks, size_t begin, size_t end) {
    std::string out;
    size_t i = begin;
    while (i < end) {
        const Chunk& chunk = chunks[i];
        std::string canonical;
        if (chunk.kind == ChunkKind::WORD && lookup_function(chunk.text, canonical)) {
            out += canonical;
            const size_t next = next_significant(chunks, i + 1, end);
            if (next < end && starts_operand(chunks[next])) {
                const size_t stop = atom_end(chunks, next, end);
                out += "(" + render_functions(chunks, next, stop) + ")";
                i = stop;
            } else {
                ++i;
            }
            continue;
        }
        out += chunk.text;
        ++i;
    }
    return out;
}

bool needs_product(const Chunk& prev, const Chunk& current, bool spaced) {
    const bool prev_number = prev.kind == ChunkKind::NUMBER;
    const bool prev_close = is_other(prev, ")");
    const bool prev_value = (prev.kind == ChunkKind::WORD || prev.kind == ChunkKind::GLYPH) &&
                            !is_function_word(prev);

    const bool cur_open = is_other(current, "(");
    const bool cur_number = current.kind == ChunkKind::NUMBER;
    const bool cur_word = current.kind == ChunkKind::WORD || current.kind == ChunkKind::GLYPH;

    if (prev_number) {
        return cur_word || cur_open || (spaced && cur_number);
    }
    if (prev_close) {
        return cur_word || cur_number || cur_open;
    }
    if (prev_value) {
        if (cur_number || cur_open) {
            return true;
        }
        if (cur_word) {
            return spaced || prev.kind == ChunkKind::GLYPH || current.kind == ChunkKind::GLYPH;
        }
    }
    return false;
}

std::string render_symbols(const std::vector<Chunk>& chunks, size_t begin, size_t end) {
    std::string out;
    size_t i = begin;
    while (i < end) {
        const Chunk& chunk = chunks[i];
        const std::string lower = to_lower_ascii(chunk.text);

        if (chunk.kind == ChunkKind::WORD && lower == "e") {
            // e**u -> exp(u)
            const size_t star = next_significant(chunks, i + 1, end);
            if (star + 1 < end && is_other(chunks[star], "*") && is_other(chunks[star + 1], "*")) {
                const size_t operand = next_significant(chunks, star + 2, end);
                if (operand < end && is_other(chunks[operand], "(")) {
                    const size_t stop = group_end(chunks, operand, end);
                    if (stop != std::string::npos) {
                        out += "exp" + render_symbols(chunks, operand, stop);
                        i = stop;
                        continue;
                    }
                } else if (operand < end) {
                    std::string sign;
                    size_t body = operand;
                    if (is_other(chunks[operand], "+") || is_other(chunks[operand], "-")) {
                        sign = chunks[operand].text;
                        body = next_significant(chunks, operand + 1, end);
                    }
                    if (body < end && starts_operand(chunks[body])) {
                        const size_t stop = atom_end(chunks, body, end);
                        out += "exp(" + sign + render_symbols(chunks, body, stop) + ")";
                        i = stop;
                        continue;
                    }
                }
            }
            out += "E";
            ++i;
            continue;
        }

        if (chunk.kind == ChunkKind::WORD && lower == "ln") {
            out += "log";
        } else if ((chunk.kind == ChunkKind::WORD && lower == "pi") || chunk.text == kPiGlyph) {
            out += "pi";
        } else if ((chunk.kind == ChunkKind::WORD && (lower == "inf" || lower == "infinity")) ||
                   chunk.text == kInfinityGlyph) {
            out += "oo";
        } else {
            out += chunk.text;
        }
        ++i;
    }
    return out;
}

std::string render_roots(const std::vector<Chunk>& chunks, size_t begin, size_t end) {
    std::string out;
    size_t i = begin;
    while (i < end) {
        const Chunk& chunk = chunks[i];
        if (chunk.text == kRootGlyph) {
            const size_t next = next_significant(chunks, i + 1, end);
            if (next < end && is_other(chunks[next], "(")) {
                const size_t stop = group_end(chunks, next, end);
                if (stop != std::string::npos) {
                    out += "sqrt" + render_roots(chunks, next, stop);
                    i = stop;
                    continue;
                }
            } else if (next < end && starts_operand(chunks[next])) {
                const size_t stop = atom_end(chunks, next, end);
                out += "sqrt(" + render_roots(chunks, next, stop) + ")";
                i = stop;
                continue;
            }
            out += "sqrt";
            ++i;
            continue;
        }
        if (chunk.kind == ChunkKind::WORD && to_lower_ascii(chunk.text) == "sqrt") {
            out += "sqrt";
        } else {
            out += chunk.text;
        }
        ++i;
    }
    return out;
}

} // namespace

std::string canonicalize_function_names(const std::string& text) {
    const auto chunks = split_chunks(text);
    return render_functions(chunks, 0, chunks.size());
}

std::string expand_powers(const std::string& text) {
    std::string out = text;
    replace_all(out, "²", "**2");
    replace_all(out, "³", "**3");
    replace_all(out, "^", "**");
    return out;
}

std::string insert_implicit_multiplication(const std::string& text) {
    const auto chunks = split_chunks(text);
    std::string out;
    const Chunk* prev = nullptr;
    bool spaced = false;

    for (const auto& chunk : chunks) {
        if (chunk.kind == ChunkKind::SPACE) {
            out += chunk.text;
            spaced = true;
            continue;
        }
        if (prev && needs_product(*prev, chunk, spaced)) {
            const size_t last = out.find_last_not_of(" \t\n\r\f\v");
            out.insert(last == std::string::npos ? 0 : last + 1, "*");
        }
        out += chunk.text;
        prev = &chunk;
        spaced = false;
    }
    return out;
}

std::string replace_symbols(const std::string& text) {
    const auto chunks = split_chunks(text);
    return render_symbols(chunks, 0, chunks.size());
}

std::string rewrite_roots(const std::string& text) {
    const auto chunks = split_chunks(text);
    return render_roots(chunks, 0, chunks.size());
}

std::string strip_whitespace(const std::string& text) {
    static const std::regex whitespace("\\s+");
    return std::regex_replace(text, whitespace, "");
}

std::string rewrite_notation(const std::string& clean) {
    std::string text = canonicalize_function_names(clean);
    text = expand_powers(text);
    text = insert_implicit_multiplication(text);
    text = replace_symbols(text);
    text = rewrite_roots(text);
    return strip_whitespace(text);
}

std::string normalize(const std::string& clean, const SymbolicEngine& engine) {
    const std::string canonical = rewrite_notation(clean);
    try {
        engine.parse(canonical);
    } catch (const EngineError& e) {
        throw InputError(InputErrorCode::UNPARSABLE_EXPRESSION,
                         "Could not parse expression '" + clean + "': " + e.what());
    }
    return canonical;
}

} // namespace limcalc
