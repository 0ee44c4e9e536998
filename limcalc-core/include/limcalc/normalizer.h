#ifndef LIMCALC_NORMALIZER_H
#define LIMCALC_NORMALIZER_H

#include "engine.h"
#include <string>

namespace limcalc {

// Rewrites informal notation ("2x²", "√(x-2)", "e^x", "sin x") into the
// canonical grammar accepted by SymbolicEngine::parse. The passes run in
// the order declared below and are exposed for testing.

// Pass 1: case-insensitive function names (arcsin -> asin, SIN -> sin),
// bare operands get parentheses ("sin x" -> "sin(x)")
std::string canonicalize_function_names(const std::string& text);

// Pass 2: superscript squares/cubes and ^ become **
std::string expand_powers(const std::string& text);

// Pass 3: explicit * for juxtaposition (2x, x(, )(, 3π)
std::string insert_implicit_multiplication(const std::string& text);

// Pass 4: ln, pi, infinity spellings, standalone e, e**u -> exp(u)
std::string replace_symbols(const std::string& text);

// Pass 5: √(u) and √atom -> sqrt(...)
std::string rewrite_roots(const std::string& text);

// Pass 6
std::string strip_whitespace(const std::string& text);

// Passes 1-6 without validation
std::string rewrite_notation(const std::string& clean);

// All passes; the result is validated through the engine.
// Throws InputError(UNPARSABLE_EXPRESSION) with the engine message.
std::string normalize(const std::string& clean, const SymbolicEngine& engine);

} // namespace limcalc

#endif // LIMCALC_NORMALIZER_H
