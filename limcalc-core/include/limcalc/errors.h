#ifndef LIMCALC_ERRORS_H
#define LIMCALC_ERRORS_H

#include <stdexcept>
#include <string>

namespace limcalc {

// Validation failures surfaced to the caller before any computation starts
enum class InputErrorCode {
    INPUT_TOO_LONG,
    UNPARSABLE_EXPRESSION,
    EMPTY_INPUT,
    INVALID_NUMBER,
    INVALID_DIRECTION
};

struct InputError : public std::runtime_error {
    InputErrorCode code;

    InputError(InputErrorCode code, const std::string& message)
        : std::runtime_error(message), code(code) {}
};

// Failures raised by a symbolic engine; absorbed into "cannot compute"
// once limit or continuity computation has started
enum class EngineErrorKind {
    PARSE,
    SUBSTITUTION,
    LIMIT,
    COERCION
};

struct EngineError : public std::runtime_error {
    EngineErrorKind kind;

    EngineError(EngineErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}
};

const char* input_error_name(InputErrorCode code);

} // namespace limcalc

#endif // LIMCALC_ERRORS_H
