#include "limcalc/errors.h"

namespace limcalc {

const char* input_error_name(InputErrorCode code) {
    switch (code) {
        case InputErrorCode::INPUT_TOO_LONG:
            return "InputTooLong";
        case InputErrorCode::UNPARSABLE_EXPRESSION:
            return "UnparsableExpression";
        case InputErrorCode::EMPTY_INPUT:
            return "EmptyInput";
        case InputErrorCode::INVALID_NUMBER:
            return "InvalidNumber";
        case InputErrorCode::INVALID_DIRECTION:
            return "InvalidDirection";
    }
    return "UnknownError";
}

} // namespace limcalc
