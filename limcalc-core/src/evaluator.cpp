#include "limcalc/evaluator.h"
#include "limcalc/display.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace limcalc {

const char* limit_kind_name(LimitValue::Kind kind) {
    switch (kind) {
        case LimitValue::Kind::INTEGER: return "integer";
        case LimitValue::Kind::RATIONAL: return "rational";
        case LimitValue::Kind::DECIMAL: return "decimal";
        case LimitValue::Kind::POSITIVE_INFINITY: return "positive_infinity";
        case LimitValue::Kind::NEGATIVE_INFINITY: return "negative_infinity";
        case LimitValue::Kind::COMPLEX_INFINITY: return "complex_infinity";
        case LimitValue::Kind::UNDEFINED: return "undefined";
        case LimitValue::Kind::NOT_A_NUMBER: return "nan";
        case LimitValue::Kind::FAILED: return "failed";
    }
    return "failed";
}

LimitEvaluator::LimitEvaluator(const SymbolicEngine& engine, const AnalysisOptions& options)
    : engine_(engine), options_(options) {}

LimitValue LimitEvaluator::undefined() const {
    LimitValue result;
    result.kind = LimitValue::Kind::UNDEFINED;
    result.value = std::numeric_limits<double>::quiet_NaN();
    result.text = options_.undefined_label;
    return result;
}

LimitValue LimitEvaluator::failure(const std::string& message) const {
    LimitValue result;
    result.kind = LimitValue::Kind::FAILED;
    result.value = std::numeric_limits<double>::quiet_NaN();
    result.text = options_.failed_label;
    result.error = message;
    return result;
}

LimitValue LimitEvaluator::from_engine_value(const EngineValue& value) const {
    LimitValue result;
    switch (value.kind) {
        case EngineValue::Kind::NUMBER: {
            result.value = engine_.to_float(value);
            result.error_estimate = value.error_estimate;
            result.text = format_number(result.value, options_);
            if (std::abs(result.value - std::round(result.value)) <= options_.integer_tolerance) {
                result.kind = LimitValue::Kind::INTEGER;
            } else if (result.text.find('/') != std::string::npos) {
                result.kind = LimitValue::Kind::RATIONAL;
            } else {
                result.kind = LimitValue::Kind::DECIMAL;
            }
            return result;
        }
        case EngineValue::Kind::POSITIVE_INFINITY:
            result.kind = LimitValue::Kind::POSITIVE_INFINITY;
            result.value = std::numeric_limits<double>::infinity();
            result.text = options_.positive_infinity_label;
            return result;
        case EngineValue::Kind::NEGATIVE_INFINITY:
            result.kind = LimitValue::Kind::NEGATIVE_INFINITY;
            result.value = -std::numeric_limits<double>::infinity();
            result.text = options_.negative_infinity_label;
            return result;
        case EngineValue::Kind::COMPLEX_INFINITY:
            result.kind = LimitValue::Kind::COMPLEX_INFINITY;
            result.value = std::numeric_limits<double>::infinity();
            result.text = options_.complex_infinity_label;
            return result;
        case EngineValue::Kind::NOT_A_NUMBER:
            result.kind = LimitValue::Kind::NOT_A_NUMBER;
            result.value = std::numeric_limits<double>::quiet_NaN();
            result.text = options_.nan_label;
            return result;
        case EngineValue::Kind::UNDEFINED:
            break;
    }
    return undefined();
}

LimitValue LimitEvaluator::evaluate_limit(const std::string& canonical,
                                          const ApproachPoint& point,
                                          Direction direction) const {
    try {
        auto expr = engine_.parse(canonical);
        return from_engine_value(engine_.limit(*expr, point, direction));
    } catch (const EngineError& e) {
        return failure(e.what());
    } catch (const std::exception& e) {
        return failure(std::string("Internal error: ") + e.what());
    }
}

LimitValue LimitEvaluator::evaluate_at(const std::string& canonical, const ApproachPoint& point) const {
    if (point.is_infinite()) {
        return undefined();
    }
    try {
        auto expr = engine_.parse(canonical);
        return from_engine_value(engine_.substitute(*expr, point.value));
    } catch (const EngineError& e) {
        LimitValue result = undefined();
        result.error = e.what();
        return result;
    }
}

bool LimitEvaluator::limits_equal(const LimitValue& a, const LimitValue& b) const {
    if (a.failed() || b.failed()) {
        return false;
    }
    if (a.is_finite() && b.is_finite()) {
        if (a.text == b.text) {
            return true;
        }
        const double scale = std::max({1.0, std::abs(a.value), std::abs(b.value)});
        const double slack = options_.comparison_tolerance * scale + a.error_estimate + b.error_estimate;
        return std::abs(a.value - b.value) <= slack;
    }
    return a.text == b.text;
}

} // namespace limcalc
