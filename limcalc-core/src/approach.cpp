#include "limcalc/approach.h"
#include "limcalc/display.h"
#include "limcalc/errors.h"
#include "limcalc/text.h"

#include <cmath>
#include <cstdlib>
#include <regex>

namespace limcalc {

namespace {

const double kPi = std::acos(-1.0);

bool is_positive_infinity(const std::string& lower) {
    return lower == "inf" || lower == "infinity" || lower == "∞" || lower == "oo" ||
           lower == "+inf" || lower == "+infinity" || lower == "+∞" || lower == "+oo";
}

bool is_negative_infinity(const std::string& lower) {
    return lower == "-inf" || lower == "-infinity" || lower == "-∞" || lower == "-oo";
}

bool parse_finite(const std::string& text, double& out) {
    const std::string lower = to_lower_ascii(trim_copy(text));

    if (lower == "pi" || lower == "π" || lower == "+pi" || lower == "+π") {
        out = kPi;
        return true;
    }
    if (lower == "-pi" || lower == "-π") {
        out = -kPi;
        return true;
    }
    if (lower == "e" || lower == "+e") {
        out = std::exp(1.0);
        return true;
    }
    if (lower == "-e") {
        out = -std::exp(1.0);
        return true;
    }

    static const std::regex real_number("^[+-]?(\\d+\\.?\\d*|\\.\\d+)([eE][+-]?\\d+)?$");
    if (!std::regex_match(lower, real_number)) {
        return false;
    }
    out = std::strtod(lower.c_str(), nullptr);
    return std::isfinite(out);
}

} // namespace

const char* direction_name(Direction direction) {
    switch (direction) {
        case Direction::LEFT:
            return "left";
        case Direction::RIGHT:
            return "right";
        case Direction::BOTH:
            return "both";
    }
    return "both";
}

ApproachSpec parse_approach(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        throw InputError(InputErrorCode::EMPTY_INPUT, "Approach value is empty");
    }

    const std::string lower = to_lower_ascii(trimmed);
    ApproachSpec spec;

    if (is_positive_infinity(lower)) {
        spec.point = ApproachPoint::positive_infinity();
        return spec;
    }
    if (is_negative_infinity(lower)) {
        spec.point = ApproachPoint::negative_infinity();
        return spec;
    }

    double value = 0.0;
    const char suffix = trimmed.back();
    if (trimmed.size() > 1 && (suffix == '+' || suffix == '-')) {
        const std::string prefix = trimmed.substr(0, trimmed.size() - 1);
        if (!parse_finite(prefix, value)) {
            throw InputError(InputErrorCode::INVALID_NUMBER,
                             "Invalid approach value: '" + prefix + "' is not a number");
        }
        spec.point = ApproachPoint::finite(value);
        spec.has_direction = true;
        spec.direction = suffix == '+' ? Direction::RIGHT : Direction::LEFT;
        return spec;
    }

    if (!parse_finite(trimmed, value)) {
        throw InputError(InputErrorCode::INVALID_NUMBER,
                         "Invalid approach value: '" + trimmed + "' is not a number");
    }
    spec.point = ApproachPoint::finite(value);
    return spec;
}

Direction resolve_direction(const ApproachSpec& spec, Direction requested) {
    return spec.has_direction ? spec.direction : requested;
}

std::string approach_notation(const ApproachPoint& point,
                              Direction direction,
                              const AnalysisOptions& options) {
    std::string out = "x → " + format_point(point, options);
    if (!point.is_infinite()) {
        if (direction == Direction::RIGHT) {
            out += "⁺";
        } else if (direction == Direction::LEFT) {
            out += "⁻";
        }
    }
    return out;
}

} // namespace limcalc
