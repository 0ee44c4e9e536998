#include "limcalc/display.h"
#include "limcalc/text.h"

#include <cmath>
#include <cstdio>
#include <regex>
#include <vector>

namespace limcalc {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

struct DisplayRule {
    std::regex pattern;
    const char* replacement;
};

const std::vector<DisplayRule>& display_rules() {
    static const std::vector<DisplayRule> rules = {
        {std::regex("\\bsqrt\\b"), "√"},
        {std::regex("\\bpi\\b"), "π"},
        {std::regex("\\boo\\b"), "∞"},
        {std::regex("\\bE\\b"), "e"},
        {std::regex("\\blog\\b"), "ln"},
        // 2*x -> 2x, 3*(x+1) -> 3(x+1)
        {std::regex("(\\d)\\*([a-zA-Z(]|√|π|∞)"), "$1$2"},
    };
    return rules;
}

std::string strip_decimal(std::string out) {
    if (out.find('.') != std::string::npos) {
        while (!out.empty() && out.back() == '0') {
            out.pop_back();
        }
        if (!out.empty() && out.back() == '.') {
            out.pop_back();
        }
    }
    if (out == "-0" || out.empty()) {
        out = "0";
    }
    return out;
}

} // namespace

std::string format_number(double value, const AnalysisOptions& options) {
    if (std::isnan(value)) {
        return options.nan_label;
    }
    if (std::isinf(value)) {
        return value > 0.0 ? options.positive_infinity_label : options.negative_infinity_label;
    }

    const double tolerance = options.integer_tolerance;
    const double nearest = std::round(value);
    if (std::abs(value - nearest) <= tolerance && std::abs(nearest) < kMaxExactInteger) {
        const long long integer = static_cast<long long>(nearest);
        return std::to_string(integer);
    }

    // Smallest denominator first, so the fraction is already reduced
    for (long long q = 2; q <= options.max_denominator; ++q) {
        const double p = std::round(value * static_cast<double>(q));
        if (std::abs(value - p / static_cast<double>(q)) <= tolerance &&
            std::abs(p) < kMaxExactInteger) {
            return std::to_string(static_cast<long long>(p)) + "/" + std::to_string(q);
        }
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", options.decimal_places, value);
    return strip_decimal(buffer);
}

std::string format_expression(const std::string& canonical) {
    std::string out = canonical;
    replace_all(out, "**", "^");
    for (const auto& rule : display_rules()) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }
    return out;
}

std::string format_point(const ApproachPoint& point, const AnalysisOptions& options) {
    switch (point.kind) {
        case ApproachPoint::Kind::POSITIVE_INFINITY:
            return options.positive_infinity_label;
        case ApproachPoint::Kind::NEGATIVE_INFINITY:
            return options.negative_infinity_label;
        case ApproachPoint::Kind::FINITE:
            break;
    }
    return format_number(point.value, options);
}

} // namespace limcalc
