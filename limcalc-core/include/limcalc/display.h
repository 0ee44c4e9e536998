#ifndef LIMCALC_DISPLAY_H
#define LIMCALC_DISPLAY_H

#include "options.h"
#include "types.h"
#include <string>

namespace limcalc {

// Integer when within tolerance, then p/q with q <= max_denominator,
// then a fixed decimal with trailing zeros removed. Infinities and NaN
// use the option labels.
std::string format_number(double value, const AnalysisOptions& options = AnalysisOptions());

// Canonical string -> user-facing text (x**2 -> x^2, sqrt -> √, 2*x -> 2x).
// Lossy: the output is not guaranteed to parse back.
std::string format_expression(const std::string& canonical);

// Numeric rendering of an approach point; ∞ / -∞ at infinity
std::string format_point(const ApproachPoint& point, const AnalysisOptions& options = AnalysisOptions());

} // namespace limcalc

#endif // LIMCALC_DISPLAY_H
