#ifndef LIMCALC_APPROACH_H
#define LIMCALC_APPROACH_H

#include "options.h"
#include "types.h"
#include <string>

namespace limcalc {

// Parsed approach text. A trailing "+" or "-" sets has_direction.
struct ApproachSpec {
    ApproachPoint point;
    bool has_direction = false;
    Direction direction = Direction::BOTH;
};

// "0", "2+", "-1-", "inf", "-∞", "pi", "e".
// Throws InputError(EMPTY_INPUT) or InputError(INVALID_NUMBER).
ApproachSpec parse_approach(const std::string& text);

// A suffix-encoded direction always overrides the requested one
Direction resolve_direction(const ApproachSpec& spec, Direction requested);

// "x → 0⁺", "x → 0⁻", "x → 0", "x → ∞", "x → -∞"
std::string approach_notation(const ApproachPoint& point,
                              Direction direction,
                              const AnalysisOptions& options = AnalysisOptions());

} // namespace limcalc

#endif // LIMCALC_APPROACH_H
