#ifndef LIMCALC_TYPES_H
#define LIMCALC_TYPES_H

#include <string>

namespace limcalc {

// Side from which the variable approaches the point
enum class Direction {
    LEFT,
    RIGHT,
    BOTH
};

struct ApproachPoint {
    enum class Kind {
        FINITE,
        POSITIVE_INFINITY,
        NEGATIVE_INFINITY
    };

    Kind kind{Kind::FINITE};
    double value{0.0};

    static ApproachPoint finite(double v) { return ApproachPoint{Kind::FINITE, v}; }
    static ApproachPoint positive_infinity() { return ApproachPoint{Kind::POSITIVE_INFINITY, 0.0}; }
    static ApproachPoint negative_infinity() { return ApproachPoint{Kind::NEGATIVE_INFINITY, 0.0}; }

    bool is_infinite() const { return kind != Kind::FINITE; }
};

const char* direction_name(Direction direction);

} // namespace limcalc

#endif // LIMCALC_TYPES_H
