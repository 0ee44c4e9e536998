#ifndef LIMCALC_OPTIONS_H
#define LIMCALC_OPTIONS_H

#include <string>

namespace limcalc {

// Per-request analysis settings, passed by value into each component
struct AnalysisOptions {
    size_t max_input_length = 500;        // code points, after trimming
    double integer_tolerance = 1e-10;     // distance to snap to an integer or p/q
    long long max_denominator = 1000;
    int decimal_places = 6;
    double comparison_tolerance = 1e-9;   // limit equality in the classifier

    std::string positive_infinity_label = "∞";
    std::string negative_infinity_label = "-∞";
    std::string complex_infinity_label = "±∞";
    std::string undefined_label = "undefined";
    std::string nan_label = "NaN";
    std::string failed_label = "cannot compute";
};

} // namespace limcalc

#endif // LIMCALC_OPTIONS_H
