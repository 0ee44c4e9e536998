#include "limcalc/catalog.h"

namespace limcalc {

const std::vector<CatalogEntry>& example_catalog() {
    static const std::vector<CatalogEntry> entries = {
        {"Sinc at zero", "sin(x)/x", "0",
         "Classic indeterminate form 0/0 with limit 1"},
        {"Removable hole", "(x^2-1)/(x-1)", "1",
         "Undefined at 1, but both sides approach 2"},
        {"Reciprocal", "1/x", "0",
         "One-sided limits diverge in opposite directions"},
        {"Compound interest", "(1+1/x)^x", "∞",
         "Converges to e as x grows"},
        {"Exponential derivative", "(e^x-1)/x", "0",
         "Derivative of e^x at 0"},
        {"Square root edge", "√(x-2)", "2+",
         "Defined only to the right of 2"},
        {"Sign function", "abs(x)/x", "0",
         "Left and right limits are -1 and 1"},
        {"Floor step", "floor(x)", "1",
         "Jump discontinuity at an integer"},
        {"Polynomial", "x²+3x", "2",
         "Continuous everywhere; direct substitution works"},
        {"Cosine ratio", "(1-cos(x))/x²", "0",
         "Second-order indeterminate form with limit 1/2"},
        {"Rational at infinity", "(3x²+2)/(x²-1)", "∞",
         "Ratio of leading coefficients"},
    };
    return entries;
}

} // namespace limcalc
