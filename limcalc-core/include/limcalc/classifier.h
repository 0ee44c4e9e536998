#ifndef LIMCALC_CLASSIFIER_H
#define LIMCALC_CLASSIFIER_H

#include "engine.h"
#include "evaluator.h"
#include "narrator.h"
#include "options.h"
#include <string>
#include <vector>

namespace limcalc {

enum class DiscontinuityKind {
    NONE,
    REMOVABLE,
    JUMP,
    ESSENTIAL,
    POINT_AT_INFINITY
};

// "continuous", "removable discontinuity", ..., "point at infinity"
const char* discontinuity_name(DiscontinuityKind kind);

struct ContinuityReport {
    ApproachPoint point;
    LimitValue function_value;
    LimitValue left;
    LimitValue right;
    LimitValue two_sided;
    bool continuous = false;
    DiscontinuityKind kind = DiscontinuityKind::ESSENTIAL;
    std::vector<Step> steps;
};

// Labels a point as continuous or as a removable, jump or essential
// discontinuity from f(a) and the one- and two-sided limits. A value that
// could not be computed counts as a limit that does not exist.
class ContinuityClassifier {
public:
    ContinuityClassifier(const SymbolicEngine& engine, const AnalysisOptions& options = AnalysisOptions());

    ContinuityReport classify(const std::string& canonical, const ApproachPoint& point) const;

private:
    DiscontinuityKind decide(const ContinuityReport& report) const;

    LimitEvaluator evaluator_;
};

} // namespace limcalc

#endif // LIMCALC_CLASSIFIER_H
