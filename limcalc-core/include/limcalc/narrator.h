#ifndef LIMCALC_NARRATOR_H
#define LIMCALC_NARRATOR_H

#include "engine.h"
#include "evaluator.h"
#include "options.h"
#include <string>
#include <vector>

namespace limcalc {

struct Step {
    std::string text;
    bool emphasized = false;
    std::string result;  // set on emphasized steps
};

struct Narration {
    LimitValue limit;
    std::vector<Step> steps;
};

// Builds the derivation shown next to a limit: restate, simplify,
// substitute, evaluate. Never throws.
class StepNarrator {
public:
    StepNarrator(const SymbolicEngine& engine, const AnalysisOptions& options = AnalysisOptions());

    Narration narrate(const std::string& canonical,
                      const ApproachPoint& point,
                      Direction direction) const;

private:
    void add_substitution(const std::string& canonical,
                          const ApproachPoint& point,
                          std::vector<Step>& steps) const;

    const SymbolicEngine& engine_;
    LimitEvaluator evaluator_;
};

} // namespace limcalc

#endif // LIMCALC_NARRATOR_H
