#ifndef LIMCALC_ANALYSIS_H
#define LIMCALC_ANALYSIS_H

#include "approach.h"
#include "classifier.h"
#include "engine.h"
#include "narrator.h"
#include "options.h"
#include <string>
#include <vector>

namespace limcalc {

// One request from the presentation layer; second_expression is optional
struct AnalysisRequest {
    std::string expression;
    std::string second_expression;
    std::string approach;
    std::string direction;
};

struct ExpressionAnalysis {
    std::string input;
    std::string canonical;
    std::string display;
    Direction direction = Direction::BOTH;
    std::string notation;
    LimitValue limit;
    std::vector<Step> steps;
    ContinuityReport continuity;
};

struct AnalysisResult {
    ApproachSpec approach;
    std::vector<ExpressionAnalysis> expressions;
};

// "both", "two-sided", "left", "right", "+", "-" (case-insensitive); empty
// means both. Throws InputError(INVALID_DIRECTION).
Direction parse_direction_choice(const std::string& text);

class Analyzer {
public:
    Analyzer(const SymbolicEngine& engine, const AnalysisOptions& options = AnalysisOptions());

    // Sanitize + normalize; throws InputError
    std::string prepare_expression(const std::string& raw) const;

    // Validates every input before computing anything. Throws InputError.
    AnalysisResult analyze(const AnalysisRequest& request) const;

    const AnalysisOptions& options() const { return options_; }

private:
    const SymbolicEngine& engine_;
    AnalysisOptions options_;
    StepNarrator narrator_;
    ContinuityClassifier classifier_;
};

} // namespace limcalc

#endif // LIMCALC_ANALYSIS_H
