#include "limcalc/analysis.h"
#include "limcalc/display.h"
#include "limcalc/errors.h"
#include "limcalc/normalizer.h"
#include "limcalc/sanitizer.h"
#include "limcalc/text.h"

namespace limcalc {

Direction parse_direction_choice(const std::string& text) {
    const std::string lower = to_lower_ascii(trim_copy(text));
    if (lower.empty() || lower == "both" || lower == "two-sided" || lower == "two sided") {
        return Direction::BOTH;
    }
    if (lower == "left" || lower == "-") {
        return Direction::LEFT;
    }
    if (lower == "right" || lower == "+") {
        return Direction::RIGHT;
    }
    throw InputError(InputErrorCode::INVALID_DIRECTION,
                     "Invalid direction '" + text + "': expected both, left or right");
}

Analyzer::Analyzer(const SymbolicEngine& engine, const AnalysisOptions& options)
    : engine_(engine),
      options_(options),
      narrator_(engine, options),
      classifier_(engine, options) {}

std::string Analyzer::prepare_expression(const std::string& raw) const {
    const std::string clean = sanitize(raw, options_.max_input_length);
    if (clean.empty()) {
        throw InputError(InputErrorCode::EMPTY_INPUT, "Expression is empty");
    }
    return normalize(clean, engine_);
}

AnalysisResult Analyzer::analyze(const AnalysisRequest& request) const {
    std::vector<std::string> inputs;
    inputs.push_back(request.expression);
    if (!trim_copy(request.second_expression).empty()) {
        inputs.push_back(request.second_expression);
    }

    // Validation stage
    std::vector<std::string> canonical;
    for (const auto& input : inputs) {
        canonical.push_back(prepare_expression(input));
    }
    AnalysisResult result;
    result.approach = parse_approach(request.approach);
    const Direction requested = parse_direction_choice(request.direction);
    const Direction direction = resolve_direction(result.approach, requested);

    // Computation stage
    for (size_t i = 0; i < inputs.size(); ++i) {
        ExpressionAnalysis analysis;
        analysis.input = trim_copy(inputs[i]);
        analysis.canonical = canonical[i];
        analysis.display = format_expression(canonical[i]);
        analysis.direction = direction;
        analysis.notation = approach_notation(result.approach.point, direction, options_);

        Narration narration = narrator_.narrate(canonical[i], result.approach.point, direction);
        analysis.limit = narration.limit;
        analysis.steps = std::move(narration.steps);
        analysis.continuity = classifier_.classify(canonical[i], result.approach.point);

        result.expressions.push_back(std::move(analysis));
    }
    return result;
}

} // namespace limcalc
