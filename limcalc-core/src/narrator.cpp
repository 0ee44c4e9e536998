#include "limcalc/narrator.h"
#include "limcalc/approach.h"
#include "limcalc/display.h"
#include "limcalc/normalizer.h"

namespace limcalc {

namespace {

Step plain(const std::string& text) {
    Step step;
    step.text = text;
    return step;
}

Step final_result(const std::string& notation, const LimitValue& limit) {
    Step step;
    step.text = "lim " + notation + " f(x) = " + limit.text;
    step.emphasized = true;
    step.result = limit.text;
    return step;
}

std::string direction_phrase(const ApproachPoint& point, Direction direction) {
    if (point.is_infinite()) {
        return "Evaluate the limit at infinity";
    }
    switch (direction) {
        case Direction::LEFT:
            return "Evaluate the left-hand limit (x approaches from below)";
        case Direction::RIGHT:
            return "Evaluate the right-hand limit (x approaches from above)";
        case Direction::BOTH:
            break;
    }
    return "Evaluate the two-sided limit";
}

} // namespace

StepNarrator::StepNarrator(const SymbolicEngine& engine, const AnalysisOptions& options)
    : engine_(engine), evaluator_(engine, options) {}

void StepNarrator::add_substitution(const std::string& canonical,
                                    const ApproachPoint& point,
                                    std::vector<Step>& steps) const {
    const AnalysisOptions& options = evaluator_.options();

    if (point.is_infinite()) {
        steps.push_back(plain("Direct substitution is not possible at " +
                              format_point(point, options) +
                              "; study the behavior as x grows without bound"));
        return;
    }

    const LimitValue value = evaluator_.evaluate_at(canonical, point);
    const std::string at = "f(" + format_point(point, options) + ")";
    if (value.kind == LimitValue::Kind::UNDEFINED) {
        steps.push_back(plain("Direct substitution: " + at + " is undefined (indeterminate form)"));
    } else {
        steps.push_back(plain("Direct substitution: " + at + " = " + value.text));
    }
}

Narration StepNarrator::narrate(const std::string& canonical,
                                const ApproachPoint& point,
                                Direction direction) const {
    const AnalysisOptions& options = evaluator_.options();
    const std::string notation = approach_notation(point, direction, options);
    Narration narration;

    narration.steps.push_back(plain("Find the limit of f(x) = " + format_expression(canonical) +
                                    " as " + notation));

    std::string current = canonical;
    try {
        auto expr = engine_.parse(canonical);
        auto simplified = engine_.simplify(*expr);
        const std::string printed = engine_.to_string(*simplified);
        if (strip_whitespace(printed) != strip_whitespace(canonical)) {
            narration.steps.push_back(plain("Simplify: f(x) = " + format_expression(printed)));
            current = printed;
        }
    } catch (const EngineError& e) {
        narration.steps.push_back(plain(std::string("Error: ") + e.what()));
        narration.limit = evaluator_.failure(e.what());
        narration.steps.push_back(final_result(notation, narration.limit));
        return narration;
    }

    add_substitution(current, point, narration.steps);

    narration.steps.push_back(plain(direction_phrase(point, direction)));
    narration.limit = evaluator_.evaluate_limit(current, point, direction);
    if (narration.limit.failed()) {
        narration.steps.push_back(plain("Error: " + narration.limit.error));
    }

    narration.steps.push_back(final_result(notation, narration.limit));
    return narration;
}

} // namespace limcalc
