#include "limcalc/classifier.h"
#include "limcalc/display.h"

namespace limcalc {

namespace {

Step plain(const std::string& text) {
    Step step;
    step.text = text;
    return step;
}

} // namespace

const char* discontinuity_name(DiscontinuityKind kind) {
    switch (kind) {
        case DiscontinuityKind::NONE:
            return "continuous";
        case DiscontinuityKind::REMOVABLE:
            return "removable discontinuity";
        case DiscontinuityKind::JUMP:
            return "jump discontinuity";
        case DiscontinuityKind::ESSENTIAL:
            return "essential discontinuity";
        case DiscontinuityKind::POINT_AT_INFINITY:
            return "point at infinity";
    }
    return "essential discontinuity";
}

ContinuityClassifier::ContinuityClassifier(const SymbolicEngine& engine, const AnalysisOptions& options)
    : evaluator_(engine, options) {}

DiscontinuityKind ContinuityClassifier::decide(const ContinuityReport& report) const {
    const LimitValue& value = report.function_value;
    const LimitValue& left = report.left;
    const LimitValue& right = report.right;
    const LimitValue& both = report.two_sided;

    if (!value.is_finite()) {
        // Not defined at the point
        if (left.is_finite() && right.is_finite() && evaluator_.limits_equal(left, right)) {
            return DiscontinuityKind::REMOVABLE;
        }
        return DiscontinuityKind::ESSENTIAL;
    }

    if (left.is_finite() && right.is_finite() && both.is_finite() &&
        evaluator_.limits_equal(value, left) && evaluator_.limits_equal(value, right) &&
        evaluator_.limits_equal(value, both) && evaluator_.limits_equal(left, right)) {
        return DiscontinuityKind::NONE;
    }

    if (!left.is_finite() || !right.is_finite()) {
        return DiscontinuityKind::ESSENTIAL;
    }
    if (!evaluator_.limits_equal(left, right)) {
        return DiscontinuityKind::JUMP;
    }
    return DiscontinuityKind::REMOVABLE;
}

ContinuityReport ContinuityClassifier::classify(const std::string& canonical,
                                                const ApproachPoint& point) const {
    const AnalysisOptions& options = evaluator_.options();
    ContinuityReport report;
    report.point = point;

    report.left = evaluator_.evaluate_limit(canonical, point, Direction::LEFT);
    report.right = evaluator_.evaluate_limit(canonical, point, Direction::RIGHT);
    report.two_sided = evaluator_.evaluate_limit(canonical, point, Direction::BOTH);

    if (point.is_infinite()) {
        report.function_value = evaluator_.evaluate_at(canonical, point);
        report.continuous = false;
        report.kind = DiscontinuityKind::POINT_AT_INFINITY;
        report.steps.push_back(plain("Continuity is only defined at finite points"));
        report.steps.push_back(plain("Limit as " + format_point(point, options) + ": " +
                                     report.two_sided.text));
    } else {
        const std::string at = format_point(point, options);
        report.function_value = evaluator_.evaluate_at(canonical, point);
        report.kind = decide(report);
        report.continuous = report.kind == DiscontinuityKind::NONE;

        report.steps.push_back(plain("f(" + at + ") = " + report.function_value.text));
        report.steps.push_back(plain("Left-hand limit: " + report.left.text));
        report.steps.push_back(plain("Right-hand limit: " + report.right.text));
        report.steps.push_back(plain("Two-sided limit: " + report.two_sided.text));
    }

    Step conclusion;
    conclusion.emphasized = true;
    conclusion.result = discontinuity_name(report.kind);
    if (report.continuous) {
        conclusion.text = "f is continuous at x = " + format_point(point, options);
    } else if (report.kind == DiscontinuityKind::POINT_AT_INFINITY) {
        conclusion.text = "x → " + format_point(point, options) + " is a point at infinity";
    } else {
        conclusion.text = "f has a " + conclusion.result + " at x = " + format_point(point, options);
    }
    report.steps.push_back(conclusion);
    return report;
}

} // namespace limcalc
