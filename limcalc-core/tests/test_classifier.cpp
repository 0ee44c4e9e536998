#include "limcalc/classifier.h"
#include <iostream>
#include <cassert>
#include <string>

using namespace limcalc;

ContinuityReport classify_at(const std::string& canonical, double a) {
    NumericEngine engine;
    ContinuityClassifier classifier(engine);
    return classifier.classify(canonical, ApproachPoint::finite(a));
}

void test_continuous() {
    ContinuityReport report = classify_at("x**2 + 3*x", 2.0);
    assert(report.continuous);
    assert(report.kind == DiscontinuityKind::NONE);
    assert(report.function_value.text == "10");
    assert(report.left.text == "10");
    assert(report.right.text == "10");
    assert(report.two_sided.text == "10");

    assert(report.steps.size() == 5);
    assert(report.steps[0].text == "f(2) = 10");
    assert(report.steps[1].text == "Left-hand limit: 10");
    assert(report.steps[2].text == "Right-hand limit: 10");
    assert(report.steps[3].text == "Two-sided limit: 10");
    assert(report.steps[4].emphasized);
    assert(report.steps[4].text == "f is continuous at x = 2");
    assert(report.steps[4].result == "continuous");

    report = classify_at("sin(x)", 0.0);
    assert(report.continuous);

    std::cout << "✓ test_continuous passed\n";
}

void test_removable() {
    // Undefined at the point, equal one-sided limits
    ContinuityReport report = classify_at("(x**2 - 1)/(x - 1)", 1.0);
    assert(!report.continuous);
    assert(report.kind == DiscontinuityKind::REMOVABLE);
    assert(report.function_value.kind == LimitValue::Kind::UNDEFINED);
    assert(report.steps.back().text == "f has a removable discontinuity at x = 1");

    report = classify_at("sin(x)/x", 0.0);
    assert(report.kind == DiscontinuityKind::REMOVABLE);

    // Defined at the point, but the limit differs from f(a)
    report = classify_at("abs(sign(x))", 0.0);
    assert(report.function_value.text == "0");
    assert(report.two_sided.text == "1");
    assert(report.kind == DiscontinuityKind::REMOVABLE);

    std::cout << "✓ test_removable passed\n";
}

void test_jump() {
    ContinuityReport report = classify_at("floor(x)", 1.0);
    assert(report.kind == DiscontinuityKind::JUMP);
    assert(report.left.text == "0");
    assert(report.right.text == "1");
    assert(report.two_sided.kind == LimitValue::Kind::UNDEFINED);
    assert(report.steps.back().text == "f has a jump discontinuity at x = 1");

    report = classify_at("Heaviside(x)", 0.0);
    assert(report.function_value.text == "1/2");
    assert(report.kind == DiscontinuityKind::JUMP);

    std::cout << "✓ test_jump passed\n";
}

void test_essential() {
    ContinuityReport report = classify_at("1/x", 0.0);
    assert(report.kind == DiscontinuityKind::ESSENTIAL);
    assert(report.left.kind == LimitValue::Kind::NEGATIVE_INFINITY);
    assert(report.right.kind == LimitValue::Kind::POSITIVE_INFINITY);
    assert(report.steps.back().result == "essential discontinuity");

    // Undefined at 0 with unequal finite sides
    report = classify_at("abs(x)/x", 0.0);
    assert(report.kind == DiscontinuityKind::ESSENTIAL);

    // A side that cannot be computed counts as a missing limit
    report = classify_at("sqrt(x - 2)", 2.0);
    assert(report.function_value.text == "0");
    assert(report.left.failed());
    assert(report.kind == DiscontinuityKind::ESSENTIAL);

    std::cout << "✓ test_essential passed\n";
}

void test_near_singular_points() {
    // Continuous at points close to a singularity or a domain boundary
    ContinuityReport report = classify_at("log(x)", 1e-6);
    assert(report.kind == DiscontinuityKind::NONE);
    assert(report.left.text == report.right.text);

    report = classify_at("sqrt(x)", 1e-6);
    assert(report.kind == DiscontinuityKind::NONE);
    assert(report.function_value.text == "1/1000");
    assert(report.left.text == "1/1000");
    assert(report.right.text == "1/1000");

    report = classify_at("1/(x - 1e-7)", 0.0);
    assert(report.continuous);
    assert(report.function_value.text == "-10000000");
    assert(report.left.text == "-10000000");
    assert(report.right.text == "-10000000");

    // Sides within solver noise of zero
    report = classify_at("x**2*sin(1/x)", 0.0);
    assert(report.function_value.kind == LimitValue::Kind::UNDEFINED);
    assert(report.left.text == "0");
    assert(report.right.text == "0");
    assert(report.kind == DiscontinuityKind::REMOVABLE);

    std::cout << "✓ test_near_singular_points passed\n";
}

void test_point_at_infinity() {
    NumericEngine engine;
    ContinuityClassifier classifier(engine);

    ContinuityReport report = classifier.classify("1/x", ApproachPoint::positive_infinity());
    assert(!report.continuous);
    assert(report.kind == DiscontinuityKind::POINT_AT_INFINITY);
    assert(report.two_sided.text == "0");
    assert(report.steps.size() == 3);
    assert(report.steps.back().text == "x → ∞ is a point at infinity");
    assert(std::string(discontinuity_name(report.kind)) == "point at infinity");

    std::cout << "✓ test_point_at_infinity passed\n";
}

int main() {
    std::cout << "Running classifier tests...\n";

    test_continuous();
    test_removable();
    test_jump();
    test_essential();
    test_near_singular_points();
    test_point_at_infinity();

    std::cout << "\nAll classifier tests passed!\n";
    return 0;
}
