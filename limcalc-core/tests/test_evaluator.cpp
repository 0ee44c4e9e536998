#include "limcalc/evaluator.h"
#include "limcalc/display.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace limcalc;

// Engine whose limit() always raises; parsing still works
class FailingEngine : public NumericEngine {
public:
    explicit FailingEngine(bool engine_error) : engine_error_(engine_error) {}

    EngineValue limit(const Expression&, const ApproachPoint&, Direction) const override {
        if (engine_error_) {
            throw EngineError(EngineErrorKind::LIMIT, "solver gave up");
        }
        throw std::runtime_error("unexpected failure");
    }

private:
    bool engine_error_;
};

void test_format_number() {
    AnalysisOptions options;
    assert(format_number(2.0, options) == "2");
    assert(format_number(-0.0, options) == "0");
    assert(format_number(0.5, options) == "1/2");
    assert(format_number(1.0 / 3.0, options) == "1/3");
    assert(format_number(-2.0 / 3.0, options) == "-2/3");
    assert(format_number(std::exp(1.0), options) == "2.718282");
    assert(format_number(0.1 + 1e-4 / 3.0, options) == "0.100033");
    assert(format_number(std::numeric_limits<double>::infinity(), options) == "∞");

    options.decimal_places = 2;
    assert(format_number(std::exp(1.0), options) == "2.72");

    std::cout << "✓ test_format_number passed\n";
}

void test_format_expression() {
    assert(format_expression("sqrt(x - 2)") == "√(x - 2)");
    assert(format_expression("x**2 + 3*x") == "x^2 + 3x");
    assert(format_expression("log(x)/pi") == "ln(x)/π");
    assert(format_expression("(1 + 1/x)**x") == "(1 + 1/x)^x");
    assert(format_expression("exp(x) - E") == "exp(x) - e");

    std::cout << "✓ test_format_expression passed\n";
}

void test_limit_kinds() {
    NumericEngine engine;
    LimitEvaluator evaluator(engine);

    LimitValue value = evaluator.evaluate_limit("sin(x)/x", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.kind == LimitValue::Kind::INTEGER);
    assert(value.text == "1");

    value = evaluator.evaluate_limit("(x + 1)/(2*x)", ApproachPoint::positive_infinity(), Direction::BOTH);
    assert(value.kind == LimitValue::Kind::RATIONAL);
    assert(value.text == "1/2");

    value = evaluator.evaluate_limit("(1 + 1/x)**x", ApproachPoint::positive_infinity(), Direction::BOTH);
    assert(value.kind == LimitValue::Kind::DECIMAL);
    assert(value.text == "2.718282");

    value = evaluator.evaluate_limit("1/x", ApproachPoint::finite(0.0), Direction::RIGHT);
    assert(value.kind == LimitValue::Kind::POSITIVE_INFINITY);
    assert(value.text == "∞");

    value = evaluator.evaluate_limit("1/x", ApproachPoint::finite(0.0), Direction::LEFT);
    assert(value.kind == LimitValue::Kind::NEGATIVE_INFINITY);
    assert(value.text == "-∞");

    value = evaluator.evaluate_limit("1/x", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.kind == LimitValue::Kind::COMPLEX_INFINITY);
    assert(value.text == "±∞");

    value = evaluator.evaluate_limit("floor(x)", ApproachPoint::finite(1.0), Direction::BOTH);
    assert(value.kind == LimitValue::Kind::UNDEFINED);
    assert(value.text == "undefined");

    std::cout << "✓ test_limit_kinds passed\n";
}

void test_failures_become_cannot_compute() {
    NumericEngine engine;
    LimitEvaluator evaluator(engine);

    LimitValue value = evaluator.evaluate_limit("sqrt(x - 2)", ApproachPoint::finite(2.0), Direction::BOTH);
    assert(value.failed());
    assert(value.text == "cannot compute");
    assert(!value.error.empty());

    value = evaluator.evaluate_limit("sin(", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.failed());

    FailingEngine engine_error(true);
    LimitEvaluator failing(engine_error);
    value = failing.evaluate_limit("x", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.failed());
    assert(value.error == "solver gave up");

    FailingEngine internal_error(false);
    LimitEvaluator internal(internal_error);
    value = internal.evaluate_limit("x", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.failed());
    assert(value.error.find("Internal error") == 0);

    std::cout << "✓ test_failures_become_cannot_compute passed\n";
}

void test_evaluate_at() {
    NumericEngine engine;
    LimitEvaluator evaluator(engine);

    LimitValue value = evaluator.evaluate_at("x**2 + 3*x", ApproachPoint::finite(2.0));
    assert(value.kind == LimitValue::Kind::INTEGER);
    assert(value.text == "10");

    value = evaluator.evaluate_at("sin(x)/x", ApproachPoint::finite(0.0));
    assert(value.kind == LimitValue::Kind::UNDEFINED);
    assert(!value.error.empty());

    value = evaluator.evaluate_at("x", ApproachPoint::positive_infinity());
    assert(value.kind == LimitValue::Kind::UNDEFINED);

    // Overflowing substitution is undefined, not infinite
    value = evaluator.evaluate_at("x**2", ApproachPoint::finite(1e300));
    assert(value.kind == LimitValue::Kind::UNDEFINED);
    assert(value.text == "undefined");

    std::cout << "✓ test_evaluate_at passed\n";
}

void test_limits_equal() {
    NumericEngine engine;
    LimitEvaluator evaluator(engine);

    LimitValue a = evaluator.from_engine_value(EngineValue::number(0.5));
    LimitValue b = evaluator.from_engine_value(EngineValue::number(0.5 + 1e-12));
    LimitValue c = evaluator.from_engine_value(EngineValue::number(0.6));
    assert(evaluator.limits_equal(a, b));
    assert(!evaluator.limits_equal(a, c));

    // Same display text counts as equal even beyond the numeric tolerance
    LimitValue tiny_pos = evaluator.from_engine_value(EngineValue::number(1.18e-8));
    LimitValue tiny_neg = evaluator.from_engine_value(EngineValue::number(-1.18e-8));
    LimitValue zero = evaluator.from_engine_value(EngineValue::number(0.0));
    assert(tiny_pos.text == "0");
    assert(tiny_neg.text == "0");
    assert(evaluator.limits_equal(tiny_pos, tiny_neg));
    assert(evaluator.limits_equal(tiny_pos, zero));

    // Error estimates widen the tolerance
    LimitValue rough = evaluator.from_engine_value(EngineValue::number(2.5000015, 2e-6));
    LimitValue exact = evaluator.from_engine_value(EngineValue::number(2.5));
    assert(rough.error_estimate == 2e-6);
    assert(rough.text != exact.text);
    assert(evaluator.limits_equal(rough, exact));
    LimitValue sharp = evaluator.from_engine_value(EngineValue::number(2.5000015));
    assert(!evaluator.limits_equal(sharp, exact));

    LimitValue inf1 = evaluator.from_engine_value(EngineValue::of_kind(EngineValue::Kind::POSITIVE_INFINITY));
    LimitValue inf2 = evaluator.from_engine_value(EngineValue::of_kind(EngineValue::Kind::POSITIVE_INFINITY));
    LimitValue ninf = evaluator.from_engine_value(EngineValue::of_kind(EngineValue::Kind::NEGATIVE_INFINITY));
    assert(evaluator.limits_equal(inf1, inf2));
    assert(!evaluator.limits_equal(inf1, ninf));
    assert(!evaluator.limits_equal(a, inf1));

    LimitValue failed = evaluator.failure("boom");
    assert(!evaluator.limits_equal(failed, failed));

    std::cout << "✓ test_limits_equal passed\n";
}

void test_custom_labels() {
    NumericEngine engine;
    AnalysisOptions options;
    options.positive_infinity_label = "+inf";
    options.failed_label = "n/a";
    LimitEvaluator evaluator(engine, options);

    LimitValue value = evaluator.evaluate_limit("1/x**2", ApproachPoint::finite(0.0), Direction::BOTH);
    assert(value.text == "+inf");

    value = evaluator.evaluate_limit("sin(1/x)", ApproachPoint::finite(0.0), Direction::RIGHT);
    assert(value.text == "n/a");

    assert(std::string(limit_kind_name(LimitValue::Kind::COMPLEX_INFINITY)) == "complex_infinity");

    std::cout << "✓ test_custom_labels passed\n";
}

int main() {
    std::cout << "Running evaluator tests...\n";

    test_format_number();
    test_format_expression();
    test_limit_kinds();
    test_failures_become_cannot_compute();
    test_evaluate_at();
    test_limits_equal();
    test_custom_labels();

    std::cout << "\nAll evaluator tests passed!\n";
    return 0;
}
