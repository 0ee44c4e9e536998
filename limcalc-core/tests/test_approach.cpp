#include "limcalc/approach.h"
#include "limcalc/analysis.h"
#include "limcalc/errors.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <string>

using namespace limcalc;

bool approx_equal(double a, double b, double epsilon = 1e-12) {
    return std::abs(a - b) < epsilon;
}

InputErrorCode error_code_of(const std::string& text) {
    try {
        parse_approach(text);
    } catch (const InputError& e) {
        return e.code;
    }
    assert(false && "expected InputError");
    return InputErrorCode::INVALID_NUMBER;
}

void test_finite_points() {
    ApproachSpec spec = parse_approach("0");
    assert(spec.point.kind == ApproachPoint::Kind::FINITE);
    assert(spec.point.value == 0.0);
    assert(!spec.has_direction);

    spec = parse_approach(" -2.5 ");
    assert(approx_equal(spec.point.value, -2.5));

    spec = parse_approach("1e-3");
    assert(approx_equal(spec.point.value, 0.001));
    assert(!spec.has_direction);

    spec = parse_approach("pi");
    assert(approx_equal(spec.point.value, std::acos(-1.0)));

    spec = parse_approach("e");
    assert(approx_equal(spec.point.value, std::exp(1.0)));

    std::cout << "✓ test_finite_points passed\n";
}

void test_one_sided_suffix() {
    ApproachSpec spec = parse_approach("0+");
    assert(spec.point.kind == ApproachPoint::Kind::FINITE);
    assert(spec.point.value == 0.0);
    assert(spec.has_direction);
    assert(spec.direction == Direction::RIGHT);

    spec = parse_approach("2-");
    assert(spec.point.value == 2.0);
    assert(spec.direction == Direction::LEFT);

    spec = parse_approach("-1-");
    assert(spec.point.value == -1.0);
    assert(spec.direction == Direction::LEFT);

    assert(error_code_of("abc+") == InputErrorCode::INVALID_NUMBER);

    std::cout << "✓ test_one_sided_suffix passed\n";
}

void test_infinity_spellings() {
    const char* positive[] = {"inf", "Infinity", "∞", "oo", "+inf", "+∞"};
    for (const char* text : positive) {
        ApproachSpec spec = parse_approach(text);
        assert(spec.point.kind == ApproachPoint::Kind::POSITIVE_INFINITY);
        assert(!spec.has_direction);
    }

    const char* negative[] = {"-inf", "-infinity", "-∞", "-oo"};
    for (const char* text : negative) {
        ApproachSpec spec = parse_approach(text);
        assert(spec.point.kind == ApproachPoint::Kind::NEGATIVE_INFINITY);
        assert(!spec.has_direction);
    }

    std::cout << "✓ test_infinity_spellings passed\n";
}

void test_invalid_input() {
    assert(error_code_of("") == InputErrorCode::EMPTY_INPUT);
    assert(error_code_of("   ") == InputErrorCode::EMPTY_INPUT);
    assert(error_code_of("abc") == InputErrorCode::INVALID_NUMBER);
    assert(error_code_of("-") == InputErrorCode::INVALID_NUMBER);
    assert(error_code_of("nan") == InputErrorCode::INVALID_NUMBER);
    assert(error_code_of("0x10") == InputErrorCode::INVALID_NUMBER);

    std::cout << "✓ test_invalid_input passed\n";
}

void test_direction_override() {
    ApproachSpec suffixed = parse_approach("0+");
    assert(resolve_direction(suffixed, Direction::LEFT) == Direction::RIGHT);
    assert(resolve_direction(suffixed, Direction::BOTH) == Direction::RIGHT);

    ApproachSpec plain = parse_approach("0");
    assert(resolve_direction(plain, Direction::LEFT) == Direction::LEFT);

    assert(parse_direction_choice("") == Direction::BOTH);
    assert(parse_direction_choice("Two-Sided") == Direction::BOTH);
    assert(parse_direction_choice("left") == Direction::LEFT);
    assert(parse_direction_choice("+") == Direction::RIGHT);

    bool threw = false;
    try {
        parse_direction_choice("up");
    } catch (const InputError& e) {
        threw = true;
        assert(e.code == InputErrorCode::INVALID_DIRECTION);
    }
    assert(threw);

    std::cout << "✓ test_direction_override passed\n";
}

void test_notation() {
    assert(approach_notation(ApproachPoint::finite(0.0), Direction::RIGHT) == "x → 0⁺");
    assert(approach_notation(ApproachPoint::finite(0.0), Direction::LEFT) == "x → 0⁻");
    assert(approach_notation(ApproachPoint::finite(2.0), Direction::BOTH) == "x → 2");
    assert(approach_notation(ApproachPoint::finite(0.5), Direction::BOTH) == "x → 1/2");
    assert(approach_notation(ApproachPoint::positive_infinity(), Direction::RIGHT) == "x → ∞");
    assert(approach_notation(ApproachPoint::negative_infinity(), Direction::BOTH) == "x → -∞");
    assert(std::string(direction_name(Direction::LEFT)) == "left");

    std::cout << "✓ test_notation passed\n";
}

int main() {
    std::cout << "Running approach tests...\n";

    test_finite_points();
    test_one_sided_suffix();
    test_infinity_spellings();
    test_invalid_input();
    test_direction_override();
    test_notation();

    std::cout << "\nAll approach tests passed!\n";
    return 0;
}
