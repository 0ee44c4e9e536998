#include "limcalc/normalizer.h"
#include "limcalc/catalog.h"
#include "limcalc/engine.h"
#include "limcalc/errors.h"
#include "limcalc/sanitizer.h"
#include <iostream>
#include <cassert>
#include <string>

using namespace limcalc;

std::string norm(const std::string& text) {
    NumericEngine engine;
    return normalize(text, engine);
}

bool rejects(const std::string& text, std::string* message = nullptr) {
    try {
        norm(text);
    } catch (const InputError& e) {
        assert(e.code == InputErrorCode::UNPARSABLE_EXPRESSION);
        if (message) {
            *message = e.what();
        }
        return true;
    }
    return false;
}

void test_individual_passes() {
    assert(canonicalize_function_names("ARCSIN(x) + Cos(x)") == "asin(x) + cos(x)");
    assert(canonicalize_function_names("sin x + 1") == "sin(x) + 1");
    assert(canonicalize_function_names("sin(cos(x))") == "sin(cos(x))");
    assert(expand_powers("x^2 + x² - x³") == "x**2 + x**2 - x**3");
    assert(insert_implicit_multiplication("2x") == "2*x");
    assert(replace_symbols("ln(x) + π") == "log(x) + pi");
    assert(rewrite_roots("√(x-2)") == "sqrt(x-2)");
    assert(strip_whitespace(" x +  1 ") == "x+1");

    std::cout << "✓ test_individual_passes passed\n";
}

void test_standard_examples() {
    assert(norm("sin(x)/x") == "sin(x)/x");
    assert(norm("(x^2-1)/(x-1)") == "(x**2-1)/(x-1)");
    assert(norm("x²+3x") == "x**2+3*x");
    assert(norm("(e^x-1)/x") == "(exp(x)-1)/x");
    assert(norm("√(x-2)") == "sqrt(x-2)");
    assert(norm("(1+1/x)^x") == "(1+1/x)**x");
    assert(norm("(1-cos(x))/x²") == "(1-cos(x))/x**2");
    assert(norm("(3x²+2)/(x²-1)") == "(3*x**2+2)/(x**2-1)");

    std::cout << "✓ test_standard_examples passed\n";
}

void test_implicit_multiplication() {
    assert(norm("2x") == "2*x");
    assert(norm("2(x+1)") == "2*(x+1)");
    assert(norm("(x+1)(x-1)") == "(x+1)*(x-1)");
    assert(norm("x(x+1)") == "x*(x+1)");
    assert(norm("x2") == "x*2");
    assert(norm("3 x") == "3*x");
    assert(norm("2π") == "2*pi");
    assert(norm("2√x") == "2*sqrt(x)");

    // Scientific notation is one number
    assert(norm("1e-5x") == "1e-5*x");

    // Function names never get a product before their parenthesis
    assert(norm("sin(x)cos(x)") == "sin(x)*cos(x)");

    std::cout << "✓ test_implicit_multiplication passed\n";
}

void test_symbols() {
    assert(norm("ln(x)") == "log(x)");
    assert(norm("π*x") == "pi*x");
    assert(norm("PI + x") == "pi+x");
    assert(norm("x + ∞") == "x+oo");
    assert(norm("e*x") == "E*x");
    assert(norm("e^(2x)") == "exp(2*x)");
    assert(norm("e^-x") == "exp(-x)");
    assert(norm("e^x^2") == "exp(x)**2");
    assert(norm("√x + 1") == "sqrt(x)+1");
    assert(norm("Sqrt(x)") == "sqrt(x)");
    assert(norm("arctan(x)") == "atan(x)");
    assert(norm("sin x") == "sin(x)");
    assert(norm("Abs(x)/x") == "abs(x)/x");

    std::cout << "✓ test_symbols passed\n";
}

void test_rejections() {
    std::string message;
    assert(rejects("foo(x)", &message));
    assert(message.find("Unknown symbol: foo") != std::string::npos);

    assert(rejects("x +"));
    assert(rejects("y*x"));
    assert(rejects("(x"));

    // Sanitizer placeholders surface as parse failures
    assert(rejects(sanitize("eval(x)")));
    assert(rejects(sanitize("__import__")));

    std::cout << "✓ test_rejections passed\n";
}

void test_catalog_entries_normalize() {
    const auto& catalog = example_catalog();
    assert(catalog.size() >= 10);
    for (const auto& entry : catalog) {
        assert(!entry.name.empty());
        assert(!entry.description.empty());
        const std::string canonical = norm(sanitize(entry.expression));
        assert(!canonical.empty());
    }

    std::cout << "✓ test_catalog_entries_normalize passed\n";
}

int main() {
    std::cout << "Running normalizer tests...\n";

    test_individual_passes();
    test_standard_examples();
    test_implicit_multiplication();
    test_symbols();
    test_rejections();
    test_catalog_entries_normalize();

    std::cout << "\nAll normalizer tests passed!\n";
    return 0;
}
