#include "limcalc/parser.h"
#include "limcalc/compiler.h"
#include "limcalc/simplify.h"
#include <iostream>
#include <cassert>
#include <string>

using namespace limcalc;

void test_simple_expression() {
    Parser parser;

    auto ast = parser.parse("x + 2", "x");
    assert(ast != nullptr);
    assert(ast->type == ASTNodeType::BINARY_OP);
    assert(ast->value == "+");
    assert(ast->children[0]->type == ASTNodeType::VARIABLE);

    std::cout << "✓ test_simple_expression passed\n";
}

void test_power_spellings() {
    Parser parser;

    auto a = parser.parse("x**2 + x^3", "x");
    assert(a != nullptr);
    assert(a->children[0]->value == "^");
    assert(a->children[1]->value == "^");

    // Unary minus binds looser than power
    auto b = parser.parse("-x**2", "x");
    assert(b != nullptr);
    assert(b->type == ASTNodeType::UNARY_OP);
    assert(b->children[0]->type == ASTNodeType::BINARY_OP);
    assert(b->children[0]->value == "^");

    std::cout << "✓ test_power_spellings passed\n";
}

void test_number_tokens() {
    Parser parser;

    auto a = parser.parse("2-x", "x");
    assert(a != nullptr);
    assert(a->value == "-");
    assert(a->children[0]->value == "2");

    auto b = parser.parse("1e-5*x", "x");
    assert(b != nullptr);
    assert(b->value == "*");
    assert(b->children[0]->type == ASTNodeType::NUMBER);
    assert(b->children[0]->value == "1e-5");

    auto c = parser.parse("1.2.3", "x");
    assert(c == nullptr);
    assert(parser.get_error().find("Malformed number") != std::string::npos);

    std::cout << "✓ test_number_tokens passed\n";
}

void test_functions_and_constants() {
    Parser parser;

    auto a = parser.parse("exp(sin(x * 2)) + pi + E", "x");
    assert(a != nullptr);

    auto b = parser.parse("Abs(x)", "x");
    assert(b != nullptr);
    assert(b->type == ASTNodeType::FUNCTION_CALL);
    assert(b->value == "abs");

    auto c = parser.parse("pow(x, 2) + Heaviside(x) + ceiling(x) + sign(x)", "x");
    assert(c != nullptr);

    auto d = parser.parse("pow(x)", "x");
    assert(d == nullptr);
    assert(parser.get_error().find("requires exactly 2") != std::string::npos);

    auto e = parser.parse("pi * oo", "x");
    assert(e != nullptr);
    assert(!e->contains_variable());

    std::cout << "✓ test_functions_and_constants passed\n";
}

void test_rejected_input() {
    Parser parser;

    assert(parser.parse("y + 1", "x") == nullptr);
    assert(parser.get_error() == "Unknown symbol: y");

    assert(parser.parse("[?](x)", "x") == nullptr);
    assert(parser.get_error().find("Unexpected character") != std::string::npos);

    assert(parser.parse("", "x") == nullptr);
    assert(parser.get_error() == "Empty expression");

    assert(parser.parse("(x + 1", "x") == nullptr);
    assert(parser.parse("x +", "x") == nullptr);

    // Nesting is bounded by the fixed recursion limit
    const std::string nested = std::string(200, '(') + "x" + std::string(200, ')');
    assert(parser.parse(nested, "x") == nullptr);
    assert(parser.get_error().find("too deeply nested") != std::string::npos);

    std::cout << "✓ test_rejected_input passed\n";
}

void test_clone_and_equals() {
    Parser parser;
    auto a = parser.parse("sin(x)/x", "x");
    auto b = parser.parse("sin(x) / x", "x");
    auto c = parser.parse("cos(x)/x", "x");
    assert(a && b && c);

    assert(a->equals(*b));
    assert(!a->equals(*c));

    auto copy = a->clone();
    assert(copy->equals(*a));
    assert(copy->contains_variable());

    std::cout << "✓ test_clone_and_equals passed\n";
}

void test_compile() {
    Parser parser;
    Compiler compiler;

    auto ast = parser.parse("x + x * 2", "x");
    assert(ast != nullptr);

    auto program = compiler.compile(*ast, {"x"});
    assert(program != nullptr);
    assert(program->num_variables() == 1);
    assert(program->disassemble().find("LOAD_VAR") != std::string::npos);

    std::cout << "✓ test_compile passed\n";
}

std::string canonical_of(const std::string& text) {
    Parser parser;
    auto ast = parser.parse(text, "x");
    assert(ast != nullptr);
    return to_canonical(*ast);
}

std::string simplified(const std::string& text) {
    Parser parser;
    Simplifier simplifier;
    auto ast = parser.parse(text, "x");
    assert(ast != nullptr);
    return to_canonical(*simplifier.simplify(*ast));
}

void test_canonical_printing() {
    assert(canonical_of("x^2-1") == "x**2 - 1");
    assert(canonical_of("2*x+3") == "2*x + 3");
    assert(canonical_of("(x+1)/(x-1)") == "(x + 1)/(x - 1)");
    assert(canonical_of("-(x+1)") == "-(x + 1)");
    assert(canonical_of("x^(1/2)") == "x**(1/2)");
    assert(canonical_of("sin(x)/x") == "sin(x)/x");
    assert(canonical_of("x-(x-1)") == "x - (x - 1)");
    assert(canonical_of("pow(x,2)") == "pow(x, 2)");

    std::cout << "✓ test_canonical_printing passed\n";
}

void test_simplifier() {
    assert(simplified("x + 0") == "x");
    assert(simplified("x*1") == "x");
    assert(simplified("x - x") == "0");
    assert(simplified("x/x") == "1");
    assert(simplified("x*x") == "x**2");
    assert(simplified("2*x + 3*x") == "5*x");
    assert(simplified("x*2") == "2*x");
    assert(simplified("--x") == "x");
    assert(simplified("x + -3") == "x - 3");
    assert(simplified("6/4") == "3/2");
    assert(simplified("2^10") == "1024");
    assert(simplified("sqrt(16)") == "4");
    assert(simplified("sin(0) + cos(0)*x") == "x");
    assert(simplified("log(E)") == "1");
    assert(simplified("(x^2)^3") == "x**6");

    // No factor cancellation: the singularity survives
    assert(simplified("(x^2-1)/(x-1)") == "(x**2 - 1)/(x - 1)");

    std::cout << "✓ test_simplifier passed\n";
}

int main() {
    std::cout << "Running parser tests...\n";

    test_simple_expression();
    test_power_spellings();
    test_number_tokens();
    test_functions_and_constants();
    test_rejected_input();
    test_clone_and_equals();
    test_compile();
    test_canonical_printing();
    test_simplifier();

    std::cout << "\nAll parser tests passed!\n";
    return 0;
}
