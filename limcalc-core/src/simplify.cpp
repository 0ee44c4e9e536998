#include "limcalc/simplify.h"
#include <cmath>
#include <cstdlib>

namespace limcalc {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

bool integer_value(const ASTNode& node, long long& out) {
    if (node.type != ASTNodeType::NUMBER) {
        return false;
    }
    char* end = nullptr;
    const double value = std::strtod(node.value.c_str(), &end);
    if (end == node.value.c_str() || *end != '\0' || !std::isfinite(value) ||
        value != std::floor(value) || std::abs(value) >= kMaxExactInteger) {
        return false;
    }
    out = static_cast<long long>(value);
    return true;
}

bool is_number(const ASTNode& node, long long expected) {
    long long value = 0;
    return integer_value(node, value) && value == expected;
}

bool fits(double value) {
    return std::abs(value) < kMaxExactInteger;
}

long long gcd(long long a, long long b) {
    a = a < 0 ? -a : a;
    b = b < 0 ? -b : b;
    while (b != 0) {
        long long t = a % b;
        a = b;
        b = t;
    }
    return a;
}

std::unique_ptr<ASTNode> make_number(long long value) {
    return std::make_unique<ASTNode>(ASTNodeType::NUMBER, std::to_string(value));
}

std::unique_ptr<ASTNode> make_binary(const std::string& op,
                                     std::unique_ptr<ASTNode> left,
                                     std::unique_ptr<ASTNode> right) {
    auto node = std::make_unique<ASTNode>(ASTNodeType::BINARY_OP, op);
    node->children.push_back(std::move(left));
    node->children.push_back(std::move(right));
    return node;
}

std::unique_ptr<ASTNode> make_negation(std::unique_ptr<ASTNode> operand) {
    long long value = 0;
    if (integer_value(*operand, value)) {
        return make_number(-value);
    }
    if (operand->type == ASTNodeType::UNARY_OP && operand->value == "-") {
        return std::move(operand->children[0]);
    }
    auto node = std::make_unique<ASTNode>(ASTNodeType::UNARY_OP, "-");
    node->children.push_back(std::move(operand));
    return node;
}

// Splits c*rest into (c, rest); rest is null for a bare integer
const ASTNode* split_term(const ASTNode& node, long long& coefficient) {
    long long value = 0;
    if (integer_value(node, value)) {
        coefficient = value;
        return nullptr;
    }
    if (node.type == ASTNodeType::BINARY_OP && node.value == "*" &&
        integer_value(*node.children[0], value)) {
        coefficient = value;
        return node.children[1].get();
    }
    if (node.type == ASTNodeType::UNARY_OP && node.value == "-") {
        const ASTNode* rest = split_term(*node.children[0], coefficient);
        coefficient = -coefficient;
        return rest;
    }
    coefficient = 1;
    return &node;
}

std::unique_ptr<ASTNode> build_term(long long coefficient, const ASTNode& rest) {
    if (coefficient == 0) {
        return make_number(0);
    }
    if (coefficient == 1) {
        return rest.clone();
    }
    if (coefficient == -1) {
        return make_negation(rest.clone());
    }
    return make_binary("*", make_number(coefficient), rest.clone());
}

int precedence(const ASTNode& node) {
    switch (node.type) {
        case ASTNodeType::NUMBER:
            return (!node.value.empty() && node.value[0] == '-') ? 3 : 5;
        case ASTNodeType::UNARY_OP:
            return 3;
        case ASTNodeType::BINARY_OP:
            if (node.value == "+" || node.value == "-") return 1;
            if (node.value == "*" || node.value == "/") return 2;
            return 4;
        default:
            return 5;
    }
}

std::string wrap(const std::string& text) {
    return "(" + text + ")";
}

} // namespace

std::string to_canonical(const ASTNode& node) {
    switch (node.type) {
        case ASTNodeType::NUMBER:
        case ASTNodeType::VARIABLE:
        case ASTNodeType::CONSTANT:
            return node.value;

        case ASTNodeType::FUNCTION_CALL: {
            std::string out = node.value + "(";
            for (size_t i = 0; i < node.children.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += to_canonical(*node.children[i]);
            }
            return out + ")";
        }

        case ASTNodeType::UNARY_OP: {
            const ASTNode& child = *node.children[0];
            const int child_prec = precedence(child);
            const std::string inner = to_canonical(child);
            return "-" + ((child_prec == 1 || child_prec == 3) ? wrap(inner) : inner);
        }

        case ASTNodeType::BINARY_OP: {
            const ASTNode& left = *node.children[0];
            const ASTNode& right = *node.children[1];
            const int prec = precedence(node);
            const int left_prec = precedence(left);
            const int right_prec = precedence(right);

            std::string lhs = to_canonical(left);
            std::string rhs = to_canonical(right);

            if (node.value == "^") {
                if (left_prec <= 4) lhs = wrap(lhs);
                if (right_prec < 4) rhs = wrap(rhs);
                return lhs + "**" + rhs;
            }

            if (left_prec < prec) lhs = wrap(lhs);
            if (right_prec < prec || right_prec == 3 ||
                ((node.value == "-" || node.value == "/") && right_prec == prec)) {
                rhs = wrap(rhs);
            }

            if (node.value == "+" || node.value == "-") {
                return lhs + " " + node.value + " " + rhs;
            }
            return lhs + node.value + rhs;
        }
    }
    return node.value;
}

Simplifier::Simplifier() {}

std::unique_ptr<ASTNode> Simplifier::simplify(const ASTNode& node) const {
    auto current = node.clone();
    std::string printed = to_canonical(*current);

    // Rewrite to a fixed point; each pass is bottom-up
    for (size_t pass = 0; pass < max_passes_; ++pass) {
        current = rewrite(std::move(current));
        std::string next = to_canonical(*current);
        if (next == printed) {
            break;
        }
        printed = std::move(next);
    }
    return current;
}

std::unique_ptr<ASTNode> Simplifier::rewrite(std::unique_ptr<ASTNode> node) const {
    for (auto& child : node->children) {
        child = rewrite(std::move(child));
    }

    switch (node->type) {
        case ASTNodeType::UNARY_OP:
            return make_negation(std::move(node->children[0]));
        case ASTNodeType::BINARY_OP:
            if (node->value == "+" || node->value == "-") return rewrite_sum(std::move(node));
            if (node->value == "*") return rewrite_product(std::move(node));
            if (node->value == "/") return rewrite_quotient(std::move(node));
            if (node->value == "^") return rewrite_power(std::move(node));
            return node;
        case ASTNodeType::FUNCTION_CALL:
            return rewrite_function(std::move(node));
        default:
            return node;
    }
}

std::unique_ptr<ASTNode> Simplifier::rewrite_sum(std::unique_ptr<ASTNode> node) const {
    auto& a = node->children[0];
    auto& b = node->children[1];
    const bool minus = node->value == "-";

    long long x = 0;
    long long y = 0;
    if (integer_value(*a, x) && integer_value(*b, y)) {
        const double folded = minus ? static_cast<double>(x) - static_cast<double>(y)
                                    : static_cast<double>(x) + static_cast<double>(y);
        if (fits(folded)) {
            return make_number(static_cast<long long>(folded));
        }
    }

    if (is_number(*b, 0)) {
        return std::move(a);
    }
    if (is_number(*a, 0)) {
        return minus ? make_negation(std::move(b)) : std::move(b);
    }

    // a + (-b) -> a - b, a - (-b) -> a + b
    if (b->type == ASTNodeType::UNARY_OP && b->value == "-") {
        auto inner = std::move(b->children[0]);
        return make_binary(minus ? "+" : "-", std::move(a), std::move(inner));
    }
    if (integer_value(*b, y) && y < 0) {
        return make_binary(minus ? "+" : "-", std::move(a), make_number(-y));
    }

    // Like terms: 2*x + 3*x -> 5*x
    long long ca = 0;
    long long cb = 0;
    const ASTNode* ra = split_term(*a, ca);
    const ASTNode* rb = split_term(*b, cb);
    if (ra && rb && ra->equals(*rb)) {
        const double combined = minus ? static_cast<double>(ca) - static_cast<double>(cb)
                                      : static_cast<double>(ca) + static_cast<double>(cb);
        if (fits(combined)) {
            return build_term(static_cast<long long>(combined), *ra);
        }
    }

    return node;
}

std::unique_ptr<ASTNode> Simplifier::rewrite_product(std::unique_ptr<ASTNode> node) const {
    auto& a = node->children[0];
    auto& b = node->children[1];

    long long x = 0;
    long long y = 0;
    if (integer_value(*a, x) && integer_value(*b, y)) {
        const double folded = static_cast<double>(x) * static_cast<double>(y);
        if (fits(folded)) {
            return make_number(static_cast<long long>(folded));
        }
    }

    if (is_number(*a, 0) || is_number(*b, 0)) {
        return make_number(0);
    }
    if (is_number(*a, 1)) return std::move(b);
    if (is_number(*b, 1)) return std::move(a);
    if (is_number(*a, -1)) return make_negation(std::move(b));
    if (is_number(*b, -1)) return make_negation(std::move(a));

    // Coefficient first: x*2 -> 2*x
    if (b->type == ASTNodeType::NUMBER && a->type != ASTNodeType::NUMBER) {
        return make_binary("*", std::move(b), std::move(a));
    }

    // 2*(3*x) -> 6*x
    if (integer_value(*a, x) && b->type == ASTNodeType::BINARY_OP && b->value == "*" &&
        integer_value(*b->children[0], y)) {
        const double folded = static_cast<double>(x) * static_cast<double>(y);
        if (fits(folded)) {
            return make_binary("*", make_number(static_cast<long long>(folded)),
                               std::move(b->children[1]));
        }
    }

    if (a->equals(*b)) {
        return make_binary("^", std::move(a), make_number(2));
    }

    return node;
}

std::unique_ptr<ASTNode> Simplifier::rewrite_quotient(std::unique_ptr<ASTNode> node) const {
    auto& a = node->children[0];
    auto& b = node->children[1];

    long long x = 0;
    long long y = 0;
    if (integer_value(*a, x) && integer_value(*b, y) && y != 0) {
        const long long divisor = gcd(x, y);
        long long p = x / divisor;
        long long q = y / divisor;
        if (q < 0) {
            p = -p;
            q = -q;
        }
        if (q == 1) {
            return make_number(p);
        }
        if (divisor != 1 || y < 0) {
            return make_binary("/", make_number(p), make_number(q));
        }
        return node;
    }

    if (is_number(*b, 1)) return std::move(a);
    if (is_number(*b, -1)) return make_negation(std::move(a));

    if (integer_value(*b, y) && y != 0 && is_number(*a, 0)) {
        return make_number(0);
    }
    if (!is_number(*a, 0) && a->equals(*b)) {
        return make_number(1);
    }

    return node;
}

std::unique_ptr<ASTNode> Simplifier::rewrite_power(std::unique_ptr<ASTNode> node) const {
    auto& a = node->children[0];
    auto& b = node->children[1];

    long long x = 0;
    long long y = 0;
    if (integer_value(*a, x) && integer_value(*b, y) && y >= 0 && y <= 62) {
        double folded = 1.0;
        bool exact = true;
        for (long long i = 0; i < y && exact; ++i) {
            folded *= static_cast<double>(x);
            exact = fits(folded);
        }
        if (exact) {
            return make_number(static_cast<long long>(folded));
        }
    }

    if (is_number(*b, 1)) return std::move(a);
    if (is_number(*b, 0)) return make_number(1);
    if (is_number(*a, 1)) return make_number(1);

    // (u**m)**n -> u**(m*n) for integer exponents
    if (integer_value(*b, y) && a->type == ASTNodeType::BINARY_OP && a->value == "^" &&
        integer_value(*a->children[1], x)) {
        const double exponent = static_cast<double>(x) * static_cast<double>(y);
        if (fits(exponent)) {
            return make_binary("^", std::move(a->children[0]),
                               make_number(static_cast<long long>(exponent)));
        }
    }

    return node;
}

std::unique_ptr<ASTNode> Simplifier::rewrite_function(std::unique_ptr<ASTNode> node) const {
    if (node->children.size() != 1) {
        return node;
    }

    const std::string& name = node->value;
    const ASTNode& arg = *node->children[0];
    long long n = 0;

    if (is_number(arg, 0)) {
        if (name == "sin" || name == "tan" || name == "asin" || name == "atan" ||
            name == "abs" || name == "sign") {
            return make_number(0);
        }
        if (name == "cos" || name == "exp" || name == "sec") {
            return make_number(1);
        }
    }

    if (name == "log") {
        if (is_number(arg, 1)) return make_number(0);
        if (arg.type == ASTNodeType::CONSTANT && arg.value == "E") return make_number(1);
    }

    if (name == "sqrt" && integer_value(arg, n) && n >= 0) {
        const long long root = static_cast<long long>(std::llround(std::sqrt(static_cast<double>(n))));
        if (root * root == n) {
            return make_number(root);
        }
    }

    if (name == "abs" && integer_value(arg, n)) {
        return make_number(n < 0 ? -n : n);
    }

    return node;
}

} // namespace limcalc
