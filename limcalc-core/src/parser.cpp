#include "limcalc/parser.h"
#include <cctype>
#include <cmath>
#include <sstream>

namespace limcalc {

namespace {

struct FunctionInfo {
    const char* name;
    size_t arity;
};

const FunctionInfo kFunctions[] = {
    {"sin", 1}, {"cos", 1}, {"tan", 1}, {"cot", 1}, {"sec", 1}, {"csc", 1},
    {"asin", 1}, {"acos", 1}, {"atan", 1},
    {"exp", 1}, {"log", 1}, {"sqrt", 1}, {"abs", 1}, {"Abs", 1},
    {"sign", 1}, {"floor", 1}, {"ceiling", 1}, {"Heaviside", 1},
    {"pow", 2}
};

bool is_exponent_start(const std::string& text, size_t pos) {
    if (pos >= text.length() || (text[pos] != 'e' && text[pos] != 'E')) {
        return false;
    }
    size_t next = pos + 1;
    if (next < text.length() && (text[next] == '+' || text[next] == '-')) {
        ++next;
    }
    return next < text.length() && std::isdigit(static_cast<unsigned char>(text[next]));
}

} // namespace

bool is_function_name(const std::string& name) {
    for (const auto& fn : kFunctions) {
        if (name == fn.name) {
            return true;
        }
    }
    return false;
}

bool is_constant_name(const std::string& name) {
    return name == "pi" || name == "E" || name == "oo";
}

size_t function_arity(const std::string& name) {
    for (const auto& fn : kFunctions) {
        if (name == fn.name) {
            return fn.arity;
        }
    }
    return 0;
}

std::unique_ptr<ASTNode> ASTNode::clone() const {
    auto copy = std::make_unique<ASTNode>(type, value);
    for (const auto& child : children) {
        copy->children.push_back(child->clone());
    }
    return copy;
}

bool ASTNode::equals(const ASTNode& other) const {
    if (type != other.type || value != other.value ||
        children.size() != other.children.size()) {
        return false;
    }
    for (size_t i = 0; i < children.size(); ++i) {
        if (!children[i]->equals(*other.children[i])) {
            return false;
        }
    }
    return true;
}

bool ASTNode::contains_variable() const {
    if (type == ASTNodeType::VARIABLE) {
        return true;
    }
    for (const auto& child : children) {
        if (child->contains_variable()) {
            return true;
        }
    }
    return false;
}

Parser::Parser() {}

std::vector<Token> Parser::tokenize(const std::string& expression) {
    std::vector<Token> tokens;
    size_t pos = 0;

    while (pos < expression.length()) {
        const unsigned char ch = static_cast<unsigned char>(expression[pos]);

        // Skip whitespace
        if (std::isspace(ch)) {
            ++pos;
            continue;
        }

        // Numbers, with an optional exponent part (1e-5)
        if (std::isdigit(ch) || ch == '.') {
            size_t start = pos;
            while (pos < expression.length() &&
                   (std::isdigit(static_cast<unsigned char>(expression[pos])) ||
                    expression[pos] == '.')) {
                ++pos;
            }
            if (is_exponent_start(expression, pos)) {
                pos += (expression[pos + 1] == '+' || expression[pos + 1] == '-') ? 2 : 1;
                while (pos < expression.length() &&
                       std::isdigit(static_cast<unsigned char>(expression[pos]))) {
                    ++pos;
                }
            }
            tokens.push_back({TokenType::NUMBER, expression.substr(start, pos - start), start});
            continue;
        }

        // Identifiers and functions
        if (std::isalpha(ch) || ch == '_') {
            size_t start = pos;
            while (pos < expression.length() &&
                   (std::isalnum(static_cast<unsigned char>(expression[pos])) ||
                    expression[pos] == '_')) {
                ++pos;
            }
            std::string name = expression.substr(start, pos - start);

            if (is_function_name(name)) {
                tokens.push_back({TokenType::FUNCTION, name, start});
            } else {
                tokens.push_back({TokenType::IDENTIFIER, name, start});
            }
            continue;
        }

        // Operators and delimiters
        switch (expression[pos]) {
            case '*':
                if (pos + 1 < expression.length() && expression[pos + 1] == '*') {
                    tokens.push_back({TokenType::OPERATOR, "^", pos});
                    pos += 2;
                } else {
                    tokens.push_back({TokenType::OPERATOR, "*", pos});
                    ++pos;
                }
                break;
            case '+':
            case '-':
            case '/':
            case '^':
                tokens.push_back({TokenType::OPERATOR, std::string(1, expression[pos]), pos});
                ++pos;
                break;
            case '(':
                tokens.push_back({TokenType::LPAREN, "(", pos});
                ++pos;
                break;
            case ')':
                tokens.push_back({TokenType::RPAREN, ")", pos});
                ++pos;
                break;
            case ',':
                tokens.push_back({TokenType::COMMA, ",", pos});
                ++pos;
                break;
            default:
                error_message_ = "Unexpected character at position " + std::to_string(pos);
                return {};
        }
    }

    tokens.push_back({TokenType::END, "", expression.length()});
    return tokens;
}

std::unique_ptr<ASTNode> Parser::parse(const std::string& expression,
                                       const std::string& variable) {
    error_message_.clear();
    variable_ = variable;

    tokens_ = tokenize(expression);
    if (tokens_.empty()) {
        return nullptr;
    }

    if (tokens_.front().type == TokenType::END) {
        error_message_ = "Empty expression";
        return nullptr;
    }

    size_t pos = 0;
    auto result = parse_expression(pos, 0);

    if (result && tokens_[pos].type != TokenType::END) {
        error_message_ = "Unexpected tokens after expression at position " +
                         std::to_string(tokens_[pos].position);
        return nullptr;
    }

    return result;
}

bool Parser::check_depth(size_t depth) {
    if (depth >= max_depth_) {
        error_message_ = "Expression too deeply nested (max depth: " + std::to_string(max_depth_) + ")";
        return false;
    }
    return true;
}

std::unique_ptr<ASTNode> Parser::parse_expression(size_t& pos, size_t depth) {
    if (!check_depth(depth)) return nullptr;

    auto left = parse_term(pos, depth + 1);
    if (!left) return nullptr;

    while (pos < tokens_.size() && tokens_[pos].type == TokenType::OPERATOR &&
           (tokens_[pos].value == "+" || tokens_[pos].value == "-")) {
        std::string op = tokens_[pos].value;
        ++pos;

        auto right = parse_term(pos, depth + 1);
        if (!right) return nullptr;

        auto node = std::make_unique<ASTNode>(ASTNodeType::BINARY_OP, op);
        node->children.push_back(std::move(left));
        node->children.push_back(std::move(right));
        left = std::move(node);
    }

    return left;
}

std::unique_ptr<ASTNode> Parser::parse_term(size_t& pos, size_t depth) {
    if (!check_depth(depth)) return nullptr;

    auto left = parse_unary(pos, depth + 1);
    if (!left) return nullptr;

    while (pos < tokens_.size() && tokens_[pos].type == TokenType::OPERATOR &&
           (tokens_[pos].value == "*" || tokens_[pos].value == "/")) {
        std::string op = tokens_[pos].value;
        ++pos;

        auto right = parse_unary(pos, depth + 1);
        if (!right) return nullptr;

        auto node = std::make_unique<ASTNode>(ASTNodeType::BINARY_OP, op);
        node->children.push_back(std::move(left));
        node->children.push_back(std::move(right));
        left = std::move(node);
    }

    return left;
}

// Unary signs bind looser than power: -x**2 == -(x**2)
std::unique_ptr<ASTNode> Parser::parse_unary(size_t& pos, size_t depth) {
    if (!check_depth(depth)) return nullptr;

    if (tokens_[pos].type == TokenType::OPERATOR && tokens_[pos].value == "-") {
        ++pos;
        auto operand = parse_unary(pos, depth + 1);
        if (!operand) return nullptr;

        auto node = std::make_unique<ASTNode>(ASTNodeType::UNARY_OP, "-");
        node->children.push_back(std::move(operand));
        return node;
    }

    if (tokens_[pos].type == TokenType::OPERATOR && tokens_[pos].value == "+") {
        ++pos;
        return parse_unary(pos, depth + 1);
    }

    return parse_power(pos, depth + 1);
}

std::unique_ptr<ASTNode> Parser::parse_power(size_t& pos, size_t depth) {
    if (!check_depth(depth)) return nullptr;

    auto left = parse_primary(pos, depth + 1);
    if (!left) return nullptr;

    // Right-associative: x^y^z = x^(y^z)
    if (pos < tokens_.size() && tokens_[pos].type == TokenType::OPERATOR &&
        tokens_[pos].value == "^") {
        ++pos;

        auto right = parse_unary(pos, depth + 1);
        if (!right) return nullptr;

        auto node = std::make_unique<ASTNode>(ASTNodeType::BINARY_OP, "^");
        node->children.push_back(std::move(left));
        node->children.push_back(std::move(right));
        return node;
    }

    return left;
}

std::unique_ptr<ASTNode> Parser::parse_primary(size_t& pos, size_t depth) {
    if (!check_depth(depth)) return nullptr;

    if (pos >= tokens_.size() || tokens_[pos].type == TokenType::END) {
        error_message_ = "Unexpected end of expression";
        return nullptr;
    }

    // Numbers
    if (tokens_[pos].type == TokenType::NUMBER) {
        const std::string& text = tokens_[pos].value;
        if (text == "." || text.find('.') != text.rfind('.')) {
            error_message_ = "Malformed number: " + text;
            return nullptr;
        }
        auto node = std::make_unique<ASTNode>(ASTNodeType::NUMBER, text);
        ++pos;
        return node;
    }

    // Variable and named constants
    if (tokens_[pos].type == TokenType::IDENTIFIER) {
        const std::string& name = tokens_[pos].value;
        std::unique_ptr<ASTNode> node;
        if (name == variable_) {
            node = std::make_unique<ASTNode>(ASTNodeType::VARIABLE, name);
        } else if (is_constant_name(name)) {
            node = std::make_unique<ASTNode>(ASTNodeType::CONSTANT, name);
        } else {
            error_message_ = "Unknown symbol: " + name;
            return nullptr;
        }
        ++pos;
        return node;
    }

    // Functions
    if (tokens_[pos].type == TokenType::FUNCTION) {
        std::string func_name = tokens_[pos].value;
        ++pos;

        if (pos >= tokens_.size() || tokens_[pos].type != TokenType::LPAREN) {
            error_message_ = "Expected '(' after function name";
            return nullptr;
        }
        ++pos;

        // Abs is the canonical spelling of abs
        auto node = std::make_unique<ASTNode>(ASTNodeType::FUNCTION_CALL,
                                              func_name == "Abs" ? "abs" : func_name);

        // Parse arguments
        if (tokens_[pos].type != TokenType::RPAREN) {
            while (true) {
                auto arg = parse_expression(pos, depth + 1);
                if (!arg) return nullptr;
                node->children.push_back(std::move(arg));

                if (tokens_[pos].type == TokenType::RPAREN) {
                    break;
                } else if (tokens_[pos].type == TokenType::COMMA) {
                    ++pos;
                } else {
                    error_message_ = "Expected ',' or ')' in function call";
                    return nullptr;
                }
            }
        }
        ++pos; // consume ')'

        if (node->children.size() != function_arity(func_name)) {
            error_message_ = func_name + "() requires exactly " +
                             std::to_string(function_arity(func_name)) + " argument(s)";
            return nullptr;
        }

        return node;
    }

    // Parenthesized expression
    if (tokens_[pos].type == TokenType::LPAREN) {
        ++pos;
        auto node = parse_expression(pos, depth + 1);
        if (!node) return nullptr;

        if (pos >= tokens_.size() || tokens_[pos].type != TokenType::RPAREN) {
            error_message_ = "Expected closing parenthesis";
            return nullptr;
        }
        ++pos;
        return node;
    }

    error_message_ = "Unexpected token '" + tokens_[pos].value + "' at position " +
                     std::to_string(tokens_[pos].position);
    return nullptr;
}

} // namespace limcalc
