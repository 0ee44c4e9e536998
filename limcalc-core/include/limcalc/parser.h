#ifndef LIMCALC_PARSER_H
#define LIMCALC_PARSER_H

#include <string>
#include <vector>
#include <memory>

namespace limcalc {

// Token types
enum class TokenType {
    NUMBER,
    IDENTIFIER,
    OPERATOR,
    LPAREN,
    RPAREN,
    COMMA,
    FUNCTION,
    END
};

struct Token {
    TokenType type;
    std::string value;
    size_t position;
};

// AST node types
enum class ASTNodeType {
    NUMBER,
    VARIABLE,
    CONSTANT,
    BINARY_OP,
    UNARY_OP,
    FUNCTION_CALL
};

struct ASTNode {
    ASTNodeType type;
    std::string value;
    std::vector<std::unique_ptr<ASTNode>> children;

    ASTNode(ASTNodeType t, std::string v = "") : type(t), value(std::move(v)) {}

    std::unique_ptr<ASTNode> clone() const;

    // Structural equality (same shape, same values)
    bool equals(const ASTNode& other) const;

    bool contains_variable() const;
};

// Names accepted by the canonical grammar
bool is_function_name(const std::string& name);
bool is_constant_name(const std::string& name);

// Expected argument count for a known function
size_t function_arity(const std::string& name);

class Parser {
public:
    Parser();

    // Parse canonical expression into AST. Power may be written as ** or ^.
    std::unique_ptr<ASTNode> parse(const std::string& expression,
                                   const std::string& variable);

    // Get error message if parsing failed
    const std::string& get_error() const { return error_message_; }

private:
    std::vector<Token> tokenize(const std::string& expression);
    std::unique_ptr<ASTNode> parse_expression(size_t& pos, size_t depth = 0);
    std::unique_ptr<ASTNode> parse_term(size_t& pos, size_t depth = 0);
    std::unique_ptr<ASTNode> parse_unary(size_t& pos, size_t depth = 0);
    std::unique_ptr<ASTNode> parse_power(size_t& pos, size_t depth = 0);
    std::unique_ptr<ASTNode> parse_primary(size_t& pos, size_t depth = 0);

    bool check_depth(size_t depth);

    std::vector<Token> tokens_;
    std::string variable_;
    std::string error_message_;
    size_t max_depth_ = 100;
};

} // namespace limcalc

#endif // LIMCALC_PARSER_H
