#ifndef LIMCALC_SIMPLIFY_H
#define LIMCALC_SIMPLIFY_H

#include "parser.h"
#include <memory>
#include <string>

namespace limcalc {

// Prints an AST in the canonical grammar (x**2 - 1, 2*x, sqrt(x)).
// The output parses back to an equivalent tree.
std::string to_canonical(const ASTNode& node);

// Rule-based rewriting: integer constant folding, additive and
// multiplicative identities, like terms, exact elementary values.
// Common factors are never cancelled, so singularities survive.
class Simplifier {
public:
    Simplifier();

    std::unique_ptr<ASTNode> simplify(const ASTNode& node) const;


private:
    std::unique_ptr<ASTNode> rewrite(std::unique_ptr<ASTNode> node) const;
    std::unique_ptr<ASTNode> rewrite_sum(std::unique_ptr<ASTNode> node) const;
    std::unique_ptr<ASTNode> rewrite_product(std::unique_ptr<ASTNode> node) const;
    std::unique_ptr<ASTNode> rewrite_quotient(std::unique_ptr<ASTNode> node) const;
    std::unique_ptr<ASTNode> rewrite_power(std::unique_ptr<ASTNode> node) const;
    std::unique_ptr<ASTNode> rewrite_function(std::unique_ptr<ASTNode> node) const;

    size_t max_passes_ = 8;
};

} // namespace limcalc

#endif // LIMCALC_SIMPLIFY_H
