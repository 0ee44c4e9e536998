#ifndef LIMCALC_ENGINE_H
#define LIMCALC_ENGINE_H

#include "bytecode.h"
#include "errors.h"
#include "limit_solver.h"
#include "parser.h"
#include "types.h"
#include <memory>
#include <string>

namespace limcalc {

// Parsed form of a canonical expression: the AST and its compiled program
class Expression {
public:
    Expression(std::unique_ptr<ASTNode> ast, std::unique_ptr<BytecodeProgram> program);

    const ASTNode& ast() const { return *ast_; }
    const BytecodeProgram& program() const { return *program_; }

    bool is_constant() const { return !ast_->contains_variable(); }

private:
    std::unique_ptr<ASTNode> ast_;
    std::unique_ptr<BytecodeProgram> program_;
};

// Raw value returned by an engine before formatting
struct EngineValue {
    enum class Kind {
        NUMBER,
        POSITIVE_INFINITY,
        NEGATIVE_INFINITY,
        COMPLEX_INFINITY,  // unsigned infinity (sides diverge with opposite signs)
        UNDEFINED,         // limit does not exist (sides disagree)
        NOT_A_NUMBER
    };

    Kind kind = Kind::NUMBER;
    double value = 0.0;
    double error_estimate = 0.0;

    static EngineValue number(double v, double error = 0.0) {
        return EngineValue{Kind::NUMBER, v, error};
    }
    static EngineValue of_kind(Kind k) { return EngineValue{k, 0.0, 0.0}; }

    bool is_number() const { return kind == Kind::NUMBER; }
};

// Capability boundary for symbolic mathematics. Implementations raise
// EngineError on failure.
class SymbolicEngine {
public:
    virtual ~SymbolicEngine() = default;

    virtual std::unique_ptr<Expression> parse(const std::string& canonical) const = 0;
    virtual std::unique_ptr<Expression> simplify(const Expression& expr) const = 0;
    virtual EngineValue substitute(const Expression& expr, double value) const = 0;

    // Direction is ignored when the point is infinite
    virtual EngineValue limit(const Expression& expr,
                              const ApproachPoint& point,
                              Direction direction) const = 0;

    virtual double to_float(const EngineValue& value) const = 0;
    virtual std::string to_string(const Expression& expr) const = 0;
};

// Engine built on the parser, bytecode VM and numeric limit solver
class NumericEngine : public SymbolicEngine {
public:
    explicit NumericEngine(const SolverSettings& settings = SolverSettings());

    std::unique_ptr<Expression> parse(const std::string& canonical) const override;
    std::unique_ptr<Expression> simplify(const Expression& expr) const override;
    EngineValue substitute(const Expression& expr, double value) const override;
    EngineValue limit(const Expression& expr,
                      const ApproachPoint& point,
                      Direction direction) const override;
    double to_float(const EngineValue& value) const override;
    std::string to_string(const Expression& expr) const override;

    // Largest denominator tried when recognizing exact rationals
    void set_max_denominator(long long denominator) { max_denominator_ = denominator; }

private:
    EngineValue one_sided(const Expression& expr, double point, int side) const;
    EngineValue constant_value(const Expression& expr) const;
    EngineValue from_solver(const OneSidedLimit& limit) const;
    double snap_rational(double value, double error) const;

    std::unique_ptr<Expression> build(std::unique_ptr<ASTNode> ast) const;

    SolverSettings settings_;
    long long max_denominator_ = 1000;
};

} // namespace limcalc

#endif // LIMCALC_ENGINE_H
