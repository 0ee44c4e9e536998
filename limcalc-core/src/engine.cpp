#include "limcalc/engine.h"
#include "limcalc/compiler.h"
#include "limcalc/simplify.h"
#include "limcalc/vm.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace limcalc {

namespace {

constexpr double kMaxSnapTolerance = 1e-9;
constexpr double kMinSnapTolerance = 1e-12;
constexpr double kSideAgreement = 1e-7;

const std::vector<std::string> kVariables = {"x"};

EngineValue from_double(double y) {
    if (std::isnan(y)) {
        return EngineValue::of_kind(EngineValue::Kind::NOT_A_NUMBER);
    }
    if (std::isinf(y)) {
        return EngineValue::of_kind(y > 0.0 ? EngineValue::Kind::POSITIVE_INFINITY
                                            : EngineValue::Kind::NEGATIVE_INFINITY);
    }
    return EngineValue::number(y);
}

} // namespace

Expression::Expression(std::unique_ptr<ASTNode> ast, std::unique_ptr<BytecodeProgram> program)
    : ast_(std::move(ast)), program_(std::move(program)) {}

NumericEngine::NumericEngine(const SolverSettings& settings) : settings_(settings) {}

std::unique_ptr<Expression> NumericEngine::build(std::unique_ptr<ASTNode> ast) const {
    Compiler compiler;
    auto program = compiler.compile(*ast, kVariables);
    if (!program) {
        throw EngineError(EngineErrorKind::PARSE, compiler.get_error());
    }
    return std::make_unique<Expression>(std::move(ast), std::move(program));
}

std::unique_ptr<Expression> NumericEngine::parse(const std::string& canonical) const {
    Parser parser;
    auto ast = parser.parse(canonical, "x");
    if (!ast) {
        throw EngineError(EngineErrorKind::PARSE, parser.get_error());
    }
    return build(std::move(ast));
}

std::unique_ptr<Expression> NumericEngine::simplify(const Expression& expr) const {
    Simplifier simplifier;
    return build(simplifier.simplify(expr.ast()));
}

EngineValue NumericEngine::substitute(const Expression& expr, double value) const {
    VM vm;
    double y = 0.0;
    if (!vm.execute(expr.program(), &value, 1, y)) {
        throw EngineError(EngineErrorKind::SUBSTITUTION, vm.get_error());
    }
    if (std::isnan(y)) {
        throw EngineError(EngineErrorKind::SUBSTITUTION, "Substitution produced NaN");
    }
    if (std::isinf(y)) {
        throw EngineError(EngineErrorKind::SUBSTITUTION, "Substitution overflowed");
    }
    return from_double(y);
}

EngineValue NumericEngine::constant_value(const Expression& expr) const {
    VM vm;
    const double unused = 0.0;
    double y = 0.0;
    if (!vm.execute(expr.program(), &unused, 1, y)) {
        throw EngineError(EngineErrorKind::LIMIT, vm.get_error());
    }
    EngineValue result = from_double(y);
    if (result.is_number()) {
        result.value = snap_rational(result.value, 0.0);
    }
    return result;
}

EngineValue NumericEngine::from_solver(const OneSidedLimit& limit) const {
    switch (limit.kind) {
        case OneSidedLimit::Kind::POSITIVE_INFINITY:
            return EngineValue::of_kind(EngineValue::Kind::POSITIVE_INFINITY);
        case OneSidedLimit::Kind::NEGATIVE_INFINITY:
            return EngineValue::of_kind(EngineValue::Kind::NEGATIVE_INFINITY);
        case OneSidedLimit::Kind::FINITE:
            break;
    }
    return EngineValue::number(snap_rational(limit.value, limit.error_estimate),
                               limit.error_estimate);
}

EngineValue NumericEngine::one_sided(const Expression& expr, double point, int side) const {
    LimitSolver solver(settings_);
    VM vm;
    OneSidedLimit result;
    if (!solver.approach_point(expr.program(), vm, point, side, result)) {
        throw EngineError(EngineErrorKind::LIMIT, solver.get_error());
    }
    return from_solver(result);
}

EngineValue NumericEngine::limit(const Expression& expr,
                                 const ApproachPoint& point,
                                 Direction direction) const {
    if (expr.is_constant()) {
        return constant_value(expr);
    }

    if (point.is_infinite()) {
        LimitSolver solver(settings_);
        VM vm;
        OneSidedLimit result;
        const int sign = point.kind == ApproachPoint::Kind::POSITIVE_INFINITY ? 1 : -1;
        if (!solver.approach_infinity(expr.program(), vm, sign, result)) {
            throw EngineError(EngineErrorKind::LIMIT, solver.get_error());
        }
        return from_solver(result);
    }

    switch (direction) {
        case Direction::LEFT:
            return one_sided(expr, point.value, -1);
        case Direction::RIGHT:
            return one_sided(expr, point.value, 1);
        case Direction::BOTH:
            break;
    }

    const EngineValue left = one_sided(expr, point.value, -1);
    const EngineValue right = one_sided(expr, point.value, 1);

    if (left.is_number() && right.is_number()) {
        const double scale = std::max({1.0, std::abs(left.value), std::abs(right.value)});
        if (std::abs(left.value - right.value) <= kSideAgreement * scale) {
            if (left.value == right.value) {
                return left;
            }
            const double error = std::max({left.error_estimate, right.error_estimate,
                                           std::abs(left.value - right.value)});
            return EngineValue::number(snap_rational(0.5 * (left.value + right.value), error),
                                       error);
        }
        return EngineValue::of_kind(EngineValue::Kind::UNDEFINED);
    }

    const bool left_infinite = left.kind == EngineValue::Kind::POSITIVE_INFINITY ||
                               left.kind == EngineValue::Kind::NEGATIVE_INFINITY;
    const bool right_infinite = right.kind == EngineValue::Kind::POSITIVE_INFINITY ||
                                right.kind == EngineValue::Kind::NEGATIVE_INFINITY;
    if (left_infinite && right_infinite) {
        if (left.kind == right.kind) {
            return left;
        }
        return EngineValue::of_kind(EngineValue::Kind::COMPLEX_INFINITY);
    }

    return EngineValue::of_kind(EngineValue::Kind::UNDEFINED);
}

double NumericEngine::to_float(const EngineValue& value) const {
    switch (value.kind) {
        case EngineValue::Kind::NUMBER:
            return value.value;
        case EngineValue::Kind::POSITIVE_INFINITY:
            return std::numeric_limits<double>::infinity();
        case EngineValue::Kind::NEGATIVE_INFINITY:
            return -std::numeric_limits<double>::infinity();
        default:
            break;
    }
    throw EngineError(EngineErrorKind::COERCION, "Value has no real numeric form");
}

std::string NumericEngine::to_string(const Expression& expr) const {
    return to_canonical(expr.ast());
}

double NumericEngine::snap_rational(double value, double error) const {
    const double tolerance = std::min(kMaxSnapTolerance,
                                      std::max(kMinSnapTolerance, 10.0 * error));
    if (!std::isfinite(value) || std::abs(value) > 1e12) {
        return value;
    }

    // Smallest denominator wins
    for (long long q = 1; q <= max_denominator_; ++q) {
        const double p = std::round(value * static_cast<double>(q));
        const double candidate = p / static_cast<double>(q);
        if (std::abs(value - candidate) <= tolerance) {
            return candidate == 0.0 ? 0.0 : candidate;
        }
    }
    return value;
}

} // namespace limcalc
