#ifndef LIMCALC_EVALUATOR_H
#define LIMCALC_EVALUATOR_H

#include "engine.h"
#include "options.h"
#include "types.h"
#include <string>

namespace limcalc {

// Formatted outcome of a limit or substitution. FAILED means the engine
// raised; UNDEFINED means the engine answered with a non-numeric value.
struct LimitValue {
    enum class Kind {
        INTEGER,
        RATIONAL,
        DECIMAL,
        POSITIVE_INFINITY,
        NEGATIVE_INFINITY,
        COMPLEX_INFINITY,
        UNDEFINED,
        NOT_A_NUMBER,
        FAILED
    };

    Kind kind = Kind::FAILED;
    double value = 0.0;
    std::string text;
    std::string error;  // engine message, kept for diagnostics only
    double error_estimate = 0.0;  // numeric uncertainty of a limit; 0 for substitutions

    bool is_finite() const {
        return kind == Kind::INTEGER || kind == Kind::RATIONAL || kind == Kind::DECIMAL;
    }
    bool is_infinite() const {
        return kind == Kind::POSITIVE_INFINITY || kind == Kind::NEGATIVE_INFINITY ||
               kind == Kind::COMPLEX_INFINITY;
    }
    bool failed() const { return kind == Kind::FAILED; }
};

const char* limit_kind_name(LimitValue::Kind kind);

class LimitEvaluator {
public:
    LimitEvaluator(const SymbolicEngine& engine, const AnalysisOptions& options = AnalysisOptions());

    // Never throws; engine errors become FAILED ("cannot compute")
    LimitValue evaluate_limit(const std::string& canonical,
                              const ApproachPoint& point,
                              Direction direction) const;

    // Direct substitution; any failure yields UNDEFINED
    LimitValue evaluate_at(const std::string& canonical, const ApproachPoint& point) const;

    LimitValue from_engine_value(const EngineValue& value) const;
    LimitValue failure(const std::string& message) const;

    // Finite values match when their display text matches or when they lie
    // within the comparison tolerance widened by both error estimates.
    // Sentinels compare by text; a FAILED value never equals anything
    bool limits_equal(const LimitValue& a, const LimitValue& b) const;

    const AnalysisOptions& options() const { return options_; }

private:
    LimitValue undefined() const;

    const SymbolicEngine& engine_;
    AnalysisOptions options_;
};

} // namespace limcalc

#endif // LIMCALC_EVALUATOR_H
