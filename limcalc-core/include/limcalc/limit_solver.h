#ifndef LIMCALC_LIMIT_SOLVER_H
#define LIMCALC_LIMIT_SOLVER_H

#include "bytecode.h"
#include "vm.h"
#include <string>
#include <vector>

namespace limcalc {

struct SolverSettings {
    double initial_step = 0.0625;     // h0, scaled by max(1, |a|) at finite points
    size_t extrapolation_levels = 12; // samples per Richardson window
    size_t sampling_levels = 34;      // total halvings of the step
    size_t tail_window = 12;          // samples inspected for divergence/convergence
    double tolerance = 1e-8;          // relative acceptance threshold
};

struct OneSidedLimit {
    enum class Kind {
        FINITE,
        POSITIVE_INFINITY,
        NEGATIVE_INFINITY
    };

    Kind kind = Kind::FINITE;
    double value = 0.0;
    double error_estimate = 0.0;
};

// Numerically resolves a one-sided limit of a single-variable program.
// The step h_k = h0 * 2^-k shrinks geometrically. Richardson tables over
// sliding windows of the samples handle functions analytic in h, starting
// wherever the steps have dropped below the distance to any nearby
// singularity; the tail of the sequence decides divergence, slow
// convergence or failure.
class LimitSolver {
public:
    explicit LimitSolver(const SolverSettings& settings = SolverSettings());

    // side = +1 approaches from above, -1 from below
    bool approach_point(const BytecodeProgram& program,
                        VM& vm,
                        double point,
                        int side,
                        OneSidedLimit& out);

    // sign = +1 for x -> +oo, -1 for x -> -oo
    bool approach_infinity(const BytecodeProgram& program,
                           VM& vm,
                           int sign,
                           OneSidedLimit& out);

    const std::string& get_error() const { return error_message_; }

private:
    bool resolve(const std::vector<double>& steps,
                 const std::vector<double>& values,
                 const std::vector<bool>& valid,
                 OneSidedLimit& out);

    bool extrapolate(const std::vector<double>& values,
                     const std::vector<bool>& valid,
                     OneSidedLimit& out) const;

    bool analyze_tail(const std::vector<double>& steps,
                      const std::vector<double>& values,
                      const std::vector<bool>& valid,
                      OneSidedLimit& out);

    SolverSettings settings_;
    std::string error_message_;
};

} // namespace limcalc

#endif // LIMCALC_LIMIT_SOLVER_H
