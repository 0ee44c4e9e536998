#include "limcalc/limit_solver.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace limcalc {

namespace {

constexpr size_t kMaxExtrapolationOrder = 6;
constexpr size_t kMinExtrapolationWindow = 6;
constexpr size_t kRegimeChecks = 4;
constexpr double kAsymptoticRatio = 0.6;
constexpr double kAgreementFactor = 10.0;
constexpr double kRoundoff = 1e-15;
constexpr double kLipschitzBound = 1e4;
constexpr double kDivergenceRatio = 0.9;
constexpr double kGeometricRatio = 0.9;

// Consecutive finite samples starting at begin, capped at limit
size_t finite_run(const std::vector<double>& values,
                  const std::vector<bool>& valid,
                  size_t begin,
                  size_t limit) {
    size_t run = 0;
    while (begin + run < values.size() && run < limit &&
           valid[begin + run] && std::isfinite(values[begin + run])) {
        ++run;
    }
    return run;
}

// Once h is inside the neighbourhood where f is analytic in h, successive
// differences shrink by at least half per halving. Steps larger than the
// distance to a nearby singularity do not.
bool in_asymptotic_regime(const std::vector<double>& values, size_t begin, size_t length) {
    const size_t checks = std::min(kRegimeChecks, length - 2);
    for (size_t i = 0; i < checks; ++i) {
        const double d0 = std::abs(values[begin + i + 1] - values[begin + i]);
        const double d1 = std::abs(values[begin + i + 2] - values[begin + i + 1]);
        if (d0 == 0.0) {
            if (d1 != 0.0) {
                return false;
            }
            continue;
        }
        if (d1 > kAsymptoticRatio * d0) {
            return false;
        }
    }
    return true;
}

// Richardson table over values[begin, begin + length); reports the entry
// with the smallest error estimate
bool richardson(const std::vector<double>& values,
                size_t begin,
                size_t length,
                double& value,
                double& error) {
    std::vector<std::vector<double>> table(length);
    double best_error = std::numeric_limits<double>::infinity();
    double best_value = 0.0;

    for (size_t i = 0; i < length; ++i) {
        table[i].push_back(values[begin + i]);

        const size_t order = std::min(i, kMaxExtrapolationOrder);
        for (size_t j = 1; j <= order; ++j) {
            // Step halves each row, so the h^j error term scales by 2^j
            const double factor = std::ldexp(1.0, static_cast<int>(j)) - 1.0;
            const double next = table[i][j - 1] + (table[i][j - 1] - table[i - 1][j - 1]) / factor;
            table[i].push_back(next);

            const double estimate = std::max(std::abs(next - table[i][j - 1]),
                                             std::abs(next - table[i - 1][j - 1]));
            if (estimate < best_error) {
                best_error = estimate;
                best_value = next;
            }
        }
    }

    if (!std::isfinite(best_value) || !std::isfinite(best_error)) {
        return false;
    }
    value = best_value;
    error = best_error;
    return true;
}

} // namespace

LimitSolver::LimitSolver(const SolverSettings& settings) : settings_(settings) {}

bool LimitSolver::approach_point(const BytecodeProgram& program,
                                 VM& vm,
                                 double point,
                                 int side,
                                 OneSidedLimit& out) {
    error_message_.clear();

    if (program.num_variables() != 1) {
        error_message_ = "Limit requires a single-variable program";
        return false;
    }

    const double scale = std::max(1.0, std::abs(point));
    const size_t levels = settings_.sampling_levels;

    std::vector<double> steps(levels, 0.0);
    std::vector<double> values(levels, 0.0);
    std::vector<bool> valid(levels, false);

    for (size_t k = 0; k < levels; ++k) {
        const double h = settings_.initial_step * scale * std::ldexp(1.0, -static_cast<int>(k));
        const double x = point + static_cast<double>(side) * h;
        double y = 0.0;

        steps[k] = h;
        if (vm.execute(program, &x, 1, y) && !std::isnan(y)) {
            values[k] = y;
            valid[k] = true;
        }
    }

    return resolve(steps, values, valid, out);
}

bool LimitSolver::approach_infinity(const BytecodeProgram& program,
                                    VM& vm,
                                    int sign,
                                    OneSidedLimit& out) {
    error_message_.clear();

    if (program.num_variables() != 1) {
        error_message_ = "Limit requires a single-variable program";
        return false;
    }

    const size_t levels = settings_.sampling_levels;

    std::vector<double> steps(levels, 0.0);
    std::vector<double> values(levels, 0.0);
    std::vector<bool> valid(levels, false);

    // Substitute x = sign / t and let t -> 0+
    for (size_t k = 0; k < levels; ++k) {
        const double t = settings_.initial_step * std::ldexp(1.0, -static_cast<int>(k));
        const double x = static_cast<double>(sign) / t;
        double y = 0.0;

        steps[k] = t;
        if (vm.execute(program, &x, 1, y) && !std::isnan(y)) {
            values[k] = y;
            valid[k] = true;
        }
    }

    return resolve(steps, values, valid, out);
}

bool LimitSolver::resolve(const std::vector<double>& steps,
                          const std::vector<double>& values,
                          const std::vector<bool>& valid,
                          OneSidedLimit& out) {
    if (extrapolate(values, valid, out)) {
        return true;
    }
    return analyze_tail(steps, values, valid, out);
}

bool LimitSolver::extrapolate(const std::vector<double>& values,
                              const std::vector<bool>& valid,
                              OneSidedLimit& out) const {
    const size_t n = std::min(settings_.extrapolation_levels, values.size());
    const size_t min_window = std::min(n, kMinExtrapolationWindow);
    if (min_window < 3) {
        return false;
    }

    // Slide the window toward smaller steps. The first accepted window
    // anchors the result; later windows refine it only while they agree
    // with the current best, which rejects cancellation noise at tiny h.
    bool anchored = false;
    double best_value = 0.0;
    double best_error = std::numeric_limits<double>::infinity();

    for (size_t begin = 0; begin + min_window <= values.size(); ++begin) {
        const size_t length = finite_run(values, valid, begin, n);
        if (length < min_window || !in_asymptotic_regime(values, begin, length)) {
            continue;
        }

        double value = 0.0;
        double error = 0.0;
        if (!richardson(values, begin, length, value, error) ||
            error > settings_.tolerance * std::max(1.0, std::abs(value))) {
            continue;
        }

        if (!anchored) {
            anchored = true;
            best_value = value;
            best_error = error;
            continue;
        }

        const double difference = std::abs(value - best_value);
        const double agreement = std::max(kAgreementFactor * best_error,
                                          kRoundoff * std::max(1.0, std::abs(best_value)));
        if (difference > agreement) {
            continue;
        }
        const double combined = std::max(error, difference);
        if (combined < best_error) {
            best_value = value;
            best_error = combined;
        }
    }

    if (!anchored) {
        return false;
    }

    out.kind = OneSidedLimit::Kind::FINITE;
    out.value = best_value;
    out.error_estimate = best_error;
    return true;
}

bool LimitSolver::analyze_tail(const std::vector<double>& steps,
                               const std::vector<double>& values,
                               const std::vector<bool>& valid,
                               OneSidedLimit& out) {
    const size_t n = values.size();
    const size_t window = std::min(settings_.tail_window, n);
    if (window < 3) {
        error_message_ = "Not enough samples to resolve the limit";
        return false;
    }
    const size_t start = n - window;

    if (std::none_of(valid.begin(), valid.end(), [](bool v) { return v; })) {
        error_message_ = "Expression is undefined on this side of the approach point";
        return false;
    }
    for (size_t i = start; i < n; ++i) {
        if (!valid[i]) {
            error_message_ = "Expression is not defined arbitrarily close to the approach point";
            return false;
        }
    }

    // Overflow: the values themselves reached +/-inf
    bool any_infinite = false;
    bool all_infinite_positive = true;
    bool all_infinite_negative = true;
    for (size_t i = start; i < n; ++i) {
        if (std::isinf(values[i])) {
            any_infinite = true;
            if (values[i] > 0.0) {
                all_infinite_negative = false;
            } else {
                all_infinite_positive = false;
            }
        }
    }
    if (any_infinite) {
        if (std::isinf(values[n - 1]) && (all_infinite_positive || all_infinite_negative)) {
            out.kind = values[n - 1] > 0.0 ? OneSidedLimit::Kind::POSITIVE_INFINITY
                                           : OneSidedLimit::Kind::NEGATIVE_INFINITY;
            out.value = values[n - 1];
            out.error_estimate = 0.0;
            return true;
        }
        error_message_ = "Expression overflows inconsistently near the approach point";
        return false;
    }

    std::vector<double> diffs;
    diffs.reserve(window - 1);
    for (size_t i = start; i + 1 < n; ++i) {
        diffs.push_back(values[i + 1] - values[i]);
    }

    // Bounded difference quotients: the samples have already settled
    bool bounded = true;
    for (size_t i = 0; i < diffs.size(); ++i) {
        if (std::abs(diffs[i]) > kLipschitzBound * steps[start + i]) {
            bounded = false;
            break;
        }
    }
    if (bounded) {
        out.kind = OneSidedLimit::Kind::FINITE;
        out.value = values[n - 1];
        out.error_estimate = kLipschitzBound * steps[n - 1];
        return true;
    }

    const bool increasing = std::all_of(diffs.begin(), diffs.end(), [](double d) { return d > 0.0; });
    const bool decreasing = std::all_of(diffs.begin(), diffs.end(), [](double d) { return d < 0.0; });
    if (!increasing && !decreasing) {
        error_message_ = "Limit does not settle: the expression oscillates near the approach point";
        return false;
    }

    const double first_diff = std::abs(diffs.front());
    const double last_diff = std::abs(diffs.back());

    // Monotone steps that do not shrink: unbounded growth
    if (last_diff >= kDivergenceRatio * first_diff) {
        out.kind = increasing ? OneSidedLimit::Kind::POSITIVE_INFINITY
                              : OneSidedLimit::Kind::NEGATIVE_INFINITY;
        out.value = increasing ? std::numeric_limits<double>::infinity()
                               : -std::numeric_limits<double>::infinity();
        out.error_estimate = 0.0;
        return true;
    }

    // Geometric convergence: Aitken extrapolation of the tail
    const double ratio = std::pow(last_diff / first_diff, 1.0 / static_cast<double>(diffs.size() - 1));
    if (ratio <= kGeometricRatio) {
        const double last_value = values[n - 1];
        const double estimate = last_value + diffs.back() * ratio / (1.0 - ratio);

        const double local_ratio = diffs.back() / diffs[diffs.size() - 2];
        double local_estimate = estimate;
        if (local_ratio > 0.0 && local_ratio < 1.0) {
            local_estimate = last_value + diffs.back() * local_ratio / (1.0 - local_ratio);
        }

        out.kind = OneSidedLimit::Kind::FINITE;
        out.value = estimate;
        out.error_estimate = std::abs(estimate - local_estimate);
        return true;
    }

    error_message_ = "Limit could not be determined numerically (convergence too slow)";
    return false;
}

} // namespace limcalc
