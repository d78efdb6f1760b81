// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/support/error_types.hpp"
#include <cmath>
#include <concepts>
#include <cstddef>
#include <expected>
#include <utility>

namespace rootfind {

/// Concept for convergence policies
///
/// A policy is a pure predicate invoked once per solver iteration with the
/// previous iterate, the current iterate, f at the current iterate, and the
/// 1-based number of the iteration just completed. Returning true stops the
/// solver and returns the current iterate.
///
/// Solvers depend on this concept only; canned and user-defined policies are
/// treated identically.
template<typename P>
concept ConvergencePolicy = requires(const P& p, double prev_x, double cur_x,
                                     double f_cur_x, size_t iteration) {
    { p.is_converged(prev_x, cur_x, f_cur_x, iteration) } -> std::convertible_to<bool>;
};

/// Stop when successive iterates are close: |cur_x - prev_x| <= epsilon
///
/// Can stop prematurely far from a root when the method takes tiny steps,
/// e.g. Newton-Raphson under a huge derivative or false position stuck on
/// one endpoint.
struct StepTolerance {
    double epsilon = 1e-9;

    /// Validated construction: epsilon must be positive and finite
    [[nodiscard]] static std::expected<StepTolerance, RootFindingError> create(double epsilon) {
        if (!(epsilon > 0.0) || !std::isfinite(epsilon)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::InvalidTolerance,
                .iterations = 0,
                .last_value = epsilon
            });
        }
        return StepTolerance{.epsilon = epsilon};
    }

    bool is_converged(double prev_x, double cur_x, double /*f_cur_x*/,
                      size_t /*iteration*/) const noexcept {
        return std::abs(cur_x - prev_x) <= epsilon;
    }
};

/// Stop when the residual is small: |f(cur_x)| <= epsilon
///
/// For flat functions this can hold far from the root.
struct FunctionTolerance {
    double epsilon = 1e-9;

    /// Validated construction: epsilon must be non-negative and finite
    [[nodiscard]] static std::expected<FunctionTolerance, RootFindingError> create(double epsilon) {
        if (!(epsilon >= 0.0) || !std::isfinite(epsilon)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::InvalidTolerance,
                .iterations = 0,
                .last_value = epsilon
            });
        }
        return FunctionTolerance{.epsilon = epsilon};
    }

    bool is_converged(double /*prev_x*/, double /*cur_x*/, double f_cur_x,
                      size_t /*iteration*/) const noexcept {
        return std::abs(f_cur_x) <= epsilon;
    }
};

/// Logical AND of two policies
template<ConvergencePolicy A, ConvergencePolicy B>
class AllOf {
public:
    AllOf(A a, B b) : a_(std::move(a)), b_(std::move(b)) {}

    bool is_converged(double prev_x, double cur_x, double f_cur_x, size_t iteration) const {
        return a_.is_converged(prev_x, cur_x, f_cur_x, iteration) &&
               b_.is_converged(prev_x, cur_x, f_cur_x, iteration);
    }

private:
    A a_;
    B b_;
};

/// Logical OR of two policies
template<ConvergencePolicy A, ConvergencePolicy B>
class AnyOf {
public:
    AnyOf(A a, B b) : a_(std::move(a)), b_(std::move(b)) {}

    bool is_converged(double prev_x, double cur_x, double f_cur_x, size_t iteration) const {
        return a_.is_converged(prev_x, cur_x, f_cur_x, iteration) ||
               b_.is_converged(prev_x, cur_x, f_cur_x, iteration);
    }

private:
    A a_;
    B b_;
};

/// Converged when both policies agree
template<ConvergencePolicy A, ConvergencePolicy B>
AllOf<A, B> both(A a, B b) {
    return AllOf<A, B>(std::move(a), std::move(b));
}

/// Converged when either policy fires
template<ConvergencePolicy A, ConvergencePolicy B>
AnyOf<A, B> either(A a, B b) {
    return AnyOf<A, B>(std::move(a), std::move(b));
}

/// Step or residual tolerance, whichever fires first
using CombinedTolerance = AnyOf<StepTolerance, FunctionTolerance>;

inline CombinedTolerance combined_tolerance(double step_epsilon, double function_epsilon) {
    return CombinedTolerance(StepTolerance{.epsilon = step_epsilon},
                             FunctionTolerance{.epsilon = function_epsilon});
}

/// Adapts a callable bool(prev_x, cur_x, f_cur_x, iteration) into a policy
template<typename F>
    requires std::predicate<const F&, double, double, double, size_t>
class CustomPolicy {
public:
    explicit CustomPolicy(F f) : f_(std::move(f)) {}

    bool is_converged(double prev_x, double cur_x, double f_cur_x, size_t iteration) const {
        return static_cast<bool>(f_(prev_x, cur_x, f_cur_x, iteration));
    }

private:
    F f_;
};

template<typename F>
    requires std::predicate<const F&, double, double, double, size_t>
CustomPolicy<F> make_policy(F f) {
    return CustomPolicy<F>(std::move(f));
}

}  // namespace rootfind
