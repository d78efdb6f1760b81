// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/convergence_policy.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/math/naive_iteration.hpp"
#include "rootfind/math/root_finding.hpp"
#include "rootfind/support/rootfind_trace.h"
#include <cstddef>

namespace rootfind {

/// Find root using Newton-Raphson without safeguards
///
/// Iterates x_{n+1} = x_n - f(x_n) / f'(x_n) from a single guess. Quadratic
/// convergence near a simple root; nothing keeps the iterates near the
/// guess, so a poor guess may diverge, cycle or land on another root.
///
/// The policy sees (x_n, x_{n+1}, f(x_{n+1}), n + 1).
///
/// **Example:**
/// ```cpp
/// auto f = make_evaluator([](double x) { return x * x - 2.0; },
///                         [](double x) { return 2.0 * x; });
/// auto result = newton_raphson_naive(f, 1.0, 50, StepTolerance{.epsilon = 1e-12});
/// // result->root ~ 1.41421356
/// ```
///
/// @return Root, or NonFinite, DerivativeTooSmall or MaxIterationsExceeded
template<FirstDerivativeEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult newton_raphson_naive(const E& f, double x0,
                                       size_t max_iterations, const P& policy) {
    return detail::naive_iteration(f, x0, max_iterations, policy, MODULE_NEWTON_RAPHSON,
        [&f](double x, double f_x) {
            return NaiveStep{.numerator = f_x, .denominator = f.eval_d1(x)};
        });
}

}  // namespace rootfind
