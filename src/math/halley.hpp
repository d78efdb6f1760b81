// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/convergence_policy.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/math/naive_iteration.hpp"
#include "rootfind/math/root_finding.hpp"
#include "rootfind/support/rootfind_trace.h"
#include <cstddef>

namespace rootfind {

/// Find root using Halley's method without safeguards
///
/// x_{n+1} = x_n - 2 f f' / (2 f'^2 - f f''). Cubic convergence near a
/// simple root at the price of a second derivative per iteration. The
/// stability check applies to the denominator 2 f'^2 - f f''.
///
/// The policy sees (x_n, x_{n+1}, f(x_{n+1}), n + 1).
///
/// @return Root, or NonFinite, DerivativeTooSmall or MaxIterationsExceeded
template<SecondDerivativeEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult halley_naive(const E& f, double x0,
                               size_t max_iterations, const P& policy) {
    return detail::naive_iteration(f, x0, max_iterations, policy, MODULE_HALLEY,
        [&f](double x, double f_x) {
            const double d1 = f.eval_d1(x);
            const double d2 = f.eval_d2(x);
            return NaiveStep{
                .numerator = 2.0 * f_x * d1,
                .denominator = 2.0 * d1 * d1 - f_x * d2
            };
        });
}

}  // namespace rootfind
