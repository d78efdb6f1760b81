// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/bounds.hpp"
#include "rootfind/math/bracket_state.hpp"
#include "rootfind/math/convergence_policy.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/math/root_finding.hpp"
#include "rootfind/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>
#include <limits>

namespace rootfind {

/// Iterations bisection needs to shrink a bracket of the given width below
/// target_width: ceil(log2(width / target_width))
///
/// Returns 0 when the bracket is already narrow enough, and the maximum
/// size_t value when the target is not positive.
[[nodiscard]] inline size_t bisection_iteration_bound(double width, double target_width) noexcept {
    if (!(target_width > 0.0)) {
        return std::numeric_limits<size_t>::max();
    }
    if (width <= target_width) {
        return 0;
    }
    return static_cast<size_t>(std::ceil(std::log2(width / target_width)));
}

/// Find root using the bisection method
///
/// Repeatedly halves the bracket, keeping the half whose endpoints still
/// straddle the sign change.
///
/// **Properties:**
/// - Converges for any valid bracket, regardless of the shape of f
/// - Linear convergence: width after k iterations is (hi - lo) / 2^k
/// - Iteration count for a target width is known in advance,
///   see bisection_iteration_bound()
///
/// The policy sees (previous midpoint, midpoint, f(midpoint), iteration).
/// On the first iteration the previous midpoint is bracket.lo(). The step
/// between successive midpoints equals the width of the narrowed bracket,
/// so a StepTolerance of epsilon returns a root within epsilon of a true
/// root.
///
/// @param f Evaluator
/// @param bracket Bracket validated against f
/// @param max_iterations Iteration cap
/// @param policy Convergence policy
/// @return Root, or NotABracket / NonFinite (before iterating) or
///         MaxIterationsExceeded
template<FunctionEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult bisection(const E& f, const Bracket& bracket,
                            size_t max_iterations, const P& policy) {
    ROOTFIND_TRACE_ALGO_START(MODULE_BISECTION, max_iterations, bracket.lo(), bracket.hi());

    auto opened = open_bracket(f, bracket);
    if (!opened.has_value()) {
        ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_BISECTION, static_cast<int>(opened.error().code),
                                          0, bracket.lo());
        return std::unexpected(opened.error());
    }
    BracketState state = *opened;

    if (auto exact = state.endpoint_root()) {
        ROOTFIND_TRACE_ALGO_COMPLETE(MODULE_BISECTION, 0, *exact);
        return RootFindingSuccess{.root = *exact, .iterations = 0, .residual = 0.0};
    }

    double prev_mid = state.lo;
    double mid = state.lo;

    for (size_t iter = 1; iter <= max_iterations; ++iter) {
        mid = state.midpoint();
        const double f_mid = f.eval(mid);
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_BISECTION, iter, mid, f_mid);

        if (!std::isfinite(f_mid)) {
            ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_BISECTION,
                                              static_cast<int>(RootFindingErrorCode::NonFinite),
                                              iter, mid);
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFinite,
                .iterations = iter,
                .last_value = mid
            });
        }

        if (f_mid == 0.0) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_BISECTION, iter, 0.0);
            ROOTFIND_TRACE_ALGO_COMPLETE(MODULE_BISECTION, iter, mid);
            return RootFindingSuccess{.root = mid, .iterations = iter, .residual = 0.0};
        }

        state.narrow(mid, f_mid);

        if (policy.is_converged(prev_mid, mid, f_mid, iter)) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_BISECTION, iter, std::abs(f_mid));
            ROOTFIND_TRACE_ALGO_COMPLETE(MODULE_BISECTION, iter, mid);
            return RootFindingSuccess{.root = mid, .iterations = iter, .residual = std::abs(f_mid)};
        }
        prev_mid = mid;
    }

    ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_BISECTION,
                                      static_cast<int>(RootFindingErrorCode::MaxIterationsExceeded),
                                      max_iterations, mid);
    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::MaxIterationsExceeded,
        .iterations = max_iterations,
        .last_value = mid
    });
}

}  // namespace rootfind
