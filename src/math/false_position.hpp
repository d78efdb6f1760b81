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

namespace rootfind {

namespace detail {

/// Regula falsi over a BracketState, optionally with Illinois damping
///
/// The interpolation uses per-endpoint weights g_lo = f_lo * w_lo and
/// g_hi = f_hi * w_hi. Without damping both weights stay 1. With damping,
/// an endpoint retained for the second consecutive iteration has its weight
/// halved, and halved again on every further consecutive retention; the
/// weight resets to 1 when the endpoint is replaced. Stored f values are
/// never modified, so narrowing always uses exact signs.
template<FunctionEvaluator E, ConvergencePolicy P>
RootFindingResult regula_falsi(const E& f, const Bracket& bracket,
                               size_t max_iterations, const P& policy,
                               bool illinois, int module_id) {
    ROOTFIND_TRACE_ALGO_START(module_id, max_iterations, bracket.lo(), bracket.hi());

    auto opened = open_bracket(f, bracket);
    if (!opened.has_value()) {
        ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id, static_cast<int>(opened.error().code),
                                          0, bracket.lo());
        return std::unexpected(opened.error());
    }
    BracketState state = *opened;

    if (auto exact = state.endpoint_root()) {
        ROOTFIND_TRACE_ALGO_COMPLETE(module_id, 0, *exact);
        return RootFindingSuccess{.root = *exact, .iterations = 0, .residual = 0.0};
    }

    size_t retained_lo = 0;
    size_t retained_hi = 0;
    double weight_lo = 1.0;
    double weight_hi = 1.0;

    double x_prev = 0.0;
    double x = state.lo;

    for (size_t iter = 1; iter <= max_iterations; ++iter) {
        const double g_lo = state.f_lo * weight_lo;
        const double g_hi = state.f_hi * weight_hi;

        x = state.hi - g_hi * (state.hi - state.lo) / (g_hi - g_lo);
        // Rounding can land the secant point on or outside an endpoint
        if (!std::isfinite(x) || !(x > state.lo && x < state.hi)) {
            x = state.midpoint();
        }

        const double f_x = f.eval(x);
        ROOTFIND_TRACE_CONVERGENCE_ITER(module_id, iter, x, f_x);

        if (!std::isfinite(f_x)) {
            ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id,
                                              static_cast<int>(RootFindingErrorCode::NonFinite),
                                              iter, x);
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFinite,
                .iterations = iter,
                .last_value = x
            });
        }

        if (iter == 1) {
            // No previous iterate yet: measure the first step from the far end
            x_prev = (x - state.lo >= state.hi - x) ? state.lo : state.hi;
        }

        if (f_x == 0.0) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(module_id, iter, 0.0);
            ROOTFIND_TRACE_ALGO_COMPLETE(module_id, iter, x);
            return RootFindingSuccess{.root = x, .iterations = iter, .residual = 0.0};
        }

        if (state.narrow(x, f_x) == BracketState::Side::Upper) {
            retained_hi = 0;
            weight_hi = 1.0;
            ++retained_lo;
            if (illinois && retained_lo >= 2) {
                weight_lo *= 0.5;
            }
        } else {
            retained_lo = 0;
            weight_lo = 1.0;
            ++retained_hi;
            if (illinois && retained_hi >= 2) {
                weight_hi *= 0.5;
            }
        }

        if (policy.is_converged(x_prev, x, f_x, iter)) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(module_id, iter, std::abs(f_x));
            ROOTFIND_TRACE_ALGO_COMPLETE(module_id, iter, x);
            return RootFindingSuccess{.root = x, .iterations = iter, .residual = std::abs(f_x)};
        }
        x_prev = x;
    }

    ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id,
                                      static_cast<int>(RootFindingErrorCode::MaxIterationsExceeded),
                                      max_iterations, x);
    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::MaxIterationsExceeded,
        .iterations = max_iterations,
        .last_value = x
    });
}

}  // namespace detail

/// Find root using plain false position (regula falsi)
///
/// Each iteration takes the secant through the bracket endpoints and narrows
/// the bracket by the same sign rule as bisection. On functions convex or
/// concave across the bracket one endpoint is never replaced and convergence
/// degrades to slow linear; prefer false_position_illinois().
///
/// The policy sees (previous iterate, iterate, f(iterate), iteration). For
/// the first iteration the previous iterate is the bracket end farther from
/// the first iterate.
///
/// @return Root, or NotABracket / NonFinite (before iterating) or
///         MaxIterationsExceeded
template<FunctionEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult false_position(const E& f, const Bracket& bracket,
                                 size_t max_iterations, const P& policy) {
    return detail::regula_falsi(f, bracket, max_iterations, policy,
                                /*illinois=*/false, MODULE_FALSE_POSITION);
}

/// Find root using the Illinois variant of false position
///
/// Damps the interpolation weight of an endpoint retained two or more
/// iterations in a row, which pulls the secant point away from the stagnant
/// end and restores superlinear convergence.
///
/// Step-based policies can still fire early while one end is stagnant;
/// combining StepTolerance with FunctionTolerance via both() guards against
/// that.
///
/// Reference: Ford, J. A. (1995). "Improved algorithms of Illinois-type for
/// the numerical solution of nonlinear equations"
///
/// @return Root, or NotABracket / NonFinite (before iterating) or
///         MaxIterationsExceeded
template<FunctionEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult false_position_illinois(const E& f, const Bracket& bracket,
                                          size_t max_iterations, const P& policy) {
    return detail::regula_falsi(f, bracket, max_iterations, policy,
                                /*illinois=*/true, MODULE_ILLINOIS);
}

}  // namespace rootfind
