// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/convergence_policy.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/math/root_finding.hpp"
#include "rootfind/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>
#include <limits>

namespace rootfind {

/// Numerator and denominator of an open-method update x_new = x - num / den
struct NaiveStep {
    double numerator;
    double denominator;
};

/// True when the denominator of x - num / den is unusable
///
/// Rejects a non-finite, zero or subnormal denominator. A large but finite
/// step is taken as is; if it overflows the driver reports NonFinite.
[[nodiscard]] inline bool step_is_unstable(const NaiveStep& step) noexcept {
    const double den = step.denominator;
    return !std::isfinite(den) || std::abs(den) < std::numeric_limits<double>::min();
}

namespace detail {

/// Shared driver for the unsafeguarded open methods
///
/// `make_step(x, f_x)` returns the NaiveStep for the method. The driver owns
/// the failure taxonomy: NonFinite for a non-finite start, function value or
/// iterate; DerivativeTooSmall when step_is_unstable() holds, checked before
/// dividing; MaxIterationsExceeded. An iterate whose value is exactly zero is
/// returned as the root without a further step.
template<FunctionEvaluator E, ConvergencePolicy P, typename MakeStep>
RootFindingResult naive_iteration(const E& f, double x0, size_t max_iterations,
                                  const P& policy, int module_id, MakeStep make_step) {
    ROOTFIND_TRACE_ALGO_START(module_id, max_iterations, x0, x0);

    auto fail = [&](RootFindingErrorCode code, size_t iterations, double last_x)
        -> RootFindingResult {
        ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id, static_cast<int>(code), iterations, last_x);
        return std::unexpected(RootFindingError{
            .code = code,
            .iterations = iterations,
            .last_value = last_x
        });
    };

    if (!std::isfinite(x0)) {
        return fail(RootFindingErrorCode::NonFinite, 0, x0);
    }

    double x = x0;
    double f_x = f.eval(x);
    if (!std::isfinite(f_x)) {
        return fail(RootFindingErrorCode::NonFinite, 0, x);
    }
    if (f_x == 0.0) {
        ROOTFIND_TRACE_ALGO_COMPLETE(module_id, 0, x);
        return RootFindingSuccess{.root = x, .iterations = 0, .residual = 0.0};
    }

    for (size_t iter = 1; iter <= max_iterations; ++iter) {
        const NaiveStep step = make_step(x, f_x);
        if (step_is_unstable(step)) {
            return fail(RootFindingErrorCode::DerivativeTooSmall, iter - 1, x);
        }

        const double x_new = x - step.numerator / step.denominator;
        if (!std::isfinite(x_new)) {
            return fail(RootFindingErrorCode::NonFinite, iter, x_new);
        }

        const double f_new = f.eval(x_new);
        ROOTFIND_TRACE_CONVERGENCE_ITER(module_id, iter, x_new, f_new);
        if (!std::isfinite(f_new)) {
            return fail(RootFindingErrorCode::NonFinite, iter, x_new);
        }

        if (f_new == 0.0 || policy.is_converged(x, x_new, f_new, iter)) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(module_id, iter, std::abs(f_new));
            ROOTFIND_TRACE_ALGO_COMPLETE(module_id, iter, x_new);
            return RootFindingSuccess{.root = x_new, .iterations = iter, .residual = std::abs(f_new)};
        }

        x = x_new;
        f_x = f_new;
    }

    return fail(RootFindingErrorCode::MaxIterationsExceeded, max_iterations, x);
}

}  // namespace detail

}  // namespace rootfind
