// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/convergence_policy.hpp"
#include "rootfind/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace rootfind {

/// Configuration for the root-finding entry points that take a config
///
/// The per-method solvers take (max_iterations, policy) directly; this is
/// the bundle used by find_roots() and by callers who want one set of
/// defaults for every method.
struct RootFindingConfig {
    /// Maximum iterations for any method
    size_t max_iter = 100;

    /// Absolute step tolerance |x_n - x_{n-1}|
    double step_tolerance = 1e-9;

    /// Absolute residual tolerance |f(x_n)|
    double function_tolerance = 1e-9;
};

/// Success result from root-finding methods
struct RootFindingSuccess {
    /// The root estimate (always finite)
    double root;

    /// Number of iterations performed (0 when an endpoint or guess was exact)
    size_t iterations;

    /// |f(root)|
    double residual;
};

/// Result from any root-finding method
///
/// Uses std::expected for type-safe error handling without exceptions.
/// Success case contains the root value and convergence diagnostics.
/// Error case contains detailed failure information.
using RootFindingResult = std::expected<RootFindingSuccess, RootFindingError>;

/// Policy used with a RootFindingConfig: both tolerances must hold
inline AllOf<StepTolerance, FunctionTolerance> convergence_policy(const RootFindingConfig& config) {
    return AllOf<StepTolerance, FunctionTolerance>(
        StepTolerance{.epsilon = config.step_tolerance},
        FunctionTolerance{.epsilon = config.function_tolerance});
}

}  // namespace rootfind
