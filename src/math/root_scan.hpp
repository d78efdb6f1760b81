// SPDX-License-Identifier: MIT
/**
 * @file root_scan.hpp
 * @brief Find every detectable root of f over Bounds
 *
 * Chains the bracket generator with a bracketing solver: each bracket from
 * one scan pass is solved independently, and per-bracket failures are
 * reported alongside the successes rather than aborting the scan.
 */

#pragma once

#include "rootfind/math/bisection.hpp"
#include "rootfind/math/bounds.hpp"
#include "rootfind/math/bracket_generator.hpp"
#include "rootfind/math/false_position.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/math/root_finding.hpp"
#include <expected>
#include <string_view>
#include <vector>

namespace rootfind {

/// Bracketing method applied to each bracket of a scan
enum class BracketingMethod {
    Bisection,
    FalsePosition,
    Illinois
};

constexpr std::string_view to_string(BracketingMethod method) noexcept {
    switch (method) {
        case BracketingMethod::Bisection: return "Bisection";
        case BracketingMethod::FalsePosition: return "FalsePosition";
        case BracketingMethod::Illinois: return "Illinois";
    }
    return "Unknown";
}

/// One bracket of a scan and the outcome of solving it
struct RootScanEntry {
    Bracket bracket;
    RootFindingResult result;
};

/// Solve a single bracket with the chosen method
template<FunctionEvaluator E, ConvergencePolicy P>
[[nodiscard]] RootFindingResult solve_bracket(const E& f, const Bracket& bracket, BracketingMethod method,
                                size_t max_iterations, const P& policy) {
    switch (method) {
        case BracketingMethod::Bisection:
            return bisection(f, bracket, max_iterations, policy);
        case BracketingMethod::FalsePosition:
            return false_position(f, bracket, max_iterations, policy);
        case BracketingMethod::Illinois:
            break;
    }
    return false_position_illinois(f, bracket, max_iterations, policy);
}

/// Scan bounds in windows of window_size and solve every bracket found
///
/// Degenerate brackets (exact zeros on a window boundary) are returned as
/// roots with zero iterations. Entries appear in scan order, i.e. sorted by
/// bracket position.
///
/// @param f Evaluator, copied into the scan
/// @param bounds Search domain
/// @param window_size Scan window width, 0 < window_size <= bounds.width()
/// @param config Iteration cap and tolerances; both tolerances must hold
/// @param method Solver applied to each bracket
/// @return One entry per bracket, or InvalidTolerance / InvalidWindow
template<FunctionEvaluator E>
[[nodiscard]] std::expected<std::vector<RootScanEntry>, RootFindingError>
find_roots(const E& f, const Bounds& bounds, double window_size,
           const RootFindingConfig& config = {},
           BracketingMethod method = BracketingMethod::Illinois) {
    if (auto step = StepTolerance::create(config.step_tolerance); !step.has_value()) {
        return std::unexpected(step.error());
    }
    if (auto residual = FunctionTolerance::create(config.function_tolerance); !residual.has_value()) {
        return std::unexpected(residual.error());
    }
    const auto policy = convergence_policy(config);

    auto generator = make_bracket_generator(f, bounds, window_size);
    if (!generator.has_value()) {
        return std::unexpected(generator.error());
    }

    std::vector<RootScanEntry> entries;
    for (const Bracket& bracket : *generator) {
        entries.push_back(RootScanEntry{
            .bracket = bracket,
            .result = solve_bracket(f, bracket, method, config.max_iter, policy)
        });
    }
    return entries;
}

}  // namespace rootfind
