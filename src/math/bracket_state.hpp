// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/bounds.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/support/error_types.hpp"
#include <cmath>
#include <expected>
#include <optional>

namespace rootfind {

/// Working copy of a bracket inside a bracketing solver
///
/// Holds both endpoints with their stored function values. Narrowing replaces
/// exactly one endpoint and keeps f_lo and f_hi of opposite sign; the
/// interval is never widened.
struct BracketState {
    enum class Side { Lower, Upper };

    double lo;
    double hi;
    double f_lo;
    double f_hi;

    double width() const noexcept { return hi - lo; }
    double midpoint() const noexcept { return interval_midpoint(lo, hi); }

    /// True while the endpoint values straddle a sign change
    bool holds_sign_change() const noexcept { return opposite_signs(f_lo, f_hi); }

    /// Endpoint with an exact zero, if any
    std::optional<double> endpoint_root() const noexcept {
        if (f_lo == 0.0) return lo;
        if (f_hi == 0.0) return hi;
        return std::nullopt;
    }

    /// Replace the endpoint whose value shares the sign of f_x
    ///
    /// Precondition: lo < x < hi, f_x finite and non-zero.
    /// @return The side that was replaced
    Side narrow(double x, double f_x) noexcept {
        if (opposite_signs(f_lo, f_x)) {
            hi = x;
            f_hi = f_x;
            return Side::Upper;
        }
        lo = x;
        f_lo = f_x;
        return Side::Lower;
    }
};

/// Evaluate the endpoints of a bracket before iterating
///
/// @return The initial state (possibly with an exact endpoint root), NonFinite
///         when f is not finite at an end, or NotABracket when the endpoint
///         values do not straddle a sign change
template<FunctionEvaluator E>
[[nodiscard]] std::expected<BracketState, RootFindingError> open_bracket(const E& f, const Bracket& bracket) {
    BracketState state{
        .lo = bracket.lo(),
        .hi = bracket.hi(),
        .f_lo = f.eval(bracket.lo()),
        .f_hi = f.eval(bracket.hi())
    };

    if (!std::isfinite(state.f_lo) || !std::isfinite(state.f_hi)) {
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::NonFinite,
            .iterations = 0,
            .last_value = std::isfinite(state.f_lo) ? state.hi : state.lo
        });
    }

    if (!state.endpoint_root().has_value() && !state.holds_sign_change()) {
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::NotABracket,
            .iterations = 0,
            .last_value = std::nullopt
        });
    }

    return state;
}

}  // namespace rootfind
