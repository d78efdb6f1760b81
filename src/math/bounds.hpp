// SPDX-License-Identifier: MIT
#pragma once

#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/support/error_types.hpp"
#include <cmath>
#include <expected>
#include <ostream>

namespace rootfind {

template<FunctionEvaluator E>
class BracketGenerator;

/// True when a and b are non-zero and of opposite sign
///
/// Compares signs directly instead of testing a * b < 0, which underflows to
/// zero for tiny magnitudes (1e-120 * -2e-300). NaN is never a sign change.
constexpr bool opposite_signs(double a, double b) noexcept {
    return (a < 0.0 && b > 0.0) || (a > 0.0 && b < 0.0);
}

/// Midpoint of [lo, hi] for finite lo <= hi
///
/// hi - lo overflows when the ends are near opposite extremes of the double
/// range; the halves are summed instead in that case.
inline double interval_midpoint(double lo, double hi) noexcept {
    const double width = hi - lo;
    if (std::isfinite(width)) {
        return lo + width * 0.5;
    }
    return lo * 0.5 + hi * 0.5;
}

/// Closed scan interval [lo, hi] with finite lo < hi
///
/// Represents the caller's full search domain. Immutable once constructed.
class Bounds {
public:
    /// Validated construction
    ///
    /// @return Bounds, or InvalidBounds when lo >= hi or either end is not finite
    [[nodiscard]] static std::expected<Bounds, RootFindingError> create(double lo, double hi);

    double lo() const noexcept { return lo_; }
    double hi() const noexcept { return hi_; }
    double width() const noexcept { return hi_ - lo_; }
    double middle() const noexcept { return interval_midpoint(lo_, hi_); }
    bool contains(double x) const noexcept { return x >= lo_ && x <= hi_; }

    bool operator==(const Bounds&) const = default;

private:
    Bounds(double lo, double hi) : lo_(lo), hi_(hi) {}

    double lo_;
    double hi_;
};

/// Root-containing interval [lo, hi]
///
/// Invariant: f(lo) and f(hi) have opposite signs, or one of them is exactly
/// zero. A degenerate bracket [a, a] holds an exact root found on a scan
/// boundary. Brackets only come from validated construction: create(), the
/// bracket generator, or a solver narrowing an existing bracket.
///
/// The invariant is relative to the evaluator the bracket was validated
/// against. Solvers re-evaluate the endpoints and report NotABracket if it
/// does not hold for their evaluator.
class Bracket {
public:
    /// Validate [lo, hi] against f
    ///
    /// @return Bracket, or InvalidBounds for lo > hi or non-finite ends,
    ///         NonFinite when f is not finite at an end, NotABracket when
    ///         there is no sign change and neither end is a root
    template<FunctionEvaluator E>
    [[nodiscard]] static std::expected<Bracket, RootFindingError> create(const E& f, double lo, double hi) {
        if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::InvalidBounds,
                .iterations = 0,
                .last_value = std::nullopt
            });
        }

        const double f_lo = f.eval(lo);
        const double f_hi = f.eval(hi);
        if (!std::isfinite(f_lo) || !std::isfinite(f_hi)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFinite,
                .iterations = 0,
                .last_value = std::isfinite(f_lo) ? hi : lo
            });
        }

        if (f_lo != 0.0 && f_hi != 0.0 && !opposite_signs(f_lo, f_hi)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NotABracket,
                .iterations = 0,
                .last_value = std::nullopt
            });
        }

        return Bracket(lo, hi);
    }

    double lo() const noexcept { return lo_; }
    double hi() const noexcept { return hi_; }
    double width() const noexcept { return hi_ - lo_; }
    double middle() const noexcept { return interval_midpoint(lo_, hi_); }
    bool contains(double x) const noexcept { return x >= lo_ && x <= hi_; }
    bool is_degenerate() const noexcept { return lo_ == hi_; }

    bool operator==(const Bracket&) const = default;

private:
    template<FunctionEvaluator E>
    friend class BracketGenerator;

    Bracket(double lo, double hi) : lo_(lo), hi_(hi) {}

    double lo_;
    double hi_;
};

std::ostream& operator<<(std::ostream& os, const Bounds& bounds);
std::ostream& operator<<(std::ostream& os, const Bracket& bracket);

}  // namespace rootfind
