// SPDX-License-Identifier: MIT
/**
 * @file bracket_generator.hpp
 * @brief Lazy scan of Bounds for root-holding brackets
 *
 * The bounds are cut into consecutive windows of fixed width (the last one
 * clipped to hi) and f is evaluated at every window boundary. A window whose
 * boundary values are non-zero and of opposite sign becomes a Bracket; by the
 * intermediate value theorem it holds at least one root of a continuous f
 * (or a singularity of a discontinuous one).
 *
 * An exact zero on a boundary is reported once, as the degenerate bracket
 * [x, x], and does not also open a bracket in the following window.
 *
 * Known gaps, inherent to window scanning:
 * - Roots that touch the axis without crossing it (even multiplicity) are
 *   never detected.
 * - A window holding an even number of sign changes looks like no root.
 * - A window holding an odd number > 1 is reported as one bracket; a solver
 *   converges to one of its roots.
 */

#pragma once

#include "rootfind/math/bounds.hpp"
#include "rootfind/math/function_evaluator.hpp"
#include "rootfind/support/error_types.hpp"
#include "rootfind/support/rootfind_trace.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace rootfind {

/// Finite, restartable sequence of Brackets over Bounds
///
/// Iteration is lazy: f is evaluated only as far as needed to produce the
/// next bracket. Every begin() starts a fresh pass from bounds.lo(), so with
/// a deterministic evaluator all passes yield the same sequence.
///
/// The generator owns its evaluator; iterators refer back to the generator
/// and must not outlive it.
///
/// **Example:**
/// ```cpp
/// auto f = rootfind::make_evaluator([](double x) { return std::sin(x); });
/// auto bounds = rootfind::Bounds::create(-0.1, 6.3).value();
/// auto gen = rootfind::BracketGenerator<decltype(f)>::create(f, bounds, 0.1).value();
/// for (const rootfind::Bracket& b : gen) {
///     // [0, 0], [3.1, 3.2], [6.2, 6.3]
/// }
/// ```
template<FunctionEvaluator E>
class BracketGenerator {
public:
    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type = Bracket;
        using difference_type = std::ptrdiff_t;

        iterator() = default;

        const Bracket& operator*() const { return *current_; }
        const Bracket* operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const iterator& it, std::default_sentinel_t) {
            return !it.current_.has_value();
        }

    private:
        friend class BracketGenerator;

        explicit iterator(const BracketGenerator* gen)
            : gen_(gen)
            , a_(gen->bounds_.lo())
            , f_a_(gen->f_.eval(gen->bounds_.lo()))
        {
            ROOTFIND_TRACE_SCAN_START(gen_->bounds_.lo(), gen_->bounds_.hi(), gen_->window_);
            if (f_a_ == 0.0) {
                emit(BracketGenerator::make_bracket(a_, a_));
            } else {
                advance();
            }
        }

        void emit(Bracket bracket) {
            ROOTFIND_TRACE_BRACKET_FOUND(bracket.lo(), bracket.hi());
            current_ = bracket;
        }

        /// Scan forward to the next bracket, or mark the pass finished
        void advance() {
            current_.reset();
            const double lo = gen_->bounds_.lo();
            const double hi = gen_->bounds_.hi();

            while (a_ < hi) {
                ++windows_scanned_;
                // Boundaries from lo + k*w rather than repeated addition,
                // so rounding does not accumulate along the scan
                double b = std::min(lo + static_cast<double>(windows_scanned_) * gen_->window_, hi);
                if (!(b > a_)) {
                    b = hi;
                }
                const double f_b = gen_->f_.eval(b);

                std::optional<Bracket> found;
                if (f_b == 0.0) {
                    found = BracketGenerator::make_bracket(b, b);
                } else if (f_a_ != 0.0 && opposite_signs(f_a_, f_b)) {
                    found = BracketGenerator::make_bracket(a_, b);
                }

                a_ = b;
                f_a_ = f_b;

                if (found.has_value()) {
                    emit(*found);
                    return;
                }
            }
            ROOTFIND_TRACE_SCAN_COMPLETE(windows_scanned_);
        }

        const BracketGenerator* gen_ = nullptr;
        size_t windows_scanned_ = 0;
        double a_ = 0.0;
        double f_a_ = 0.0;
        std::optional<Bracket> current_;
    };

    /// Validated construction
    ///
    /// @param f Evaluator, copied into the generator
    /// @param bounds Search domain
    /// @param window_size Scan window width, 0 < window_size <= bounds.width()
    /// @return Generator, or InvalidWindow
    [[nodiscard]] static std::expected<BracketGenerator, RootFindingError>
    create(E f, const Bounds& bounds, double window_size) {
        if (!std::isfinite(window_size) || !(window_size > 0.0) ||
            window_size > bounds.width()) {
            ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_BRACKET_SCAN,
                                            static_cast<int>(RootFindingErrorCode::InvalidWindow),
                                            window_size, bounds.width());
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::InvalidWindow,
                .iterations = 0,
                .last_value = std::nullopt
            });
        }
        return BracketGenerator(std::move(f), bounds, window_size);
    }

    iterator begin() const { return iterator(this); }
    std::default_sentinel_t end() const noexcept { return {}; }

    /// Run one full pass and collect every bracket
    std::vector<Bracket> collect() const {
        std::vector<Bracket> brackets;
        for (const Bracket& bracket : *this) {
            brackets.push_back(bracket);
        }
        return brackets;
    }

    const Bounds& bounds() const noexcept { return bounds_; }
    double window_size() const noexcept { return window_; }

private:
    BracketGenerator(E f, const Bounds& bounds, double window_size)
        : f_(std::move(f)), bounds_(bounds), window_(window_size) {}

    static Bracket make_bracket(double lo, double hi) { return Bracket(lo, hi); }

    E f_;
    Bounds bounds_;
    double window_;
};

/// Deduces the evaluator type for BracketGenerator::create
template<FunctionEvaluator E>
[[nodiscard]] std::expected<BracketGenerator<E>, RootFindingError>
make_bracket_generator(E f, const Bounds& bounds, double window_size) {
    return BracketGenerator<E>::create(std::move(f), bounds, window_size);
}

}  // namespace rootfind
