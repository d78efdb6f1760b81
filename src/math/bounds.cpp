// SPDX-License-Identifier: MIT
#include "rootfind/math/bounds.hpp"
#include "rootfind/support/rootfind_trace.h"

namespace rootfind {

std::expected<Bounds, RootFindingError> Bounds::create(double lo, double hi) {
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
                                        static_cast<int>(RootFindingErrorCode::InvalidBounds),
                                        lo, hi);
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::InvalidBounds,
            .iterations = 0,
            .last_value = std::nullopt
        });
    }
    return Bounds(lo, hi);
}

std::ostream& operator<<(std::ostream& os, const Bounds& bounds) {
    return os << "Bounds[" << bounds.lo() << ", " << bounds.hi() << "]";
}

std::ostream& operator<<(std::ostream& os, const Bracket& bracket) {
    return os << "Bracket[" << bracket.lo() << ", " << bracket.hi() << "]";
}

}  // namespace rootfind
