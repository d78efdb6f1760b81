// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace rootfind {

/// Root-finding failure categories surfaced through expected results
enum class RootFindingErrorCode {
    // Configuration errors
    InvalidBounds,           ///< Bounds with lo >= hi or a non-finite end
    InvalidWindow,           ///< Scan window <= 0 or wider than the bounds
    InvalidTolerance,        ///< Canned convergence policy with a bad epsilon
    NotABracket,             ///< Endpoints do not straddle a sign change

    // Numerical errors
    MaxIterationsExceeded,   ///< Iteration cap reached before convergence
    DerivativeTooSmall,      ///< Step denominator too close to zero
    NonFinite                ///< NaN or Inf produced by f or by an iterate
};

/// Detailed root-finding error passed through the expected failure path
struct RootFindingError {
    RootFindingErrorCode code;

    /// Iterations completed before the failure (0 for precondition errors)
    size_t iterations = 0;

    /// Last x value tried, when one exists
    std::optional<double> last_value;
};

/// Stable name of an error code, for logs and test messages
std::string_view to_string(RootFindingErrorCode code) noexcept;

std::ostream& operator<<(std::ostream& os, RootFindingErrorCode code);

/// Output stream operator for RootFindingError
std::ostream& operator<<(std::ostream& os, const RootFindingError& err);

}  // namespace rootfind
