// SPDX-License-Identifier: MIT
#include "rootfind/support/error_types.hpp"

namespace rootfind {

std::string_view to_string(RootFindingErrorCode code) noexcept {
    switch (code) {
        case RootFindingErrorCode::InvalidBounds:
            return "InvalidBounds";
        case RootFindingErrorCode::InvalidWindow:
            return "InvalidWindow";
        case RootFindingErrorCode::InvalidTolerance:
            return "InvalidTolerance";
        case RootFindingErrorCode::NotABracket:
            return "NotABracket";
        case RootFindingErrorCode::MaxIterationsExceeded:
            return "MaxIterationsExceeded";
        case RootFindingErrorCode::DerivativeTooSmall:
            return "DerivativeTooSmall";
        case RootFindingErrorCode::NonFinite:
            return "NonFinite";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, RootFindingErrorCode code) {
    return os << to_string(code);
}

std::ostream& operator<<(std::ostream& os, const RootFindingError& err) {
    os << "RootFindingError{code=" << err.code
       << ", iterations=" << err.iterations;
    if (err.last_value.has_value()) {
        os << ", last_value=" << *err.last_value;
    }
    os << "}";
    return os;
}

}  // namespace rootfind
