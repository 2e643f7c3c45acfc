// SPDX-License-Identifier: MIT

// src/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace pg_typemap {

/// Error codes for mapping construction, literal generation and comparison.
enum class ErrorCode {
    // Shape
    UnsupportedRank,       ///< Operation needs a single-dimensional sequence
    UnsupportedShape,      ///< Sequence type does not match the element mapping

    // Comparison
    ComparerUnavailable,   ///< Mapping was built without a comparer (rank != 1)

    // Value
    InvalidValue,          ///< Boxed value is null or holds the wrong type
};

/// Error payload returned through std::expected.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "shape", "value").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedRank:
        case ErrorCode::UnsupportedShape:
            return "shape";
        case ErrorCode::ComparerUnavailable:
            return "comparison";
        case ErrorCode::InvalidValue:
            return "value";
    }
    return "unknown";
}

constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedRank: return "unsupported_rank";
        case ErrorCode::UnsupportedShape: return "unsupported_shape";
        case ErrorCode::ComparerUnavailable: return "comparer_unavailable";
        case ErrorCode::InvalidValue: return "invalid_value";
    }
    return "";
}

}  // namespace pg_typemap
