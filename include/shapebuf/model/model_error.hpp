//! # Error Types
//!
//! Errors of the structured-data model and of the two buffer traversals.
//!
//! ## Overview
//!
//! | Type | Raised by | Meaning |
//! |------|-----------|---------|
//! | `Error` | producers, consumers, the replay path | A protocol-level failure |
//! | `CaptureError` | `Buffer::capture*`, `BufferBuilder::build` | Capture aborted, no buffer |
//! | `ReplayError` | `Buffer::replay*`, `Buffer::deserialize` | Replay aborted mid-way |
//!
//! Producers and consumers exchange `Error` values through `Status` returns.
//! At the buffer boundary they are classified into `CaptureError` or
//! `ReplayError`, keeping the original message verbatim.
//!
//! ## Example
//!
//! ```cpp
//! auto result = buffer.deserialize<std::string>();
//! if (is_err(result)) {
//!     const ReplayError& error = unwrap_err(result);
//!     // error.kind == ReplayError::Kind::ShapeMismatch
//!     // error.expected == "string", error.found == "i32"
//! }
//! ```

#pragma once

#include "shapebuf/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace shapebuf {

// ============================================================================
// Protocol Error
// ============================================================================

/// Classification of a protocol `Error`.
enum class ErrorCode : uint8_t {
    Custom,         ///< Reported by producer or consumer code
    ShapeMismatch,  ///< A value had a different shape than requested
    UnknownVariant, ///< An enum variant the consumer does not know
    InvalidLength,  ///< A container had an unexpected number of elements
    MissingValue    ///< A map value was requested before its key
};

/// An error raised while producing or consuming structured data.
///
/// For `ShapeMismatch` the `expected` and `found` fields name the two shapes,
/// e.g. `expected = "string"`, `found = "i32"`.
struct Error {
    ErrorCode code = ErrorCode::Custom;

    /// Human-readable error description.
    std::string message;

    /// The shape the consumer asked for (ShapeMismatch only).
    std::string expected;

    /// The shape actually present (ShapeMismatch only).
    std::string found;

    /// Creates a free-form error, typically from user producer/consumer code.
    static auto custom(std::string msg) -> Error;

    /// Creates a shape mismatch error.
    ///
    /// # Arguments
    ///
    /// * `found` - The shape that was present
    /// * `expected` - The shape the consumer wanted
    static auto invalid_type(std::string found, std::string expected) -> Error;

    /// Creates an unknown-variant error for enum `enum_name`.
    static auto unknown_variant(std::string_view enum_name, uint32_t index,
                                std::string_view variant) -> Error;

    /// Creates an invalid-length error.
    static auto invalid_length(size_t len, std::string expected) -> Error;

    /// Creates the error for a map value requested without a preceding key.
    static auto missing_value() -> Error;

    /// Formats the error for display.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Result of a protocol call that has no value of its own.
///
/// Success holds `true`.
using Status = Result<bool, Error>;

/// The success value of `Status`.
inline auto ok() -> Status {
    return true;
}

// ============================================================================
// Capture Error
// ============================================================================

/// Why a capture failed.
struct CaptureError {
    enum class Kind : uint8_t {
        DepthExceeded,  ///< Nesting deeper than the configured maximum
        LengthOverflow, ///< A count or payload does not fit the token encoding
        SourceFailed    ///< The producer reported a failure
    };

    Kind kind = Kind::SourceFailed;

    /// Description; for `SourceFailed` the producer's message verbatim.
    std::string message;

    /// The depth limit in effect (DepthExceeded only).
    size_t max_depth = 0;

    /// The producer's error as reported (SourceFailed only).
    Error source;

    static auto depth_exceeded(size_t max_depth) -> CaptureError;
    static auto length_overflow(size_t length) -> CaptureError;
    static auto source_failed(const Error& error) -> CaptureError;

    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Replay Error
// ============================================================================

/// Why a replay failed.
struct ReplayError {
    enum class Kind : uint8_t {
        ShapeMismatch,  ///< Hinted request disagreed with the recorded shape
        UnknownVariant, ///< Recorded variant matches none the consumer knows
        ConsumerFailed  ///< The consumer reported a failure
    };

    Kind kind = Kind::ConsumerFailed;

    /// Requested shape (ShapeMismatch only).
    std::string expected;

    /// Recorded shape (ShapeMismatch only).
    std::string found;

    /// Description; for `ConsumerFailed` the consumer's message verbatim.
    std::string message;

    /// The protocol error the replay stopped on, code included.
    Error source;

    /// Classifies a protocol error surfacing from a replay traversal.
    static auto from_error(const Error& error) -> ReplayError;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Display name of a capture error kind (e.g. "depth exceeded").
auto kind_name(CaptureError::Kind kind) -> const char*;

/// Display name of a replay error kind (e.g. "shape mismatch").
auto kind_name(ReplayError::Kind kind) -> const char*;

} // namespace shapebuf
