//! # Capture Options
//!
//! Configuration of a capture: the nesting limit and whether text and bytes
//! may be borrowed from the source.
//!
//! ## Environment
//!
//! | Variable | Values | Effect |
//! |----------|--------|--------|
//! | `SHAPEBUF_MAX_DEPTH` | positive integer | Overrides `max_depth` |
//! | `SHAPEBUF_BORROW` | `prefer`, `copy` | Overrides `borrow` |
//!
//! Invalid values are ignored with a warning.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace shapebuf {

/// Whether the capture path may store references into the source.
enum class BorrowPolicy : uint8_t {
    PreferBorrow, ///< Borrow anchored content, copy the rest
    Copy          ///< Copy all content
};

/// Display name of a borrow policy ("prefer" or "copy").
[[nodiscard]] auto borrow_policy_name(BorrowPolicy policy) -> const char*;

/// Parses "prefer" or "copy".
[[nodiscard]] auto parse_borrow_policy(std::string_view s) -> std::optional<BorrowPolicy>;

/// Options controlling a capture.
struct CaptureOptions {
    /// Default nesting limit.
    static constexpr size_t DEFAULT_MAX_DEPTH = 128;

    /// Maximum number of open containers at any point of the capture.
    size_t max_depth = DEFAULT_MAX_DEPTH;

    BorrowPolicy borrow = BorrowPolicy::PreferBorrow;

    /// Default options with the environment overrides applied.
    [[nodiscard]] static auto from_env() -> CaptureOptions;

    /// Applies the environment overrides to these options.
    void apply_env();
};

} // namespace shapebuf
