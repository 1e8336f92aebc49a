//! # Serialization Side of the Structured-Data Model
//!
//! A `Serializer` is any consumer of structured-data events: a format writer,
//! a printer, or the buffer's own capture path. A type becomes serializable by
//! specializing `Serialize<T>`.
//!
//! ## Event Protocol
//!
//! | Shape | Calls |
//! |-------|-------|
//! | scalar | `serialize_bool`, `serialize_i32`, ... |
//! | text / bytes | `serialize_str` / `serialize_bytes` (or the `borrowed` forms) |
//! | optional | `serialize_none`, or `serialize_some` followed by one value |
//! | unit struct | `serialize_unit_struct(name)` |
//! | newtype struct | `serialize_newtype_struct(name)` followed by one value |
//! | sequence | `begin_seq(len)`, values..., `end_seq()` |
//! | tuple | `begin_tuple(len)`, values..., `end_tuple()` |
//! | tuple struct | `begin_tuple_struct(name, len)`, values..., `end_tuple_struct()` |
//! | map | `begin_map(len)`, key, value, key, value..., `end_map()` |
//! | struct | `begin_struct(name, len)`, (`serialize_field(key)`, value)..., `end_struct()` |
//! | unit variant | `serialize_unit_variant(name, index, variant)` |
//! | newtype variant | `serialize_newtype_variant(name, index, variant)` followed by one value |
//! | tuple variant | `begin_tuple_variant(...)`, values..., `end_tuple_variant()` |
//! | struct variant | `begin_struct_variant(...)`, (`serialize_field(key)`, value)..., `end_struct_variant()` |
//!
//! ## Borrowed Content
//!
//! `serialize_borrowed_str` hands over text that stays valid after the call.
//! The memory is kept alive by `anchor`; a null anchor means the text lives
//! inside the value being serialized. Consumers that do not retain content can
//! ignore the distinction: the default implementations forward to
//! `serialize_str` / `serialize_bytes`.
//!
//! ## Example
//!
//! ```cpp
//! struct Point { int32_t x; int32_t y; };
//!
//! template <> struct shapebuf::Serialize<Point> {
//!     static auto serialize(const Point& p, Serializer& s) -> Status {
//!         // begin_struct, serialize_field("x"), serialize_value(p.x, s), ...
//!     }
//! };
//! ```

#pragma once

#include "shapebuf/common.hpp"
#include "shapebuf/model/model_error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace shapebuf {

/// A read-only view of a byte sequence.
using ByteView = std::span<const std::byte>;

// ============================================================================
// Serializer
// ============================================================================

/// Consumer of structured-data events.
///
/// Every call returns a `Status`; the first error must abort the producer.
/// Counts passed to `begin_*` are declared counts; `std::nullopt` means the
/// producer does not know the count in advance.
class Serializer {
public:
    virtual ~Serializer() = default;

    // ========================================================================
    // Scalars
    // ========================================================================

    virtual auto serialize_bool(bool v) -> Status = 0;
    virtual auto serialize_i8(int8_t v) -> Status = 0;
    virtual auto serialize_i16(int16_t v) -> Status = 0;
    virtual auto serialize_i32(int32_t v) -> Status = 0;
    virtual auto serialize_i64(int64_t v) -> Status = 0;
    virtual auto serialize_u8(uint8_t v) -> Status = 0;
    virtual auto serialize_u16(uint16_t v) -> Status = 0;
    virtual auto serialize_u32(uint32_t v) -> Status = 0;
    virtual auto serialize_u64(uint64_t v) -> Status = 0;
    virtual auto serialize_f32(float v) -> Status = 0;
    virtual auto serialize_f64(double v) -> Status = 0;

    /// Serializes a single Unicode scalar value.
    virtual auto serialize_char(char32_t v) -> Status = 0;

    /// Serializes the unit value (no content).
    virtual auto serialize_unit() -> Status = 0;

    // ========================================================================
    // Text and Bytes
    // ========================================================================

    /// Serializes text that is only valid for the duration of the call.
    virtual auto serialize_str(std::string_view v) -> Status = 0;

    /// Serializes text whose memory is kept alive by `anchor`.
    ///
    /// A null `anchor` means the text lives inside the value being serialized.
    virtual auto serialize_borrowed_str(std::string_view v, const Anchor& anchor) -> Status {
        (void)anchor;
        return serialize_str(v);
    }

    /// Serializes bytes that are only valid for the duration of the call.
    virtual auto serialize_bytes(ByteView v) -> Status = 0;

    /// Serializes bytes whose memory is kept alive by `anchor`.
    virtual auto serialize_borrowed_bytes(ByteView v, const Anchor& anchor) -> Status {
        (void)anchor;
        return serialize_bytes(v);
    }

    // ========================================================================
    // Optional and Wrappers
    // ========================================================================

    virtual auto serialize_none() -> Status = 0;

    /// Announces a present optional; the next value is its content.
    virtual auto serialize_some() -> Status = 0;

    virtual auto serialize_unit_struct(std::string_view name) -> Status = 0;

    /// Announces a newtype struct; the next value is its content.
    virtual auto serialize_newtype_struct(std::string_view name) -> Status = 0;

    // ========================================================================
    // Containers
    // ========================================================================

    virtual auto begin_seq(std::optional<size_t> len) -> Status = 0;
    virtual auto end_seq() -> Status = 0;

    virtual auto begin_tuple(size_t len) -> Status = 0;
    virtual auto end_tuple() -> Status = 0;

    virtual auto begin_tuple_struct(std::string_view name, size_t len) -> Status = 0;
    virtual auto end_tuple_struct() -> Status = 0;

    virtual auto begin_map(std::optional<size_t> len) -> Status = 0;
    virtual auto end_map() -> Status = 0;

    virtual auto begin_struct(std::string_view name, size_t len) -> Status = 0;

    /// Names the next struct (or struct variant) field; its value follows.
    virtual auto serialize_field(std::string_view key) -> Status = 0;

    virtual auto end_struct() -> Status = 0;

    // ========================================================================
    // Enum Variants
    // ========================================================================

    virtual auto serialize_unit_variant(std::string_view name, uint32_t index,
                                        std::string_view variant) -> Status = 0;

    /// Announces a newtype variant; the next value is its content.
    virtual auto serialize_newtype_variant(std::string_view name, uint32_t index,
                                           std::string_view variant) -> Status = 0;

    virtual auto begin_tuple_variant(std::string_view name, uint32_t index,
                                     std::string_view variant, size_t len) -> Status = 0;
    virtual auto end_tuple_variant() -> Status = 0;

    virtual auto begin_struct_variant(std::string_view name, uint32_t index,
                                      std::string_view variant, size_t len) -> Status = 0;
    virtual auto end_struct_variant() -> Status = 0;
};

// ============================================================================
// Serialize Trait
// ============================================================================

/// Decomposes a `T` into `Serializer` events.
///
/// Specializations provide:
///
/// ```cpp
/// static auto serialize(const T& value, Serializer& s) -> Status;
/// ```
///
/// Implementations for standard library types live in `model_std.hpp`.
template <typename T, typename Enable = void> struct Serialize;

/// Serializes `value` through its `Serialize<T>` specialization.
template <typename T> auto serialize_value(const T& value, Serializer& s) -> Status {
    return Serialize<T>::serialize(value, s);
}

/// Serializes a struct field: `serialize_field(key)` followed by the value.
template <typename T>
auto serialize_field(Serializer& s, std::string_view key, const T& value) -> Status {
    auto status = s.serialize_field(key);
    if (is_err(status)) {
        return status;
    }
    return serialize_value(value, s);
}

} // namespace shapebuf
