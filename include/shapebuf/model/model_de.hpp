//! # Deserialization Side of the Structured-Data Model
//!
//! A `Deserializer` produces structured data on request of a consumer. The
//! consumer either asks for "whatever comes next" (`deserialize_any`, the
//! self-describing mode) or states the shape it expects (`deserialize_str`,
//! `deserialize_struct`, ...). In both cases the deserializer answers by
//! calling one method of the consumer's `Visitor`.
//!
//! ## Access Interfaces
//!
//! | Interface | Handed to | Iterates |
//! |-----------|-----------|----------|
//! | `SeqAccess` | `Visitor::visit_seq` | elements of a sequence, tuple or tuple struct |
//! | `MapAccess` | `Visitor::visit_map` | key/value entries of a map, fields of a struct |
//! | `EnumAccess` | `Visitor::visit_enum` | the variant and its payload |
//!
//! Elements are returned as `Deserializer*` that stay valid until the next
//! call on the access object. A null pointer marks the end.
//!
//! ## Example
//!
//! ```cpp
//! class PointVisitor : public Visitor {
//! public:
//!     Point value;
//!     auto expecting() const -> std::string override { return "struct Point"; }
//!     auto visit_map(MapAccess& map) -> Status override {
//!         while (true) {
//!             auto key = next_key<std::string>(map);
//!             // ...
//!         }
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
#include <string>
#include <string_view>
#include <utility>

namespace shapebuf {

class Deserializer;
class SeqAccess;
class MapAccess;
class EnumAccess;

// ============================================================================
// Visitor
// ============================================================================

/// Consumer of exactly one value produced by a `Deserializer`.
///
/// Every `visit_*` method defaults to rejecting the value with a shape
/// mismatch that names `expecting()`. Narrow integer visits forward to the
/// 64-bit ones, `visit_f32` forwards to `visit_f64`, and the borrowed text and
/// byte visits forward to the transient ones, so a visitor only overrides the
/// widest form it accepts.
class Visitor {
public:
    virtual ~Visitor() = default;

    /// Describes what the visitor accepts (e.g. "a string", "struct Point").
    [[nodiscard]] virtual auto expecting() const -> std::string = 0;

    virtual auto visit_bool(bool v) -> Status;

    virtual auto visit_i8(int8_t v) -> Status;
    virtual auto visit_i16(int16_t v) -> Status;
    virtual auto visit_i32(int32_t v) -> Status;
    virtual auto visit_i64(int64_t v) -> Status;

    virtual auto visit_u8(uint8_t v) -> Status;
    virtual auto visit_u16(uint16_t v) -> Status;
    virtual auto visit_u32(uint32_t v) -> Status;
    virtual auto visit_u64(uint64_t v) -> Status;

    virtual auto visit_f32(float v) -> Status;
    virtual auto visit_f64(double v) -> Status;

    virtual auto visit_char(char32_t v) -> Status;

    /// Visits text that is only valid for the duration of the call.
    virtual auto visit_str(std::string_view v) -> Status;

    /// Visits text that stays valid while `anchor` (or the deserializer's
    /// source) is alive.
    virtual auto visit_borrowed_str(std::string_view v, const Anchor& anchor) -> Status;

    virtual auto visit_bytes(std::span<const std::byte> v) -> Status;
    virtual auto visit_borrowed_bytes(std::span<const std::byte> v, const Anchor& anchor)
        -> Status;

    virtual auto visit_none() -> Status;

    /// Visits a present optional; its content is read from `d`.
    virtual auto visit_some(Deserializer& d) -> Status;

    virtual auto visit_unit() -> Status;

    /// Visits a newtype struct; its content is read from `d`.
    virtual auto visit_newtype_struct(Deserializer& d) -> Status;

    virtual auto visit_seq(SeqAccess& seq) -> Status;
    virtual auto visit_map(MapAccess& map) -> Status;
    virtual auto visit_enum(EnumAccess& data) -> Status;

protected:
    /// Builds the default rejection for a value of shape `found`.
    [[nodiscard]] auto reject(std::string_view found) const -> Error;
};

// ============================================================================
// Access Interfaces
// ============================================================================

/// Element iteration over a sequence-like value.
class SeqAccess {
public:
    virtual ~SeqAccess() = default;

    /// Returns the deserializer for the next element, or nullptr at the end.
    virtual auto next_element() -> Result<Deserializer*, Error> = 0;

    /// Number of remaining elements, when known.
    [[nodiscard]] virtual auto size_hint() const -> std::optional<size_t> {
        return std::nullopt;
    }
};

/// Entry iteration over a map-like value.
///
/// `next_key` and `next_value` must alternate, starting with a key.
class MapAccess {
public:
    virtual ~MapAccess() = default;

    /// Returns the deserializer for the next key, or nullptr at the end.
    virtual auto next_key() -> Result<Deserializer*, Error> = 0;

    /// Returns the deserializer for the value belonging to the last key.
    ///
    /// Fails with `ErrorCode::MissingValue` if no key is pending.
    virtual auto next_value() -> Result<Deserializer*, Error> = 0;

    /// Number of remaining entries, when known.
    [[nodiscard]] virtual auto size_hint() const -> std::optional<size_t> {
        return std::nullopt;
    }
};

/// Access to an enum value: the selected variant and its payload.
///
/// Exactly one of the payload methods must be called, and it must match the
/// payload shape of the variant; a mismatch is a shape error.
class EnumAccess {
public:
    virtual ~EnumAccess() = default;

    /// Index of the variant.
    ///
    /// In hinted mode this is the position in the consumer's variant list; in
    /// self-describing mode it is the recorded index.
    [[nodiscard]] virtual auto variant_index() const -> uint32_t = 0;

    /// Name of the variant.
    [[nodiscard]] virtual auto variant_name() const -> std::string_view = 0;

    /// Consumes a variant without payload.
    virtual auto unit_variant() -> Status = 0;

    /// Returns the deserializer for the single payload value.
    virtual auto newtype_variant() -> Result<Deserializer*, Error> = 0;

    /// Replays a positional payload of `len` values into `visitor.visit_seq`.
    virtual auto tuple_variant(size_t len, Visitor& visitor) -> Status = 0;

    /// Replays a named payload into `visitor.visit_map`.
    virtual auto struct_variant(std::span<const std::string_view> fields, Visitor& visitor)
        -> Status = 0;
};

// ============================================================================
// Deserializer
// ============================================================================

/// Producer of structured data driven by a consumer.
///
/// Only `deserialize_any` is required. Every hinted method forwards to it by
/// default, which suits self-describing sources; stricter sources override the
/// hints they can check.
class Deserializer {
public:
    virtual ~Deserializer() = default;

    /// Produces the next value in whatever shape it has.
    virtual auto deserialize_any(Visitor& visitor) -> Status = 0;

    virtual auto deserialize_bool(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }

    virtual auto deserialize_i8(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_i16(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_i32(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_i64(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_u8(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_u16(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_u32(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_u64(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_f32(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_f64(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }

    virtual auto deserialize_char(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_str(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_bytes(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_option(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
    virtual auto deserialize_unit(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }

    virtual auto deserialize_unit_struct(std::string_view name, Visitor& visitor) -> Status {
        (void)name;
        return deserialize_any(visitor);
    }

    virtual auto deserialize_newtype_struct(std::string_view name, Visitor& visitor) -> Status {
        (void)name;
        return deserialize_any(visitor);
    }

    virtual auto deserialize_seq(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }

    virtual auto deserialize_tuple(size_t len, Visitor& visitor) -> Status {
        (void)len;
        return deserialize_any(visitor);
    }

    virtual auto deserialize_tuple_struct(std::string_view name, size_t len, Visitor& visitor)
        -> Status {
        (void)name;
        (void)len;
        return deserialize_any(visitor);
    }

    virtual auto deserialize_map(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }

    virtual auto deserialize_struct(std::string_view name, std::span<const std::string_view> fields,
                                    Visitor& visitor) -> Status {
        (void)name;
        (void)fields;
        return deserialize_any(visitor);
    }

    /// Produces an enum value, resolving its variant against `variants`.
    virtual auto deserialize_enum(std::string_view name,
                                  std::span<const std::string_view> variants, Visitor& visitor)
        -> Status {
        (void)name;
        (void)variants;
        return deserialize_any(visitor);
    }

    /// Produces a struct field name or enum variant name.
    virtual auto deserialize_identifier(Visitor& visitor) -> Status {
        return deserialize_str(visitor);
    }

    /// Skips the next value, whatever its shape.
    virtual auto deserialize_ignored_any(Visitor& visitor) -> Status {
        return deserialize_any(visitor);
    }
};

// ============================================================================
// String Deserializer
// ============================================================================

/// A deserializer yielding one string value.
///
/// Used for struct field keys, which are names rather than recorded values.
/// The text is handed out as borrowed content kept alive by `anchor`.
class StrDeserializer : public Deserializer {
public:
    StrDeserializer(std::string_view value, Anchor anchor)
        : value_(value), anchor_(std::move(anchor)) {}

    auto deserialize_any(Visitor& visitor) -> Status override;

    [[nodiscard]] auto value() const -> std::string_view {
        return value_;
    }

private:
    std::string_view value_;
    Anchor anchor_;
};

// ============================================================================
// Deserialize Trait
// ============================================================================

/// Rebuilds a `T` from a `Deserializer`.
///
/// Specializations provide:
///
/// ```cpp
/// static auto deserialize(Deserializer& d) -> Result<T, Error>;
/// ```
template <typename T, typename Enable = void> struct Deserialize;

/// Deserializes a `T` through its `Deserialize<T>` specialization.
template <typename T> auto deserialize_value(Deserializer& d) -> Result<T, Error> {
    return Deserialize<T>::deserialize(d);
}

/// Reads the next sequence element as a `T`.
///
/// # Returns
///
/// The element, `std::nullopt` at the end of the sequence, or the first error.
template <typename T> auto next_element(SeqAccess& seq) -> Result<std::optional<T>, Error> {
    auto next = seq.next_element();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    Deserializer* element = unwrap(next);
    if (element == nullptr) {
        return std::optional<T>();
    }
    auto value = deserialize_value<T>(*element);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return std::optional<T>(std::move(unwrap(value)));
}

/// Reads the next map key as a `K`, or `std::nullopt` at the end of the map.
template <typename K> auto next_key(MapAccess& map) -> Result<std::optional<K>, Error> {
    auto next = map.next_key();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    Deserializer* key = unwrap(next);
    if (key == nullptr) {
        return std::optional<K>();
    }
    auto value = deserialize_value<K>(*key);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return std::optional<K>(std::move(unwrap(value)));
}

/// Reads the value belonging to the last key as a `V`.
template <typename V> auto next_value(MapAccess& map) -> Result<V, Error> {
    auto next = map.next_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    return deserialize_value<V>(*unwrap(next));
}

} // namespace shapebuf
