//! # Visitor Defaults
//!
//! Default `Visitor` behavior: narrow forms forward to wide forms, everything
//! else is rejected with a shape mismatch.

#include "shapebuf/model/model_de.hpp"

namespace shapebuf {

auto Visitor::reject(std::string_view found) const -> Error {
    return Error::invalid_type(std::string(found), expecting());
}

// ============================================================================
// Scalars
// ============================================================================

auto Visitor::visit_bool(bool v) -> Status {
    (void)v;
    return reject("bool");
}

auto Visitor::visit_i8(int8_t v) -> Status {
    return visit_i64(v);
}

auto Visitor::visit_i16(int16_t v) -> Status {
    return visit_i64(v);
}

auto Visitor::visit_i32(int32_t v) -> Status {
    return visit_i64(v);
}

auto Visitor::visit_i64(int64_t v) -> Status {
    (void)v;
    return reject("integer");
}

auto Visitor::visit_u8(uint8_t v) -> Status {
    return visit_u64(v);
}

auto Visitor::visit_u16(uint16_t v) -> Status {
    return visit_u64(v);
}

auto Visitor::visit_u32(uint32_t v) -> Status {
    return visit_u64(v);
}

auto Visitor::visit_u64(uint64_t v) -> Status {
    (void)v;
    return reject("integer");
}

auto Visitor::visit_f32(float v) -> Status {
    return visit_f64(v);
}

auto Visitor::visit_f64(double v) -> Status {
    (void)v;
    return reject("float");
}

auto Visitor::visit_char(char32_t v) -> Status {
    (void)v;
    return reject("char");
}

// ============================================================================
// Text and Bytes
// ============================================================================

auto Visitor::visit_str(std::string_view v) -> Status {
    (void)v;
    return reject("string");
}

auto Visitor::visit_borrowed_str(std::string_view v, const Anchor& anchor) -> Status {
    (void)anchor;
    return visit_str(v);
}

auto Visitor::visit_bytes(std::span<const std::byte> v) -> Status {
    (void)v;
    return reject("bytes");
}

auto Visitor::visit_borrowed_bytes(std::span<const std::byte> v, const Anchor& anchor) -> Status {
    (void)anchor;
    return visit_bytes(v);
}

// ============================================================================
// Compound Values
// ============================================================================

auto Visitor::visit_none() -> Status {
    return reject("none");
}

auto Visitor::visit_some(Deserializer& d) -> Status {
    (void)d;
    return reject("some");
}

auto Visitor::visit_unit() -> Status {
    return reject("unit");
}

auto Visitor::visit_newtype_struct(Deserializer& d) -> Status {
    (void)d;
    return reject("newtype struct");
}

auto Visitor::visit_seq(SeqAccess& seq) -> Status {
    (void)seq;
    return reject("sequence");
}

auto Visitor::visit_map(MapAccess& map) -> Status {
    (void)map;
    return reject("map");
}

auto Visitor::visit_enum(EnumAccess& data) -> Status {
    (void)data;
    return reject("enum");
}

// ============================================================================
// StrDeserializer
// ============================================================================

auto StrDeserializer::deserialize_any(Visitor& visitor) -> Status {
    return visitor.visit_borrowed_str(value_, anchor_);
}

} // namespace shapebuf
