//! # Standard Library Types
//!
//! `Serialize` and `Deserialize` implementations for scalars and the common
//! standard containers.
//!
//! ## Mapping
//!
//! | C++ type | Shape |
//! |----------|-------|
//! | `bool` | bool |
//! | integral types | the integer of the same width and signedness |
//! | `float`, `double` | f32, f64 |
//! | `char32_t` | char |
//! | `std::string`, `std::string_view` | string (borrowed from the value) |
//! | `std::vector<std::byte>` | bytes (borrowed from the value) |
//! | `std::monostate` | unit |
//! | `std::optional<T>` | none / some |
//! | `std::vector<T>` | sequence |
//! | `std::map<K, V>` | map |
//! | `std::pair<A, B>`, `std::tuple<Ts...>` | tuple |
//!
//! Strings and byte vectors are serialized as borrowed content with a null
//! anchor: the text lives inside the value being serialized, so it is only
//! valid to serialize them from a value that outlives the capture.
//!
//! Integers are range-checked on deserialization; a recorded `u64` of 300
//! read as `uint8_t` fails instead of wrapping.

#pragma once

#include "shapebuf/model/model_de.hpp"
#include "shapebuf/model/model_ser.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace shapebuf {

namespace detail {

/// Integral types mapped onto the integer shapes.
template <typename T>
inline constexpr bool is_plain_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                           !std::is_same_v<T, char32_t>;

/// Display name of an integer type (e.g. "i32", "u8").
template <typename T> constexpr auto integer_name() -> const char* {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) {
            return "i8";
        } else if constexpr (sizeof(T) == 2) {
            return "i16";
        } else if constexpr (sizeof(T) == 4) {
            return "i32";
        } else {
            return "i64";
        }
    } else {
        if constexpr (sizeof(T) == 1) {
            return "u8";
        } else if constexpr (sizeof(T) == 2) {
            return "u16";
        } else if constexpr (sizeof(T) == 4) {
            return "u32";
        } else {
            return "u64";
        }
    }
}

// ============================================================================
// Visitors
// ============================================================================

struct BoolVisitor : Visitor {
    bool value = false;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a boolean";
    }

    auto visit_bool(bool v) -> Status override {
        value = v;
        return ok();
    }
};

template <typename T> struct IntVisitor : Visitor {
    T value{};

    [[nodiscard]] auto expecting() const -> std::string override {
        return std::string("an integer fitting ") + integer_name<T>();
    }

    auto visit_i64(int64_t v) -> Status override {
        if constexpr (std::is_signed_v<T>) {
            if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                return out_of_range(std::to_string(v));
            }
        } else {
            if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) {
                return out_of_range(std::to_string(v));
            }
        }
        value = static_cast<T>(v);
        return ok();
    }

    auto visit_u64(uint64_t v) -> Status override {
        if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            return out_of_range(std::to_string(v));
        }
        value = static_cast<T>(v);
        return ok();
    }

private:
    auto out_of_range(const std::string& v) const -> Status {
        return Error::custom("integer " + v + " out of range for " + integer_name<T>());
    }
};

template <typename T> struct FloatVisitor : Visitor {
    T value{};

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a floating point number";
    }

    auto visit_f64(double v) -> Status override {
        value = static_cast<T>(v);
        return ok();
    }

    auto visit_i64(int64_t v) -> Status override {
        value = static_cast<T>(v);
        return ok();
    }

    auto visit_u64(uint64_t v) -> Status override {
        value = static_cast<T>(v);
        return ok();
    }
};

struct CharVisitor : Visitor {
    char32_t value = 0;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a character";
    }

    auto visit_char(char32_t v) -> Status override {
        value = v;
        return ok();
    }
};

struct StringVisitor : Visitor {
    std::string value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a string";
    }

    auto visit_str(std::string_view v) -> Status override {
        value.assign(v);
        return ok();
    }
};

struct BorrowedStrVisitor : Visitor {
    std::string_view value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a borrowed string";
    }

    auto visit_borrowed_str(std::string_view v, const Anchor& anchor) -> Status override {
        (void)anchor;
        value = v;
        return ok();
    }
};

struct ByteBufVisitor : Visitor {
    std::vector<std::byte> value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a byte array";
    }

    auto visit_bytes(std::span<const std::byte> v) -> Status override {
        value.assign(v.begin(), v.end());
        return ok();
    }
};

struct UnitVisitor : Visitor {
    [[nodiscard]] auto expecting() const -> std::string override {
        return "unit";
    }

    auto visit_unit() -> Status override {
        return ok();
    }
};

template <typename T> struct OptionVisitor : Visitor {
    std::optional<T> value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "option";
    }

    auto visit_none() -> Status override {
        value.reset();
        return ok();
    }

    auto visit_unit() -> Status override {
        value.reset();
        return ok();
    }

    auto visit_some(Deserializer& d) -> Status override {
        auto inner = deserialize_value<T>(d);
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        value.emplace(std::move(unwrap(inner)));
        return ok();
    }
};

template <typename T> struct VecVisitor : Visitor {
    std::vector<T> value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a sequence";
    }

    auto visit_seq(SeqAccess& seq) -> Status override {
        if (auto hint = seq.size_hint()) {
            value.reserve(*hint);
        }
        while (true) {
            auto element = next_element<T>(seq);
            if (is_err(element)) {
                return unwrap_err(element);
            }
            auto& item = unwrap(element);
            if (!item) {
                return ok();
            }
            value.push_back(std::move(*item));
        }
    }
};

template <typename K, typename V> struct MapVisitor : Visitor {
    std::map<K, V> value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a map";
    }

    auto visit_map(MapAccess& map) -> Status override {
        while (true) {
            auto key = next_key<K>(map);
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto& k = unwrap(key);
            if (!k) {
                return ok();
            }
            auto v = next_value<V>(map);
            if (is_err(v)) {
                return unwrap_err(v);
            }
            value.insert_or_assign(std::move(*k), std::move(unwrap(v)));
        }
    }
};

template <typename... Ts> struct TupleVisitor : Visitor {
    std::tuple<Ts...> value;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "a tuple of size " + std::to_string(sizeof...(Ts));
    }

    auto visit_seq(SeqAccess& seq) -> Status override {
        auto status = read_elements(seq, std::index_sequence_for<Ts...>{});
        if (is_err(status)) {
            return status;
        }
        // Surplus elements make the tuple the wrong length.
        auto extra = seq.next_element();
        if (is_err(extra)) {
            return unwrap_err(extra);
        }
        if (unwrap(extra) != nullptr) {
            return Error::invalid_length(sizeof...(Ts) + 1, expecting());
        }
        return ok();
    }

private:
    template <size_t... Is> auto read_elements(SeqAccess& seq, std::index_sequence<Is...>)
        -> Status {
        Status status = ok();
        (void)((status = read_one<Is>(seq), is_ok(status)) && ...);
        return status;
    }

    template <size_t I> auto read_one(SeqAccess& seq) -> Status {
        using Element = std::tuple_element_t<I, std::tuple<Ts...>>;
        auto element = next_element<Element>(seq);
        if (is_err(element)) {
            return unwrap_err(element);
        }
        auto& item = unwrap(element);
        if (!item) {
            return Error::invalid_length(I, expecting());
        }
        std::get<I>(value) = std::move(*item);
        return ok();
    }
};

} // namespace detail

// ============================================================================
// Scalars
// ============================================================================

template <> struct Serialize<bool> {
    static auto serialize(const bool& v, Serializer& s) -> Status {
        return s.serialize_bool(v);
    }
};

template <> struct Deserialize<bool> {
    static auto deserialize(Deserializer& d) -> Result<bool, Error> {
        detail::BoolVisitor visitor;
        auto status = d.deserialize_bool(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <typename T> struct Serialize<T, std::enable_if_t<detail::is_plain_integer_v<T>>> {
    static auto serialize(const T& v, Serializer& s) -> Status {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) {
                return s.serialize_i8(static_cast<int8_t>(v));
            } else if constexpr (sizeof(T) == 2) {
                return s.serialize_i16(static_cast<int16_t>(v));
            } else if constexpr (sizeof(T) == 4) {
                return s.serialize_i32(static_cast<int32_t>(v));
            } else {
                return s.serialize_i64(static_cast<int64_t>(v));
            }
        } else {
            if constexpr (sizeof(T) == 1) {
                return s.serialize_u8(static_cast<uint8_t>(v));
            } else if constexpr (sizeof(T) == 2) {
                return s.serialize_u16(static_cast<uint16_t>(v));
            } else if constexpr (sizeof(T) == 4) {
                return s.serialize_u32(static_cast<uint32_t>(v));
            } else {
                return s.serialize_u64(static_cast<uint64_t>(v));
            }
        }
    }
};

template <typename T> struct Deserialize<T, std::enable_if_t<detail::is_plain_integer_v<T>>> {
    static auto deserialize(Deserializer& d) -> Result<T, Error> {
        detail::IntVisitor<T> visitor;
        Status status = ok();
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) {
                status = d.deserialize_i8(visitor);
            } else if constexpr (sizeof(T) == 2) {
                status = d.deserialize_i16(visitor);
            } else if constexpr (sizeof(T) == 4) {
                status = d.deserialize_i32(visitor);
            } else {
                status = d.deserialize_i64(visitor);
            }
        } else {
            if constexpr (sizeof(T) == 1) {
                status = d.deserialize_u8(visitor);
            } else if constexpr (sizeof(T) == 2) {
                status = d.deserialize_u16(visitor);
            } else if constexpr (sizeof(T) == 4) {
                status = d.deserialize_u32(visitor);
            } else {
                status = d.deserialize_u64(visitor);
            }
        }
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <> struct Serialize<float> {
    static auto serialize(const float& v, Serializer& s) -> Status {
        return s.serialize_f32(v);
    }
};

template <> struct Deserialize<float> {
    static auto deserialize(Deserializer& d) -> Result<float, Error> {
        detail::FloatVisitor<float> visitor;
        auto status = d.deserialize_f32(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <> struct Serialize<double> {
    static auto serialize(const double& v, Serializer& s) -> Status {
        return s.serialize_f64(v);
    }
};

template <> struct Deserialize<double> {
    static auto deserialize(Deserializer& d) -> Result<double, Error> {
        detail::FloatVisitor<double> visitor;
        auto status = d.deserialize_f64(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <> struct Serialize<char32_t> {
    static auto serialize(const char32_t& v, Serializer& s) -> Status {
        return s.serialize_char(v);
    }
};

template <> struct Deserialize<char32_t> {
    static auto deserialize(Deserializer& d) -> Result<char32_t, Error> {
        detail::CharVisitor visitor;
        auto status = d.deserialize_char(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

// ============================================================================
// Text and Bytes
// ============================================================================

template <> struct Serialize<std::string> {
    static auto serialize(const std::string& v, Serializer& s) -> Status {
        return s.serialize_borrowed_str(v, nullptr);
    }
};

template <> struct Deserialize<std::string> {
    static auto deserialize(Deserializer& d) -> Result<std::string, Error> {
        detail::StringVisitor visitor;
        auto status = d.deserialize_str(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <> struct Serialize<std::string_view> {
    static auto serialize(const std::string_view& v, Serializer& s) -> Status {
        return s.serialize_borrowed_str(v, nullptr);
    }
};

/// Deserializing a `std::string_view` only succeeds when the source hands out
/// borrowed text; the view is valid for as long as the source is.
template <> struct Deserialize<std::string_view> {
    static auto deserialize(Deserializer& d) -> Result<std::string_view, Error> {
        detail::BorrowedStrVisitor visitor;
        auto status = d.deserialize_str(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <> struct Serialize<std::vector<std::byte>> {
    static auto serialize(const std::vector<std::byte>& v, Serializer& s) -> Status {
        return s.serialize_borrowed_bytes(ByteView(v.data(), v.size()), nullptr);
    }
};

template <> struct Deserialize<std::vector<std::byte>> {
    static auto deserialize(Deserializer& d) -> Result<std::vector<std::byte>, Error> {
        detail::ByteBufVisitor visitor;
        auto status = d.deserialize_bytes(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <> struct Serialize<std::monostate> {
    static auto serialize(const std::monostate& v, Serializer& s) -> Status {
        (void)v;
        return s.serialize_unit();
    }
};

template <> struct Deserialize<std::monostate> {
    static auto deserialize(Deserializer& d) -> Result<std::monostate, Error> {
        detail::UnitVisitor visitor;
        auto status = d.deserialize_unit(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::monostate{};
    }
};

// ============================================================================
// Containers
// ============================================================================

template <typename T> struct Serialize<std::optional<T>> {
    static auto serialize(const std::optional<T>& v, Serializer& s) -> Status {
        if (!v) {
            return s.serialize_none();
        }
        auto status = s.serialize_some();
        if (is_err(status)) {
            return status;
        }
        return serialize_value(*v, s);
    }
};

template <typename T> struct Deserialize<std::optional<T>> {
    static auto deserialize(Deserializer& d) -> Result<std::optional<T>, Error> {
        detail::OptionVisitor<T> visitor;
        auto status = d.deserialize_option(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <typename T> struct Serialize<std::vector<T>> {
    static auto serialize(const std::vector<T>& v, Serializer& s) -> Status {
        auto status = s.begin_seq(v.size());
        if (is_err(status)) {
            return status;
        }
        for (const auto& item : v) {
            status = serialize_value(item, s);
            if (is_err(status)) {
                return status;
            }
        }
        return s.end_seq();
    }
};

template <typename T> struct Deserialize<std::vector<T>> {
    static auto deserialize(Deserializer& d) -> Result<std::vector<T>, Error> {
        detail::VecVisitor<T> visitor;
        auto status = d.deserialize_seq(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <typename K, typename V> struct Serialize<std::map<K, V>> {
    static auto serialize(const std::map<K, V>& v, Serializer& s) -> Status {
        auto status = s.begin_map(v.size());
        if (is_err(status)) {
            return status;
        }
        for (const auto& [key, value] : v) {
            status = serialize_value(key, s);
            if (is_err(status)) {
                return status;
            }
            status = serialize_value(value, s);
            if (is_err(status)) {
                return status;
            }
        }
        return s.end_map();
    }
};

template <typename K, typename V> struct Deserialize<std::map<K, V>> {
    static auto deserialize(Deserializer& d) -> Result<std::map<K, V>, Error> {
        detail::MapVisitor<K, V> visitor;
        auto status = d.deserialize_map(visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <typename... Ts> struct Serialize<std::tuple<Ts...>> {
    static auto serialize(const std::tuple<Ts...>& v, Serializer& s) -> Status {
        auto status = s.begin_tuple(sizeof...(Ts));
        if (is_err(status)) {
            return status;
        }
        std::apply(
            [&](const auto&... items) {
                (void)((status = serialize_value(items, s), is_ok(status)) && ...);
            },
            v);
        if (is_err(status)) {
            return status;
        }
        return s.end_tuple();
    }
};

template <typename... Ts> struct Deserialize<std::tuple<Ts...>> {
    static auto deserialize(Deserializer& d) -> Result<std::tuple<Ts...>, Error> {
        detail::TupleVisitor<Ts...> visitor;
        auto status = d.deserialize_tuple(sizeof...(Ts), visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::move(visitor.value);
    }
};

template <typename A, typename B> struct Serialize<std::pair<A, B>> {
    static auto serialize(const std::pair<A, B>& v, Serializer& s) -> Status {
        auto status = s.begin_tuple(2);
        if (is_err(status)) {
            return status;
        }
        status = serialize_value(v.first, s);
        if (is_err(status)) {
            return status;
        }
        status = serialize_value(v.second, s);
        if (is_err(status)) {
            return status;
        }
        return s.end_tuple();
    }
};

template <typename A, typename B> struct Deserialize<std::pair<A, B>> {
    static auto deserialize(Deserializer& d) -> Result<std::pair<A, B>, Error> {
        detail::TupleVisitor<A, B> visitor;
        auto status = d.deserialize_tuple(2, visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return std::pair<A, B>(std::move(std::get<0>(visitor.value)),
                               std::move(std::get<1>(visitor.value)));
    }
};

} // namespace shapebuf
