//! # Test Support
//!
//! Shared producers and consumers for the shapebuf tests:
//!
//! - `JsonPrinter`: a `Serializer` writing compact JSON-like text
//! - `EventLog`: a `Serializer` recording every call it receives
//! - `Describer`: a `Visitor` writing the same text as `JsonPrinter`
//! - Sample types (`Point`, `Document`, `Message`) with `Serialize` and
//!   `Deserialize` implementations

#pragma once

#include "shapebuf/shapebuf.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace shapebuf::test {

// ============================================================================
// JsonPrinter
// ============================================================================

/// Writes compact JSON-like text.
///
/// Optionals and newtypes are transparent, none and unit print as `null`,
/// variants print as `"Name"` or `{"Name":payload}`.
class JsonPrinter : public Serializer {
public:
    std::string out;

    auto serialize_bool(bool v) -> Status override {
        return scalar(v ? "true" : "false");
    }
    auto serialize_i8(int8_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_i16(int16_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_i32(int32_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_i64(int64_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_u8(uint8_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_u16(uint16_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_u32(uint32_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_u64(uint64_t v) -> Status override {
        return scalar(std::to_string(v));
    }
    auto serialize_f32(float v) -> Status override {
        return serialize_f64(v);
    }
    auto serialize_f64(double v) -> Status override {
        std::ostringstream oss;
        oss << v;
        return scalar(oss.str());
    }
    auto serialize_char(char32_t v) -> Status override {
        return scalar(quote(std::string(1, static_cast<char>(v))));
    }
    auto serialize_unit() -> Status override {
        return scalar("null");
    }

    auto serialize_str(std::string_view v) -> Status override {
        return scalar(quote(v));
    }
    auto serialize_bytes(ByteView v) -> Status override {
        std::string text = "[";
        for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
                text += ',';
            }
            text += std::to_string(static_cast<unsigned>(v[i]));
        }
        text += ']';
        return scalar(text);
    }

    auto serialize_none() -> Status override {
        return scalar("null");
    }
    auto serialize_some() -> Status override {
        before_value();
        open("", Frame::Single);
        return ok();
    }
    auto serialize_unit_struct(std::string_view) -> Status override {
        return scalar("null");
    }
    auto serialize_newtype_struct(std::string_view) -> Status override {
        before_value();
        open("", Frame::Single);
        return ok();
    }

    auto begin_seq(std::optional<size_t>) -> Status override {
        before_value();
        out += '[';
        open("]", Frame::List);
        return ok();
    }
    auto end_seq() -> Status override {
        return close();
    }
    auto begin_tuple(size_t) -> Status override {
        return begin_seq(std::nullopt);
    }
    auto end_tuple() -> Status override {
        return close();
    }
    auto begin_tuple_struct(std::string_view, size_t) -> Status override {
        return begin_seq(std::nullopt);
    }
    auto end_tuple_struct() -> Status override {
        return close();
    }
    auto begin_map(std::optional<size_t>) -> Status override {
        before_value();
        out += '{';
        open("}", Frame::Map);
        return ok();
    }
    auto end_map() -> Status override {
        return close();
    }
    auto begin_struct(std::string_view, size_t) -> Status override {
        before_value();
        out += '{';
        open("}", Frame::Fields);
        return ok();
    }
    auto serialize_field(std::string_view key) -> Status override {
        Frame& top = frames_.back();
        if (!top.first) {
            out += ',';
        }
        top.first = false;
        out += quote(key) + ":";
        return ok();
    }
    auto end_struct() -> Status override {
        return close();
    }

    auto serialize_unit_variant(std::string_view, uint32_t, std::string_view variant)
        -> Status override {
        return scalar(quote(variant));
    }
    auto serialize_newtype_variant(std::string_view, uint32_t, std::string_view variant)
        -> Status override {
        before_value();
        out += "{" + quote(variant) + ":";
        open("}", Frame::Single);
        return ok();
    }
    auto begin_tuple_variant(std::string_view, uint32_t, std::string_view variant, size_t)
        -> Status override {
        before_value();
        out += "{" + quote(variant) + ":[";
        open("]}", Frame::List);
        return ok();
    }
    auto end_tuple_variant() -> Status override {
        return close();
    }
    auto begin_struct_variant(std::string_view, uint32_t, std::string_view variant, size_t)
        -> Status override {
        before_value();
        out += "{" + quote(variant) + ":{";
        open("}}", Frame::Fields);
        return ok();
    }
    auto end_struct_variant() -> Status override {
        return close();
    }

    static auto quote(std::string_view v) -> std::string {
        std::string text = "\"";
        for (char c : v) {
            if (c == '"' || c == '\\') {
                text += '\\';
            }
            text += c;
        }
        text += '"';
        return text;
    }

private:
    struct Frame {
        enum Kind { List, Map, Fields, Single };
        Kind kind;
        std::string closer;
        bool first = true;
        bool key_next = true;
    };

    void open(std::string closer, Frame::Kind kind) {
        frames_.push_back(Frame{kind, std::move(closer)});
    }

    void before_value() {
        if (frames_.empty()) {
            return;
        }
        Frame& top = frames_.back();
        switch (top.kind) {
        case Frame::List:
            if (!top.first) {
                out += ',';
            }
            top.first = false;
            break;
        case Frame::Map:
            if (top.key_next) {
                if (!top.first) {
                    out += ',';
                }
                top.first = false;
            } else {
                out += ':';
            }
            break;
        case Frame::Fields:
        case Frame::Single:
            break;
        }
    }

    void after_value() {
        while (!frames_.empty()) {
            Frame& top = frames_.back();
            if (top.kind == Frame::Map) {
                top.key_next = !top.key_next;
            }
            if (top.kind != Frame::Single) {
                return;
            }
            out += top.closer;
            frames_.pop_back();
        }
    }

    auto scalar(const std::string& text) -> Status {
        before_value();
        out += text;
        after_value();
        return ok();
    }

    auto close() -> Status {
        out += frames_.back().closer;
        frames_.pop_back();
        after_value();
        return ok();
    }

    std::vector<Frame> frames_;
};

// ============================================================================
// EventLog
// ============================================================================

/// Records every serializer call as a short string, e.g. `seq(2)`, `i32:1`.
///
/// Borrowed text is logged as `bstr:` and its pointer and anchor are kept.
class EventLog : public Serializer {
public:
    std::vector<std::string> events;
    std::vector<const char*> str_pointers;
    std::vector<Anchor> anchors;

    auto serialize_bool(bool v) -> Status override {
        return log(std::string("bool:") + (v ? "true" : "false"));
    }
    auto serialize_i8(int8_t v) -> Status override {
        return log("i8:" + std::to_string(v));
    }
    auto serialize_i16(int16_t v) -> Status override {
        return log("i16:" + std::to_string(v));
    }
    auto serialize_i32(int32_t v) -> Status override {
        return log("i32:" + std::to_string(v));
    }
    auto serialize_i64(int64_t v) -> Status override {
        return log("i64:" + std::to_string(v));
    }
    auto serialize_u8(uint8_t v) -> Status override {
        return log("u8:" + std::to_string(v));
    }
    auto serialize_u16(uint16_t v) -> Status override {
        return log("u16:" + std::to_string(v));
    }
    auto serialize_u32(uint32_t v) -> Status override {
        return log("u32:" + std::to_string(v));
    }
    auto serialize_u64(uint64_t v) -> Status override {
        return log("u64:" + std::to_string(v));
    }
    auto serialize_f32(float v) -> Status override {
        return log("f32:" + std::to_string(v));
    }
    auto serialize_f64(double v) -> Status override {
        return log("f64:" + std::to_string(v));
    }
    auto serialize_char(char32_t v) -> Status override {
        return log("char:" + std::to_string(static_cast<uint32_t>(v)));
    }
    auto serialize_unit() -> Status override {
        return log("unit");
    }
    auto serialize_str(std::string_view v) -> Status override {
        str_pointers.push_back(v.data());
        return log("str:" + std::string(v));
    }
    auto serialize_borrowed_str(std::string_view v, const Anchor& anchor) -> Status override {
        str_pointers.push_back(v.data());
        anchors.push_back(anchor);
        return log("bstr:" + std::string(v));
    }
    auto serialize_bytes(ByteView v) -> Status override {
        return log("bytes:" + std::to_string(v.size()));
    }
    auto serialize_borrowed_bytes(ByteView v, const Anchor& anchor) -> Status override {
        anchors.push_back(anchor);
        return log("bbytes:" + std::to_string(v.size()));
    }
    auto serialize_none() -> Status override {
        return log("none");
    }
    auto serialize_some() -> Status override {
        return log("some");
    }
    auto serialize_unit_struct(std::string_view name) -> Status override {
        return log("unit_struct:" + std::string(name));
    }
    auto serialize_newtype_struct(std::string_view name) -> Status override {
        return log("newtype_struct:" + std::string(name));
    }
    auto begin_seq(std::optional<size_t> len) -> Status override {
        return log("seq(" + (len ? std::to_string(*len) : std::string("?")) + ")");
    }
    auto end_seq() -> Status override {
        return log("end_seq");
    }
    auto begin_tuple(size_t len) -> Status override {
        return log("tuple(" + std::to_string(len) + ")");
    }
    auto end_tuple() -> Status override {
        return log("end_tuple");
    }
    auto begin_tuple_struct(std::string_view name, size_t len) -> Status override {
        return log("tuple_struct:" + std::string(name) + "(" + std::to_string(len) + ")");
    }
    auto end_tuple_struct() -> Status override {
        return log("end_tuple_struct");
    }
    auto begin_map(std::optional<size_t> len) -> Status override {
        return log("map(" + (len ? std::to_string(*len) : std::string("?")) + ")");
    }
    auto end_map() -> Status override {
        return log("end_map");
    }
    auto begin_struct(std::string_view name, size_t len) -> Status override {
        return log("struct:" + std::string(name) + "(" + std::to_string(len) + ")");
    }
    auto serialize_field(std::string_view key) -> Status override {
        return log("field:" + std::string(key));
    }
    auto end_struct() -> Status override {
        return log("end_struct");
    }
    auto serialize_unit_variant(std::string_view name, uint32_t index, std::string_view variant)
        -> Status override {
        return log(variant_event("unit_variant", name, index, variant));
    }
    auto serialize_newtype_variant(std::string_view name, uint32_t index,
                                   std::string_view variant) -> Status override {
        return log(variant_event("newtype_variant", name, index, variant));
    }
    auto begin_tuple_variant(std::string_view name, uint32_t index, std::string_view variant,
                             size_t len) -> Status override {
        return log(variant_event("tuple_variant", name, index, variant) + "(" +
                   std::to_string(len) + ")");
    }
    auto end_tuple_variant() -> Status override {
        return log("end_tuple_variant");
    }
    auto begin_struct_variant(std::string_view name, uint32_t index, std::string_view variant,
                              size_t len) -> Status override {
        return log(variant_event("struct_variant", name, index, variant) + "(" +
                   std::to_string(len) + ")");
    }
    auto end_struct_variant() -> Status override {
        return log("end_struct_variant");
    }

    /// Fails the call that would record event number `n` (0-based).
    void fail_at(size_t n) {
        fail_at_ = n;
    }

private:
    static auto variant_event(const char* kind, std::string_view name, uint32_t index,
                              std::string_view variant) -> std::string {
        return std::string(kind) + ":" + std::string(name) + "::" + std::string(variant) + "#" +
               std::to_string(index);
    }

    auto log(std::string event) -> Status {
        if (events.size() == fail_at_) {
            return Error::custom("sink rejected " + event);
        }
        events.push_back(std::move(event));
        return ok();
    }

    size_t fail_at_ = SIZE_MAX;
};

// ============================================================================
// Describer
// ============================================================================

/// A visitor printing whatever it is given in `JsonPrinter` format.
///
/// Drives the self-describing replay mode.
class Describer : public Visitor {
public:
    std::string out;

    [[nodiscard]] auto expecting() const -> std::string override {
        return "any value";
    }

    auto visit_bool(bool v) -> Status override {
        out += v ? "true" : "false";
        return ok();
    }
    auto visit_i64(int64_t v) -> Status override {
        out += std::to_string(v);
        return ok();
    }
    auto visit_u64(uint64_t v) -> Status override {
        out += std::to_string(v);
        return ok();
    }
    auto visit_f64(double v) -> Status override {
        std::ostringstream oss;
        oss << v;
        out += oss.str();
        return ok();
    }
    auto visit_char(char32_t v) -> Status override {
        out += JsonPrinter::quote(std::string(1, static_cast<char>(v)));
        return ok();
    }
    auto visit_str(std::string_view v) -> Status override {
        out += JsonPrinter::quote(v);
        return ok();
    }
    auto visit_bytes(std::span<const std::byte> v) -> Status override {
        out += '[';
        for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            out += std::to_string(static_cast<unsigned>(v[i]));
        }
        out += ']';
        return ok();
    }
    auto visit_none() -> Status override {
        out += "null";
        return ok();
    }
    auto visit_unit() -> Status override {
        out += "null";
        return ok();
    }
    auto visit_some(Deserializer& d) -> Status override {
        return d.deserialize_any(*this);
    }
    auto visit_newtype_struct(Deserializer& d) -> Status override {
        return d.deserialize_any(*this);
    }
    auto visit_seq(SeqAccess& seq) -> Status override {
        out += '[';
        bool first = true;
        while (true) {
            auto next = seq.next_element();
            if (is_err(next)) {
                return unwrap_err(next);
            }
            Deserializer* element = unwrap(next);
            if (element == nullptr) {
                break;
            }
            if (!first) {
                out += ',';
            }
            first = false;
            auto status = element->deserialize_any(*this);
            if (is_err(status)) {
                return status;
            }
        }
        out += ']';
        return ok();
    }
    auto visit_map(MapAccess& map) -> Status override {
        out += '{';
        bool first = true;
        while (true) {
            auto key = map.next_key();
            if (is_err(key)) {
                return unwrap_err(key);
            }
            if (unwrap(key) == nullptr) {
                break;
            }
            if (!first) {
                out += ',';
            }
            first = false;
            auto status = unwrap(key)->deserialize_any(*this);
            if (is_err(status)) {
                return status;
            }
            out += ':';
            auto value = map.next_value();
            if (is_err(value)) {
                return unwrap_err(value);
            }
            status = unwrap(value)->deserialize_any(*this);
            if (is_err(status)) {
                return status;
            }
        }
        out += '}';
        return ok();
    }
    auto visit_enum(EnumAccess& data) -> Status override {
        std::string name = JsonPrinter::quote(data.variant_name());
        if (is_ok(data.unit_variant())) {
            out += name;
            return ok();
        }
        out += "{" + name + ":";
        auto newtype = data.newtype_variant();
        if (is_ok(newtype)) {
            auto status = unwrap(newtype)->deserialize_any(*this);
            out += '}';
            return status;
        }
        auto status = data.tuple_variant(0, *this);
        if (is_err(status)) {
            status = data.struct_variant({}, *this);
        }
        out += '}';
        return status;
    }
};

// ============================================================================
// Sample Types
// ============================================================================

/// A struct with two fields.
struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point&) const = default;
};

/// A struct owning text, used for borrowing tests.
struct Document {
    std::string title;
    std::vector<std::string> tags;
    std::optional<std::string> note;
};

/// An enum with one variant of each payload shape.
struct Message {
    enum class Kind : uint32_t { Quit, Write, Move, Color };

    Kind kind = Kind::Quit;
    std::string text;             ///< Write
    Point to;                     ///< Move
    std::array<uint8_t, 3> rgb{}; ///< Color

    static constexpr std::array<std::string_view, 4> VARIANTS = {"Quit", "Write", "Move",
                                                                 "Color"};

    bool operator==(const Message&) const = default;
};

} // namespace shapebuf::test

namespace shapebuf {

template <> struct Serialize<test::Point> {
    static auto serialize(const test::Point& p, Serializer& s) -> Status {
        auto status = s.begin_struct("Point", 2);
        if (is_err(status)) {
            return status;
        }
        status = serialize_field(s, "x", p.x);
        if (is_err(status)) {
            return status;
        }
        status = serialize_field(s, "y", p.y);
        if (is_err(status)) {
            return status;
        }
        return s.end_struct();
    }
};

template <> struct Deserialize<test::Point> {
    struct PointVisitor : Visitor {
        test::Point value;

        [[nodiscard]] auto expecting() const -> std::string override {
            return "struct Point";
        }

        auto visit_map(MapAccess& map) -> Status override {
            while (true) {
                auto key = next_key<std::string>(map);
                if (is_err(key)) {
                    return unwrap_err(key);
                }
                auto& name = unwrap(key);
                if (!name) {
                    return ok();
                }
                auto v = next_value<int32_t>(map);
                if (is_err(v)) {
                    return unwrap_err(v);
                }
                if (*name == "x") {
                    value.x = unwrap(v);
                } else if (*name == "y") {
                    value.y = unwrap(v);
                }
            }
        }
    };

    static auto deserialize(Deserializer& d) -> Result<test::Point, Error> {
        static constexpr std::array<std::string_view, 2> FIELDS = {"x", "y"};
        PointVisitor visitor;
        auto status = d.deserialize_struct("Point", FIELDS, visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

template <> struct SourceExtent<test::Document> {
    static void collect(const test::Document& doc, SourceRegions& regions) {
        regions.add_object(doc);
        collect_regions(doc.title, regions);
        collect_regions(doc.tags, regions);
        collect_regions(doc.note, regions);
    }
};

template <> struct Serialize<test::Document> {
    static auto serialize(const test::Document& doc, Serializer& s) -> Status {
        auto status = s.begin_struct("Document", 3);
        if (is_err(status)) {
            return status;
        }
        status = serialize_field(s, "title", doc.title);
        if (is_err(status)) {
            return status;
        }
        status = serialize_field(s, "tags", doc.tags);
        if (is_err(status)) {
            return status;
        }
        status = serialize_field(s, "note", doc.note);
        if (is_err(status)) {
            return status;
        }
        return s.end_struct();
    }
};

template <> struct Serialize<test::Message> {
    static auto serialize(const test::Message& m, Serializer& s) -> Status {
        using Kind = test::Message::Kind;
        auto index = static_cast<uint32_t>(m.kind);
        std::string_view variant = test::Message::VARIANTS[index];
        switch (m.kind) {
        case Kind::Quit:
            return s.serialize_unit_variant("Message", index, variant);
        case Kind::Write: {
            auto status = s.serialize_newtype_variant("Message", index, variant);
            if (is_err(status)) {
                return status;
            }
            return serialize_value(m.text, s);
        }
        case Kind::Move: {
            auto status = s.begin_struct_variant("Message", index, variant, 2);
            if (is_err(status)) {
                return status;
            }
            status = serialize_field(s, "x", m.to.x);
            if (is_err(status)) {
                return status;
            }
            status = serialize_field(s, "y", m.to.y);
            if (is_err(status)) {
                return status;
            }
            return s.end_struct_variant();
        }
        case Kind::Color: {
            auto status = s.begin_tuple_variant("Message", index, variant, 3);
            if (is_err(status)) {
                return status;
            }
            for (uint8_t c : m.rgb) {
                status = serialize_value(c, s);
                if (is_err(status)) {
                    return status;
                }
            }
            return s.end_tuple_variant();
        }
        }
        return Error::custom("invalid Message kind");
    }
};

template <> struct Deserialize<test::Message> {
    struct RgbVisitor : Visitor {
        std::array<uint8_t, 3> value{};

        [[nodiscard]] auto expecting() const -> std::string override {
            return "three color components";
        }

        auto visit_seq(SeqAccess& seq) -> Status override {
            for (size_t i = 0; i < value.size(); ++i) {
                auto c = next_element<uint8_t>(seq);
                if (is_err(c)) {
                    return unwrap_err(c);
                }
                if (!unwrap(c)) {
                    return Error::invalid_length(i, expecting());
                }
                value[i] = *unwrap(c);
            }
            return ok();
        }
    };

    struct MessageVisitor : Visitor {
        test::Message value;

        [[nodiscard]] auto expecting() const -> std::string override {
            return "enum Message";
        }

        auto visit_enum(EnumAccess& data) -> Status override {
            using Kind = test::Message::Kind;
            switch (data.variant_index()) {
            case 0:
                value.kind = Kind::Quit;
                return data.unit_variant();
            case 1: {
                value.kind = Kind::Write;
                auto payload = data.newtype_variant();
                if (is_err(payload)) {
                    return unwrap_err(payload);
                }
                auto text = deserialize_value<std::string>(*unwrap(payload));
                if (is_err(text)) {
                    return unwrap_err(text);
                }
                value.text = std::move(unwrap(text));
                return ok();
            }
            case 2: {
                value.kind = Kind::Move;
                Deserialize<test::Point>::PointVisitor point;
                static constexpr std::array<std::string_view, 2> FIELDS = {"x", "y"};
                auto status = data.struct_variant(FIELDS, point);
                value.to = point.value;
                return status;
            }
            case 3: {
                value.kind = Kind::Color;
                RgbVisitor rgb;
                auto status = data.tuple_variant(3, rgb);
                value.rgb = rgb.value;
                return status;
            }
            default:
                return Error::unknown_variant("Message", data.variant_index(),
                                              data.variant_name());
            }
        }
    };

    static auto deserialize(Deserializer& d) -> Result<test::Message, Error> {
        MessageVisitor visitor;
        auto status = d.deserialize_enum("Message", test::Message::VARIANTS, visitor);
        if (is_err(status)) {
            return unwrap_err(status);
        }
        return visitor.value;
    }
};

} // namespace shapebuf
