//! # Replay Path Implementation

#include "shapebuf/buffer/buffer_replay.hpp"

#include "shapebuf/log/log.hpp"

#include <string>

namespace shapebuf::detail {

// ============================================================================
// Cursor
// ============================================================================

auto Cursor::at_end() const -> bool {
    if (remaining_.empty()) {
        return top_taken_ || pos_ >= tokens_.size();
    }
    return remaining_.back() == 0;
}

auto Cursor::peek() const -> const Token* {
    if (at_end()) {
        return nullptr;
    }
    return &tokens_[pos_];
}

auto Cursor::take() -> const Token& {
    const Token& token = tokens_[pos_++];
    if (remaining_.empty()) {
        top_taken_ = true;
    } else {
        --remaining_.back();
    }
    return token;
}

void Cursor::skip_value() {
    size_t pending = child_groups(take());
    while (pending > 0) {
        const Token& child = tokens_[pos_++];
        pending = pending - 1 + child_groups(child);
    }
}

void Cursor::enter(size_t groups) {
    remaining_.push_back(groups);
}

auto Cursor::leave() -> size_t {
    size_t skipped = 0;
    while (remaining_.back() > 0) {
        skip_value();
        ++skipped;
    }
    remaining_.pop_back();
    return skipped;
}

auto Cursor::remaining() const -> size_t {
    if (remaining_.empty()) {
        return top_taken_ ? 0 : 1;
    }
    return remaining_.back();
}

// ============================================================================
// Access Objects
// ============================================================================

/// Elements of a sequence, tuple, tuple struct or tuple variant.
class SeqReplay : public SeqAccess {
public:
    explicit SeqReplay(Replayer& replayer) : replayer_(replayer) {}

    auto next_element() -> Result<Deserializer*, Error> override {
        Cursor& cursor = replayer_.cursor_;
        // An element handed out but never read is skipped here.
        if (handed_ && cursor.remaining() == *handed_) {
            cursor.skip_value();
        }
        handed_.reset();

        if (cursor.at_end()) {
            return static_cast<Deserializer*>(nullptr);
        }
        handed_ = cursor.remaining();
        return static_cast<Deserializer*>(&replayer_);
    }

    [[nodiscard]] auto size_hint() const -> std::optional<size_t> override {
        return replayer_.cursor_.remaining();
    }

private:
    Replayer& replayer_;
    std::optional<size_t> handed_;
};

/// Key/value entries of a map.
class MapReplay : public MapAccess {
public:
    explicit MapReplay(Replayer& replayer) : replayer_(replayer) {}

    auto next_key() -> Result<Deserializer*, Error> override {
        Cursor& cursor = replayer_.cursor_;
        settle();
        if (key_pending_) {
            cursor.skip_value();
            key_pending_ = false;
        }
        if (cursor.at_end()) {
            return static_cast<Deserializer*>(nullptr);
        }
        handed_ = cursor.remaining();
        key_pending_ = true;
        return static_cast<Deserializer*>(&replayer_);
    }

    auto next_value() -> Result<Deserializer*, Error> override {
        if (!key_pending_) {
            return Error::missing_value();
        }
        settle();
        key_pending_ = false;
        handed_ = replayer_.cursor_.remaining();
        return static_cast<Deserializer*>(&replayer_);
    }

    [[nodiscard]] auto size_hint() const -> std::optional<size_t> override {
        return replayer_.cursor_.remaining() / 2;
    }

private:
    void settle() {
        Cursor& cursor = replayer_.cursor_;
        if (handed_ && cursor.remaining() == *handed_) {
            cursor.skip_value();
        }
        handed_.reset();
    }

    Replayer& replayer_;
    std::optional<size_t> handed_;
    bool key_pending_ = false;
};

/// Fields of a struct or struct variant, presented as a map with string keys.
class StructReplay : public MapAccess {
public:
    StructReplay(Replayer& replayer, std::span<const PayloadRef> fields)
        : replayer_(replayer), fields_(fields) {}

    auto next_key() -> Result<Deserializer*, Error> override {
        Cursor& cursor = replayer_.cursor_;
        settle();
        if (key_pending_) {
            cursor.skip_value();
            key_pending_ = false;
        }
        if (cursor.at_end()) {
            return static_cast<Deserializer*>(nullptr);
        }
        PayloadRef name = fields_[fields_.size() - cursor.remaining()];
        key_.emplace(replayer_.data_->payload.resolve(name), replayer_.self_anchor_);
        key_pending_ = true;
        return static_cast<Deserializer*>(&*key_);
    }

    auto next_value() -> Result<Deserializer*, Error> override {
        if (!key_pending_) {
            return Error::missing_value();
        }
        key_pending_ = false;
        handed_ = replayer_.cursor_.remaining();
        return static_cast<Deserializer*>(&replayer_);
    }

    [[nodiscard]] auto size_hint() const -> std::optional<size_t> override {
        return replayer_.cursor_.remaining();
    }

private:
    void settle() {
        Cursor& cursor = replayer_.cursor_;
        if (handed_ && cursor.remaining() == *handed_) {
            cursor.skip_value();
        }
        handed_.reset();
    }

    Replayer& replayer_;
    std::span<const PayloadRef> fields_;
    std::optional<StrDeserializer> key_;
    std::optional<size_t> handed_;
    bool key_pending_ = false;
};

/// The selected variant of an enum and its payload.
class EnumReplay : public EnumAccess {
public:
    EnumReplay(Replayer& replayer, const Token& token, uint32_t index, std::string_view name)
        : replayer_(replayer), token_(token), index_(index), name_(name) {}

    [[nodiscard]] auto variant_index() const -> uint32_t override {
        return index_;
    }

    [[nodiscard]] auto variant_name() const -> std::string_view override {
        return name_;
    }

    auto unit_variant() -> Status override {
        if (token_.kind != TokenKind::UnitVariant) {
            return replayer_.mismatch(token_, "unit variant");
        }
        return ok();
    }

    auto newtype_variant() -> Result<Deserializer*, Error> override {
        if (token_.kind != TokenKind::NewtypeVariant) {
            return replayer_.mismatch(token_, "newtype variant");
        }
        return static_cast<Deserializer*>(&replayer_);
    }

    auto tuple_variant(size_t len, Visitor& visitor) -> Status override {
        if (token_.kind != TokenKind::TupleVariant) {
            return replayer_.mismatch(token_, "tuple variant");
        }
        (void)len;
        SeqReplay seq(replayer_);
        return visitor.visit_seq(seq);
    }

    auto struct_variant(std::span<const std::string_view> fields, Visitor& visitor)
        -> Status override {
        (void)fields;
        if (token_.kind != TokenKind::StructVariant) {
            return replayer_.mismatch(token_, "struct variant");
        }
        StructReplay map(replayer_, replayer_.data_->fields_of(token_));
        return visitor.visit_map(map);
    }

private:
    Replayer& replayer_;
    const Token& token_;
    uint32_t index_;
    std::string_view name_;
};

// ============================================================================
// Replayer
// ============================================================================

Replayer::Replayer(Rc<const BufferData> data)
    : data_(std::move(data)), self_anchor_(data_), cursor_(data_->tokens) {}

auto Replayer::peek_value() -> Result<const Token*, Error> {
    const Token* token = cursor_.peek();
    if (token == nullptr) {
        return Error::custom("no value left to replay");
    }
    return token;
}

auto Replayer::mismatch(const Token& token, std::string_view expected) const -> Error {
    SHAPEBUF_LOG_DEBUG("replay", "Shape mismatch at token " << cursor_.position() << ": expected "
                                                            << expected << ", found "
                                                            << token_kind_name(token.kind));
    return Error::invalid_type(token_kind_name(token.kind), std::string(expected));
}

auto Replayer::anchor_for(PayloadRef ref) const -> const Anchor& {
    if (data_->payload.ownership(ref) == Ownership::Borrowed) {
        return data_->payload.anchor(ref);
    }
    return self_anchor_;
}

auto Replayer::visit_str(PayloadRef ref, Visitor& visitor) -> Status {
    return visitor.visit_borrowed_str(data_->payload.resolve(ref), anchor_for(ref));
}

auto Replayer::visit_bytes(PayloadRef ref, Visitor& visitor) -> Status {
    return visitor.visit_borrowed_bytes(data_->payload.resolve_bytes(ref), anchor_for(ref));
}

template <typename Fn> auto Replayer::visit_container(const Token& token, Fn&& visit) -> Status {
    cursor_.enter(child_groups(token));
    Status status = visit();
    if (is_err(status)) {
        return status;
    }
    size_t skipped = cursor_.leave();
    if (skipped > 0) {
        SHAPEBUF_LOG_DEBUG("replay", "Skipped " << skipped << " unread value(s) of "
                                                << token_kind_name(token.kind));
    }
    return status;
}

auto Replayer::visit_enum_token(const Token& token, uint32_t index, std::string_view name,
                                Visitor& visitor) -> Status {
    return visit_container(token, [&]() -> Status {
        EnumReplay access(*this, token, index, name);
        return visitor.visit_enum(access);
    });
}

// ============================================================================
// Self-Describing Replay
// ============================================================================

auto Replayer::deserialize_any(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    const Token& token = cursor_.take();
    const PayloadStore& payload = data_->payload;

    switch (token.kind) {
    case TokenKind::Unit:
        return visitor.visit_unit();
    case TokenKind::Bool:
        return visitor.visit_bool(token.scalar.b);
    case TokenKind::I8:
        return visitor.visit_i8(static_cast<int8_t>(token.scalar.i));
    case TokenKind::I16:
        return visitor.visit_i16(static_cast<int16_t>(token.scalar.i));
    case TokenKind::I32:
        return visitor.visit_i32(static_cast<int32_t>(token.scalar.i));
    case TokenKind::I64:
        return visitor.visit_i64(token.scalar.i);
    case TokenKind::U8:
        return visitor.visit_u8(static_cast<uint8_t>(token.scalar.u));
    case TokenKind::U16:
        return visitor.visit_u16(static_cast<uint16_t>(token.scalar.u));
    case TokenKind::U32:
        return visitor.visit_u32(static_cast<uint32_t>(token.scalar.u));
    case TokenKind::U64:
        return visitor.visit_u64(token.scalar.u);
    case TokenKind::F32:
        return visitor.visit_f32(token.scalar.f32);
    case TokenKind::F64:
        return visitor.visit_f64(token.scalar.f64);
    case TokenKind::Char:
        return visitor.visit_char(token.scalar.c);
    case TokenKind::Str:
        return visit_str(token.data, visitor);
    case TokenKind::Bytes:
        return visit_bytes(token.data, visitor);
    case TokenKind::None:
        return visitor.visit_none();
    case TokenKind::Some:
        return visit_container(token, [&]() { return visitor.visit_some(*this); });
    case TokenKind::UnitStruct:
        return visitor.visit_unit();
    case TokenKind::NewtypeStruct:
        return visit_container(token, [&]() { return visitor.visit_newtype_struct(*this); });
    case TokenKind::Seq:
    case TokenKind::Tuple:
    case TokenKind::TupleStruct:
        return visit_container(token, [&]() {
            SeqReplay seq(*this);
            return visitor.visit_seq(seq);
        });
    case TokenKind::Map:
        return visit_container(token, [&]() {
            MapReplay map(*this);
            return visitor.visit_map(map);
        });
    case TokenKind::Struct:
        return visit_container(token, [&]() {
            StructReplay map(*this, data_->fields_of(token));
            return visitor.visit_map(map);
        });
    case TokenKind::UnitVariant:
    case TokenKind::NewtypeVariant:
    case TokenKind::TupleVariant:
    case TokenKind::StructVariant:
        return visit_enum_token(token, token.index, payload.resolve(token.variant), visitor);
    }
    return Error::custom("corrupt token kind");
}

// ============================================================================
// Hinted Replay
// ============================================================================

auto Replayer::numeric(Visitor& visitor, const char* hint) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    const Token& token = *unwrap(next);
    if (!is_numeric(token.kind)) {
        return mismatch(token, hint);
    }
    return deserialize_any(visitor);
}

auto Replayer::tuple_like(size_t len, Visitor& visitor, const char* hint) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    const Token& token = *unwrap(next);
    if (token.kind != TokenKind::Seq && token.kind != TokenKind::Tuple &&
        token.kind != TokenKind::TupleStruct) {
        return mismatch(token, hint);
    }
    if (token.count != len) {
        return mismatch(token, std::string(hint) + " of " + std::to_string(len) + " elements");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_bool(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::Bool) {
        return mismatch(*unwrap(next), "bool");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_i8(Visitor& visitor) -> Status {
    return numeric(visitor, "i8");
}

auto Replayer::deserialize_i16(Visitor& visitor) -> Status {
    return numeric(visitor, "i16");
}

auto Replayer::deserialize_i32(Visitor& visitor) -> Status {
    return numeric(visitor, "i32");
}

auto Replayer::deserialize_i64(Visitor& visitor) -> Status {
    return numeric(visitor, "i64");
}

auto Replayer::deserialize_u8(Visitor& visitor) -> Status {
    return numeric(visitor, "u8");
}

auto Replayer::deserialize_u16(Visitor& visitor) -> Status {
    return numeric(visitor, "u16");
}

auto Replayer::deserialize_u32(Visitor& visitor) -> Status {
    return numeric(visitor, "u32");
}

auto Replayer::deserialize_u64(Visitor& visitor) -> Status {
    return numeric(visitor, "u64");
}

auto Replayer::deserialize_f32(Visitor& visitor) -> Status {
    return numeric(visitor, "f32");
}

auto Replayer::deserialize_f64(Visitor& visitor) -> Status {
    return numeric(visitor, "f64");
}

auto Replayer::deserialize_char(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::Char) {
        return mismatch(*unwrap(next), "char");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_str(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::Str) {
        return mismatch(*unwrap(next), "string");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_bytes(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::Bytes) {
        return mismatch(*unwrap(next), "bytes");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_option(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::None && kind != TokenKind::Some) {
        return mismatch(*unwrap(next), "option");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_unit(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::Unit && kind != TokenKind::UnitStruct) {
        return mismatch(*unwrap(next), "unit");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_unit_struct(std::string_view name, Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::UnitStruct && kind != TokenKind::Unit) {
        return mismatch(*unwrap(next), "unit struct " + std::string(name));
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_newtype_struct(std::string_view name, Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::NewtypeStruct) {
        return mismatch(*unwrap(next), "newtype struct " + std::string(name));
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_seq(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::Seq && kind != TokenKind::Tuple && kind != TokenKind::TupleStruct) {
        return mismatch(*unwrap(next), "sequence");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_tuple(size_t len, Visitor& visitor) -> Status {
    return tuple_like(len, visitor, "tuple");
}

auto Replayer::deserialize_tuple_struct(std::string_view name, size_t len, Visitor& visitor)
    -> Status {
    (void)name;
    return tuple_like(len, visitor, "tuple struct");
}

auto Replayer::deserialize_map(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::Map && kind != TokenKind::Struct) {
        return mismatch(*unwrap(next), "map");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_struct(std::string_view name, std::span<const std::string_view> fields,
                                  Visitor& visitor) -> Status {
    (void)fields;
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    TokenKind kind = unwrap(next)->kind;
    if (kind != TokenKind::Struct && kind != TokenKind::Map) {
        return mismatch(*unwrap(next), "struct " + std::string(name));
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_enum(std::string_view name, std::span<const std::string_view> variants,
                                Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    const Token& peeked = *unwrap(next);
    if (!is_variant(peeked.kind)) {
        return mismatch(peeked, "enum " + std::string(name));
    }

    std::string_view recorded = data_->payload.resolve(peeked.variant);
    auto resolved = resolve_variant(peeked.index, recorded, variants);
    if (!resolved) {
        SHAPEBUF_LOG_DEBUG("replay", "Variant `" << recorded << "` (index " << peeked.index
                                                 << ") not in enum " << name);
        return Error::unknown_variant(name, peeked.index, recorded);
    }

    const Token& token = cursor_.take();
    std::string_view resolved_name = variants.empty() ? recorded : variants[*resolved];
    return visit_enum_token(token, *resolved, resolved_name, visitor);
}

auto Replayer::deserialize_identifier(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next)->kind != TokenKind::Str) {
        return mismatch(*unwrap(next), "identifier");
    }
    return deserialize_any(visitor);
}

auto Replayer::deserialize_ignored_any(Visitor& visitor) -> Status {
    auto next = peek_value();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    cursor_.skip_value();
    return visitor.visit_unit();
}

// ============================================================================
// Variant Resolution
// ============================================================================

auto resolve_variant(uint32_t index, std::string_view name,
                     std::span<const std::string_view> variants) -> std::optional<uint32_t> {
    if (variants.empty()) {
        return index;
    }
    if (index < variants.size() && (name.empty() || variants[index] == name)) {
        return index;
    }
    for (size_t i = 0; i < variants.size(); ++i) {
        if (variants[i] == name) {
            return static_cast<uint32_t>(i);
        }
    }
    if (index < variants.size()) {
        return index;
    }
    return std::nullopt;
}

// ============================================================================
// Push Replay
// ============================================================================

namespace {

/// An open container during push replay.
struct PushFrame {
    TokenKind kind;
    size_t remaining;
    std::span<const PayloadRef> fields;
    size_t next_field = 0;
};

auto is_counted_container(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::Seq:
    case TokenKind::Tuple:
    case TokenKind::TupleStruct:
    case TokenKind::Map:
    case TokenKind::Struct:
    case TokenKind::TupleVariant:
    case TokenKind::StructVariant:
        return true;
    default:
        return false;
    }
}

auto emit_end(TokenKind kind, Serializer& s) -> Status {
    switch (kind) {
    case TokenKind::Seq:
        return s.end_seq();
    case TokenKind::Tuple:
        return s.end_tuple();
    case TokenKind::TupleStruct:
        return s.end_tuple_struct();
    case TokenKind::Map:
        return s.end_map();
    case TokenKind::Struct:
        return s.end_struct();
    case TokenKind::TupleVariant:
        return s.end_tuple_variant();
    case TokenKind::StructVariant:
        return s.end_struct_variant();
    default:
        // Optionals and newtypes have no end event
        return ok();
    }
}

auto emit_begin(const Token& token, const BufferData& data, const Anchor& self, Serializer& s)
    -> Status {
    const PayloadStore& payload = data.payload;
    auto anchor_for = [&](PayloadRef ref) -> const Anchor& {
        return payload.ownership(ref) == Ownership::Borrowed ? payload.anchor(ref) : self;
    };

    switch (token.kind) {
    case TokenKind::Unit:
        return s.serialize_unit();
    case TokenKind::Bool:
        return s.serialize_bool(token.scalar.b);
    case TokenKind::I8:
        return s.serialize_i8(static_cast<int8_t>(token.scalar.i));
    case TokenKind::I16:
        return s.serialize_i16(static_cast<int16_t>(token.scalar.i));
    case TokenKind::I32:
        return s.serialize_i32(static_cast<int32_t>(token.scalar.i));
    case TokenKind::I64:
        return s.serialize_i64(token.scalar.i);
    case TokenKind::U8:
        return s.serialize_u8(static_cast<uint8_t>(token.scalar.u));
    case TokenKind::U16:
        return s.serialize_u16(static_cast<uint16_t>(token.scalar.u));
    case TokenKind::U32:
        return s.serialize_u32(static_cast<uint32_t>(token.scalar.u));
    case TokenKind::U64:
        return s.serialize_u64(token.scalar.u);
    case TokenKind::F32:
        return s.serialize_f32(token.scalar.f32);
    case TokenKind::F64:
        return s.serialize_f64(token.scalar.f64);
    case TokenKind::Char:
        return s.serialize_char(token.scalar.c);
    case TokenKind::Str:
        return s.serialize_borrowed_str(payload.resolve(token.data), anchor_for(token.data));
    case TokenKind::Bytes:
        return s.serialize_borrowed_bytes(payload.resolve_bytes(token.data),
                                          anchor_for(token.data));
    case TokenKind::None:
        return s.serialize_none();
    case TokenKind::Some:
        return s.serialize_some();
    case TokenKind::UnitStruct:
        return s.serialize_unit_struct(payload.resolve(token.name));
    case TokenKind::NewtypeStruct:
        return s.serialize_newtype_struct(payload.resolve(token.name));
    case TokenKind::Seq:
        return s.begin_seq(static_cast<size_t>(token.count));
    case TokenKind::Tuple:
        return s.begin_tuple(token.count);
    case TokenKind::TupleStruct:
        return s.begin_tuple_struct(payload.resolve(token.name), token.count);
    case TokenKind::Map:
        return s.begin_map(static_cast<size_t>(token.count));
    case TokenKind::Struct:
        return s.begin_struct(payload.resolve(token.name), token.count);
    case TokenKind::UnitVariant:
        return s.serialize_unit_variant(payload.resolve(token.name), token.index,
                                        payload.resolve(token.variant));
    case TokenKind::NewtypeVariant:
        return s.serialize_newtype_variant(payload.resolve(token.name), token.index,
                                           payload.resolve(token.variant));
    case TokenKind::TupleVariant:
        return s.begin_tuple_variant(payload.resolve(token.name), token.index,
                                     payload.resolve(token.variant), token.count);
    case TokenKind::StructVariant:
        return s.begin_struct_variant(payload.resolve(token.name), token.index,
                                      payload.resolve(token.variant), token.count);
    }
    return Error::custom("corrupt token kind");
}

} // namespace

auto replay_events(const Rc<const BufferData>& data, Serializer& serializer) -> Status {
    const Anchor self = data;
    std::vector<PushFrame> frames;

    for (const Token& token : data->tokens) {
        if (!frames.empty() && !frames.back().fields.empty() &&
            frames.back().next_field < frames.back().fields.size()) {
            PushFrame& top = frames.back();
            PayloadRef field = top.fields[top.next_field++];
            auto status = serializer.serialize_field(data->payload.resolve(field));
            if (is_err(status)) {
                return status;
            }
        }

        auto status = emit_begin(token, *data, self, serializer);
        if (is_err(status)) {
            return status;
        }

        size_t children = child_groups(token);
        if (children > 0) {
            frames.push_back(PushFrame{token.kind, children, data->fields_of(token)});
            continue;
        }
        if (is_counted_container(token.kind)) {
            status = emit_end(token.kind, serializer);
            if (is_err(status)) {
                return status;
            }
        }

        // A finished value may finish its enclosing containers as well.
        while (!frames.empty()) {
            PushFrame& top = frames.back();
            if (--top.remaining > 0) {
                break;
            }
            TokenKind kind = top.kind;
            frames.pop_back();
            status = emit_end(kind, serializer);
            if (is_err(status)) {
                return status;
            }
        }
    }
    return ok();
}

} // namespace shapebuf::detail
