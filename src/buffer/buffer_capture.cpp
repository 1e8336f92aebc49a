//! # Capture Path Implementation

#include "shapebuf/buffer/buffer_capture.hpp"

#include "shapebuf/log/log.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace shapebuf::detail {

namespace {

constexpr size_t MAX_COUNT = std::numeric_limits<uint32_t>::max();

/// The end call that closes a container of `kind`.
auto end_call_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::Seq:
        return "end_seq";
    case TokenKind::Tuple:
        return "end_tuple";
    case TokenKind::TupleStruct:
        return "end_tuple_struct";
    case TokenKind::Map:
        return "end_map";
    case TokenKind::Struct:
        return "end_struct";
    case TokenKind::TupleVariant:
        return "end_tuple_variant";
    case TokenKind::StructVariant:
        return "end_struct_variant";
    default:
        return "(implicit)";
    }
}

/// Containers that close themselves after one value.
auto is_single_value(TokenKind kind) -> bool {
    return kind == TokenKind::Some || kind == TokenKind::NewtypeStruct ||
           kind == TokenKind::NewtypeVariant;
}

auto is_struct_like(TokenKind kind) -> bool {
    return kind == TokenKind::Struct || kind == TokenKind::StructVariant;
}

auto make_token(TokenKind kind) -> Token {
    Token token;
    token.kind = kind;
    return token;
}

} // namespace

Recorder::Recorder(CaptureOptions options, Anchor root, SourceRegions regions)
    : options_(options), root_(std::move(root)), regions_(std::move(regions)),
      data_(make_box<BufferData>()) {
    regions_.seal();
}

// ============================================================================
// Failure Latch
// ============================================================================

auto Recorder::fail(CaptureError error) -> Status {
    SHAPEBUF_LOG_DEBUG("capture", "Capture aborted: " << error.message);
    error_ = std::move(error);
    return Error::custom(error_->message);
}

auto Recorder::latched() const -> Status {
    return Error::custom(error_->message);
}

void Recorder::ensure_live() const {
    if (finished_) {
        throw std::logic_error("capture: already finished");
    }
}

// ============================================================================
// Value Bookkeeping
// ============================================================================

auto Recorder::begin_value() -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    if (frames_.empty()) {
        if (has_root_value_) {
            throw std::logic_error("capture: a second top-level value was serialized");
        }
        return ok();
    }
    const Frame& top = frames_.back();
    if (is_struct_like(top.kind) && !top.field_pending) {
        throw std::logic_error("capture: struct field value serialized without serialize_field");
    }
    return ok();
}

void Recorder::complete_value() {
    while (true) {
        if (frames_.empty()) {
            has_root_value_ = true;
            return;
        }
        Frame& top = frames_.back();
        ++top.children;
        top.field_pending = false;
        if (!is_single_value(top.kind)) {
            return;
        }
        // An optional or newtype is complete with its single value, and is
        // itself a value of the enclosing container.
        frames_.pop_back();
    }
}

auto Recorder::push_scalar(Token token) -> Status {
    auto status = begin_value();
    if (is_err(status)) {
        return status;
    }
    data_->tokens.push_back(token);
    complete_value();
    return ok();
}

auto Recorder::push_payload(TokenKind kind, std::string_view bytes, const Anchor& anchor,
                            bool borrowable) -> Status {
    auto status = begin_value();
    if (is_err(status)) {
        return status;
    }
    if (bytes.size() > MAX_COUNT) {
        return fail(CaptureError::length_overflow(bytes.size()));
    }

    Token token = make_token(kind);
    bool in_source = anchor || (root_ && regions_.contains(bytes.data(), bytes.size()));
    const Anchor& owner = anchor ? anchor : root_;
    if (borrowable && in_source && options_.borrow == BorrowPolicy::PreferBorrow) {
        token.data = data_->payload.append_borrowed(bytes, owner);
    } else {
        token.data = data_->payload.append_owned(bytes);
    }
    data_->tokens.push_back(token);
    complete_value();
    return ok();
}

auto Recorder::open(Token token, std::optional<size_t> declared) -> Status {
    auto status = begin_value();
    if (is_err(status)) {
        return status;
    }
    if (frames_.size() >= options_.max_depth) {
        return fail(CaptureError::depth_exceeded(options_.max_depth));
    }
    if (declared && *declared > MAX_COUNT) {
        return fail(CaptureError::length_overflow(*declared));
    }

    Frame frame;
    frame.kind = token.kind;
    frame.token = data_->tokens.size();
    frame.declared = declared;
    data_->tokens.push_back(token);
    frames_.push_back(std::move(frame));
    return ok();
}

auto Recorder::close(TokenKind kind) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    if (frames_.empty() || frames_.back().kind != kind) {
        std::string open_kind = frames_.empty() ? "nothing" : token_kind_name(frames_.back().kind);
        throw std::logic_error(std::string("capture: ") + end_call_name(kind) + " called while " +
                               open_kind + " is open");
    }

    Frame& frame = frames_.back();
    size_t count = frame.children;
    if (kind == TokenKind::Map) {
        if (count % 2 != 0) {
            throw std::logic_error("capture: map ended after a key without its value");
        }
        count /= 2;
    }
    if (is_struct_like(kind) && frame.field_pending) {
        throw std::logic_error("capture: struct ended after a field name without its value");
    }
    if (count > MAX_COUNT) {
        return fail(CaptureError::length_overflow(count));
    }
    if (frame.declared && *frame.declared != count) {
        SHAPEBUF_LOG_DEBUG("capture", token_kind_name(kind) << " declared " << *frame.declared
                                                            << " children but recorded "
                                                            << count);
    }

    Token& opener = data_->tokens[frame.token];
    opener.count = static_cast<uint32_t>(count);
    if (is_struct_like(kind)) {
        opener.fields.offset = static_cast<uint32_t>(data_->field_names.size());
        opener.fields.length = static_cast<uint32_t>(frame.fields.size());
        data_->field_names.insert(data_->field_names.end(), frame.fields.begin(),
                                  frame.fields.end());
    }

    frames_.pop_back();
    complete_value();
    return ok();
}

// ============================================================================
// Scalars
// ============================================================================

auto Recorder::serialize_bool(bool v) -> Status {
    Token token = make_token(TokenKind::Bool);
    token.scalar.b = v;
    return push_scalar(token);
}

auto Recorder::serialize_i8(int8_t v) -> Status {
    Token token = make_token(TokenKind::I8);
    token.scalar.i = v;
    return push_scalar(token);
}

auto Recorder::serialize_i16(int16_t v) -> Status {
    Token token = make_token(TokenKind::I16);
    token.scalar.i = v;
    return push_scalar(token);
}

auto Recorder::serialize_i32(int32_t v) -> Status {
    Token token = make_token(TokenKind::I32);
    token.scalar.i = v;
    return push_scalar(token);
}

auto Recorder::serialize_i64(int64_t v) -> Status {
    Token token = make_token(TokenKind::I64);
    token.scalar.i = v;
    return push_scalar(token);
}

auto Recorder::serialize_u8(uint8_t v) -> Status {
    Token token = make_token(TokenKind::U8);
    token.scalar.u = v;
    return push_scalar(token);
}

auto Recorder::serialize_u16(uint16_t v) -> Status {
    Token token = make_token(TokenKind::U16);
    token.scalar.u = v;
    return push_scalar(token);
}

auto Recorder::serialize_u32(uint32_t v) -> Status {
    Token token = make_token(TokenKind::U32);
    token.scalar.u = v;
    return push_scalar(token);
}

auto Recorder::serialize_u64(uint64_t v) -> Status {
    Token token = make_token(TokenKind::U64);
    token.scalar.u = v;
    return push_scalar(token);
}

auto Recorder::serialize_f32(float v) -> Status {
    Token token = make_token(TokenKind::F32);
    token.scalar.f32 = v;
    return push_scalar(token);
}

auto Recorder::serialize_f64(double v) -> Status {
    Token token = make_token(TokenKind::F64);
    token.scalar.f64 = v;
    return push_scalar(token);
}

auto Recorder::serialize_char(char32_t v) -> Status {
    Token token = make_token(TokenKind::Char);
    token.scalar.c = v;
    return push_scalar(token);
}

auto Recorder::serialize_unit() -> Status {
    return push_scalar(make_token(TokenKind::Unit));
}

// ============================================================================
// Text and Bytes
// ============================================================================

auto Recorder::serialize_str(std::string_view v) -> Status {
    return push_payload(TokenKind::Str, v, nullptr, false);
}

auto Recorder::serialize_borrowed_str(std::string_view v, const Anchor& anchor) -> Status {
    return push_payload(TokenKind::Str, v, anchor, true);
}

auto Recorder::serialize_bytes(ByteView v) -> Status {
    std::string_view raw(reinterpret_cast<const char*>(v.data()), v.size());
    return push_payload(TokenKind::Bytes, raw, nullptr, false);
}

auto Recorder::serialize_borrowed_bytes(ByteView v, const Anchor& anchor) -> Status {
    std::string_view raw(reinterpret_cast<const char*>(v.data()), v.size());
    return push_payload(TokenKind::Bytes, raw, anchor, true);
}

// ============================================================================
// Optional and Wrappers
// ============================================================================

auto Recorder::serialize_none() -> Status {
    return push_scalar(make_token(TokenKind::None));
}

auto Recorder::serialize_some() -> Status {
    return open(make_token(TokenKind::Some), 1);
}

auto Recorder::serialize_unit_struct(std::string_view name) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::UnitStruct);
    token.name = data_->payload.intern(name);
    return push_scalar(token);
}

auto Recorder::serialize_newtype_struct(std::string_view name) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::NewtypeStruct);
    token.name = data_->payload.intern(name);
    return open(token, 1);
}

// ============================================================================
// Containers
// ============================================================================

auto Recorder::begin_seq(std::optional<size_t> len) -> Status {
    return open(make_token(TokenKind::Seq), len);
}

auto Recorder::end_seq() -> Status {
    return close(TokenKind::Seq);
}

auto Recorder::begin_tuple(size_t len) -> Status {
    return open(make_token(TokenKind::Tuple), len);
}

auto Recorder::end_tuple() -> Status {
    return close(TokenKind::Tuple);
}

auto Recorder::begin_tuple_struct(std::string_view name, size_t len) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::TupleStruct);
    token.name = data_->payload.intern(name);
    return open(token, len);
}

auto Recorder::end_tuple_struct() -> Status {
    return close(TokenKind::TupleStruct);
}

auto Recorder::begin_map(std::optional<size_t> len) -> Status {
    return open(make_token(TokenKind::Map), len);
}

auto Recorder::end_map() -> Status {
    return close(TokenKind::Map);
}

auto Recorder::begin_struct(std::string_view name, size_t len) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::Struct);
    token.name = data_->payload.intern(name);
    return open(token, len);
}

auto Recorder::serialize_field(std::string_view key) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    if (frames_.empty() || !is_struct_like(frames_.back().kind)) {
        throw std::logic_error("capture: serialize_field called outside a struct");
    }
    Frame& top = frames_.back();
    if (top.field_pending) {
        throw std::logic_error("capture: field `" + std::string(key) +
                               "` named before the previous field's value");
    }
    top.fields.push_back(data_->payload.intern(key));
    top.field_pending = true;
    return ok();
}

auto Recorder::end_struct() -> Status {
    return close(TokenKind::Struct);
}

// ============================================================================
// Enum Variants
// ============================================================================

auto Recorder::serialize_unit_variant(std::string_view name, uint32_t index,
                                      std::string_view variant) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::UnitVariant);
    token.name = data_->payload.intern(name);
    token.variant = data_->payload.intern(variant);
    token.index = index;
    return push_scalar(token);
}

auto Recorder::serialize_newtype_variant(std::string_view name, uint32_t index,
                                         std::string_view variant) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::NewtypeVariant);
    token.name = data_->payload.intern(name);
    token.variant = data_->payload.intern(variant);
    token.index = index;
    return open(token, 1);
}

auto Recorder::begin_tuple_variant(std::string_view name, uint32_t index,
                                   std::string_view variant, size_t len) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::TupleVariant);
    token.name = data_->payload.intern(name);
    token.variant = data_->payload.intern(variant);
    token.index = index;
    return open(token, len);
}

auto Recorder::end_tuple_variant() -> Status {
    return close(TokenKind::TupleVariant);
}

auto Recorder::begin_struct_variant(std::string_view name, uint32_t index,
                                    std::string_view variant, size_t len) -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    Token token = make_token(TokenKind::StructVariant);
    token.name = data_->payload.intern(name);
    token.variant = data_->payload.intern(variant);
    token.index = index;
    return open(token, len);
}

auto Recorder::end_struct_variant() -> Status {
    return close(TokenKind::StructVariant);
}

// ============================================================================
// Recorder State
// ============================================================================

auto Recorder::end_current() -> Status {
    ensure_live();
    if (error_) {
        return latched();
    }
    if (frames_.empty()) {
        throw std::logic_error("capture: end called with no open container");
    }
    TokenKind kind = frames_.back().kind;
    if (is_single_value(kind)) {
        throw std::logic_error(std::string("capture: ") + token_kind_name(kind) +
                               " closes itself after its value");
    }
    return close(kind);
}

auto Recorder::finish() -> Result<Rc<const BufferData>, CaptureError> {
    ensure_live();
    if (error_) {
        return *error_;
    }
    if (!frames_.empty()) {
        throw std::logic_error("capture: finished with " + std::to_string(frames_.size()) +
                               " open container(s)");
    }
    if (!has_root_value_) {
        throw std::logic_error("capture: no value was serialized");
    }

    SHAPEBUF_LOG_DEBUG("capture", "Captured " << data_->tokens.size() << " tokens, "
                                              << data_->payload.size() << " payload entries ("
                                              << data_->payload.borrowed_count() << " borrowed, "
                                              << data_->payload.owned_bytes()
                                              << " owned bytes)");
    finished_ = true;
    return Rc<const BufferData>(std::move(data_));
}

} // namespace shapebuf::detail
