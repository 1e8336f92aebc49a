//! # Buffer Builder Implementation

#include "shapebuf/buffer/buffer_builder.hpp"

#include "shapebuf/buffer/buffer_capture.hpp"
#include "shapebuf/log/log.hpp"

namespace shapebuf {

BufferBuilder::BufferBuilder(CaptureOptions options)
    : recorder_(make_box<detail::Recorder>(options)) {}

BufferBuilder::~BufferBuilder() = default;

BufferBuilder::BufferBuilder(BufferBuilder&&) noexcept = default;

auto BufferBuilder::operator=(BufferBuilder&&) noexcept -> BufferBuilder& = default;

auto BufferBuilder::serializer() -> Serializer& {
    return *recorder_;
}

void BufferBuilder::apply(Status status) {
    if (is_err(status)) {
        SHAPEBUF_LOG_DEBUG("builder", "Build failed: " << unwrap_err(status).message);
        error_ = std::move(unwrap_err(status));
    }
}

// ============================================================================
// Scalars
// ============================================================================

auto BufferBuilder::boolean(bool v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_bool(v));
    }
    return *this;
}

auto BufferBuilder::i8(int8_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_i8(v));
    }
    return *this;
}

auto BufferBuilder::i16(int16_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_i16(v));
    }
    return *this;
}

auto BufferBuilder::i32(int32_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_i32(v));
    }
    return *this;
}

auto BufferBuilder::i64(int64_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_i64(v));
    }
    return *this;
}

auto BufferBuilder::u8(uint8_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_u8(v));
    }
    return *this;
}

auto BufferBuilder::u16(uint16_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_u16(v));
    }
    return *this;
}

auto BufferBuilder::u32(uint32_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_u32(v));
    }
    return *this;
}

auto BufferBuilder::u64(uint64_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_u64(v));
    }
    return *this;
}

auto BufferBuilder::f32(float v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_f32(v));
    }
    return *this;
}

auto BufferBuilder::f64(double v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_f64(v));
    }
    return *this;
}

auto BufferBuilder::character(char32_t v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_char(v));
    }
    return *this;
}

auto BufferBuilder::unit() -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_unit());
    }
    return *this;
}

// ============================================================================
// Text and Bytes
// ============================================================================

auto BufferBuilder::str(std::string_view v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_str(v));
    }
    return *this;
}

auto BufferBuilder::borrowed_str(std::string_view v, const Anchor& anchor) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_borrowed_str(v, anchor));
    }
    return *this;
}

auto BufferBuilder::bytes(ByteView v) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_bytes(v));
    }
    return *this;
}

auto BufferBuilder::borrowed_bytes(ByteView v, const Anchor& anchor) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_borrowed_bytes(v, anchor));
    }
    return *this;
}

// ============================================================================
// Optional and Wrappers
// ============================================================================

auto BufferBuilder::none() -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_none());
    }
    return *this;
}

auto BufferBuilder::some() -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_some());
    }
    return *this;
}

auto BufferBuilder::unit_struct(std::string_view name) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_unit_struct(name));
    }
    return *this;
}

auto BufferBuilder::newtype_struct(std::string_view name) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_newtype_struct(name));
    }
    return *this;
}

auto BufferBuilder::unit_variant(std::string_view name, uint32_t index, std::string_view variant)
    -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_unit_variant(name, index, variant));
    }
    return *this;
}

auto BufferBuilder::newtype_variant(std::string_view name, uint32_t index,
                                    std::string_view variant) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_newtype_variant(name, index, variant));
    }
    return *this;
}

// ============================================================================
// Containers
// ============================================================================

auto BufferBuilder::begin_seq(std::optional<size_t> len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_seq(len));
    }
    return *this;
}

auto BufferBuilder::begin_tuple(size_t len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_tuple(len));
    }
    return *this;
}

auto BufferBuilder::begin_tuple_struct(std::string_view name, size_t len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_tuple_struct(name, len));
    }
    return *this;
}

auto BufferBuilder::begin_map(std::optional<size_t> len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_map(len));
    }
    return *this;
}

auto BufferBuilder::begin_struct(std::string_view name, size_t len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_struct(name, len));
    }
    return *this;
}

auto BufferBuilder::begin_tuple_variant(std::string_view name, uint32_t index,
                                        std::string_view variant, size_t len) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_tuple_variant(name, index, variant, len));
    }
    return *this;
}

auto BufferBuilder::begin_struct_variant(std::string_view name, uint32_t index,
                                         std::string_view variant, size_t len)
    -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->begin_struct_variant(name, index, variant, len));
    }
    return *this;
}

auto BufferBuilder::field(std::string_view name) -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->serialize_field(name));
    }
    return *this;
}

auto BufferBuilder::end() -> BufferBuilder& {
    if (!failed()) {
        apply(recorder_->end_current());
    }
    return *this;
}

// ============================================================================
// Result
// ============================================================================

auto BufferBuilder::build() -> Result<Buffer, CaptureError> {
    if (error_) {
        if (recorder_->capture_error()) {
            return *recorder_->capture_error();
        }
        return CaptureError::source_failed(*error_);
    }
    auto data = recorder_->finish();
    if (is_err(data)) {
        return unwrap_err(data);
    }
    return Buffer(std::move(unwrap(data)));
}

} // namespace shapebuf
