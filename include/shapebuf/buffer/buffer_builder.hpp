//! # Buffer Builder
//!
//! A fluent API for assembling a buffer by hand, without a serializable type.
//!
//! ## Features
//!
//! - **Fluent API**: chain calls in the order the value is read
//! - **Borrowed content**: `borrowed_str` / `borrowed_bytes` reference memory
//!   kept alive by an anchor instead of copying it
//! - **Mixed construction**: `value(v)` records any serializable value in place
//!
//! ## Usage Pattern
//!
//! 1. Open containers with `begin_*`, name struct fields with `field()`
//! 2. Add values; `some()` and the newtype methods wrap the next value
//! 3. Close each container with `end()`
//! 4. Call `build()` to get the `Buffer`
//!
//! ## Example
//!
//! ```cpp
//! auto text = std::make_shared<const std::string>("hello");
//! auto buffer = BufferBuilder()
//!     .begin_struct("Greeting", 2)
//!         .field("text").borrowed_str(*text, text)
//!         .field("count").value(3)
//!     .end()
//!     .build();
//! ```

#pragma once

#include "shapebuf/buffer/buffer.hpp"
#include "shapebuf/buffer/buffer_options.hpp"
#include "shapebuf/common.hpp"
#include "shapebuf/model/model_ser.hpp"

#include <optional>
#include <string_view>

namespace shapebuf {

namespace detail {
class Recorder;
} // namespace detail

/// Fluent builder for `Buffer` values.
///
/// Structural misuse (`end()` with nothing open, `field()` outside a struct,
/// `build()` with containers still open, any call after a successful
/// `build()`) throws `std::logic_error`. Capture
/// failures such as an exceeded depth limit are reported by `build()`.
///
/// # Thread Safety
///
/// The builder is not thread-safe. Each thread should use its own builder instance.
class BufferBuilder {
public:
    explicit BufferBuilder(CaptureOptions options = {});
    ~BufferBuilder();

    BufferBuilder(BufferBuilder&&) noexcept;
    auto operator=(BufferBuilder&&) noexcept -> BufferBuilder&;

    // ========================================================================
    // Scalars
    // ========================================================================

    auto boolean(bool v) -> BufferBuilder&;
    auto i8(int8_t v) -> BufferBuilder&;
    auto i16(int16_t v) -> BufferBuilder&;
    auto i32(int32_t v) -> BufferBuilder&;
    auto i64(int64_t v) -> BufferBuilder&;
    auto u8(uint8_t v) -> BufferBuilder&;
    auto u16(uint16_t v) -> BufferBuilder&;
    auto u32(uint32_t v) -> BufferBuilder&;
    auto u64(uint64_t v) -> BufferBuilder&;
    auto f32(float v) -> BufferBuilder&;
    auto f64(double v) -> BufferBuilder&;
    auto character(char32_t v) -> BufferBuilder&;
    auto unit() -> BufferBuilder&;

    // ========================================================================
    // Text and Bytes
    // ========================================================================

    /// Adds a copy of `v`.
    auto str(std::string_view v) -> BufferBuilder&;

    /// Adds `v` without copying; `anchor` keeps its memory alive.
    ///
    /// With a null `anchor` the text is copied.
    auto borrowed_str(std::string_view v, const Anchor& anchor) -> BufferBuilder&;

    /// Adds a copy of `v`.
    auto bytes(ByteView v) -> BufferBuilder&;

    /// Adds `v` without copying; `anchor` keeps its memory alive.
    auto borrowed_bytes(ByteView v, const Anchor& anchor) -> BufferBuilder&;

    // ========================================================================
    // Optional and Wrappers
    // ========================================================================

    auto none() -> BufferBuilder&;

    /// Wraps the next value in a present optional.
    auto some() -> BufferBuilder&;

    auto unit_struct(std::string_view name) -> BufferBuilder&;

    /// Wraps the next value in newtype struct `name`.
    auto newtype_struct(std::string_view name) -> BufferBuilder&;

    auto unit_variant(std::string_view name, uint32_t index, std::string_view variant)
        -> BufferBuilder&;

    /// Wraps the next value in a newtype variant.
    auto newtype_variant(std::string_view name, uint32_t index, std::string_view variant)
        -> BufferBuilder&;

    // ========================================================================
    // Containers
    // ========================================================================

    auto begin_seq(std::optional<size_t> len = std::nullopt) -> BufferBuilder&;
    auto begin_tuple(size_t len) -> BufferBuilder&;
    auto begin_tuple_struct(std::string_view name, size_t len) -> BufferBuilder&;
    auto begin_map(std::optional<size_t> len = std::nullopt) -> BufferBuilder&;
    auto begin_struct(std::string_view name, size_t len) -> BufferBuilder&;
    auto begin_tuple_variant(std::string_view name, uint32_t index, std::string_view variant,
                             size_t len) -> BufferBuilder&;
    auto begin_struct_variant(std::string_view name, uint32_t index, std::string_view variant,
                              size_t len) -> BufferBuilder&;

    /// Names the next value of the enclosing struct.
    auto field(std::string_view name) -> BufferBuilder&;

    /// Closes the innermost open container.
    auto end() -> BufferBuilder&;

    /// Records any serializable value.
    template <typename T> auto value(const T& v) -> BufferBuilder& {
        if (!failed()) {
            apply(serialize_value(v, serializer()));
        }
        return *this;
    }

    // ========================================================================
    // Result
    // ========================================================================

    /// Finishes the buffer.
    ///
    /// # Returns
    ///
    /// The buffer, or the first capture failure (e.g. `DepthExceeded`)
    auto build() -> Result<Buffer, CaptureError>;

private:
    [[nodiscard]] auto failed() const -> bool {
        return error_.has_value();
    }
    auto serializer() -> Serializer&;
    void apply(Status status);

    Box<detail::Recorder> recorder_;
    std::optional<Error> error_;
};

} // namespace shapebuf
