//! # Capture Path
//!
//! The `Recorder` is a `Serializer` that appends one token per event instead
//! of writing a wire format.
//!
//! ## Count Patching
//!
//! Container openers are appended with a placeholder count when the container
//! begins. The matching end call patches in the number of children actually
//! recorded, so producers that cannot declare a length up front are recorded
//! in a single pass.
//!
//! ## Failure Modes
//!
//! | Condition | Result |
//! |-----------|--------|
//! | Opening a container at `max_depth` | `CaptureError::DepthExceeded` |
//! | Count or payload above `UINT32_MAX` | `CaptureError::LengthOverflow` |
//! | Mismatched end, missing field name, odd map entries | `std::logic_error` |
//! | Second top-level value, finishing with open containers | `std::logic_error` |
//! | Any call after `finish()` | `std::logic_error` |
//!
//! The first `CaptureError` is latched: every later call fails with it again.

#pragma once

#include "shapebuf/buffer/buffer_options.hpp"
#include "shapebuf/buffer/buffer_payload.hpp"
#include "shapebuf/buffer/buffer_source.hpp"
#include "shapebuf/buffer/buffer_token.hpp"
#include "shapebuf/model/model_ser.hpp"

#include <optional>
#include <vector>

namespace shapebuf::detail {

/// Records serializer events as tokens.
class Recorder : public Serializer {
public:
    /// Creates a recorder.
    ///
    /// # Arguments
    ///
    /// * `options` - Depth limit and borrow policy
    /// * `root` - Anchor for borrowed content passed with a null anchor
    /// * `regions` - Memory kept alive by `root`; null-anchored content
    ///   outside these regions, or any with a null `root`, is copied
    explicit Recorder(CaptureOptions options = {}, Anchor root = nullptr,
                      SourceRegions regions = {});

    // ========================================================================
    // Serializer
    // ========================================================================

    auto serialize_bool(bool v) -> Status override;
    auto serialize_i8(int8_t v) -> Status override;
    auto serialize_i16(int16_t v) -> Status override;
    auto serialize_i32(int32_t v) -> Status override;
    auto serialize_i64(int64_t v) -> Status override;
    auto serialize_u8(uint8_t v) -> Status override;
    auto serialize_u16(uint16_t v) -> Status override;
    auto serialize_u32(uint32_t v) -> Status override;
    auto serialize_u64(uint64_t v) -> Status override;
    auto serialize_f32(float v) -> Status override;
    auto serialize_f64(double v) -> Status override;
    auto serialize_char(char32_t v) -> Status override;
    auto serialize_unit() -> Status override;

    auto serialize_str(std::string_view v) -> Status override;
    auto serialize_borrowed_str(std::string_view v, const Anchor& anchor) -> Status override;
    auto serialize_bytes(ByteView v) -> Status override;
    auto serialize_borrowed_bytes(ByteView v, const Anchor& anchor) -> Status override;

    auto serialize_none() -> Status override;
    auto serialize_some() -> Status override;
    auto serialize_unit_struct(std::string_view name) -> Status override;
    auto serialize_newtype_struct(std::string_view name) -> Status override;

    auto begin_seq(std::optional<size_t> len) -> Status override;
    auto end_seq() -> Status override;
    auto begin_tuple(size_t len) -> Status override;
    auto end_tuple() -> Status override;
    auto begin_tuple_struct(std::string_view name, size_t len) -> Status override;
    auto end_tuple_struct() -> Status override;
    auto begin_map(std::optional<size_t> len) -> Status override;
    auto end_map() -> Status override;
    auto begin_struct(std::string_view name, size_t len) -> Status override;
    auto serialize_field(std::string_view key) -> Status override;
    auto end_struct() -> Status override;

    auto serialize_unit_variant(std::string_view name, uint32_t index,
                                std::string_view variant) -> Status override;
    auto serialize_newtype_variant(std::string_view name, uint32_t index,
                                   std::string_view variant) -> Status override;
    auto begin_tuple_variant(std::string_view name, uint32_t index, std::string_view variant,
                             size_t len) -> Status override;
    auto end_tuple_variant() -> Status override;
    auto begin_struct_variant(std::string_view name, uint32_t index, std::string_view variant,
                              size_t len) -> Status override;
    auto end_struct_variant() -> Status override;

    // ========================================================================
    // Recorder State
    // ========================================================================

    /// Closes the innermost open container, whatever its kind.
    auto end_current() -> Status;

    /// Number of containers currently open.
    [[nodiscard]] auto depth() const -> size_t {
        return frames_.size();
    }

    /// The latched capture failure, if any.
    [[nodiscard]] auto capture_error() const -> const std::optional<CaptureError>& {
        return error_;
    }

    /// Hands over the recorded data.
    ///
    /// Throws `std::logic_error` if containers are still open, no value was
    /// recorded, or the data was already handed over.
    auto finish() -> Result<Rc<const BufferData>, CaptureError>;

private:
    struct Frame {
        TokenKind kind;
        size_t token;                     ///< Index of the opener token
        size_t children = 0;              ///< Child values recorded so far
        std::optional<size_t> declared;   ///< Count declared by the producer
        std::vector<PayloadRef> fields;   ///< Field names (structs only)
        bool field_pending = false;       ///< A field name awaits its value
    };

    auto fail(CaptureError error) -> Status;
    auto latched() const -> Status;
    void ensure_live() const;

    auto begin_value() -> Status;
    void complete_value();

    auto push_scalar(Token token) -> Status;
    auto push_payload(TokenKind kind, std::string_view bytes, const Anchor& anchor,
                      bool borrowable) -> Status;
    auto open(Token token, std::optional<size_t> declared) -> Status;
    auto close(TokenKind kind) -> Status;

    CaptureOptions options_;
    Anchor root_;
    SourceRegions regions_;
    Box<BufferData> data_;
    std::vector<Frame> frames_;
    bool has_root_value_ = false;
    bool finished_ = false;
    std::optional<CaptureError> error_;
};

} // namespace shapebuf::detail
