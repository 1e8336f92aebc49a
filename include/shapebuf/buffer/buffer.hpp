//! # Buffer
//!
//! An opaque, format-agnostic container for one structured value.
//!
//! A `Buffer` is filled by capturing a value from a producer and read by
//! replaying it into a consumer. Its internal shape is never exposed.
//!
//! ## Features
//!
//! - **Format agnostic**: any `Serializer` can consume a buffer, any
//!   serializable value can fill one
//! - **Borrowing**: text and bytes living inside a shared source are
//!   referenced rather than copied, and the source is kept alive
//! - **Cheap copies**: copies share the immutable captured data
//! - **Repeatable replay**: replay is `const` and may run concurrently
//!
//! ## Example
//!
//! ```cpp
//! auto captured = Buffer::capture(std::map<std::string, int32_t>{{"a", 1}});
//! if (is_ok(captured)) {
//!     Buffer& buffer = unwrap(captured);
//!     auto copy = buffer.deserialize<std::map<std::string, int32_t>>();
//!     buffer.replay_into(printer); // any Serializer
//! }
//! ```

#pragma once

#include "shapebuf/buffer/buffer_options.hpp"
#include "shapebuf/buffer/buffer_source.hpp"
#include "shapebuf/common.hpp"
#include "shapebuf/model/model_de.hpp"
#include "shapebuf/model/model_error.hpp"
#include "shapebuf/model/model_ser.hpp"
#include "shapebuf/model/model_std.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace shapebuf {

namespace detail {
struct BufferData;
} // namespace detail

class Buffer;
class BufferBuilder;
template <> struct Serialize<Buffer>;

/// Size figures of a buffer.
struct BufferStats {
    size_t tokens = 0;           ///< Recorded events
    size_t payload_entries = 0;  ///< Text, byte and name entries
    size_t borrowed_entries = 0; ///< Entries referencing source memory
    size_t owned_bytes = 0;      ///< Bytes copied into the buffer
};

/// A captured structured value.
class Buffer {
public:
    /// A callable producing exactly one value into a serializer.
    using Producer = std::function<Status(Serializer&)>;

    /// A callable consuming one value from a deserializer.
    using Consumer = std::function<Status(Deserializer&)>;

    // ========================================================================
    // Capture
    // ========================================================================

    /// Captures `value`, copying all of its text and bytes.
    ///
    /// # Returns
    ///
    /// The buffer, or the reason the capture failed
    template <typename T>
    static auto capture(const T& value, CaptureOptions options = {})
        -> Result<Buffer, CaptureError> {
        return capture_with([&value](Serializer& s) { return serialize_value(value, s); },
                            options);
    }

    /// Captures `*value`, borrowing the text and bytes that live inside it.
    ///
    /// Only content inside the regions reported by `SourceExtent<T>` is
    /// borrowed; text built while serializing is copied. The buffer keeps
    /// `value` alive for as long as borrowed entries exist.
    template <typename T>
    static auto capture(std::shared_ptr<T> value, CaptureOptions options = {})
        -> Result<Buffer, CaptureError> {
        const T& ref = *value;
        SourceRegions regions;
        collect_regions<std::remove_cv_t<T>>(ref, regions);
        return capture_with([&ref](Serializer& s) { return serialize_value(ref, s); }, options,
                            std::move(value), std::move(regions));
    }

    /// Captures whatever `producer` serializes.
    ///
    /// # Arguments
    ///
    /// * `producer` - Serializes exactly one value
    /// * `options` - Depth limit and borrow policy
    /// * `anchor` - Keeps the memory in `regions` alive
    /// * `regions` - Where content passed with a null anchor may be borrowed
    ///   from; such content outside them, or with a null `anchor`, is copied
    static auto capture_with(const Producer& producer, CaptureOptions options = {},
                             Anchor anchor = nullptr, SourceRegions regions = {})
        -> Result<Buffer, CaptureError>;

    // ========================================================================
    // Replay
    // ========================================================================

    /// Re-emits the captured events into `serializer`.
    auto replay_into(Serializer& serializer) const -> Result<bool, ReplayError>;

    /// Replays the captured value into `visitor` in self-describing mode.
    auto replay_into(Visitor& visitor) const -> Result<bool, ReplayError>;

    /// Hands a deserializer over the captured value to `consumer`.
    auto replay_with(const Consumer& consumer) const -> Result<bool, ReplayError>;

    /// Rebuilds a `T` from the captured value.
    template <typename T> auto deserialize() const -> Result<T, ReplayError> {
        std::optional<T> out;
        auto replayed = replay_with([&out](Deserializer& d) -> Status {
            auto value = deserialize_value<T>(d);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            out.emplace(std::move(unwrap(value)));
            return ok();
        });
        if (is_err(replayed)) {
            return unwrap_err(replayed);
        }
        return std::move(*out);
    }

    // ========================================================================
    // Inspection
    // ========================================================================

    /// A buffer with the same content that borrows nothing.
    ///
    /// The returned buffer holds no anchors, so the sources of this buffer
    /// may be released once it is dropped.
    [[nodiscard]] auto to_owned() const -> Buffer;

    [[nodiscard]] auto stats() const -> BufferStats;

private:
    friend struct Serialize<Buffer>;
    friend class BufferBuilder;

    explicit Buffer(Rc<const detail::BufferData> data) : data_(std::move(data)) {}

    Rc<const detail::BufferData> data_;
};

/// Serializing a buffer replays it.
///
/// Content is handed on as borrowed, anchored on the buffer's data, so
/// capturing a buffer again does not copy.
template <> struct Serialize<Buffer> {
    static auto serialize(const Buffer& buffer, Serializer& s) -> Status;
};

} // namespace shapebuf
