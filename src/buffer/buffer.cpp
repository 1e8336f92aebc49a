//! # Buffer Implementation

#include "shapebuf/buffer/buffer.hpp"

#include "shapebuf/buffer/buffer_capture.hpp"
#include "shapebuf/buffer/buffer_replay.hpp"
#include "shapebuf/log/log.hpp"

#include <limits>
#include <stdexcept>

namespace shapebuf {

// ============================================================================
// Capture
// ============================================================================

auto Buffer::capture_with(const Producer& producer, CaptureOptions options, Anchor anchor,
                          SourceRegions regions) -> Result<Buffer, CaptureError> {
    detail::Recorder recorder(options, std::move(anchor), std::move(regions));
    Status status = producer(recorder);
    if (is_err(status)) {
        if (recorder.capture_error()) {
            return *recorder.capture_error();
        }
        SHAPEBUF_LOG_DEBUG("capture", "Producer failed: " << unwrap_err(status).message);
        return CaptureError::source_failed(unwrap_err(status));
    }

    auto data = recorder.finish();
    if (is_err(data)) {
        return unwrap_err(data);
    }
    return Buffer(std::move(unwrap(data)));
}

// ============================================================================
// Replay
// ============================================================================

auto Buffer::replay_into(Serializer& serializer) const -> Result<bool, ReplayError> {
    auto status = detail::replay_events(data_, serializer);
    if (is_err(status)) {
        return ReplayError::from_error(unwrap_err(status));
    }
    return true;
}

auto Buffer::replay_into(Visitor& visitor) const -> Result<bool, ReplayError> {
    detail::Replayer replayer(data_);
    auto status = replayer.deserialize_any(visitor);
    if (is_err(status)) {
        return ReplayError::from_error(unwrap_err(status));
    }
    return true;
}

auto Buffer::replay_with(const Consumer& consumer) const -> Result<bool, ReplayError> {
    detail::Replayer replayer(data_);
    auto status = consumer(replayer);
    if (is_err(status)) {
        return ReplayError::from_error(unwrap_err(status));
    }
    if (!replayer.finished()) {
        SHAPEBUF_LOG_TRACE("replay", "Consumer left part of the value unread");
    }
    return true;
}

// ============================================================================
// Inspection
// ============================================================================

auto Buffer::to_owned() const -> Buffer {
    CaptureOptions options;
    options.max_depth = std::numeric_limits<size_t>::max();
    options.borrow = BorrowPolicy::Copy;

    detail::Recorder recorder(options);
    auto status = detail::replay_events(data_, recorder);
    if (is_err(status)) {
        throw std::logic_error("to_owned: re-recording failed: " + unwrap_err(status).message);
    }
    auto data = recorder.finish();
    if (is_err(data)) {
        throw std::logic_error("to_owned: re-recording failed: " + unwrap_err(data).message);
    }
    return Buffer(std::move(unwrap(data)));
}

auto Buffer::stats() const -> BufferStats {
    BufferStats stats;
    stats.tokens = data_->tokens.size();
    stats.payload_entries = data_->payload.size();
    stats.borrowed_entries = data_->payload.borrowed_count();
    stats.owned_bytes = data_->payload.owned_bytes();
    return stats;
}

auto Serialize<Buffer>::serialize(const Buffer& buffer, Serializer& s) -> Status {
    return detail::replay_events(buffer.data_, s);
}

} // namespace shapebuf
