//! # Error Implementation

#include "shapebuf/model/model_error.hpp"

namespace shapebuf {

// ============================================================================
// Error
// ============================================================================

auto Error::custom(std::string msg) -> Error {
    Error error;
    error.code = ErrorCode::Custom;
    error.message = std::move(msg);
    return error;
}

auto Error::invalid_type(std::string found, std::string expected) -> Error {
    Error error;
    error.code = ErrorCode::ShapeMismatch;
    error.message = "invalid type: " + found + ", expected " + expected;
    error.expected = std::move(expected);
    error.found = std::move(found);
    return error;
}

auto Error::unknown_variant(std::string_view enum_name, uint32_t index, std::string_view variant)
    -> Error {
    Error error;
    error.code = ErrorCode::UnknownVariant;
    error.message = "unknown variant `" + std::string(variant) + "` (index " +
                    std::to_string(index) + ")";
    if (!enum_name.empty()) {
        error.message += " of enum `" + std::string(enum_name) + "`";
    }
    return error;
}

auto Error::invalid_length(size_t len, std::string expected) -> Error {
    Error error;
    error.code = ErrorCode::InvalidLength;
    error.message = "invalid length " + std::to_string(len) + ", expected " + expected;
    return error;
}

auto Error::missing_value() -> Error {
    Error error;
    error.code = ErrorCode::MissingValue;
    error.message = "missing map value";
    return error;
}

auto Error::to_string() const -> std::string {
    return message;
}

// ============================================================================
// CaptureError
// ============================================================================

auto CaptureError::depth_exceeded(size_t max_depth) -> CaptureError {
    CaptureError error;
    error.kind = Kind::DepthExceeded;
    error.max_depth = max_depth;
    error.message = "nesting exceeds the maximum depth of " + std::to_string(max_depth);
    return error;
}

auto CaptureError::length_overflow(size_t length) -> CaptureError {
    CaptureError error;
    error.kind = Kind::LengthOverflow;
    error.message = "length " + std::to_string(length) + " does not fit in 32 bits";
    return error;
}

auto CaptureError::source_failed(const Error& source) -> CaptureError {
    CaptureError error;
    error.kind = Kind::SourceFailed;
    error.message = source.message;
    error.source = source;
    return error;
}

auto CaptureError::to_string() const -> std::string {
    return std::string("capture failed (") + kind_name(kind) + "): " + message;
}

// ============================================================================
// ReplayError
// ============================================================================

auto ReplayError::from_error(const Error& error) -> ReplayError {
    ReplayError result;
    switch (error.code) {
    case ErrorCode::ShapeMismatch:
        result.kind = Kind::ShapeMismatch;
        result.expected = error.expected;
        result.found = error.found;
        break;
    case ErrorCode::UnknownVariant:
        result.kind = Kind::UnknownVariant;
        break;
    case ErrorCode::Custom:
    case ErrorCode::InvalidLength:
    case ErrorCode::MissingValue:
        result.kind = Kind::ConsumerFailed;
        break;
    }
    result.message = error.message;
    result.source = error;
    return result;
}

auto ReplayError::to_string() const -> std::string {
    return std::string("replay failed (") + kind_name(kind) + "): " + message;
}

auto kind_name(CaptureError::Kind kind) -> const char* {
    switch (kind) {
    case CaptureError::Kind::DepthExceeded:
        return "depth exceeded";
    case CaptureError::Kind::LengthOverflow:
        return "length overflow";
    case CaptureError::Kind::SourceFailed:
        return "source failed";
    }
    return "unknown";
}

auto kind_name(ReplayError::Kind kind) -> const char* {
    switch (kind) {
    case ReplayError::Kind::ShapeMismatch:
        return "shape mismatch";
    case ReplayError::Kind::UnknownVariant:
        return "unknown variant";
    case ReplayError::Kind::ConsumerFailed:
        return "consumer failed";
    }
    return "unknown";
}

} // namespace shapebuf
