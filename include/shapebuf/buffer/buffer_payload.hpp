//! # Payload Store
//!
//! Storage for the text, bytes and names referenced by tokens.
//!
//! ## Features
//!
//! - **Borrowed entries**: a view into memory owned by the capture source,
//!   kept alive by an `Anchor`. Nothing is copied.
//! - **Owned entries**: a private copy in arena blocks owned by the store.
//!   Pointers into the arena stay stable for the store's lifetime.
//! - **Name interning**: identical names share one owned entry.
//!
//! Every entry records its ownership explicitly; replay hands borrowed entries
//! out with their own anchor.
//!
//! ## Example
//!
//! ```cpp
//! PayloadStore store;
//! auto source = std::make_shared<const std::string>("hello");
//! PayloadRef ref = store.append_borrowed(*source, source);
//! assert(store.resolve(ref).data() == source->data());
//! ```

#pragma once

#include "shapebuf/buffer/buffer_token.hpp"
#include "shapebuf/common.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shapebuf::detail {

// ============================================================================
// Payload Arena
// ============================================================================

/// A fixed-size block of owned payload bytes.
struct PayloadBlock {
    static constexpr size_t DEFAULT_SIZE = 16 * 1024;

    std::unique_ptr<char[]> data;
    size_t size;
    size_t used = 0;

    explicit PayloadBlock(size_t block_size = DEFAULT_SIZE)
        : data(std::make_unique<char[]>(block_size)), size(block_size) {}

    /// Returns `bytes` bytes from the block, or nullptr if it is full.
    [[nodiscard]] auto alloc(size_t bytes) -> char* {
        if (used + bytes > size) {
            return nullptr;
        }
        char* ptr = data.get() + used;
        used += bytes;
        return ptr;
    }
};

/// FNV-1a hash for the name intern table.
struct NameHash {
    size_t operator()(std::string_view sv) const {
        size_t hash = 14695981039346656037ULL;
        for (char c : sv) {
            hash ^= static_cast<size_t>(static_cast<unsigned char>(c));
            hash *= 1099511628211ULL;
        }
        return hash;
    }
};

// ============================================================================
// Payload Store
// ============================================================================

/// Who owns the memory of a payload entry.
enum class Ownership : uint8_t {
    Borrowed, ///< Memory of the capture source, kept alive by an anchor
    Owned     ///< Memory of the store's own arena
};

/// Append-only storage for token payloads.
///
/// The store is filled during capture and is read-only afterwards.
class PayloadStore {
public:
    PayloadStore() = default;

    PayloadStore(const PayloadStore&) = delete;
    auto operator=(const PayloadStore&) -> PayloadStore& = delete;
    PayloadStore(PayloadStore&&) noexcept = default;
    auto operator=(PayloadStore&&) noexcept -> PayloadStore& = default;

    /// Records a view into memory kept alive by `anchor`. Nothing is copied.
    ///
    /// # Arguments
    ///
    /// * `bytes` - The borrowed memory
    /// * `anchor` - Owner of the memory; must not be null
    auto append_borrowed(std::string_view bytes, const Anchor& anchor) -> PayloadRef;

    /// Copies `bytes` into the store's arena.
    auto append_owned(std::string_view bytes) -> PayloadRef;

    /// Returns an owned entry holding `name`, shared with earlier equal names.
    auto intern(std::string_view name) -> PayloadRef;

    /// Returns the content of an entry as text.
    [[nodiscard]] auto resolve(PayloadRef ref) const -> std::string_view {
        const Entry& entry = entries_[ref.index];
        return {entry.data, entry.size};
    }

    /// Returns the content of an entry as bytes.
    [[nodiscard]] auto resolve_bytes(PayloadRef ref) const -> std::span<const std::byte> {
        const Entry& entry = entries_[ref.index];
        return {reinterpret_cast<const std::byte*>(entry.data), entry.size};
    }

    [[nodiscard]] auto ownership(PayloadRef ref) const -> Ownership {
        return entries_[ref.index].ownership;
    }

    /// The anchor of a borrowed entry; null for owned entries.
    [[nodiscard]] auto anchor(PayloadRef ref) const -> const Anchor&;

    /// Number of entries.
    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    /// Number of borrowed entries.
    [[nodiscard]] auto borrowed_count() const -> size_t {
        return borrowed_count_;
    }

    /// Total bytes copied into owned entries.
    [[nodiscard]] auto owned_bytes() const -> size_t {
        return owned_bytes_;
    }

    /// Number of distinct anchors retained.
    [[nodiscard]] auto anchor_count() const -> size_t {
        return anchors_.size();
    }

private:
    static constexpr uint32_t NO_ANCHOR = UINT32_MAX;

    struct Entry {
        const char* data = nullptr;
        uint32_t size = 0;
        Ownership ownership = Ownership::Owned;
        uint32_t anchor = NO_ANCHOR; ///< Index into `anchors_`
    };

    auto retain(const Anchor& anchor) -> uint32_t;
    auto copy_to_arena(std::string_view bytes) -> const char*;

    std::vector<Entry> entries_;
    std::vector<Anchor> anchors_;
    std::unordered_map<const void*, uint32_t> anchor_index_;
    std::vector<PayloadBlock> blocks_;
    std::unordered_map<std::string_view, PayloadRef, NameHash> interned_;
    size_t borrowed_count_ = 0;
    size_t owned_bytes_ = 0;
};

// ============================================================================
// Buffer Data
// ============================================================================

/// Everything a captured value consists of. Immutable once built.
struct BufferData {
    std::vector<Token> tokens;
    std::vector<PayloadRef> field_names; ///< Addressed by `Token::fields`
    PayloadStore payload;

    /// The field names of a `Struct` or `StructVariant` token.
    [[nodiscard]] auto fields_of(const Token& token) const -> std::span<const PayloadRef> {
        return std::span<const PayloadRef>(field_names).subspan(token.fields.offset,
                                                                token.fields.length);
    }
};

} // namespace shapebuf::detail
