//! # Payload Store Implementation

#include "shapebuf/buffer/buffer_payload.hpp"

#include "shapebuf/log/log.hpp"

#include <algorithm>
#include <cstring>

namespace shapebuf::detail {

auto PayloadStore::append_borrowed(std::string_view bytes, const Anchor& anchor) -> PayloadRef {
    Entry entry;
    entry.data = bytes.data();
    entry.size = static_cast<uint32_t>(bytes.size());
    entry.ownership = Ownership::Borrowed;
    entry.anchor = retain(anchor);

    PayloadRef ref{static_cast<uint32_t>(entries_.size()), entry.size};
    entries_.push_back(entry);
    ++borrowed_count_;
    return ref;
}

auto PayloadStore::append_owned(std::string_view bytes) -> PayloadRef {
    Entry entry;
    entry.data = copy_to_arena(bytes);
    entry.size = static_cast<uint32_t>(bytes.size());
    entry.ownership = Ownership::Owned;

    PayloadRef ref{static_cast<uint32_t>(entries_.size()), entry.size};
    entries_.push_back(entry);
    owned_bytes_ += bytes.size();
    return ref;
}

auto PayloadStore::intern(std::string_view name) -> PayloadRef {
    auto it = interned_.find(name);
    if (it != interned_.end()) {
        return it->second;
    }

    PayloadRef ref = append_owned(name);
    interned_.emplace(resolve(ref), ref);
    return ref;
}

auto PayloadStore::anchor(PayloadRef ref) const -> const Anchor& {
    static const Anchor none;
    const Entry& entry = entries_[ref.index];
    if (entry.anchor == NO_ANCHOR) {
        return none;
    }
    return anchors_[entry.anchor];
}

auto PayloadStore::retain(const Anchor& anchor) -> uint32_t {
    if (!anchor) {
        return NO_ANCHOR;
    }
    auto it = anchor_index_.find(anchor.get());
    if (it != anchor_index_.end()) {
        return it->second;
    }
    auto index = static_cast<uint32_t>(anchors_.size());
    anchors_.push_back(anchor);
    anchor_index_.emplace(anchor.get(), index);
    SHAPEBUF_LOG_TRACE("payload", "Retained anchor #" << index);
    return index;
}

auto PayloadStore::copy_to_arena(std::string_view bytes) -> const char* {
    if (bytes.empty()) {
        return nullptr;
    }

    char* dest = blocks_.empty() ? nullptr : blocks_.back().alloc(bytes.size());
    if (dest == nullptr) {
        // Oversized payloads get a block of their own
        blocks_.emplace_back(std::max(bytes.size(), PayloadBlock::DEFAULT_SIZE));
        dest = blocks_.back().alloc(bytes.size());
        SHAPEBUF_LOG_TRACE("payload", "Allocated payload block #" << blocks_.size() << " ("
                                                                  << blocks_.back().size
                                                                  << " bytes)");
    }
    std::memcpy(dest, bytes.data(), bytes.size());
    return dest;
}

} // namespace shapebuf::detail
