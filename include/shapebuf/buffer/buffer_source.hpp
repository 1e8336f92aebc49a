//! # Source Regions
//!
//! Describes which memory belongs to a shared capture source, so the capture
//! path can tell text sliced from the source apart from text a `Serialize`
//! implementation builds on the fly.
//!
//! Content passed with a null anchor is borrowed only when it lies entirely
//! inside one of the source's regions. Anything else is copied.
//!
//! ## Extending
//!
//! `SourceExtent<T>` reports the regions of a `T`. The default covers the
//! object's own bytes, which is enough for types holding their text inline.
//! Types whose text lives on the heap specialize it:
//!
//! ```cpp
//! template <> struct shapebuf::SourceExtent<Document> {
//!     static void collect(const Document& doc, SourceRegions& regions) {
//!         regions.add_object(doc);
//!         SourceExtent<std::string>::collect(doc.title, regions);
//!     }
//! };
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shapebuf {

/// A set of address ranges owned by a capture source.
class SourceRegions {
public:
    /// Adds `[data, data + size)`.
    void add(const void* data, size_t size);

    /// Adds the bytes of `value` itself.
    template <typename T> void add_object(const T& value) {
        add(&value, sizeof(T));
    }

    /// Sorts and merges the ranges. Must run before `contains`.
    void seal();

    /// Whether `[data, data + size)` lies inside a single merged range.
    [[nodiscard]] auto contains(const void* data, size_t size) const -> bool;

    [[nodiscard]] auto empty() const -> bool {
        return ranges_.empty();
    }

    /// Number of ranges (merged once sealed).
    [[nodiscard]] auto size() const -> size_t {
        return ranges_.size();
    }

private:
    struct Range {
        uintptr_t begin;
        uintptr_t end;
    };

    std::vector<Range> ranges_;
    bool sealed_ = true;
};

// ============================================================================
// SourceExtent
// ============================================================================

/// Reports the memory regions of a `T` that a capture may borrow from.
template <typename T, typename Enable = void> struct SourceExtent {
    static void collect(const T& value, SourceRegions& regions) {
        regions.add_object(value);
    }
};

/// Collects the regions of `value` through its `SourceExtent<T>`.
template <typename T> void collect_regions(const T& value, SourceRegions& regions) {
    SourceExtent<T>::collect(value, regions);
}

template <> struct SourceExtent<std::string> {
    static void collect(const std::string& value, SourceRegions& regions) {
        regions.add_object(value);
        regions.add(value.data(), value.size());
    }
};

template <typename T> struct SourceExtent<std::vector<T>> {
    static void collect(const std::vector<T>& value, SourceRegions& regions) {
        regions.add_object(value);
        regions.add(value.data(), value.size() * sizeof(T));
        for (const T& element : value) {
            collect_regions(element, regions);
        }
    }
};

template <typename T> struct SourceExtent<std::optional<T>> {
    static void collect(const std::optional<T>& value, SourceRegions& regions) {
        regions.add_object(value);
        if (value) {
            collect_regions(*value, regions);
        }
    }
};

template <typename A, typename B> struct SourceExtent<std::pair<A, B>> {
    static void collect(const std::pair<A, B>& value, SourceRegions& regions) {
        collect_regions(value.first, regions);
        collect_regions(value.second, regions);
    }
};

template <typename K, typename V> struct SourceExtent<std::map<K, V>> {
    static void collect(const std::map<K, V>& value, SourceRegions& regions) {
        regions.add_object(value);
        for (const auto& [key, mapped] : value) {
            collect_regions(key, regions);
            collect_regions(mapped, regions);
        }
    }
};

} // namespace shapebuf
