//! # Source Regions Implementation

#include "shapebuf/buffer/buffer_source.hpp"

#include <algorithm>
#include <stdexcept>

namespace shapebuf {

void SourceRegions::add(const void* data, size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    auto begin = reinterpret_cast<uintptr_t>(data);
    ranges_.push_back(Range{begin, begin + size});
    sealed_ = false;
}

void SourceRegions::seal() {
    if (sealed_) {
        return;
    }
    std::sort(ranges_.begin(), ranges_.end(),
              [](const Range& a, const Range& b) { return a.begin < b.begin; });

    std::vector<Range> merged;
    merged.reserve(ranges_.size());
    for (const Range& range : ranges_) {
        if (!merged.empty() && range.begin <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, range.end);
        } else {
            merged.push_back(range);
        }
    }
    ranges_ = std::move(merged);
    sealed_ = true;
}

auto SourceRegions::contains(const void* data, size_t size) const -> bool {
    if (!sealed_) {
        throw std::logic_error("SourceRegions: contains() called before seal()");
    }
    if (data == nullptr) {
        return false;
    }
    auto begin = reinterpret_cast<uintptr_t>(data);
    auto end = begin + size;

    // Last range starting at or before `begin`.
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), begin,
                               [](uintptr_t addr, const Range& r) { return addr < r.begin; });
    if (it == ranges_.begin()) {
        return false;
    }
    --it;
    return end <= it->end && (size > 0 || begin < it->end);
}

} // namespace shapebuf
