#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

namespace datastore::detail {

// Index conventions shared by db_list and db_string. Negative indices are
// offsets from the end (-1 is the last element).

/// Resolve an element index. Returns nullopt if it falls outside [0, size).
inline std::optional<int64_t> resolve_index(int64_t index, int64_t size) noexcept {
    if (index < 0) index += size;
    if (index < 0 || index >= size) return std::nullopt;
    return index;
}

/// Resolve an insertion point, clamped into [0, size].
inline int64_t clamp_insert_index(int64_t index, int64_t size) noexcept {
    if (index < 0) return std::max<int64_t>(0, index + size);
    return std::min(index, size);
}

/// Clamp a removal count for a range starting at an already clamped `index`.
inline int64_t clamp_count(int64_t index, int64_t count, int64_t size) noexcept {
    return std::max<int64_t>(0, std::min(count, size - index));
}

/// Resolve a search bound, clamped into [0, size - 1].
inline int64_t clamp_search_bound(int64_t bound, int64_t size) noexcept {
    if (bound < 0) return std::max<int64_t>(0, bound + size);
    return std::min(bound, size - 1);
}

/// Forward scan over the inclusive range [start, stop]. If stop precedes
/// start the scan wraps past the end. Returns -1 if nothing matches.
template<typename Pred>
int64_t find_first_in_range(int64_t size, int64_t start, int64_t stop, Pred&& pred) {
    if (size == 0) return -1;
    start = clamp_search_bound(start, size);
    stop = clamp_search_bound(stop, size);
    int64_t span = stop < start ? (stop + 1) + (size - start) : stop - start + 1;
    for (int64_t i = 0; i < span; ++i) {
        int64_t j = (start + i) % size;
        if (pred(j)) return j;
    }
    return -1;
}

/// Backward scan from start down to stop, inclusive. If start precedes stop
/// the scan wraps past the front. Returns -1 if nothing matches.
template<typename Pred>
int64_t find_last_in_range(int64_t size, int64_t start, int64_t stop, Pred&& pred) {
    if (size == 0) return -1;
    start = clamp_search_bound(start, size);
    stop = clamp_search_bound(stop, size);
    int64_t span = start < stop ? (start + 1) + (size - stop) : start - stop + 1;
    for (int64_t i = 0; i < span; ++i) {
        int64_t j = (start - i + size) % size;
        if (pred(j)) return j;
    }
    return -1;
}

} // namespace datastore::detail
