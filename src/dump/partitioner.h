#pragma once

#include <cstddef>
#include <vector>

namespace dump {

// Half-open slice [begin, end) of the logical record order
struct ShardRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

inline bool operator==(const ShardRange& a, const ShardRange& b) {
    return a.begin == b.begin && a.end == b.end;
}

// Slice owned by `shard_index` when `total` records are split over `shard_count`
// shards: floor(total / shard_count) records each, the last shard also takes
// the remainder. Throws ConfigurationError for shard_count == 0 and
// PartitionMismatchError for shard_index >= shard_count.
ShardRange shard_range(size_t total, size_t shard_count, size_t shard_index);

// All slices in shard order; they tile [0, total) exactly
std::vector<ShardRange> partition(size_t total, size_t shard_count);

} // namespace dump
