#include "partitioner.h"
#include "errors.h"
#include <string>

namespace dump {

ShardRange shard_range(size_t total, size_t shard_count, size_t shard_index) {
    if (shard_count == 0) {
        throw podflow::ConfigurationError("shard count must be at least 1");
    }
    if (shard_index >= shard_count) {
        throw podflow::PartitionMismatchError("shard index " + std::to_string(shard_index) +
                                              " out of range for " + std::to_string(shard_count) +
                                              " shards");
    }

    const size_t per_shard = total / shard_count;
    ShardRange range;
    range.begin = shard_index * per_shard;
    range.end = (shard_index == shard_count - 1) ? total : range.begin + per_shard;
    return range;
}

std::vector<ShardRange> partition(size_t total, size_t shard_count) {
    if (shard_count == 0) {
        throw podflow::ConfigurationError("shard count must be at least 1");
    }
    std::vector<ShardRange> ranges;
    ranges.reserve(shard_count);
    for (size_t s = 0; s < shard_count; s++) {
        ranges.push_back(shard_range(total, shard_count, s));
    }
    return ranges;
}

} // namespace dump
