#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "partitioner.h"

namespace dump {

inline constexpr const char* kManifestFile = "manifest.json";

// Artifacts and logical slice of one shard
struct ShardEntry {
    size_t index = 0;
    ShardRange range;
    std::string vectors_file;   // relative to the snapshot directory
    std::string metas_file;
    std::string vectors_sha256;
    std::string metas_sha256;
    std::string sequences_file;  // checkpoints only, empty in dumps
    std::string sequences_sha256;
};

// How a snapshot's logical keyspace was divided across shards. Written once
// per snapshot generation and never modified afterwards.
struct ShardManifest {
    static constexpr int kFormatVersion = 1;

    int version = kFormatVersion;
    size_t shard_count = 0;
    size_t total_records = 0;
    std::vector<ShardEntry> shards;

    // Throws PartitionMismatchError if `index` is not below shard_count
    const ShardEntry& shard(size_t index) const;

    nlohmann::json to_json() const;

    // Rejects manifests whose ranges do not follow the partition formula
    static ShardManifest from_json(const nlohmann::json& j);

    // Write `dir/manifest.json` through a temporary file and rename
    void save(const std::string& dir) const;

    // Throws SnapshotError if missing, unparsable or tampered with
    static ShardManifest load(const std::string& dir);
};

} // namespace dump
