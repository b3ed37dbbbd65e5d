#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "manifest.h"
#include "record.h"

namespace dump {

using VectorEntry = std::pair<std::string, std::vector<float>>;
using MetadataEntry = std::pair<std::string, std::string>;
using SequenceEntry = std::pair<std::string, uint64_t>;

struct DumpSummary {
    std::string path;
    size_t total_records = 0;
    ShardManifest manifest;
};

// Write `records`, already in logical order, as `shard_count` shards:
// <path>/<s>/vectors, <path>/<s>/metas and <path>/manifest.json.
// Each dump is a new generation directory <path>.gen-<n>; <path> is a symlink
// swapped to it by rename, so readers always see one complete generation.
DumpSummary write_snapshot(const std::string& path,
                           const std::vector<podflow::StoredRecord>& records,
                           size_t shard_count);

// Single shard snapshot of a unit's whole store that also keeps every
// record's insertion sequence in <path>/0/sequences
DumpSummary write_checkpoint(const std::string& path,
                             const std::vector<podflow::StoredRecord>& records);

// Records of a checkpoint with their saved sequences
std::vector<podflow::StoredRecord> read_checkpoint(const std::string& path);

// Whether `path` holds a published manifest
bool snapshot_exists(const std::string& path);

// Readers below resolve <path> once and read a single generation against a
// single manifest load.

// Ordered (id, vector) pairs of one shard. Safe to call repeatedly.
std::vector<VectorEntry> import_vectors(const std::string& path, size_t shard_index);

// Ordered (id, metadata) pairs of one shard
std::vector<MetadataEntry> import_metas(const std::string& path, size_t shard_index);

// Both artifacts of one shard zipped back into records; sequences are the
// records' positions in the logical order. Throws PartitionMismatchError when
// the snapshot was not cut into `expected_shard_count` shards.
std::vector<podflow::StoredRecord> import_shard(const std::string& path,
                                                size_t shard_index,
                                                size_t expected_shard_count);

// Raw artifact codecs
void write_vectors_file(const std::string& file,
                        const std::vector<podflow::StoredRecord>& records,
                        const ShardRange& range);
void write_metas_file(const std::string& file,
                      const std::vector<podflow::StoredRecord>& records,
                      const ShardRange& range);
std::vector<VectorEntry> read_vectors_file(const std::string& file);
std::vector<MetadataEntry> read_metas_file(const std::string& file);
void write_sequences_file(const std::string& file,
                          const std::vector<podflow::StoredRecord>& records,
                          const ShardRange& range);
std::vector<SequenceEntry> read_sequences_file(const std::string& file);

} // namespace dump
