#pragma once

#include <cstddef>
#include <vector>
#include "podflow.pb.h"
#include "stage_spec.h"

namespace flow {

// Combine per-shard ranked match lists into one list ordered by descending
// score. Ties keep shard order, then each shard's local order. A document id
// seen on several shards is kept once, at its best-ranked position.
std::vector<podflow::Document> merge_matches(
    const std::vector<std::vector<podflow::Document>>& per_shard,
    size_t top_k,
    const podflow::MergeOptions& options = podflow::MergeOptions());

// Merge the answers of every shard of one replica to the same search request
podflow::Response merge_shard_answers(const std::vector<podflow::Response>& shard_responses,
                                      size_t top_k,
                                      const podflow::MergeOptions& options);

// Join the outputs of several upstream stages: document j keeps the first
// input's fields and collects the matches of document j of every input
podflow::Response join_responses(const std::vector<podflow::Response>& inputs);

} // namespace flow
