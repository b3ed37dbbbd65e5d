#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "podflow.pb.h"
#include "record.h"
#include "stage_spec.h"
#include "worker.h"

namespace flow {

using Clock = std::chrono::steady_clock;

// The P workers of one replica. Acts as the shard head (fan-out) and tail
// (fan-in): every request goes to every shard.
class ShardGroup {
public:
    ShardGroup(std::string pod, int replica_id,
               std::vector<std::unique_ptr<worker::Worker>> workers,
               podflow::MergeOptions merge);

    void start();

    // False if some shard was not ready by the deadline; rethrows warm-up errors
    bool wait_ready(Clock::time_point deadline);

    // Searches are answered by every shard and merged; throws ShardTimeoutError
    // when a shard misses the deadline and UnavailableError when one is stopped.
    // Writes are broadcast; failed shards are listed in Response.failures and
    // UnavailableError is thrown only if no shard accepted the write.
    podflow::Response process(const podflow::Request& request, Clock::time_point deadline);

    // Records of every shard, concatenated in shard order
    std::vector<podflow::StoredRecord> full_scan(Clock::time_point deadline);

    void stop();

    size_t size() const { return workers_.size(); }
    const worker::Worker& worker(size_t shard_id) const { return *workers_.at(shard_id); }

private:
    podflow::Response search(const podflow::Request& request, Clock::time_point deadline);
    podflow::Response broadcast_write(const podflow::Request& request, Clock::time_point deadline);
    podflow::ShardFailure failure(int shard_id, bool timed_out, const std::string& message) const;

    std::string pod_;
    int replica_id_;
    std::vector<std::unique_ptr<worker::Worker>> workers_;
    podflow::MergeOptions merge_;
};

} // namespace flow
