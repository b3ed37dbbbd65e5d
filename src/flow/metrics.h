#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace flow {

// Counters for a single pod
struct PodMetrics {
    std::string pod;
    int64_t requests = 0;
    int64_t retries = 0;
    int64_t timeouts = 0;
    int64_t write_failures = 0;
    int64_t rolling_updates = 0;
    int64_t failed_rolling_updates = 0;

    // Timing metrics (in milliseconds)
    int64_t total_latency_ms = 0;
    int64_t max_latency_ms = 0;
    double avg_latency_ms = 0.0;

    // Replica distribution
    std::map<int, int64_t> requests_per_replica;
};

// Thread-safe collector shared by every pod of a flow
class FlowMetrics {
public:
    FlowMetrics() = default;

    // Record a request served by `replica_id` of `pod`
    void record_request(const std::string& pod, int replica_id, int64_t latency_ms);

    // Record a call retried on another replica
    void record_retry(const std::string& pod);

    // Record a replica or shard missing its deadline
    void record_timeout(const std::string& pod);

    // Record shards that reported a failed broadcast write
    void record_write_failures(const std::string& pod, int64_t count);

    // Record a finished rolling update
    void record_rolling_update(const std::string& pod, bool success);

    PodMetrics pod_metrics(const std::string& pod) const;

    // All pods, ordered by name
    std::vector<PodMetrics> snapshot() const;

    // Export metrics to CSV
    static bool export_to_csv(const std::string& filename,
                              const std::vector<PodMetrics>& metrics_list);

private:
    PodMetrics& entry(const std::string& pod);

    std::map<std::string, PodMetrics> pods_;
    mutable std::mutex metrics_mutex_;
};

} // namespace flow
