#include "metrics.h"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace flow {

PodMetrics& FlowMetrics::entry(const std::string& pod) {
    auto& metrics = pods_[pod];
    metrics.pod = pod;
    return metrics;
}

void FlowMetrics::record_request(const std::string& pod, int replica_id, int64_t latency_ms) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto& metrics = entry(pod);
    metrics.requests++;
    metrics.requests_per_replica[replica_id]++;
    metrics.total_latency_ms += latency_ms;
    if (latency_ms > metrics.max_latency_ms) {
        metrics.max_latency_ms = latency_ms;
    }
    metrics.avg_latency_ms = static_cast<double>(metrics.total_latency_ms) / metrics.requests;
}

void FlowMetrics::record_retry(const std::string& pod) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    entry(pod).retries++;
}

void FlowMetrics::record_timeout(const std::string& pod) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    entry(pod).timeouts++;
}

void FlowMetrics::record_write_failures(const std::string& pod, int64_t count) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    entry(pod).write_failures += count;
}

void FlowMetrics::record_rolling_update(const std::string& pod, bool success) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto& metrics = entry(pod);
    if (success) {
        metrics.rolling_updates++;
    } else {
        metrics.failed_rolling_updates++;
    }
}

PodMetrics FlowMetrics::pod_metrics(const std::string& pod) const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = pods_.find(pod);
    if (it == pods_.end()) {
        PodMetrics empty;
        empty.pod = pod;
        return empty;
    }
    return it->second;
}

std::vector<PodMetrics> FlowMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    std::vector<PodMetrics> result;
    for (const auto& [name, metrics] : pods_) {
        result.push_back(metrics);
    }
    return result;
}

bool FlowMetrics::export_to_csv(const std::string& filename,
                                const std::vector<PodMetrics>& metrics_list) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Write header
    file << "pod,requests,retries,timeouts,write_failures,rolling_updates,"
         << "failed_rolling_updates,avg_latency_ms,max_latency_ms,requests_per_replica\n";

    // Write data rows
    for (const auto& metrics : metrics_list) {
        std::ostringstream replicas;
        bool first = true;
        for (const auto& [replica_id, count] : metrics.requests_per_replica) {
            if (!first) {
                replicas << ";";
            }
            replicas << replica_id << ":" << count;
            first = false;
        }

        file << metrics.pod << ","
             << metrics.requests << ","
             << metrics.retries << ","
             << metrics.timeouts << ","
             << metrics.write_failures << ","
             << metrics.rolling_updates << ","
             << metrics.failed_rolling_updates << ","
             << std::fixed << std::setprecision(2) << metrics.avg_latency_ms << ","
             << metrics.max_latency_ms << ","
             << replicas.str() << "\n";
    }

    file.close();
    return true;
}

} // namespace flow
