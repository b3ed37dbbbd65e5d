#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "pod.h"
#include "rolling_update.h"
#include "snapshot_codec.h"
#include "stage_spec.h"
#include "topology.h"
#include "unit_registry.h"

namespace flow {

struct IndexResult {
    size_t indexed = 0;
    std::vector<podflow::ShardFailure> failures;  // partial writes, not rolled back
};

struct SearchResult {
    std::vector<podflow::Document> docs;  // queries with their matches
    std::vector<podflow::Route> routes;
};

// A running pipeline: the wired topology plus one Pod per stage
class Flow {
public:
    Flow(podflow::PipelineSpec spec, podflow::FlowConfig config = podflow::FlowConfig(),
         std::shared_ptr<worker::UnitRegistry> registry = worker::UnitRegistry::with_builtins());
    ~Flow();

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    // Build the topology and start every pod. Nothing is left running when
    // this throws.
    void start();
    // Waits for requests, dumps and rolling updates in progress
    void close();
    bool running() const { return running_.load(); }

    IndexResult index(const std::vector<podflow::Document>& docs);

    SearchResult search(const std::vector<podflow::Document>& queries);
    SearchResult search(const std::vector<podflow::Document>& queries, size_t top_k);

    void rolling_update(const std::string& pod);
    void rolling_update(const std::string& pod, const podflow::StageSpec& next_spec);

    // Snapshot the records of `pod` into `shard_count` shards under `path`.
    // A non-positive timeout uses the configured dump timeout.
    dump::DumpSummary dump(const std::string& pod, const std::string& path, size_t shard_count,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    const topology::Topology& topology() const;
    size_t num_units() const;

    // Throws ConfigurationError for unknown names and UnavailableError when
    // the flow is not running. A returned pod stays valid after close().
    Pod& pod(const std::string& name);

    FlowMetrics& metrics() { return *metrics_; }
    RollingUpdateOrchestrator& updates() { return orchestrator_; }
    const podflow::PipelineSpec& spec() const { return spec_; }
    const podflow::FlowConfig& config() const { return config_; }
    std::shared_ptr<worker::UnitRegistry> registry() const { return registry_; }

private:
    // Run a request through every pod in execution order
    podflow::Response run(const podflow::Request& request);
    // Callers hold lifecycle_mutex_
    Pod& find_pod(const std::string& name);
    podflow::Request make_request(podflow::RequestType type,
                                  const std::vector<podflow::Document>& docs);

    podflow::PipelineSpec spec_;
    podflow::FlowConfig config_;
    std::shared_ptr<worker::UnitRegistry> registry_;
    std::shared_ptr<FlowMetrics> metrics_;
    RollingUpdateOrchestrator orchestrator_;

    topology::Topology topology_;
    std::vector<std::unique_ptr<Pod>> pods_;  // spec order
    std::atomic<bool> running_{false};
    // Shared by every operation on a running flow, exclusive for start and close
    mutable std::shared_mutex lifecycle_mutex_;

    std::atomic<uint64_t> next_request_{0};
    std::atomic<uint64_t> next_sequence_{0};
    std::mutex dump_mutex_;
};

} // namespace flow
