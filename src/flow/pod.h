#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "pod_resources.h"
#include "replica_group.h"
#include "topology.h"

namespace flow {

// Runtime of one pipeline stage: R replicas behind a replica group head,
// reachable through the endpoints fixed by its layout
class Pod {
public:
    Pod(topology::PodLayout layout, PodResources resources);
    ~Pod();

    Pod(const Pod&) = delete;
    Pod& operator=(const Pod&) = delete;

    // Spawn every replica and wait until all are ready. On failure nothing
    // is left running and the error propagates.
    void start();
    void close();
    bool running() const { return group_ != nullptr; }

    podflow::Response process(const podflow::Request& request, Clock::time_point deadline);

    // Union of the records held by the active replicas; the latest write of
    // an id wins and the result is ordered by insertion sequence
    std::vector<podflow::StoredRecord> full_scan(Clock::time_point deadline);

    // Create and start (without waiting) replica `replica_id` from `spec`
    std::shared_ptr<Replica> spawn_replica(int replica_id, const podflow::StageSpec& spec) const;

    const std::string& name() const { return layout_.name; }
    const topology::PodLayout& layout() const { return layout_; }
    const PodResources& resources() const { return resources_; }
    ReplicaGroup& replicas();

    podflow::StageSpec spec() const;
    void set_spec(podflow::StageSpec spec);

    // Held for the whole of a rolling update of this pod
    std::mutex& update_mutex() { return update_mutex_; }

    size_t num_units() const { return layout_.num_units(); }

private:
    std::string workspace_of(int replica_id, int shard_id) const;

    topology::PodLayout layout_;
    PodResources resources_;
    podflow::StageSpec spec_;
    std::unique_ptr<ReplicaGroup> group_;
    mutable std::mutex spec_mutex_;
    std::mutex update_mutex_;
};

} // namespace flow
