#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "pod.h"

namespace flow {

enum class UpdatePhase {
    kIdle,
    kDraining,
    kRestarting,
    kWarming
};

const char* phase_name(UpdatePhase phase);

struct UpdateStatus {
    UpdatePhase phase = UpdatePhase::kIdle;
    int replica_id = -1;
    uint64_t completed = 0;  // finished rolling updates of the pod
    uint64_t failed = 0;
};

// Receives every (pod, replica, phase) transition
using UpdateObserver = std::function<void(const std::string&, int, UpdatePhase)>;

// Cycles the replicas of a pod one at a time: exclude from selection, drain,
// stop, spawn a fresh replica, wait for it, put it back. Updates of the same
// pod are serialized; different pods proceed independently.
class RollingUpdateOrchestrator {
public:
    explicit RollingUpdateOrchestrator(UpdateObserver observer = nullptr);

    // Restart every replica from the pod's current spec
    void rolling_update(Pod& pod);

    // Restart every replica from `next_spec`, which may change uses and
    // dump_path only. Throws RollingUpdateError naming the replica that did
    // not become ready; the replicas cycled before it keep the new spec and
    // the failed one stays out of rotation.
    void rolling_update(Pod& pod, const podflow::StageSpec& next_spec);

    UpdateStatus status(const std::string& pod) const;

    void set_observer(UpdateObserver observer);

private:
    void check_compatible(const Pod& pod, const podflow::StageSpec& next_spec) const;
    void cycle_replica(Pod& pod, int replica_id, const podflow::StageSpec& spec);
    void transition(const std::string& pod, int replica_id, UpdatePhase phase);

    std::map<std::string, UpdateStatus> statuses_;
    UpdateObserver observer_;
    mutable std::mutex mutex_;
};

} // namespace flow
