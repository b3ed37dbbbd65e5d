#include "rolling_update.h"
#include "errors.h"
#include <iostream>

namespace flow {

const char* phase_name(UpdatePhase phase) {
    switch (phase) {
        case UpdatePhase::kIdle: return "idle";
        case UpdatePhase::kDraining: return "draining";
        case UpdatePhase::kRestarting: return "restarting";
        case UpdatePhase::kWarming: return "warming";
    }
    return "unknown";
}

RollingUpdateOrchestrator::RollingUpdateOrchestrator(UpdateObserver observer)
    : observer_(std::move(observer)) {}

void RollingUpdateOrchestrator::set_observer(UpdateObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

UpdateStatus RollingUpdateOrchestrator::status(const std::string& pod) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(pod);
    if (it == statuses_.end()) {
        return UpdateStatus();
    }
    return it->second;
}

void RollingUpdateOrchestrator::transition(const std::string& pod, int replica_id,
                                           UpdatePhase phase) {
    UpdateObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = statuses_[pod];
        status.phase = phase;
        status.replica_id = phase == UpdatePhase::kIdle ? -1 : replica_id;
        observer = observer_;
    }
    if (observer) {
        observer(pod, replica_id, phase);
    }
}

void RollingUpdateOrchestrator::check_compatible(const Pod& pod,
                                                 const podflow::StageSpec& next_spec) const {
    const auto current = pod.spec();
    if (next_spec.name != current.name) {
        throw podflow::ConfigurationError("rolling update of pod '" + current.name +
                                          "' cannot rename it to '" + next_spec.name + "'");
    }
    if (next_spec.replicas != current.replicas || next_spec.shards != current.shards) {
        throw podflow::ConfigurationError("rolling update of pod '" + current.name +
                                          "' cannot change replicas or shards");
    }
    if (next_spec.port_in != current.port_in || next_spec.port_out != current.port_out) {
        throw podflow::ConfigurationError("rolling update of pod '" + current.name +
                                          "' cannot move its endpoint");
    }
    if (!pod.resources().registry->contains(next_spec.uses)) {
        throw podflow::ConfigurationError("pod '" + current.name + "' uses unknown unit '" +
                                          next_spec.uses + "'");
    }
}

void RollingUpdateOrchestrator::rolling_update(Pod& pod) {
    rolling_update(pod, pod.spec());
}

void RollingUpdateOrchestrator::rolling_update(Pod& pod, const podflow::StageSpec& next_spec) {
    std::lock_guard<std::mutex> update_lock(pod.update_mutex());
    check_compatible(pod, next_spec);

    std::cout << "Rolling update of pod " << pod.name() << " started" << std::endl;
    for (int r = 0; r < next_spec.replicas; r++) {
        try {
            cycle_replica(pod, r, next_spec);
        } catch (const podflow::RollingUpdateError& e) {
            std::cerr << e.what() << std::endl;
            transition(pod.name(), r, UpdatePhase::kIdle);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                statuses_[pod.name()].failed++;
            }
            pod.resources().metrics->record_rolling_update(pod.name(), false);
            throw;
        }
    }

    pod.set_spec(next_spec);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[pod.name()].completed++;
    }
    pod.resources().metrics->record_rolling_update(pod.name(), true);
    std::cout << "Rolling update of pod " << pod.name() << " finished" << std::endl;
}

void RollingUpdateOrchestrator::cycle_replica(Pod& pod, int replica_id,
                                              const podflow::StageSpec& spec) {
    auto& group = pod.replicas();
    const auto& config = pod.resources().config;

    transition(pod.name(), replica_id, UpdatePhase::kDraining);
    group.exclude(replica_id);
    auto old = group.replica(replica_id);
    old->stop_accepting();
    if (!old->wait_drained(Clock::now() + config.drain_timeout)) {
        // Calls still queued are failed by stop() and retried elsewhere
        std::cerr << "Pod " << pod.name() << " replica " << replica_id << " still has "
                  << old->inflight() << " calls in flight after draining" << std::endl;
    }

    transition(pod.name(), replica_id, UpdatePhase::kRestarting);
    old->stop();
    std::shared_ptr<Replica> fresh;
    try {
        fresh = pod.spawn_replica(replica_id, spec);
    } catch (const std::exception& e) {
        throw podflow::RollingUpdateError(pod.name(), replica_id, e.what());
    }

    transition(pod.name(), replica_id, UpdatePhase::kWarming);
    std::string reason;
    try {
        if (!fresh->wait_ready(Clock::now() + config.readiness_timeout)) {
            reason = "not ready after " + std::to_string(config.readiness_timeout.count()) + " ms";
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }
    if (!reason.empty()) {
        fresh->stop();
        throw podflow::RollingUpdateError(pod.name(), replica_id, reason);
    }

    group.replace(replica_id, fresh, true);
    transition(pod.name(), replica_id, UpdatePhase::kIdle);
    std::cout << "Pod " << pod.name() << " replica " << replica_id << " replaced" << std::endl;
}

} // namespace flow
