#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "pod_resources.h"
#include "shard_group.h"

namespace flow {

// One interchangeable copy of a pod
class Replica {
public:
    Replica(int replica_id, std::unique_ptr<ShardGroup> shards);
    ~Replica();

    int id() const { return replica_id_; }
    ShardGroup& shards() { return *shards_; }

    void start() { shards_->start(); }
    bool wait_ready(Clock::time_point deadline) { return shards_->wait_ready(deadline); }
    void stop();

    // Count a call in flight; false once the replica stopped accepting
    bool try_acquire();
    void release();

    void stop_accepting();
    bool accepting() const { return accepting_.load(); }

    // Wait until every acquired call was released
    bool wait_drained(Clock::time_point deadline);

    int inflight() const { return inflight_.load(); }

private:
    int replica_id_;
    std::unique_ptr<ShardGroup> shards_;
    std::atomic<bool> accepting_{true};
    std::atomic<int> inflight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drained_;
};

// Holds one in-flight call on a replica
class ReplicaLease {
public:
    explicit ReplicaLease(std::shared_ptr<Replica> replica) : replica_(std::move(replica)) {}
    ~ReplicaLease() {
        if (replica_) replica_->release();
    }

    ReplicaLease(ReplicaLease&& other) noexcept : replica_(std::move(other.replica_)) {}
    ReplicaLease(const ReplicaLease&) = delete;
    ReplicaLease& operator=(const ReplicaLease&) = delete;
    ReplicaLease& operator=(ReplicaLease&&) = delete;

    Replica& operator*() const { return *replica_; }
    Replica* operator->() const { return replica_.get(); }

private:
    std::shared_ptr<Replica> replica_;
};

// Immutable view of the replica set; replaced, never modified
struct Membership {
    std::vector<std::shared_ptr<Replica>> replicas;  // indexed by replica id
    std::vector<bool> active;
    uint64_t version = 0;
};

// Replica group head: picks one active replica per request, round-robin,
// and retries calls that are safe to retry on another replica
class ReplicaGroup {
public:
    ReplicaGroup(std::string pod, std::vector<std::shared_ptr<Replica>> replicas,
                 PodResources resources);

    // Serve a request before the deadline; appends a Route for the replica used
    podflow::Response process(const podflow::Request& request, Clock::time_point deadline);

    // Next active replica accepting calls, skipping the ids in `skip`
    std::optional<ReplicaLease> select(const std::set<int>& skip = {});

    // Current membership snapshot
    std::shared_ptr<const Membership> membership() const;

    // Membership changes; each publishes a new snapshot
    void exclude(int replica_id);
    void include(int replica_id);
    std::shared_ptr<Replica> replace(int replica_id, std::shared_ptr<Replica> fresh, bool active);

    std::shared_ptr<Replica> replica(int replica_id) const;
    size_t size() const;
    size_t active_count() const;

    // Stop every replica; later calls fail with UnavailableError
    void stop_all();

private:
    void publish(std::shared_ptr<Membership> next);
    bool wait_for_change(uint64_t version, Clock::time_point until);

    std::string pod_;
    PodResources resources_;
    std::shared_ptr<const Membership> membership_;
    std::atomic<uint64_t> cursor_{0};
    std::atomic<bool> stopped_{false};

    std::mutex writer_mutex_;
    std::mutex changed_mutex_;
    std::condition_variable changed_;
};

} // namespace flow
