#include "replica_group.h"
#include "errors.h"
#include <algorithm>
#include <iostream>

namespace flow {

namespace {

// Upper bound on one wait for membership to change before re-polling
constexpr std::chrono::milliseconds kSelectPoll{20};

} // namespace

Replica::Replica(int replica_id, std::unique_ptr<ShardGroup> shards)
    : replica_id_(replica_id), shards_(std::move(shards)) {}

Replica::~Replica() {
    stop();
}

void Replica::stop() {
    accepting_.store(false);
    shards_->stop();
}

bool Replica::try_acquire() {
    inflight_.fetch_add(1);
    if (!accepting_.load()) {
        release();
        return false;
    }
    return true;
}

void Replica::release() {
    if (inflight_.fetch_sub(1) == 1) {
        std::lock_guard<std::mutex> lock(drain_mutex_);
        drained_.notify_all();
    }
}

void Replica::stop_accepting() {
    accepting_.store(false);
}

bool Replica::wait_drained(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(drain_mutex_);
    return drained_.wait_until(lock, deadline, [this] { return inflight_.load() == 0; });
}

ReplicaGroup::ReplicaGroup(std::string pod, std::vector<std::shared_ptr<Replica>> replicas,
                           PodResources resources)
    : pod_(std::move(pod)), resources_(std::move(resources)) {
    auto initial = std::make_shared<Membership>();
    initial->active.assign(replicas.size(), true);
    initial->replicas = std::move(replicas);
    membership_ = initial;
}

std::shared_ptr<const Membership> ReplicaGroup::membership() const {
    return std::atomic_load(&membership_);
}

void ReplicaGroup::publish(std::shared_ptr<Membership> next) {
    next->version++;
    std::atomic_store(&membership_, std::shared_ptr<const Membership>(std::move(next)));
    {
        std::lock_guard<std::mutex> lock(changed_mutex_);
    }
    changed_.notify_all();
}

std::optional<ReplicaLease> ReplicaGroup::select(const std::set<int>& skip) {
    auto current = membership();
    const size_t count = current->replicas.size();
    if (count == 0) {
        return std::nullopt;
    }
    const size_t start = cursor_.fetch_add(1) % count;
    for (size_t i = 0; i < count; i++) {
        size_t index = (start + i) % count;
        if (!current->active[index] || skip.count(static_cast<int>(index))) {
            continue;
        }
        const auto& replica = current->replicas[index];
        if (replica && replica->try_acquire()) {
            return ReplicaLease(replica);
        }
    }
    return std::nullopt;
}

bool ReplicaGroup::wait_for_change(uint64_t version, Clock::time_point until) {
    std::unique_lock<std::mutex> lock(changed_mutex_);
    return changed_.wait_until(lock, until, [this, version] {
        return membership()->version != version || stopped_.load();
    });
}

podflow::Response ReplicaGroup::process(const podflow::Request& request,
                                        Clock::time_point deadline) {
    const auto started = Clock::now();
    std::set<int> tried;

    while (true) {
        if (stopped_.load()) {
            throw podflow::UnavailableError("pod '" + pod_ + "' is closed");
        }
        if (Clock::now() >= deadline) {
            resources_.metrics->record_timeout(pod_);
            throw podflow::ShardTimeoutError(pod_, -1, -1, "no replica answered before the deadline");
        }

        uint64_t version = membership()->version;
        auto lease = select(tried);
        if (!lease) {
            // Nothing selectable right now: a replica is being cycled or
            // every one failed this call. Wait for the set to change.
            tried.clear();
            wait_for_change(version, std::min(deadline, Clock::now() + kSelectPoll));
            continue;
        }

        const int replica_id = (*lease)->id();
        try {
            auto response = (*lease)->shards().process(request, deadline);
            auto* route = response.add_routes();
            route->set_pod(pod_);
            route->set_replica(replica_id);

            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - started).count();
            resources_.metrics->record_request(pod_, replica_id, latency);
            if (response.failures_size() > 0) {
                resources_.metrics->record_write_failures(pod_, response.failures_size());
            }
            return response;
        } catch (const podflow::UnavailableError& e) {
            std::cerr << "Pod " << pod_ << " replica " << replica_id
                      << " unavailable, retrying: " << e.what() << std::endl;
        } catch (const podflow::ShardTimeoutError& e) {
            resources_.metrics->record_timeout(pod_);
            if (request.type() != podflow::SEARCH) {
                throw;
            }
            std::cerr << "Pod " << pod_ << " replica " << replica_id
                      << " timed out, retrying: " << e.what() << std::endl;
        }
        resources_.metrics->record_retry(pod_);
        tried.insert(replica_id);
    }
}

void ReplicaGroup::exclude(int replica_id) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto next = std::make_shared<Membership>(*membership());
    next->active.at(replica_id) = false;
    publish(std::move(next));
}

void ReplicaGroup::include(int replica_id) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto next = std::make_shared<Membership>(*membership());
    next->active.at(replica_id) = true;
    publish(std::move(next));
}

std::shared_ptr<Replica> ReplicaGroup::replace(int replica_id, std::shared_ptr<Replica> fresh,
                                               bool active) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto next = std::make_shared<Membership>(*membership());
    auto previous = next->replicas.at(replica_id);
    next->replicas[replica_id] = std::move(fresh);
    next->active[replica_id] = active;
    publish(std::move(next));
    return previous;
}

std::shared_ptr<Replica> ReplicaGroup::replica(int replica_id) const {
    return membership()->replicas.at(replica_id);
}

size_t ReplicaGroup::size() const {
    return membership()->replicas.size();
}

size_t ReplicaGroup::active_count() const {
    auto current = membership();
    return static_cast<size_t>(std::count(current->active.begin(), current->active.end(), true));
}

void ReplicaGroup::stop_all() {
    stopped_.store(true);
    changed_.notify_all();
    auto current = membership();
    for (const auto& replica : current->replicas) {
        if (replica) {
            replica->stop_accepting();
        }
    }
    for (const auto& replica : current->replicas) {
        if (replica) {
            replica->wait_drained(Clock::now() + resources_.config.drain_timeout);
            replica->stop();
        }
    }
}

} // namespace flow
