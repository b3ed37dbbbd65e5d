#include "pod.h"
#include "errors.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <unordered_map>

namespace flow {

Pod::Pod(topology::PodLayout layout, PodResources resources)
    : layout_(std::move(layout)), resources_(std::move(resources)), spec_(layout_.spec) {}

Pod::~Pod() {
    close();
}

std::string Pod::workspace_of(int replica_id, int shard_id) const {
    if (resources_.config.workspace_root.empty()) {
        return "";
    }
    auto dir = std::filesystem::path(resources_.config.workspace_root) /
               (layout_.name + "-" + std::to_string(replica_id) + "-" + std::to_string(shard_id));
    return dir.string();
}

std::shared_ptr<Replica> Pod::spawn_replica(int replica_id, const podflow::StageSpec& spec) const {
    const auto& replica_layout = layout_.replicas.at(replica_id);

    std::vector<std::unique_ptr<worker::Worker>> workers;
    for (const auto& unit : replica_layout.workers) {
        worker::UnitContext context;
        context.pod = layout_.name;
        context.replica_id = replica_id;
        context.shard_id = unit.shard_id;
        context.shard_count = spec.shards;
        context.workspace = workspace_of(replica_id, unit.shard_id);
        context.dump_path = spec.dump_path;

        workers.push_back(std::make_unique<worker::Worker>(
            unit.name, unit.endpoint, std::move(context), resources_.registry->create(spec.uses)));
    }

    auto shards = std::make_unique<ShardGroup>(layout_.name, replica_id, std::move(workers),
                                               resources_.config.merge);
    auto replica = std::make_shared<Replica>(replica_id, std::move(shards));
    replica->start();
    return replica;
}

void Pod::start() {
    if (group_) {
        throw podflow::ConfigurationError("pod '" + layout_.name + "' is already started");
    }
    const auto spec = this->spec();
    const auto deadline = Clock::now() + resources_.config.readiness_timeout;

    std::vector<std::shared_ptr<Replica>> replicas;
    try {
        for (int r = 0; r < spec.replicas; r++) {
            replicas.push_back(spawn_replica(r, spec));
        }
        for (auto& replica : replicas) {
            if (!replica->wait_ready(deadline)) {
                throw podflow::UnavailableError("pod '" + layout_.name + "' replica " +
                                                std::to_string(replica->id()) +
                                                " was not ready in time");
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to start pod " << layout_.name << ": " << e.what() << std::endl;
        for (auto& replica : replicas) {
            replica->stop();
        }
        throw;
    }

    group_ = std::make_unique<ReplicaGroup>(layout_.name, std::move(replicas), resources_);
    std::cout << "Pod " << layout_.name << " started: " << spec.replicas << " replicas x "
              << spec.shards << " shards, " << podflow::to_string(layout_.endpoint) << std::endl;
}

void Pod::close() {
    // Never tear down replicas under a rolling update
    std::lock_guard<std::mutex> update_lock(update_mutex_);
    if (!group_) {
        return;
    }
    group_->stop_all();
    group_.reset();
    std::cout << "Pod " << layout_.name << " closed" << std::endl;
}

ReplicaGroup& Pod::replicas() {
    if (!group_) {
        throw podflow::UnavailableError("pod '" + layout_.name + "' is not running");
    }
    return *group_;
}

podflow::Response Pod::process(const podflow::Request& request, Clock::time_point deadline) {
    return replicas().process(request, deadline);
}

std::vector<podflow::StoredRecord> Pod::full_scan(Clock::time_point deadline) {
    auto current = replicas().membership();

    std::unordered_map<std::string, podflow::StoredRecord> latest;
    size_t scanned = 0;
    for (size_t r = 0; r < current->replicas.size(); r++) {
        if (!current->active[r]) {
            continue;
        }
        const auto& replica = current->replicas[r];
        if (!replica->try_acquire()) {
            continue;
        }
        ReplicaLease lease(replica);
        for (auto& record : lease->shards().full_scan(deadline)) {
            auto it = latest.find(record.id);
            if (it == latest.end()) {
                latest.emplace(record.id, std::move(record));
            } else if (record.sequence > it->second.sequence) {
                it->second = std::move(record);
            }
        }
        scanned++;
    }
    if (scanned == 0) {
        throw podflow::UnavailableError("no active replica of pod '" + layout_.name +
                                        "' could be scanned");
    }

    std::vector<podflow::StoredRecord> records;
    records.reserve(latest.size());
    for (auto& entry : latest) {
        records.push_back(std::move(entry.second));
    }
    std::sort(records.begin(), records.end(),
              [](const podflow::StoredRecord& a, const podflow::StoredRecord& b) {
                  if (a.sequence != b.sequence) return a.sequence < b.sequence;
                  return a.id < b.id;
              });
    return records;
}

podflow::StageSpec Pod::spec() const {
    std::lock_guard<std::mutex> lock(spec_mutex_);
    return spec_;
}

void Pod::set_spec(podflow::StageSpec spec) {
    std::lock_guard<std::mutex> lock(spec_mutex_);
    spec_ = std::move(spec);
}

} // namespace flow
