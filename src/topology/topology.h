#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "endpoint.h"
#include "stage_spec.h"

namespace topology {

enum class UnitRole {
    kGateway,
    kWorker,
    kShardHead,
    kShardTail,
    kReplicaHead,
    kReplicaTail,
};

const char* role_name(UnitRole role);

// A single routable unit and the endpoints it fans to or collects from
struct UnitLayout {
    std::string name;
    UnitRole role = UnitRole::kWorker;
    podflow::Endpoint endpoint;
    int replica_id = -1;
    int shard_id = -1;
    std::vector<podflow::Endpoint> fan;  // heads and tails only
};

// One replica: a shard group, with head/tail only when shards > 1
struct ReplicaLayout {
    int replica_id = 0;
    podflow::Endpoint endpoint;
    std::optional<UnitLayout> head;
    std::optional<UnitLayout> tail;
    std::vector<UnitLayout> workers;

    size_t num_units() const;
};

// A pod: one replica group, with head/tail only when replicas > 1
struct PodLayout {
    std::string name;
    podflow::StageSpec spec;
    podflow::Endpoint endpoint;       // external, stable for the life of the pod
    std::optional<UnitLayout> head;
    std::optional<UnitLayout> tail;
    std::vector<ReplicaLayout> replicas;
    std::vector<std::string> needs;   // resolved upstream names, may be the gateway

    // Endpoint of the first unit a message entering the pod reaches
    const podflow::Endpoint& head_endpoint() const;

    // Endpoint of the last unit a message leaving the pod passes
    const podflow::Endpoint& tail_endpoint() const;

    // R * (P + (P > 1 ? 2 : 0)) + (R > 1 ? 2 : 0)
    size_t num_units() const;

    // Routing units (heads and tails) at every level of the pod
    size_t routing_hops() const;
};

struct Topology {
    UnitLayout gateway;
    std::vector<PodLayout> pods;                             // spec order
    std::vector<size_t> execution_order;                     // indices into pods
    std::vector<std::pair<std::string, std::string>> edges;  // from -> to, gateway included

    const PodLayout* find(const std::string& name) const;

    // External endpoint of a pod or of the gateway
    const podflow::Endpoint& endpoint_of(const std::string& name) const;

    // Names of pods feeding the gateway's exit
    std::vector<std::string> sinks() const;

    // Every pod's units plus the gateway
    size_t num_units() const;
};

// Check the chained-port invariant on every edge and the head/tail wiring
// inside every pod and replica; throws WiringError on the first violation
void validate_wiring(const Topology& topology);

} // namespace topology
