#include "topology.h"
#include "errors.h"

namespace topology {

namespace {

void expect(bool condition, const std::string& what) {
    if (!condition) {
        throw podflow::WiringError(what);
    }
}

void validate_replica(const PodLayout& pod, const ReplicaLayout& replica) {
    const std::string where = "pod '" + pod.name + "' replica " + std::to_string(replica.replica_id);
    expect(replica.workers.size() == static_cast<size_t>(pod.spec.shards),
           where + " has " + std::to_string(replica.workers.size()) + " workers, expected " +
               std::to_string(pod.spec.shards));
    expect(replica.head.has_value() == (pod.spec.shards > 1) &&
               replica.tail.has_value() == (pod.spec.shards > 1),
           where + " has routing units that do not match its shard count");

    if (!replica.head) {
        expect(replica.workers.front().endpoint == replica.endpoint,
               where + " sole worker is not bound to the replica endpoint");
        return;
    }

    expect(replica.head->endpoint.port_in == replica.endpoint.port_in,
           where + " shard head does not listen on the replica input");
    expect(replica.tail->endpoint.port_out == replica.endpoint.port_out,
           where + " shard tail does not emit on the replica output");
    for (const auto& worker : replica.workers) {
        expect(worker.endpoint.port_in == replica.head->endpoint.port_out,
               where + " worker " + worker.name + " is not fed by the shard head");
        expect(worker.endpoint.port_out == replica.tail->endpoint.port_in,
               where + " worker " + worker.name + " does not feed the shard tail");
    }
}

void validate_pod(const PodLayout& pod) {
    const std::string where = "pod '" + pod.name + "'";
    expect(pod.replicas.size() == static_cast<size_t>(pod.spec.replicas),
           where + " has " + std::to_string(pod.replicas.size()) + " replicas, expected " +
               std::to_string(pod.spec.replicas));
    expect(pod.head_endpoint().port_in == pod.endpoint.port_in,
           where + " head does not listen on the pod input");
    expect(pod.tail_endpoint().port_out == pod.endpoint.port_out,
           where + " tail does not emit on the pod output");

    if (pod.head) {
        expect(pod.tail.has_value(), where + " has a head without a tail");
        for (const auto& replica : pod.replicas) {
            expect(replica.endpoint.port_in == pod.head->endpoint.port_out,
                   where + " replica " + std::to_string(replica.replica_id) +
                       " is not fed by the replica head");
            expect(replica.endpoint.port_out == pod.tail->endpoint.port_in,
                   where + " replica " + std::to_string(replica.replica_id) +
                       " does not feed the replica tail");
        }
    } else {
        expect(pod.replicas.size() == 1 && pod.replicas.front().endpoint == pod.endpoint,
               where + " single replica is not bound to the pod endpoint");
    }

    for (const auto& replica : pod.replicas) {
        validate_replica(pod, replica);
    }
}

} // namespace

const char* role_name(UnitRole role) {
    switch (role) {
        case UnitRole::kGateway: return "gateway";
        case UnitRole::kWorker: return "worker";
        case UnitRole::kShardHead: return "shard-head";
        case UnitRole::kShardTail: return "shard-tail";
        case UnitRole::kReplicaHead: return "replica-head";
        case UnitRole::kReplicaTail: return "replica-tail";
    }
    return "unknown";
}

size_t ReplicaLayout::num_units() const {
    return workers.size() + (head ? 1 : 0) + (tail ? 1 : 0);
}

const podflow::Endpoint& PodLayout::head_endpoint() const {
    if (head) return head->endpoint;
    const auto& replica = replicas.front();
    if (replica.head) return replica.head->endpoint;
    return replica.workers.front().endpoint;
}

const podflow::Endpoint& PodLayout::tail_endpoint() const {
    if (tail) return tail->endpoint;
    const auto& replica = replicas.front();
    if (replica.tail) return replica.tail->endpoint;
    return replica.workers.front().endpoint;
}

size_t PodLayout::num_units() const {
    size_t units = (head ? 1 : 0) + (tail ? 1 : 0);
    for (const auto& replica : replicas) {
        units += replica.num_units();
    }
    return units;
}

size_t PodLayout::routing_hops() const {
    size_t hops = (head ? 1 : 0) + (tail ? 1 : 0);
    for (const auto& replica : replicas) {
        hops += (replica.head ? 1 : 0) + (replica.tail ? 1 : 0);
    }
    return hops;
}

const PodLayout* Topology::find(const std::string& name) const {
    for (const auto& pod : pods) {
        if (pod.name == name) return &pod;
    }
    return nullptr;
}

const podflow::Endpoint& Topology::endpoint_of(const std::string& name) const {
    if (name == podflow::kGatewayName) return gateway.endpoint;
    const PodLayout* pod = find(name);
    if (!pod) {
        throw podflow::WiringError("edge refers to unknown pod '" + name + "'");
    }
    return pod->endpoint;
}

std::vector<std::string> Topology::sinks() const {
    std::vector<std::string> result;
    for (const auto& [from, to] : edges) {
        if (to == podflow::kGatewayName) {
            result.push_back(from);
        }
    }
    return result;
}

size_t Topology::num_units() const {
    size_t units = 1;
    for (const auto& pod : pods) {
        units += pod.num_units();
    }
    return units;
}

void validate_wiring(const Topology& topology) {
    for (const auto& [from, to] : topology.edges) {
        const auto& out = topology.endpoint_of(from);
        const auto& in = topology.endpoint_of(to);
        expect(out.port_out == in.port_in,
               "edge " + from + " -> " + to + " breaks the port chain: " +
                   std::to_string(out.port_out) + " != " + std::to_string(in.port_in));
    }
    for (const auto& pod : topology.pods) {
        validate_pod(pod);
    }
}

} // namespace topology
