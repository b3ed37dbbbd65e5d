#include "topology_builder.h"
#include "errors.h"
#include <map>
#include <numeric>
#include <unordered_map>

namespace topology {

namespace {

// Union-find over port slots. Slot 0 is the gateway's output, slot 1 its
// input, then two slots (in, out) per stage.
class PortSlots {
public:
    explicit PortSlots(size_t count) : parent_(count) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t find(size_t slot) {
        while (parent_[slot] != slot) {
            parent_[slot] = parent_[parent_[slot]];
            slot = parent_[slot];
        }
        return slot;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        // Lower slot stays the root so allocation order is stable
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

    size_t size() const { return parent_.size(); }

private:
    std::vector<size_t> parent_;
};

constexpr size_t kGatewayOut = 0;
constexpr size_t kGatewayIn = 1;

size_t in_slot(size_t stage) { return 2 + 2 * stage; }
size_t out_slot(size_t stage) { return 3 + 2 * stage; }

std::string slot_owner(const podflow::PipelineSpec& spec, size_t slot) {
    if (slot == kGatewayOut) return "gateway/out";
    if (slot == kGatewayIn) return "gateway/in";
    size_t stage = (slot - 2) / 2;
    return spec.stages[stage].name + ((slot % 2 == 0) ? "/in" : "/out");
}

} // namespace

std::string worker_name(const std::string& pod, int replica_id, int shard_id) {
    return pod + "/replica-" + std::to_string(replica_id) + "/shard-" + std::to_string(shard_id);
}

Topology TopologyBuilder::build(const podflow::PipelineSpec& spec) const {
    podflow::validate_pipeline(spec);

    Topology topology;
    topology.execution_order = podflow::topological_sort(spec);

    std::unordered_map<std::string, size_t> index_of;
    for (size_t i = 0; i < spec.stages.size(); i++) {
        index_of[spec.stages[i].name] = i;
    }

    // Tie every edge's output slot to its input slot
    PortSlots slots(2 + 2 * spec.stages.size());
    std::vector<bool> has_dependents(spec.stages.size(), false);
    std::vector<std::vector<std::string>> needs(spec.stages.size());
    for (size_t i = 0; i < spec.stages.size(); i++) {
        needs[i] = podflow::effective_needs(spec, i);
        for (const auto& need : needs[i]) {
            if (need == podflow::kGatewayName) {
                slots.unite(kGatewayOut, in_slot(i));
            } else {
                size_t from = index_of.at(need);
                slots.unite(out_slot(from), in_slot(i));
                has_dependents[from] = true;
            }
            topology.edges.emplace_back(need, spec.stages[i].name);
        }
    }
    for (size_t i = 0; i < spec.stages.size(); i++) {
        if (!has_dependents[i]) {
            slots.unite(out_slot(i), kGatewayIn);
            topology.edges.emplace_back(spec.stages[i].name, podflow::kGatewayName);
        }
    }

    // A stage whose input and output land on one link would read its own output
    for (size_t i = 0; i < spec.stages.size(); i++) {
        if (slots.find(in_slot(i)) == slots.find(out_slot(i))) {
            throw podflow::ConfigurationError(
                "stage " + spec.stages[i].name + " would read its own output: its input and "
                "output end up on the same link");
        }
    }

    // Explicit overrides pin a slot group to a port
    std::map<size_t, int> group_port;
    std::map<size_t, size_t> group_pinned_by;
    auto pin = [&](size_t slot, int port) {
        size_t root = slots.find(slot);
        auto it = group_port.find(root);
        if (it != group_port.end() && it->second != port) {
            throw podflow::WiringError(
                slot_owner(spec, slot) + " requests port " + std::to_string(port) + " but " +
                slot_owner(spec, group_pinned_by[root]) + " on the same link requests " +
                std::to_string(it->second));
        }
        group_port[root] = port;
        group_pinned_by[root] = slot;
    };
    for (size_t i = 0; i < spec.stages.size(); i++) {
        if (spec.stages[i].port_in) pin(in_slot(i), *spec.stages[i].port_in);
        if (spec.stages[i].port_out) pin(out_slot(i), *spec.stages[i].port_out);
    }

    EndpointAllocator allocator(range_);
    for (const auto& [root, port] : group_port) {
        allocator.reserve(port, slot_owner(spec, root));
    }
    for (size_t slot = 0; slot < slots.size(); slot++) {
        size_t root = slots.find(slot);
        if (group_port.count(root) == 0) {
            group_port[root] = allocator.allocate(slot_owner(spec, root));
        }
    }
    auto port_of = [&](size_t slot) { return group_port.at(slots.find(slot)); };

    topology.gateway.name = podflow::kGatewayName;
    topology.gateway.role = UnitRole::kGateway;
    topology.gateway.endpoint = podflow::Endpoint{port_of(kGatewayIn), port_of(kGatewayOut)};

    for (size_t i = 0; i < spec.stages.size(); i++) {
        podflow::Endpoint outer{port_of(in_slot(i)), port_of(out_slot(i))};
        PodLayout pod = layout_pod(spec.stages[i], outer, allocator);
        pod.needs = needs[i];
        topology.pods.push_back(std::move(pod));
    }

    validate_wiring(topology);
    return topology;
}

PodLayout TopologyBuilder::layout_pod(const podflow::StageSpec& stage,
                                      const podflow::Endpoint& outer,
                                      EndpointAllocator& allocator) const {
    PodLayout pod;
    pod.name = stage.name;
    pod.spec = stage;
    pod.endpoint = outer;

    podflow::Endpoint replica_endpoint = outer;
    if (stage.replicas > 1) {
        UnitLayout head{stage.name + "/head", UnitRole::kReplicaHead};
        UnitLayout tail{stage.name + "/tail", UnitRole::kReplicaTail};
        replica_endpoint = allocator.wire_group(outer, &head.endpoint, &tail.endpoint, stage.name);
        pod.head = std::move(head);
        pod.tail = std::move(tail);
    }

    for (int r = 0; r < stage.replicas; r++) {
        pod.replicas.push_back(layout_replica(stage, r, replica_endpoint, allocator));
    }

    if (pod.head) {
        for (const auto& replica : pod.replicas) {
            pod.head->fan.push_back(replica.endpoint);
            pod.tail->fan.push_back(replica.endpoint);
        }
    }
    return pod;
}

ReplicaLayout TopologyBuilder::layout_replica(const podflow::StageSpec& stage,
                                              int replica_id,
                                              const podflow::Endpoint& outer,
                                              EndpointAllocator& allocator) const {
    ReplicaLayout replica;
    replica.replica_id = replica_id;
    replica.endpoint = outer;

    const std::string owner = stage.name + "/replica-" + std::to_string(replica_id);
    podflow::Endpoint worker_endpoint = outer;
    if (stage.shards > 1) {
        UnitLayout head{owner + "/head", UnitRole::kShardHead};
        UnitLayout tail{owner + "/tail", UnitRole::kShardTail};
        head.replica_id = tail.replica_id = replica_id;
        worker_endpoint = allocator.wire_group(outer, &head.endpoint, &tail.endpoint, owner);
        replica.head = std::move(head);
        replica.tail = std::move(tail);
    }

    for (int s = 0; s < stage.shards; s++) {
        UnitLayout worker{worker_name(stage.name, replica_id, s), UnitRole::kWorker, worker_endpoint,
                          replica_id, s};
        replica.workers.push_back(std::move(worker));
        if (replica.head) {
            replica.head->fan.push_back(worker_endpoint);
            replica.tail->fan.push_back(worker_endpoint);
        }
    }
    return replica;
}

} // namespace topology
