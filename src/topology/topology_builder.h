#pragma once

#include "endpoint_allocator.h"
#include "stage_spec.h"
#include "topology.h"

namespace topology {

// Composes pods and the gateway into a wired routing graph.
//
// Every edge A -> B ties A's output slot to B's input slot; each resulting
// group of slots shares one port, taken from an explicit override when one
// exists and from the allocator otherwise. Inside a pod, routing units are
// added only for groups with more than one member, so a 1x1 pod is a single
// worker bound directly to the pod endpoint.
class TopologyBuilder {
public:
    explicit TopologyBuilder(podflow::PortRange range) : range_(range) {}

    // Throws ConfigurationError for an invalid spec or port collision and
    // WiringError for contradicting overrides; nothing is returned half-built
    Topology build(const podflow::PipelineSpec& spec) const;

private:
    PodLayout layout_pod(const podflow::StageSpec& stage,
                         const podflow::Endpoint& outer,
                         EndpointAllocator& allocator) const;

    ReplicaLayout layout_replica(const podflow::StageSpec& stage,
                                 int replica_id,
                                 const podflow::Endpoint& outer,
                                 EndpointAllocator& allocator) const;

    podflow::PortRange range_;
};

// Name of a worker unit: "<pod>/replica-<r>/shard-<s>"
std::string worker_name(const std::string& pod, int replica_id, int shard_id);

} // namespace topology
