#pragma once

#include <map>
#include <string>
#include "endpoint.h"

namespace topology {

// Hands out ports for the units of one topology.
// Explicit ports are reserved first; fresh ports come from the range in
// ascending order, skipping anything already taken. Same inputs, same ports.
class EndpointAllocator {
public:
    explicit EndpointAllocator(podflow::PortRange range);

    // Claim an explicitly requested port; throws ConfigurationError on collision
    void reserve(int port, const std::string& owner);

    // Next free port in the range; throws ConfigurationError when exhausted
    int allocate(const std::string& owner);

    // Wire a head/tail pair around a group advertised at `outer`.
    // The head listens on outer.port_in, the tail emits on outer.port_out and
    // both internal ports are fresh. Returns the endpoint every member binds to.
    podflow::Endpoint wire_group(const podflow::Endpoint& outer,
                                 podflow::Endpoint* head,
                                 podflow::Endpoint* tail,
                                 const std::string& owner);

    bool in_use(int port) const { return owners_.count(port) > 0; }

    const std::string& owner_of(int port) const { return owners_.at(port); }

    size_t size() const { return owners_.size(); }

private:
    podflow::PortRange range_;
    int next_;
    std::map<int, std::string> owners_;
};

} // namespace topology
