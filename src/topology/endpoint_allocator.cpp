#include "endpoint_allocator.h"
#include "errors.h"

namespace topology {

EndpointAllocator::EndpointAllocator(podflow::PortRange range)
    : range_(range), next_(range.first) {
    if (range_.first < 1 || range_.last > 65535 || range_.first > range_.last) {
        throw podflow::ConfigurationError("invalid port range " + std::to_string(range_.first) +
                                          ".." + std::to_string(range_.last));
    }
}

void EndpointAllocator::reserve(int port, const std::string& owner) {
    if (port < 1 || port > 65535) {
        throw podflow::ConfigurationError("port " + std::to_string(port) + " requested by " +
                                          owner + " is not a valid port");
    }
    auto it = owners_.find(port);
    if (it != owners_.end()) {
        throw podflow::ConfigurationError("port " + std::to_string(port) + " requested by " +
                                          owner + " is already used by " + it->second);
    }
    owners_[port] = owner;
}

int EndpointAllocator::allocate(const std::string& owner) {
    while (next_ <= range_.last && in_use(next_)) {
        next_++;
    }
    if (next_ > range_.last) {
        throw podflow::ConfigurationError("port range " + std::to_string(range_.first) + ".." +
                                          std::to_string(range_.last) +
                                          " exhausted while allocating for " + owner);
    }
    int port = next_++;
    owners_[port] = owner;
    return port;
}

podflow::Endpoint EndpointAllocator::wire_group(const podflow::Endpoint& outer,
                                                podflow::Endpoint* head,
                                                podflow::Endpoint* tail,
                                                const std::string& owner) {
    head->port_in = outer.port_in;
    head->port_out = allocate(owner + "/head");
    tail->port_in = allocate(owner + "/tail");
    tail->port_out = outer.port_out;
    return podflow::Endpoint{head->port_out, tail->port_in};
}

} // namespace topology
