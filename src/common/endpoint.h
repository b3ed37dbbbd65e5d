#pragma once

#include <string>

namespace podflow {

// The two addresses a routable unit exposes
struct Endpoint {
    int port_in = 0;
    int port_out = 0;
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.port_in == b.port_in && a.port_out == b.port_out;
}

inline bool operator!=(const Endpoint& a, const Endpoint& b) {
    return !(a == b);
}

inline std::string to_string(const Endpoint& endpoint) {
    return std::to_string(endpoint.port_in) + "->" + std::to_string(endpoint.port_out);
}

// Inclusive range fresh ports are drawn from
struct PortRange {
    int first = 52000;
    int last = 52999;
};

} // namespace podflow
