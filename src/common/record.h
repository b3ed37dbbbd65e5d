#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace podflow {

// One persisted record as returned by a unit's full scan
struct StoredRecord {
    std::string id;
    std::vector<float> vector;
    std::string metadata;   // serialized Document without its embedding
    uint64_t sequence = 0;  // flow-wide insertion order
};

} // namespace podflow
