#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "podflow.pb.h"
#include "record.h"

namespace worker {

// Where a unit instance sits in the topology
struct UnitContext {
    std::string pod;
    int replica_id = 0;
    int shard_id = 0;
    int shard_count = 1;
    std::string workspace;  // private directory of this (replica, shard)
    std::string dump_path;  // snapshot to load on warm-up, may be empty
};

// Pluggable per-shard computation hosted by a Worker. A unit is only ever
// called from its worker's thread.
class ProcessingUnit {
public:
    virtual ~ProcessingUnit() = default;

    // Called once before the worker reports ready; throwing fails the start
    virtual void warm_up(const UnitContext& context) { (void)context; }

    virtual podflow::Response process(const podflow::Request& request) = 0;

    // Whether full_scan is implemented
    virtual bool supports_scan() const { return false; }

    // Every stored record, ordered by insertion sequence
    virtual std::vector<podflow::StoredRecord> full_scan();
};

using UnitFactory = std::function<std::unique_ptr<ProcessingUnit>()>;

} // namespace worker
