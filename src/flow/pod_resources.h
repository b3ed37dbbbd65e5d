#pragma once

#include <memory>
#include "metrics.h"
#include "stage_spec.h"
#include "unit_registry.h"

namespace flow {

// What every pod of a flow shares
struct PodResources {
    std::shared_ptr<const worker::UnitRegistry> registry;
    podflow::FlowConfig config;
    std::shared_ptr<FlowMetrics> metrics;
};

} // namespace flow
