#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "stage_spec.h"

namespace podflow {

// Pipeline plus the flow configuration it runs with
struct PipelineConfig {
    PipelineSpec pipeline;
    FlowConfig flow;
};

// Parse stages from {"pods": [...]}
PipelineSpec parse_pipeline(const nlohmann::json& j);

// Parse ports, workspace, timeouts and merge options; absent keys keep defaults
FlowConfig parse_flow_config(const nlohmann::json& j);

// Load and validate a JSON pipeline file
PipelineConfig load_pipeline_config(const std::string& json_file);

} // namespace podflow
