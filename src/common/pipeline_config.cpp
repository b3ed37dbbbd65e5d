#include "pipeline_config.h"
#include "errors.h"
#include <fstream>

using json = nlohmann::json;

namespace podflow {

namespace {

std::chrono::milliseconds millis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(j.at(key).get<int64_t>());
}

StageSpec parse_stage(const json& stage_json) {
    StageSpec stage;
    stage.name = stage_json.at("name").get<std::string>();
    stage.replicas = stage_json.value("replicas", 1);
    stage.shards = stage_json.value("shards", 1);
    stage.uses = stage_json.value("uses", "");
    stage.dump_path = stage_json.value("dump_path", "");

    if (stage_json.contains("needs")) {
        const auto& needs = stage_json["needs"];
        if (needs.is_string()) {
            stage.needs.push_back(needs.get<std::string>());
        } else {
            for (const auto& need : needs) {
                stage.needs.push_back(need.get<std::string>());
            }
        }
    }

    if (stage_json.contains("port_in")) {
        stage.port_in = stage_json["port_in"].get<int>();
    }
    if (stage_json.contains("port_out")) {
        stage.port_out = stage_json["port_out"].get<int>();
    }
    return stage;
}

} // namespace

PipelineSpec parse_pipeline(const json& j) {
    if (!j.contains("pods") || !j["pods"].is_array()) {
        throw ConfigurationError("pipeline config needs a 'pods' array");
    }

    PipelineSpec spec;
    try {
        for (const auto& stage_json : j["pods"]) {
            spec.stages.push_back(parse_stage(stage_json));
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid pod entry: ") + e.what());
    }
    return spec;
}

FlowConfig parse_flow_config(const json& j) {
    FlowConfig config;
    try {
        if (j.contains("ports")) {
            const auto& ports = j["ports"];
            config.ports.first = ports.value("first", config.ports.first);
            config.ports.last = ports.value("last", config.ports.last);
        }
        config.workspace_root = j.value("workspace", "");
        config.default_top_k = j.value("top_k", config.default_top_k);

        if (j.contains("timeouts")) {
            const auto& timeouts = j["timeouts"];
            config.request_timeout = millis(timeouts, "request_ms", config.request_timeout);
            config.readiness_timeout = millis(timeouts, "readiness_ms", config.readiness_timeout);
            config.drain_timeout = millis(timeouts, "drain_ms", config.drain_timeout);
            config.dump_timeout = millis(timeouts, "dump_ms", config.dump_timeout);
        }
        if (j.contains("merge")) {
            config.merge.truncate_to_top_k =
                j["merge"].value("truncate_to_top_k", config.merge.truncate_to_top_k);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid flow config: ") + e.what());
    }

    if (config.ports.first < 1 || config.ports.last > 65535 ||
        config.ports.first > config.ports.last) {
        throw ConfigurationError("invalid port range " + std::to_string(config.ports.first) +
                                 ".." + std::to_string(config.ports.last));
    }
    return config;
}

PipelineConfig load_pipeline_config(const std::string& json_file) {
    std::ifstream file(json_file);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open JSON file: " + json_file);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Failed to parse " + json_file + ": " + e.what());
    }

    PipelineConfig config;
    config.pipeline = parse_pipeline(j);
    config.flow = parse_flow_config(j);
    validate_pipeline(config.pipeline);
    return config;
}

} // namespace podflow
