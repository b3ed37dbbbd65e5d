#include "flow.h"
#include "errors.h"
#include "merge.h"
#include "topology_builder.h"
#include <iostream>
#include <unordered_map>

namespace flow {

Flow::Flow(podflow::PipelineSpec spec, podflow::FlowConfig config,
           std::shared_ptr<worker::UnitRegistry> registry)
    : spec_(std::move(spec)),
      config_(std::move(config)),
      registry_(std::move(registry)),
      metrics_(std::make_shared<FlowMetrics>()) {
    if (!registry_) {
        throw podflow::ConfigurationError("flow needs a unit registry");
    }
}

Flow::~Flow() {
    close();
}

void Flow::start() {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        throw podflow::ConfigurationError("flow is already running");
    }

    podflow::validate_pipeline(spec_);
    for (const auto& stage : spec_.stages) {
        if (!registry_->contains(stage.uses)) {
            throw podflow::ConfigurationError("stage '" + stage.name + "' uses unknown unit '" +
                                              stage.uses + "'");
        }
    }
    topology_ = topology::TopologyBuilder(config_.ports).build(spec_);

    PodResources resources{registry_, config_, metrics_};
    std::vector<std::unique_ptr<Pod>> pods;
    try {
        for (const auto& layout : topology_.pods) {
            pods.push_back(std::make_unique<Pod>(layout, resources));
        }
        for (size_t index : topology_.execution_order) {
            pods[index]->start();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to start flow: " << e.what() << std::endl;
        for (auto it = pods.rbegin(); it != pods.rend(); ++it) {
            (*it)->close();
        }
        throw;
    }

    pods_ = std::move(pods);
    running_ = true;
    std::cout << "Flow started: " << pods_.size() << " pods, " << topology_.num_units()
              << " units, gateway " << podflow::to_string(topology_.gateway.endpoint) << std::endl;
}

void Flow::close() {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        return;
    }
    running_ = false;
    // Closed pods are kept until the next start so references stay valid
    for (auto it = pods_.rbegin(); it != pods_.rend(); ++it) {
        (*it)->close();
    }
    std::cout << "Flow closed" << std::endl;
}

const topology::Topology& Flow::topology() const {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        throw podflow::UnavailableError("flow is not running");
    }
    return topology_;
}

size_t Flow::num_units() const {
    return topology().num_units();
}

Pod& Flow::pod(const std::string& name) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    return find_pod(name);
}

Pod& Flow::find_pod(const std::string& name) {
    if (!running_) {
        throw podflow::UnavailableError("flow is not running");
    }
    for (auto& pod : pods_) {
        if (pod->name() == name) {
            return *pod;
        }
    }
    throw podflow::ConfigurationError("unknown pod '" + name + "'");
}

podflow::Request Flow::make_request(podflow::RequestType type,
                                    const std::vector<podflow::Document>& docs) {
    podflow::Request request;
    request.set_request_id("req-" + std::to_string(next_request_.fetch_add(1)));
    request.set_type(type);
    for (const auto& doc : docs) {
        *request.add_docs() = doc;
    }
    return request;
}

podflow::Response Flow::run(const podflow::Request& request) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        throw podflow::UnavailableError("flow is not running");
    }
    const auto deadline = Clock::now() + config_.request_timeout;

    podflow::Response entry;
    entry.set_request_id(request.request_id());
    *entry.mutable_docs() = request.docs();

    std::unordered_map<std::string, podflow::Response> outputs;
    outputs.emplace(podflow::kGatewayName, entry);

    podflow::Response trail;
    for (size_t index : topology_.execution_order) {
        auto& pod = *pods_[index];
        const auto& needs = topology_.pods[index].needs;

        std::vector<podflow::Response> inputs;
        for (const auto& upstream : needs) {
            inputs.push_back(outputs.at(upstream));
        }
        auto joined = join_responses(inputs);

        podflow::Request stage_request(request);
        *stage_request.mutable_docs() = joined.docs();

        auto response = pod.process(stage_request, deadline);
        for (const auto& route : response.routes()) {
            *trail.add_routes() = route;
        }
        for (const auto& failure : response.failures()) {
            *trail.add_failures() = failure;
        }

        podflow::Response output;
        output.set_request_id(request.request_id());
        *output.mutable_docs() = response.docs();
        outputs[pod.name()] = std::move(output);
    }

    std::vector<podflow::Response> sinks;
    for (const auto& name : topology_.sinks()) {
        sinks.push_back(outputs.at(name));
    }
    auto result = join_responses(sinks);
    *result.mutable_routes() = trail.routes();
    *result.mutable_failures() = trail.failures();
    return result;
}

IndexResult Flow::index(const std::vector<podflow::Document>& docs) {
    auto request = make_request(podflow::INDEX, docs);
    request.set_base_sequence(next_sequence_.fetch_add(docs.size()));

    auto response = run(request);

    IndexResult result;
    result.indexed = static_cast<size_t>(response.docs_size());
    result.failures.assign(response.failures().begin(), response.failures().end());
    return result;
}

SearchResult Flow::search(const std::vector<podflow::Document>& queries) {
    return search(queries, config_.default_top_k);
}

SearchResult Flow::search(const std::vector<podflow::Document>& queries, size_t top_k) {
    auto request = make_request(podflow::SEARCH, queries);
    request.set_top_k(static_cast<uint32_t>(top_k));

    auto response = run(request);

    SearchResult result;
    result.docs.assign(response.docs().begin(), response.docs().end());
    result.routes.assign(response.routes().begin(), response.routes().end());
    return result;
}

void Flow::rolling_update(const std::string& name) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    orchestrator_.rolling_update(find_pod(name));
}

void Flow::rolling_update(const std::string& name, const podflow::StageSpec& next_spec) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    orchestrator_.rolling_update(find_pod(name), next_spec);
}

dump::DumpSummary Flow::dump(const std::string& name, const std::string& path,
                             size_t shard_count, std::chrono::milliseconds timeout) {
    if (shard_count == 0) {
        throw podflow::ConfigurationError("shard count must be at least 1");
    }
    std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    auto& target = find_pod(name);
    if (timeout.count() <= 0) {
        timeout = config_.dump_timeout;
    }

    std::lock_guard<std::mutex> lock(dump_mutex_);
    const auto deadline = Clock::now() + timeout;
    auto records = target.full_scan(deadline);
    std::cout << "Dumping " << records.size() << " records of pod " << name << " to " << path
              << " in " << shard_count << " shards" << std::endl;
    return dump::write_snapshot(path, records, shard_count);
}

} // namespace flow
