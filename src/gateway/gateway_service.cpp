#include "gateway_service.h"
#include "errors.h"
#include <iostream>

namespace gateway {

grpc::Status to_status(const std::exception& error) {
    const std::string message = error.what();
    if (dynamic_cast<const podflow::ConfigurationError*>(&error) ||
        dynamic_cast<const podflow::PartitionMismatchError*>(&error)) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
    }
    if (dynamic_cast<const podflow::WiringError*>(&error)) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, message);
    }
    if (dynamic_cast<const podflow::ShardTimeoutError*>(&error)) {
        return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, message);
    }
    if (dynamic_cast<const podflow::RollingUpdateError*>(&error)) {
        return grpc::Status(grpc::StatusCode::ABORTED, message);
    }
    if (dynamic_cast<const podflow::UnavailableError*>(&error)) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, message);
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, message);
}

grpc::Status GatewayServiceImpl::Index(grpc::ServerContext* context,
                                       const podflow::IndexRequest* request,
                                       podflow::IndexResponse* response) {
    try {
        std::vector<podflow::Document> docs(request->docs().begin(), request->docs().end());
        auto result = flow_.index(docs);
        response->set_indexed(static_cast<uint32_t>(result.indexed));
        for (const auto& failure : result.failures) {
            *response->add_failures() = failure;
        }
    } catch (const std::exception& e) {
        std::cerr << "Index failed: " << e.what() << std::endl;
        return to_status(e);
    }
    return grpc::Status::OK;
}

grpc::Status GatewayServiceImpl::Search(grpc::ServerContext* context,
                                        const podflow::SearchRequest* request,
                                        podflow::SearchResponse* response) {
    try {
        std::vector<podflow::Document> queries(request->docs().begin(), request->docs().end());
        auto result = request->top_k() > 0 ? flow_.search(queries, request->top_k())
                                           : flow_.search(queries);
        for (const auto& doc : result.docs) {
            *response->add_docs() = doc;
        }
        for (const auto& route : result.routes) {
            *response->add_routes() = route;
        }
    } catch (const std::exception& e) {
        std::cerr << "Search failed: " << e.what() << std::endl;
        return to_status(e);
    }
    return grpc::Status::OK;
}

grpc::Status GatewayServiceImpl::RollingUpdate(grpc::ServerContext* context,
                                               const podflow::RollingUpdateRequest* request,
                                               podflow::RollingUpdateResponse* response) {
    try {
        if (request->uses().empty() && request->dump_path().empty()) {
            flow_.rolling_update(request->pod());
        } else {
            auto next = flow_.pod(request->pod()).spec();
            if (!request->uses().empty()) {
                next.uses = request->uses();
            }
            if (!request->dump_path().empty()) {
                next.dump_path = request->dump_path();
            }
            flow_.rolling_update(request->pod(), next);
        }
        response->set_success(true);
        response->set_message("Rolling update of " + request->pod() + " completed");
    } catch (const std::exception& e) {
        response->set_success(false);
        response->set_message(e.what());
        return to_status(e);
    }
    return grpc::Status::OK;
}

grpc::Status GatewayServiceImpl::Dump(grpc::ServerContext* context,
                                      const podflow::DumpRequest* request,
                                      podflow::DumpResponse* response) {
    try {
        auto summary = flow_.dump(request->pod(), request->path(), request->shards(),
                                  std::chrono::milliseconds(request->timeout_ms()));
        response->set_success(true);
        response->set_records(summary.total_records);
        response->set_message("Dumped " + std::to_string(summary.total_records) + " records to " +
                              summary.path);
    } catch (const std::exception& e) {
        response->set_success(false);
        response->set_message(e.what());
        return to_status(e);
    }
    return grpc::Status::OK;
}

grpc::Status GatewayServiceImpl::Topology(grpc::ServerContext* context,
                                          const podflow::TopologyRequest* request,
                                          podflow::TopologyResponse* response) {
    try {
        const auto& topology = flow_.topology();
        response->set_gateway_port_in(topology.gateway.endpoint.port_in);
        response->set_gateway_port_out(topology.gateway.endpoint.port_out);
        for (const auto& pod : topology.pods) {
            auto* info = response->add_pods();
            info->set_name(pod.name);
            info->set_port_in(pod.endpoint.port_in);
            info->set_port_out(pod.endpoint.port_out);
            info->set_replicas(pod.spec.replicas);
            info->set_shards(pod.spec.shards);
            info->set_units(static_cast<uint32_t>(pod.num_units()));
        }
        response->set_units(static_cast<uint32_t>(topology.num_units()));
    } catch (const std::exception& e) {
        return to_status(e);
    }
    return grpc::Status::OK;
}

} // namespace gateway
