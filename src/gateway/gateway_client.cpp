#include "gateway_client.h"
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

namespace gateway {

GatewayClient::GatewayClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(podflow::Gateway::NewStub(channel)) {}

std::unique_ptr<GatewayClient> GatewayClient::connect(const std::string& address) {
    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    return std::make_unique<GatewayClient>(channel);
}

bool GatewayClient::Index(const std::vector<podflow::Document>& docs,
                          podflow::IndexResponse& response) {
    grpc::ClientContext context;
    podflow::IndexRequest request;
    for (const auto& doc : docs) {
        *request.add_docs() = doc;
    }
    last_status_ = stub_->Index(&context, request, &response);
    return last_status_.ok();
}

bool GatewayClient::Search(const std::vector<podflow::Document>& queries, uint32_t top_k,
                           podflow::SearchResponse& response) {
    grpc::ClientContext context;
    podflow::SearchRequest request;
    for (const auto& query : queries) {
        *request.add_docs() = query;
    }
    request.set_top_k(top_k);
    last_status_ = stub_->Search(&context, request, &response);
    return last_status_.ok();
}

bool GatewayClient::RollingUpdate(const std::string& pod, podflow::RollingUpdateResponse& response,
                                  const std::string& uses, const std::string& dump_path) {
    grpc::ClientContext context;
    podflow::RollingUpdateRequest request;
    request.set_pod(pod);
    request.set_uses(uses);
    request.set_dump_path(dump_path);
    last_status_ = stub_->RollingUpdate(&context, request, &response);
    return last_status_.ok() && response.success();
}

bool GatewayClient::Dump(const std::string& pod, const std::string& path, uint32_t shards,
                         int64_t timeout_ms, podflow::DumpResponse& response) {
    grpc::ClientContext context;
    podflow::DumpRequest request;
    request.set_pod(pod);
    request.set_path(path);
    request.set_shards(shards);
    request.set_timeout_ms(timeout_ms);
    last_status_ = stub_->Dump(&context, request, &response);
    return last_status_.ok() && response.success();
}

bool GatewayClient::Topology(podflow::TopologyResponse& response) {
    grpc::ClientContext context;
    podflow::TopologyRequest request;
    last_status_ = stub_->Topology(&context, request, &response);
    return last_status_.ok();
}

} // namespace gateway
