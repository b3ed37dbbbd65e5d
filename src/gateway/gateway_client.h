#pragma once

#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "podflow.grpc.pb.h"

namespace gateway {

// gRPC client wrapper for a podflow gateway
class GatewayClient {
public:
    explicit GatewayClient(std::shared_ptr<grpc::Channel> channel);

    // Connect to "host:port" without credentials
    static std::unique_ptr<GatewayClient> connect(const std::string& address);

    bool Index(const std::vector<podflow::Document>& docs, podflow::IndexResponse& response);
    bool Search(const std::vector<podflow::Document>& queries, uint32_t top_k,
                podflow::SearchResponse& response);
    bool RollingUpdate(const std::string& pod, podflow::RollingUpdateResponse& response,
                       const std::string& uses = "", const std::string& dump_path = "");
    bool Dump(const std::string& pod, const std::string& path, uint32_t shards,
              int64_t timeout_ms, podflow::DumpResponse& response);
    bool Topology(podflow::TopologyResponse& response);

    // Status of the most recent call
    const grpc::Status& last_status() const { return last_status_; }

private:
    std::unique_ptr<podflow::Gateway::Stub> stub_;
    grpc::Status last_status_;
};

} // namespace gateway
