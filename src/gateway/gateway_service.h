#pragma once

#include <grpcpp/grpcpp.h>
#include "flow.h"
#include "podflow.grpc.pb.h"

namespace gateway {

// gRPC front of a running Flow
class GatewayServiceImpl final : public podflow::Gateway::Service {
public:
    explicit GatewayServiceImpl(flow::Flow& flow) : flow_(flow) {}

    grpc::Status Index(grpc::ServerContext* context, const podflow::IndexRequest* request,
                       podflow::IndexResponse* response) override;

    grpc::Status Search(grpc::ServerContext* context, const podflow::SearchRequest* request,
                        podflow::SearchResponse* response) override;

    grpc::Status RollingUpdate(grpc::ServerContext* context,
                               const podflow::RollingUpdateRequest* request,
                               podflow::RollingUpdateResponse* response) override;

    grpc::Status Dump(grpc::ServerContext* context, const podflow::DumpRequest* request,
                      podflow::DumpResponse* response) override;

    grpc::Status Topology(grpc::ServerContext* context, const podflow::TopologyRequest* request,
                          podflow::TopologyResponse* response) override;

private:
    flow::Flow& flow_;
};

// Status code reported for an error raised by the flow
grpc::Status to_status(const std::exception& error);

} // namespace gateway
