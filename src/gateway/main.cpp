#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include "flow.h"
#include "gateway_service.h"
#include "pipeline_config.h"

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

void RunServer(flow::Flow& flow, const std::string& host) {
    gateway::GatewayServiceImpl service(flow);
    const std::string server_address =
        host + ":" + std::to_string(flow.topology().gateway.endpoint.port_in);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        throw std::runtime_error("cannot listen on " + server_address);
    }
    std::cout << "Gateway listening on " << server_address << std::endl;

    std::thread watcher([&server] {
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        server->Shutdown();
    });

    server->Wait();
    g_shutdown.store(true);
    watcher.join();
}

} // namespace

int main(int argc, char** argv) {
    std::string config_file;
    std::string metrics_csv;
    std::string host = "0.0.0.0";

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--metrics-csv" && i + 1 < argc) {
            metrics_csv = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0]
                      << " --config <pipeline.json> [--metrics-csv <file>] [--host <addr>]"
                      << std::endl;
            return 2;
        }
    }

    // Fall back to the environment
    if (config_file.empty()) {
        const char* env_config = std::getenv("PODFLOW_CONFIG");
        if (env_config) {
            config_file = env_config;
        }
    }
    if (config_file.empty()) {
        std::cerr << "No pipeline configuration given (--config or PODFLOW_CONFIG)" << std::endl;
        return 2;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        auto config = podflow::load_pipeline_config(config_file);
        flow::Flow flow(config.pipeline, config.flow);
        flow.start();

        RunServer(flow, host);

        if (!metrics_csv.empty()) {
            if (flow::FlowMetrics::export_to_csv(metrics_csv, flow.metrics().snapshot())) {
                std::cout << "Metrics written to " << metrics_csv << std::endl;
            } else {
                std::cerr << "Failed to write metrics to " << metrics_csv << std::endl;
            }
        }
        flow.close();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
