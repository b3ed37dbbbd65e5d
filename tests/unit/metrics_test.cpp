#include <catch2/catch.hpp>

#include <fstream>
#include <string>

#include "metrics.h"
#include "tests/common/test_utils.h"

TEST_CASE("Flow metrics count per pod", "[metrics]")
{
    flow::FlowMetrics metrics;
    metrics.record_request("encoder", 0, 10);
    metrics.record_request("encoder", 1, 30);
    metrics.record_request("encoder", 1, 20);
    metrics.record_retry("encoder");
    metrics.record_timeout("indexer");
    metrics.record_write_failures("indexer", 2);
    metrics.record_rolling_update("indexer", true);
    metrics.record_rolling_update("indexer", false);

    auto encoder = metrics.pod_metrics("encoder");
    REQUIRE(encoder.requests == 3);
    REQUIRE(encoder.retries == 1);
    REQUIRE(encoder.total_latency_ms == 60);
    REQUIRE(encoder.max_latency_ms == 30);
    REQUIRE(encoder.avg_latency_ms == Approx(20.0));
    REQUIRE(encoder.requests_per_replica.at(0) == 1);
    REQUIRE(encoder.requests_per_replica.at(1) == 2);

    auto indexer = metrics.pod_metrics("indexer");
    REQUIRE(indexer.requests == 0);
    REQUIRE(indexer.timeouts == 1);
    REQUIRE(indexer.write_failures == 2);
    REQUIRE(indexer.rolling_updates == 1);
    REQUIRE(indexer.failed_rolling_updates == 1);

    auto unknown = metrics.pod_metrics("missing");
    REQUIRE(unknown.pod == "missing");
    REQUIRE(unknown.requests == 0);

    auto all = metrics.snapshot();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].pod == "encoder");
    REQUIRE(all[1].pod == "indexer");
}

TEST_CASE("Flow metrics export to CSV", "[metrics]")
{
    podflow::test::TempDir dir;
    flow::FlowMetrics metrics;
    metrics.record_request("encoder", 0, 4);
    metrics.record_request("encoder", 1, 6);

    auto path = (dir.path() / "metrics.csv").string();
    REQUIRE(flow::FlowMetrics::export_to_csv(path, metrics.snapshot()));

    std::ifstream in(path);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    REQUIRE(header == "pod,requests,retries,timeouts,write_failures,rolling_updates,"
                      "failed_rolling_updates,avg_latency_ms,max_latency_ms,requests_per_replica");
    REQUIRE(row == "encoder,2,0,0,0,0,0,5.00,6,0:1;1:1");

    REQUIRE_FALSE(flow::FlowMetrics::export_to_csv((dir.path() / "missing" / "m.csv").string(),
                                                   metrics.snapshot()));
}
