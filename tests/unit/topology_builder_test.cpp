#include <catch2/catch.hpp>

#include <set>

#include "errors.h"
#include "tests/common/test_utils.h"
#include "topology_builder.h"

using podflow::test::MakeStage;
using topology::Topology;
using topology::TopologyBuilder;

namespace
{
    const podflow::PortRange kRange{50000, 50999};

    podflow::PipelineSpec Pipeline(std::vector<podflow::StageSpec> stages)
    {
        podflow::PipelineSpec spec;
        spec.stages = std::move(stages);
        return spec;
    }

    // Every port used by any unit of the topology, with multiplicity
    std::vector<int> InternalPorts(const topology::PodLayout& pod)
    {
        std::vector<int> ports;
        if (pod.head)
        {
            ports.push_back(pod.head->endpoint.port_out);
            ports.push_back(pod.tail->endpoint.port_in);
        }
        for (const auto& replica : pod.replicas)
        {
            if (replica.head)
            {
                ports.push_back(replica.head->endpoint.port_out);
                ports.push_back(replica.tail->endpoint.port_in);
            }
        }
        return ports;
    }

    void RequireReplicaGroupWiring(const topology::PodLayout& pod)
    {
        REQUIRE(pod.head.has_value());
        REQUIRE(pod.tail.has_value());
        REQUIRE(pod.head->endpoint.port_in == pod.endpoint.port_in);
        REQUIRE(pod.tail->endpoint.port_out == pod.endpoint.port_out);
        for (const auto& replica : pod.replicas)
        {
            REQUIRE(replica.endpoint.port_in == pod.head->endpoint.port_out);
            REQUIRE(replica.endpoint.port_out == pod.tail->endpoint.port_in);
        }
    }
}

TEST_CASE("Linear chain satisfies the port chain through the gateway", "[topology][builder]")
{
    auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("encode"), MakeStage("index")}));

    REQUIRE(topology.pods.size() == 2);
    REQUIRE(topology.gateway.endpoint == podflow::Endpoint{50001, 50000});
    REQUIRE(topology.pods[0].endpoint == podflow::Endpoint{50000, 50002});
    REQUIRE(topology.pods[1].endpoint == podflow::Endpoint{50002, 50001});

    REQUIRE(topology.gateway.endpoint.port_out == topology.pods[0].endpoint.port_in);
    REQUIRE(topology.pods[0].endpoint.port_out == topology.pods[1].endpoint.port_in);
    REQUIRE(topology.pods[1].endpoint.port_out == topology.gateway.endpoint.port_in);

    REQUIRE(topology.edges.size() == 3);
    REQUIRE(topology.sinks() == std::vector<std::string>{"index"});
    REQUIRE_NOTHROW(topology::validate_wiring(topology));
}

TEST_CASE("Single replica single shard pod has no routing hops", "[topology][builder]")
{
    auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("solo")}));
    const auto& pod = topology.pods.front();

    REQUIRE(pod.routing_hops() == 0);
    REQUIRE_FALSE(pod.head.has_value());
    REQUIRE_FALSE(pod.tail.has_value());
    REQUIRE(pod.replicas.size() == 1);
    REQUIRE_FALSE(pod.replicas[0].head.has_value());
    REQUIRE(pod.replicas[0].workers.size() == 1);

    const auto& worker = pod.replicas[0].workers[0];
    REQUIRE(pod.head_endpoint() == pod.tail_endpoint());
    REQUIRE(pod.head_endpoint() == worker.endpoint);
    REQUIRE(worker.endpoint == pod.endpoint);
    REQUIRE(pod.num_units() == 1);
    REQUIRE(topology.num_units() == 2);
}

TEST_CASE("Replicated pods put head and tail on the pod ports", "[topology][builder]")
{
    SECTION("replicas=3, shards=1")
    {
        auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("pod", 3, 1)}));
        const auto& pod = topology.pods.front();

        RequireReplicaGroupWiring(pod);
        REQUIRE(pod.replicas.size() == 3);
        for (const auto& replica : pod.replicas)
        {
            REQUIRE_FALSE(replica.head.has_value());
            REQUIRE(replica.workers.size() == 1);
            REQUIRE(replica.workers[0].endpoint == replica.endpoint);
        }
        REQUIRE(pod.head->fan.size() == 3);
        REQUIRE(pod.num_units() == 5);
    }

    SECTION("replicas=2, shards=3")
    {
        auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("pod", 2, 3)}));
        const auto& pod = topology.pods.front();

        RequireReplicaGroupWiring(pod);
        for (const auto& replica : pod.replicas)
        {
            REQUIRE(replica.head.has_value());
            REQUIRE(replica.head->endpoint.port_in == replica.endpoint.port_in);
            REQUIRE(replica.tail->endpoint.port_out == replica.endpoint.port_out);
            REQUIRE(replica.workers.size() == 3);
            for (size_t s = 0; s < replica.workers.size(); s++)
            {
                const auto& worker = replica.workers[s];
                REQUIRE(worker.shard_id == static_cast<int>(s));
                REQUIRE(worker.replica_id == replica.replica_id);
                REQUIRE(worker.endpoint.port_in == replica.head->endpoint.port_out);
                REQUIRE(worker.endpoint.port_out == replica.tail->endpoint.port_in);
            }
        }

        // Internal ports are fresh and never reused
        auto ports = InternalPorts(pod);
        std::set<int> unique(ports.begin(), ports.end());
        REQUIRE(unique.size() == ports.size());
        REQUIRE(unique.count(pod.endpoint.port_in) == 0);
        REQUIRE(unique.count(pod.endpoint.port_out) == 0);
        REQUIRE(pod.num_units() == 2 * (3 + 2) + 2);
    }
}

TEST_CASE("Unit count follows R * (P + 2 if sharded) + 2 if replicated", "[topology][builder]")
{
    auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("pod", 3, 4)}));
    REQUIRE(topology.pods.front().num_units() == 20);
    REQUIRE(topology.num_units() == 21);

    auto sharded_only = TopologyBuilder(kRange).build(Pipeline({MakeStage("pod", 1, 4)}));
    REQUIRE(sharded_only.pods.front().num_units() == 6);
    REQUIRE(sharded_only.pods.front().routing_hops() == 2);
}

TEST_CASE("Port overrides are honoured on a mixed four stage pipeline", "[topology][builder]")
{
    const std::vector<std::pair<int, int>> shapes{{3, 1}, {2, 3}, {2, 2}, {2, 1}};
    podflow::PipelineSpec spec;
    for (size_t i = 0; i < shapes.size(); i++)
    {
        auto stage = MakeStage("pod" + std::to_string(i), shapes[i].first, shapes[i].second);
        stage.port_in = 51000 + 100 * static_cast<int>(i);
        stage.port_out = 51000 + 100 * static_cast<int>(i + 1);
        spec.stages.push_back(stage);
    }

    auto topology = TopologyBuilder(podflow::PortRange{52000, 52999}).build(spec);

    REQUIRE(topology.gateway.endpoint.port_out == 51000);
    REQUIRE(topology.gateway.endpoint.port_in == 51400);
    for (size_t i = 0; i < topology.pods.size(); i++)
    {
        const auto& pod = topology.pods[i];
        REQUIRE(pod.endpoint.port_in == 51000 + 100 * static_cast<int>(i));
        REQUIRE(pod.endpoint.port_out == 51000 + 100 * static_cast<int>(i + 1));
        RequireReplicaGroupWiring(pod);
        for (int port : InternalPorts(pod))
        {
            REQUIRE(port >= 52000);
            REQUIRE(port <= 52999);
        }
    }
    REQUIRE_NOTHROW(topology::validate_wiring(topology));
}

TEST_CASE("Building the same spec twice yields identical wiring", "[topology][builder]")
{
    auto spec = Pipeline({MakeStage("a", 2, 2), MakeStage("b", 3, 1), MakeStage("c")});
    auto first = TopologyBuilder(kRange).build(spec);
    auto second = TopologyBuilder(kRange).build(spec);

    REQUIRE(first.gateway.endpoint == second.gateway.endpoint);
    REQUIRE(first.edges == second.edges);
    for (size_t i = 0; i < first.pods.size(); i++)
    {
        REQUIRE(first.pods[i].endpoint == second.pods[i].endpoint);
        REQUIRE(InternalPorts(first.pods[i]) == InternalPorts(second.pods[i]));
        for (size_t r = 0; r < first.pods[i].replicas.size(); r++)
        {
            const auto& a = first.pods[i].replicas[r].workers;
            const auto& b = second.pods[i].replicas[r].workers;
            for (size_t s = 0; s < a.size(); s++)
            {
                REQUIRE(a[s].endpoint == b[s].endpoint);
                REQUIRE(a[s].name == b[s].name);
            }
        }
    }
}

TEST_CASE("DAG stages share ports on fan-out and fan-in", "[topology][builder][dag]")
{
    auto a = MakeStage("a");
    auto b = MakeStage("b", 2, 1);
    b.needs = {"a"};
    auto c = MakeStage("c");
    c.needs = {"a"};
    auto d = MakeStage("d");
    d.needs = {"b", "c"};

    auto topology = TopologyBuilder(kRange).build(Pipeline({a, b, c, d}));
    const auto* pa = topology.find("a");
    const auto* pb = topology.find("b");
    const auto* pc = topology.find("c");
    const auto* pd = topology.find("d");
    REQUIRE(pa != nullptr);
    REQUIRE(pd != nullptr);

    REQUIRE(pb->endpoint.port_in == pa->endpoint.port_out);
    REQUIRE(pc->endpoint.port_in == pa->endpoint.port_out);
    REQUIRE(pb->endpoint.port_out == pd->endpoint.port_in);
    REQUIRE(pc->endpoint.port_out == pd->endpoint.port_in);
    REQUIRE(pd->endpoint.port_out == topology.gateway.endpoint.port_in);

    REQUIRE(topology.edges.size() == 6);
    REQUIRE(topology.sinks() == std::vector<std::string>{"d"});
    REQUIRE(topology.execution_order.front() == 0);
    REQUIRE(topology.execution_order.back() == 3);
    REQUIRE(pd->needs == std::vector<std::string>{"b", "c"});
}

TEST_CASE("Parallel stages both read from and write to the gateway", "[topology][builder][dag]")
{
    auto left = MakeStage("left");
    left.needs = {podflow::kGatewayName};
    auto right = MakeStage("right");
    right.needs = {podflow::kGatewayName};

    auto topology = TopologyBuilder(kRange).build(Pipeline({left, right}));

    REQUIRE(topology.pods[0].endpoint == topology.pods[1].endpoint);
    REQUIRE(topology.pods[0].endpoint.port_in == topology.gateway.endpoint.port_out);
    REQUIRE(topology.pods[0].endpoint.port_out == topology.gateway.endpoint.port_in);
    REQUIRE(topology.sinks().size() == 2);
}

TEST_CASE("Invalid specs fail before any port is allocated", "[topology][builder][errors]")
{
    TopologyBuilder builder(kRange);

    SECTION("empty pipeline")
    {
        REQUIRE_THROWS_AS(builder.build(podflow::PipelineSpec{}), podflow::ConfigurationError);
    }
    SECTION("replicas < 1")
    {
        REQUIRE_THROWS_AS(builder.build(Pipeline({MakeStage("a", 0, 1)})), podflow::ConfigurationError);
    }
    SECTION("shards < 1")
    {
        REQUIRE_THROWS_AS(builder.build(Pipeline({MakeStage("a", 1, 0)})), podflow::ConfigurationError);
    }
    SECTION("duplicate names")
    {
        REQUIRE_THROWS_AS(builder.build(Pipeline({MakeStage("a"), MakeStage("a")})),
                          podflow::ConfigurationError);
    }
    SECTION("reserved name")
    {
        REQUIRE_THROWS_AS(builder.build(Pipeline({MakeStage(podflow::kGatewayName)})),
                          podflow::ConfigurationError);
    }
    SECTION("unknown needs")
    {
        auto stage = MakeStage("a");
        stage.needs = {"missing"};
        REQUIRE_THROWS_AS(builder.build(Pipeline({stage})), podflow::ConfigurationError);
    }
    SECTION("cycle")
    {
        auto a = MakeStage("a");
        a.needs = {"b"};
        auto b = MakeStage("b");
        b.needs = {"a"};
        REQUIRE_THROWS_AS(builder.build(Pipeline({a, b})), podflow::ConfigurationError);
    }
    SECTION("stage reading from the gateway and from a gateway reader")
    {
        auto a = MakeStage("a");
        a.needs = {podflow::kGatewayName};
        auto b = MakeStage("b");
        b.needs = {podflow::kGatewayName, "a"};
        REQUIRE_THROWS_AS(builder.build(Pipeline({a, b})), podflow::ConfigurationError);
    }
    SECTION("skip edge over a middle stage")
    {
        auto a = MakeStage("a");
        auto b = MakeStage("b");
        b.needs = {"a"};
        auto c = MakeStage("c");
        c.needs = {"a", "b"};
        REQUIRE_THROWS_AS(builder.build(Pipeline({a, b, c})), podflow::ConfigurationError);
    }
}

TEST_CASE("Port override conflicts are reported", "[topology][builder][errors]")
{
    TopologyBuilder builder(kRange);

    SECTION("two values on one link")
    {
        auto a = MakeStage("a");
        a.port_out = 41000;
        auto b = MakeStage("b");
        b.port_in = 41001;
        REQUIRE_THROWS_AS(builder.build(Pipeline({a, b})), podflow::WiringError);
    }
    SECTION("one port on two links")
    {
        auto a = MakeStage("a");
        a.port_in = 41000;
        auto b = MakeStage("b");
        b.port_out = 41000;
        REQUIRE_THROWS_AS(builder.build(Pipeline({a, b})), podflow::ConfigurationError);
    }
    SECTION("port out of range")
    {
        auto a = MakeStage("a");
        a.port_in = 70000;
        REQUIRE_THROWS_AS(builder.build(Pipeline({a})), podflow::ConfigurationError);
    }
    SECTION("range exhausted")
    {
        TopologyBuilder tiny(podflow::PortRange{50000, 50002});
        REQUIRE_THROWS_AS(tiny.build(Pipeline({MakeStage("a", 3, 1)})), podflow::ConfigurationError);
    }
}

TEST_CASE("validate_wiring detects a broken chain", "[topology][builder][errors]")
{
    auto topology = TopologyBuilder(kRange).build(Pipeline({MakeStage("a"), MakeStage("b")}));
    topology.pods[0].endpoint.port_out += 1;
    REQUIRE_THROWS_AS(topology::validate_wiring(topology), podflow::WiringError);
}
