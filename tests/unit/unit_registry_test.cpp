#include <catch2/catch.hpp>

#include <cmath>

#include "builtin_units.h"
#include "errors.h"
#include "snapshot_codec.h"
#include "tests/common/test_utils.h"
#include "unit_registry.h"

using podflow::test::MakeDocument;
using worker::UnitRegistry;

namespace
{
    podflow::Request IndexRequest(const std::vector<podflow::Document>& docs, uint64_t base_sequence)
    {
        podflow::Request request;
        request.set_request_id("index");
        request.set_type(podflow::INDEX);
        request.set_base_sequence(base_sequence);
        for (const auto& doc : docs)
            *request.add_docs() = doc;
        return request;
    }

    podflow::Request SearchRequest(const podflow::Document& query, uint32_t top_k)
    {
        podflow::Request request;
        request.set_request_id("search");
        request.set_type(podflow::SEARCH);
        request.set_top_k(top_k);
        *request.add_docs() = query;
        return request;
    }
}

TEST_CASE("Registry resolves built-in units", "[worker][registry]")
{
    auto registry = UnitRegistry::with_builtins();
    REQUIRE(registry->contains("_pass"));
    REQUIRE(registry->contains(""));
    REQUIRE(registry->contains("VectorIndexer"));
    REQUIRE_FALSE(registry->contains("Missing"));
    REQUIRE(registry->names() == std::vector<std::string>{"VectorIndexer", "_pass"});

    auto unit = registry->create("");
    REQUIRE(dynamic_cast<worker::PassUnit*>(unit.get()) != nullptr);
    REQUIRE_FALSE(unit->supports_scan());
    REQUIRE_THROWS_AS(unit->full_scan(), podflow::ConfigurationError);
}

TEST_CASE("Registry rejects duplicates and unknown names", "[worker][registry][errors]")
{
    auto registry = UnitRegistry::with_builtins();
    REQUIRE_THROWS_AS(registry->register_unit("_pass", [] { return std::make_unique<worker::PassUnit>(); }),
                      podflow::ConfigurationError);
    REQUIRE_THROWS_AS(registry->create("Missing"), podflow::ConfigurationError);
    REQUIRE_THROWS_AS(registry->register_unit("", [] { return std::make_unique<worker::PassUnit>(); }),
                      podflow::ConfigurationError);
}

TEST_CASE("Pass unit forwards documents", "[worker][units]")
{
    worker::PassUnit unit;
    auto doc = MakeDocument("a", {1.0f, 2.0f});
    auto response = unit.process(IndexRequest({doc}, 0));
    REQUIRE(response.request_id() == "index");
    REQUIRE(response.docs_size() == 1);
    REQUIRE(response.docs(0).id() == "a");
    REQUIRE(response.docs(0).embedding_size() == 2);
}

TEST_CASE("Vector indexer answers nearest neighbours", "[worker][units]")
{
    worker::VectorIndexer unit;
    unit.process(IndexRequest({MakeDocument("near", {1.0f, 1.0f}),
                               MakeDocument("far", {10.0f, 10.0f}),
                               MakeDocument("exact", {0.0f, 0.0f})},
                              100));
    REQUIRE(unit.size() == 3);

    auto response = unit.process(SearchRequest(MakeDocument("q", {0.0f, 0.0f}), 2));
    REQUIRE(response.docs_size() == 1);
    const auto& answer = response.docs(0);
    REQUIRE(answer.id() == "q");
    REQUIRE(podflow::test::MatchIds(answer) == std::vector<std::string>{"exact", "near"});
    REQUIRE(answer.matches(0).score() == Approx(1.0f));
    REQUIRE(answer.matches(1).score() == Approx(1.0f / (1.0f + std::sqrt(2.0f))));
    REQUIRE(answer.matches(1).text() == "text of near");
    REQUIRE(answer.matches(1).embedding_size() == 2);

    auto everything = unit.process(SearchRequest(MakeDocument("q", {0.0f, 0.0f}), 0));
    REQUIRE(everything.docs(0).matches_size() == 3);
}

TEST_CASE("Vector indexer replaces re-indexed ids and scans by sequence", "[worker][units]")
{
    worker::VectorIndexer unit;
    unit.process(IndexRequest({MakeDocument("a", {1.0f}), MakeDocument("b", {2.0f})}, 0));
    unit.process(IndexRequest({MakeDocument("a", {5.0f}, "updated")}, 7));

    auto records = unit.full_scan();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].id == "b");
    REQUIRE(records[0].sequence == 1);
    REQUIRE(records[1].id == "a");
    REQUIRE(records[1].sequence == 7);
    REQUIRE(records[1].vector == std::vector<float>{5.0f});

    podflow::Document metadata;
    REQUIRE(metadata.ParseFromString(records[1].metadata));
    REQUIRE(metadata.text() == "updated");
    REQUIRE(metadata.embedding_size() == 0);
}

TEST_CASE("Vector indexer reloads its workspace checkpoint", "[worker][units]")
{
    podflow::test::TempDir dir;
    worker::UnitContext context;
    context.pod = "indexer";
    context.workspace = (dir.path() / "indexer-0-0").string();

    {
        worker::VectorIndexer unit;
        unit.warm_up(context);
        unit.process(IndexRequest({MakeDocument("a", {1.0f}), MakeDocument("b", {2.0f})}, 3));
        unit.process(IndexRequest({MakeDocument("a", {5.0f}, "updated")}, 9));
    }

    worker::VectorIndexer restarted;
    restarted.warm_up(context);
    REQUIRE(restarted.size() == 2);
    auto records = restarted.full_scan();
    REQUIRE(records[0].id == "b");
    REQUIRE(records[0].sequence == 4);
    REQUIRE(records[1].id == "a");
    REQUIRE(records[1].sequence == 9);
    REQUIRE(records[1].vector == std::vector<float>{5.0f});

    SECTION("a configured dump wins over the checkpoint")
    {
        auto snapshot = (dir.path() / "snapshot").string();
        dump::write_snapshot(snapshot, podflow::test::MakeRecords(3, 1), 1);
        context.dump_path = snapshot;

        worker::VectorIndexer from_dump;
        from_dump.warm_up(context);
        REQUIRE(from_dump.size() == 3);
    }
    SECTION("no workspace means nothing is kept")
    {
        worker::VectorIndexer unit;
        unit.warm_up(worker::UnitContext{});
        unit.process(IndexRequest({MakeDocument("c", {1.0f})}, 0));

        worker::VectorIndexer fresh;
        fresh.warm_up(worker::UnitContext{});
        REQUIRE(fresh.size() == 0);
    }
}

TEST_CASE("Vector indexer rejects documents it cannot store or compare", "[worker][units][errors]")
{
    worker::VectorIndexer unit;
    REQUIRE_THROWS_AS(unit.process(IndexRequest({MakeDocument("", {1.0f})}, 0)),
                      podflow::ConfigurationError);

    unit.process(IndexRequest({MakeDocument("a", {1.0f, 2.0f})}, 0));
    REQUIRE_THROWS_AS(unit.process(SearchRequest(MakeDocument("q", {1.0f}), 1)),
                      podflow::ConfigurationError);
}
