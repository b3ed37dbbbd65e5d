#include <catch2/catch.hpp>

#include "errors.h"
#include "merge.h"
#include "tests/common/test_utils.h"

using podflow::Document;

namespace
{
    Document Match(const std::string& id, float score)
    {
        Document doc;
        doc.set_id(id);
        doc.set_score(score);
        return doc;
    }

    std::vector<std::string> Ids(const std::vector<Document>& docs)
    {
        std::vector<std::string> ids;
        for (const auto& doc : docs)
            ids.push_back(doc.id());
        return ids;
    }

    podflow::Response ShardAnswer(const std::vector<Document>& matches)
    {
        podflow::Response response;
        response.set_request_id("req-0");
        auto* query = response.add_docs();
        query->set_id("query");
        for (const auto& match : matches)
            *query->add_matches() = match;
        return response;
    }
}

TEST_CASE("Merge ranks by score across shards", "[merge]")
{
    std::vector<std::vector<Document>> shards{
        {Match("a", 0.9f), Match("b", 0.5f)},
        {Match("c", 0.8f), Match("d", 0.1f)},
        {Match("e", 0.7f)},
    };
    auto merged = flow::merge_matches(shards, 0);
    REQUIRE(Ids(merged) == std::vector<std::string>{"a", "c", "e", "b", "d"});
    REQUIRE(merged[1].score() == Approx(0.8f));
}

TEST_CASE("Merge breaks ties by shard then local order", "[merge]")
{
    std::vector<std::vector<Document>> shards{
        {Match("s0-a", 0.5f), Match("s0-b", 0.5f)},
        {Match("s1-a", 0.5f), Match("s1-b", 0.9f)},
    };
    auto merged = flow::merge_matches(shards, 0);
    REQUIRE(Ids(merged) == std::vector<std::string>{"s1-b", "s0-a", "s0-b", "s1-a"});
}

TEST_CASE("Merge truncation follows the merge options", "[merge]")
{
    std::vector<std::vector<Document>> shards{
        {Match("a", 0.9f), Match("b", 0.3f)},
        {Match("c", 0.6f), Match("d", 0.2f)},
    };

    SECTION("truncated to top_k by default")
    {
        REQUIRE(Ids(flow::merge_matches(shards, 3)) == std::vector<std::string>{"a", "c", "b"});
    }
    SECTION("top_k of zero returns the whole union")
    {
        REQUIRE(flow::merge_matches(shards, 0).size() == 4);
    }
    SECTION("truncation disabled returns the whole union")
    {
        podflow::MergeOptions options;
        options.truncate_to_top_k = false;
        REQUIRE(flow::merge_matches(shards, 2, options).size() == 4);
    }
    SECTION("union smaller than top_k")
    {
        REQUIRE(flow::merge_matches(shards, 10).size() == 4);
    }
}

TEST_CASE("Merge keeps the best entry of a duplicated id", "[merge]")
{
    std::vector<std::vector<Document>> shards{
        {Match("a", 0.4f), Match("b", 0.3f)},
        {Match("a", 0.9f), Match("c", 0.2f)},
    };
    auto merged = flow::merge_matches(shards, 0);
    REQUIRE(Ids(merged) == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(merged[0].score() == Approx(0.9f));
}

TEST_CASE("Shard answers merge per query", "[merge]")
{
    auto merged = flow::merge_shard_answers(
        {ShardAnswer({Match("a", 0.2f)}), ShardAnswer({Match("b", 0.7f), Match("c", 0.1f)})},
        2, podflow::MergeOptions());

    REQUIRE(merged.request_id() == "req-0");
    REQUIRE(merged.docs_size() == 1);
    REQUIRE(merged.docs(0).id() == "query");
    REQUIRE(podflow::test::MatchIds(merged.docs(0)) == std::vector<std::string>{"b", "a"});

    podflow::Response two_queries = ShardAnswer({});
    two_queries.add_docs()->set_id("other");
    REQUIRE_THROWS_AS(flow::merge_shard_answers({ShardAnswer({}), two_queries}, 2, podflow::MergeOptions()),
                      podflow::PodflowError);
}

TEST_CASE("Joined inputs keep the first input's fields and all matches", "[merge][dag]")
{
    auto left = ShardAnswer({Match("a", 0.9f)});
    left.mutable_docs(0)->set_text("left text");
    auto* route = left.add_routes();
    route->set_pod("left");
    auto right = ShardAnswer({Match("b", 0.8f)});
    right.mutable_docs(0)->set_text("right text");

    auto joined = flow::join_responses({left, right});
    REQUIRE(joined.docs_size() == 1);
    REQUIRE(joined.docs(0).text() == "left text");
    REQUIRE(podflow::test::MatchIds(joined.docs(0)) == std::vector<std::string>{"a", "b"});
    REQUIRE(joined.routes_size() == 1);
}
