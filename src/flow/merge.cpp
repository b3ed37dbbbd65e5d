#include "merge.h"
#include "errors.h"
#include <algorithm>
#include <unordered_set>

namespace flow {

std::vector<podflow::Document> merge_matches(
    const std::vector<std::vector<podflow::Document>>& per_shard,
    size_t top_k,
    const podflow::MergeOptions& options) {
    // Collected shard-major, so a stable sort breaks ties by shard then local order
    std::vector<const podflow::Document*> ranked;
    for (const auto& shard : per_shard) {
        for (const auto& doc : shard) {
            ranked.push_back(&doc);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const podflow::Document* a, const podflow::Document* b) {
                         return a->score() > b->score();
                     });

    std::vector<podflow::Document> merged;
    std::unordered_set<std::string> seen;
    for (const auto* doc : ranked) {
        if (!doc->id().empty() && !seen.insert(doc->id()).second) {
            continue;
        }
        merged.push_back(*doc);
        if (options.truncate_to_top_k && top_k > 0 && merged.size() == top_k) {
            break;
        }
    }
    return merged;
}

podflow::Response merge_shard_answers(const std::vector<podflow::Response>& shard_responses,
                                      size_t top_k,
                                      const podflow::MergeOptions& options) {
    if (shard_responses.empty()) {
        return podflow::Response();
    }
    if (shard_responses.size() == 1) {
        return shard_responses.front();
    }

    const auto& first = shard_responses.front();
    for (const auto& response : shard_responses) {
        if (response.docs_size() != first.docs_size()) {
            throw podflow::PodflowError("shards answered " + std::to_string(first.docs_size()) +
                                        " and " + std::to_string(response.docs_size()) +
                                        " documents for the same request");
        }
    }

    podflow::Response merged;
    merged.set_request_id(first.request_id());
    for (int j = 0; j < first.docs_size(); j++) {
        std::vector<std::vector<podflow::Document>> per_shard;
        per_shard.reserve(shard_responses.size());
        for (const auto& response : shard_responses) {
            const auto& matches = response.docs(j).matches();
            per_shard.emplace_back(matches.begin(), matches.end());
        }

        auto* doc = merged.add_docs();
        *doc = first.docs(j);
        doc->clear_matches();
        for (auto& match : merge_matches(per_shard, top_k, options)) {
            *doc->add_matches() = std::move(match);
        }
    }
    for (const auto& response : shard_responses) {
        for (const auto& route : response.routes()) {
            *merged.add_routes() = route;
        }
        for (const auto& failure : response.failures()) {
            *merged.add_failures() = failure;
        }
    }
    return merged;
}

podflow::Response join_responses(const std::vector<podflow::Response>& inputs) {
    if (inputs.empty()) {
        return podflow::Response();
    }
    if (inputs.size() == 1) {
        return inputs.front();
    }

    podflow::Response joined = inputs.front();
    for (size_t i = 1; i < inputs.size(); i++) {
        const auto& input = inputs[i];
        int shared = std::min(joined.docs_size(), input.docs_size());
        for (int j = 0; j < shared; j++) {
            for (const auto& match : input.docs(j).matches()) {
                *joined.mutable_docs(j)->add_matches() = match;
            }
        }
        for (const auto& route : input.routes()) {
            *joined.add_routes() = route;
        }
        for (const auto& failure : input.failures()) {
            *joined.add_failures() = failure;
        }
    }
    return joined;
}

} // namespace flow
