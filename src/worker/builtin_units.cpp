#include "builtin_units.h"
#include "unit_registry.h"
#include "errors.h"
#include "snapshot_codec.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

namespace worker {

podflow::Response PassUnit::process(const podflow::Request& request) {
    podflow::Response response;
    response.set_request_id(request.request_id());
    *response.mutable_docs() = request.docs();
    return response;
}

float similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw podflow::ConfigurationError("cannot compare vectors of dimension " +
                                          std::to_string(a.size()) + " and " +
                                          std::to_string(b.size()));
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += diff * diff;
    }
    return static_cast<float>(1.0 / (1.0 + std::sqrt(sum)));
}

std::string serialize_metadata(const podflow::Document& doc) {
    podflow::Document copy(doc);
    copy.clear_embedding();
    copy.clear_matches();
    copy.clear_score();
    return copy.SerializeAsString();
}

void VectorIndexer::warm_up(const UnitContext& context) {
    if (!context.workspace.empty()) {
        checkpoint_path_ = (std::filesystem::path(context.workspace) / "index").string();
    }

    std::string source;
    if (!context.dump_path.empty()) {
        // An explicit snapshot wins over whatever the workspace holds
        load(dump::import_shard(context.dump_path,
                                static_cast<size_t>(context.shard_id),
                                static_cast<size_t>(context.shard_count)));
        source = context.dump_path;
    } else if (!checkpoint_path_.empty() && dump::snapshot_exists(checkpoint_path_)) {
        load(dump::read_checkpoint(checkpoint_path_));
        source = checkpoint_path_;
    } else {
        return;
    }
    std::cout << "Pod " << context.pod << " replica " << context.replica_id << " shard "
              << context.shard_id << " loaded " << records_.size() << " records from "
              << source << std::endl;
}

void VectorIndexer::load(std::vector<podflow::StoredRecord> records) {
    records_.clear();
    positions_.clear();
    for (auto& record : records) {
        positions_[record.id] = records_.size();
        records_.push_back(std::move(record));
    }
}

void VectorIndexer::store(const podflow::Document& doc, uint64_t sequence) {
    if (doc.id().empty()) {
        throw podflow::ConfigurationError("cannot index a document without an id");
    }
    podflow::StoredRecord record;
    record.id = doc.id();
    record.vector.assign(doc.embedding().begin(), doc.embedding().end());
    record.metadata = serialize_metadata(doc);
    record.sequence = sequence;

    auto it = positions_.find(record.id);
    if (it != positions_.end()) {
        records_[it->second] = std::move(record);
    } else {
        positions_[record.id] = records_.size();
        records_.push_back(std::move(record));
    }
}

podflow::Document VectorIndexer::answer(const podflow::Document& query, size_t top_k) const {
    std::vector<float> target(query.embedding().begin(), query.embedding().end());

    std::vector<std::pair<float, size_t>> scored;
    scored.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); i++) {
        scored.emplace_back(similarity(target, records_[i].vector), i);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    if (top_k > 0 && scored.size() > top_k) {
        scored.resize(top_k);
    }

    podflow::Document result(query);
    result.clear_matches();
    for (const auto& [score, index] : scored) {
        const auto& record = records_[index];
        auto* match = result.add_matches();
        if (!match->ParseFromString(record.metadata)) {
            throw podflow::SnapshotError("stored metadata of '" + record.id + "' is corrupt");
        }
        match->set_id(record.id);
        for (float value : record.vector) {
            match->add_embedding(value);
        }
        match->set_score(score);
    }
    return result;
}

podflow::Response VectorIndexer::process(const podflow::Request& request) {
    podflow::Response response;
    response.set_request_id(request.request_id());

    if (request.type() == podflow::INDEX) {
        for (int i = 0; i < request.docs_size(); i++) {
            store(request.docs(i), request.base_sequence() + static_cast<uint64_t>(i));
        }
        if (!checkpoint_path_.empty()) {
            dump::write_checkpoint(checkpoint_path_, full_scan());
        }
        *response.mutable_docs() = request.docs();
        return response;
    }

    for (const auto& query : request.docs()) {
        *response.add_docs() = answer(query, request.top_k());
    }
    return response;
}

std::vector<podflow::StoredRecord> VectorIndexer::full_scan() {
    auto records = records_;
    std::stable_sort(records.begin(), records.end(),
                     [](const podflow::StoredRecord& a, const podflow::StoredRecord& b) {
                         return a.sequence < b.sequence;
                     });
    return records;
}

void register_builtin_units(UnitRegistry& registry) {
    registry.register_unit(kPassUnit, [] { return std::make_unique<PassUnit>(); });
    registry.register_unit("VectorIndexer", [] { return std::make_unique<VectorIndexer>(); });
}

} // namespace worker
