#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "processing_unit.h"

namespace worker {

class UnitRegistry;

// Forwards documents unchanged
class PassUnit : public ProcessingUnit {
public:
    podflow::Response process(const podflow::Request& request) override;
};

// In-memory vector store answering nearest-neighbour queries. With a
// workspace, every INDEX batch is checkpointed to <workspace>/index and a
// unit started without a dump reloads that checkpoint.
class VectorIndexer : public ProcessingUnit {
public:
    void warm_up(const UnitContext& context) override;
    podflow::Response process(const podflow::Request& request) override;
    bool supports_scan() const override { return true; }
    std::vector<podflow::StoredRecord> full_scan() override;

    size_t size() const { return records_.size(); }

private:
    void store(const podflow::Document& doc, uint64_t sequence);
    podflow::Document answer(const podflow::Document& query, size_t top_k) const;
    void load(std::vector<podflow::StoredRecord> records);

    std::string checkpoint_path_;
    std::vector<podflow::StoredRecord> records_;
    std::unordered_map<std::string, size_t> positions_;
};

// Similarity used by VectorIndexer: 1 / (1 + euclidean distance)
float similarity(const std::vector<float>& a, const std::vector<float>& b);

// Document as persisted in the metadata artifact: everything but the embedding
std::string serialize_metadata(const podflow::Document& doc);

// Registers "_pass" and "VectorIndexer"
void register_builtin_units(UnitRegistry& registry);

} // namespace worker
