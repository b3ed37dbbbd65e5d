#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "podflow.pb.h"
#include "record.h"
#include "stage_spec.h"
#include "unit_registry.h"

namespace podflow::test {

class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Document with an id and an embedding
Document MakeDocument(const std::string& id, std::vector<float> embedding,
                      const std::string& text = "");

// `count` documents "<prefix>-<i>" whose embeddings are all `i + 0.01 * k`
std::vector<Document> MakeDocuments(size_t count, size_t dim = 4,
                                    const std::string& prefix = "doc");

// Records in logical order, sequence i
std::vector<StoredRecord> MakeRecords(size_t count, size_t dim = 4);

StageSpec MakeStage(const std::string& name, int replicas = 1, int shards = 1,
                    const std::string& uses = "");

// Small timeouts and a private port range
FlowConfig TestFlowConfig(const std::string& workspace = "");

// Built-in units plus:
//   "SlowWarm"    VectorIndexer whose warm-up sleeps SlowWarmDelay()
//   "FailingWarm" whose warm-up always throws
std::shared_ptr<worker::UnitRegistry> TestRegistry();

// Warm-up duration of "SlowWarm"; reset to 0 by TestRegistry()
void SetSlowWarmDelay(std::chrono::milliseconds delay);

// Ids of `doc`'s matches in order
std::vector<std::string> MatchIds(const Document& doc);

} // namespace podflow::test
