#include "manifest.h"
#include "errors.h"
#include "hash_utils.h"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dump {

namespace {

json shards_to_json(const std::vector<ShardEntry>& shards) {
    json list = json::array();
    for (const auto& entry : shards) {
        json item = {
            {"index", entry.index},
            {"begin", entry.range.begin},
            {"end", entry.range.end},
            {"vectors", entry.vectors_file},
            {"metas", entry.metas_file},
            {"vectors_sha256", entry.vectors_sha256},
            {"metas_sha256", entry.metas_sha256},
        };
        if (!entry.sequences_file.empty()) {
            item["sequences"] = entry.sequences_file;
            item["sequences_sha256"] = entry.sequences_sha256;
        }
        list.push_back(std::move(item));
    }
    return list;
}

} // namespace

const ShardEntry& ShardManifest::shard(size_t index) const {
    if (index >= shard_count || index >= shards.size()) {
        throw podflow::PartitionMismatchError("snapshot has " + std::to_string(shard_count) +
                                              " shards, shard " + std::to_string(index) +
                                              " requested");
    }
    return shards[index];
}

json ShardManifest::to_json() const {
    json shard_list = shards_to_json(shards);
    return {
        {"version", version},
        {"shard_count", shard_count},
        {"total_records", total_records},
        {"shards", shard_list},
        // Fingerprint over the shard table guards against partial edits
        {"fingerprint", podflow::compute_hash(shard_list.dump())},
    };
}

ShardManifest ShardManifest::from_json(const json& j) {
    ShardManifest manifest;
    try {
        manifest.version = j.at("version").get<int>();
        manifest.shard_count = j.at("shard_count").get<size_t>();
        manifest.total_records = j.at("total_records").get<size_t>();
        for (const auto& entry_json : j.at("shards")) {
            ShardEntry entry;
            entry.index = entry_json.at("index").get<size_t>();
            entry.range.begin = entry_json.at("begin").get<size_t>();
            entry.range.end = entry_json.at("end").get<size_t>();
            entry.vectors_file = entry_json.at("vectors").get<std::string>();
            entry.metas_file = entry_json.at("metas").get<std::string>();
            entry.vectors_sha256 = entry_json.at("vectors_sha256").get<std::string>();
            entry.metas_sha256 = entry_json.at("metas_sha256").get<std::string>();
            entry.sequences_file = entry_json.value("sequences", std::string());
            entry.sequences_sha256 = entry_json.value("sequences_sha256", std::string());
            manifest.shards.push_back(std::move(entry));
        }
        if (j.at("fingerprint").get<std::string>() !=
            podflow::compute_hash(j.at("shards").dump())) {
            throw podflow::SnapshotError("manifest fingerprint mismatch");
        }
    } catch (const json::exception& e) {
        throw podflow::SnapshotError(std::string("malformed manifest: ") + e.what());
    }

    if (manifest.version != kFormatVersion) {
        throw podflow::SnapshotError("unsupported manifest version " +
                                     std::to_string(manifest.version));
    }
    if (manifest.shard_count == 0 || manifest.shards.size() != manifest.shard_count) {
        throw podflow::SnapshotError("manifest lists " + std::to_string(manifest.shards.size()) +
                                     " shards but declares " +
                                     std::to_string(manifest.shard_count));
    }
    auto expected = partition(manifest.total_records, manifest.shard_count);
    for (size_t s = 0; s < manifest.shard_count; s++) {
        if (manifest.shards[s].index != s || !(manifest.shards[s].range == expected[s])) {
            throw podflow::SnapshotError("manifest range of shard " + std::to_string(s) +
                                         " does not match the partition formula");
        }
    }
    return manifest;
}

void ShardManifest::save(const std::string& dir) const {
    fs::path tmp = fs::path(dir) / (std::string(kManifestFile) + ".tmp");
    fs::path target = fs::path(dir) / kManifestFile;

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw podflow::SnapshotError("cannot write " + tmp.string());
        }
        out << to_json().dump(2) << "\n";
        out.flush();
        if (!out) {
            throw podflow::SnapshotError("write to " + tmp.string() + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw podflow::SnapshotError("cannot publish " + target.string() + ": " + ec.message());
    }
}

ShardManifest ShardManifest::load(const std::string& dir) {
    fs::path path = fs::path(dir) / kManifestFile;
    std::ifstream in(path);
    if (!in.is_open()) {
        throw podflow::SnapshotError("no manifest at " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw podflow::SnapshotError("cannot parse " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

} // namespace dump
