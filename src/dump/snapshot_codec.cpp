#include "snapshot_codec.h"
#include "errors.h"
#include "hash_utils.h"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace dump {

namespace {

constexpr char kVectorsMagic[8] = {'P', 'F', 'V', 'E', 'C', '0', '1', '\n'};
constexpr char kMetasMagic[8] = {'P', 'F', 'M', 'E', 'T', '0', '1', '\n'};
constexpr char kSequencesMagic[8] = {'P', 'F', 'S', 'E', 'Q', '0', '1', '\n'};

constexpr const char* kGenerationTag = ".gen-";
constexpr int kReadAttempts = 4;

template <typename T>
void write_pod(std::ofstream& out, T value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

void write_string(std::ofstream& out, const std::string& value) {
    write_pod<uint32_t>(out, static_cast<uint32_t>(value.size()));
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
}

// Reads from an artifact and reports truncation with the file name
class ArtifactReader {
public:
    explicit ArtifactReader(const std::string& file) : file_(file), in_(file, std::ios::binary) {
        if (!in_.is_open()) {
            throw podflow::SnapshotError("cannot open " + file);
        }
    }

    void expect_magic(const char (&magic)[8]) {
        char header[8];
        read_bytes(header, sizeof(header));
        if (std::memcmp(header, magic, sizeof(header)) != 0) {
            throw podflow::SnapshotError(file_ + " is not a snapshot artifact of the expected kind");
        }
    }

    template <typename T>
    T read_pod() {
        T value;
        read_bytes(reinterpret_cast<char*>(&value), sizeof(value));
        return value;
    }

    std::string read_string() {
        auto size = read_pod<uint32_t>();
        std::string value(size, '\0');
        if (size > 0) {
            read_bytes(&value[0], size);
        }
        return value;
    }

    void read_bytes(char* data, size_t size) {
        in_.read(data, static_cast<std::streamsize>(size));
        if (static_cast<size_t>(in_.gcount()) != size) {
            throw podflow::SnapshotError(file_ + " is truncated");
        }
    }

private:
    std::string file_;
    std::ifstream in_;
};

std::ofstream open_artifact(const std::string& file) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw podflow::SnapshotError("cannot create " + file);
    }
    return out;
}

void finish_artifact(std::ofstream& out, const std::string& file) {
    out.flush();
    if (!out) {
        throw podflow::SnapshotError("write to " + file + " failed");
    }
}

void verify_digest(const std::string& file, const std::string& expected) {
    if (podflow::compute_file_hash(file) != expected) {
        throw podflow::SnapshotError(file + " does not match the digest in its manifest");
    }
}

void check_count(const std::string& file, size_t count, const ShardEntry& entry) {
    if (count != entry.range.size()) {
        throw podflow::SnapshotError(file + " holds " + std::to_string(count) +
                                     " records, manifest expects " +
                                     std::to_string(entry.range.size()));
    }
}

fs::path with_suffix(const fs::path& target, const std::string& suffix) {
    fs::path result = target;
    result += suffix;
    return result;
}

fs::path snapshot_path(const std::string& path) {
    fs::path target(path);
    return target.has_filename() ? target : target.parent_path();
}

// Directory a snapshot path currently points at. A published snapshot is a
// symlink to its generation; a plain directory is its own generation.
fs::path resolve_generation(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_symlink(path, ec)) {
        return path;
    }
    fs::path link = fs::read_symlink(path, ec);
    if (ec) {
        throw podflow::SnapshotError("cannot resolve " + path.string() + ": " + ec.message());
    }
    return link.is_relative() ? path.parent_path() / link : link;
}

// Generation numbers of `target` present on disk, ascending
std::vector<uint64_t> list_generations(const fs::path& target) {
    const fs::path parent = target.has_parent_path() ? target.parent_path() : fs::path(".");
    const std::string prefix = target.filename().string() + kGenerationTag;

    std::vector<uint64_t> found;
    std::error_code ec;
    for (const auto& item : fs::directory_iterator(parent, ec)) {
        const std::string name = item.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        const std::string number = name.substr(prefix.size());
        if (number.empty() || number.find_first_not_of("0123456789") != std::string::npos) continue;
        found.push_back(std::stoull(number));
    }
    std::sort(found.begin(), found.end());
    return found;
}

fs::path generation_dir(const fs::path& target, uint64_t generation) {
    return with_suffix(target, kGenerationTag + std::to_string(generation));
}

// Move a fully written snapshot directory into the next generation and swing
// the `target` link to it with one rename, so `target` always resolves to a
// complete snapshot. The generation readers could still be inside is kept;
// older ones are pruned.
void publish_generation(const fs::path& target, const fs::path& staging) {
    std::error_code ec;
    auto generations = list_generations(target);
    uint64_t next = generations.empty() ? 1 : generations.back() + 1;

    fs::path previous;
    if (fs::is_symlink(target, ec)) {
        previous = resolve_generation(target);
    } else if (fs::exists(target, ec)) {
        // A snapshot written as a plain directory becomes the previous generation
        previous = generation_dir(target, next++);
        fs::rename(target, previous, ec);
        if (ec) {
            throw podflow::SnapshotError("cannot adopt " + target.string() + ": " + ec.message());
        }
    }

    const fs::path generation = generation_dir(target, next);
    fs::rename(staging, generation, ec);
    if (ec) {
        throw podflow::SnapshotError("cannot stage " + generation.string() + ": " + ec.message());
    }

    const fs::path link = with_suffix(target, ".link");
    fs::remove(link, ec);
    fs::create_directory_symlink(generation.filename(), link, ec);
    if (ec) {
        throw podflow::SnapshotError("cannot link " + link.string() + ": " + ec.message());
    }
    fs::rename(link, target, ec);
    if (ec) {
        throw podflow::SnapshotError("cannot publish " + target.string() + ": " + ec.message());
    }

    for (uint64_t number : list_generations(target)) {
        const fs::path dir = generation_dir(target, number);
        if (dir == generation || dir == previous) continue;
        fs::remove_all(dir, ec);
        if (ec) {
            std::cerr << "Failed to remove old snapshot generation " << dir << ": "
                      << ec.message() << std::endl;
        }
    }
}

} // namespace

void write_vectors_file(const std::string& file,
                        const std::vector<podflow::StoredRecord>& records,
                        const ShardRange& range) {
    auto out = open_artifact(file);
    out.write(kVectorsMagic, sizeof(kVectorsMagic));
    write_pod<uint64_t>(out, range.size());
    for (size_t i = range.begin; i < range.end; i++) {
        const auto& record = records[i];
        write_string(out, record.id);
        write_pod<uint32_t>(out, static_cast<uint32_t>(record.vector.size()));
        out.write(reinterpret_cast<const char*>(record.vector.data()),
                  static_cast<std::streamsize>(record.vector.size() * sizeof(float)));
    }
    finish_artifact(out, file);
}

void write_metas_file(const std::string& file,
                      const std::vector<podflow::StoredRecord>& records,
                      const ShardRange& range) {
    auto out = open_artifact(file);
    out.write(kMetasMagic, sizeof(kMetasMagic));
    write_pod<uint64_t>(out, range.size());
    for (size_t i = range.begin; i < range.end; i++) {
        write_string(out, records[i].id);
        write_string(out, records[i].metadata);
    }
    finish_artifact(out, file);
}

std::vector<VectorEntry> read_vectors_file(const std::string& file) {
    ArtifactReader reader(file);
    reader.expect_magic(kVectorsMagic);
    auto count = reader.read_pod<uint64_t>();

    std::vector<VectorEntry> entries;
    entries.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; i++) {
        VectorEntry entry;
        entry.first = reader.read_string();
        auto dim = reader.read_pod<uint32_t>();
        entry.second.resize(dim);
        if (dim > 0) {
            reader.read_bytes(reinterpret_cast<char*>(entry.second.data()), dim * sizeof(float));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<MetadataEntry> read_metas_file(const std::string& file) {
    ArtifactReader reader(file);
    reader.expect_magic(kMetasMagic);
    auto count = reader.read_pod<uint64_t>();

    std::vector<MetadataEntry> entries;
    entries.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; i++) {
        MetadataEntry entry;
        entry.first = reader.read_string();
        entry.second = reader.read_string();
        entries.push_back(std::move(entry));
    }
    return entries;
}

void write_sequences_file(const std::string& file,
                          const std::vector<podflow::StoredRecord>& records,
                          const ShardRange& range) {
    auto out = open_artifact(file);
    out.write(kSequencesMagic, sizeof(kSequencesMagic));
    write_pod<uint64_t>(out, range.size());
    for (size_t i = range.begin; i < range.end; i++) {
        write_string(out, records[i].id);
        write_pod<uint64_t>(out, records[i].sequence);
    }
    finish_artifact(out, file);
}

std::vector<SequenceEntry> read_sequences_file(const std::string& file) {
    ArtifactReader reader(file);
    reader.expect_magic(kSequencesMagic);
    auto count = reader.read_pod<uint64_t>();

    std::vector<SequenceEntry> entries;
    entries.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; i++) {
        SequenceEntry entry;
        entry.first = reader.read_string();
        entry.second = reader.read_pod<uint64_t>();
        entries.push_back(std::move(entry));
    }
    return entries;
}

namespace {

DumpSummary publish_snapshot(const std::string& path,
                             const std::vector<podflow::StoredRecord>& records,
                             size_t shard_count,
                             bool keep_sequences) {
    auto ranges = partition(records.size(), shard_count);

    const fs::path target = snapshot_path(path);
    const fs::path staging = with_suffix(target, ".staging");
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    fs::remove_all(staging);
    fs::create_directories(staging);

    ShardManifest manifest;
    manifest.shard_count = shard_count;
    manifest.total_records = records.size();
    for (size_t s = 0; s < shard_count; s++) {
        ShardEntry entry;
        entry.index = s;
        entry.range = ranges[s];
        entry.vectors_file = std::to_string(s) + "/vectors";
        entry.metas_file = std::to_string(s) + "/metas";

        fs::create_directories(staging / std::to_string(s));
        const std::string vectors = (staging / entry.vectors_file).string();
        const std::string metas = (staging / entry.metas_file).string();
        write_vectors_file(vectors, records, entry.range);
        write_metas_file(metas, records, entry.range);
        entry.vectors_sha256 = podflow::compute_file_hash(vectors);
        entry.metas_sha256 = podflow::compute_file_hash(metas);
        if (keep_sequences) {
            entry.sequences_file = std::to_string(s) + "/sequences";
            const std::string sequences = (staging / entry.sequences_file).string();
            write_sequences_file(sequences, records, entry.range);
            entry.sequences_sha256 = podflow::compute_file_hash(sequences);
        }
        manifest.shards.push_back(std::move(entry));
    }
    manifest.save(staging.string());

    publish_generation(target, staging);

    DumpSummary summary;
    summary.path = path;
    summary.total_records = records.size();
    summary.manifest = std::move(manifest);
    return summary;
}

// Runs `read` against the generation `path` resolves to, loading the manifest
// once. If a concurrent dump pruned that generation mid-read the link has
// moved on, and the read restarts on the new generation.
template <typename Read>
auto read_generation(const std::string& path, Read&& read) {
    const fs::path target = snapshot_path(path);
    fs::path generation = resolve_generation(target);
    for (int attempt = 1;; attempt++) {
        try {
            auto manifest = ShardManifest::load(generation.string());
            return read(generation, manifest);
        } catch (const podflow::SnapshotError&) {
            fs::path current = resolve_generation(target);
            if (current == generation || attempt == kReadAttempts) {
                throw;
            }
            generation = current;
        }
    }
}

std::vector<VectorEntry> load_vectors(const fs::path& dir, const ShardEntry& entry) {
    const std::string file = (dir / entry.vectors_file).string();
    verify_digest(file, entry.vectors_sha256);
    auto entries = read_vectors_file(file);
    check_count(file, entries.size(), entry);
    return entries;
}

std::vector<MetadataEntry> load_metas(const fs::path& dir, const ShardEntry& entry) {
    const std::string file = (dir / entry.metas_file).string();
    verify_digest(file, entry.metas_sha256);
    auto entries = read_metas_file(file);
    check_count(file, entries.size(), entry);
    return entries;
}

// Both artifacts of one shard zipped into records at their logical positions
std::vector<podflow::StoredRecord> load_shard(const fs::path& dir, const ShardEntry& entry) {
    auto vectors = load_vectors(dir, entry);
    auto metas = load_metas(dir, entry);
    const std::string shard = "shard " + std::to_string(entry.index) + " of " + dir.string();
    if (vectors.size() != metas.size()) {
        throw podflow::SnapshotError(shard + " has mismatched artifacts");
    }

    std::vector<podflow::StoredRecord> records;
    records.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); i++) {
        if (vectors[i].first != metas[i].first) {
            throw podflow::SnapshotError(shard + " lists id '" + vectors[i].first + "' against '" +
                                         metas[i].first + "'");
        }
        podflow::StoredRecord record;
        record.id = std::move(vectors[i].first);
        record.vector = std::move(vectors[i].second);
        record.metadata = std::move(metas[i].second);
        record.sequence = entry.range.begin + i;
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace

DumpSummary write_snapshot(const std::string& path,
                           const std::vector<podflow::StoredRecord>& records,
                           size_t shard_count) {
    auto summary = publish_snapshot(path, records, shard_count, false);
    std::cout << "Wrote snapshot " << path << ": " << records.size() << " records in "
              << shard_count << " shards" << std::endl;
    return summary;
}

DumpSummary write_checkpoint(const std::string& path,
                             const std::vector<podflow::StoredRecord>& records) {
    return publish_snapshot(path, records, 1, true);
}

bool snapshot_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::path(path) / kManifestFile, ec);
}

std::vector<VectorEntry> import_vectors(const std::string& path, size_t shard_index) {
    return read_generation(path, [&](const fs::path& dir, const ShardManifest& manifest) {
        return load_vectors(dir, manifest.shard(shard_index));
    });
}

std::vector<MetadataEntry> import_metas(const std::string& path, size_t shard_index) {
    return read_generation(path, [&](const fs::path& dir, const ShardManifest& manifest) {
        return load_metas(dir, manifest.shard(shard_index));
    });
}

std::vector<podflow::StoredRecord> import_shard(const std::string& path,
                                                size_t shard_index,
                                                size_t expected_shard_count) {
    return read_generation(path, [&](const fs::path& dir, const ShardManifest& manifest) {
        if (manifest.shard_count != expected_shard_count) {
            throw podflow::PartitionMismatchError(
                "snapshot " + path + " has " + std::to_string(manifest.shard_count) +
                " shards, expected " + std::to_string(expected_shard_count));
        }
        return load_shard(dir, manifest.shard(shard_index));
    });
}

std::vector<podflow::StoredRecord> read_checkpoint(const std::string& path) {
    return read_generation(path, [&](const fs::path& dir, const ShardManifest& manifest) {
        const auto& entry = manifest.shard(0);
        if (manifest.shard_count != 1 || entry.sequences_file.empty()) {
            throw podflow::SnapshotError(path + " is not a unit checkpoint");
        }
        auto records = load_shard(dir, entry);

        const std::string file = (dir / entry.sequences_file).string();
        verify_digest(file, entry.sequences_sha256);
        auto sequences = read_sequences_file(file);
        check_count(file, sequences.size(), entry);
        for (size_t i = 0; i < records.size(); i++) {
            if (sequences[i].first != records[i].id) {
                throw podflow::SnapshotError(file + " lists id '" + sequences[i].first +
                                             "' against '" + records[i].id + "'");
            }
            records[i].sequence = sequences[i].second;
        }
        return records;
    });
}

} // namespace dump
