#pragma once

#include <string>

namespace podflow {

// Compute SHA256 hash of string
std::string compute_hash(const std::string& data);

// Compute SHA256 hash of a file's contents; throws SnapshotError if unreadable
std::string compute_file_hash(const std::string& path);

} // namespace podflow
