#include "hash_utils.h"
#include "errors.h"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <vector>

namespace podflow {

namespace {

std::string to_hex(const unsigned char* hash) {
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

} // namespace

std::string compute_hash(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.c_str(), data.length());
    SHA256_Final(hash, &sha256);
    return to_hex(hash);
}

std::string compute_file_hash(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SnapshotError("cannot open " + path + " for hashing");
    }

    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize n = file.gcount();
        if (n > 0) {
            SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) {
        throw SnapshotError("read error while hashing " + path);
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256);
    return to_hex(hash);
}

} // namespace podflow
