#pragma once

#include <stdexcept>
#include <string>

namespace podflow {

// Root of every error raised by the orchestration layer
class PodflowError : public std::runtime_error {
public:
    explicit PodflowError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid pipeline spec: bad replica/shard count, name or port collision
class ConfigurationError : public PodflowError {
public:
    using PodflowError::PodflowError;
};

// Ports cannot satisfy the chained-port invariant
class WiringError : public PodflowError {
public:
    using PodflowError::PodflowError;
};

// A member was stopped, is draining or failed to start; it never accepted the call
class UnavailableError : public PodflowError {
public:
    using PodflowError::PodflowError;
};

// A replica did not become ready while being cycled
class RollingUpdateError : public PodflowError {
public:
    RollingUpdateError(const std::string& pod, int replica_id, const std::string& reason)
        : PodflowError("rolling update of pod '" + pod + "' failed at replica " +
                       std::to_string(replica_id) + ": " + reason),
          pod_(pod), replica_id_(replica_id) {}

    const std::string& pod() const { return pod_; }
    int replica_id() const { return replica_id_; }

private:
    std::string pod_;
    int replica_id_;
};

// A shard or replica missed the deadline of a call. Index -1 means "any".
class ShardTimeoutError : public PodflowError {
public:
    ShardTimeoutError(const std::string& pod, int replica_id, int shard_id,
                      const std::string& detail = "did not respond before the deadline")
        : PodflowError("pod '" + pod + "' replica " + std::to_string(replica_id) +
                       " shard " + std::to_string(shard_id) + ": " + detail),
          pod_(pod), replica_id_(replica_id), shard_id_(shard_id) {}

    const std::string& pod() const { return pod_; }
    int replica_id() const { return replica_id_; }
    int shard_id() const { return shard_id_; }

private:
    std::string pod_;
    int replica_id_;
    int shard_id_;
};

// Requested shard index does not exist in the snapshot's manifest
class PartitionMismatchError : public PodflowError {
public:
    using PodflowError::PodflowError;
};

// Snapshot artifact missing, truncated or failing its digest
class SnapshotError : public PodflowError {
public:
    using PodflowError::PodflowError;
};

} // namespace podflow
