#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "endpoint.h"
#include "processing_unit.h"

namespace worker {

enum class WorkerState {
    kCreated,
    kStarting,
    kReady,
    kFailed,
    kStopped
};

const char* state_name(WorkerState state);

// Leaf unit of execution: one (replica, shard) pair running its processing
// unit on a dedicated thread, fed through a mailbox
class Worker {
public:
    Worker(std::string name, podflow::Endpoint endpoint, UnitContext context,
           std::unique_ptr<ProcessingUnit> unit);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Spawn the execution thread; warm-up runs on it
    void start();

    // Block until warm-up finished. Returns false if the deadline passed first,
    // rethrows the warm-up error if it failed.
    bool wait_ready(std::chrono::steady_clock::time_point deadline);

    // Queue a request. Throws UnavailableError if the worker is not running.
    std::future<podflow::Response> submit(podflow::Request request);

    // Queue a full scan of the unit's records
    std::future<std::vector<podflow::StoredRecord>> submit_scan();

    // Fail queued jobs with UnavailableError and join the thread
    void stop();

    WorkerState state() const;
    bool supports_scan() const { return supports_scan_; }
    const std::string& name() const { return name_; }
    const podflow::Endpoint& endpoint() const { return endpoint_; }
    const UnitContext& context() const { return context_; }

private:
    struct Job {
        std::function<void(ProcessingUnit&)> run;
        std::function<void(std::exception_ptr)> fail;
    };

    void enqueue(Job job);
    void execution_thread();
    void fail_pending(std::deque<Job>& jobs);

    std::string name_;
    podflow::Endpoint endpoint_;
    UnitContext context_;
    std::unique_ptr<ProcessingUnit> unit_;
    bool supports_scan_;

    WorkerState state_ = WorkerState::kCreated;
    std::exception_ptr startup_error_;
    bool stopping_ = false;
    std::deque<Job> mailbox_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace worker
