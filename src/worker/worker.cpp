#include "worker.h"
#include "errors.h"
#include <filesystem>
#include <iostream>

namespace worker {

const char* state_name(WorkerState state) {
    switch (state) {
        case WorkerState::kCreated: return "created";
        case WorkerState::kStarting: return "starting";
        case WorkerState::kReady: return "ready";
        case WorkerState::kFailed: return "failed";
        case WorkerState::kStopped: return "stopped";
    }
    return "unknown";
}

Worker::Worker(std::string name, podflow::Endpoint endpoint, UnitContext context,
               std::unique_ptr<ProcessingUnit> unit)
    : name_(std::move(name)),
      endpoint_(endpoint),
      context_(std::move(context)),
      unit_(std::move(unit)),
      supports_scan_(unit_ && unit_->supports_scan()) {
    if (!unit_) {
        throw podflow::ConfigurationError("worker " + name_ + " has no processing unit");
    }
}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != WorkerState::kCreated) {
        throw podflow::UnavailableError("worker " + name_ + " was already started");
    }
    state_ = WorkerState::kStarting;
    thread_ = std::thread(&Worker::execution_thread, this);
}

bool Worker::wait_ready(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_until(lock, deadline, [this] {
        return state_ != WorkerState::kCreated && state_ != WorkerState::kStarting;
    });
    if (!settled) {
        return false;
    }
    if (state_ == WorkerState::kFailed) {
        std::rethrow_exception(startup_error_);
    }
    if (state_ == WorkerState::kStopped) {
        throw podflow::UnavailableError("worker " + name_ + " is stopped");
    }
    return true;
}

void Worker::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || (state_ != WorkerState::kStarting && state_ != WorkerState::kReady)) {
            throw podflow::UnavailableError("worker " + name_ + " is " + state_name(state_));
        }
        mailbox_.push_back(std::move(job));
    }
    cv_.notify_all();
}

std::future<podflow::Response> Worker::submit(podflow::Request request) {
    auto promise = std::make_shared<std::promise<podflow::Response>>();
    auto future = promise->get_future();
    auto shared_request = std::make_shared<podflow::Request>(std::move(request));

    Job job;
    job.run = [promise, shared_request](ProcessingUnit& unit) {
        promise->set_value(unit.process(*shared_request));
    };
    job.fail = [promise](std::exception_ptr error) { promise->set_exception(error); };
    enqueue(std::move(job));
    return future;
}

std::future<std::vector<podflow::StoredRecord>> Worker::submit_scan() {
    if (!supports_scan_) {
        throw podflow::ConfigurationError("unit of worker " + name_ + " does not support full scans");
    }
    auto promise = std::make_shared<std::promise<std::vector<podflow::StoredRecord>>>();
    auto future = promise->get_future();

    Job job;
    job.run = [promise](ProcessingUnit& unit) { promise->set_value(unit.full_scan()); };
    job.fail = [promise](std::exception_ptr error) { promise->set_exception(error); };
    enqueue(std::move(job));
    return future;
}

void Worker::fail_pending(std::deque<Job>& jobs) {
    for (auto& job : jobs) {
        job.fail(std::make_exception_ptr(
            podflow::UnavailableError("worker " + name_ + " stopped before serving the request")));
    }
    jobs.clear();
}

void Worker::execution_thread() {
    try {
        if (!context_.workspace.empty()) {
            std::filesystem::create_directories(context_.workspace);
        }
        unit_->warm_up(context_);
    } catch (const std::exception& e) {
        std::cerr << "Worker " << name_ << " failed to start: " << e.what() << std::endl;
        std::deque<Job> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            startup_error_ = std::current_exception();
            state_ = WorkerState::kFailed;
            pending.swap(mailbox_);
        }
        cv_.notify_all();
        fail_pending(pending);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == WorkerState::kStarting) {
            state_ = WorkerState::kReady;
        }
    }
    cv_.notify_all();

    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !mailbox_.empty(); });
            if (stopping_) {
                break;
            }
            job = std::move(mailbox_.front());
            mailbox_.pop_front();
        }

        try {
            job.run(*unit_);
        } catch (...) {
            job.fail(std::current_exception());
        }
    }
}

void Worker::stop() {
    std::deque<Job> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == WorkerState::kStopped) {
            return;
        }
        stopping_ = true;
        pending.swap(mailbox_);
    }
    cv_.notify_all();
    fail_pending(pending);

    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = WorkerState::kStopped;
        // Jobs queued while warm-up was still running
        pending.swap(mailbox_);
    }
    cv_.notify_all();
    fail_pending(pending);
}

WorkerState Worker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace worker
