#include "shard_group.h"
#include "errors.h"
#include "merge.h"
#include <future>
#include <iostream>

namespace flow {

ShardGroup::ShardGroup(std::string pod, int replica_id,
                       std::vector<std::unique_ptr<worker::Worker>> workers,
                       podflow::MergeOptions merge)
    : pod_(std::move(pod)), replica_id_(replica_id), workers_(std::move(workers)), merge_(merge) {
    if (workers_.empty()) {
        throw podflow::ConfigurationError("pod '" + pod_ + "' replica " +
                                          std::to_string(replica_id_) + " has no shards");
    }
}

void ShardGroup::start() {
    for (auto& worker : workers_) {
        worker->start();
    }
}

bool ShardGroup::wait_ready(Clock::time_point deadline) {
    for (auto& worker : workers_) {
        if (!worker->wait_ready(deadline)) {
            return false;
        }
    }
    return true;
}

void ShardGroup::stop() {
    for (auto& worker : workers_) {
        worker->stop();
    }
}

podflow::ShardFailure ShardGroup::failure(int shard_id, bool timed_out,
                                          const std::string& message) const {
    podflow::ShardFailure failure;
    failure.set_pod(pod_);
    failure.set_replica(replica_id_);
    failure.set_shard(shard_id);
    failure.set_timed_out(timed_out);
    failure.set_message(message);
    return failure;
}

podflow::Response ShardGroup::process(const podflow::Request& request,
                                      Clock::time_point deadline) {
    if (request.type() == podflow::INDEX) {
        return broadcast_write(request, deadline);
    }
    return search(request, deadline);
}

podflow::Response ShardGroup::search(const podflow::Request& request,
                                     Clock::time_point deadline) {
    std::vector<std::future<podflow::Response>> pending;
    pending.reserve(workers_.size());
    for (auto& worker : workers_) {
        pending.push_back(worker->submit(request));
    }

    std::vector<podflow::Response> answers;
    answers.reserve(pending.size());
    for (size_t s = 0; s < pending.size(); s++) {
        if (pending[s].wait_until(deadline) != std::future_status::ready) {
            throw podflow::ShardTimeoutError(pod_, replica_id_, static_cast<int>(s));
        }
        answers.push_back(pending[s].get());
    }
    return merge_shard_answers(answers, request.top_k(), merge_);
}

podflow::Response ShardGroup::broadcast_write(const podflow::Request& request,
                                              Clock::time_point deadline) {
    std::vector<std::future<podflow::Response>> pending(workers_.size());
    std::vector<podflow::ShardFailure> failures;
    size_t accepted = 0;

    for (size_t s = 0; s < workers_.size(); s++) {
        try {
            pending[s] = workers_[s]->submit(request);
            accepted++;
        } catch (const podflow::UnavailableError& e) {
            failures.push_back(failure(static_cast<int>(s), false, e.what()));
        }
    }
    if (accepted == 0) {
        throw podflow::UnavailableError("no shard of pod '" + pod_ + "' replica " +
                                        std::to_string(replica_id_) + " accepted the write");
    }

    podflow::Response response;
    bool answered = false;
    for (size_t s = 0; s < pending.size(); s++) {
        if (!pending[s].valid()) {
            continue;
        }
        if (pending[s].wait_until(deadline) != std::future_status::ready) {
            failures.push_back(failure(static_cast<int>(s), true, "did not respond before the deadline"));
            continue;
        }
        try {
            auto shard_response = pending[s].get();
            if (!answered) {
                response = std::move(shard_response);
                answered = true;
            }
        } catch (const std::exception& e) {
            failures.push_back(failure(static_cast<int>(s), false, e.what()));
        }
    }

    if (!answered) {
        response.set_request_id(request.request_id());
        *response.mutable_docs() = request.docs();
    }
    for (const auto& f : failures) {
        std::cerr << "Write to pod " << pod_ << " replica " << replica_id_ << " shard "
                  << f.shard() << " failed: " << f.message() << std::endl;
        *response.add_failures() = f;
    }
    return response;
}

std::vector<podflow::StoredRecord> ShardGroup::full_scan(Clock::time_point deadline) {
    std::vector<std::future<std::vector<podflow::StoredRecord>>> pending;
    for (auto& worker : workers_) {
        if (worker->supports_scan()) {
            pending.push_back(worker->submit_scan());
        }
    }
    if (pending.empty()) {
        throw podflow::ConfigurationError("units of pod '" + pod_ + "' do not support full scans");
    }

    std::vector<podflow::StoredRecord> records;
    for (size_t s = 0; s < pending.size(); s++) {
        if (pending[s].wait_until(deadline) != std::future_status::ready) {
            throw podflow::ShardTimeoutError(pod_, replica_id_, static_cast<int>(s),
                                             "full scan did not finish before the deadline");
        }
        auto shard_records = pending[s].get();
        records.insert(records.end(),
                       std::make_move_iterator(shard_records.begin()),
                       std::make_move_iterator(shard_records.end()));
    }
    return records;
}

} // namespace flow
