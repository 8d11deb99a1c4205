// src/query_pool.cpp
// Implementation of the bounded disk image query pool

#include "vdalign/query_pool.hpp"
#include "vdalign/errors.hpp"
#include "vdalign/utils.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

namespace vdalign {

namespace {

using Clock = std::chrono::steady_clock;

// Shared between the caller and its workers; outlives abandoned workers
struct BatchState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<HostName> queue;
    std::map<HostName, DiskImageId> answers;
    std::set<HostName> failed_hosts;
    std::vector<std::string> failures;
    size_t outstanding = 0;
    bool expired = false;
    Clock::time_point deadline;
};

void run_worker(std::shared_ptr<BatchState> state,
                std::shared_ptr<DiskImageResolver> resolver,
                std::shared_ptr<std::atomic<bool>> done) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->expired && !state->queue.empty()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            state->deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        HostName host = std::move(state->queue.front());
        state->queue.pop_front();
        lock.unlock();

        DiskImageId image;
        std::string failure;
        try {
            image = resolver->query_disk_image(host, remaining);
        } catch (const std::exception& e) {
            failure = Errors::query_failed(host, e.what()).what();
        }

        lock.lock();
        if (state->expired) {
            break;
        }
        if (failure.empty()) {
            state->answers[host] = std::move(image);
        } else {
            state->failed_hosts.insert(host);
            state->failures.push_back(std::move(failure));
        }
        if (state->outstanding > 0) {
            --state->outstanding;
        }
        state->cv.notify_all();
    }
    done->store(true);
}

} // namespace

DiskImageId QueryBatchResult::lookup(const HostName& host) const {
    auto it = identifiers.find(host);
    if (it == identifiers.end()) {
        return std::nullopt;
    }
    return it->second;
}

DiskImageQueryPool::DiskImageQueryPool(std::shared_ptr<DiskImageResolver> resolver,
                                       size_t concurrency_limit,
                                       std::chrono::milliseconds timeout)
    : resolver_(std::move(resolver))
    , concurrency_limit_(std::max<size_t>(concurrency_limit, 1))
    , timeout_(timeout) {
    if (!resolver_) {
        throw Errors::collaborator_unavailable("DiskImageResolver");
    }
}

QueryBatchResult DiskImageQueryPool::resolve(const std::vector<HostName>& hosts) {
    QueryBatchResult result;
    Utils::ScopedTimer timer;

    std::vector<HostName> distinct;
    std::set<HostName> seen;
    for (const auto& host : hosts) {
        if (!host.empty() && seen.insert(host).second) {
            distinct.push_back(host);
        }
    }
    if (distinct.empty()) {
        return result;
    }

    auto state = std::make_shared<BatchState>();
    state->queue.assign(distinct.begin(), distinct.end());
    state->outstanding = distinct.size();
    state->deadline = timer.started() + timeout_;

    size_t worker_count = std::min(concurrency_limit_, distinct.size());
    std::vector<std::thread> workers;
    std::vector<std::shared_ptr<std::atomic<bool>>> done_flags;
    workers.reserve(worker_count);

    for (size_t i = 0; i < worker_count; ++i) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            workers.emplace_back(run_worker, state, resolver_, done);
            done_flags.push_back(done);
        } catch (const std::system_error& e) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->failures.push_back(std::string("Could not start query worker: ") + e.what());
            break;
        }
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (!workers.empty()) {
            state->cv.wait_until(lock, state->deadline, [&state]() {
                return state->outstanding == 0;
            });
        }
        state->expired = true;
    }

    for (size_t i = 0; i < workers.size(); ++i) {
        if (done_flags[i]->load()) {
            workers[i].join();
        } else {
            workers[i].detach();
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    for (const auto& host : distinct) {
        auto it = state->answers.find(host);
        if (it != state->answers.end()) {
            result.identifiers[host] = it->second;
            ++result.answered;
        } else if (state->failed_hosts.count(host) > 0) {
            result.identifiers[host] = std::nullopt;
            ++result.failed;
        } else {
            result.identifiers[host] = std::nullopt;
            ++result.timed_out;
        }
    }
    result.failures = state->failures;
    result.elapsed = timer.elapsed();
    return result;
}

} // namespace vdalign
