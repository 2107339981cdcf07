#pragma once

#include "types.hpp"
#include "../types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clawlink {
namespace protocol {

/**
 * @brief Async request/response correlation for gateway RPCs.
 *
 * Maps outgoing request IDs to std::promise objects so that responses
 * from the receive thread can be routed back to the correct caller.
 * Every pending request is resolved exactly once: by its response, by its
 * deadline, or by cancel_all(). Whichever path removes the entry from the
 * table first wins; the others find nothing and do nothing.
 *
 * Deadlines are enforced by a single timer thread owned by the correlator.
 * Destroying the correlator stops the timer and fails whatever is left.
 *
 * Thread-safe: create_pending_request() is called from caller threads,
 * resolve() from the transport read thread, cancel_all() from disconnect.
 */
class RequestCorrelator {
public:
    using Result = Expected<ResponseFrame>;

    explicit RequestCorrelator(std::chrono::milliseconds default_timeout = std::chrono::seconds(30))
        : default_timeout_(default_timeout) {
        timer_thread_ = std::thread([this]() { timer_loop(); });
    }

    ~RequestCorrelator() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        timer_cv_.notify_all();
        if (timer_thread_.joinable()) {
            timer_thread_.join();
        }
        cancel_all("Request correlator shut down");
    }

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * @brief Create a pending request and return its future.
     *
     * Allocates the next identifier (1, 2, 3, ... as decimal strings, never
     * reused by this correlator), arms its deadline, and returns the ID along
     * with a future that resolves with the response or a failure.
     *
     * @param method Method name, used to label a timeout failure
     * @param timeout Deadline override; default_timeout() when absent
     */
    std::pair<RequestId, std::future<Result>> create_pending_request(
        const std::string& method,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        RequestId id = std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();
        auto deadline = std::chrono::steady_clock::now() + timeout.value_or(default_timeout_);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.emplace(id, PendingRequest{method, deadline, std::move(promise)});
        }
        timer_cv_.notify_all();

        return {std::move(id), std::move(future)};
    }

    /**
     * @brief Route a response frame to its pending request.
     *
     * A response whose ID is no longer pending (already timed out, cancelled,
     * or a duplicate) is dropped.
     *
     * @return true if a waiting caller was resolved
     */
    bool resolve(const ResponseFrame& response) {
        auto promise = take(response.id);
        if (!promise) {
            spdlog::debug("[clawlink] dropping response for non-pending request id={}", response.id);
            return false;
        }
        promise->set_value(response);
        return true;
    }

    /**
     * @brief Fail a single pending request (e.g. the transport refused the write).
     */
    bool fail(const RequestId& id, Error error) {
        auto promise = take(id);
        if (!promise) {
            return false;
        }
        promise->set_value(tl::unexpected(std::move(error)));
        return true;
    }

    /**
     * @brief Fail every pending request with NotConnected.
     *
     * Called on disconnect so that no caller is left waiting.
     */
    void cancel_all(const std::string& reason = "Not connected to server") {
        std::vector<std::shared_ptr<std::promise<Result>>> cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled.reserve(pending_.size());
            for (auto& entry : pending_) {
                cancelled.push_back(std::move(entry.second.promise));
            }
            pending_.clear();
        }

        for (auto& promise : cancelled) {
            promise->set_value(tl::unexpected(Error{ErrorCode::NotConnected, reason}));
        }
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::chrono::milliseconds default_timeout() const {
        return default_timeout_;
    }

private:
    struct PendingRequest {
        std::string method;
        std::chrono::steady_clock::time_point deadline;
        std::shared_ptr<std::promise<Result>> promise;
    };

    std::shared_ptr<std::promise<Result>> take(const RequestId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return nullptr;
        }
        auto promise = std::move(it->second.promise);
        pending_.erase(it);
        return promise;
    }

    void timer_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (pending_.empty()) {
                timer_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
                continue;
            }

            auto earliest = std::chrono::steady_clock::time_point::max();
            for (const auto& entry : pending_) {
                earliest = std::min(earliest, entry.second.deadline);
            }
            timer_cv_.wait_until(lock, earliest);
            if (stopping_) {
                break;
            }

            // Collect expired entries under the lock, resolve them outside it
            auto now = std::chrono::steady_clock::now();
            std::vector<std::pair<std::string, std::shared_ptr<std::promise<Result>>>> expired;
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.deadline <= now) {
                    expired.emplace_back(std::move(it->second.method), std::move(it->second.promise));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }

            if (expired.empty()) {
                continue;
            }

            lock.unlock();
            for (auto& [method, promise] : expired) {
                spdlog::warn("[clawlink] request timed out: {}", method);
                promise->set_value(tl::unexpected(Error{
                    ErrorCode::RequestTimeout,
                    "Request timed out: " + method,
                    method
                }));
            }
            lock.lock();
        }
    }

    std::atomic<uint64_t> next_id_{1};
    std::chrono::milliseconds default_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    bool stopping_ = false;
    std::unordered_map<RequestId, PendingRequest> pending_;

    std::thread timer_thread_;  ///< Declared last: started after every other member is ready
};

} // namespace protocol
} // namespace clawlink
