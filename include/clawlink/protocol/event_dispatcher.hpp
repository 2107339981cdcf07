#pragma once

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clawlink {
namespace protocol {

/**
 * @brief Fans every inbound event out to a primary handler and a keyed
 * registry of listeners.
 *
 * dispatch() works on a snapshot of the registry taken when it starts, so a
 * listener may add or remove listeners (itself included) while being called.
 * Listeners get no ordering guarantee relative to each other.
 *
 * Threading: dispatch() runs on the transport read thread and must not block;
 * registration can happen from any thread.
 */
class EventDispatcher {
public:
    using EventHandler = std::function<void(const std::string&, const nlohmann::json&)>;

    /**
     * @brief Set (or clear, with nullptr) the primary handler.
     */
    void set_primary_handler(EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        primary_ = std::move(handler);
    }

    /**
     * @brief Register a listener under a caller-chosen ID.
     *
     * Registering an ID that already exists replaces its handler.
     *
     * @return The listener ID, for later removal
     */
    std::string add_listener(const std::string& id, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_[id] = std::move(handler);
        return id;
    }

    /**
     * @brief Remove a listener. Unknown IDs are ignored.
     */
    void remove_listener(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(id);
    }

    bool has_listener(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.count(id) > 0;
    }

    size_t listener_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
        primary_ = nullptr;
    }

    /**
     * @brief Deliver one event to the primary handler, then every listener.
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still see the event.
     */
    void dispatch(const std::string& name, const nlohmann::json& payload) const {
        EventHandler primary;
        std::vector<std::pair<std::string, EventHandler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            primary = primary_;
            snapshot.assign(listeners_.begin(), listeners_.end());
        }

        if (primary) {
            invoke("primary", primary, name, payload);
        }
        for (const auto& [id, handler] : snapshot) {
            invoke(id, handler, name, payload);
        }
    }

private:
    static void invoke(const std::string& id, const EventHandler& handler,
                       const std::string& name, const nlohmann::json& payload) {
        try {
            handler(name, payload);
        } catch (const std::exception& e) {
            spdlog::warn("[clawlink] event listener '{}' failed on '{}': {}", id, name, e.what());
        }
    }

    mutable std::mutex mutex_;
    EventHandler primary_;
    std::unordered_map<std::string, EventHandler> listeners_;
};

} // namespace protocol
} // namespace clawlink
