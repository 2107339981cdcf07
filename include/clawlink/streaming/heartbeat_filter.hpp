#pragma once

#include "../types.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace clawlink {
namespace streaming {

/**
 * @brief Detects synthetic heartbeat/status content the gateway injects.
 *
 * Patterns are matched case-insensitively as substrings. The same filter is
 * applied to streamed chunks and to loaded history.
 */
class HeartbeatFilter {
public:
    explicit HeartbeatFilter(std::vector<std::string> patterns = default_heartbeat_patterns())
        : patterns_(normalize(std::move(patterns))) {}

    /// True if the text contains any sentinel pattern.
    bool matches(std::string_view text) const {
        if (text.empty() || patterns_.empty()) {
            return false;
        }
        const std::string upper = to_upper(text);
        return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::string& pattern) {
            return upper.find(pattern) != std::string::npos;
        });
    }

    bool is_heartbeat(const Message& message) const {
        return matches(message.content);
    }

    /**
     * @brief Drop heartbeat messages and messages with nothing to show.
     *
     * Idempotent: filtering an already-filtered list returns it unchanged.
     */
    std::vector<Message> filter(const std::vector<Message>& messages) const {
        std::vector<Message> kept;
        kept.reserve(messages.size());
        for (const auto& message : messages) {
            if (!is_heartbeat(message) && !message.is_empty()) {
                kept.push_back(message);
            }
        }
        return kept;
    }

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    static std::string to_upper(std::string_view text) {
        std::string upper(text);
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return upper;
    }

    static std::vector<std::string> normalize(std::vector<std::string> patterns) {
        patterns.erase(std::remove_if(patterns.begin(), patterns.end(),
                                      [](const std::string& p) { return p.empty(); }),
                       patterns.end());
        for (auto& pattern : patterns) {
            pattern = to_upper(pattern);
        }
        return patterns;
    }

    std::vector<std::string> patterns_;
};

} // namespace streaming
} // namespace clawlink
