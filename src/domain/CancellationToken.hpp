/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared between a caller and a background extraction.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "domain/ContentErrors.hpp"

namespace omnisplit::domain {

/**
 * @class CancellationToken
 * @brief Copyable handle to a shared cancel flag with an optional deadline.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : m_state(std::make_shared<State>()) {}

    static CancellationToken WithTimeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.m_state->deadline = Clock::now() + timeout;
        return token;
    }

    void cancel() { m_state->cancelled = true; }

    bool isCancelled() const {
        if (m_state->cancelled.load()) return true;
        return m_state->deadline && Clock::now() >= *m_state->deadline;
    }

    /** @brief Throws ExtractionCancelledError if cancelled or past the deadline. */
    void throwIfCancelled(const std::string& what) const {
        if (isCancelled()) {
            throw ExtractionCancelledError("Extraction cancelled: " + what);
        }
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline; // written before the token is shared
    };
    std::shared_ptr<State> m_state;
};

} // namespace omnisplit::domain
