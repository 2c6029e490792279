/**
 * @file Deadline.hpp
 * @brief Caller-supplied deadline and cancellation token for in-flight screening.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "domain/Errors.hpp"

namespace amlgate::domain {

/**
 * @class CancellationToken
 * @brief Shared flag; copies observe the same cancellation.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * @class Deadline
 * @brief Optional steady-clock expiry combined with a cancellation token.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /** @brief Unbounded deadline that can still be cancelled through the token. */
    Deadline() = default;

    Deadline(std::optional<Clock::time_point> expiry, CancellationToken token)
        : m_expiry(expiry), m_token(std::move(token)) {}

    static Deadline After(std::chrono::milliseconds budget, CancellationToken token = CancellationToken()) {
        return Deadline(Clock::now() + budget, std::move(token));
    }

    bool isBounded() const { return m_expiry.has_value(); }

    bool expired() const {
        if (m_token.isCancelled()) return true;
        return m_expiry && Clock::now() >= *m_expiry;
    }

    /** @brief Time left before expiry, rounded up; zero once expired. Only meaningful when bounded. */
    std::chrono::milliseconds remaining() const {
        if (!m_expiry) return std::chrono::milliseconds::max();
        auto left = std::chrono::ceil<std::chrono::milliseconds>(*m_expiry - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    /**
     * @brief The smaller of a per-call budget and the time left.
     * @throws DeadlineExceededError if no time is left for the call.
     */
    std::chrono::milliseconds bound(std::chrono::milliseconds budget,
                                    const std::string& stage = "bounded call") const {
        check(stage);
        auto left = remaining();
        if (left.count() == 0) {
            throw DeadlineExceededError(stage);
        }
        return std::min(budget, left);
    }

    /** @brief Throws DeadlineExceededError if expired or cancelled. */
    void check(const std::string& stage) const {
        if (expired()) {
            throw DeadlineExceededError(stage);
        }
    }

    const CancellationToken& getToken() const { return m_token; }

private:
    std::optional<Clock::time_point> m_expiry;
    CancellationToken m_token;
};

/**
 * @brief Runs one collaborator call with its timeout bounded by the deadline.
 *
 * A collaborator failure raised once the deadline has passed, such as a read timeout cut short
 * by the bound, surfaces as DeadlineExceededError. Failures before expiry propagate unchanged.
 */
template <typename Call>
auto CallWithin(const Deadline& deadline, std::chrono::milliseconds budget, const std::string& stage, Call&& call)
    -> decltype(call(budget)) {
    const auto timeout = deadline.bound(budget, stage);
    try {
        return call(timeout);
    } catch (const DeadlineExceededError&) {
        throw;
    } catch (const ExternalUnavailableError& e) {
        if (deadline.expired()) {
            throw DeadlineExceededError(stage + " (" + e.what() + ")");
        }
        throw;
    }
}

} // namespace amlgate::domain
