/**
 * @file Errors.hpp
 * @brief Exception types raised across the screening pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace amlgate::domain {

/**
 * @class ExternalUnavailableError
 * @brief A collaborator (gate, knowledge base, reasoning service) could not be reached or failed.
 *
 * Always propagated to the pipeline caller. Never converted into a decision.
 */
class ExternalUnavailableError : public std::runtime_error {
public:
    explicit ExternalUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class DeadlineExceededError
 * @brief The caller-supplied deadline expired or its cancellation token fired.
 */
class DeadlineExceededError : public ExternalUnavailableError {
public:
    explicit DeadlineExceededError(const std::string& stage)
        : ExternalUnavailableError("Deadline exceeded during " + stage), m_stage(stage) {}

    const std::string& getStage() const { return m_stage; }

private:
    std::string m_stage;
};

/**
 * @class InvariantViolationError
 * @brief A score, count or aggregate is outside its declared bound.
 */
class InvariantViolationError : public std::invalid_argument {
public:
    explicit InvariantViolationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace amlgate::domain
