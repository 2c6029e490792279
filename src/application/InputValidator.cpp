/**
 * @file InputValidator.cpp
 * @brief Implementation of the pipeline boundary checks.
 */

#include "application/InputValidator.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "domain/Errors.hpp"

namespace amlgate::application {

namespace {

void RequireNonNegative(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw domain::InvariantViolationError(std::string(field) + " must be a finite, non-negative number");
    }
}

void RequireRange(double value, double low, double high, const char* field) {
    if (!(value >= low && value <= high)) {
        throw domain::InvariantViolationError(std::string(field) + " must be within [" +
                                              std::to_string(low) + ", " + std::to_string(high) + "]");
    }
}

} // namespace

void InputValidator::ValidateTransaction(const domain::Transaction& transaction) {
    RequireNonNegative(transaction.amount.sent, "amount.sent");
    RequireNonNegative(transaction.amount.received, "amount.received");
}

void InputValidator::ValidateHistory(const domain::AccountHistory& history) {
    const auto& stats = history.stats;
    if (stats.totalTransactions < 0) {
        throw domain::InvariantViolationError("total_transactions must be non-negative");
    }
    if (stats.uniqueCounterparties < 0) {
        throw domain::InvariantViolationError("unique_counterparties must be non-negative");
    }
    RequireNonNegative(stats.totalSent, "total_sent");
    RequireNonNegative(stats.totalReceived, "total_received");
    RequireNonNegative(stats.avgTransactionAmount, "avg_transaction_amount");
    RequireNonNegative(stats.stdTransactionAmount, "std_transaction_amount");
    RequireNonNegative(stats.transactionFrequencyPerDay, "transaction_frequency_per_day");

    if (stats.totalTransactions > 0) {
        double expected = stats.totalSent / stats.totalTransactions;
        double tolerance = std::max(0.01, expected * 1e-3);
        if (std::abs(stats.avgTransactionAmount - expected) > tolerance) {
            throw domain::InvariantViolationError("avg_transaction_amount must equal total_sent / total_transactions");
        }
    }
}

void InputValidator::ValidateAssessment(const domain::StatisticalAssessment& assessment) {
    RequireRange(assessment.score, 0.0, 10.0, "statistical score");
}

void InputValidator::ValidateAssessment(const domain::NarrativeAssessment& assessment) {
    RequireRange(assessment.score, 0.0, 1.0, "narrative score");
}

} // namespace amlgate::application
