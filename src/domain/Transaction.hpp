/**
 * @file Transaction.hpp
 * @brief Transaction and account-history records produced by upstream ingestion.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace amlgate::domain {

using Timestamp = std::chrono::system_clock::time_point;

/** @brief Sender or receiver of a transaction. */
struct TransactionParty {
    std::string accountId;
    std::string bankId;
};

/** @brief Amount details for a transaction. */
struct TransactionAmount {
    double sent = 0.0;
    double received = 0.0;
    std::string currencySent = "US Dollar";
    std::string currencyReceived = "US Dollar";
};

/**
 * @struct Transaction
 * @brief A single financial transaction. Read-only inside the pipeline.
 */
struct Transaction {
    std::optional<std::string> id;
    TransactionParty sender;
    TransactionParty receiver;
    TransactionAmount amount;
    std::string paymentFormat; ///< "Wire", "Cheque", "ACH", "Reinvestment", "Credit Card"...
    Timestamp timestamp;
    std::optional<bool> isLaundering; ///< Ground truth label, when known.

    double amountSent() const { return amount.sent; }
};

/**
 * @struct AccountStats
 * @brief Aggregated behavioural summary of an account.
 *
 * Counts are non-negative and avgTransactionAmount == totalSent / totalTransactions
 * whenever totalTransactions > 0.
 */
struct AccountStats {
    int totalTransactions = 0;
    double totalSent = 0.0;
    double totalReceived = 0.0;
    double avgTransactionAmount = 0.0;
    double stdTransactionAmount = 0.0;
    int uniqueCounterparties = 0;
    std::map<std::string, double> paymentFormatDistribution;
    std::map<int, double> hourDistribution;
    Timestamp firstTransaction;
    Timestamp lastTransaction;
    double transactionFrequencyPerDay = 0.0;

    /** @brief Ratio of sent to received volume, if both sides moved money. */
    std::optional<double> sentReceivedRatio() const {
        if (totalSent > 0.0 && totalReceived > 0.0) {
            return totalSent / totalReceived;
        }
        return std::nullopt;
    }
};

/** @brief History context for the account owning a transaction. */
struct AccountHistory {
    std::string accountId;
    std::string bankId;
    AccountStats stats;
    std::optional<int> clusterId; ///< Behavioural peer group, if assigned.
};

/** @brief One transaction to screen together with its account history. */
struct ScreeningCase {
    Transaction transaction;
    AccountHistory history;
};

} // namespace amlgate::domain
