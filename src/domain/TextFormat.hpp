/**
 * @file TextFormat.hpp
 * @brief Number and date rendering shared by prompts and report drafts.
 */

#pragma once

#include <string>

#include "domain/Transaction.hpp"

namespace amlgate::domain {

/** @brief "$12,345.67" */
std::string FormatMoney(double amount);

/** @brief Fixed-point with the given number of decimals. */
std::string FormatFixed(double value, int decimals);

/** @brief Ratio rendered as a percentage, e.g. 0.25 -> "25%" (decimals=0). */
std::string FormatPercent(double ratio, int decimals = 0);

/** @brief UTC rendering with a strftime pattern (default "%Y-%m-%d"). */
std::string FormatUtc(Timestamp when, const char* pattern = "%Y-%m-%d");

/** @brief Copy with ASCII letters upper-cased. */
std::string ToUpperAscii(std::string value);

/** @brief Copy with the first letter upper-cased and the rest lower-cased. */
std::string TitleCase(std::string value);

/**
 * @brief Leading part of UTF-8 text holding at most maxChars code points.
 *
 * Cuts only on code-point boundaries, so the result stays valid UTF-8 when the input is.
 */
std::string TruncateUtf8(const std::string& text, size_t maxChars);

} // namespace amlgate::domain
