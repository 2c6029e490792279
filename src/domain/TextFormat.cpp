/**
 * @file TextFormat.cpp
 * @brief Implementation of the text formatting helpers.
 */

#include "domain/TextFormat.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace amlgate::domain {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

std::string FormatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

std::string FormatMoney(double amount) {
    std::string fixed = FormatFixed(std::fabs(amount), 2);
    std::string::size_type dot = fixed.find('.');
    std::string whole = fixed.substr(0, dot);
    std::string cents = fixed.substr(dot);

    std::string grouped;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        count++;
    }
    return std::string(amount < 0 ? "-$" : "$") + grouped + cents;
}

std::string FormatPercent(double ratio, int decimals) {
    return FormatFixed(ratio * 100.0, decimals) + "%";
}

std::string FormatUtc(Timestamp when, const char* pattern) {
    std::time_t tt = std::chrono::system_clock::to_time_t(when);
    std::tm tm = ToUtcTime(tt);
    std::ostringstream ss;
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

std::string ToUpperAscii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string TitleCase(std::string value) {
    bool first = true;
    for (char& ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        ch = static_cast<char>(first ? std::toupper(c) : std::tolower(c));
        first = false;
    }
    return value;
}

std::string TruncateUtf8(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80) continue; // continuation byte
        if (chars == maxChars) return text.substr(0, i);
        chars++;
    }
    return text;
}

} // namespace amlgate::domain
