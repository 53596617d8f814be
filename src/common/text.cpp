#include "verifetch/common/text.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace verifetch {
namespace common {

std::optional<uint64_t> parseBytes(const std::string& value) {
    static const std::string suffixes = "bkmgtp";

    std::string number = trim(value);
    if (number.empty()) {
        return std::nullopt;
    }

    double multiplier = 1.0;
    auto pos = suffixes.find(static_cast<char>(std::tolower(static_cast<unsigned char>(number.back()))));
    if (pos != std::string::npos) {
        multiplier = std::pow(1024.0, static_cast<double>(pos));
        number.pop_back();
    }

    if (number.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double parsed = std::strtod(number.c_str(), &end);
    if (end == number.c_str() || *end != '\0' || !std::isfinite(parsed) || parsed < 0) {
        return std::nullopt;
    }

    // 2^64 is exactly representable; anything at or above it does not fit.
    double scaled = std::round(parsed * multiplier);
    if (scaled >= 18446744073709551616.0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(scaled);
}

std::optional<uint64_t> parseUnsigned(const std::string& value) {
    std::string number = trim(value);
    if (number.empty() || !std::all_of(number.begin(), number.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(number));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto first = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(value.rbegin(), value.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string extractBetween(const std::string& text, const std::string& begin, const std::string& end) {
    auto start = text.find(begin);
    if (start == std::string::npos) {
        return "";
    }
    start += begin.size();
    auto stop = text.find(end, start);
    if (stop == std::string::npos) {
        return "";
    }
    return text.substr(start, stop - start);
}

std::optional<int64_t> parseHttpDate(const std::string& value) {
    static const char* formats[] = {
        "%a, %d %b %Y %H:%M:%S",
        "%A, %d-%b-%y %H:%M:%S",
        "%a %b %d %H:%M:%S %Y"
    };

    std::string input = trim(value);
    for (const char* format : formats) {
        struct tm tm;
        std::memset(&tm, 0, sizeof(tm));
        const char* rest = strptime(input.c_str(), format, &tm);
        if (rest) {
            return static_cast<int64_t>(timegm(&tm));
        }
    }
    return std::nullopt;
}

std::string formatTimestamp(int64_t unix_timestamp) {
    std::time_t t = static_cast<std::time_t>(unix_timestamp);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

}}
