#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace verifetch {
namespace common {

// "1.5k" -> 1536, "10M" -> 10485760; suffixes b k m g t p are powers of 1024.
// Returns nullopt for empty or malformed input.
std::optional<uint64_t> parseBytes(const std::string& value);

std::optional<uint64_t> parseUnsigned(const std::string& value);

std::string toLower(std::string value);
std::string trim(const std::string& value);

// Text between the first `begin` and the following `end`, empty if absent.
std::string extractBetween(const std::string& text, const std::string& begin, const std::string& end);

// Parses RFC 1123 / RFC 850 / asctime HTTP dates into seconds since the epoch (UTC).
std::optional<int64_t> parseHttpDate(const std::string& value);

std::string formatTimestamp(int64_t unix_timestamp);

}}
