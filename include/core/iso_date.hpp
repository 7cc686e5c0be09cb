#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ytp {

// Second resolution keeps every four-digit year representable
using DateTP = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// Strict YYYY-MM-DD, midnight UTC. Anything else (short fields, bad month/day, trailing text) is nullopt
std::optional<DateTP> ParseIsoDate(const std::string& s);

// Inverse of ParseIsoDate for the date part (UTC)
std::string FormatIsoDate(DateTP tp);

} // namespace ytp
