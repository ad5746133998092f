#pragma once

#include <chrono>
#include <optional>
#include <string>

// Human-readable elapsed time between two points: "2h35m", "14m22s", "8s".
// With no end point the duration runs up to now (for still-running jobs).
std::string format_duration(std::chrono::system_clock::time_point start,
                            std::optional<std::chrono::system_clock::time_point> end = std::nullopt);

// Same, for a raw number of seconds. Negative values clamp to "0s".
std::string format_seconds(long long seconds);

// Wall-clock "8:13pm" display of a time point.
std::string format_clock(std::chrono::system_clock::time_point tp);
