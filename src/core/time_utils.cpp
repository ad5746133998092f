#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>

std::string format_seconds(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_duration(std::chrono::system_clock::time_point start,
                            std::optional<std::chrono::system_clock::time_point> end) {
    auto stop = end ? *end : std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(stop - start).count();
    return format_seconds(secs);
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    // "08:13PM" → "8:13pm"
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}
