#include "utils.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <mutex>
#include <random>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::string generate_uuid() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng();
        lo = rng();
    }

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string remote_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}
