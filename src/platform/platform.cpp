#include "platform.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <random>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_path(const std::string& prefix) {
    // pid + counter + random keeps parallel test processes apart
    static std::atomic<unsigned> counter{0};
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(10000, 99999);

    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                          std::to_string(counter.fetch_add(1)) + "_" +
                          std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
