#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, temp dir if unset).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a fresh, not-yet-existing path under temp_dir() starting with prefix.
std::filesystem::path temp_path(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
