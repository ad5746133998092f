#pragma once

#include <string>

namespace platform {

// RAII guard that turns terminal echo off for the lifetime of the object.
// Restores the saved mode on destruction. No-op when stdin is not a tty.
class NoEchoGuard {
public:
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Print `prompt`, read one line from stdin without echo.
// Returns false on EOF.
bool read_secret(const std::string& prompt, std::string& out);

} // namespace platform
