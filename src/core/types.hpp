#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Where to connect
struct Endpoint {
    std::string host;
    int port = 22;
};

// Who to connect as. The password doubles as the sudo password when the
// target runs its payload elevated.
struct Credential {
    std::string user;
    std::string password;
};

// Per-destination policy: which payload to ship and how to launch it.
// One entry per destination platform (proxmox, kvm, ...).
struct TargetConfig {
    std::string name;
    std::string script;                          // primary local script path
    std::string fallback_script;                 // used when `script` is absent
    std::optional<std::string> config;           // local payload configuration (optional)
    std::string remote_dir;                      // upload directory on the destination
    std::string remote_config_name = "config.json";
    std::string interpreter;                     // e.g. "python3 -u"; empty = exec script directly
    bool elevate = false;                        // run through sudo -S
    int port = 22;
};
