#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

class Config;

// The files a job ships to the destination: an executable script (with a
// fallback location) and an optional configuration file.
struct PayloadBundle {
    fs::path script;
    fs::path fallback_script;
    std::optional<fs::path> config;
    std::string remote_dir;
    std::string remote_config_name = "config.json";

    // Build from a target policy, resolving relative paths against the
    // config's base_dir.
    static PayloadBundle from_target(const TargetConfig& target, const Config& config);
};

enum class ConfigPresence {
    kNotConfigured,
    kFound,
    kMissing,
};

struct ResolvedPayload {
    fs::path script;
    bool used_fallback = false;
    ConfigPresence config = ConfigPresence::kNotConfigured;
    fs::path config_path;   // configured path unless kNotConfigured

    std::string remote_script;
    std::string remote_config;
};

// Pick the script location that exists and check the config file.
// TransferError when neither script location exists.
ResolvedPayload resolve_payload(const PayloadBundle& bundle);
