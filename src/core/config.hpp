#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.vmig/config.yaml (or $VMIG_CONFIG). Falls back to built-in
    // defaults when the file does not exist.
    static Result<Config> load();

    // Load a specific config file. Missing file is an error here.
    static Result<Config> load_file(const fs::path& path);

    // Built-in defaults: proxmox and kvm targets, 15s connect timeout, cleanup on.
    static Config defaults();

    // Accessors
    int connect_timeout() const { return connect_timeout_; }
    bool cleanup() const { return cleanup_; }
    const fs::path& base_dir() const { return base_dir_; }
    const std::map<std::string, TargetConfig>& targets() const { return targets_; }

    // nullptr if no target has that name
    const TargetConfig* find_target(const std::string& name) const;

    // Payload paths are relative to base_dir unless absolute.
    fs::path resolve_local(const std::string& path) const;

public:
    Config() = default;

private:
    int connect_timeout_ = 15;
    bool cleanup_ = true;
    fs::path base_dir_;
    std::map<std::string, TargetConfig> targets_;
};

bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write the built-in defaults to get_config_path() (no-op if it exists)
Result<void> create_default_config();
