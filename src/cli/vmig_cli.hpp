#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Parsed `vmig run <target> --host H --user U [--port P] [--save-log] [--log-dir D]`
struct RunArgs {
    std::string target;
    Endpoint endpoint{"", 0};   // port 0 = the target's configured port
    std::string user;
    bool save_log = false;
    fs::path log_dir = ".";
};

Result<RunArgs> parse_run_args(const std::vector<std::string>& args);

// Parsed `vmig config <profile.yaml> [-o out.json]`; empty output = stdout
struct ConfigArgs {
    fs::path profile;
    fs::path output;
};

Result<ConfigArgs> parse_config_args(const std::vector<std::string>& args);

// Subcommand front end. Each run_* returns the process exit code.
class VmigCLI {
public:
    VmigCLI() = default;

    int run_job(const std::vector<std::string>& args);
    int run_targets();
    int run_config(const std::vector<std::string>& args);
    int run_init();

private:
    // Prints the error and returns false when the config cannot be loaded
    bool load_config(Config& out);
};
