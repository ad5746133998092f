#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

static const char* DEFAULT_CONFIG_YAML = R"(# vmig configuration
# Targets describe which migration payload is shipped to each destination
# platform and how it is launched there.

connect_timeout: 15      # seconds, TCP connect + SSH handshake
cleanup: true            # remove uploaded payload files when a job ends
base_dir: ""             # relative payload paths resolve here (default: cwd)

targets:
  proxmox:
    script: "app/esxi_to_proxmox_migration.py"
    fallback_script: "app/esxi_to_proxmox_migration.py"
    remote_dir: "/root"
    interpreter: "python3"
    elevate: false

  kvm:
    script: "app/kvm_migration.py"
    fallback_script: "app/kvm_migration.py"
    config: "app/config.json"
    remote_dir: "/home/kvmuser"
    interpreter: "python3 -u"
    elevate: true          # sudo -S, password written to stdin
)";

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".vmig";
}

fs::path get_config_path() {
    const char* env = std::getenv("VMIG_CONFIG");
    if (env && *env) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    try {
        if (config_path.has_parent_path()) {
            fs::create_directories(config_path.parent_path());
        }
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << DEFAULT_CONFIG_YAML;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static TargetConfig parse_target(const std::string& name, const YAML::Node& node) {
    TargetConfig t;
    t.name = name;
    t.script = node["script"].as<std::string>("");
    t.fallback_script = node["fallback_script"].as<std::string>("");
    if (node["config"] && node["config"].IsScalar()) {
        std::string cfg = node["config"].as<std::string>();
        if (!cfg.empty()) t.config = cfg;
    }
    t.remote_dir = node["remote_dir"].as<std::string>("");
    t.remote_config_name = node["remote_config_name"].as<std::string>(DEFAULT_REMOTE_CONFIG_NAME);
    t.interpreter = node["interpreter"].as<std::string>("");
    t.elevate = node["elevate"].as<bool>(false);
    t.port = node["port"].as<int>(22);
    return t;
}

// Empty string on success, otherwise what is wrong with the target.
static std::string validate_target(const TargetConfig& t) {
    if (t.script.empty() && t.fallback_script.empty()) {
        return "target '" + t.name + "' has neither script nor fallback_script";
    }
    if (t.remote_dir.empty()) {
        return "target '" + t.name + "' has no remote_dir";
    }
    if (t.remote_config_name.empty() || t.remote_config_name.find('/') != std::string::npos) {
        return "target '" + t.name + "' has an invalid remote_config_name";
    }
    if (t.port <= 0 || t.port > 65535) {
        return "target '" + t.name + "' has an invalid port";
    }
    return "";
}

Config Config::defaults() {
    Config config;
    YAML::Node root = YAML::Load(DEFAULT_CONFIG_YAML);
    for (const auto& kv : root["targets"]) {
        std::string name = kv.first.as<std::string>();
        config.targets_[name] = parse_target(name, kv.second);
    }
    config.connect_timeout_ = root["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
    config.cleanup_ = root["cleanup"].as<bool>(true);
    config.base_dir_ = fs::current_path();
    return config;
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (root["targets"] && !root["targets"].IsMap()) {
            return Result<Config>::Err("'targets' must be a map of target name to settings");
        }

        Config config;
        config.connect_timeout_ = root["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
        if (config.connect_timeout_ <= 0) {
            return Result<Config>::Err("connect_timeout must be positive");
        }
        config.cleanup_ = root["cleanup"].as<bool>(true);

        std::string base = root["base_dir"].as<std::string>("");
        if (base.empty()) {
            config.base_dir_ = fs::current_path();
        } else {
            fs::path b(base);
            // Relative base_dir is taken relative to the config file itself
            config.base_dir_ = b.is_absolute() ? b : path.parent_path() / b;
        }

        if (root["targets"]) {
            for (const auto& kv : root["targets"]) {
                std::string name = kv.first.as<std::string>();
                if (!kv.second.IsMap()) {
                    return Result<Config>::Err("target '" + name + "' must be a map");
                }
                TargetConfig t = parse_target(name, kv.second);
                std::string problem = validate_target(t);
                if (!problem.empty()) {
                    return Result<Config>::Err(problem);
                }
                config.targets_[name] = t;
            }
        }

        if (config.targets_.empty()) {
            return Result<Config>::Err("No targets configured in " + path.string());
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_config_path());
}

const TargetConfig* Config::find_target(const std::string& name) const {
    auto it = targets_.find(name);
    return it == targets_.end() ? nullptr : &it->second;
}

fs::path Config::resolve_local(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) return p;
    return base_dir_ / p;
}
