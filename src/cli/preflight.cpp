#include "preflight.hpp"
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_target(const Config& config, const std::string& target) {
    std::vector<PreflightIssue> issues;
    if (config.find_target(target)) return issues;

    std::string known;
    for (const auto& [name, tc] : config.targets()) {
        if (!known.empty()) known += ", ";
        known += name;
    }
    issues.push_back({
        fmt::format("Unknown target '{}'", target),
        fmt::format("Use one of: {} (see 'vmig targets')", known)
    });
    return issues;
}

std::vector<PreflightIssue> check_payload(const Config& config, const TargetConfig& target) {
    std::vector<PreflightIssue> issues;
    namespace fs = std::filesystem;

    fs::path script = config.resolve_local(target.script);
    fs::path fallback = config.resolve_local(
        target.fallback_script.empty() ? target.script : target.fallback_script);

    if (!fs::exists(script) && !fs::exists(fallback)) {
        issues.push_back({
            fmt::format("Target '{}': payload script '{}' not found", target.name, script.string()),
            fmt::format("Create it or set targets.{}.script (base_dir is {})",
                        target.name, config.base_dir().string())
        });
    }

    // A missing config only warns at run time; say so up front
    if (target.config) {
        fs::path cfg = config.resolve_local(*target.config);
        if (!fs::exists(cfg)) {
            issues.push_back({
                fmt::format("Target '{}': config '{}' not found, the payload runs without it",
                            target.name, cfg.string()),
                "Generate one with 'vmig config <profile.yaml> -o " + cfg.string() + "'",
                true
            });
        }
    }

    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config, const std::string& target) {
    std::vector<PreflightIssue> all = check_target(config, target);
    if (!all.empty()) return all;

    auto payload_issues = check_payload(config, *config.find_target(target));
    all.insert(all.end(), payload_issues.begin(), payload_issues.end());
    return all;
}
