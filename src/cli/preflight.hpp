#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Checks before a job is started for `target`.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config, const std::string& target);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_target(const Config& config, const std::string& target);
std::vector<PreflightIssue> check_payload(const Config& config, const TargetConfig& target);
