#include "payload_bundle.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

PayloadBundle PayloadBundle::from_target(const TargetConfig& target, const Config& config) {
    PayloadBundle b;
    b.script = config.resolve_local(target.script);
    b.fallback_script = config.resolve_local(
        target.fallback_script.empty() ? target.script : target.fallback_script);
    if (target.config) {
        b.config = config.resolve_local(*target.config);
    }
    b.remote_dir = target.remote_dir;
    b.remote_config_name = target.remote_config_name;
    return b;
}

static bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

ResolvedPayload resolve_payload(const PayloadBundle& bundle) {
    ResolvedPayload r;

    if (is_regular(bundle.script)) {
        r.script = bundle.script;
    } else if (is_regular(bundle.fallback_script)) {
        r.script = bundle.fallback_script;
        r.used_fallback = true;
    } else if (bundle.fallback_script == bundle.script) {
        throw TransferError(fmt::format("Script not found: {}", bundle.script.string()));
    } else {
        throw TransferError(fmt::format("Script not found: {} (fallback {} missing too)",
                                        bundle.script.string(),
                                        bundle.fallback_script.string()));
    }

    if (bundle.config) {
        if (is_regular(*bundle.config)) {
            r.config = ConfigPresence::kFound;
            r.config_path = *bundle.config;
        } else {
            r.config = ConfigPresence::kMissing;
            r.config_path = *bundle.config;
        }
    }

    r.remote_script = remote_join(bundle.remote_dir, r.script.filename().string());
    r.remote_config = remote_join(bundle.remote_dir, bundle.remote_config_name);
    return r;
}
