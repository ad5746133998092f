#include "vmig_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <cstdlib>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/migration_config.hpp>
#include <managers/migration_service.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <ssh/session.hpp>

// ── Argument parsing ────────────────────────────────────────

Result<RunArgs> parse_run_args(const std::vector<std::string>& args) {
    RunArgs out;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        auto value = [&]() -> const std::string* {
            if (i + 1 >= args.size()) return nullptr;
            return &args[++i];
        };

        if (a == "--host" || a == "-H") {
            const std::string* v = value();
            if (!v) return Result<RunArgs>::Err("--host needs a value");
            out.endpoint.host = *v;
            trim(out.endpoint.host);
        } else if (a == "--user" || a == "-u") {
            const std::string* v = value();
            if (!v) return Result<RunArgs>::Err("--user needs a value");
            out.user = *v;
            trim(out.user);
        } else if (a == "--port" || a == "-p") {
            const std::string* v = value();
            if (!v) return Result<RunArgs>::Err("--port needs a value");
            int port = safe_stoi(*v, -1);
            if (port <= 0 || port > 65535) {
                return Result<RunArgs>::Err("Invalid port: " + *v);
            }
            out.endpoint.port = port;
        } else if (a == "--save-log") {
            out.save_log = true;
        } else if (a == "--log-dir") {
            const std::string* v = value();
            if (!v) return Result<RunArgs>::Err("--log-dir needs a value");
            out.log_dir = *v;
            out.save_log = true;
        } else if (!a.empty() && a[0] == '-') {
            return Result<RunArgs>::Err("Unknown option: " + a);
        } else if (out.target.empty()) {
            out.target = a;
        } else {
            return Result<RunArgs>::Err("Unexpected argument: " + a);
        }
    }

    if (out.target.empty()) return Result<RunArgs>::Err("Missing target name");
    if (out.endpoint.host.empty()) return Result<RunArgs>::Err("Missing --host");
    if (out.user.empty()) return Result<RunArgs>::Err("Missing --user");
    return Result<RunArgs>::Ok(out);
}

Result<ConfigArgs> parse_config_args(const std::vector<std::string>& args) {
    ConfigArgs out;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "-o" || a == "--output") {
            if (i + 1 >= args.size()) return Result<ConfigArgs>::Err(a + " needs a value");
            out.output = args[++i];
        } else if (!a.empty() && a[0] == '-') {
            return Result<ConfigArgs>::Err("Unknown option: " + a);
        } else if (out.profile.empty()) {
            out.profile = a;
        } else {
            return Result<ConfigArgs>::Err("Unexpected argument: " + a);
        }
    }
    if (out.profile.empty()) return Result<ConfigArgs>::Err("Missing profile file");
    return Result<ConfigArgs>::Ok(out);
}

// ── Helpers ─────────────────────────────────────────────────

bool VmigCLI::load_config(Config& out) {
    auto result = Config::load();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'vmig init'");
        return false;
    }
    out = result.value;
    return true;
}

static bool read_password(const RunArgs& ra, std::string& password) {
    const char* env = std::getenv("VMIG_PASSWORD");
    if (env) {
        password = env;
        return true;
    }
    return platform::read_secret(
        fmt::format("    Password for {}@{}: ", ra.user, ra.endpoint.host), password);
}

// ── run ─────────────────────────────────────────────────────

int VmigCLI::run_job(const std::vector<std::string>& args) {
    auto parsed = parse_run_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: vmig run <target> --host H --user U [--port P] [--save-log] [--log-dir D]");
        return 1;
    }
    const RunArgs& ra = parsed.value;

    Config config;
    if (!load_config(config)) return 1;

    bool blocked = false;
    for (const auto& issue : run_preflight_checks(config, ra.target)) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocked = true;
        }
        if (!issue.fix.empty()) std::cout << theme::step(issue.fix);
    }
    if (blocked) return 1;

    std::string password;
    if (!read_password(ra, password)) {
        std::cout << theme::fail("No password given");
        return 1;
    }

    MigrationService service(config, ssh_transport_factory(), ssh_library_init);
    auto started = service.start_job(ra.target, ra.endpoint, Credential{ra.user, password});
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }
    const std::string& job_id = started.value;

    std::cout << theme::section(fmt::format("Migration to {} ({})", ra.endpoint.host, ra.target));
    std::cout << theme::kv("job", job_id);
    std::cout << theme::rule() << "\n";

    // Tail the log until the job is terminal
    size_t offset = 0;
    JobStatus status = JobStatus::kQueued;
    while (true) {
        auto chunk = service.query().logs_since(job_id, offset);
        for (const auto& line : chunk.lines) {
            std::cout << theme::job_line(line);
        }
        std::cout << std::flush;
        offset = chunk.next_offset;
        status = chunk.status;
        if (is_terminal(status)) break;
        platform::sleep_ms(POLL_INTERVAL_MS);
    }

    JobRecord rec = service.query().get_job(job_id);
    std::cout << "\n" << theme::rule();
    std::string took = format_duration(rec.started_at, rec.finished_at);
    if (status == JobStatus::kFinished) {
        std::cout << theme::ok(fmt::format("Migration finished in {}", took));
    } else if (rec.exit_code) {
        std::cout << theme::fail(fmt::format("Migration failed after {} (exit {})", took, *rec.exit_code));
    } else {
        std::cout << theme::fail(fmt::format("Migration failed after {}", took));
    }

    if (ra.save_log) {
        fs::path path = ra.log_dir / JobQuery::log_file_name(job_id);
        auto saved = service.query().save_log(job_id, path);
        if (saved.is_ok()) {
            std::cout << theme::info("Log saved to " + path.string());
        } else {
            std::cout << theme::fail(saved.error);
        }
    }

    return status == JobStatus::kFinished ? 0 : 1;
}

// ── targets ─────────────────────────────────────────────────

int VmigCLI::run_targets() {
    Config config;
    if (!load_config(config)) return 1;

    std::cout << theme::section("Targets");
    for (const auto& [name, tc] : config.targets()) {
        std::cout << "  " << theme::blue(name) << "\n";
        std::cout << theme::kv("script", config.resolve_local(tc.script).string());
        if (!tc.fallback_script.empty() && tc.fallback_script != tc.script) {
            std::cout << theme::kv("fallback", config.resolve_local(tc.fallback_script).string());
        }
        std::cout << theme::kv("config", tc.config ? config.resolve_local(*tc.config).string() : "-");
        std::cout << theme::kv("remote", tc.remote_dir);
        std::cout << theme::kv("run as", tc.elevate ? "root (sudo)" : "login user");
        std::cout << "\n";
    }
    return 0;
}

// ── config ──────────────────────────────────────────────────

int VmigCLI::run_config(const std::vector<std::string>& args) {
    auto parsed = parse_config_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: vmig config <profile.yaml> [-o out.json]");
        return 1;
    }

    auto profile = load_migration_profile(parsed.value.profile);
    if (profile.is_err()) {
        std::cout << theme::fail(profile.error);
        return 1;
    }

    if (parsed.value.output.empty()) {
        std::cout << to_payload_json(profile.value) << "\n";
        return 0;
    }

    auto written = write_payload_config(profile.value, parsed.value.output);
    if (written.is_err()) {
        std::cout << theme::fail(written.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + parsed.value.output.string());
    return 0;
}

// ── init ────────────────────────────────────────────────────

int VmigCLI::run_init() {
    if (config_exists()) {
        std::cout << theme::info("Config already exists at " + get_config_path().string());
        return 0;
    }
    auto result = create_default_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Created " + get_config_path().string());
    return 0;
}
