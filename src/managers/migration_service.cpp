#include "migration_service.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

static RunnerOptions runner_options(const Config& config) {
    RunnerOptions opts;
    opts.connect_timeout = std::chrono::seconds(config.connect_timeout());
    opts.cleanup = config.cleanup();
    return opts;
}

MigrationService::MigrationService(Config config, TransportFactory factory,
                                   PrerequisiteCheck prerequisites)
    : config_(std::move(config)),
      prerequisites_(std::move(prerequisites)),
      query_(registry_),
      runner_(registry_, std::move(factory), runner_options(config_)) {}

MigrationService::~MigrationService() {
    runner_.join_all();
}

// ── Job operations ────────────────────────────────────────────

Result<std::string> MigrationService::start_job(const std::string& target,
                                                const Endpoint& endpoint,
                                                const Credential& credential) {
    const TargetConfig* tc = config_.find_target(target);
    if (!tc) {
        return Result<std::string>::Err(fmt::format("Unknown target '{}'", target));
    }
    if (endpoint.host.empty()) {
        return Result<std::string>::Err("Destination host is required");
    }
    if (credential.user.empty()) {
        return Result<std::string>::Err("Username is required");
    }
    Endpoint ep = endpoint;
    if (ep.port == 0) ep.port = tc->port;
    if (ep.port <= 0 || ep.port > 65535) {
        return Result<std::string>::Err(fmt::format("Invalid port {}", ep.port));
    }
    if (prerequisites_) {
        auto ready = prerequisites_();
        if (ready.is_err()) {
            return Result<std::string>::Err("SSH support unavailable: " + ready.error);
        }
    }

    JobRequest req;
    req.endpoint = ep;
    req.credential = credential;
    req.payload = PayloadBundle::from_target(*tc, config_);
    req.target = tc->name;
    req.interpreter = tc->interpreter;
    req.elevate = tc->elevate;

    std::string id = runner_.start(std::move(req));
    return Result<std::string>::Ok(id);
}

bool MigrationService::clear_job(const std::string& job_id) {
    bool removed = registry_.remove(job_id);
    if (removed) {
        vmig_log_job(job_id, "cleared");
    }
    return removed;
}

void MigrationService::wait_all() {
    runner_.join_all();
}

// ── Queries ───────────────────────────────────────────────────

std::vector<JobSummary> MigrationService::list_jobs() const {
    std::vector<JobSummary> out;
    for (const auto& id : registry_.ids()) {
        JobRecord rec;
        try {
            rec = registry_.get(id);
        } catch (const NotFoundError&) {
            continue;  // cleared between ids() and get()
        }

        JobSummary s;
        s.job_id = rec.id;
        s.target = rec.target;
        s.host = rec.host;
        s.status = to_string(rec.status);
        if (rec.status == JobStatus::kFailed && rec.exit_code) {
            s.status += fmt::format(" (exit {})", *rec.exit_code);
        }
        s.started = format_clock(rec.started_at);
        s.duration = format_duration(rec.started_at, rec.finished_at);
        s.log_lines = rec.logs.size();
        out.push_back(s);
    }
    return out;
}

// ── Configuration ─────────────────────────────────────────────

std::vector<std::string> MigrationService::target_names() const {
    std::vector<std::string> names;
    for (const auto& [name, tc] : config_.targets()) {
        names.push_back(name);
    }
    return names;
}
