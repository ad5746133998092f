#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "job_query.hpp"
#include "job_registry.hpp"
#include "job_runner.hpp"

// Pure data struct for UI consumption.
struct JobSummary {
    std::string job_id;
    std::string target;
    std::string host;
    std::string status;      // "running", "failed (exit 17)", ...
    std::string started;     // wall clock, e.g. "8:13pm"
    std::string duration;    // elapsed so far, or total once terminal
    size_t log_lines = 0;
};

// Checked before each job starts; Err means the transport cannot work at all
// (e.g. the SSH library failed to initialise).
using PrerequisiteCheck = std::function<Result<void>()>;

// Headless service facade: owns the registry, the runner and the query side.
// Frontends (CLI, tests) talk only to this.
class MigrationService {
public:
    MigrationService(Config config, TransportFactory factory,
                     PrerequisiteCheck prerequisites = nullptr);
    ~MigrationService();

    MigrationService(const MigrationService&) = delete;
    MigrationService& operator=(const MigrationService&) = delete;

    // ── Job operations ────────────────────────────────────────

    // Start a job for the named target. Err for an unknown target, missing
    // prerequisites or an empty host/user; everything after that is reported
    // through the job's log and status. Port 0 means the target's port.
    Result<std::string> start_job(const std::string& target, const Endpoint& endpoint,
                                  const Credential& credential);

    // Forget a job. false if the id is unknown. A running job keeps running
    // but its further output is dropped.
    bool clear_job(const std::string& job_id);

    // Block until every started job is terminal.
    void wait_all();

    // ── Queries ───────────────────────────────────────────────

    const JobQuery& query() const { return query_; }
    std::vector<JobSummary> list_jobs() const;

    // ── Configuration ─────────────────────────────────────────

    const Config& config() const { return config_; }
    std::vector<std::string> target_names() const;

private:
    Config config_;
    PrerequisiteCheck prerequisites_;
    JobRegistry registry_;
    JobQuery query_;
    JobRunner runner_;   // declared last: joins its threads before registry_ goes away
};
