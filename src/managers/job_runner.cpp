#include "job_runner.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/escalation.hpp>
#include <fmt/format.h>
#include <functional>
#include <memory>

using JobLogFn = std::function<void(const std::string&)>;

std::string build_remote_command(const std::string& interpreter,
                                 const std::string& remote_script, bool elevate) {
    std::string cmd = interpreter.empty()
        ? shell_quote(remote_script)
        : fmt::format("{} {}", interpreter, shell_quote(remote_script));
    return elevate ? elevated_command(cmd) : cmd;
}

// ── Session scope ──────────────────────────────────────────
// Owns the job's transport. On destruction removes every file uploaded
// through it (when cleanup is on), then closes the connection.

namespace {

class SessionScope {
public:
    SessionScope(JobLogFn log, bool cleanup)
        : log_(std::move(log)), cleanup_(cleanup) {}

    ~SessionScope() {
        if (!transport_) return;
        if (cleanup_) {
            for (auto it = uploaded_.rbegin(); it != uploaded_.rend(); ++it) {
                try {
                    transport_->remove(*it);
                } catch (const MigrationError& e) {
                    log_(fmt::format("[WARNING] Could not remove remote file {}: {}", *it, e.what()));
                }
            }
        }
        transport_->close();
    }

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

    Transport& open(const TransportFactory& factory) {
        transport_ = factory ? factory() : nullptr;
        if (!transport_) {
            throw ConnectionError("No transport available");
        }
        return *transport_;
    }

    void track(const std::string& remote_path) { uploaded_.push_back(remote_path); }

private:
    JobLogFn log_;
    bool cleanup_;
    std::unique_ptr<Transport> transport_;
    std::vector<std::string> uploaded_;
};

} // namespace

// ── JobRunner ──────────────────────────────────────────────

JobRunner::JobRunner(JobRegistry& registry, TransportFactory factory, RunnerOptions options)
    : registry_(registry), factory_(std::move(factory)), options_(options) {}

JobRunner::~JobRunner() {
    // Job threads write into registry_, which must outlive them
    join_all();
}

void JobRunner::join_all() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

size_t JobRunner::active_threads() {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    reap_finished_locked();
    return workers_.size();
}

// Joins threads that have left their job body. The join only waits for the
// thread to exit, so it never blocks on a running job.
void JobRunner::reap_finished_locked() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string JobRunner::start(JobRequest request) {
    JobRecord rec = JobRecord::create(request.target, request.endpoint.host);
    std::string job_id = rec.id;
    registry_.create(std::move(rec));
    vmig_log_job(job_id, fmt::format("queued target={} host={}:{}", request.target,
                                     request.endpoint.host, request.endpoint.port));

    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(threads_mutex_);
    reap_finished_locked();
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([this, job_id, done, req = std::move(request)] {
        try {
            run_job(job_id, req);
        } catch (const std::exception& e) {
            // Only registry lifecycle violations get here
            vmig_log_job(job_id, fmt::format("job thread aborted: {}", e.what()));
        }
        done->store(true);
    });
    workers_.push_back(std::move(worker));
    return job_id;
}

// ── Job thread ─────────────────────────────────────────────

void JobRunner::run_job(const std::string& job_id, const JobRequest& request) {
    auto t0 = std::chrono::system_clock::now();

    // Writes to a record deleted mid-run are dropped; the job still finishes
    // its steps so the remote side is cleaned up.
    auto log = [&](const std::string& line) {
        registry_.append_log(job_id, line);
        vmig_log_job(job_id, line);
    };

    registry_.mark_running(job_id);

    JobStatus final_status = JobStatus::kFailed;
    {
        SessionScope scope(log, options_.cleanup);
        try {
            ResolvedPayload payload = resolve_payload(request.payload);
            if (payload.used_fallback) {
                log(fmt::format("Local script not found at {}, falling back to {}",
                                request.payload.script.string(), payload.script.string()));
            }

            const auto& ep = request.endpoint;
            log(fmt::format("Connecting to {}:{} as {}...", ep.host, ep.port, request.credential.user));
            Transport& transport = scope.open(factory_);
            transport.connect(ep, request.credential, options_.connect_timeout);
            log("SSH connection established.");

            log(fmt::format("Uploading {} to {}...", payload.script.string(), payload.remote_script));
            // Tracked before writing so a partial upload is removed too
            scope.track(payload.remote_script);
            transport.upload(payload.script, payload.remote_script, true);

            switch (payload.config) {
                case ConfigPresence::kFound:
                    log(fmt::format("Uploading {} to {}...", payload.config_path.string(),
                                    payload.remote_config));
                    scope.track(payload.remote_config);
                    transport.upload(payload.config_path, payload.remote_config, false);
                    log("Config upload complete");
                    break;
                case ConfigPresence::kMissing:
                    log(fmt::format("[WARNING] Config file not found at {}, skipping config upload",
                                    payload.config_path.string()));
                    break;
                case ConfigPresence::kNotConfigured:
                    log("No config file for this target, skipping config upload");
                    break;
            }
            log("Upload complete.");

            std::string cmd = build_remote_command(request.interpreter, payload.remote_script,
                                                   request.elevate);
            log(request.elevate ? fmt::format("Executing as root: {}", cmd)
                                : fmt::format("Executing: {}", cmd));

            auto process = transport.execute(cmd);
            if (request.elevate) {
                supply_escalation_password(*process, request.credential);
            }
            process->close_input();

            // Alternate between the streams so neither starves the other
            bool out_done = false;
            bool err_done = false;
            std::string line;
            while (!out_done || !err_done) {
                bool progressed = false;
                if (!out_done) {
                    LineRead r = process->next_line(OutputStream::kStdout, line);
                    if (r == LineRead::kLine) {
                        log(line);
                        progressed = true;
                    } else if (r == LineRead::kEnd) {
                        out_done = true;
                    }
                }
                if (!err_done) {
                    LineRead r = process->next_line(OutputStream::kStderr, line);
                    if (r == LineRead::kLine) {
                        log(STDERR_PREFIX + line);
                        progressed = true;
                    } else if (r == LineRead::kEnd) {
                        err_done = true;
                    }
                }
                if (!progressed && !(out_done && err_done)) {
                    platform::sleep_ms(OUTPUT_IDLE_SLEEP_MS);
                }
            }

            int code = process->exit_status();
            registry_.set_exit_code(job_id, code);
            if (code == 0) {
                log("[SUCCESS] Remote script exited with code 0");
                final_status = JobStatus::kFinished;
            } else {
                log(fmt::format("[ERROR] Remote script exited with code {}", code));
            }
        } catch (const AuthenticationError& e) {
            log(fmt::format("[ERROR] SSH authentication failed: {}", e.what()));
        } catch (const ConnectionError& e) {
            log(fmt::format("[ERROR] SSH connection failed: {}", e.what()));
        } catch (const TransferError& e) {
            log(fmt::format("[ERROR] File transfer failed: {}", e.what()));
        } catch (const ExecutionError& e) {
            log(fmt::format("[ERROR] Remote execution failed: {}", e.what()));
        } catch (const std::exception& e) {
            log(fmt::format("[ERROR] Unexpected error: {}", e.what()));
        }
    }

    registry_.finish(job_id, final_status);
    vmig_log_job(job_id, fmt::format("{} after {}", to_string(final_status),
                                     format_duration(t0, std::chrono::system_clock::now())));
}
