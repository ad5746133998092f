#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "job_registry.hpp"
#include "payload_bundle.hpp"

struct RunnerOptions {
    std::chrono::seconds connect_timeout{CONNECT_TIMEOUT_SECS};
    bool cleanup = true;   // remove uploaded files when the job ends
};

// Everything one job needs: where to go, who to be, what to ship and how
// to launch it.
struct JobRequest {
    Endpoint endpoint;
    Credential credential;
    PayloadBundle payload;
    std::string target;        // policy name, recorded on the job
    std::string interpreter;   // prefix for the remote script; empty = run it directly
    bool elevate = false;      // run through sudo with the login password
};

// Runs migration jobs in the background, one thread per job.
//
// start() registers a queued record and returns its id immediately; the job
// thread then walks resolve -> connect -> upload -> execute -> stream output
// -> exit status, writing every step into the record. Any failure ends the
// job as failed with a log line describing it. Uploaded files are removed
// and the session closed on every path.
//
// There is no cancellation and no limit on concurrent jobs.
class JobRunner {
public:
    JobRunner(JobRegistry& registry, TransportFactory factory, RunnerOptions options = {});
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    std::string start(JobRequest request);

    // Wait for every job started so far.
    void join_all();

    // Job threads not yet joined. Threads whose job is done are joined
    // first, so this counts jobs still running.
    size_t active_threads();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    JobRegistry& registry_;
    TransportFactory factory_;
    RunnerOptions options_;
    std::vector<Worker> workers_;
    std::mutex threads_mutex_;

    void run_job(const std::string& job_id, const JobRequest& request);
    void reap_finished_locked();
};

// Remote command line for a script: "<interpreter> '<script>'", wrapped in
// sudo when elevated.
std::string build_remote_command(const std::string& interpreter,
                                 const std::string& remote_script, bool elevate);
