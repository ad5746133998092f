#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus {
    kQueued,
    kRunning,
    kFinished,   // remote script exited 0
    kFailed,     // any failure, including a non-zero exit code
};

// "queued", "running", "finished", "failed"
std::string to_string(JobStatus status);

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::kFinished || status == JobStatus::kFailed;
}

struct JobRecord {
    std::string id;                    // random UUID v4, immutable
    JobStatus status = JobStatus::kQueued;
    std::vector<std::string> logs;     // append-only
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::optional<int> exit_code;      // set only when the script ran to completion

    std::string target;                // target policy name (proxmox, kvm, ...)
    std::string host;                  // destination host

    // Fresh queued record with a new id and started_at = now
    static JobRecord create(const std::string& target, const std::string& host);
};
