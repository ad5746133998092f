#include "job_record.hpp"
#include <core/utils.hpp>

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::kQueued:   return "queued";
        case JobStatus::kRunning:  return "running";
        case JobStatus::kFinished: return "finished";
        case JobStatus::kFailed:   return "failed";
    }
    return "unknown";
}

JobRecord JobRecord::create(const std::string& target, const std::string& host) {
    JobRecord rec;
    rec.id = generate_uuid();
    rec.started_at = std::chrono::system_clock::now();
    rec.target = target;
    rec.host = host;
    return rec;
}
