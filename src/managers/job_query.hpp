#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "job_registry.hpp"

namespace fs = std::filesystem;

// Read side of the registry for polling clients. Never blocks on a running
// job; every call returns a snapshot. Unknown ids throw NotFoundError.
class JobQuery {
public:
    explicit JobQuery(const JobRegistry& registry) : registry_(registry) {}

    JobRecord get_job(const std::string& id) const;

    // All log lines joined with '\n'
    std::string download_log(const std::string& id) const;

    // Lines appended since the caller last saw `offset` lines; status is the
    // job's status at the time of the read.
    struct LogChunk {
        std::vector<std::string> lines;
        size_t next_offset = 0;
        JobStatus status = JobStatus::kQueued;
    };
    LogChunk logs_since(const std::string& id, size_t offset) const;

    // Write download_log() to `path`. Err if the file cannot be written.
    Result<void> save_log(const std::string& id, const fs::path& path) const;

    // Default artifact name: migration_<id>.log
    static std::string log_file_name(const std::string& id);

private:
    const JobRegistry& registry_;
};
