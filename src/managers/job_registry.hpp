#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "job_record.hpp"

// In-memory store of all jobs, shared between job threads (writers) and
// status queries (readers). One mutex guards the whole map.
//
// Mutators take the id and return false when the record no longer exists
// (deleted while its job was still running); such writes are dropped.
// Violating the record lifecycle (writing to a terminal record, finishing
// twice) throws std::logic_error.
class JobRegistry {
public:
    JobRegistry() = default;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // std::logic_error if the id is already present
    void create(JobRecord record);

    // Snapshot copy. NotFoundError if unknown or deleted.
    JobRecord get(const std::string& id) const;

    // Log lines from `offset` onward plus the record status at that moment.
    // NotFoundError if unknown or deleted.
    std::vector<std::string> logs_since(const std::string& id, size_t offset,
                                        JobStatus* status = nullptr) const;

    // true if the record existed
    bool remove(const std::string& id);

    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;

    bool mark_running(const std::string& id);
    bool append_log(const std::string& id, const std::string& line);
    bool set_exit_code(const std::string& id, int code);

    // Terminal transition: sets status and finished_at once.
    bool finish(const std::string& id, JobStatus status);

private:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;

    // nullptr if absent; caller holds mutex_
    JobRecord* find_locked(const std::string& id);
};
