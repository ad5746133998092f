#include "job_registry.hpp"
#include <core/errors.hpp>
#include <stdexcept>

void JobRegistry::create(JobRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = record.id;
    auto inserted = jobs_.emplace(id, std::move(record));
    if (!inserted.second) {
        throw std::logic_error("Duplicate job id: " + id);
    }
}

JobRecord JobRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw NotFoundError(id);
    }
    return it->second;
}

std::vector<std::string> JobRegistry::logs_since(const std::string& id, size_t offset,
                                                 JobStatus* status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw NotFoundError(id);
    }
    const auto& logs = it->second.logs;
    if (status) *status = it->second.status;
    if (offset >= logs.size()) return {};
    return std::vector<std::string>(logs.begin() + static_cast<std::ptrdiff_t>(offset),
                                    logs.end());
}

bool JobRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.erase(id) > 0;
}

bool JobRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.count(id) > 0;
}

std::vector<std::string> JobRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(jobs_.size());
    for (const auto& [id, rec] : jobs_) {
        out.push_back(id);
    }
    return out;
}

JobRecord* JobRegistry::find_locked(const std::string& id) {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

bool JobRegistry::mark_running(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord* rec = find_locked(id);
    if (!rec) return false;
    if (rec->status != JobStatus::kQueued) {
        throw std::logic_error("Job " + id + " cannot start from state " + to_string(rec->status));
    }
    rec->status = JobStatus::kRunning;
    return true;
}

bool JobRegistry::append_log(const std::string& id, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord* rec = find_locked(id);
    if (!rec) return false;
    if (rec->finished_at) {
        throw std::logic_error("Log append to finished job " + id);
    }
    rec->logs.push_back(line);
    return true;
}

bool JobRegistry::set_exit_code(const std::string& id, int code) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord* rec = find_locked(id);
    if (!rec) return false;
    if (is_terminal(rec->status)) {
        throw std::logic_error("Exit code set on finished job " + id);
    }
    rec->exit_code = code;
    return true;
}

bool JobRegistry::finish(const std::string& id, JobStatus status) {
    if (!is_terminal(status)) {
        throw std::logic_error("finish() needs a terminal status, got " + to_string(status));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord* rec = find_locked(id);
    if (!rec) return false;
    if (is_terminal(rec->status)) {
        throw std::logic_error("Job " + id + " already " + to_string(rec->status));
    }
    rec->status = status;
    rec->finished_at = std::chrono::system_clock::now();
    return true;
}
