#pragma once

#include <stdexcept>
#include <string>

// Error taxonomy for migration jobs. Transports and the job runner throw these;
// the runner catches them at the job boundary and turns them into log lines.

class MigrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Host unreachable, port closed, handshake failed or connect timed out.
class ConnectionError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Credential rejected by the SSH server. Reported separately from
// ConnectionError so callers can ask for different input.
class AuthenticationError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Local file missing/unreadable or remote write/unlink denied.
class TransferError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Remote command could not be started, or its channel broke mid-run.
class ExecutionError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Unknown or deleted job id.
class NotFoundError : public MigrationError {
public:
    explicit NotFoundError(const std::string& job_id)
        : MigrationError("Job not found: " + job_id), job_id_(job_id) {}

    const std::string& job_id() const { return job_id_; }

private:
    std::string job_id_;
};
