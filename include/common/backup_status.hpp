#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <stdexcept>

enum class JobStatus {
    Created,
    Active,
    Finishing,
    Finished,
    Aborted
};

enum class ErrorCode {
    None,
    ConnectionError,
    AuthenticationError,
    InvalidJobState,
    UploadError,
    IndexError,
    JobError,
    RuntimeClosed,
    InitializationError,
    InvalidArgument,
    Cancelled
};

std::string jobStatusToString(JobStatus status);
std::string errorCodeToString(ErrorCode code);

// Errors that move the owning job to Aborted when they reach the job layer.
bool isFatalError(ErrorCode code);

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Value that crosses the synchronous boundary. `value` carries the
// operation specific payload (bytes committed, device id, previous
// backup flag).
struct OperationResult {
    ErrorCode code{ErrorCode::None};
    std::string message;
    uint64_t value{0};

    bool ok() const { return code == ErrorCode::None; }

    static OperationResult success(uint64_t value = 0) {
        OperationResult result;
        result.value = value;
        return result;
    }

    static OperationResult failure(ErrorCode code, const std::string& message) {
        OperationResult result;
        result.code = code;
        result.message = message;
        return result;
    }
};

struct BackupCounters {
    uint64_t bytesWritten{0};
    uint64_t bytesUploaded{0};
    uint64_t bytesReused{0};
    uint64_t chunksTotal{0};
    uint64_t chunksUploaded{0};
    uint64_t chunksReused{0};
};

struct BackupStatus {
    JobStatus status;
    std::string jobId;
    std::chrono::system_clock::time_point createdAt;
    BackupCounters counters;
    size_t openImages;
    size_t inFlightOperations;
    std::string error;
};
