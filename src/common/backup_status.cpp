#include "common/backup_status.hpp"

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Created:   return "created";
        case JobStatus::Active:    return "active";
        case JobStatus::Finishing: return "finishing";
        case JobStatus::Finished:  return "finished";
        case JobStatus::Aborted:   return "aborted";
        default:                   return "unknown";
    }
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "none";
        case ErrorCode::ConnectionError:     return "connection error";
        case ErrorCode::AuthenticationError: return "authentication error";
        case ErrorCode::InvalidJobState:     return "invalid job state";
        case ErrorCode::UploadError:         return "upload error";
        case ErrorCode::IndexError:          return "index error";
        case ErrorCode::JobError:            return "job error";
        case ErrorCode::RuntimeClosed:       return "runtime closed";
        case ErrorCode::InitializationError: return "initialization error";
        case ErrorCode::InvalidArgument:     return "invalid argument";
        case ErrorCode::Cancelled:           return "cancelled";
        default:                             return "unknown";
    }
}

bool isFatalError(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionError:
        case ErrorCode::AuthenticationError:
        case ErrorCode::UploadError:
        case ErrorCode::IndexError:
        case ErrorCode::JobError:
            return true;
        default:
            return false;
    }
}
