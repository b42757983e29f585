#include "common/job_manager.hpp"
#include "backup/http_backup_transport.hpp"
#include "common/logger.hpp"

JobManager::JobManager(std::shared_ptr<RuntimeHost> host, const BridgeConfig& config,
                       TransportFactory transportFactory)
    : host_(std::move(host))
    , config_(config)
    , transportFactory_(std::move(transportFactory)) {
    if (!host_) {
        throw BridgeError(ErrorCode::InvalidArgument, "Job manager needs a runtime host");
    }
    if (!transportFactory_) {
        transportFactory_ = []() { return std::make_shared<HttpBackupTransport>(); };
    }
}

JobManager::~JobManager() {
    stopAllJobs("bridge shut down");

    std::vector<std::shared_ptr<BackupJob>> jobs = getBackupJobs();
    for (auto& job : jobs) {
        job->waitForIdle();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    backupJobs_.clear();
}

std::shared_ptr<BackupJob> JobManager::createBackupJob(const BackupOptions& options) {
    auto transport = transportFactory_();
    if (!transport) {
        throw BridgeError(ErrorCode::InitializationError, "Failed to create backup transport");
    }

    auto job = std::make_shared<BackupJob>(options, config_, transport, host_);

    std::lock_guard<std::mutex> lock(mutex_);
    backupJobs_[job->getId()] = job;
    return job;
}

std::shared_ptr<BackupJob> JobManager::getBackupJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backupJobs_.find(jobId);
    return it != backupJobs_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<BackupJob>> JobManager::getBackupJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BackupJob>> result;
    result.reserve(backupJobs_.size());
    for (const auto& pair : backupJobs_) {
        result.push_back(pair.second);
    }
    return result;
}

size_t JobManager::getJobCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backupJobs_.size();
}

bool JobManager::removeJob(const std::string& jobId) {
    std::shared_ptr<BackupJob> job = getBackupJob(jobId);
    if (!job) {
        return false;
    }

    if (!job->isTerminal()) {
        job->abort("backup handle released");
    }
    job->waitForIdle();

    std::lock_guard<std::mutex> lock(mutex_);
    backupJobs_.erase(jobId);
    Logger::debug("Released backup job " + jobId);
    return true;
}

void JobManager::cleanupCompletedJobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = backupJobs_.begin(); it != backupJobs_.end();) {
        if (it->second->isTerminal() && it->second->getPendingOperationCount() == 0) {
            it = backupJobs_.erase(it);
        } else {
            ++it;
        }
    }
}

void JobManager::stopAllJobs(const std::string& reason) {
    for (auto& job : getBackupJobs()) {
        if (!job->isTerminal()) {
            job->abort(reason);
        }
    }
}
