#pragma once

#include "common/bridge_config.hpp"
#include "common/runtime_host.hpp"
#include "backup/backup_job.hpp"
#include "backup/backup_transport.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

using TransportFactory = std::function<std::shared_ptr<BackupTransport>()>;

// Registry of the backup jobs of one bridge.
class JobManager {
public:
    // Without a factory every job talks HTTP to the server.
    JobManager(std::shared_ptr<RuntimeHost> host, const BridgeConfig& config,
               TransportFactory transportFactory = nullptr);
    ~JobManager();

    // Throws BridgeError(InvalidArgument) for invalid options.
    std::shared_ptr<BackupJob> createBackupJob(const BackupOptions& options);

    std::shared_ptr<BackupJob> getBackupJob(const std::string& jobId) const;
    std::vector<std::shared_ptr<BackupJob>> getBackupJobs() const;
    size_t getJobCount() const;

    // Aborts an unfinished job and waits for its running operations
    // before dropping it.
    bool removeJob(const std::string& jobId);
    void cleanupCompletedJobs();
    void stopAllJobs(const std::string& reason);

    const BridgeConfig& getConfig() const { return config_; }

private:
    std::shared_ptr<RuntimeHost> host_;
    BridgeConfig config_;
    TransportFactory transportFactory_;

    std::unordered_map<std::string, std::shared_ptr<BackupJob>> backupJobs_;
    mutable std::mutex mutex_;
};
