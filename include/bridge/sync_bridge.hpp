#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/bridge_config.hpp"
#include "common/job_manager.hpp"
#include "common/pending_operation.hpp"
#include "common/runtime_host.hpp"

// Entry points for a synchronous caller.
//
// Blocking calls park the calling thread until the work ran on the
// runtime and return its result; they are refused on runtime threads.
// Async calls return at once; their callback runs on the runtime's
// completion thread. submitWrite() is the polling variant of
// writeDataAsync(): it hands out a token for poll() and wait().
class SyncBridge {
public:
    SyncBridge(std::shared_ptr<RuntimeHost> host, const BridgeConfig& config,
               TransportFactory transportFactory = nullptr);
    ~SyncBridge();

    SyncBridge(const SyncBridge&) = delete;
    SyncBridge& operator=(const SyncBridge&) = delete;

    // Returns the job id. Throws BridgeError(InvalidArgument).
    std::string createJob(const BackupOptions& options);

    OperationResult connect(const std::string& jobId);
    OperationResult registerImage(const std::string& jobId, const std::string& name, uint64_t size,
                                  IndexKind kind, bool incremental);
    OperationResult addConfig(const std::string& jobId, const std::string& name,
                              const uint8_t* data, size_t size);
    OperationResult writeData(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                              uint64_t offset, uint64_t size);
    OperationResult closeImage(const std::string& jobId, uint8_t deviceId);
    OperationResult finish(const std::string& jobId);
    bool abort(const std::string& jobId, const std::string& reason);

    void connectAsync(const std::string& jobId, CompletionCallback callback);
    void registerImageAsync(const std::string& jobId, const std::string& name, uint64_t size,
                            IndexKind kind, bool incremental, CompletionCallback callback);
    void addConfigAsync(const std::string& jobId, const std::string& name,
                        const uint8_t* data, size_t size, CompletionCallback callback);
    // Copies `data`.
    void writeDataAsync(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                        uint64_t offset, uint64_t size, CompletionCallback callback);
    // Copies `data`; returns the token of the write. The token is held
    // until poll() or wait() collected the result, or the job is released.
    uint64_t submitWrite(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                         uint64_t offset, uint64_t size);
    void closeImageAsync(const std::string& jobId, uint8_t deviceId, CompletionCallback callback);
    void finishAsync(const std::string& jobId, CompletionCallback callback);

    // Returns true and fills `result` once the write finished; the token
    // is forgotten afterwards. Unknown tokens finish with InvalidArgument.
    bool poll(const std::string& jobId, uint64_t token, OperationResult& result);
    uint64_t progress(const std::string& jobId, uint64_t token) const;
    // Blocking variant of poll().
    OperationResult wait(const std::string& jobId, uint64_t token);
    size_t getTokenCount() const;

    std::string lastError(const std::string& jobId) const;
    bool getStatus(const std::string& jobId, BackupStatus& status) const;
    // Aborts the job unless it finished and forgets it.
    bool releaseJob(const std::string& jobId);

    std::shared_ptr<RuntimeHost> getHost() const { return host_; }
    JobManager& getJobManager() { return jobs_; }

private:
    using JobBody = std::function<OperationResult(BackupJob& job, PendingOperation& operation)>;

    struct TokenEntry {
        std::string jobId;
        std::shared_ptr<PendingOperation> operation;
    };

    // deviceId >= 0 routes the work through the image's strand, if it has one.
    std::shared_ptr<PendingOperation> schedule(const std::string& jobId,
                                               const std::string& description,
                                               JobBody body,
                                               CompletionCallback callback,
                                               int deviceId,
                                               std::function<void()> onFinished);
    std::shared_ptr<PendingOperation> scheduleWrite(const std::string& jobId, uint8_t deviceId,
                                                    const uint8_t* data, uint64_t offset, uint64_t size,
                                                    CompletionCallback callback);
    OperationResult runBlocking(const std::string& jobId, const std::string& description,
                                JobBody body, int deviceId = -1);
    std::shared_ptr<PendingOperation> findToken(const std::string& jobId, uint64_t token) const;

    std::shared_ptr<RuntimeHost> host_;
    BridgeConfig config_;
    JobManager jobs_;

    mutable std::mutex tokensMutex_;
    std::map<uint64_t, TokenEntry> tokens_;
};
