#include "bridge/vmbridge.h"
#include "bridge/sync_bridge.hpp"
#include "backup/http_backup_transport.hpp"
#include "common/crypt_config.hpp"
#include "common/logger.hpp"
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

struct VmBridgeHandle {
    std::shared_ptr<SyncBridge> bridge;
    std::string jobId;
};

namespace {

std::mutex bridgeMutex;
std::shared_ptr<SyncBridge> processBridge;

char* copyString(const std::string& text) {
    char* copy = static_cast<char*>(std::malloc(text.size() + 1));
    if (copy) {
        std::memcpy(copy, text.c_str(), text.size() + 1);
    }
    return copy;
}

void setError(char** error, const std::string& message) {
    if (error) {
        *error = copyString(message);
    }
}

int reportFailure(const OperationResult& result, char** error) {
    setError(error, result.message);
    return -1;
}

std::string toString(const char* text) {
    return text ? std::string(text) : std::string();
}

BridgeConfig loadProcessConfig() {
    const char* path = std::getenv("VMBRIDGE_CONFIG");
    if (path && *path) {
        return BridgeConfig::loadFromFile(path);
    }
    return BridgeConfig();
}

std::shared_ptr<SyncBridge> ensureBridge(unsigned threads) {
    std::lock_guard<std::mutex> lock(bridgeMutex);
    if (processBridge) {
        return processBridge;
    }

    BridgeConfig config = loadProcessConfig();
    if (!Logger::isInitialized()) {
        Logger::initialize(config.logPath, Logger::parseLevel(config.logLevel));
    }
    auto host = RuntimeHost::start(threads != 0 ? threads : config.workerThreads);
    processBridge = std::make_shared<SyncBridge>(host, config);
    return processBridge;
}

bool checkHandle(VmBridgeHandle* handle, char** error) {
    if (!handle || !handle->bridge) {
        setError(error, "invalid backup handle");
        return false;
    }
    return true;
}

// Result delivery of the *_async calls.
CompletionCallback makeCallback(VmBridgeCallback callback, void* callbackData, int* result, char** error) {
    return [callback, callbackData, result, error](const OperationResult& outcome) {
        if (outcome.ok()) {
            if (result) {
                *result = static_cast<int>(outcome.value);
            }
        } else {
            if (result) {
                *result = -1;
            }
            setError(error, outcome.message);
        }
        if (callback) {
            callback(callbackData);
        }
    };
}

std::shared_ptr<RuntimeHost> completionHost(VmBridgeHandle* handle) {
    if (handle && handle->bridge) {
        return handle->bridge->getHost();
    }
    auto host = RuntimeHost::instance();
    if (host) {
        return host;
    }
    try {
        return ensureBridge(0)->getHost();
    } catch (const std::exception& e) {
        Logger::error(std::string("No runtime for completion delivery: ") + e.what());
        return nullptr;
    }
}

// Failures detected before any work was queued still complete on the
// completion thread, never inside the *_async call itself.
void failAsync(VmBridgeHandle* handle, VmBridgeCallback callback, void* callbackData,
               int* result, char** error, const std::string& message) {
    auto deliver = [callback, callbackData, result, error, message]() {
        if (result) {
            *result = -1;
        }
        setError(error, message);
        if (callback) {
            callback(callbackData);
        }
    };

    auto host = completionHost(handle);
    if (host) {
        host->postCompletion(deliver);
        return;
    }
    try {
        std::thread(deliver).detach();
    } catch (const std::system_error& e) {
        Logger::error(std::string("Failed to deliver completion: ") + e.what());
    }
}

void checkWriteSize(uint64_t size) {
    if (size > static_cast<uint64_t>(INT_MAX)) {
        throw BridgeError(ErrorCode::InvalidArgument,
                          "write of " + std::to_string(size) + " bytes exceeds the maximum of " +
                          std::to_string(INT_MAX));
    }
}

IndexKind toIndexKind(int kind) {
    if (kind == VMBRIDGE_INDEX_FIXED) {
        return IndexKind::Fixed;
    }
    if (kind == VMBRIDGE_INDEX_DYNAMIC) {
        return IndexKind::Dynamic;
    }
    throw BridgeError(ErrorCode::InvalidArgument, "unknown index kind " + std::to_string(kind));
}

} // namespace

extern "C" {

int vmbridge_runtime_start(unsigned threads, char** error) {
    try {
        ensureBridge(threads);
        return 0;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

int vmbridge_runtime_shutdown(unsigned grace_ms) {
    std::shared_ptr<SyncBridge> bridge;
    {
        std::lock_guard<std::mutex> lock(bridgeMutex);
        bridge = std::move(processBridge);
    }
    try {
        if (bridge) {
            bridge->getJobManager().stopAllJobs("runtime shut down");
        }
        return RuntimeHost::shutdownProcessRuntime(std::chrono::milliseconds(grace_ms)) ? 0 : -1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Runtime shutdown failed: ") + e.what());
        return -1;
    }
}

VmBridgeHandle* vmbridge_new(const char* repo,
                             const char* backup_id,
                             uint64_t backup_time,
                             uint64_t chunk_size,
                             const char* password,
                             const char* keyfile,
                             const char* key_password,
                             const char* fingerprint,
                             char** error) {
    try {
        if (!repo || !backup_id) {
            throw BridgeError(ErrorCode::InvalidArgument, "repository and backup id are required");
        }

        BackupOptions options;
        options.repository = BackupRepository::parse(repo);
        options.backupId = backup_id;
        options.backupTime = static_cast<int64_t>(backup_time);
        options.chunkSize = chunk_size;
        options.password = toString(password);
        options.keyfile = toString(keyfile);
        options.keyPassword = toString(key_password);
        options.fingerprint = toString(fingerprint);
        if (!options.fingerprint.empty()) {
            HttpBackupTransport::parseFingerprint(options.fingerprint);
        }
        if (!options.keyfile.empty()) {
            options.crypt = CryptConfig::loadKeyFile(options.keyfile, options.keyPassword);
        }

        auto bridge = ensureBridge(0);
        std::unique_ptr<VmBridgeHandle> handle(new VmBridgeHandle());
        handle->bridge = bridge;
        handle->jobId = bridge->createJob(options);
        return handle.release();
    } catch (const std::exception& e) {
        setError(error, e.what());
        return nullptr;
    }
}

int vmbridge_connect(VmBridgeHandle* handle, char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        OperationResult result = handle->bridge->connect(handle->jobId);
        return result.ok() ? static_cast<int>(result.value) : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_connect_async(VmBridgeHandle* handle,
                            VmBridgeCallback callback, void* callback_data,
                            int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    try {
        handle->bridge->connectAsync(handle->jobId, makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

void vmbridge_abort(VmBridgeHandle* handle, const char* reason) {
    if (!handle || !handle->bridge) {
        return;
    }
    try {
        handle->bridge->abort(handle->jobId, reason ? reason : "aborted by caller");
    } catch (const std::exception& e) {
        Logger::error(std::string("Abort failed: ") + e.what());
    }
}

int vmbridge_register_image(VmBridgeHandle* handle,
                            const char* device_name, uint64_t size,
                            int incremental, int kind,
                            char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        OperationResult result = handle->bridge->registerImage(handle->jobId, toString(device_name), size,
                                                               toIndexKind(kind), incremental != 0);
        return result.ok() ? static_cast<int>(result.value) : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_register_image_async(VmBridgeHandle* handle,
                                   const char* device_name, uint64_t size,
                                   int incremental, int kind,
                                   VmBridgeCallback callback, void* callback_data,
                                   int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    try {
        handle->bridge->registerImageAsync(handle->jobId, toString(device_name), size, toIndexKind(kind),
                                           incremental != 0, makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

int vmbridge_add_config(VmBridgeHandle* handle,
                        const char* name, const uint8_t* data, uint64_t size,
                        char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    if (!data && size != 0) {
        setError(error, "configuration data missing");
        return -1;
    }
    try {
        OperationResult result = handle->bridge->addConfig(handle->jobId, toString(name), data,
                                                           static_cast<size_t>(size));
        return result.ok() ? 0 : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_add_config_async(VmBridgeHandle* handle,
                               const char* name, const uint8_t* data, uint64_t size,
                               VmBridgeCallback callback, void* callback_data,
                               int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    if (!data && size != 0) {
        failAsync(handle, callback, callback_data, result, error, "configuration data missing");
        return;
    }
    try {
        handle->bridge->addConfigAsync(handle->jobId, toString(name), data, static_cast<size_t>(size),
                                       makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

int vmbridge_write_data(VmBridgeHandle* handle,
                        uint8_t dev_id, const uint8_t* data,
                        uint64_t offset, uint64_t size,
                        char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        checkWriteSize(size);
        OperationResult result = handle->bridge->writeData(handle->jobId, dev_id, data, offset, size);
        return result.ok() ? static_cast<int>(result.value) : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_write_data_async(VmBridgeHandle* handle,
                               uint8_t dev_id, const uint8_t* data,
                               uint64_t offset, uint64_t size,
                               VmBridgeCallback callback, void* callback_data,
                               int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    try {
        checkWriteSize(size);
        handle->bridge->writeDataAsync(handle->jobId, dev_id, data, offset, size,
                                       makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

uint64_t vmbridge_write_data_submit(VmBridgeHandle* handle,
                                    uint8_t dev_id, const uint8_t* data,
                                    uint64_t offset, uint64_t size,
                                    char** error) {
    if (!checkHandle(handle, error)) {
        return 0;
    }
    try {
        return handle->bridge->submitWrite(handle->jobId, dev_id, data, offset, size);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return 0;
    }
}

int vmbridge_poll(VmBridgeHandle* handle, uint64_t token, uint64_t* bytes, char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        OperationResult result;
        if (!handle->bridge->poll(handle->jobId, token, result)) {
            if (bytes) {
                *bytes = handle->bridge->progress(handle->jobId, token);
            }
            return 0;
        }
        if (!result.ok()) {
            return reportFailure(result, error);
        }
        if (bytes) {
            *bytes = result.value;
        }
        return 1;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

int vmbridge_close_image(VmBridgeHandle* handle, uint8_t dev_id, char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        OperationResult result = handle->bridge->closeImage(handle->jobId, dev_id);
        return result.ok() ? 0 : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_close_image_async(VmBridgeHandle* handle, uint8_t dev_id,
                                VmBridgeCallback callback, void* callback_data,
                                int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    try {
        handle->bridge->closeImageAsync(handle->jobId, dev_id,
                                        makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

int vmbridge_finish(VmBridgeHandle* handle, char** error) {
    if (!checkHandle(handle, error)) {
        return -1;
    }
    try {
        OperationResult result = handle->bridge->finish(handle->jobId);
        return result.ok() ? 0 : reportFailure(result, error);
    } catch (const std::exception& e) {
        setError(error, e.what());
        return -1;
    }
}

void vmbridge_finish_async(VmBridgeHandle* handle,
                           VmBridgeCallback callback, void* callback_data,
                           int* result, char** error) {
    if (!handle || !handle->bridge) {
        failAsync(handle, callback, callback_data, result, error, "invalid backup handle");
        return;
    }
    try {
        handle->bridge->finishAsync(handle->jobId, makeCallback(callback, callback_data, result, error));
    } catch (const std::exception& e) {
        failAsync(handle, callback, callback_data, result, error, e.what());
    }
}

char* vmbridge_last_error(VmBridgeHandle* handle) {
    if (!handle || !handle->bridge) {
        return nullptr;
    }
    try {
        std::string message = handle->bridge->lastError(handle->jobId);
        return message.empty() ? nullptr : copyString(message);
    } catch (const std::exception& e) {
        Logger::error(std::string("Reading last error failed: ") + e.what());
        return nullptr;
    }
}

void vmbridge_free_error(char* ptr) {
    std::free(ptr);
}

void vmbridge_disconnect(VmBridgeHandle* handle) {
    if (!handle) {
        return;
    }
    if (handle->bridge) {
        try {
            handle->bridge->releaseJob(handle->jobId);
        } catch (const std::exception& e) {
            Logger::error(std::string("Releasing job failed: ") + e.what());
        }
    }
    delete handle;
}

} // extern "C"
