#include "common/bridge_config.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

bool isPowerOfTwo(uint64_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

} // namespace

void BridgeConfig::validate() const {
    if (maxInFlightUploads == 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "max_in_flight_uploads must be at least 1");
    }
    if (chunkProbeRetries < 0 || uploadRetries < 0 || reconnectAttempts < 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "retry budgets must not be negative");
    }
    if (retryDelayMs < 0 || shutdownGraceMs < 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "delays must not be negative");
    }
    if (indexBatchSize == 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "index_batch_size must be at least 1");
    }
    if (!isPowerOfTwo(defaultChunkSize) || defaultChunkSize < 64 * 1024) {
        throw BridgeError(ErrorCode::InvalidArgument,
                          "default_chunk_size must be a power of two of at least 64KiB");
    }
}

BridgeConfig BridgeConfig::fromJson(const json& j) {
    BridgeConfig config;
    try {
        config.workerThreads = j.value("worker_threads", config.workerThreads);
        config.maxInFlightUploads = j.value("max_in_flight_uploads", config.maxInFlightUploads);
        config.chunkProbeRetries = j.value("chunk_probe_retries", config.chunkProbeRetries);
        config.uploadRetries = j.value("upload_retries", config.uploadRetries);
        config.reconnectAttempts = j.value("reconnect_attempts", config.reconnectAttempts);
        config.retryDelayMs = j.value("retry_delay_ms", config.retryDelayMs);
        config.shutdownGraceMs = j.value("shutdown_grace_ms", config.shutdownGraceMs);
        config.indexBatchSize = j.value("index_batch_size", config.indexBatchSize);
        config.defaultChunkSize = j.value("default_chunk_size", config.defaultChunkSize);
        config.logPath = j.value("log_path", config.logPath);
        config.logLevel = j.value("log_level", config.logLevel);
        config.verifyTls = j.value("verify_tls", config.verifyTls);
        config.probeBeforeUpload = j.value("probe_before_upload", config.probeBeforeUpload);
    } catch (const json::exception& e) {
        throw BridgeError(ErrorCode::InvalidArgument, std::string("Invalid configuration: ") + e.what());
    }
    config.validate();
    return config;
}

BridgeConfig BridgeConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BridgeError(ErrorCode::InvalidArgument, "Failed to open configuration file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw BridgeError(ErrorCode::InvalidArgument,
                          "Failed to parse configuration file " + path + ": " + e.what());
    }

    Logger::debug("Loaded configuration from " + path);
    return fromJson(j);
}

json BridgeConfig::toJson() const {
    return {
        {"worker_threads", workerThreads},
        {"max_in_flight_uploads", maxInFlightUploads},
        {"chunk_probe_retries", chunkProbeRetries},
        {"upload_retries", uploadRetries},
        {"reconnect_attempts", reconnectAttempts},
        {"retry_delay_ms", retryDelayMs},
        {"shutdown_grace_ms", shutdownGraceMs},
        {"index_batch_size", indexBatchSize},
        {"default_chunk_size", defaultChunkSize},
        {"log_path", logPath},
        {"log_level", logLevel},
        {"verify_tls", verifyTls},
        {"probe_before_upload", probeBeforeUpload}
    };
}
