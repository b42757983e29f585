#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

// Process wide policy: thread counts, retry budgets and limits.
struct BridgeConfig {
    size_t workerThreads{0};              // 0 = hardware concurrency
    size_t maxInFlightUploads{16};
    int chunkProbeRetries{3};
    int uploadRetries{3};
    int reconnectAttempts{5};
    int retryDelayMs{500};
    int shutdownGraceMs{5000};
    size_t indexBatchSize{128};
    uint64_t defaultChunkSize{4 * 1024 * 1024};
    std::string logPath;
    std::string logLevel{"info"};
    bool verifyTls{true};
    bool probeBeforeUpload{true};         // ask the server before sending a new chunk

    std::chrono::milliseconds retryDelay() const { return std::chrono::milliseconds(retryDelayMs); }
    std::chrono::milliseconds shutdownGrace() const { return std::chrono::milliseconds(shutdownGraceMs); }

    // Throws BridgeError(InvalidArgument) when a value is out of range.
    void validate() const;

    static BridgeConfig fromJson(const nlohmann::json& json);
    static BridgeConfig loadFromFile(const std::string& path);
    nlohmann::json toJson() const;
};
