#pragma once

#include "backup/backup_transport.hpp"
#include "common/backup_status.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// In-memory backup server with fault injection.
class MockBackupTransport : public BackupTransport {
public:
    struct IndexRecord {
        std::string archive;
        IndexKind kind;
        uint64_t size{0};
        uint64_t chunkSize{0};
        std::vector<IndexEntry> entries;
        bool closed{false};
        uint64_t chunkCount{0};
        uint64_t closedSize{0};
        Digest checksum{};
    };

    bool connect(const ServerParams& params) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connectCalls_;
        if (rejectAuth_) {
            throw BridgeError(ErrorCode::AuthenticationError, "authentication failed");
        }
        if (connectFailures_ > 0) {
            --connectFailures_;
            throw BridgeError(ErrorCode::ConnectionError, "connection refused");
        }
        params_ = params;
        connected_ = true;
        return previous_;
    }

    void reconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reconnectCalls_;
        if (reconnectFailures_ > 0) {
            --reconnectFailures_;
            throw BridgeError(ErrorCode::ConnectionError, "reconnect refused");
        }
        connected_ = true;
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    bool hasChunk(const Digest& digest) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probeCalls_;
        return chunks_.count(digest) != 0;
    }

    void uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                     uint64_t rawSize, bool encrypted) override {
        const int running = ++uploadsRunning_;
        int peak = peakUploads_.load();
        while (running > peak && !peakUploads_.compare_exchange_weak(peak, running)) {
        }
        struct Leave {
            std::atomic<int>& counter;
            ~Leave() { --counter; }
        } leave{uploadsRunning_};

        if (uploadDelay_.count() > 0) {
            std::this_thread::sleep_for(uploadDelay_);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++uploadAttempts_;
        if (dropConnections_ > 0) {
            --dropConnections_;
            connected_ = false;
            throw BridgeError(ErrorCode::ConnectionError, "connection reset by peer");
        }
        if (!connected_) {
            throw BridgeError(ErrorCode::ConnectionError, "not connected");
        }
        if (uploadFailures_ > 0) {
            --uploadFailures_;
            throw BridgeError(ErrorCode::UploadError, "server returned 503");
        }
        chunks_.insert(digest);
        ++uploadsPerDigest_[digest];
        lastPayloadSize_ = payload.size();
        lastRawSize_ = rawSize;
        lastEncrypted_ = encrypted;
    }

    std::string createIndex(const std::string& archive, IndexKind kind,
                            uint64_t size, uint64_t chunkSize) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (indexFailures_ > 0) {
            --indexFailures_;
            throw BridgeError(ErrorCode::UploadError, "server returned 500");
        }
        const std::string writerId = "wid-" + std::to_string(indexes_.size() + 1);
        IndexRecord record;
        record.archive = archive;
        record.kind = kind;
        record.size = size;
        record.chunkSize = chunkSize;
        indexes_[writerId] = record;
        return writerId;
    }

    void appendIndex(const std::string& writerId, const std::vector<IndexEntry>& entries) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = indexes_.find(writerId);
        if (it == indexes_.end() || it->second.closed) {
            throw BridgeError(ErrorCode::IndexError, "unknown writer " + writerId);
        }
        ++appendCalls_;
        for (const auto& entry : entries) {
            if (chunks_.count(entry.digest) == 0) {
                throw BridgeError(ErrorCode::IndexError, "index references unknown chunk");
            }
            it->second.entries.push_back(entry);
        }
    }

    void closeIndex(const std::string& writerId, uint64_t chunkCount,
                    uint64_t size, const Digest& checksum) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = indexes_.find(writerId);
        if (it == indexes_.end() || it->second.closed) {
            throw BridgeError(ErrorCode::IndexError, "unknown writer " + writerId);
        }
        if (chunkCount != it->second.entries.size()) {
            throw BridgeError(ErrorCode::IndexError, "chunk count mismatch");
        }
        it->second.closed = true;
        it->second.chunkCount = chunkCount;
        it->second.closedSize = size;
        it->second.checksum = checksum;
    }

    std::vector<Digest> knownChunks(const std::string& archive) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = previousChunks_.find(archive);
        return it == previousChunks_.end() ? std::vector<Digest>() : it->second;
    }

    void uploadBlob(const std::string& name, const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (blobFailures_ > 0) {
            --blobFailures_;
            throw BridgeError(ErrorCode::UploadError, "server returned 502");
        }
        blobs_[name] = data;
    }

    void finish() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rejectFinish_) {
            throw BridgeError(ErrorCode::JobError, "finish rejected");
        }
        finished_ = true;
    }

    void abort(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        abortReason_ = reason;
    }

    // Fault injection
    void setPreviousBackup(bool previous) { std::lock_guard<std::mutex> lock(mutex_); previous_ = previous; }
    void setPreviousChunks(const std::string& archive, const std::vector<Digest>& digests) {
        std::lock_guard<std::mutex> lock(mutex_);
        previousChunks_[archive] = digests;
        chunks_.insert(digests.begin(), digests.end());
    }
    void storeChunk(const Digest& digest) { std::lock_guard<std::mutex> lock(mutex_); chunks_.insert(digest); }
    void rejectAuthentication(bool reject) { std::lock_guard<std::mutex> lock(mutex_); rejectAuth_ = reject; }
    void failConnects(int count) { std::lock_guard<std::mutex> lock(mutex_); connectFailures_ = count; }
    void failReconnects(int count) { std::lock_guard<std::mutex> lock(mutex_); reconnectFailures_ = count; }
    void dropConnections(int count) { std::lock_guard<std::mutex> lock(mutex_); dropConnections_ = count; }
    void failUploads(int count) { std::lock_guard<std::mutex> lock(mutex_); uploadFailures_ = count; }
    void failIndexCreation(int count) { std::lock_guard<std::mutex> lock(mutex_); indexFailures_ = count; }
    void failBlobs(int count) { std::lock_guard<std::mutex> lock(mutex_); blobFailures_ = count; }
    void rejectFinish(bool reject) { std::lock_guard<std::mutex> lock(mutex_); rejectFinish_ = reject; }
    void setUploadDelay(std::chrono::milliseconds delay) { uploadDelay_ = delay; }

    // Inspection
    int getConnectCalls() const { std::lock_guard<std::mutex> lock(mutex_); return connectCalls_; }
    int getReconnectCalls() const { std::lock_guard<std::mutex> lock(mutex_); return reconnectCalls_; }
    int getUploadAttempts() const { std::lock_guard<std::mutex> lock(mutex_); return uploadAttempts_; }
    int getProbeCalls() const { std::lock_guard<std::mutex> lock(mutex_); return probeCalls_; }
    int getAppendCalls() const { std::lock_guard<std::mutex> lock(mutex_); return appendCalls_; }
    int getPeakConcurrentUploads() const { return peakUploads_.load(); }
    bool isFinished() const { std::lock_guard<std::mutex> lock(mutex_); return finished_; }
    bool isAborted() const { std::lock_guard<std::mutex> lock(mutex_); return aborted_; }
    std::string getAbortReason() const { std::lock_guard<std::mutex> lock(mutex_); return abortReason_; }
    bool getLastEncrypted() const { std::lock_guard<std::mutex> lock(mutex_); return lastEncrypted_; }
    uint64_t getLastRawSize() const { std::lock_guard<std::mutex> lock(mutex_); return lastRawSize_; }
    ServerParams getParams() const { std::lock_guard<std::mutex> lock(mutex_); return params_; }

    size_t getStoredChunkCount() const { std::lock_guard<std::mutex> lock(mutex_); return chunks_.size(); }

    int getUploadCount(const Digest& digest) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploadsPerDigest_.find(digest);
        return it == uploadsPerDigest_.end() ? 0 : it->second;
    }

    int getTotalUploads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& entry : uploadsPerDigest_) {
            total += entry.second;
        }
        return total;
    }

    bool findIndex(const std::string& archive, IndexRecord& record) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : indexes_) {
            if (entry.second.archive == archive) {
                record = entry.second;
                return true;
            }
        }
        return false;
    }

    bool getBlob(const std::string& name, std::vector<uint8_t>& data) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blobs_.find(name);
        if (it == blobs_.end()) {
            return false;
        }
        data = it->second;
        return true;
    }

private:
    mutable std::mutex mutex_;
    ServerParams params_;
    bool connected_{false};
    bool previous_{false};
    bool rejectAuth_{false};
    bool rejectFinish_{false};
    bool finished_{false};
    bool aborted_{false};
    std::string abortReason_;

    int connectFailures_{0};
    int reconnectFailures_{0};
    int dropConnections_{0};
    int uploadFailures_{0};
    int indexFailures_{0};
    int blobFailures_{0};

    int connectCalls_{0};
    int reconnectCalls_{0};
    int uploadAttempts_{0};
    int probeCalls_{0};
    int appendCalls_{0};
    bool lastEncrypted_{false};
    uint64_t lastRawSize_{0};
    size_t lastPayloadSize_{0};

    std::set<Digest> chunks_;
    std::map<Digest, int> uploadsPerDigest_;
    std::map<std::string, IndexRecord> indexes_;
    std::map<std::string, std::vector<Digest>> previousChunks_;
    std::map<std::string, std::vector<uint8_t>> blobs_;

    std::chrono::milliseconds uploadDelay_{0};
    std::atomic<int> uploadsRunning_{0};
    std::atomic<int> peakUploads_{0};
};
