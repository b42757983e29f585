#pragma once

#include "backup/backup_config.hpp"
#include "backup/chunk.hpp"
#include <memory>
#include <string>
#include <vector>

// Network collaborator: one backup session on the server.
//
// Implementations report failures by throwing BridgeError:
//   ConnectionError      transport level failure, session may be resumed
//   AuthenticationError  credentials rejected
//   UploadError          transient server side failure of a chunk or blob call
//   IndexError           index call rejected
//   JobError             finish rejected
// All methods except connect/reconnect/disconnect may be called
// concurrently from several threads.
class BackupTransport {
public:
    virtual ~BackupTransport() = default;

    // Opens the session. Returns true when a previous backup of the same
    // group exists on the server.
    virtual bool connect(const ServerParams& params) = 0;
    // Re-establishes the connection of the current session.
    virtual void reconnect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool hasChunk(const Digest& digest) = 0;
    virtual void uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                             uint64_t rawSize, bool encrypted) = 0;

    // Returns the server side writer id of the new index.
    virtual std::string createIndex(const std::string& archive, IndexKind kind,
                                    uint64_t size, uint64_t chunkSize) = 0;
    virtual void appendIndex(const std::string& writerId, const std::vector<IndexEntry>& entries) = 0;
    virtual void closeIndex(const std::string& writerId, uint64_t chunkCount,
                            uint64_t size, const Digest& checksum) = 0;

    // Chunk digests referenced by `archive` in the previous backup.
    virtual std::vector<Digest> knownChunks(const std::string& archive) = 0;

    virtual void uploadBlob(const std::string& name, const std::vector<uint8_t>& data) = 0;
    virtual void finish() = 0;
    virtual void abort(const std::string& reason) = 0;
};
