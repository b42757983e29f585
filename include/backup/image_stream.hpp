#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backup/chunk.hpp"
#include "backup/chunker.hpp"
#include "common/digest.hpp"
#include "common/strand.hpp"

// One disk image of a backup job.
//
// Fixed images accept chunk aligned blocks in any order. Dynamic images
// accept an append only stream; their writes run on the image's strand.
// Acknowledged chunks go through a reorder buffer so that index entries
// reach the server in ascending offset order.
class ImageStream {
public:
    ImageStream(uint8_t deviceId,
                std::string name,
                uint64_t size,
                IndexKind kind,
                uint64_t chunkSize,
                std::string writerId,
                size_t batchSize,
                std::shared_ptr<Strand> strand,
                bool incremental = false);

    ImageStream(const ImageStream&) = delete;
    ImageStream& operator=(const ImageStream&) = delete;

    uint8_t getDeviceId() const { return deviceId_; }
    const std::string& getName() const { return name_; }
    uint64_t getSize() const { return size_; }
    IndexKind getKind() const { return kind_; }
    uint64_t getChunkSize() const { return chunkSize_; }
    const std::string& getWriterId() const { return writerId_; }
    bool isIncremental() const { return incremental_; }
    std::string getArchiveName() const { return archiveName(name_, kind_); }
    // nullptr for fixed images
    std::shared_ptr<Strand> getStrand() const { return strand_; }

    // Admits a write. Throws BridgeError(InvalidArgument) for writes to a
    // closing image, misaligned or out of range blocks, blocks written
    // before and dynamic writes that are not appended at the stream end.
    void beginWrite(uint64_t offset, uint64_t size);
    // A failed fixed write gives its block back so the caller may retry it.
    void endWrite(uint64_t offset, bool succeeded);

    // Dynamic images only, used from the strand.
    StreamChunker& getChunker() { return chunker_; }
    uint64_t getStreamOffset() const;
    // Start offset of the next emitted chunk; advances by `size`.
    uint64_t advanceChunkOffset(uint64_t size);

    void addEntry(const IndexEntry& entry);
    // Up to batch size entries that may be registered now; with `all` every
    // remaining entry, ascending.
    std::vector<IndexEntry> takeBatch(bool all);
    // Throws BridgeError(IndexError) when entries arrive out of order.
    void markRegistered(const std::vector<IndexEntry>& entries);
    // Held while a batch is taken and sent.
    std::mutex& getRegistrationMutex() { return registrationMutex_; }

    // Stops admitting writes and waits for running ones. Throws
    // BridgeError(InvalidArgument) when the image is already closing.
    void beginClose();
    // Offsets of the blocks of a closing fixed image that were never
    // written; they count as written afterwards. Always empty for dynamic
    // and incremental images.
    std::vector<uint64_t> takeUnwrittenBlocks();
    void markClosed();
    bool isClosing() const;
    bool isClosed() const;

    // Bytes acknowledged by the server.
    uint64_t getCursor() const;
    uint64_t getChunkCount() const;
    uint64_t getIndexedSize() const;
    // Checksum over the registered entries; only valid once all are registered.
    Digest finalizeChecksum();

private:
    const uint8_t deviceId_;
    const std::string name_;
    const uint64_t size_;
    const IndexKind kind_;
    const uint64_t chunkSize_;
    const std::string writerId_;
    const size_t batchSize_;
    std::shared_ptr<Strand> strand_;
    const bool incremental_;

    mutable std::mutex mutex_;
    std::condition_variable writesDone_;
    size_t activeWrites_{0};
    bool closing_{false};
    bool closed_{false};
    std::vector<bool> blocksTaken_;
    uint64_t streamOffset_{0};
    uint64_t cursor_{0};

    std::map<uint64_t, IndexEntry> pending_;
    std::deque<IndexEntry> ready_;
    uint64_t nextOffset_{0};

    StreamChunker chunker_;
    uint64_t chunkOffset_{0};

    mutable std::mutex registrationMutex_;
    Sha256 checksum_;
    uint64_t chunkCount_{0};
    uint64_t registeredEnd_{0};
};
