#include "backup/image_stream.hpp"
#include "common/backup_status.hpp"
#include <algorithm>

ImageStream::ImageStream(uint8_t deviceId,
                         std::string name,
                         uint64_t size,
                         IndexKind kind,
                         uint64_t chunkSize,
                         std::string writerId,
                         size_t batchSize,
                         std::shared_ptr<Strand> strand,
                         bool incremental)
    : deviceId_(deviceId)
    , name_(std::move(name))
    , size_(size)
    , kind_(kind)
    , chunkSize_(chunkSize)
    , writerId_(std::move(writerId))
    , batchSize_(batchSize == 0 ? 1 : batchSize)
    , strand_(std::move(strand))
    , incremental_(incremental)
    , chunker_(static_cast<size_t>(chunkSize)) {
    if (kind_ == IndexKind::Fixed) {
        blocksTaken_.assign(static_cast<size_t>((size_ + chunkSize_ - 1) / chunkSize_), false);
    }
}

void ImageStream::beginWrite(uint64_t offset, uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_ || closed_) {
        throw BridgeError(ErrorCode::InvalidArgument, "Image " + name_ + " is closed");
    }
    if (size == 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "Empty write to image " + name_);
    }
    if (offset >= size_ || size > size_ - offset) {
        throw BridgeError(ErrorCode::InvalidArgument,
                          "Write of " + std::to_string(size) + " bytes at offset " + std::to_string(offset) +
                          " exceeds size of image " + name_ + " (" + std::to_string(size_) + ")");
    }

    if (kind_ == IndexKind::Fixed) {
        if (offset % chunkSize_ != 0) {
            throw BridgeError(ErrorCode::InvalidArgument,
                              "Offset " + std::to_string(offset) + " is not aligned to the chunk size " +
                              std::to_string(chunkSize_));
        }
        const uint64_t expected = std::min(chunkSize_, size_ - offset);
        if (size != expected) {
            throw BridgeError(ErrorCode::InvalidArgument,
                              "Write at offset " + std::to_string(offset) + " must be " +
                              std::to_string(expected) + " bytes, got " + std::to_string(size));
        }
        const size_t block = static_cast<size_t>(offset / chunkSize_);
        if (blocksTaken_[block]) {
            throw BridgeError(ErrorCode::InvalidArgument,
                              "Block at offset " + std::to_string(offset) + " of image " + name_ +
                              " was already written");
        }
        blocksTaken_[block] = true;
    } else {
        if (offset != streamOffset_) {
            throw BridgeError(ErrorCode::InvalidArgument,
                              "Dynamic image " + name_ + " expects offset " + std::to_string(streamOffset_) +
                              ", got " + std::to_string(offset));
        }
        streamOffset_ += size;
    }
    ++activeWrites_;
}

void ImageStream::endWrite(uint64_t offset, bool succeeded) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!succeeded && kind_ == IndexKind::Fixed) {
            blocksTaken_[static_cast<size_t>(offset / chunkSize_)] = false;
        }
        --activeWrites_;
    }
    writesDone_.notify_all();
}

uint64_t ImageStream::getStreamOffset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streamOffset_;
}

uint64_t ImageStream::advanceChunkOffset(uint64_t size) {
    const uint64_t offset = chunkOffset_;
    chunkOffset_ += size;
    return offset;
}

void ImageStream::addEntry(const IndexEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_ += entry.size;
    pending_.emplace(entry.offset, entry);

    auto it = pending_.begin();
    while (it != pending_.end() && it->first == nextOffset_) {
        nextOffset_ += it->second.size;
        ready_.push_back(it->second);
        it = pending_.erase(it);
    }
}

std::vector<IndexEntry> ImageStream::takeBatch(bool all) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IndexEntry> batch;

    if (all) {
        batch.assign(ready_.begin(), ready_.end());
        ready_.clear();
        for (const auto& item : pending_) {
            batch.push_back(item.second);
        }
        pending_.clear();
        return batch;
    }

    if (ready_.size() < batchSize_) {
        return batch;
    }
    batch.assign(ready_.begin(), ready_.begin() + static_cast<std::ptrdiff_t>(batchSize_));
    ready_.erase(ready_.begin(), ready_.begin() + static_cast<std::ptrdiff_t>(batchSize_));
    return batch;
}

void ImageStream::markRegistered(const std::vector<IndexEntry>& entries) {
    for (const auto& entry : entries) {
        if (chunkCount_ > 0 && entry.offset < registeredEnd_) {
            throw BridgeError(ErrorCode::IndexError,
                              "Index entry at offset " + std::to_string(entry.offset) + " of image " + name_ +
                              " registered after offset " + std::to_string(registeredEnd_));
        }
        registeredEnd_ = entry.offset + entry.size;
        ++chunkCount_;

        if (kind_ == IndexKind::Dynamic) {
            uint8_t end[8];
            for (int i = 0; i < 8; ++i) {
                end[i] = static_cast<uint8_t>(registeredEnd_ >> (8 * i));
            }
            checksum_.update(end, sizeof(end));
        }
        checksum_.update(entry.digest.data(), entry.digest.size());
    }
}

void ImageStream::beginClose() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closing_ || closed_) {
        throw BridgeError(ErrorCode::InvalidArgument, "Image " + name_ + " is already closed");
    }
    closing_ = true;
    writesDone_.wait(lock, [this]() { return activeWrites_ == 0; });
}

std::vector<uint64_t> ImageStream::takeUnwrittenBlocks() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> offsets;
    if (kind_ != IndexKind::Fixed || incremental_ || !closing_) {
        return offsets;
    }
    for (size_t block = 0; block < blocksTaken_.size(); ++block) {
        if (!blocksTaken_[block]) {
            blocksTaken_[block] = true;
            offsets.push_back(static_cast<uint64_t>(block) * chunkSize_);
        }
    }
    return offsets;
}

void ImageStream::markClosed() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool ImageStream::isClosing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closing_;
}

bool ImageStream::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

uint64_t ImageStream::getCursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

uint64_t ImageStream::getChunkCount() const {
    std::lock_guard<std::mutex> lock(registrationMutex_);
    return chunkCount_;
}

uint64_t ImageStream::getIndexedSize() const {
    if (kind_ == IndexKind::Fixed) {
        return size_;
    }
    return getStreamOffset();
}

Digest ImageStream::finalizeChecksum() {
    std::lock_guard<std::mutex> lock(registrationMutex_);
    return checksum_.finalize();
}
