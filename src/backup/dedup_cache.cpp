#include "backup/dedup_cache.hpp"
#include "common/backup_status.hpp"

DedupCache::DedupCache(const std::vector<Digest>& seed) {
    for (const auto& digest : seed) {
        entries_.emplace(digest, ChunkState::DuplicateOfKnown);
    }
}

void DedupCache::seed(const std::vector<Digest>& digests) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
        return;
    }
    for (const auto& digest : digests) {
        entries_.emplace(digest, ChunkState::DuplicateOfKnown);
    }
}

DedupCache::Claim DedupCache::claim(const Digest& digest) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (released_) {
            throw BridgeError(ErrorCode::Cancelled, "Chunk cache released");
        }

        auto it = entries_.find(digest);
        if (it == entries_.end()) {
            entries_.emplace(digest, ChunkState::UploadPending);
            return Claim::Owner;
        }
        if (it->second != ChunkState::UploadPending) {
            return Claim::Known;
        }
        changed_.wait(lock);
    }
}

void DedupCache::markAcked(const Digest& digest) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released_) {
            return;
        }
        entries_[digest] = ChunkState::UploadAcked;
    }
    changed_.notify_all();
}

void DedupCache::markFailed(const Digest& digest) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(digest);
        if (it != entries_.end() && it->second == ChunkState::UploadPending) {
            entries_.erase(it);
        }
    }
    changed_.notify_all();
}

bool DedupCache::contains(const Digest& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(digest);
    return it != entries_.end() && it->second != ChunkState::UploadPending;
}

ChunkState DedupCache::getState(const Digest& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(digest);
    return it == entries_.end() ? ChunkState::New : it->second;
}

void DedupCache::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        entries_.clear();
    }
    changed_.notify_all();
}

bool DedupCache::isReleased() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

size_t DedupCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
