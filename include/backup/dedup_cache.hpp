#pragma once

#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "backup/chunk.hpp"
#include "common/digest.hpp"

// Job scoped map from chunk digest to what is known about its presence
// on the server. Never shared between jobs; an incremental job is handed
// the previous backup's digests through seed().
class DedupCache {
public:
    enum class Claim {
        Known,   // present on the server, register without uploading
        Owner    // caller must upload and then call markAcked/markFailed
    };

    DedupCache() = default;
    explicit DedupCache(const std::vector<Digest>& seed);

    void seed(const std::vector<Digest>& digests);

    // Blocks while another thread owns an upload of the same digest.
    // Throws BridgeError(Cancelled) once the cache was released.
    Claim claim(const Digest& digest);
    void markAcked(const Digest& digest);
    // Drops the claim so that the next claimant retries the upload.
    void markFailed(const Digest& digest);

    bool contains(const Digest& digest) const;
    ChunkState getState(const Digest& digest) const;

    // Forgets every digest and fails all waiters.
    void release();
    bool isReleased() const;

    size_t size() const;

private:
    std::unordered_map<Digest, ChunkState, DigestHash> entries_;
    bool released_{false};
    mutable std::mutex mutex_;
    std::condition_variable changed_;
};
