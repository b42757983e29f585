#include "backup/chunker.hpp"
#include "common/backup_status.hpp"

namespace {

// Fixed pseudo random table; changing it changes every chunk boundary.
std::array<uint32_t, 256> makeBuzhashTable() {
    std::array<uint32_t, 256> table{};
    uint64_t state = 0x9e3779b97f4a7c15ULL;
    for (auto& entry : table) {
        state += 0x9e3779b97f4a7c15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        z = z ^ (z >> 31);
        entry = static_cast<uint32_t>(z >> 32);
    }
    return table;
}

const std::array<uint32_t, 256>& buzhashTable() {
    static const std::array<uint32_t, 256> table = makeBuzhashTable();
    return table;
}

inline uint32_t rotl(uint32_t value, unsigned shift) {
    shift &= 31;
    return shift == 0 ? value : (value << shift) | (value >> (32 - shift));
}

bool isPowerOfTwo(size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

} // namespace

Chunker::Chunker(size_t avgChunkSize)
    : avgSize_(avgChunkSize)
    , minSize_(avgChunkSize >> 2)
    , maxSize_(avgChunkSize << 2)
    , discriminator_(static_cast<uint32_t>(avgChunkSize - 1)) {
    if (!isPowerOfTwo(avgChunkSize) || avgChunkSize < 64 * 1024 || avgChunkSize > (1u << 30)) {
        throw BridgeError(ErrorCode::InvalidArgument,
                          "Average chunk size must be a power of two between 64KiB and 1GiB");
    }
}

void Chunker::reset() {
    hash_ = 0;
    chunkSize_ = 0;
    windowSize_ = 0;
}

bool Chunker::shallBreak() const {
    if (chunkSize_ >= maxSize_) {
        return true;
    }
    if (chunkSize_ < minSize_) {
        return false;
    }
    return (hash_ & discriminator_) == discriminator_;
}

size_t Chunker::scan(const uint8_t* data, size_t size) {
    const auto& table = buzhashTable();
    size_t idx = 0;

    // Fill the window first; no boundary can fall inside it since
    // minSize_ is far larger than the window.
    while (windowSize_ < WINDOW_SIZE && idx < size) {
        const uint8_t byte = data[idx++];
        window_[windowSize_++] = byte;
        hash_ = rotl(hash_, 1) ^ table[byte];
        ++chunkSize_;
    }

    while (idx < size) {
        const uint8_t byte = data[idx++];
        const size_t pos = chunkSize_ % WINDOW_SIZE;
        const uint8_t out = window_[pos];
        window_[pos] = byte;
        hash_ = rotl(hash_, 1) ^ rotl(table[out], WINDOW_SIZE) ^ table[byte];
        ++chunkSize_;

        if (shallBreak()) {
            reset();
            return idx;
        }
    }
    return 0;
}

StreamChunker::StreamChunker(size_t avgChunkSize)
    : chunker_(avgChunkSize) {
}

void StreamChunker::push(const uint8_t* data, size_t size, const ChunkSink& sink) {
    size_t pos = 0;
    while (pos < size) {
        const size_t boundary = chunker_.scan(data + pos, size - pos);
        if (boundary == 0) {
            buffer_.insert(buffer_.end(), data + pos, data + size);
            return;
        }

        if (buffer_.empty()) {
            sink(data + pos, boundary);
        } else {
            buffer_.insert(buffer_.end(), data + pos, data + pos + boundary);
            sink(buffer_.data(), buffer_.size());
            buffer_.clear();
        }
        pos += boundary;
    }
}

void StreamChunker::flush(const ChunkSink& sink) {
    if (!buffer_.empty()) {
        sink(buffer_.data(), buffer_.size());
        buffer_.clear();
    }
    chunker_.reset();
}
