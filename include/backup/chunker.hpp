#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

// Content defined chunking with a buzhash rolling hash over a 64 byte
// window. A boundary is placed after a byte when the hash matches the
// discriminator and the chunk is at least avg/4 long; chunks never grow
// beyond avg*4. Boundaries depend on the bytes only, not on how the
// stream is split into scan() calls.
class Chunker {
public:
    static constexpr size_t WINDOW_SIZE = 64;

    // avgChunkSize must be a power of two >= 64KiB.
    explicit Chunker(size_t avgChunkSize);

    // Returns the number of bytes of `data` that belong to the current
    // chunk when a boundary was found, 0 otherwise (all bytes consumed).
    size_t scan(const uint8_t* data, size_t size);
    void reset();

    size_t getMinSize() const { return minSize_; }
    size_t getMaxSize() const { return maxSize_; }
    size_t getAvgSize() const { return avgSize_; }

private:
    bool shallBreak() const;

    const size_t avgSize_;
    const size_t minSize_;
    const size_t maxSize_;
    const uint32_t discriminator_;

    uint32_t hash_{0};
    size_t chunkSize_{0};
    size_t windowSize_{0};
    std::array<uint8_t, WINDOW_SIZE> window_{};
};

// Accumulates an append-only byte stream and emits complete chunks.
class StreamChunker {
public:
    using ChunkSink = std::function<void(const uint8_t* data, size_t size)>;

    explicit StreamChunker(size_t avgChunkSize);

    // Emits every chunk completed by `data`; the tail stays buffered.
    void push(const uint8_t* data, size_t size, const ChunkSink& sink);
    // Emits the buffered tail, if any, as the last chunk.
    void flush(const ChunkSink& sink);

    size_t buffered() const { return buffer_.size(); }

private:
    Chunker chunker_;
    std::vector<uint8_t> buffer_;
};
