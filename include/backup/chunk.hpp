#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "common/digest.hpp"

enum class IndexKind {
    Fixed,
    Dynamic
};

// What the dedup cache knows about a digest.
enum class ChunkState {
    New,
    DuplicateOfKnown,
    UploadPending,
    UploadAcked
};

struct IndexEntry {
    uint64_t offset;
    uint64_t size;
    Digest digest;
};

inline std::string indexKindToString(IndexKind kind) {
    return kind == IndexKind::Fixed ? "fixed" : "dynamic";
}

// Server side archive name: "<image>.img.fidx" or "<image>.img.didx".
inline std::string archiveName(const std::string& image, IndexKind kind) {
    return image + (kind == IndexKind::Fixed ? ".img.fidx" : ".img.didx");
}
