#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

using Digest = std::array<uint8_t, 32>;

struct DigestHash {
    size_t operator()(const Digest& digest) const {
        // SHA-256 output is uniformly distributed, the first word is enough.
        size_t value;
        std::memcpy(&value, digest.data(), sizeof(value));
        return value;
    }
};

Digest sha256(const uint8_t* data, size_t size);
std::string digestToHex(const Digest& digest);
bool digestFromHex(const std::string& hex, Digest& digest);

std::string bytesToHex(const uint8_t* data, size_t size);
// Accepts upper and lower case; ':' separators are skipped.
bool hexToBytes(const std::string& hex, std::vector<uint8_t>& bytes);

// Incremental SHA-256 over an EVP context.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t size);
    Digest finalize();

private:
    void* ctx_;
};
