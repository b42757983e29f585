#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include "common/digest.hpp"

// Encryption context of a backup job.
//
// Chunk digests are keyed (SHA-256 over data followed by an id key derived
// from the encryption key), so encrypted and plain chunks never collide on
// the server. Payloads are AES-256-GCM: 16 byte IV, 16 byte tag, ciphertext.
class CryptConfig {
public:
    using Key = std::array<uint8_t, 32>;

    static constexpr size_t IV_SIZE = 16;
    static constexpr size_t TAG_SIZE = 16;

    explicit CryptConfig(const Key& key);

    Digest computeDigest(const uint8_t* data, size_t size) const;
    std::vector<uint8_t> encrypt(const uint8_t* data, size_t size) const;

    // SHA-256 of the id key, "aa:bb:..." formatted, recorded in the manifest.
    std::string fingerprint() const;

    // Key file JSON:
    //   {"kdf": "none", "key": "<64 hex chars>"}
    //   {"kdf": "pbkdf2", "salt": "<hex>", "iterations": n}
    // Throws BridgeError(InvalidArgument) on unreadable or malformed files.
    static std::shared_ptr<CryptConfig> loadKeyFile(const std::string& path,
                                                   const std::string& password);
    static Key deriveKey(const std::string& password, const std::vector<uint8_t>& salt, int iterations);

private:
    Key encKey_;
    Key idKey_;
};
