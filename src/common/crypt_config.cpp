#include "common/crypt_config.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <cstring>

using json = nlohmann::json;

namespace {

const char ID_KEY_SALT[] = "_id_key";
const int ID_KEY_ITERATIONS = 10;

std::string opensslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

// RAII owner for EVP cipher contexts.
class CipherContext {
public:
    CipherContext() : ctx_(EVP_CIPHER_CTX_new()) {
        if (!ctx_) {
            throw BridgeError(ErrorCode::InitializationError, "Failed to allocate cipher context");
        }
    }
    ~CipherContext() { EVP_CIPHER_CTX_free(ctx_); }

    CipherContext(const CipherContext&) = delete;
    CipherContext& operator=(const CipherContext&) = delete;

    EVP_CIPHER_CTX* get() const { return ctx_; }

private:
    EVP_CIPHER_CTX* ctx_;
};

} // namespace

CryptConfig::CryptConfig(const Key& key)
    : encKey_(key) {
    if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(encKey_.data()),
                          static_cast<int>(encKey_.size()),
                          reinterpret_cast<const unsigned char*>(ID_KEY_SALT),
                          static_cast<int>(sizeof(ID_KEY_SALT) - 1),
                          ID_KEY_ITERATIONS,
                          EVP_sha256(),
                          static_cast<int>(idKey_.size()),
                          idKey_.data()) != 1) {
        throw BridgeError(ErrorCode::InitializationError, "Failed to derive id key: " + opensslError());
    }
}

Digest CryptConfig::computeDigest(const uint8_t* data, size_t size) const {
    Sha256 hasher;
    hasher.update(data, size);
    hasher.update(idKey_.data(), idKey_.size());
    return hasher.finalize();
}

std::vector<uint8_t> CryptConfig::encrypt(const uint8_t* data, size_t size) const {
    std::vector<uint8_t> payload(IV_SIZE + TAG_SIZE + size);
    uint8_t* iv = payload.data();
    uint8_t* tag = payload.data() + IV_SIZE;
    uint8_t* out = payload.data() + IV_SIZE + TAG_SIZE;

    if (RAND_bytes(iv, static_cast<int>(IV_SIZE)) != 1) {
        throw BridgeError(ErrorCode::UploadError, "Failed to generate IV: " + opensslError());
    }

    CipherContext ctx;
    int length = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, encKey_.data(), iv) != 1) {
        throw BridgeError(ErrorCode::UploadError, "Failed to initialize chunk encryption: " + opensslError());
    }

    size_t written = 0;
    while (written < size) {
        const int step = static_cast<int>(std::min<size_t>(size - written, 1 << 30));
        if (EVP_EncryptUpdate(ctx.get(), out + written, &length, data + written, step) != 1) {
            throw BridgeError(ErrorCode::UploadError, "Chunk encryption failed: " + opensslError());
        }
        written += static_cast<size_t>(length);
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out + written, &length) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
        throw BridgeError(ErrorCode::UploadError, "Chunk encryption failed: " + opensslError());
    }
    return payload;
}

std::string CryptConfig::fingerprint() const {
    Digest digest = sha256(idKey_.data(), idKey_.size());
    std::string hex = bytesToHex(digest.data(), 8);
    std::string result;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!result.empty()) {
            result.push_back(':');
        }
        result.append(hex, i, 2);
    }
    return result;
}

CryptConfig::Key CryptConfig::deriveKey(const std::string& password,
                                        const std::vector<uint8_t>& salt,
                                        int iterations) {
    Key key{};
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw BridgeError(ErrorCode::InvalidArgument, "Key derivation failed: " + opensslError());
    }
    return key;
}

std::shared_ptr<CryptConfig> CryptConfig::loadKeyFile(const std::string& path,
                                                      const std::string& password) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BridgeError(ErrorCode::InvalidArgument, "Failed to open key file: " + path);
    }

    json keyData;
    try {
        file >> keyData;
    } catch (const json::exception& e) {
        throw BridgeError(ErrorCode::InvalidArgument, "Failed to parse key file " + path + ": " + e.what());
    }

    const std::string kdf = keyData.value("kdf", std::string("none"));
    Key key{};

    if (kdf == "none") {
        std::vector<uint8_t> bytes;
        if (!hexToBytes(keyData.value("key", std::string()), bytes) || bytes.size() != key.size()) {
            throw BridgeError(ErrorCode::InvalidArgument, "Key file " + path + " contains no valid key");
        }
        std::memcpy(key.data(), bytes.data(), key.size());
    } else if (kdf == "pbkdf2") {
        if (password.empty()) {
            throw BridgeError(ErrorCode::InvalidArgument, "Key file " + path + " requires a key password");
        }
        std::vector<uint8_t> salt;
        if (!hexToBytes(keyData.value("salt", std::string()), salt) || salt.empty()) {
            throw BridgeError(ErrorCode::InvalidArgument, "Key file " + path + " has no valid salt");
        }
        const int iterations = keyData.value("iterations", 65535);
        if (iterations <= 0) {
            throw BridgeError(ErrorCode::InvalidArgument, "Key file " + path + " has an invalid iteration count");
        }
        key = deriveKey(password, salt, iterations);
    } else {
        throw BridgeError(ErrorCode::InvalidArgument, "Unsupported key derivation function: " + kdf);
    }

    auto config = std::make_shared<CryptConfig>(key);
    Logger::info("Loaded encryption key " + config->fingerprint() + " from " + path);
    return config;
}
