#include "common/digest.hpp"
#include "common/backup_status.hpp"
#include <openssl/evp.h>
#include <cctype>

Digest sha256(const uint8_t* data, size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.finalize();
}

std::string bytesToHex(const uint8_t* data, size_t size) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        result.push_back(hex[data[i] >> 4]);
        result.push_back(hex[data[i] & 0x0f]);
    }
    return result;
}

std::string digestToHex(const Digest& digest) {
    return bytesToHex(digest.data(), digest.size());
}

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

bool hexToBytes(const std::string& hex, std::vector<uint8_t>& bytes) {
    bytes.clear();
    int high = -1;
    for (char c : hex) {
        if (c == ':') {
            continue;
        }
        int value = hexValue(c);
        if (value < 0) {
            return false;
        }
        if (high < 0) {
            high = value;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    return high < 0;
}

bool digestFromHex(const std::string& hex, Digest& digest) {
    std::vector<uint8_t> bytes;
    if (!hexToBytes(hex, bytes) || bytes.size() != digest.size()) {
        return false;
    }
    std::memcpy(digest.data(), bytes.data(), digest.size());
    return true;
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw BridgeError(ErrorCode::InitializationError, "Failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Sha256::update(const void* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size) != 1) {
        throw BridgeError(ErrorCode::InitializationError, "SHA-256 update failed");
    }
}

Digest Sha256::finalize() {
    Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), digest.data(), &length) != 1 ||
        length != digest.size()) {
        throw BridgeError(ErrorCode::InitializationError, "SHA-256 finalize failed");
    }
    return digest;
}
