#include <gtest/gtest.h>
#include "backup/backup_config.hpp"
#include "backup/http_backup_transport.hpp"
#include "common/backup_status.hpp"
#include "common/bridge_config.hpp"
#include "common/crypt_config.hpp"
#include "common/digest.hpp"
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <fstream>
#include <memory>
#include <string>

namespace {

std::string writeFile(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream file(path);
    file << content;
    return path;
}

// Decrypts an IV | tag | ciphertext payload; false when authentication fails.
bool openPayload(const CryptConfig::Key& key, const std::vector<uint8_t>& payload, std::vector<uint8_t>& plain) {
    const size_t header = CryptConfig::IV_SIZE + CryptConfig::TAG_SIZE;
    if (payload.size() < header) {
        return false;
    }
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    plain.assign(payload.size() - header, 0);
    int length = 0;
    int finalLength = 0;
    std::vector<uint8_t> tag(payload.begin() + CryptConfig::IV_SIZE, payload.begin() + header);
    return EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
           EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(CryptConfig::IV_SIZE),
                               nullptr) == 1 &&
           EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), payload.data()) == 1 &&
           EVP_DecryptUpdate(ctx.get(), plain.data(), &length, payload.data() + header,
                             static_cast<int>(plain.size())) == 1 &&
           EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1 &&
           EVP_DecryptFinal_ex(ctx.get(), plain.data() + length, &finalLength) == 1;
}

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using StorePtr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;
using StoreContextPtr = std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)>;

PkeyPtr generateKey() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr),
                                                                    EVP_PKEY_CTX_free);
    EVP_PKEY* key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1 ||
        EVP_PKEY_keygen(ctx.get(), &key) != 1) {
        return PkeyPtr(nullptr, EVP_PKEY_free);
    }
    return PkeyPtr(key, EVP_PKEY_free);
}

// Self signed certificate for host.
X509Ptr selfSignedCertificate(EVP_PKEY* key, const char* host) {
    X509Ptr certificate(X509_new(), X509_free);
    X509_set_version(certificate.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(certificate.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(certificate.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(certificate.get()), 3600);
    X509_set_pubkey(certificate.get(), key);
    X509_NAME* name = X509_get_subject_name(certificate.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(host), -1, -1, 0);
    X509_set_issuer_name(certificate.get(), name);
    if (X509_sign(certificate.get(), key, EVP_sha256()) == 0) {
        certificate.reset();
    }
    return certificate;
}

StoreContextPtr storeContext(X509_STORE* store, X509* certificate) {
    StoreContextPtr ctx(X509_STORE_CTX_new(), X509_STORE_CTX_free);
    if (ctx && X509_STORE_CTX_init(ctx.get(), store, certificate, nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

} // namespace

TEST(BackupRepositoryTest, ParsesDatastoreOnly) {
    BackupRepository repo = BackupRepository::parse("store1");
    EXPECT_EQ(repo.datastore, "store1");
    EXPECT_EQ(repo.host, "localhost");
    EXPECT_EQ(repo.user, "root@pam");
    EXPECT_EQ(repo.port, 8007);
}

TEST(BackupRepositoryTest, ParsesUserHostPortAndDatastore) {
    BackupRepository repo = BackupRepository::parse("backup@pbs@backup.example.com:8008:store2");
    EXPECT_EQ(repo.user, "backup@pbs");
    EXPECT_EQ(repo.host, "backup.example.com");
    EXPECT_EQ(repo.port, 8008);
    EXPECT_EQ(repo.datastore, "store2");
    EXPECT_EQ(repo.toString(), "backup@pbs@backup.example.com:8008:store2");
}

TEST(BackupRepositoryTest, ParsesIpv6Host) {
    BackupRepository repo = BackupRepository::parse("[fd00::1]:store3");
    EXPECT_EQ(repo.host, "[fd00::1]");
    EXPECT_EQ(repo.datastore, "store3");
}

TEST(BackupRepositoryTest, RejectsMalformedInput) {
    EXPECT_THROW(BackupRepository::parse(""), BridgeError);
    EXPECT_THROW(BackupRepository::parse("host:"), BridgeError);
    EXPECT_THROW(BackupRepository::parse("host:0:store"), BridgeError);
    EXPECT_THROW(BackupRepository::parse("host:70000:store"), BridgeError);
    EXPECT_THROW(BackupRepository::parse("a b:store"), BridgeError);
}

TEST(BackupOptionsTest, Validate) {
    BackupOptions options;
    options.repository = BackupRepository::parse("store1");
    options.backupId = "100";
    EXPECT_NO_THROW(options.validate());

    options.chunkSize = 128 * 1024;
    EXPECT_NO_THROW(options.validate());
    options.chunkSize = 32 * 1024;
    EXPECT_THROW(options.validate(), BridgeError);
    options.chunkSize = 100000;
    EXPECT_THROW(options.validate(), BridgeError);
    options.chunkSize = 0;

    options.backupTime = -1;
    EXPECT_THROW(options.validate(), BridgeError);
    options.backupTime = 0;

    options.backupId.clear();
    EXPECT_THROW(options.validate(), BridgeError);
}

TEST(BridgeConfigTest, DefaultsFromEmptyJson) {
    BridgeConfig config = BridgeConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(config.maxInFlightUploads, 16u);
    EXPECT_EQ(config.uploadRetries, 3);
    EXPECT_EQ(config.defaultChunkSize, 4u * 1024 * 1024);
    EXPECT_TRUE(config.probeBeforeUpload);
}

TEST(BridgeConfigTest, ReadsAllKeys) {
    const std::string path = writeFile("bridge_config.json", R"({
        "worker_threads": 8,
        "max_in_flight_uploads": 4,
        "upload_retries": 5,
        "reconnect_attempts": 1,
        "retry_delay_ms": 10,
        "index_batch_size": 64,
        "default_chunk_size": 1048576,
        "log_level": "debug",
        "verify_tls": false,
        "probe_before_upload": false
    })");

    BridgeConfig config = BridgeConfig::loadFromFile(path);
    EXPECT_EQ(config.workerThreads, 8u);
    EXPECT_EQ(config.maxInFlightUploads, 4u);
    EXPECT_EQ(config.uploadRetries, 5);
    EXPECT_EQ(config.reconnectAttempts, 1);
    EXPECT_EQ(config.retryDelay(), std::chrono::milliseconds(10));
    EXPECT_EQ(config.indexBatchSize, 64u);
    EXPECT_EQ(config.defaultChunkSize, 1048576u);
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_FALSE(config.verifyTls);
    EXPECT_FALSE(config.probeBeforeUpload);

    BridgeConfig copy = BridgeConfig::fromJson(config.toJson());
    EXPECT_EQ(copy.toJson(), config.toJson());
}

TEST(BridgeConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(BridgeConfig::fromJson({{"max_in_flight_uploads", 0}}), BridgeError);
    EXPECT_THROW(BridgeConfig::fromJson({{"upload_retries", -1}}), BridgeError);
    EXPECT_THROW(BridgeConfig::fromJson({{"default_chunk_size", 100000}}), BridgeError);
    EXPECT_THROW(BridgeConfig::fromJson({{"upload_retries", "three"}}), BridgeError);
    EXPECT_THROW(BridgeConfig::loadFromFile(::testing::TempDir() + "does_not_exist.json"), BridgeError);
    EXPECT_THROW(BridgeConfig::loadFromFile(writeFile("broken.json", "{ not json")), BridgeError);
}

TEST(DigestTest, HexConversions) {
    const std::string text = "abc";
    Digest digest = sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    const std::string hex = digestToHex(digest);
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Digest parsed{};
    EXPECT_TRUE(digestFromHex(hex, parsed));
    EXPECT_EQ(parsed, digest);
    EXPECT_FALSE(digestFromHex("abcd", parsed));
    EXPECT_FALSE(digestFromHex(std::string(64, 'x'), parsed));

    std::vector<uint8_t> bytes;
    EXPECT_TRUE(hexToBytes("AB:cd:01", bytes));
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[0], 0xab);
    EXPECT_EQ(bytes[1], 0xcd);
    EXPECT_EQ(bytes[2], 0x01);
    EXPECT_FALSE(hexToBytes("abc", bytes));
}

TEST(DigestTest, IncrementalHashMatchesOneShot) {
    const std::string text = "incremental hashing";
    Sha256 hasher;
    hasher.update(text.data(), 5);
    hasher.update(text.data() + 5, text.size() - 5);
    EXPECT_EQ(hasher.finalize(), sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

TEST(CryptConfigTest, EncryptionRoundTrip) {
    CryptConfig::Key key{};
    key.fill(7);
    CryptConfig crypt(key);

    const std::vector<uint8_t> plain(1000, 0x5a);
    std::vector<uint8_t> payload = crypt.encrypt(plain.data(), plain.size());
    EXPECT_EQ(payload.size(), plain.size() + CryptConfig::IV_SIZE + CryptConfig::TAG_SIZE);
    std::vector<uint8_t> opened;
    ASSERT_TRUE(openPayload(key, payload, opened));
    EXPECT_EQ(opened, plain);

    // fresh IV per chunk
    EXPECT_NE(crypt.encrypt(plain.data(), plain.size()), payload);

    payload.back() ^= 0x01;
    EXPECT_FALSE(openPayload(key, payload, opened));
}

TEST(CryptConfigTest, KeyedDigestDiffersFromPlainDigest) {
    CryptConfig::Key key{};
    key.fill(1);
    CryptConfig crypt(key);
    CryptConfig::Key otherKey{};
    otherKey.fill(2);
    CryptConfig other(otherKey);

    const std::vector<uint8_t> data(64, 0x11);
    EXPECT_NE(crypt.computeDigest(data.data(), data.size()), sha256(data.data(), data.size()));
    EXPECT_NE(crypt.computeDigest(data.data(), data.size()), other.computeDigest(data.data(), data.size()));
    EXPECT_EQ(crypt.computeDigest(data.data(), data.size()), crypt.computeDigest(data.data(), data.size()));

    const std::string fingerprint = crypt.fingerprint();
    EXPECT_EQ(fingerprint.size(), 23u);
    EXPECT_EQ(fingerprint[2], ':');
}

TEST(CryptConfigTest, LoadsPlainKeyFile) {
    const std::string path = writeFile("plain.key",
        R"({"kdf": "none", "key": ")" + std::string(64, 'a') + R"("})");
    auto crypt = CryptConfig::loadKeyFile(path, "");
    ASSERT_NE(crypt, nullptr);

    CryptConfig::Key key{};
    key.fill(0xaa);
    EXPECT_EQ(crypt->fingerprint(), CryptConfig(key).fingerprint());
}

TEST(CryptConfigTest, LoadsPasswordProtectedKeyFile) {
    const std::string path = writeFile("pbkdf2.key",
        R"({"kdf": "pbkdf2", "salt": "0011223344556677", "iterations": 1000})");
    EXPECT_THROW(CryptConfig::loadKeyFile(path, ""), BridgeError);

    auto crypt = CryptConfig::loadKeyFile(path, "passphrase");
    const CryptConfig::Key key = CryptConfig::deriveKey("passphrase", {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77},
                                                         1000);
    EXPECT_EQ(crypt->fingerprint(), CryptConfig(key).fingerprint());
}

TEST(CryptConfigTest, RejectsBrokenKeyFiles) {
    EXPECT_THROW(CryptConfig::loadKeyFile(::testing::TempDir() + "missing.key", ""), BridgeError);
    EXPECT_THROW(CryptConfig::loadKeyFile(writeFile("short.key", R"({"key": "abcd"})"), ""), BridgeError);
    EXPECT_THROW(CryptConfig::loadKeyFile(writeFile("scrypt.key", R"({"kdf": "scrypt"})"), "pw"), BridgeError);
    EXPECT_THROW(CryptConfig::loadKeyFile(writeFile("garbage.key", "garbage"), ""), BridgeError);
}

TEST(HttpBackupTransportTest, ParsesFingerprint) {
    const std::string fingerprint =
        "ba:78:16:bf:8f:01:cf:ea:41:41:40:de:5d:ae:22:23:b0:03:61:a3:96:17:7a:9c:b4:10:ff:61:f2:00:15:ad";
    Digest digest = HttpBackupTransport::parseFingerprint(fingerprint);
    EXPECT_EQ(digestToHex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    EXPECT_THROW(HttpBackupTransport::parseFingerprint("ba:78"), BridgeError);
    EXPECT_THROW(HttpBackupTransport::parseFingerprint("zz"), BridgeError);
}

TEST(HttpBackupTransportTest, PinnedFingerprintIsStrict) {
    PkeyPtr key = generateKey();
    ASSERT_TRUE(key);
    X509Ptr certificate = selfSignedCertificate(key.get(), "pbs.example.com");
    ASSERT_TRUE(certificate);

    // The certificate is trusted, so chain verification alone would pass.
    StorePtr store(X509_STORE_new(), X509_STORE_free);
    ASSERT_EQ(X509_STORE_add_cert(store.get(), certificate.get()), 1);
    StoreContextPtr chain = storeContext(store.get(), certificate.get());
    ASSERT_TRUE(chain);
    ASSERT_EQ(X509_verify_cert(chain.get()), 1);

    Digest pinned{};
    unsigned int length = 0;
    ASSERT_EQ(X509_digest(certificate.get(), EVP_sha256(), pinned.data(), &length), 1);
    ASSERT_EQ(length, pinned.size());

    StoreContextPtr matching = storeContext(store.get(), certificate.get());
    ASSERT_TRUE(matching);
    EXPECT_EQ(HttpBackupTransport::verifyPinnedCertificate(matching.get(), &pinned), 1);

    Digest other = pinned;
    other[0] ^= 0xff;
    StoreContextPtr mismatching = storeContext(store.get(), certificate.get());
    ASSERT_TRUE(mismatching);
    EXPECT_EQ(HttpBackupTransport::verifyPinnedCertificate(mismatching.get(), &other), 0);
    EXPECT_EQ(X509_STORE_CTX_get_error(mismatching.get()), X509_V_ERR_CERT_REJECTED);
}

TEST(HttpBackupTransportTest, CallsBeforeConnectFail) {
    HttpBackupTransport transport;
    EXPECT_FALSE(transport.isConnected());
    Digest digest{};
    try {
        transport.hasChunk(digest);
        FAIL() << "hasChunk without a session must throw";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConnectionError);
    }
}

TEST(ErrorCodeTest, FatalCodes) {
    EXPECT_TRUE(isFatalError(ErrorCode::ConnectionError));
    EXPECT_TRUE(isFatalError(ErrorCode::AuthenticationError));
    EXPECT_TRUE(isFatalError(ErrorCode::UploadError));
    EXPECT_TRUE(isFatalError(ErrorCode::IndexError));
    EXPECT_TRUE(isFatalError(ErrorCode::JobError));
    EXPECT_FALSE(isFatalError(ErrorCode::InvalidArgument));
    EXPECT_FALSE(isFatalError(ErrorCode::InvalidJobState));
    EXPECT_FALSE(isFatalError(ErrorCode::Cancelled));
    EXPECT_FALSE(isFatalError(ErrorCode::RuntimeClosed));
    EXPECT_EQ(jobStatusToString(JobStatus::Finishing), "finishing");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
