#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <openssl/x509.h>
#include <nlohmann/json.hpp>
#include "backup/backup_transport.hpp"

// HTTP/JSON backup session on top of libcurl.
//
// Every request uses its own easy handle; connections, DNS and TLS
// sessions are shared through a CURLSH so that concurrent uploads reuse
// them. Session layout:
//   POST   /api2/json/access/ticket                         login
//   POST   /api2/json/backup                                start session
//   GET    /api2/json/backup/<sid>                          resume check
//   HEAD   /api2/json/backup/<sid>/chunk/<digest>           probe
//   PUT    /api2/json/backup/<sid>/chunk/<digest>           upload
//   POST   /api2/json/backup/<sid>/index                    create index
//   PUT    /api2/json/backup/<sid>/index/<wid>              append entries
//   POST   /api2/json/backup/<sid>/index/<wid>/close        close index
//   GET    /api2/json/backup/<sid>/previous/<archive>       previous index
//   POST   /api2/json/backup/<sid>/blob/<name>              blob
//   POST   /api2/json/backup/<sid>/finish                   finish
//   DELETE /api2/json/backup/<sid>                          abort
class HttpBackupTransport : public BackupTransport {
public:
    HttpBackupTransport();
    ~HttpBackupTransport() override;

    HttpBackupTransport(const HttpBackupTransport&) = delete;
    HttpBackupTransport& operator=(const HttpBackupTransport&) = delete;

    bool connect(const ServerParams& params) override;
    void reconnect() override;
    void disconnect() override;
    bool isConnected() const override;

    bool hasChunk(const Digest& digest) override;
    void uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                     uint64_t rawSize, bool encrypted) override;

    std::string createIndex(const std::string& archive, IndexKind kind,
                            uint64_t size, uint64_t chunkSize) override;
    void appendIndex(const std::string& writerId, const std::vector<IndexEntry>& entries) override;
    void closeIndex(const std::string& writerId, uint64_t chunkCount,
                    uint64_t size, const Digest& checksum) override;

    std::vector<Digest> knownChunks(const std::string& archive) override;

    void uploadBlob(const std::string& name, const std::vector<uint8_t>& data) override;
    void finish() override;
    void abort(const std::string& reason) override;

    // Parses a "aa:bb:..." SHA-256 certificate fingerprint.
    // Throws BridgeError(InvalidArgument).
    static Digest parseFingerprint(const std::string& fingerprint);

    // Certificate verification of pinned connections: accepts the server
    // certificate only when its SHA-256 digest equals *arg (a Digest).
    static int verifyPinnedCertificate(X509_STORE_CTX* storeContext, void* arg);

private:
    // Which error code an HTTP failure of a call maps to.
    enum class CallClass {
        Session,
        Chunk,
        Index,
        Finish
    };

    struct Response {
        long status{0};
        std::string body;
    };

    Response makeRequest(const std::string& method, const std::string& endpoint,
                         const std::string& contentType, const std::string& body,
                         CallClass callClass);
    nlohmann::json makeJsonRequest(const std::string& method, const std::string& endpoint,
                                   const nlohmann::json& data, CallClass callClass);
    void login();
    std::string sessionEndpoint(const std::string& suffix) const;
    std::string buildUrl(const std::string& endpoint) const;
    void checkStatus(const std::string& what, const Response& response, CallClass callClass) const;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static void lockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlockShare(CURL* handle, curl_lock_data data, void* userptr);
    static CURLcode sslContextCallback(CURL* handle, void* sslContext, void* userptr);

    CURLSH* share_;
    std::mutex shareLocks_[CURL_LOCK_DATA_LAST];

    mutable std::mutex sessionMutex_;
    ServerParams params_;
    bool pinned_{false};
    Digest fingerprint_{};
    std::string ticket_;
    std::string csrfToken_;
    std::string sessionId_;
    bool connected_{false};
};
