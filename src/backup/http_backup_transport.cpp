#include "backup/http_backup_transport.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace {

std::once_flag curlInitFlag;

std::string urlEncode(const std::string& str) {
    char* encoded = curl_easy_escape(nullptr, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        throw BridgeError(ErrorCode::InvalidArgument, "Failed to URL encode " + str);
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* headers) const { curl_slist_free_all(headers); }
};

bool isTransientStatus(long status) {
    return status >= 500 || status == 408 || status == 429;
}

} // namespace

HttpBackupTransport::HttpBackupTransport() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });

    share_ = curl_share_init();
    if (!share_) {
        throw BridgeError(ErrorCode::InitializationError, "Failed to initialize CURL share handle");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lockShare);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlockShare);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

HttpBackupTransport::~HttpBackupTransport() {
    if (share_) {
        curl_share_cleanup(share_);
    }
}

void HttpBackupTransport::lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<HttpBackupTransport*>(userptr)->shareLocks_[data].lock();
}

void HttpBackupTransport::unlockShare(CURL*, curl_lock_data data, void* userptr) {
    static_cast<HttpBackupTransport*>(userptr)->shareLocks_[data].unlock();
}

int HttpBackupTransport::verifyPinnedCertificate(X509_STORE_CTX* storeContext, void* arg) {
    const Digest* expected = static_cast<const Digest*>(arg);
    X509* certificate = X509_STORE_CTX_get0_cert(storeContext);
    if (certificate) {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdLength = 0;
        if (X509_digest(certificate, EVP_sha256(), md, &mdLength) == 1 &&
            mdLength == expected->size() &&
            std::memcmp(md, expected->data(), mdLength) == 0) {
            return 1;
        }
    }
    Logger::error("Server certificate does not match the configured fingerprint");
    X509_STORE_CTX_set_error(storeContext, X509_V_ERR_CERT_REJECTED);
    return 0;
}

CURLcode HttpBackupTransport::sslContextCallback(CURL*, void* sslContext, void* userptr) {
    auto* self = static_cast<HttpBackupTransport*>(userptr);
    SSL_CTX_set_cert_verify_callback(static_cast<SSL_CTX*>(sslContext), verifyPinnedCertificate,
                                     &self->fingerprint_);
    return CURLE_OK;
}

size_t HttpBackupTransport::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

Digest HttpBackupTransport::parseFingerprint(const std::string& fingerprint) {
    std::vector<uint8_t> bytes;
    Digest digest{};
    if (!hexToBytes(fingerprint, bytes) || bytes.size() != digest.size()) {
        throw BridgeError(ErrorCode::InvalidArgument, "Invalid certificate fingerprint: " + fingerprint);
    }
    std::copy(bytes.begin(), bytes.end(), digest.begin());
    return digest;
}

std::string HttpBackupTransport::buildUrl(const std::string& endpoint) const {
    const auto& repo = params_.repository;
    return "https://" + repo.host + ":" + std::to_string(repo.port) + endpoint;
}

std::string HttpBackupTransport::sessionEndpoint(const std::string& suffix) const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    if (sessionId_.empty()) {
        throw BridgeError(ErrorCode::ConnectionError, "No backup session");
    }
    return "/api2/json/backup/" + urlEncode(sessionId_) + suffix;
}

HttpBackupTransport::Response HttpBackupTransport::makeRequest(const std::string& method,
                                                              const std::string& endpoint,
                                                              const std::string& contentType,
                                                              const std::string& body,
                                                              CallClass callClass) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw BridgeError(ErrorCode::ConnectionError, "Failed to initialize CURL");
    }

    std::string url;
    std::string ticket;
    std::string csrfToken;
    bool verifyTls;
    bool pinned;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        url = buildUrl(endpoint);
        ticket = ticket_;
        csrfToken = csrfToken_;
        verifyTls = params_.verifyTls;
        pinned = pinned_;
    }
    Logger::debug("Making " + method + " request to: " + url);

    curl_slist* rawHeaders = nullptr;
    rawHeaders = curl_slist_append(rawHeaders, "Accept: application/json");
    if (!contentType.empty()) {
        rawHeaders = curl_slist_append(rawHeaders, ("Content-Type: " + contentType).c_str());
    }
    if (!ticket.empty()) {
        rawHeaders = curl_slist_append(rawHeaders, ("Cookie: PBSAuthCookie=" + ticket).c_str());
        rawHeaders = curl_slist_append(rawHeaders, ("CSRFPreventionToken: " + csrfToken).c_str());
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(rawHeaders);

    CURL* handle = curl.get();
    Response response;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPIDLE, 60L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPINTVL, 30L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);

    if (pinned) {
        // the pinned fingerprint replaces chain and host name checks
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_CTX_FUNCTION, sslContextCallback);
        curl_easy_setopt(handle, CURLOPT_SSL_CTX_DATA, this);
    } else if (!verifyTls) {
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    if (method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        throw BridgeError(ErrorCode::ConnectionError,
                          method + " " + endpoint + " failed: " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    Logger::debug("Response code: " + std::to_string(response.status));

    if (method != "HEAD") {
        checkStatus(method + " " + endpoint, response, callClass);
    }
    return response;
}

nlohmann::json HttpBackupTransport::makeJsonRequest(const std::string& method, const std::string& endpoint,
                                                    const nlohmann::json& data, CallClass callClass) {
    const std::string body = data.is_null() ? std::string() : data.dump();
    Response response = makeRequest(method, endpoint, body.empty() ? "" : "application/json", body, callClass);
    if (response.body.empty()) {
        return nlohmann::json();
    }
    try {
        nlohmann::json parsed = nlohmann::json::parse(response.body);
        return parsed.contains("data") ? parsed["data"] : parsed;
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(callClass == CallClass::Index ? ErrorCode::IndexError : ErrorCode::JobError,
                          "Failed to parse response of " + endpoint + ": " + e.what());
    }
}

void HttpBackupTransport::checkStatus(const std::string& what, const Response& response, CallClass callClass) const {
    const long status = response.status;
    if (status >= 200 && status < 300) {
        return;
    }

    std::string message = what + " returned HTTP " + std::to_string(status);
    try {
        nlohmann::json parsed = nlohmann::json::parse(response.body);
        if (parsed.contains("message")) {
            message += ": " + parsed["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        if (!response.body.empty()) {
            message += ": " + response.body.substr(0, 256);
        }
    }

    if (status == 401 || status == 403) {
        throw BridgeError(ErrorCode::AuthenticationError, message);
    }

    switch (callClass) {
        case CallClass::Session:
            throw BridgeError(status >= 500 ? ErrorCode::ConnectionError : ErrorCode::JobError, message);
        case CallClass::Chunk:
            throw BridgeError(ErrorCode::UploadError, message);
        case CallClass::Index:
            throw BridgeError(isTransientStatus(status) ? ErrorCode::UploadError : ErrorCode::IndexError, message);
        case CallClass::Finish:
            throw BridgeError(isTransientStatus(status) ? ErrorCode::UploadError : ErrorCode::JobError, message);
    }
    throw BridgeError(ErrorCode::JobError, message);
}

void HttpBackupTransport::login() {
    std::string body;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        body = "username=" + urlEncode(params_.repository.user) + "&password=" + urlEncode(params_.password);
        ticket_.clear();
        csrfToken_.clear();
    }

    Response response = makeRequest("POST", "/api2/json/access/ticket",
                                    "application/x-www-form-urlencoded", body, CallClass::Session);
    try {
        nlohmann::json data = nlohmann::json::parse(response.body).at("data");
        std::lock_guard<std::mutex> lock(sessionMutex_);
        ticket_ = data.at("ticket").get<std::string>();
        csrfToken_ = data.value("CSRFPreventionToken", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorCode::AuthenticationError, std::string("Invalid login response: ") + e.what());
    }
}

bool HttpBackupTransport::connect(const ServerParams& params) {
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        params_ = params;
        pinned_ = !params.fingerprint.empty();
        if (pinned_) {
            fingerprint_ = parseFingerprint(params.fingerprint);
        }
        sessionId_.clear();
        connected_ = false;
    }
    if (!params.verifyTls && !pinned_) {
        Logger::warning("TLS certificate verification is disabled for " + params.repository.host);
    }

    login();

    nlohmann::json request = {
        {"store", params.repository.datastore},
        {"backup-type", params.backupType},
        {"backup-id", params.backupId},
        {"backup-time", params.backupTime}
    };
    nlohmann::json data = makeJsonRequest("POST", "/api2/json/backup", request, CallClass::Session);

    std::lock_guard<std::mutex> lock(sessionMutex_);
    try {
        sessionId_ = data.at("session").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorCode::JobError, std::string("Invalid backup session response: ") + e.what());
    }
    connected_ = true;
    return data.value("previous", false);
}

void HttpBackupTransport::reconnect() {
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        if (sessionId_.empty()) {
            throw BridgeError(ErrorCode::ConnectionError, "Cannot resume: no backup session");
        }
        connected_ = false;
    }

    login();
    // the session must still exist on the server, otherwise the job is lost
    makeJsonRequest("GET", sessionEndpoint(""), nlohmann::json(), CallClass::Session);

    std::lock_guard<std::mutex> lock(sessionMutex_);
    connected_ = true;
}

void HttpBackupTransport::disconnect() {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    connected_ = false;
    sessionId_.clear();
    ticket_.clear();
    csrfToken_.clear();
}

bool HttpBackupTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return connected_;
}

bool HttpBackupTransport::hasChunk(const Digest& digest) {
    const std::string endpoint = sessionEndpoint("/chunk/" + digestToHex(digest));
    Response response = makeRequest("HEAD", endpoint, "", "", CallClass::Chunk);
    if (response.status == 404) {
        return false;
    }
    checkStatus("HEAD " + endpoint, response, CallClass::Chunk);
    return true;
}

void HttpBackupTransport::uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                                      uint64_t rawSize, bool encrypted) {
    const std::string endpoint = sessionEndpoint("/chunk/" + digestToHex(digest) +
                                                 "?size=" + std::to_string(rawSize) +
                                                 "&encrypted=" + (encrypted ? "1" : "0"));
    makeRequest("PUT", endpoint, "application/octet-stream",
                std::string(payload.begin(), payload.end()), CallClass::Chunk);
}

std::string HttpBackupTransport::createIndex(const std::string& archive, IndexKind kind,
                                             uint64_t size, uint64_t chunkSize) {
    nlohmann::json request = {
        {"archive-name", archive},
        {"type", indexKindToString(kind)},
        {"size", size}
    };
    if (kind == IndexKind::Fixed) {
        request["chunk-size"] = chunkSize;
    }
    nlohmann::json data = makeJsonRequest("POST", sessionEndpoint("/index"), request, CallClass::Index);
    try {
        return data.at("wid").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorCode::IndexError, "Invalid index response for " + archive + ": " + e.what());
    }
}

void HttpBackupTransport::appendIndex(const std::string& writerId, const std::vector<IndexEntry>& entries) {
    nlohmann::json offsets = nlohmann::json::array();
    nlohmann::json sizes = nlohmann::json::array();
    nlohmann::json digests = nlohmann::json::array();
    for (const auto& entry : entries) {
        offsets.push_back(entry.offset);
        sizes.push_back(entry.size);
        digests.push_back(digestToHex(entry.digest));
    }
    nlohmann::json request = {
        {"offset-list", offsets},
        {"size-list", sizes},
        {"digest-list", digests}
    };
    makeJsonRequest("PUT", sessionEndpoint("/index/" + urlEncode(writerId)), request, CallClass::Index);
}

void HttpBackupTransport::closeIndex(const std::string& writerId, uint64_t chunkCount,
                                     uint64_t size, const Digest& checksum) {
    nlohmann::json request = {
        {"chunk-count", chunkCount},
        {"size", size},
        {"csum", digestToHex(checksum)}
    };
    makeJsonRequest("POST", sessionEndpoint("/index/" + urlEncode(writerId) + "/close"), request, CallClass::Index);
}

std::vector<Digest> HttpBackupTransport::knownChunks(const std::string& archive) {
    nlohmann::json data = makeJsonRequest("GET", sessionEndpoint("/previous/" + urlEncode(archive)),
                                          nlohmann::json(), CallClass::Chunk);
    std::vector<Digest> digests;
    if (!data.is_array()) {
        return digests;
    }
    digests.reserve(data.size());
    for (const auto& item : data) {
        Digest digest;
        if (!item.is_string() || !digestFromHex(item.get<std::string>(), digest)) {
            throw BridgeError(ErrorCode::UploadError, "Invalid digest in previous index of " + archive);
        }
        digests.push_back(digest);
    }
    return digests;
}

void HttpBackupTransport::uploadBlob(const std::string& name, const std::vector<uint8_t>& data) {
    makeRequest("POST", sessionEndpoint("/blob/" + urlEncode(name)), "application/octet-stream",
                std::string(data.begin(), data.end()), CallClass::Chunk);
}

void HttpBackupTransport::finish() {
    makeJsonRequest("POST", sessionEndpoint("/finish"), nlohmann::json(), CallClass::Finish);
    std::lock_guard<std::mutex> lock(sessionMutex_);
    connected_ = false;
}

void HttpBackupTransport::abort(const std::string& reason) {
    makeRequest("DELETE", sessionEndpoint("?reason=" + urlEncode(reason)), "", "", CallClass::Session);
    std::lock_guard<std::mutex> lock(sessionMutex_);
    connected_ = false;
}
