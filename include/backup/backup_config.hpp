#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include "common/digest.hpp"

class CryptConfig;

// "[[user@]host[:port]:]datastore"
struct BackupRepository {
    std::string user{"root@pam"};
    std::string host{"localhost"};
    uint16_t port{8007};
    std::string datastore;

    // Throws BridgeError(InvalidArgument) on malformed input.
    static BackupRepository parse(const std::string& text);
    std::string toString() const;
};

// Options of one backup job, as handed over by the hypervisor.
struct BackupOptions {
    BackupRepository repository;
    std::string backupId;
    int64_t backupTime{0};          // seconds since epoch
    uint64_t chunkSize{0};          // 0 = BridgeConfig::defaultChunkSize
    std::string password;
    std::string keyfile;
    std::string keyPassword;
    std::string fingerprint;        // server certificate fingerprint "aa:bb:..."
    bool verifyTls{true};
    // Digests known to be on the server from an earlier job.
    std::vector<Digest> knownChunks;
    std::shared_ptr<CryptConfig> crypt;

    // Throws BridgeError(InvalidArgument).
    void validate() const;
};

// Everything the transport needs to open a backup session.
struct ServerParams {
    BackupRepository repository;
    std::string password;
    std::string fingerprint;
    bool verifyTls{true};
    std::string backupType{"vm"};
    std::string backupId;
    int64_t backupTime{0};
};
