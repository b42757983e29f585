#include "backup/backup_config.hpp"
#include "common/backup_status.hpp"
#include <regex>

BackupRepository BackupRepository::parse(const std::string& text) {
    // user may contain '@' realms ("backup@pbs"), host may be a bracketed IPv6 address
    static const std::regex repoRegex(
        R"(^(?:(?:([\w.\-]+(?:@[\w.\-]+)?)@)?(\[[0-9a-fA-F:.]+\]|[\w.\-]+)(?::(\d{1,5}))?:)?([\w.\-]+)$)");

    std::smatch matches;
    if (!std::regex_match(text, matches, repoRegex)) {
        throw BridgeError(ErrorCode::InvalidArgument, "Invalid repository string: " + text);
    }

    BackupRepository repo;
    if (matches[1].matched) {
        repo.user = matches[1];
    }
    if (matches[2].matched) {
        repo.host = matches[2];
    }
    if (matches[3].matched) {
        const unsigned long port = std::stoul(matches[3].str());
        if (port == 0 || port > 65535) {
            throw BridgeError(ErrorCode::InvalidArgument, "Invalid port in repository: " + text);
        }
        repo.port = static_cast<uint16_t>(port);
    }
    repo.datastore = matches[4];
    return repo;
}

std::string BackupRepository::toString() const {
    return user + "@" + host + ":" + std::to_string(port) + ":" + datastore;
}

void BackupOptions::validate() const {
    if (repository.datastore.empty()) {
        throw BridgeError(ErrorCode::InvalidArgument, "datastore must not be empty");
    }
    if (backupId.empty()) {
        throw BridgeError(ErrorCode::InvalidArgument, "backup_id must not be empty");
    }
    if (backupTime < 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "backup_time must not be negative");
    }
    if (chunkSize != 0 && (chunkSize & (chunkSize - 1)) != 0) {
        throw BridgeError(ErrorCode::InvalidArgument, "chunk_size must be a power of two");
    }
    if (chunkSize != 0 && chunkSize < 64 * 1024) {
        throw BridgeError(ErrorCode::InvalidArgument, "chunk_size must be at least 64KiB");
    }
}
