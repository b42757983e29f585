#include <gtest/gtest.h>
#include "backup/backup_job.hpp"
#include "common/crypt_config.hpp"
#include "mock_backup_transport.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <memory>
#include <random>
#include <thread>
#include <utility>
#include <vector>

namespace {

const uint64_t CHUNK = 64 * 1024;

std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(seed + i * 31 + (i >> 8));
    }
    return data;
}

std::vector<uint8_t> randomData(size_t size, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

} // namespace

class BackupJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_ = std::make_shared<RuntimeHost>(2);
        transport_ = std::make_shared<MockBackupTransport>();

        config_.retryDelayMs = 0;
        config_.uploadRetries = 2;
        config_.reconnectAttempts = 2;
        config_.indexBatchSize = 1;

        options_.repository = BackupRepository::parse("backup@pbs@pbs.example.com:store1");
        options_.backupId = "100";
        options_.backupTime = 1700000000;
        options_.chunkSize = CHUNK;
        options_.password = "secret";
    }

    void TearDown() override {
        host_->shutdown(std::chrono::milliseconds(1000));
    }

    std::unique_ptr<BackupJob> makeJob() {
        return std::make_unique<BackupJob>(options_, config_, transport_, host_);
    }

    std::unique_ptr<BackupJob> connectedJob() {
        auto job = makeJob();
        EXPECT_TRUE(job->connect().ok());
        return job;
    }

    std::shared_ptr<RuntimeHost> host_;
    std::shared_ptr<MockBackupTransport> transport_;
    BridgeConfig config_;
    BackupOptions options_;
};

TEST_F(BackupJobTest, RejectsInvalidOptions) {
    options_.backupId.clear();
    EXPECT_THROW(makeJob(), BridgeError);

    options_.backupId = "100";
    options_.chunkSize = 3000;
    EXPECT_THROW(makeJob(), BridgeError);
}

TEST_F(BackupJobTest, ConnectReportsPreviousBackup) {
    transport_->setPreviousBackup(true);
    auto job = makeJob();
    EXPECT_EQ(job->getState(), JobStatus::Created);

    OperationResult result = job->connect();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, 1u);
    EXPECT_TRUE(job->hasPreviousBackup());
    EXPECT_EQ(transport_->getParams().backupId, "100");
    EXPECT_EQ(transport_->getParams().repository.host, "pbs.example.com");

    EXPECT_EQ(job->connect().code, ErrorCode::InvalidJobState);
}

TEST_F(BackupJobTest, RegisterRequiresConnection) {
    auto job = makeJob();
    OperationResult result = job->registerImage("drive-scsi0", 4 * CHUNK, IndexKind::Fixed, false);
    EXPECT_EQ(result.code, ErrorCode::InvalidJobState);
    EXPECT_FALSE(job->isAborted());
}

TEST_F(BackupJobTest, RegisterAssignsDeviceIds) {
    auto job = connectedJob();
    OperationResult first = job->registerImage("drive-scsi0", 4 * CHUNK, IndexKind::Fixed, false);
    OperationResult second = job->registerImage("drive-scsi1", 4 * CHUNK, IndexKind::Dynamic, false);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value, 0u);
    EXPECT_EQ(second.value, 1u);
    EXPECT_EQ(job->getState(), JobStatus::Active);

    EXPECT_EQ(job->getImageStrand(0), nullptr);
    EXPECT_NE(job->getImageStrand(1), nullptr);

    EXPECT_EQ(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, false).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->registerImage("", CHUNK, IndexKind::Fixed, false).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->registerImage("empty", 0, IndexKind::Fixed, false).code, ErrorCode::InvalidArgument);

    MockBackupTransport::IndexRecord record;
    ASSERT_TRUE(transport_->findIndex("drive-scsi1.img.didx", record));
    EXPECT_EQ(record.kind, IndexKind::Dynamic);
}

TEST_F(BackupJobTest, RepeatedBlocksUploadOnce) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 4 * CHUNK, IndexKind::Fixed, false).value);

    const std::vector<uint8_t> same = pattern(CHUNK, 1);
    const std::vector<uint8_t> other = pattern(CHUNK, 2);
    EXPECT_EQ(job->writeData(dev, same.data(), 0, CHUNK).value, CHUNK);
    EXPECT_EQ(job->writeData(dev, same.data(), CHUNK, CHUNK).value, CHUNK);
    EXPECT_EQ(job->writeData(dev, other.data(), 2 * CHUNK, CHUNK).value, CHUNK);
    EXPECT_EQ(job->writeData(dev, nullptr, 3 * CHUNK, CHUNK).value, CHUNK);

    EXPECT_EQ(transport_->getUploadCount(sha256(same.data(), same.size())), 1);
    EXPECT_EQ(transport_->getTotalUploads(), 3);

    BackupCounters counters = job->getCounters();
    EXPECT_EQ(counters.chunksTotal, 4u);
    EXPECT_EQ(counters.chunksUploaded, 3u);
    EXPECT_EQ(counters.chunksReused, 1u);
    EXPECT_EQ(counters.bytesWritten, 4 * CHUNK);
}

TEST_F(BackupJobTest, ZeroBlocksShareOneChunk) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 3 * CHUNK, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> zeros(CHUNK, 0);

    ASSERT_TRUE(job->writeData(dev, nullptr, 0, CHUNK).ok());
    ASSERT_TRUE(job->writeData(dev, zeros.data(), CHUNK, CHUNK).ok());
    ASSERT_TRUE(job->writeData(dev, nullptr, 2 * CHUNK, CHUNK).ok());

    EXPECT_EQ(transport_->getTotalUploads(), 1);
    EXPECT_EQ(transport_->getUploadCount(sha256(zeros.data(), zeros.size())), 1);
}

TEST_F(BackupJobTest, OutOfOrderWritesRegisterAscending) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 4 * CHUNK, IndexKind::Fixed, false).value);

    for (uint64_t block : {3u, 1u, 0u, 2u}) {
        const std::vector<uint8_t> data = pattern(CHUNK, static_cast<uint8_t>(block + 10));
        ASSERT_TRUE(job->writeData(dev, data.data(), block * CHUNK, CHUNK).ok());
    }
    ASSERT_TRUE(job->closeImage(dev).ok());

    MockBackupTransport::IndexRecord record;
    ASSERT_TRUE(transport_->findIndex("drive-scsi0.img.fidx", record));
    ASSERT_EQ(record.entries.size(), 4u);
    for (size_t i = 0; i < record.entries.size(); ++i) {
        EXPECT_EQ(record.entries[i].offset, i * CHUNK);
        EXPECT_EQ(record.entries[i].size, CHUNK);
    }
    EXPECT_TRUE(record.closed);
    EXPECT_EQ(record.chunkCount, 4u);
    EXPECT_EQ(record.closedSize, 4 * CHUNK);
}

TEST_F(BackupJobTest, UnwrittenBlocksAreStoredAsZero) {
    auto job = connectedJob();
    const uint64_t size = 2 * CHUNK + CHUNK / 2;
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", size, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 21);
    ASSERT_TRUE(job->writeData(dev, data.data(), CHUNK, CHUNK).ok());
    ASSERT_TRUE(job->closeImage(dev).ok());

    const std::vector<uint8_t> zeros(CHUNK, 0);
    MockBackupTransport::IndexRecord record;
    ASSERT_TRUE(transport_->findIndex("drive-scsi0.img.fidx", record));
    ASSERT_EQ(record.entries.size(), 3u);
    EXPECT_EQ(record.entries[0].offset, 0u);
    EXPECT_EQ(record.entries[0].size, CHUNK);
    EXPECT_EQ(record.entries[0].digest, sha256(zeros.data(), CHUNK));
    EXPECT_EQ(record.entries[1].offset, CHUNK);
    EXPECT_EQ(record.entries[1].digest, sha256(data.data(), data.size()));
    EXPECT_EQ(record.entries[2].offset, 2 * CHUNK);
    EXPECT_EQ(record.entries[2].size, CHUNK / 2);
    EXPECT_EQ(record.entries[2].digest, sha256(zeros.data(), CHUNK / 2));
    EXPECT_EQ(record.chunkCount, 3u);
    EXPECT_EQ(record.closedSize, size);
    EXPECT_EQ(job->getCounters().bytesWritten, CHUNK);
}

TEST_F(BackupJobTest, IncrementalCloseKeepsOnlyWrittenBlocks) {
    transport_->setPreviousBackup(true);
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 3 * CHUNK, IndexKind::Fixed, true).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 22);
    ASSERT_TRUE(job->writeData(dev, data.data(), CHUNK, CHUNK).ok());
    ASSERT_TRUE(job->closeImage(dev).ok());

    MockBackupTransport::IndexRecord record;
    ASSERT_TRUE(transport_->findIndex("drive-scsi0.img.fidx", record));
    ASSERT_EQ(record.entries.size(), 1u);
    EXPECT_EQ(record.entries[0].offset, CHUNK);
    EXPECT_EQ(record.chunkCount, 1u);
    EXPECT_TRUE(record.closed);
    EXPECT_EQ(transport_->getTotalUploads(), 1);
}

TEST_F(BackupJobTest, ConcurrentImagesKeepIndexOrder) {
    config_.indexBatchSize = 3;
    auto job = connectedJob();
    const uint64_t blocks = 16;
    const uint8_t first = static_cast<uint8_t>(job->registerImage("drive-scsi0", blocks * CHUNK, IndexKind::Fixed, false).value);
    const uint8_t second = static_cast<uint8_t>(job->registerImage("drive-scsi1", blocks * CHUNK, IndexKind::Fixed, false).value);

    std::vector<std::pair<uint8_t, uint64_t>> work;
    for (uint64_t block = 0; block < blocks; ++block) {
        work.emplace_back(first, block);
        work.emplace_back(second, block);
    }
    std::shuffle(work.begin(), work.end(), std::mt19937(7));

    std::atomic<size_t> next{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i) {
        writers.emplace_back([&]() {
            for (size_t index = next++; index < work.size(); index = next++) {
                const std::vector<uint8_t> data =
                    randomData(CHUNK, static_cast<uint32_t>(work[index].first * 100 + work[index].second));
                if (!job->writeData(work[index].first, data.data(), work[index].second * CHUNK, CHUNK).ok()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(failures.load(), 0);
    ASSERT_TRUE(job->closeImage(first).ok());
    ASSERT_TRUE(job->closeImage(second).ok());

    for (const char* archive : {"drive-scsi0.img.fidx", "drive-scsi1.img.fidx"}) {
        MockBackupTransport::IndexRecord record;
        ASSERT_TRUE(transport_->findIndex(archive, record));
        ASSERT_EQ(record.entries.size(), blocks) << archive;
        for (size_t i = 0; i < record.entries.size(); ++i) {
            EXPECT_EQ(record.entries[i].offset, i * CHUNK) << archive;
            if (i > 0) {
                EXPECT_GT(record.entries[i].offset, record.entries[i - 1].offset) << archive;
            }
        }
        EXPECT_EQ(record.chunkCount, blocks);
    }
}

TEST_F(BackupJobTest, InvalidWritesDoNotAbort) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 3);

    EXPECT_EQ(job->writeData(dev, data.data(), 100, CHUNK).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->writeData(dev, data.data(), 2 * CHUNK, CHUNK).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->writeData(7, data.data(), 0, CHUNK).code, ErrorCode::InvalidArgument);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());
    EXPECT_EQ(job->writeData(dev, data.data(), 0, CHUNK).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->getState(), JobStatus::Active);

    ASSERT_TRUE(job->closeImage(dev).ok());
    EXPECT_EQ(job->writeData(dev, data.data(), CHUNK, CHUNK).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(job->closeImage(dev).code, ErrorCode::InvalidArgument);
}

TEST_F(BackupJobTest, DynamicImageChunksTheStream) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("state", 16 * CHUNK, IndexKind::Dynamic, false).value);

    const std::vector<uint8_t> data = randomData(600000, 11);
    uint64_t offset = 0;
    for (size_t step : {100000u, 50000u, 250000u, 200000u}) {
        ASSERT_TRUE(job->writeData(dev, data.data() + offset, offset, step).ok());
        offset += step;
    }
    EXPECT_EQ(job->writeData(dev, data.data(), 0, 10).code, ErrorCode::InvalidArgument);
    ASSERT_TRUE(job->closeImage(dev).ok());

    MockBackupTransport::IndexRecord record;
    ASSERT_TRUE(transport_->findIndex("state.img.didx", record));
    ASSERT_FALSE(record.entries.empty());
    uint64_t expectedOffset = 0;
    for (const auto& entry : record.entries) {
        EXPECT_EQ(entry.offset, expectedOffset);
        expectedOffset += entry.size;
    }
    EXPECT_EQ(expectedOffset, data.size());
    EXPECT_EQ(record.closedSize, data.size());
}

TEST_F(BackupJobTest, FinishRequiresClosedImages) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, false).value);

    EXPECT_EQ(job->finish().code, ErrorCode::InvalidJobState);
    EXPECT_EQ(job->getState(), JobStatus::Active);

    ASSERT_TRUE(job->closeImage(dev).ok());
    ASSERT_TRUE(job->finish().ok());
    EXPECT_EQ(job->getState(), JobStatus::Finished);
    EXPECT_TRUE(transport_->isFinished());
    EXPECT_FALSE(job->abort("too late"));
    EXPECT_EQ(job->finish().code, ErrorCode::InvalidJobState);
}

TEST_F(BackupJobTest, ManifestListsImagesAndConfigs) {
    auto job = connectedJob();
    ASSERT_TRUE(job->addConfig("qemu-server.conf", {'c', 'o', 'r', 'e', 's'}).ok());
    EXPECT_EQ(job->addConfig("qemu-server.conf", {'x'}).code, ErrorCode::InvalidArgument);

    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 5);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());
    ASSERT_TRUE(job->writeData(dev, data.data(), CHUNK, CHUNK).ok());
    ASSERT_TRUE(job->closeImage(dev).ok());
    ASSERT_TRUE(job->finish().ok());

    std::vector<uint8_t> blob;
    ASSERT_TRUE(transport_->getBlob("qemu-server.conf.blob", blob));
    EXPECT_EQ(std::string(blob.begin(), blob.end()), "cores");

    ASSERT_TRUE(transport_->getBlob(BackupJob::MANIFEST_BLOB_NAME, blob));
    nlohmann::json manifest = nlohmann::json::parse(std::string(blob.begin(), blob.end()));
    EXPECT_EQ(manifest["backup-id"], "100");
    ASSERT_EQ(manifest["files"].size(), 1u);
    EXPECT_EQ(manifest["files"][0]["filename"], "drive-scsi0.img.fidx");
    EXPECT_EQ(manifest["files"][0]["chunk-count"], 2);
    EXPECT_EQ(manifest["configs"][0], "qemu-server.conf.blob");
    EXPECT_EQ(manifest["counters"]["chunks-reused"], 1);
    EXPECT_FALSE(manifest.contains("crypt-fingerprint"));
}

TEST_F(BackupJobTest, TransientFailuresAreRetried) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, false).value);
    transport_->failUploads(config_.uploadRetries);

    const std::vector<uint8_t> data = pattern(CHUNK, 6);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());
    EXPECT_EQ(transport_->getUploadAttempts(), config_.uploadRetries + 1);
    EXPECT_EQ(job->getState(), JobStatus::Active);
}

TEST_F(BackupJobTest, ExhaustedRetriesAbortJob) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, false).value);
    transport_->failUploads(100);

    const std::vector<uint8_t> data = pattern(CHUNK, 7);
    OperationResult result = job->writeData(dev, data.data(), 0, CHUNK);
    EXPECT_EQ(result.code, ErrorCode::UploadError);
    EXPECT_EQ(job->getState(), JobStatus::Aborted);
    const std::string error = job->getLastError();
    EXPECT_FALSE(error.empty());

    EXPECT_EQ(job->writeData(dev, data.data(), CHUNK, CHUNK).code, ErrorCode::InvalidJobState);
    EXPECT_EQ(job->finish().code, ErrorCode::InvalidJobState);
    EXPECT_EQ(job->getLastError(), error);

    host_->waitForAll();
    EXPECT_TRUE(transport_->isAborted());
}

TEST_F(BackupJobTest, ReconnectsMidJob) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, false).value);
    transport_->dropConnections(1);

    const std::vector<uint8_t> data = pattern(CHUNK, 8);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());
    EXPECT_EQ(job->getUploadClient().getReconnectCount(), 1u);
    ASSERT_TRUE(job->writeData(dev, nullptr, CHUNK, CHUNK).ok());
    ASSERT_TRUE(job->closeImage(dev).ok());
    EXPECT_TRUE(job->finish().ok());
}

TEST_F(BackupJobTest, AuthenticationFailureAbortsJob) {
    transport_->rejectAuthentication(true);
    auto job = makeJob();
    EXPECT_EQ(job->connect().code, ErrorCode::AuthenticationError);
    EXPECT_EQ(job->getState(), JobStatus::Aborted);
}

TEST_F(BackupJobTest, AbortStopsTheJob) {
    auto job = connectedJob();
    ASSERT_TRUE(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, false).ok());

    EXPECT_TRUE(job->abort("operator request"));
    EXPECT_EQ(job->getState(), JobStatus::Aborted);
    EXPECT_NE(job->getLastError().find("operator request"), std::string::npos);
    EXPECT_EQ(job->finish().code, ErrorCode::InvalidJobState);
    EXPECT_TRUE(job->abort("again"));

    host_->waitForAll();
    EXPECT_TRUE(transport_->isAborted());
}

TEST_F(BackupJobTest, AbortResolvesPendingOperations) {
    auto job = connectedJob();
    auto operation = std::make_shared<PendingOperation>(PendingOperation::nextToken(), "write", host_);
    job->trackOperation(operation);
    EXPECT_EQ(job->getPendingOperationCount(), 1u);

    job->abort("shutdown");
    OperationResult result;
    ASSERT_TRUE(operation->tryGetResult(result));
    EXPECT_EQ(result.code, ErrorCode::Cancelled);
    EXPECT_TRUE(operation->isCancelRequested());
    EXPECT_EQ(job->getPendingOperationCount(), 0u);
}

TEST_F(BackupJobTest, IncrementalReusesPreviousChunks) {
    const std::vector<uint8_t> unchanged = pattern(CHUNK, 9);
    transport_->setPreviousBackup(true);
    transport_->setPreviousChunks("drive-scsi0.img.fidx", {sha256(unchanged.data(), unchanged.size())});

    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, true).value);
    ASSERT_TRUE(job->writeData(dev, unchanged.data(), 0, CHUNK).ok());

    BackupCounters counters = job->getCounters();
    EXPECT_EQ(counters.chunksReused, 1u);
    EXPECT_EQ(transport_->getTotalUploads(), 0);
    EXPECT_EQ(transport_->getProbeCalls(), 0);
}

TEST_F(BackupJobTest, IncrementalNeedsPreviousFixedBackup) {
    auto job = connectedJob();
    EXPECT_EQ(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, true).code, ErrorCode::InvalidArgument);

    transport_->setPreviousBackup(true);
    auto second = connectedJob();
    EXPECT_EQ(second->registerImage("state", CHUNK, IndexKind::Dynamic, true).code, ErrorCode::InvalidArgument);
}

TEST_F(BackupJobTest, EncryptedJobUploadsEncryptedChunks) {
    CryptConfig::Key key{};
    key.fill(0x42);
    options_.crypt = std::make_shared<CryptConfig>(key);

    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", CHUNK, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 12);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());

    EXPECT_TRUE(transport_->getLastEncrypted());
    EXPECT_EQ(transport_->getLastRawSize(), CHUNK);
    EXPECT_EQ(transport_->getUploadCount(sha256(data.data(), data.size())), 0);
    EXPECT_EQ(transport_->getUploadCount(options_.crypt->computeDigest(data.data(), data.size())), 1);

    ASSERT_TRUE(job->closeImage(dev).ok());
    ASSERT_TRUE(job->finish().ok());
    std::vector<uint8_t> blob;
    ASSERT_TRUE(transport_->getBlob(BackupJob::MANIFEST_BLOB_NAME, blob));
    nlohmann::json manifest = nlohmann::json::parse(std::string(blob.begin(), blob.end()));
    EXPECT_EQ(manifest["crypt-fingerprint"], options_.crypt->fingerprint());
}

TEST_F(BackupJobTest, StatusReportsProgress) {
    auto job = connectedJob();
    const uint8_t dev = static_cast<uint8_t>(job->registerImage("drive-scsi0", 2 * CHUNK, IndexKind::Fixed, false).value);
    const std::vector<uint8_t> data = pattern(CHUNK, 13);
    ASSERT_TRUE(job->writeData(dev, data.data(), 0, CHUNK).ok());

    BackupStatus status = job->getBackupStatus();
    EXPECT_EQ(status.status, JobStatus::Active);
    EXPECT_EQ(status.jobId, job->getId());
    EXPECT_EQ(status.openImages, 1u);
    EXPECT_EQ(status.counters.bytesWritten, CHUNK);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
