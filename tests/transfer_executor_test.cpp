#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "compression.h"
#include "hash/content_hash.h"
#include "test_support.h"
#include "transfer_executor.h"
#include "util/sync_log.h"

namespace
{
    ManifestEntry entryFor(const std::string &path, const std::string &content, int64_t mtime = 1000)
    {
        ManifestEntry entry;
        entry.set_path(path);
        entry.set_hash(ContentHash::hex(content));
        entry.set_mtime(mtime);
        entry.set_size(content.size());
        return entry;
    }

    std::string noisy(size_t size)
    {
        std::string out;
        out.reserve(size);
        uint32_t state = 12345;
        while (out.size() < size) {
            state = state * 1103515245 + 12345;
            out += static_cast<char>((state >> 16) & 0xff);
        }
        return out;
    }
}

class TransferExecutorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mConfig = SyncConfigStore::defaults();
        mExecutor.setSleeper([this](std::chrono::milliseconds delay) { mSleeps.push_back(delay); });
    }

    TestWorkspace mWorkspace;
    SyncLog mLog{SYNC_LOG_CAPACITY, false};
    TransferExecutor mExecutor{mWorkspace.vfs(), mLog};
    FakeRemotePeer mPeer;
    SyncConfiguration mConfig;
    std::vector<std::chrono::milliseconds> mSleeps;
};

TEST_F(TransferExecutorTest, SmallFileIsOnePlainPart)
{
    mConfig.mutable_compression()->set_min_size(1024);
    const auto parts = TransferExecutor::buildParts(entryFor("/notes/a.md", "short"), "short", mConfig);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].content, "short");
    EXPECT_TRUE(parts[0].encoding.empty());
    EXPECT_EQ(parts[0].chunkCount, 1u);
}

TEST_F(TransferExecutorTest, CompressibleFileIsGzipped)
{
    const std::string content(8192, 'a');
    const auto parts = TransferExecutor::buildParts(entryFor("/notes/a.md", content), content, mConfig);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].encoding, "gzip");
    EXPECT_TRUE(Compression::looksGzipped(parts[0].content));
    EXPECT_EQ(parts[0].size, content.size());
    EXPECT_EQ(parts[0].hash, ContentHash::hex(content));
}

TEST_F(TransferExecutorTest, IncompressibleFileIsSentRaw)
{
    const std::string content = noisy(4096);
    const auto parts = TransferExecutor::buildParts(entryFor("/notes/a.bin", content), content, mConfig);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(parts[0].encoding.empty());
    EXPECT_EQ(parts[0].content, content);
}

TEST_F(TransferExecutorTest, LargeFileIsChunked)
{
    mConfig.mutable_compression()->set_enabled(false);
    mConfig.mutable_chunking()->set_threshold(1000);
    mConfig.mutable_chunking()->set_chunk_size(400);
    const std::string content = noisy(1000);

    const auto parts = TransferExecutor::buildParts(entryFor("/notes/big.bin", content), content, mConfig);
    ASSERT_EQ(parts.size(), 3u);
    std::string joined;
    for (uint32_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].chunkIndex, i);
        EXPECT_EQ(parts[i].chunkCount, 3u);
        joined += parts[i].content;
    }
    EXPECT_EQ(parts[2].content.size(), 200u);
    EXPECT_EQ(joined, content);
}

TEST_F(TransferExecutorTest, RetryDelayDoubles)
{
    mConfig.mutable_retry()->set_retry_delay_ms(250);
    EXPECT_EQ(TransferExecutor::retryDelay(mConfig, 1).count(), 250);
    EXPECT_EQ(TransferExecutor::retryDelay(mConfig, 2).count(), 500);
    EXPECT_EQ(TransferExecutor::retryDelay(mConfig, 3).count(), 1000);
}

TEST_F(TransferExecutorTest, UploadsChunkedFileToPeer)
{
    mConfig.mutable_chunking()->set_threshold(1000);
    mConfig.mutable_chunking()->set_chunk_size(512);
    const std::string content = noisy(3000);
    mWorkspace.write("/notes/big.bin", content);

    TransferCommands commands;
    commands.emplace_back(TransferCommand::KIND_UPLOAD, entryFor("/notes/big.bin", content));
    const auto report = mExecutor.execute(commands, mPeer, mConfig);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_GT(mPeer.parts.size(), 1u);
    EXPECT_EQ(mPeer.content("/notes/big.bin"), content);
}

TEST_F(TransferExecutorTest, DownloadWritesAndRemovalDeletes)
{
    mPeer.put("/notes/new.md", "from remote");
    mWorkspace.write("/notes/old.md", "stale");

    ManifestEntry tombstone;
    tombstone.set_path("/notes/old.md");
    tombstone.set_is_deleted(true);

    TransferCommands commands;
    commands.emplace_back(TransferCommand::KIND_DOWNLOAD, entryFor("/notes/new.md", "from remote"));
    commands.emplace_back(TransferCommand::KIND_REMOVE, tombstone);
    const auto report = mExecutor.execute(commands, mPeer, mConfig);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(mWorkspace.read("/notes/new.md"), "from remote");
    EXPECT_FALSE(mWorkspace.exists("/notes/old.md"));
}

TEST_F(TransferExecutorTest, HashMismatchIsRejected)
{
    mConfig.mutable_retry()->set_max_retries(0);
    mPeer.put("/notes/a.md", "tampered");

    uint64_t bytes = 0;
    const SyncError err = mExecutor.downloadFile(entryFor("/notes/a.md", "expected"), mPeer, mConfig, bytes);
    EXPECT_EQ(err.code, SYNC_ERR_PROTOCOL);
    EXPECT_FALSE(mWorkspace.exists("/notes/a.md"));
}

TEST_F(TransferExecutorTest, FailingFileIsRetriedThenSkipped)
{
    mConfig.mutable_retry()->set_max_retries(3);
    mConfig.mutable_retry()->set_retry_delay_ms(100);

    TransferCommands commands;
    for (int i = 1; i <= 5; ++i) {
        const std::string path = "/notes/file" + std::to_string(i) + ".md";
        const std::string content = "content " + std::to_string(i);
        mWorkspace.write(path, content);
        commands.emplace_back(TransferCommand::KIND_UPLOAD, entryFor(path, content));
    }
    mPeer.failUploadsOf("/notes/file3.md");

    const auto report = mExecutor.execute(commands, mPeer, mConfig);
    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.succeeded, 4u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failedPaths.size(), 1u);
    EXPECT_EQ(report.failedPaths[0], "/notes/file3.md");
    EXPECT_EQ(report.firstError.code, SYNC_ERR_NETWORK);

    ASSERT_EQ(mSleeps.size(), 3u);
    EXPECT_EQ(mSleeps[0].count(), 100);
    EXPECT_EQ(mSleeps[1].count(), 200);
    EXPECT_EQ(mSleeps[2].count(), 400);

    EXPECT_TRUE(mPeer.has("/notes/file1.md"));
    EXPECT_TRUE(mPeer.has("/notes/file5.md"));
    EXPECT_FALSE(mPeer.has("/notes/file3.md"));
}

TEST_F(TransferExecutorTest, AuthFailureAbortsRemainingTransfers)
{
    mWorkspace.write("/notes/a.md", "a");
    mWorkspace.write("/notes/b.md", "b");
    mPeer.setToken("expired");
    mPeer.setRejectCredentials(true);

    TransferCommands commands;
    commands.emplace_back(TransferCommand::KIND_UPLOAD, entryFor("/notes/a.md", "a"));
    commands.emplace_back(TransferCommand::KIND_UPLOAD, entryFor("/notes/b.md", "b"));
    const auto report = mExecutor.execute(commands, mPeer, mConfig);

    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.firstError.code, SYNC_ERR_AUTH);
    EXPECT_EQ(mPeer.uploadRequests.load(), 1);
    EXPECT_TRUE(mSleeps.empty());
}

TEST_F(TransferExecutorTest, ReportsProgressPerFile)
{
    mWorkspace.write("/notes/a.md", "a");
    mPeer.put("/notes/b.md", "b");

    std::vector<SyncProgress> seen;
    mExecutor.setProgressCallback([&](const SyncProgress &progress) { seen.push_back(progress); });

    TransferCommands commands;
    commands.emplace_back(TransferCommand::KIND_UPLOAD, entryFor("/notes/a.md", "a"));
    commands.emplace_back(TransferCommand::KIND_DOWNLOAD, entryFor("/notes/b.md", "b"));
    mExecutor.execute(commands, mPeer, mConfig);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].phase, SyncPhase::UPLOADING);
    EXPECT_EQ(seen[0].currentFile, "/notes/a.md");
    EXPECT_EQ(seen[1].phase, SyncPhase::DOWNLOADING);
    EXPECT_EQ(seen[2].phase, SyncPhase::APPLYING);
    EXPECT_EQ(seen[2].current, 2u);
}

TEST_F(TransferExecutorTest, CommandsSortUploadsFirst)
{
    ManifestEntry tombstone;
    tombstone.set_path("/notes/c.md");
    tombstone.set_is_deleted(true);

    SyncPlan plan;
    plan.downloads.push_back(tombstone);
    plan.downloads.push_back(entryFor("/notes/b.md", "b"));
    plan.uploads.push_back(entryFor("/notes/a.md", "a"));

    TransferCommands commands = TransferCommands::fromPlan(plan);
    commands.sortCommands();
    ASSERT_EQ(commands.size(), 3u);
    auto it = commands.begin();
    EXPECT_EQ((it++)->kind(), TransferCommand::KIND_UPLOAD);
    EXPECT_EQ((it++)->kind(), TransferCommand::KIND_DOWNLOAD);
    EXPECT_EQ(it->kind(), TransferCommand::KIND_REMOVE);
    EXPECT_EQ(commands.countOf(TransferCommand::KIND_REMOVE), 1u);
}
