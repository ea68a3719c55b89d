#include <gtest/gtest.h>

#include <string>

#include "change_indexer.h"
#include "hash/content_hash.h"
#include "test_support.h"
#include "util/sync_log.h"
#include "util/thread_pool.h"

class ChangeIndexerTest : public ::testing::Test
{
protected:
    SyncConfiguration::Filters filters() const { return SyncConfigStore::defaults().filters(); }

    TestWorkspace mWorkspace;
    SyncLog mLog{SYNC_LOG_CAPACITY, false};
};

TEST_F(ChangeIndexerTest, IndexesEveryUserFileSortedByPath)
{
    mWorkspace.write("/notes/b.md", "bee");
    mWorkspace.write("/notes/a.md", "ay");
    mWorkspace.write("/code/src/main.cpp", "int main() {}");

    ChangeIndexer indexer(mWorkspace.vfs(), &mLog);
    Manifest manifest;
    ASSERT_EQ(indexer.index(filters(), manifest), SYNC_OK);

    ASSERT_EQ(manifest.files_size(), 3);
    EXPECT_EQ(manifest.files(0).path(), "/code/src/main.cpp");
    EXPECT_EQ(manifest.files(1).path(), "/notes/a.md");
    EXPECT_EQ(manifest.files(2).path(), "/notes/b.md");
    EXPECT_EQ(manifest.files(1).hash(), ContentHash::hex("ay"));
    EXPECT_EQ(manifest.files(1).size(), 2u);
    EXPECT_FALSE(manifest.files(1).is_deleted());
    EXPECT_GT(manifest.files(1).mtime(), 0);
    EXPECT_GT(manifest.generated_at(), 0);
    EXPECT_EQ(indexer.count(), 3u);
}

TEST_F(ChangeIndexerTest, SkipsSystemModules)
{
    mWorkspace.write("/notes/a.md", "a");
    mWorkspace.write("/__config/sync_config.json", "{}");
    mWorkspace.write("/agents/agent.json", "{}");

    ChangeIndexer indexer(mWorkspace.vfs(), &mLog);
    Manifest manifest;
    ASSERT_EQ(indexer.index(filters(), manifest), SYNC_OK);
    ASSERT_EQ(manifest.files_size(), 1);
    EXPECT_EQ(manifest.files(0).path(), "/notes/a.md");
}

TEST_F(ChangeIndexerTest, AppliesFilters)
{
    mWorkspace.write("/notes/a.md", "a");
    mWorkspace.write("/notes/scratch.tmp", "t");
    mWorkspace.write("/notes/blob.dat", std::string("x\0y", 3));
    mWorkspace.write("/notes/large.txt", std::string(2048, 'l'));

    auto config = filters();
    config.add_exclude_paths("*.tmp");
    config.set_exclude_binary(true);
    config.set_max_file_size(1024);

    ChangeIndexer indexer(mWorkspace.vfs(), &mLog);
    Manifest manifest;
    ASSERT_EQ(indexer.index(config, manifest), SYNC_OK);
    ASSERT_EQ(manifest.files_size(), 1);
    EXPECT_EQ(manifest.files(0).path(), "/notes/a.md");
}

TEST_F(ChangeIndexerTest, SameContentSameHash)
{
    mWorkspace.write("/notes/a.md", "same");
    mWorkspace.write("/other/b.md", "same");

    ChangeIndexer indexer(mWorkspace.vfs(), &mLog);
    Manifest manifest;
    ASSERT_EQ(indexer.index(filters(), manifest), SYNC_OK);
    ASSERT_EQ(manifest.files_size(), 2);
    EXPECT_EQ(manifest.files(0).hash(), manifest.files(1).hash());
    EXPECT_EQ(manifest.files(0).hash().size(), CONTENT_HASH_HEX_LENGTH);
}

TEST_F(ChangeIndexerTest, PoolGivesSameManifest)
{
    for (int i = 0; i < 20; ++i)
        mWorkspace.write("/notes/file" + std::to_string(i) + ".md", "content " + std::to_string(i));

    ChangeIndexer sequential(mWorkspace.vfs(), &mLog);
    Manifest expected;
    ASSERT_EQ(sequential.index(filters(), expected), SYNC_OK);

    ThreadPool pool(4);
    ChangeIndexer parallel(mWorkspace.vfs(), &mLog, &pool);
    Manifest actual;
    ASSERT_EQ(parallel.index(filters(), actual), SYNC_OK);

    ASSERT_EQ(actual.files_size(), expected.files_size());
    for (int i = 0; i < actual.files_size(); ++i) {
        EXPECT_EQ(actual.files(i).path(), expected.files(i).path());
        EXPECT_EQ(actual.files(i).hash(), expected.files(i).hash());
    }
}

TEST_F(ChangeIndexerTest, DumpsLastManifest)
{
    mWorkspace.write("/notes/a.md", "a");
    ChangeIndexer indexer(mWorkspace.vfs(), &mLog);

    const auto dumpPath = mWorkspace.root() / "index.bin";
    EXPECT_EQ(indexer.dumpIndexToFile(dumpPath), SYNC_ERR_INVALID_STATE);

    Manifest manifest;
    ASSERT_EQ(indexer.index(filters(), manifest), SYNC_OK);
    ASSERT_EQ(indexer.dumpIndexToFile(dumpPath), SYNC_OK);
    EXPECT_TRUE(std::filesystem::exists(dumpPath));

    EXPECT_EQ(indexer.closeDataset(), SYNC_OK);
    EXPECT_FALSE(indexer.lastManifest().has_value());
}
