#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/data_catalogue.hpp"
#include "storage/snapshot_store.hpp"
#include "test_helpers.hpp"
#include "transfer/http_transport.hpp"
#include "transfer/transport.hpp"
#include "worker/data_manager.hpp"
#include "worker_config.hpp"

namespace {

using namespace chunkworker;
using chunkworker::test::TempDir;
using chunkworker::test::chunkFor;
using chunkworker::test::datasetOf;

namespace fs = std::filesystem;

/**
 * Transport double. Writes each file's url as its content, or fails / blocks
 * on request.
 */
class ScriptedTransport : public transfer::Transport
{
public:
    std::atomic<bool> failFetch{false};
    std::atomic<bool> failRemove{false};
    std::atomic<bool> blockFetch{false};
    std::atomic<int> fetchCalls{0};
    std::atomic<int> removeCalls{0};
    std::function<void()> afterFetch; ///< Runs once the files are written

    void fetch(const core::DataChunk &chunk, const std::string &chunkDir,
               const transfer::CancellationToken &token) override
    {
        ++fetchCalls;
        fs::create_directories(chunkDir);
        test::writeFile(fs::path(chunkDir) / "partial.part", "half");

        if (blockFetch) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_entered = true;
            m_cv.notify_all();
            while (!m_released && !token.isCancelled()) {
                m_cv.wait_for(lock, std::chrono::milliseconds(5));
            }
        }
        token.throwIfCancelled("fetch");
        if (failFetch) {
            throw transfer::TransportError("scripted fetch failure");
        }

        fs::remove(fs::path(chunkDir) / "partial.part");
        for (const auto &file : chunk.files) {
            test::writeFile(fs::path(chunkDir) / file.first, file.second);
        }
        if (afterFetch) {
            afterFetch();
        }
    }

    void remove(const core::ChunkId &, const std::string &chunkDir,
                const transfer::CancellationToken &token) override
    {
        ++removeCalls;
        token.throwIfCancelled("remove");
        if (failRemove) {
            throw transfer::TransportError("scripted remove failure");
        }
        fs::remove_all(chunkDir);
    }

    void waitUntilBlocked()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void release()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered = false;
    bool m_released = false;
};

class DataManagerTest : public ::testing::Test
{
protected:
    DataManagerTest()
        : m_dir("data_manager"), m_transport(std::make_shared<ScriptedTransport>())
    {
        m_config.dataDirectory = (m_dir.path() / "data").string();
        m_config.transferThreads = 2;
    }

    std::unique_ptr<worker::DataManager> makeManager()
    {
        return std::make_unique<worker::DataManager>(m_config, m_transport);
    }

    TempDir m_dir;
    config::WorkerConfig m_config;
    std::shared_ptr<ScriptedTransport> m_transport;
};

TEST_F(DataManagerTest, DownloadMakesChunkFindable) {
    auto manager = makeManager();
    const core::DatasetId ds = datasetOf(0x11);
    const core::DataChunk chunk = chunkFor(ds, 0, 35, {{"blocks.parquet", "payload"}});

    auto signal = manager->downloadChunk(chunk);
    const core::TransferOutcome &outcome = signal->wait();
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.chunkId, chunk.id);

    EXPECT_EQ(manager->listChunks().count(chunk.id), 1u);
    auto found = manager->findChunk(ds, 12);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->chunk, chunk);
    EXPECT_EQ(found->path, manager->dataSource().chunkPath(chunk));
    EXPECT_EQ(test::readFile(fs::path(found->path) / "blocks.parquet"), "payload");
    EXPECT_FALSE(manager->findChunk(ds, 35).has_value());
}

TEST_F(DataManagerTest, DuplicateDownloadIsRejected) {
    auto manager = makeManager();
    const core::DataChunk chunk = chunkFor(datasetOf(0x11), 0, 35);

    ASSERT_TRUE(manager->downloadChunk(chunk)->wait().success);
    auto again = manager->downloadChunk(chunk);
    ASSERT_TRUE(again->isComplete());
    EXPECT_FALSE(again->wait().success);
    EXPECT_EQ(again->wait().message, "rejected");
    EXPECT_EQ(m_transport->fetchCalls.load(), 1);
}

TEST_F(DataManagerTest, MismatchedChunkIdIsRefused) {
    auto manager = makeManager();
    core::DataChunk chunk = chunkFor(datasetOf(0x11), 0, 35);
    chunk.blockRange.end = 36;
    EXPECT_THROW(manager->downloadChunk(chunk), std::invalid_argument);
    EXPECT_EQ(manager->catalogue().size(), 0u);
}

TEST_F(DataManagerTest, FailedDownloadLeavesNothingBehind) {
    m_transport->failFetch = true;
    auto manager = makeManager();
    const core::DataChunk chunk = chunkFor(datasetOf(0x22), 100, 200, {{"a", "x"}});

    const core::TransferOutcome outcome = manager->downloadChunk(chunk)->wait();
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.message.find("scripted fetch failure"), std::string::npos);

    EXPECT_FALSE(manager->catalogue().chunkState(chunk.id).has_value());
    EXPECT_FALSE(fs::exists(manager->dataSource().chunkPath(chunk)));

    // A failed download can be retried
    m_transport->failFetch = false;
    EXPECT_TRUE(manager->downloadChunk(chunk)->wait().success);
}

TEST_F(DataManagerTest, DeleteRemovesChunk) {
    auto manager = makeManager();
    const core::DatasetId ds = datasetOf(0x33);
    const core::DataChunk chunk = chunkFor(ds, 0, 10, {{"a", "x"}});
    ASSERT_TRUE(manager->downloadChunk(chunk)->wait().success);

    auto signal = manager->deleteChunk(chunk.id);
    EXPECT_TRUE(signal->wait().success);
    EXPECT_FALSE(manager->catalogue().chunkState(chunk.id).has_value());
    EXPECT_FALSE(manager->findChunk(ds, 5).has_value());
    EXPECT_FALSE(fs::exists(manager->dataSource().chunkPath(chunk)));
}

TEST_F(DataManagerTest, DeleteOfUnknownOrBusyChunkIsRejected) {
    auto manager = makeManager();
    const core::DataChunk chunk = chunkFor(datasetOf(0x44), 0, 10);

    EXPECT_EQ(manager->deleteChunk(chunk.id)->wait().message, "rejected");

    m_transport->blockFetch = true;
    auto download = manager->downloadChunk(chunk);
    m_transport->waitUntilBlocked();
    EXPECT_EQ(manager->deleteChunk(chunk.id)->wait().message, "rejected");
    EXPECT_EQ(manager->catalogue().chunkState(chunk.id), core::ChunkState::Downloading);

    m_transport->release();
    EXPECT_TRUE(download->wait().success);
    EXPECT_EQ(m_transport->removeCalls.load(), 0);
}

TEST_F(DataManagerTest, FailedDeletionDropsEntry) {
    auto manager = makeManager();
    const core::DataChunk chunk = chunkFor(datasetOf(0x55), 0, 10);
    ASSERT_TRUE(manager->downloadChunk(chunk)->wait().success);

    m_transport->failRemove = true;
    const core::TransferOutcome outcome = manager->deleteChunk(chunk.id)->wait();
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(manager->catalogue().chunkState(chunk.id).has_value());
    EXPECT_TRUE(manager->listChunks().empty());
}

TEST_F(DataManagerTest, ShutdownCancelsInFlightDownload) {
    m_transport->blockFetch = true;
    auto manager = makeManager();
    const core::DataChunk chunk = chunkFor(datasetOf(0x66), 0, 10);

    auto signal = manager->downloadChunk(chunk);
    m_transport->waitUntilBlocked();
    manager->shutdown();

    ASSERT_TRUE(signal->isComplete());
    EXPECT_FALSE(signal->wait().success);
    EXPECT_NE(signal->wait().message.find("cancelled"), std::string::npos);
    EXPECT_FALSE(manager->catalogue().chunkState(chunk.id).has_value());

    EXPECT_EQ(manager->downloadChunk(chunkFor(datasetOf(0x66), 10, 20))->wait().message, "rejected");
    manager->shutdown();
}

TEST_F(DataManagerTest, RestartKeepsReadyChunksAndAdoptsDisk) {
    const core::DatasetId ds = datasetOf(0x77);
    const core::DataChunk downloaded = chunkFor(ds, 0, 35, {{"blocks.parquet", "one"}});
    {
        auto manager = makeManager();
        ASSERT_TRUE(manager->downloadChunk(downloaded)->wait().success);
    }

    // A chunk copied into the layout while the worker was down
    storage::LocalDataSource layout(m_config.dataDirectory);
    test::writeFile(fs::path(layout.chunkPath(ds, core::BlockRange(36, 94))) / "blocks.parquet", "two");

    auto manager = makeManager();
    EXPECT_EQ(manager->listChunks().size(), 2u);
    EXPECT_EQ(manager->findChunk(ds, 12)->chunk, downloaded);
    auto adopted = manager->findChunk(ds, 45);
    ASSERT_TRUE(adopted.has_value());
    EXPECT_EQ(adopted->chunk.id, core::deriveChunkId(ds, core::BlockRange(36, 94)));
}

TEST_F(DataManagerTest, RestartClearsInterruptedTransfers) {
    const core::DatasetId ds = datasetOf(0x79);
    const core::DataChunk downloading = chunkFor(ds, 0, 10, {{"a", "fresh"}});
    const core::DataChunk deleting = chunkFor(ds, 10, 20, {{"b", "x"}});
    storage::LocalDataSource layout(m_config.dataDirectory);

    // A previous process died in the middle of both transfers
    {
        core::DataCatalogue crashed(m_config.resolvedSnapshotPath());
        ASSERT_TRUE(crashed.startDownload(downloading));
        crashed.updateChunk(deleting, core::ChunkState::Ready);
        ASSERT_TRUE(crashed.startDeletion(deleting));
    }
    test::writeFile(fs::path(layout.chunkPath(downloading)) / "a", "trunc");
    test::writeFile(fs::path(layout.chunkPath(deleting)) / "b", "x");

    auto manager = makeManager();
    EXPECT_EQ(manager->catalogue().size(), 0u);
    EXPECT_TRUE(manager->listChunks().empty());
    EXPECT_FALSE(fs::exists(layout.chunkPath(downloading)));
    EXPECT_FALSE(fs::exists(layout.chunkPath(deleting)));

    ASSERT_TRUE(manager->downloadChunk(downloading)->wait().success);
    auto found = manager->findChunk(ds, 5);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(test::readFile(fs::path(found->path) / "a"), "fresh");
    EXPECT_EQ(manager->deleteChunk(deleting.id)->wait().message, "rejected");
}

TEST_F(DataManagerTest, UnrecordableDownloadKeepsPayloadAndCanBeRetried) {
    auto manager = makeManager();
    const core::DatasetId ds = datasetOf(0x7a);
    const core::DataChunk chunk = chunkFor(ds, 0, 35, {{"blocks.parquet", "payload"}});
    const std::string blocker = m_config.resolvedSnapshotPath() + ".tmp";

    // Snapshot writes start failing right after the files land
    m_transport->afterFetch = [blocker] { test::writeFile(fs::path(blocker) / "occupied", "x"); };
    const core::TransferOutcome outcome = manager->downloadChunk(chunk)->wait();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "snapshot write failed");
    EXPECT_FALSE(manager->catalogue().chunkState(chunk.id).has_value());
    EXPECT_EQ(test::readFile(fs::path(manager->dataSource().chunkPath(chunk)) / "blocks.parquet"),
              "payload");

    m_transport->afterFetch = nullptr;
    fs::remove_all(blocker);

    ASSERT_TRUE(manager->downloadChunk(chunk)->wait().success);
    EXPECT_EQ(manager->catalogue().chunkState(chunk.id), core::ChunkState::Ready);
    EXPECT_TRUE(manager->findChunk(ds, 12).has_value());

    bool persistedReady = false;
    for (const auto &entry : storage::SnapshotStore(m_config.resolvedSnapshotPath()).load()) {
        persistedReady |= (entry.chunk.id == chunk.id && entry.state == core::ChunkState::Ready);
    }
    EXPECT_TRUE(persistedReady);
}

TEST_F(DataManagerTest, ParallelDownloadsAllComplete) {
    auto manager = makeManager();
    const core::DatasetId ds = datasetOf(0x88);
    std::vector<std::shared_ptr<core::CompletionSignal>> signals;
    for (uint64_t i = 0; i < 10; ++i) {
        signals.push_back(manager->downloadChunk(chunkFor(ds, i * 100, i * 100 + 100, {{"f", "x"}})));
    }
    for (auto &signal : signals) {
        EXPECT_TRUE(signal->wait().success);
    }
    EXPECT_EQ(manager->listChunks().size(), 10u);
    EXPECT_EQ(storage::SnapshotStore(m_config.resolvedSnapshotPath()).load().size(), 10u);
}

TEST(HttpTransportTest, FetchesFileUrlsAndRemovesChunk) {
    TempDir dir("http_transport");
    test::writeFile(dir.path() / "remote" / "blocks.bin", "block bytes");
    test::writeFile(dir.path() / "remote" / "logs.bin", "log bytes");

    config::WorkerConfig cfg;
    cfg.dataDirectory = (dir.path() / "data").string();
    cfg.transferThreads = 1;
    worker::DataManager manager(cfg, std::make_shared<transfer::HttpTransport>(30));

    const core::DatasetId ds = datasetOf(0x99);
    const core::DataChunk chunk = chunkFor(ds, 5, 9, {
        {"blocks.parquet", test::fileUrl(dir.path() / "remote" / "blocks.bin")},
        {"logs.parquet", test::fileUrl(dir.path() / "remote" / "logs.bin")}});

    ASSERT_TRUE(manager.downloadChunk(chunk)->wait().success);
    const std::string chunkDir = manager.dataSource().chunkPath(chunk);
    EXPECT_EQ(test::readFile(fs::path(chunkDir) / "blocks.parquet"), "block bytes");
    EXPECT_EQ(test::readFile(fs::path(chunkDir) / "logs.parquet"), "log bytes");
    EXPECT_FALSE(fs::exists(fs::path(chunkDir) / "blocks.parquet.part"));

    ASSERT_TRUE(manager.deleteChunk(chunk.id)->wait().success);
    EXPECT_FALSE(fs::exists(chunkDir));
    EXPECT_FALSE(fs::exists(dir.path() / "data" / storage::LocalDataSource::datasetDirName(ds)));
}

TEST(HttpTransportTest, MissingSourceFailsDownload) {
    TempDir dir("http_transport_missing");
    config::WorkerConfig cfg;
    cfg.dataDirectory = (dir.path() / "data").string();
    cfg.transferThreads = 1;
    worker::DataManager manager(cfg, std::make_shared<transfer::HttpTransport>(30));

    const core::DataChunk chunk = chunkFor(datasetOf(0x9a), 0, 1, {
        {"blocks.parquet", test::fileUrl(dir.path() / "does_not_exist.bin")}});

    EXPECT_FALSE(manager.downloadChunk(chunk)->wait().success);
    EXPECT_FALSE(manager.catalogue().chunkState(chunk.id).has_value());
    EXPECT_FALSE(fs::exists(manager.dataSource().chunkPath(chunk)));
}

TEST(HttpTransportTest, RefusesPathLikeFileNames) {
    TempDir dir("http_transport_names");
    test::writeFile(dir.path() / "remote.bin", "x");
    transfer::HttpTransport transport(30);
    transfer::CancellationToken token;

    const core::DataChunk chunk = chunkFor(datasetOf(0x9b), 0, 1, {
        {"../escape", test::fileUrl(dir.path() / "remote.bin")}});
    EXPECT_THROW(transport.fetch(chunk, (dir.path() / "chunk").string(), token), transfer::TransportError);
    EXPECT_FALSE(fs::exists(dir.path() / "escape"));
}

TEST(HttpTransportTest, CancelledTokenStopsFetch) {
    TempDir dir("http_transport_cancel");
    test::writeFile(dir.path() / "remote.bin", "x");
    transfer::HttpTransport transport(30);
    transfer::CancellationToken token;
    token.cancel();

    const core::DataChunk chunk = chunkFor(datasetOf(0x9c), 0, 1, {
        {"blocks.parquet", test::fileUrl(dir.path() / "remote.bin")}});
    EXPECT_THROW(transport.fetch(chunk, (dir.path() / "chunk").string(), token), transfer::TransportError);
    EXPECT_FALSE(fs::exists(dir.path() / "chunk" / "blocks.parquet"));
}

} // namespace
