#ifndef CHUNKWORKER_WORKER_DATA_MANAGER_HPP
#define CHUNKWORKER_WORKER_DATA_MANAGER_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "core/chunk_identity.hpp"
#include "core/completion_bridge.hpp"
#include "core/data_catalogue.hpp"
#include "storage/local_data_source.hpp"
#include "transfer/transport.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"
#include "worker_config.hpp"

namespace chunkworker {
namespace worker {

/*
  DataManager
  --------------------------------
  Front door of the worker. Accepts download / delete requests, records them
  in the catalogue, and runs the transfer on the background pool. Every
  request returns a CompletionSignal that reports the outcome.

  Download:  startDownload -> fetch -> Ready
             (fetch failure: partial directory removed, entry dropped;
              Ready not persistable after retries: payload kept, entry dropped)
  Delete:    startDeletion -> remove -> Deleted
             (on failure: entry dropped anyway, logged as an error)
  Startup:   directories of transfers interrupted by the previous process
             are removed before any request is accepted.

  A request the catalogue refuses (already known, not Ready, worker shut
  down) gets a signal that is already complete with success=false and
  message "rejected".
*/

class DataManager
{
    static constexpr int READY_SAVE_ATTEMPTS = 3;
    static constexpr std::chrono::milliseconds READY_SAVE_BACKOFF{50};

public:
    /**
     * @throw storage::SnapshotError if the catalogue snapshot cannot be read or written.
     * @throw std::invalid_argument if transport is null.
     */
    DataManager(const config::WorkerConfig &config, std::shared_ptr<transfer::Transport> transport)
        : m_transport(std::move(transport)),
          m_dataSource(config.dataDirectory),
          m_catalogue(config.resolvedSnapshotPath(), checkedDiscovery(m_transport, m_dataSource)),
          m_isShutdown(false),
          m_pool(config.transferThreads)
    {
        for (const auto &chunk : m_catalogue.interruptedChunks()) {
            removeChunkDirectory(m_dataSource.chunkPath(chunk));
        }
        util::logger::info("[DataManager] Serving " + std::to_string(m_catalogue.size()) +
                           " chunks from " + m_dataSource.dataDir() + " with " +
                           std::to_string(config.transferThreads) + " transfer threads");
    }

    DataManager(const DataManager&) = delete;
    DataManager& operator=(const DataManager&) = delete;

    ~DataManager()
    {
        shutdown();
    }

    /**
     * @brief Start downloading a chunk in the background.
     * @throw std::invalid_argument if the chunk id does not match its dataset and range.
     * @throw storage::SnapshotError if the catalogue cannot persist the request.
     */
    std::shared_ptr<core::CompletionSignal> downloadChunk(const core::DataChunk &chunk)
    {
        using namespace chunkworker::util::logger;

        if (chunk.blockRange.empty() ||
            core::deriveChunkId(chunk.datasetId, chunk.blockRange) != chunk.id) {
            throw std::invalid_argument("downloadChunk: id of " + core::shortId(chunk.id) +
                                        " does not match " + chunk.blockRange.toString());
        }

        std::lock_guard<std::mutex> lock(m_submitMutex);
        if (m_isShutdown || !m_catalogue.startDownload(chunk)) {
            debug("[DataManager] download of " + core::shortId(chunk.id) + " rejected");
            return core::CompletionSignal::completed(chunk.id, false, "rejected");
        }

        auto signal = std::make_shared<core::CompletionSignal>(chunk.id);
        m_pool.submit([this, chunk, signal] { runDownload(chunk, signal); });
        return signal;
    }

    /**
     * @brief Start deleting a Ready chunk in the background.
     * @throw storage::SnapshotError if the catalogue cannot persist the request.
     */
    std::shared_ptr<core::CompletionSignal> deleteChunk(const core::ChunkId &chunkId)
    {
        std::lock_guard<std::mutex> lock(m_submitMutex);
        auto chunk = m_catalogue.getChunkById(chunkId);
        if (m_isShutdown || !chunk || !m_catalogue.startDeletion(*chunk)) {
            util::logger::debug("[DataManager] deletion of " + core::shortId(chunkId) + " rejected");
            return core::CompletionSignal::completed(chunkId, false, "rejected");
        }

        auto signal = std::make_shared<core::CompletionSignal>(chunkId);
        core::DataChunk target = *chunk;
        m_pool.submit([this, target, signal] { runDeletion(target, signal); });
        return signal;
    }

    /// Ids of the chunks currently served.
    core::ChunkIdSet listChunks() const
    {
        return m_catalogue.listReady();
    }

    /// The Ready chunk covering the block, with its directory.
    std::optional<storage::ChunkRef> findChunk(const core::DatasetId &datasetId, uint64_t blockNumber) const
    {
        auto chunk = m_catalogue.findChunk(datasetId, blockNumber);
        if (!chunk) {
            return std::nullopt;
        }
        return m_dataSource.makeRef(*chunk);
    }

    // -------------------------------------------------------------------------
    // Cancel in-flight transfers, let queued ones fail fast, join the pool.
    // Safe to call more than once.
    // -------------------------------------------------------------------------
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(m_submitMutex);
            if (m_isShutdown) {
                return;
            }
            m_isShutdown = true;
        }
        util::logger::info("[DataManager] Shutting down, cancelling transfers");
        m_token.cancel();
        m_pool.shutdown();
    }

    const core::DataCatalogue& catalogue() const { return m_catalogue; }

    const storage::LocalDataSource& dataSource() const { return m_dataSource; }

private:
    static std::vector<core::DataChunk> checkedDiscovery(const std::shared_ptr<transfer::Transport> &transport,
                                                         const storage::LocalDataSource &source)
    {
        if (!transport) {
            throw std::invalid_argument("DataManager: transport must not be null");
        }
        return source.discoverLocalChunks();
    }

    void runDownload(const core::DataChunk &chunk, const std::shared_ptr<core::CompletionSignal> &signal)
    {
        using namespace chunkworker::util::logger;

        const std::string chunkDir = m_dataSource.chunkPath(chunk);
        try {
            m_transport->fetch(chunk, chunkDir, m_token);
        } catch (const std::exception &ex) {
            warn("[DataManager] download of " + core::shortId(chunk.id) + " failed: " + ex.what());
            removeChunkDirectory(chunkDir);
            m_catalogue.dropChunk(chunk);
            signal->complete(false, ex.what());
            return;
        }

        if (persistReady(chunk)) {
            info("[DataManager] " + core::shortId(chunk.id) + " downloaded into " + chunkDir);
            signal->complete(true, "downloaded");
            return;
        }

        // The payload is complete. It stays on disk for a later request to reuse.
        error("[DataManager] " + core::shortId(chunk.id) + " downloaded but could not be recorded as Ready");
        m_catalogue.dropChunk(chunk);
        signal->complete(false, "snapshot write failed");
    }

    bool persistReady(const core::DataChunk &chunk)
    {
        for (int attempt = 1; ; ++attempt) {
            try {
                m_catalogue.updateChunk(chunk, core::ChunkState::Ready);
                return true;
            } catch (const storage::SnapshotError &ex) {
                if (attempt >= READY_SAVE_ATTEMPTS || m_token.isCancelled()) {
                    return false;
                }
                util::logger::warn("[DataManager] recording " + core::shortId(chunk.id) +
                                   " as Ready failed (attempt " + std::to_string(attempt) + "): " +
                                   ex.what());
            }
            std::this_thread::sleep_for(READY_SAVE_BACKOFF * attempt);
        }
    }

    static void removeChunkDirectory(const std::string &chunkDir)
    {
        std::error_code ec;
        std::filesystem::remove_all(chunkDir, ec);
        if (ec) {
            util::logger::error("[DataManager] cannot clean up " + chunkDir + ": " + ec.message());
        }
    }

    void runDeletion(const core::DataChunk &chunk, const std::shared_ptr<core::CompletionSignal> &signal)
    {
        using namespace chunkworker::util::logger;

        const std::string chunkDir = m_dataSource.chunkPath(chunk);
        try {
            m_transport->remove(chunk.id, chunkDir, m_token);
        } catch (const std::exception &ex) {
            error("[DataManager] deletion of " + core::shortId(chunk.id) + " failed, dropping it: " +
                  ex.what());
            m_catalogue.dropChunk(chunk);
            signal->complete(false, ex.what());
            return;
        }

        if (m_catalogue.dropChunk(chunk)) {
            signal->complete(true, "deleted");
        } else {
            signal->complete(false, "snapshot write failed");
        }
    }

    std::shared_ptr<transfer::Transport> m_transport;
    storage::LocalDataSource m_dataSource;
    core::DataCatalogue m_catalogue;

    std::mutex m_submitMutex;
    bool m_isShutdown;
    transfer::CancellationToken m_token;
    util::ThreadPool m_pool;
};

} // namespace worker
} // namespace chunkworker

#endif // CHUNKWORKER_WORKER_DATA_MANAGER_HPP
