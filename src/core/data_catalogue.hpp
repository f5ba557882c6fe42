#ifndef CHUNKWORKER_CORE_DATA_CATALOGUE_HPP
#define CHUNKWORKER_CORE_DATA_CATALOGUE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/chunk_registry.hpp"
#include "core/data_chunk.hpp"
#include "storage/snapshot_store.hpp"
#include "util/logger.hpp"

/**
 * @file data_catalogue.hpp
 * @brief Chunk registry plus its durable snapshot.
 *
 * Every state change is written to the snapshot before the call returns.
 * Mutation and save are serialized by one persistence mutex, so snapshots are
 * written in the same order as the transitions they record. When a save
 * fails the in-memory change is undone and the SnapshotError propagates.
 *
 * Startup merge (snapshot vs. chunks found on disk): only Ready rows are
 * reloaded. A Downloading or Deleting row belongs to a transfer that died with
 * the previous process; it is dropped and reported by interruptedChunks() so
 * the owner can clear its directory, and a local copy of it is not adopted.
 * A local chunk unknown to the snapshot is registered as Ready.
 *
 * dropChunk() is the one mutation that does not roll back: a transfer that
 * has ended must leave the registry even when the disk is refusing writes.
 * The stale row it may leave behind is non-terminal and is dropped at the
 * next start.
 */

namespace chunkworker {
namespace core {

class DataCatalogue
{
public:
    /**
     * @param snapshotPath Location of the catalogue snapshot.
     * @param localChunks Chunks found in the data directory at startup.
     * @throw storage::SnapshotError if the snapshot cannot be read or written.
     */
    explicit DataCatalogue(const std::string &snapshotPath,
                           const std::vector<DataChunk> &localChunks = {})
        : snapshot_(snapshotPath)
    {
        std::lock_guard<std::mutex> lock(persistMutex_);

        const std::vector<ChunkStateEntry> persisted = snapshot_.load();
        ChunkIdSet interruptedIds;
        for (const auto &entry : persisted) {
            switch (entry.state) {
            case ChunkState::Ready:
                registry_.setState(entry.chunk, ChunkState::Ready);
                break;
            case ChunkState::Downloading:
            case ChunkState::Deleting:
                util::logger::warn("[DataCatalogue] " + shortId(entry.chunk.id) +
                                   " was interrupted while " + chunkStateName(entry.state) +
                                   ", dropping it");
                interrupted_.push_back(entry.chunk);
                interruptedIds.insert(entry.chunk.id);
                break;
            case ChunkState::Deleted:
                break;
            }
        }

        size_t adopted = 0;
        for (const auto &chunk : localChunks) {
            if (registry_.getState(chunk.id) || interruptedIds.count(chunk.id) > 0) {
                continue;
            }
            registry_.setState(chunk, ChunkState::Ready);
            ++adopted;
        }

        snapshot_.save(registry_.entries());
        util::logger::info("[DataCatalogue] " + std::to_string(persisted.size()) +
                           " chunks from snapshot, " + std::to_string(interrupted_.size()) +
                           " interrupted, " + std::to_string(adopted) +
                           " adopted from disk, " + std::to_string(registry_.size()) + " total");
    }

    DataCatalogue(const DataCatalogue&) = delete;
    DataCatalogue& operator=(const DataCatalogue&) = delete;

    /**
     * @brief Register the chunk as Downloading unless it is already known.
     * @return false when the chunk is downloading, ready or being deleted.
     * @throw storage::SnapshotError if persisting fails (nothing is registered then).
     */
    bool startDownload(const DataChunk &chunk)
    {
        std::lock_guard<std::mutex> lock(persistMutex_);
        if (!registry_.startDownload(chunk)) {
            return false;
        }
        persistOrRollback(chunk.id, std::nullopt);
        util::logger::info("[DataCatalogue] " + shortId(chunk.id) + " Downloading " +
                           chunk.blockRange.toString());
        return true;
    }

    /**
     * @brief Ready -> Deleting.
     * @return false when the chunk is absent or not Ready.
     * @throw storage::SnapshotError if persisting fails (the chunk stays Ready then).
     */
    bool startDeletion(const DataChunk &chunk)
    {
        std::lock_guard<std::mutex> lock(persistMutex_);
        auto previous = currentEntry(chunk.id);
        if (!registry_.startDeletion(chunk.id)) {
            return false;
        }
        persistOrRollback(chunk.id, previous);
        util::logger::info("[DataCatalogue] " + shortId(chunk.id) + " Deleting");
        return true;
    }

    /**
     * @brief Idempotent direct set, used by transfer completion. Deleted removes the entry.
     * @throw storage::SnapshotError if persisting fails (the previous state is restored).
     */
    void updateChunk(const DataChunk &chunk, ChunkState state)
    {
        std::lock_guard<std::mutex> lock(persistMutex_);
        auto previous = registry_.setState(chunk, state);
        persistOrRollback(chunk.id, previous);
        util::logger::info("[DataCatalogue] " + shortId(chunk.id) + " " +
                           (previous ? chunkStateName(previous->state) : "absent") + " -> " +
                           chunkStateName(state));
    }

    /**
     * @brief Remove the chunk from the registry, then try to persist.
     *
     * The entry is gone from memory even if the save fails.
     * @return false if the snapshot could not be written (already logged).
     */
    bool dropChunk(const DataChunk &chunk)
    {
        std::lock_guard<std::mutex> lock(persistMutex_);
        auto previous = registry_.setState(chunk, ChunkState::Deleted);
        try {
            snapshot_.save(registry_.entries());
        } catch (const storage::SnapshotError &ex) {
            util::logger::error("[DataCatalogue] " + shortId(chunk.id) +
                                " dropped, but the snapshot write failed: " + ex.what());
            return false;
        }
        util::logger::info("[DataCatalogue] " + shortId(chunk.id) + " " +
                           (previous ? chunkStateName(previous->state) : "absent") + " -> dropped");
        return true;
    }

    /**
     * @brief Chunks whose transfer was cut short by the previous process.
     *
     * They are not in the registry; their directories may hold partial data.
     */
    const std::vector<DataChunk>& interruptedChunks() const
    {
        return interrupted_;
    }

    std::optional<DataChunk> getChunkById(const ChunkId &id) const
    {
        return registry_.getById(id);
    }

    /**
     * @brief The Ready chunk of the dataset covering the block, if any.
     */
    std::optional<DataChunk> findChunk(const DatasetId &datasetId, uint64_t blockNumber) const
    {
        return registry_.findByBlock(datasetId, blockNumber);
    }

    ChunkIdSet listReady() const
    {
        return registry_.listReadyIds();
    }

    std::optional<ChunkState> chunkState(const ChunkId &id) const
    {
        return registry_.getState(id);
    }

    size_t size() const
    {
        return registry_.size();
    }

    const std::string& snapshotPath() const
    {
        return snapshot_.path();
    }

private:
    std::optional<ChunkStateEntry> currentEntry(const ChunkId &id) const
    {
        auto chunk = registry_.getById(id);
        auto state = registry_.getState(id);
        if (!chunk || !state) {
            return std::nullopt;
        }
        return ChunkStateEntry{*chunk, *state};
    }

    // Caller holds persistMutex_
    void persistOrRollback(const ChunkId &id, const std::optional<ChunkStateEntry> &previous)
    {
        try {
            snapshot_.save(registry_.entries());
        } catch (const storage::SnapshotError &ex) {
            registry_.restore(id, previous);
            util::logger::error("[DataCatalogue] snapshot write failed, change to " +
                                shortId(id) + " rolled back: " + ex.what());
            throw;
        }
    }

    ChunkRegistry registry_;
    storage::SnapshotStore snapshot_;
    std::vector<DataChunk> interrupted_;
    mutable std::mutex persistMutex_;
};

} // namespace core
} // namespace chunkworker

#endif // CHUNKWORKER_CORE_DATA_CATALOGUE_HPP
