#ifndef CHUNKWORKER_CORE_CHUNK_REGISTRY_HPP
#define CHUNKWORKER_CORE_CHUNK_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/data_chunk.hpp"
#include "util/logger.hpp"

/**
 * @file chunk_registry.hpp
 * @brief Thread-safe in-memory registry of chunks and their lifecycle state.
 *
 * Design goals:
 *  1. Track each chunk's state (Downloading, Ready, Deleting).
 *  2. Guarded transitions: the guard check and the state write happen in one
 *     critical section, so two callers can never both start the same download.
 *  3. Readers (lookups, listings) share the lock; writers take it exclusively.
 *
 * A chunk in state Deleted is not stored: absence and Deleted are the same.
 *
 * Usage Example:
 *   chunkworker::core::ChunkRegistry registry;
 *   if (registry.startDownload(chunk)) { ... fetch ... registry.markReady(chunk.id); }
 *   auto found = registry.findByBlock(datasetId, 12);
 */

namespace chunkworker {
namespace core {

/**
 * @enum ChunkState
 * @brief Lifecycle of a chunk on this worker.
 */
enum class ChunkState {
    Downloading = 0, ///< Transfer in progress, not served
    Ready = 1,       ///< Fully downloaded and served to readers
    Deleting = 2,    ///< Removal in progress, no longer served
    Deleted = 3      ///< Terminal; equivalent to absence
};

inline const char* chunkStateName(ChunkState state)
{
    switch (state) {
    case ChunkState::Downloading: return "Downloading";
    case ChunkState::Ready:       return "Ready";
    case ChunkState::Deleting:    return "Deleting";
    case ChunkState::Deleted:     return "Deleted";
    }
    return "Unknown";
}

/**
 * @brief Inverse of chunkStateName().
 * @return std::nullopt for names that are not a ChunkState.
 */
inline std::optional<ChunkState> parseChunkState(const std::string &name)
{
    if (name == "Downloading") return ChunkState::Downloading;
    if (name == "Ready") return ChunkState::Ready;
    if (name == "Deleting") return ChunkState::Deleting;
    if (name == "Deleted") return ChunkState::Deleted;
    return std::nullopt;
}

/**
 * @struct ChunkStateEntry
 * @brief A chunk descriptor together with its current state.
 */
struct ChunkStateEntry
{
    DataChunk chunk;
    ChunkState state{ChunkState::Ready};

    bool operator==(const ChunkStateEntry &other) const
    {
        return chunk == other.chunk && state == other.state;
    }
    bool operator!=(const ChunkStateEntry &other) const { return !(*this == other); }
};

using ChunkIdSet = std::unordered_set<ChunkId, ChunkIdHash>;

/**
 * @class ChunkRegistry
 * @brief Map ChunkId -> ChunkStateEntry behind a single reader-writer lock.
 *
 * Transition table:
 *   absent      --startDownload-->  Downloading
 *   Downloading --markReady------>  Ready
 *   Ready       --startDeletion-->  Deleting
 *   Deleting    --markDeleted---->  absent
 *
 * Guarded operations return false without mutating when the guard fails.
 */
class ChunkRegistry
{
public:
    ChunkRegistry() = default;

    ChunkRegistry(const ChunkRegistry&) = delete;
    ChunkRegistry& operator=(const ChunkRegistry&) = delete;

    /**
     * @brief Register a chunk as Downloading if no entry exists for its id.
     * @return false if the chunk is already downloading, ready or being deleted.
     */
    inline bool startDownload(const DataChunk &chunk)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto result = entries_.emplace(chunk.id, ChunkStateEntry{chunk, ChunkState::Downloading});
        if (!result.second) {
            util::logger::debug("[ChunkRegistry] startDownload rejected for " + shortId(chunk.id) +
                                ", state " + chunkStateName(result.first->second.state));
            return false;
        }
        return true;
    }

    /**
     * @brief Downloading -> Ready.
     * @return false if the entry is absent or not Downloading.
     */
    inline bool markReady(const ChunkId &id)
    {
        return transition(id, ChunkState::Downloading, ChunkState::Ready);
    }

    /**
     * @brief Ready -> Deleting.
     * @return false if the entry is absent or not Ready.
     */
    inline bool startDeletion(const ChunkId &id)
    {
        return transition(id, ChunkState::Ready, ChunkState::Deleting);
    }

    /**
     * @brief Deleting -> absent.
     * @return false if the entry is absent or not Deleting.
     */
    inline bool markDeleted(const ChunkId &id)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.state != ChunkState::Deleting) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    /**
     * @brief Unguarded direct set. Deleted removes the entry.
     * @return The entry as it was before the call, if any.
     */
    inline std::optional<ChunkStateEntry> setState(const DataChunk &chunk, ChunkState state)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::optional<ChunkStateEntry> previous;
        auto it = entries_.find(chunk.id);
        if (it != entries_.end()) {
            previous = it->second;
        }

        if (state == ChunkState::Deleted) {
            if (it != entries_.end()) {
                entries_.erase(it);
            }
        } else if (it != entries_.end()) {
            it->second.state = state;
        } else {
            entries_.emplace(chunk.id, ChunkStateEntry{chunk, state});
        }
        return previous;
    }

    /**
     * @brief Put an entry back exactly as captured (or drop it when none was captured).
     *
     * Used to undo a mutation whose persistence failed.
     */
    inline void restore(const ChunkId &id, const std::optional<ChunkStateEntry> &previous)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (previous) {
            entries_[id] = *previous;
        } else {
            entries_.erase(id);
        }
    }

    /**
     * @brief Descriptor for an id, regardless of state.
     */
    inline std::optional<DataChunk> getById(const ChunkId &id) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.chunk;
    }

    /**
     * @brief Current state, or std::nullopt when absent.
     */
    inline std::optional<ChunkState> getState(const ChunkId &id) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.state;
    }

    /**
     * @brief The Ready chunk of a dataset whose range contains the block.
     *
     * Linear scan. Ranges of one dataset are disjoint, so at most one Ready
     * entry can match; a second match means the caller that created the
     * chunks broke that invariant and is logged as an error.
     */
    inline std::optional<DataChunk> findByBlock(const DatasetId &datasetId, uint64_t blockNumber) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const ChunkStateEntry *match = nullptr;
        for (const auto &pair : entries_) {
            const ChunkStateEntry &entry = pair.second;
            if (entry.state != ChunkState::Ready ||
                entry.chunk.datasetId != datasetId ||
                !entry.chunk.blockRange.contains(blockNumber)) {
                continue;
            }
            if (match == nullptr) {
                match = &entry;
                continue;
            }
            util::logger::error("[ChunkRegistry] overlapping Ready chunks for block " +
                                std::to_string(blockNumber) + ": " +
                                shortId(match->chunk.id) + " " + match->chunk.blockRange.toString() +
                                " and " + shortId(entry.chunk.id) + " " + entry.chunk.blockRange.toString());
        }
        if (match == nullptr) {
            return std::nullopt;
        }
        return match->chunk;
    }

    /**
     * @brief Ids currently Ready, taken under one lock acquisition.
     */
    inline ChunkIdSet listReadyIds() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ChunkIdSet ready;
        for (const auto &pair : entries_) {
            if (pair.second.state == ChunkState::Ready) {
                ready.insert(pair.first);
            }
        }
        return ready;
    }

    /**
     * @brief Copy of every entry, for persistence.
     */
    inline std::vector<ChunkStateEntry> entries() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<ChunkStateEntry> all;
        all.reserve(entries_.size());
        for (const auto &pair : entries_) {
            all.push_back(pair.second);
        }
        return all;
    }

    inline size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

private:
    inline bool transition(const ChunkId &id, ChunkState from, ChunkState to)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            util::logger::debug(std::string("[ChunkRegistry] ") + chunkStateName(to) +
                                " rejected for " + shortId(id) + ": not registered");
            return false;
        }
        if (it->second.state != from) {
            util::logger::debug(std::string("[ChunkRegistry] ") + chunkStateName(to) +
                                " rejected for " + shortId(id) + ": state is " +
                                chunkStateName(it->second.state));
            return false;
        }
        it->second.state = to;
        return true;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<ChunkId, ChunkStateEntry, ChunkIdHash> entries_;
};

} // namespace core
} // namespace chunkworker

#endif // CHUNKWORKER_CORE_CHUNK_REGISTRY_HPP
