#ifndef CHUNKWORKER_CORE_DATA_CHUNK_HPP
#define CHUNKWORKER_CORE_DATA_CHUNK_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include "util/hashing.hpp"

/**
 * @file data_chunk.hpp
 * @brief Plain data types describing a dataset chunk.
 *
 * A chunk is an immutable, contiguous block range of one dataset, backed by a
 * handful of remote files (usually 1-10, a few hundred MB in total). The
 * descriptor carries only metadata.
 *
 * Chunk ids must come from deriveChunkId() (chunk_identity.hpp); use
 * makeDataChunk() rather than filling DataChunk::id by hand.
 */

namespace chunkworker {
namespace core {

/// Opaque 32-byte dataset (blockchain) identifier.
using DatasetId = std::array<uint8_t, 32>;

/// 32-byte chunk identifier, SHA-256 of the canonical (dataset, range) encoding.
using ChunkId = std::array<uint8_t, 32>;

/**
 * @struct BlockRange
 * @brief Half-open block interval [start, end).
 *
 * Ranges of one dataset never overlap; range lookup relies on it.
 */
struct BlockRange
{
    uint64_t start{0};
    uint64_t end{0};

    BlockRange() = default;
    BlockRange(uint64_t s, uint64_t e) : start(s), end(e) {}

    bool empty() const { return start >= end; }

    bool contains(uint64_t block) const { return block >= start && block < end; }

    bool operator==(const BlockRange &other) const
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const BlockRange &other) const { return !(*this == other); }

    std::string toString() const
    {
        return "[" + std::to_string(start) + "," + std::to_string(end) + ")";
    }
};

/**
 * @struct DataChunk
 * @brief Chunk descriptor.
 *
 * Fields:
 *   - id: derived from (datasetId, blockRange); the only identity key.
 *   - datasetId: dataset the blocks belong to.
 *   - blockRange: blocks covered by the chunk.
 *   - files: logical file name -> download location (URL or local path).
 */
struct DataChunk
{
    ChunkId id{};
    DatasetId datasetId{};
    BlockRange blockRange;
    std::map<std::string, std::string> files;

    /// Full structural equality, used when comparing persisted state.
    bool operator==(const DataChunk &other) const
    {
        return id == other.id && datasetId == other.datasetId &&
               blockRange == other.blockRange && files == other.files;
    }
    bool operator!=(const DataChunk &other) const { return !(*this == other); }
};

/**
 * @brief Hash functor so ChunkId can key unordered containers.
 *
 * Ids are SHA-256 output, so any 8 bytes are already uniformly distributed.
 */
struct ChunkIdHash
{
    size_t operator()(const ChunkId &id) const
    {
        size_t h = 0;
        std::memcpy(&h, id.data(), sizeof(h));
        return h;
    }
};

inline std::string toHex(const ChunkId &id)
{
    return util::hashing::toHex(id);
}

/// Short form for log lines.
inline std::string shortId(const ChunkId &id)
{
    return util::hashing::toHex(id.data(), 6);
}

inline ChunkId chunkIdFromHex(const std::string &hex)
{
    return util::hashing::fromHexFixed<32>(hex);
}

inline DatasetId datasetIdFromHex(const std::string &hex)
{
    return util::hashing::fromHexFixed<32>(hex);
}

} // namespace core
} // namespace chunkworker

#endif // CHUNKWORKER_CORE_DATA_CHUNK_HPP
