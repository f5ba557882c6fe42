#ifndef CHUNKWORKER_CORE_CHUNK_IDENTITY_HPP
#define CHUNKWORKER_CORE_CHUNK_IDENTITY_HPP

#include <map>
#include <stdexcept>
#include <string>
#include "core/data_chunk.hpp"
#include "util/hashing.hpp"

namespace chunkworker {
namespace core {

/**
 * @brief Canonical text that a chunk id is hashed from:
 *        hex(datasetId) + decimal(start) + "_" + decimal(end).
 *
 * The dataset hex is fixed-width; the '_' keeps start/end unambiguous
 * ([1,234) and [12,34) must not encode alike).
 *
 * Tools that hash hex + start + end with no separator derive different ids
 * for the same chunk. Ids from this function are only comparable with ids
 * derived the same way.
 */
inline std::string canonicalChunkEncoding(const DatasetId &datasetId, const BlockRange &range)
{
    return util::hashing::toHex(datasetId) + std::to_string(range.start) + "_" +
           std::to_string(range.end);
}

/**
 * @brief Derive a chunk id from its dataset and block range.
 *
 * Pure and deterministic; every component that needs a chunk's identity goes
 * through here.
 * @throw std::runtime_error if hashing fails.
 */
inline ChunkId deriveChunkId(const DatasetId &datasetId, const BlockRange &range)
{
    return util::hashing::sha256(canonicalChunkEncoding(datasetId, range));
}

/**
 * @brief Build a chunk descriptor with its derived id.
 * @throw std::invalid_argument on an empty block range.
 */
inline DataChunk makeDataChunk(const DatasetId &datasetId,
                               const BlockRange &range,
                               std::map<std::string, std::string> files = {})
{
    if (range.empty()) {
        throw std::invalid_argument("makeDataChunk: empty block range " + range.toString());
    }
    DataChunk chunk;
    chunk.id = deriveChunkId(datasetId, range);
    chunk.datasetId = datasetId;
    chunk.blockRange = range;
    chunk.files = std::move(files);
    return chunk;
}

} // namespace core
} // namespace chunkworker

#endif // CHUNKWORKER_CORE_CHUNK_IDENTITY_HPP
