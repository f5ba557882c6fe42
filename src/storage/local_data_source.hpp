#ifndef CHUNKWORKER_STORAGE_LOCAL_DATA_SOURCE_HPP
#define CHUNKWORKER_STORAGE_LOCAL_DATA_SOURCE_HPP

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "core/chunk_identity.hpp"
#include "core/data_chunk.hpp"
#include "util/logger.hpp"

namespace chunkworker {
namespace storage {

/*
  LocalDataSource
  --------------------------------
  Knows the on-disk chunk layout under the data directory:

    <dataDir>/dataset_id=<64 hex>/block_range=<start>_<end>/<file>...

  discoverLocalChunks() rebuilds chunk descriptors from that layout at
  startup (file name -> local path). Directories that do not follow the
  layout are skipped with a warning.
*/

/**
 * @struct ChunkRef
 * @brief What a reader gets back from a lookup: the descriptor and where it lives.
 */
struct ChunkRef
{
    core::DataChunk chunk;
    std::string path;
};

class LocalDataSource
{
public:
    explicit LocalDataSource(std::string dataDir)
        : m_dataDir(std::move(dataDir))
    {
    }

    const std::string& dataDir() const { return m_dataDir; }

    // -------------------------------------------------------------------------
    // Directory of a chunk, with a trailing separator.
    // -------------------------------------------------------------------------
    std::string chunkPath(const core::DataChunk &chunk) const
    {
        return chunkPath(chunk.datasetId, chunk.blockRange);
    }

    std::string chunkPath(const core::DatasetId &datasetId, const core::BlockRange &range) const
    {
        std::filesystem::path p(m_dataDir);
        p /= datasetDirName(datasetId);
        p /= rangeDirName(range);
        return p.string() + "/";
    }

    ChunkRef makeRef(const core::DataChunk &chunk) const
    {
        return ChunkRef{chunk, chunkPath(chunk)};
    }

    static std::string datasetDirName(const core::DatasetId &datasetId)
    {
        return "dataset_id=" + core::toHex(datasetId);
    }

    static std::string rangeDirName(const core::BlockRange &range)
    {
        return "block_range=" + std::to_string(range.start) + "_" + std::to_string(range.end);
    }

    // -------------------------------------------------------------------------
    // Parse "dataset_id=<hex>"; std::nullopt if the name does not match.
    // -------------------------------------------------------------------------
    static std::optional<core::DatasetId> parseDatasetDirName(const std::string &name)
    {
        static const std::string prefix = "dataset_id=";
        if (name.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        try {
            return core::datasetIdFromHex(name.substr(prefix.size()));
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    // -------------------------------------------------------------------------
    // Parse "block_range=<start>_<end>"; std::nullopt if malformed or empty.
    // -------------------------------------------------------------------------
    static std::optional<core::BlockRange> parseRangeDirName(const std::string &name)
    {
        static const std::string prefix = "block_range=";
        if (name.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        const std::string body = name.substr(prefix.size());
        auto sep = body.find('_');
        if (sep == std::string::npos) {
            return std::nullopt;
        }
        auto start = parseU64(body.substr(0, sep));
        auto end = parseU64(body.substr(sep + 1));
        if (!start || !end || *start >= *end) {
            return std::nullopt;
        }
        return core::BlockRange(*start, *end);
    }

    // -------------------------------------------------------------------------
    // Scan the data directory. A missing directory yields no chunks.
    // Result is sorted by dataset, then range start.
    // -------------------------------------------------------------------------
    std::vector<core::DataChunk> discoverLocalChunks() const
    {
        namespace fs = std::filesystem;
        using namespace chunkworker::util::logger;

        std::vector<core::DataChunk> chunks;
        std::error_code ec;
        if (!fs::is_directory(m_dataDir, ec)) {
            info("[LocalDataSource] Data directory " + m_dataDir + " does not exist yet.");
            return chunks;
        }

        for (const auto &datasetEntry : fs::directory_iterator(m_dataDir)) {
            if (!datasetEntry.is_directory()) {
                continue;
            }
            const std::string datasetName = datasetEntry.path().filename().string();
            auto datasetId = parseDatasetDirName(datasetName);
            if (!datasetId) {
                warn("[LocalDataSource] Skipping unexpected directory " + datasetEntry.path().string());
                continue;
            }

            for (const auto &rangeEntry : fs::directory_iterator(datasetEntry.path())) {
                if (!rangeEntry.is_directory()) {
                    continue;
                }
                auto range = parseRangeDirName(rangeEntry.path().filename().string());
                if (!range) {
                    warn("[LocalDataSource] Skipping unexpected directory " + rangeEntry.path().string());
                    continue;
                }

                std::map<std::string, std::string> files;
                for (const auto &fileEntry : fs::directory_iterator(rangeEntry.path())) {
                    const std::string fileName = fileEntry.path().filename().string();
                    if (!fileEntry.is_regular_file() || isPartialDownload(fileName)) {
                        continue;
                    }
                    files.emplace(fileName, fileEntry.path().string());
                }
                chunks.push_back(core::makeDataChunk(*datasetId, *range, std::move(files)));
            }
        }

        std::sort(chunks.begin(), chunks.end(), [](const core::DataChunk &a, const core::DataChunk &b) {
            if (a.datasetId != b.datasetId) {
                return a.datasetId < b.datasetId;
            }
            return a.blockRange.start < b.blockRange.start;
        });

        info("[LocalDataSource] Found " + std::to_string(chunks.size()) + " local chunks in " + m_dataDir);
        return chunks;
    }

private:
    static bool isPartialDownload(const std::string &fileName)
    {
        static const std::string suffix = ".part";
        return fileName.size() >= suffix.size() &&
               fileName.compare(fileName.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static std::optional<uint64_t> parseU64(const std::string &text)
    {
        if (text.empty() || text.size() > 20) {
            return std::nullopt;
        }
        uint64_t value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            uint64_t digit = static_cast<uint64_t>(c - '0');
            if (value > (UINT64_MAX - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
        }
        return value;
    }

    std::string m_dataDir;
};

} // namespace storage
} // namespace chunkworker

#endif // CHUNKWORKER_STORAGE_LOCAL_DATA_SOURCE_HPP
