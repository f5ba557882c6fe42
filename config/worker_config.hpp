#ifndef CHUNKWORKER_CONFIG_WORKER_CONFIG_HPP
#define CHUNKWORKER_CONFIG_WORKER_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file worker_config.hpp
 * @brief Defines configuration parameters for a single chunk worker process.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Contains the data directory, snapshot location, transfer pool size, logging.
 */

namespace chunkworker {
namespace config {

/**
 * @struct WorkerConfig
 * @brief Holds essential local configuration for a worker:
 *   - dataDirectory: Root of the on-disk chunk layout.
 *   - snapshotPath: Catalogue snapshot file (empty = derived from dataDirectory).
 *   - transferThreads: Number of background transfer threads.
 *   - transferTimeoutSeconds: Per-request limit applied by the transport.
 *   - logLevel / logFile: Logger setup.
 */
struct WorkerConfig
{
    /**
     * @brief Construct a new WorkerConfig with some defaults:
     *   dataDirectory = "./local_data_dir"
     *   snapshotPath = "" (resolves to <dataDirectory>/catalogue.sqlite)
     *   transferThreads = 4
     *   transferTimeoutSeconds = 600
     *   logLevel = "INFO"
     *   logFile = "" (console only)
     */
    WorkerConfig()
        : dataDirectory("./local_data_dir"),
          snapshotPath(""),
          transferThreads(4),
          transferTimeoutSeconds(600),
          logLevel("INFO"),
          logFile("")
    {
    }

    /// Where downloaded chunks live (dataset_id=<hex>/block_range=<s>_<e>/).
    std::string dataDirectory;

    /// Path of the catalogue snapshot; empty means the default inside dataDirectory.
    std::string snapshotPath;

    /// Size of the background transfer pool.
    uint32_t transferThreads;

    /// Timeout for a single file transfer, in seconds. 0 disables it.
    uint64_t transferTimeoutSeconds;

    /// Minimal log level name (DEBUG, INFO, WARN, ERROR, CRITICAL).
    std::string logLevel;

    /// Optional log file; console output is always on.
    std::string logFile;

    /// The snapshot location actually used by the catalogue.
    std::string resolvedSnapshotPath() const
    {
        if (!snapshotPath.empty()) {
            return snapshotPath;
        }
        if (dataDirectory.empty() || dataDirectory.back() == '/') {
            return dataDirectory + "catalogue.sqlite";
        }
        return dataDirectory + "/catalogue.sqlite";
    }
};

} // namespace config
} // namespace chunkworker

#endif // CHUNKWORKER_CONFIG_WORKER_CONFIG_HPP
