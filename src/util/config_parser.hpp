#ifndef CHUNKWORKER_UTIL_CONFIG_PARSER_HPP
#define CHUNKWORKER_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <limits>
#include <mutex>
#include "worker_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Provides a minimal parser for the worker's key=value configuration.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate chunkworker::config::WorkerConfig fields.
 *   - Lines starting with '#' and blank lines are ignored.
 *   - A missing file is not an error: defaults stay in place.
 *
 * USAGE:
 *   @code
 *   chunkworker::config::WorkerConfig cfg;
 *   chunkworker::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("chunkworker.conf");
 *   @endcode
 *
 * Recognized keys:
 *   dataDirectory, snapshotPath, transferThreads, transferTimeoutSeconds,
 *   logLevel, logFile
 */

namespace chunkworker {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates WorkerConfig fields.
 */
class ConfigParser
{
public:
    explicit ConfigParser(chunkworker::config::WorkerConfig &workerConfig)
        : workerConfig_(workerConfig)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     * @return false if the file does not exist (defaults kept), true otherwise.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            chunkworker::util::logger::warn("ConfigParser: File not found, using defaults: " + filepath);
            return false;
        }

        chunkworker::util::logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile);
        chunkworker::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse config text held in memory.
     */
    inline void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(text);
        parseStream(in);
    }

private:
    chunkworker::config::WorkerConfig &workerConfig_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: empty key on line " + std::to_string(lineNo));
            }

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        using namespace chunkworker::util::logger;

        if (key == "dataDirectory") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: dataDirectory must not be empty");
            }
            workerConfig_.dataDirectory = val;
            debug("ConfigParser: dataDirectory set to " + val);
        }
        else if (key == "snapshotPath") {
            workerConfig_.snapshotPath = val;
            debug("ConfigParser: snapshotPath set to " + val);
        }
        else if (key == "transferThreads") {
            uint64_t n = parseUInt(val);
            if (n == 0 || n > std::numeric_limits<uint32_t>::max()) {
                throw std::runtime_error("ConfigParser: transferThreads out of range: " + val);
            }
            workerConfig_.transferThreads = static_cast<uint32_t>(n);
            debug("ConfigParser: transferThreads set to " + val);
        }
        else if (key == "transferTimeoutSeconds") {
            workerConfig_.transferTimeoutSeconds = parseUInt(val);
            debug("ConfigParser: transferTimeoutSeconds set to " + val);
        }
        else if (key == "logLevel") {
            // Validate early so a typo fails at startup
            parseLogLevel(val);
            workerConfig_.logLevel = val;
            debug("ConfigParser: logLevel set to " + val);
        }
        else if (key == "logFile") {
            workerConfig_.logFile = val;
            debug("ConfigParser: logFile set to " + val);
        }
        else {
            warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

    inline static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline static uint64_t parseUInt(const std::string &val)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace chunkworker

#endif // CHUNKWORKER_UTIL_CONFIG_PARSER_HPP
