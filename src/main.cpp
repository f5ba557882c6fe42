#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/chunk_identity.hpp"
#include "core/completion_bridge.hpp"
#include "transfer/http_transport.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "worker/data_manager.hpp"

namespace {

const std::set<std::string> kCommands = {"list", "find", "download", "delete"};

void printUsage()
{
    std::cerr << "usage: chunkworker [config-file] [command ...]\n"
              << "  list                                           ids of ready chunks (default)\n"
              << "  find <dataset-hex> <block>                     directory of the chunk covering a block\n"
              << "  download <dataset-hex> <start> <end> name=url...  fetch a chunk and wait\n"
              << "  delete <chunk-hex>                             delete a chunk and wait\n";
}

uint64_t parseBlock(const std::string &text)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not a block number: '" + text + "'");
    }
    return std::stoull(text);
}

int reportOutcome(const chunkworker::core::TransferOutcome &outcome, const std::string &action)
{
    using namespace chunkworker;
    if (outcome.success) {
        std::cout << core::toHex(outcome.chunkId) << "\n";
        util::logger::info("[main] " + action + " of " + core::shortId(outcome.chunkId) + " finished");
        return 0;
    }
    util::logger::error("[main] " + action + " of " + core::shortId(outcome.chunkId) +
                        " failed: " + outcome.message);
    return 1;
}

int runCommand(chunkworker::worker::DataManager &manager, const std::vector<std::string> &args)
{
    using namespace chunkworker;

    const std::string command = args.empty() ? "list" : args[0];

    if (command == "list") {
        for (const auto &id : manager.listChunks()) {
            std::cout << core::toHex(id) << "\n";
        }
        return 0;
    }

    if (command == "find") {
        if (args.size() != 3) {
            printUsage();
            return 1;
        }
        auto found = manager.findChunk(core::datasetIdFromHex(args[1]), parseBlock(args[2]));
        if (!found) {
            util::logger::warn("[main] no ready chunk covers block " + args[2]);
            return 1;
        }
        std::cout << found->path << "\n";
        return 0;
    }

    if (command == "download") {
        if (args.size() < 5) {
            printUsage();
            return 1;
        }
        std::map<std::string, std::string> files;
        for (size_t i = 4; i < args.size(); ++i) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument("expected name=url, got '" + args[i] + "'");
            }
            files[args[i].substr(0, eq)] = args[i].substr(eq + 1);
        }
        core::DataChunk chunk = core::makeDataChunk(core::datasetIdFromHex(args[1]),
                                                    core::BlockRange(parseBlock(args[2]), parseBlock(args[3])),
                                                    files);
        auto signal = manager.downloadChunk(chunk);
        return reportOutcome(signal->wait(), "download");
    }

    if (command == "delete") {
        if (args.size() != 2) {
            printUsage();
            return 1;
        }
        auto signal = manager.deleteChunk(core::chunkIdFromHex(args[1]));
        return reportOutcome(signal->wait(), "deletion");
    }

    printUsage();
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace chunkworker;

    std::vector<std::string> args(argv + 1, argv + argc);

    // 1. Config file is the first argument unless it is already a command
    std::string configPath = "chunkworker.conf";
    if (!args.empty() && kCommands.count(args[0]) == 0) {
        configPath = args[0];
        args.erase(args.begin());
    }

    try {
        config::WorkerConfig workerConfig;
        util::ConfigParser configParser(workerConfig);
        if (!configParser.loadFromFile(configPath)) {
            util::logger::info("[main] No config at " + configPath + ", using defaults");
        }

        // 2. Logging
        if (!util::logger::configure(workerConfig.logLevel, workerConfig.logFile)) {
            util::logger::warn("[main] Cannot write log file " + workerConfig.logFile);
        }
        util::logger::info("[main] chunkworker starting, data directory " + workerConfig.dataDirectory);

        // 3. Data manager over libcurl
        auto transport = std::make_shared<transfer::HttpTransport>(
            static_cast<long>(workerConfig.transferTimeoutSeconds));
        worker::DataManager manager(workerConfig, transport);

        // 4. One command, then a clean shutdown
        int rc = runCommand(manager, args);
        manager.shutdown();
        util::logger::info("[main] chunkworker exiting");
        return rc;
    } catch (const std::exception &ex) {
        util::logger::critical(std::string("[main] ") + ex.what());
        return 1;
    }
}
