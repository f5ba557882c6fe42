#ifndef CHUNKWORKER_TRANSFER_HTTP_TRANSPORT_HPP
#define CHUNKWORKER_TRANSFER_HTTP_TRANSPORT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <curl/curl.h>
#include "transfer/transport.hpp"
#include "util/logger.hpp"

namespace chunkworker {
namespace transfer {

/*
  HttpTransport
  --------------------------------
  Transport backed by libcurl.

   - fetch: every (name, url) of the chunk is downloaded to <chunkDir>/<name>.part
     and renamed to <chunkDir>/<name> once complete. Any scheme libcurl
     handles works (http, https, file).
   - HTTP status >= 400 is a failure (CURLOPT_FAILONERROR).
   - The curl transfer callback polls the CancellationToken and aborts the
     request when it is set.
   - remove: deletes the chunk directory and then its dataset directory if
     that became empty.

   IMPORTANT:
   - You must link against libcurl (-lcurl).
   - Retries are left to the caller.
*/

class HttpTransport : public Transport
{
public:
    // -------------------------------------------------------------------------
    // timeoutSeconds applies to each file request; 0 means no limit.
    // -------------------------------------------------------------------------
    explicit HttpTransport(long timeoutSeconds = 600)
        : m_timeoutSeconds(timeoutSeconds)
    {
        initCurl();
    }

    void fetch(const core::DataChunk &chunk,
               const std::string &chunkDir,
               const CancellationToken &token) override
    {
        namespace fs = std::filesystem;
        using namespace chunkworker::util::logger;

        std::error_code ec;
        fs::create_directories(chunkDir, ec);
        if (ec) {
            throw TransportError("[HttpTransport] cannot create " + chunkDir + ": " + ec.message());
        }

        for (const auto &file : chunk.files) {
            token.throwIfCancelled("fetch " + core::shortId(chunk.id));
            if (!isSafeFileName(file.first)) {
                throw TransportError("[HttpTransport] refusing file name '" + file.first + "'");
            }

            const fs::path finalPath = fs::path(chunkDir) / file.first;
            const fs::path partPath = fs::path(chunkDir) / (file.first + ".part");

            debug("[HttpTransport] GET " + file.second + " -> " + finalPath.string());
            downloadFile(file.second, partPath.string(), token);

            fs::rename(partPath, finalPath, ec);
            if (ec) {
                throw TransportError("[HttpTransport] cannot finalize " + finalPath.string() +
                                     ": " + ec.message());
            }
        }

        info("[HttpTransport] Fetched " + std::to_string(chunk.files.size()) + " files for " +
             core::shortId(chunk.id) + " into " + chunkDir);
    }

    void remove(const core::ChunkId &chunkId,
                const std::string &chunkDir,
                const CancellationToken &token) override
    {
        namespace fs = std::filesystem;

        token.throwIfCancelled("remove " + core::shortId(chunkId));

        std::error_code ec;
        fs::remove_all(chunkDir, ec);
        if (ec) {
            throw TransportError("[HttpTransport] cannot remove " + chunkDir + ": " + ec.message());
        }

        // Prune the dataset directory once its last chunk is gone
        fs::path normalized = fs::path(chunkDir).lexically_normal();
        if (normalized.filename().empty()) {
            normalized = normalized.parent_path();
        }
        const fs::path datasetDir = normalized.parent_path();
        if (datasetDir.filename().string().rfind("dataset_id=", 0) == 0 &&
            fs::is_directory(datasetDir, ec) && fs::is_empty(datasetDir, ec)) {
            fs::remove(datasetDir, ec);
        }

        util::logger::info("[HttpTransport] Removed " + core::shortId(chunkId) + " from " + chunkDir);
    }

private:
    // -------------------------------------------------------------------------
    // Static initialization of libcurl for the entire process
    // -------------------------------------------------------------------------
    static void initCurl()
    {
        static bool initialized = false;
        static std::mutex initMutex;
        std::lock_guard<std::mutex> lock(initMutex);
        if (!initialized)
        {
            curl_global_init(CURL_GLOBAL_ALL);
            initialized = true;
        }
    }

    static bool isSafeFileName(const std::string &name)
    {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
    }

    // -------------------------------------------------------------------------
    // Helper: stream one URL into a local file
    // -------------------------------------------------------------------------
    void downloadFile(const std::string &url, const std::string &destPath,
                      const CancellationToken &token)
    {
        FILE *out = std::fopen(destPath.c_str(), "wb");
        if (!out) {
            throw TransportError("[HttpTransport] cannot open " + destPath + " for writing");
        }

        CURL *curl = curl_easy_init();
        if (!curl) {
            std::fclose(out);
            std::remove(destPath.c_str());
            throw TransportError("[HttpTransport] curl_easy_init failed");
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(&token));

        CURLcode res = curl_easy_perform(curl);
        curl_easy_cleanup(curl);
        bool closed = (std::fclose(out) == 0);

        if (res != CURLE_OK || !closed) {
            std::remove(destPath.c_str());
            if (res == CURLE_ABORTED_BY_CALLBACK) {
                throw TransportError("cancelled: " + url);
            }
            std::string reason = (res != CURLE_OK) ? curl_easy_strerror(res) : "write failed";
            throw TransportError("[HttpTransport] " + url + ": " + reason);
        }
    }

    // -------------------------------------------------------------------------
    // Callback for libcurl to write response data
    // -------------------------------------------------------------------------
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        if (!userdata) return 0;
        FILE *out = static_cast<FILE*>(userdata);
        return std::fwrite(ptr, size, nmemb, out) * size;
    }

    // Non-zero return aborts the transfer
    static int progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
    {
        const CancellationToken *token = static_cast<const CancellationToken*>(clientp);
        return (token && token->isCancelled()) ? 1 : 0;
    }

    long m_timeoutSeconds;
};

} // namespace transfer
} // namespace chunkworker

#endif // CHUNKWORKER_TRANSFER_HTTP_TRANSPORT_HPP
