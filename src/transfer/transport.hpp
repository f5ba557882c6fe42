#ifndef CHUNKWORKER_TRANSFER_TRANSPORT_HPP
#define CHUNKWORKER_TRANSFER_TRANSPORT_HPP

#include <atomic>
#include <stdexcept>
#include <string>
#include "core/data_chunk.hpp"

namespace chunkworker {
namespace transfer {

/*
  Transport
  --------------------------------
  Moves chunk payloads between their remote locations and the local data
  directory. The data manager calls it from a transfer thread; the
  catalogue never sees it.

  Both calls throw TransportError on failure and return normally on success.
  Implementations check the CancellationToken between units of work and
  stop with TransportError("cancelled") once it is set.
*/

class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

class CancellationToken
{
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Throws TransportError when cancelled.
    void throwIfCancelled(const std::string &what) const
    {
        if (isCancelled()) {
            throw TransportError("cancelled: " + what);
        }
    }

private:
    std::atomic<bool> cancelled_;
};

class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * @brief Download every file of the chunk into chunkDir.
     * @throw TransportError on failure or cancellation.
     */
    virtual void fetch(const core::DataChunk &chunk,
                       const std::string &chunkDir,
                       const CancellationToken &token) = 0;

    /**
     * @brief Remove a downloaded chunk from chunkDir.
     * @throw TransportError on failure or cancellation.
     */
    virtual void remove(const core::ChunkId &chunkId,
                        const std::string &chunkDir,
                        const CancellationToken &token) = 0;
};

} // namespace transfer
} // namespace chunkworker

#endif // CHUNKWORKER_TRANSFER_TRANSPORT_HPP
