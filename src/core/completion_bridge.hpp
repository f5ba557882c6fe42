#ifndef CHUNKWORKER_CORE_COMPLETION_BRIDGE_HPP
#define CHUNKWORKER_CORE_COMPLETION_BRIDGE_HPP

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/data_chunk.hpp"
#include "util/logger.hpp"

/**
 * @file completion_bridge.hpp
 * @brief One-shot signal from a transfer thread to whoever waits on the transfer.
 *
 * The producer (a worker thread) calls complete() exactly once. The outcome is
 * stored in the signal, so a consumer that starts waiting or registers its
 * wake callback after completion still sees it: there is no lost wakeup
 * regardless of which side runs first.
 *
 * Usage Example:
 *  @code
 *    auto signal = std::make_shared<CompletionSignal>(chunk.id);
 *    pool.submit([signal] { ...; signal->complete(true, "done"); });
 *    const TransferOutcome &outcome = signal->wait();
 *  @endcode
 */

namespace chunkworker {
namespace core {

/**
 * @struct TransferOutcome
 * @brief Result delivered through a CompletionSignal.
 */
struct TransferOutcome
{
    ChunkId chunkId{};
    bool success{false};
    std::string message;
};

/**
 * @class CompletionSignal
 * @brief Single-producer / single-consumer one-shot channel carrying a TransferOutcome.
 */
class CompletionSignal
{
public:
    using Waker = std::function<void(const TransferOutcome&)>;

    explicit CompletionSignal(const ChunkId &chunkId)
        : chunkId_(chunkId), future_(promise_.get_future().share()), completed_(false)
    {
    }

    CompletionSignal(const CompletionSignal&) = delete;
    CompletionSignal& operator=(const CompletionSignal&) = delete;

    /**
     * @brief A signal that is already complete, e.g. for a rejected request.
     */
    static std::shared_ptr<CompletionSignal> completed(const ChunkId &chunkId,
                                                       bool success,
                                                       const std::string &message)
    {
        auto signal = std::make_shared<CompletionSignal>(chunkId);
        signal->complete(success, message);
        return signal;
    }

    const ChunkId& chunkId() const { return chunkId_; }

    /**
     * @brief Producer side: publish the outcome and run registered wakers.
     * @return false if the signal had already been completed (the call is ignored).
     */
    bool complete(bool success, const std::string &message)
    {
        std::vector<Waker> wakers;
        TransferOutcome outcome{chunkId_, success, message};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (completed_) {
                util::logger::warn("[CompletionSignal] duplicate completion ignored for " +
                                   shortId(chunkId_));
                return false;
            }
            completed_ = true;
            promise_.set_value(outcome);
            wakers.swap(wakers_);
        }

        // Wakers run outside the lock so they may touch the signal themselves
        for (auto &waker : wakers) {
            runWaker(waker, outcome);
        }
        return true;
    }

    /**
     * @brief Consumer side: register a wake callback.
     *
     * If the outcome is already available the callback runs immediately on the
     * calling thread; otherwise it runs on the producer thread inside complete().
     */
    void onComplete(Waker waker)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!completed_) {
                wakers_.push_back(std::move(waker));
                return;
            }
        }
        runWaker(waker, future_.get());
    }

    bool isComplete() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    /**
     * @brief Block until the outcome is available.
     */
    const TransferOutcome& wait() const
    {
        return future_.get();
    }

    /**
     * @brief Block for at most the given duration.
     * @return true if the outcome is available.
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period> &timeout) const
    {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    /**
     * @brief Shared future view, for callers that compose futures.
     */
    std::shared_future<TransferOutcome> future() const { return future_; }

private:
    static void runWaker(const Waker &waker, const TransferOutcome &outcome)
    {
        try {
            waker(outcome);
        } catch (const std::exception &ex) {
            util::logger::error(std::string("[CompletionSignal] waker threw: ") + ex.what());
        } catch (...) {
            util::logger::error("[CompletionSignal] waker threw a non-standard exception");
        }
    }

    const ChunkId chunkId_;
    mutable std::mutex mutex_;
    std::promise<TransferOutcome> promise_;
    std::shared_future<TransferOutcome> future_;
    bool completed_;
    std::vector<Waker> wakers_;
};

} // namespace core
} // namespace chunkworker

#endif // CHUNKWORKER_CORE_COMPLETION_BRIDGE_HPP
