// Hand-off between the transfer worker (producer) and the front end
// (consumer). Progress is coalesced to the latest value; status lines are
// queued; exactly one terminal event is delivered, after everything else.
#pragma once
#include "CancelToken.hpp"
#include "TransferTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace prosftp {

struct TransferEvent {
    enum class Type { Status, Progress, Finished };
    Type type = Type::Progress;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::string message;   // Status only
    TransferReport report; // Finished only
};

class ProgressChannel {
public:
    ProgressChannel() = default;
    explicit ProgressChannel(CancelToken token) : cancel_(std::move(token)) {}

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Producer side. Calls after finish() are ignored.
    void publishProgress(std::uint64_t done, std::uint64_t total);
    void publishStatus(std::string text);
    // Returns false if a terminal event was already published.
    bool finish(TransferReport report);

    // Consumer side. Waits up to timeout for the next event; returns false on
    // timeout or once the terminal event has been delivered.
    bool next(TransferEvent& ev, std::chrono::milliseconds timeout);
    bool tryNext(TransferEvent& ev) { return next(ev, std::chrono::milliseconds(0)); }

    bool isFinished() const;   // terminal event published
    bool isCompleted() const;  // terminal event delivered to the consumer

    // Cancellation travels the other way.
    void requestCancel() const { cancel_.cancel(); }
    bool cancelRequested() const { return cancel_.isCancelled(); }
    const CancelToken& cancelToken() const { return cancel_; }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> statuses_;
    bool progressPending_ = false;
    std::uint64_t done_ = 0;
    std::uint64_t total_ = 0;
    std::optional<TransferReport> terminal_;
    bool terminalDelivered_ = false;
    CancelToken cancel_;
};

// Rate limiter for progress callbacks fired once per I/O chunk.
class ProgressThrottle {
public:
    ProgressThrottle(std::uint64_t stepBytes, std::chrono::milliseconds interval)
        : step_(stepBytes), interval_(interval) {}

    // True if (done, total) should be forwarded. The first call, completion
    // (done == total) and every step/interval boundary pass.
    bool shouldEmit(std::uint64_t done, std::uint64_t total);
    void reset() { started_ = false; }

private:
    std::uint64_t step_;
    std::chrono::milliseconds interval_;
    bool started_ = false;
    std::uint64_t lastDone_ = 0;
    std::chrono::steady_clock::time_point lastTime_{};
};

} // namespace prosftp
