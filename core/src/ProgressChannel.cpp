#include "prosftp/ProgressChannel.hpp"

namespace prosftp {

void ProgressChannel::publishProgress(std::uint64_t done, std::uint64_t total) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (terminal_) return;
        if (done < done_) return; // never go backwards
        done_ = done;
        total_ = total;
        if (total_ != 0 && done_ > total_) done_ = total_;
        progressPending_ = true;
    }
    cv_.notify_one();
}

void ProgressChannel::publishStatus(std::string text) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (terminal_) return;
        statuses_.push_back(std::move(text));
    }
    cv_.notify_one();
}

bool ProgressChannel::finish(TransferReport report) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (terminal_) return false;
        terminal_ = std::move(report);
    }
    cv_.notify_all();
    return true;
}

bool ProgressChannel::next(TransferEvent& ev, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto ready = [this] {
        return terminalDelivered_ || !statuses_.empty() || progressPending_ || terminal_.has_value();
    };
    if (!cv_.wait_for(lk, timeout, ready)) return false;
    if (terminalDelivered_) return false;

    ev = TransferEvent{};
    if (!statuses_.empty()) {
        ev.type = TransferEvent::Type::Status;
        ev.message = std::move(statuses_.front());
        statuses_.pop_front();
        ev.bytes_done = done_;
        ev.bytes_total = total_;
        return true;
    }
    if (progressPending_) {
        progressPending_ = false;
        ev.type = TransferEvent::Type::Progress;
        ev.bytes_done = done_;
        ev.bytes_total = total_;
        return true;
    }
    ev.type = TransferEvent::Type::Finished;
    ev.report = *terminal_;
    ev.bytes_done = ev.report.bytes_done;
    ev.bytes_total = ev.report.bytes_total;
    terminalDelivered_ = true;
    return true;
}

bool ProgressChannel::isFinished() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return terminal_.has_value();
}

bool ProgressChannel::isCompleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return terminalDelivered_;
}

bool ProgressThrottle::shouldEmit(std::uint64_t done, std::uint64_t total) {
    const auto now = std::chrono::steady_clock::now();
    const bool emit = !started_ ||
                      (total != 0 && done >= total) ||
                      done - lastDone_ >= step_ ||
                      now - lastTime_ >= interval_;
    if (emit) {
        started_ = true;
        lastDone_ = done;
        lastTime_ = now;
    }
    return emit;
}

} // namespace prosftp
