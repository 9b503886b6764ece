#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <memory>

namespace prosftp {

// Shared cancellation flag. Copies observe the same flag; the worker polls it
// at chunk and step boundaries.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

    // Adapter for SftpClient::get/put.
    SftpClient::CancelFn asPredicate() const {
        auto flag = flag_;
        return [flag] { return flag->load(); };
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace prosftp
