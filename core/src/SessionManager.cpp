#include "prosftp/SessionManager.hpp"
#include "prosftp/Log.hpp"

#include <utility>

namespace prosftp {

SessionManager::Lease& SessionManager::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

SftpClient& SessionManager::Lease::client() const {
    return *owner_->client_;
}

void SessionManager::Lease::release() {
    if (owner_) {
        owner_->releaseLease();
        owner_ = nullptr;
    }
}

SessionManager::SessionManager(std::unique_ptr<SftpClient> client)
    : client_(std::move(client)) {}

SessionManager::~SessionManager() {
    if (client_) client_->disconnect();
}

bool SessionManager::tryMarkBusy() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true);
}

void SessionManager::releaseLease() {
    std::lock_guard<std::mutex> lk(leaseMutex_);
    // A broken transport (interrupt or socket error) leaves the client marked
    // disconnected; free its resources before anyone else can lease it.
    if (pendingDisconnect_.exchange(false) || !client_->isConnected()) {
        client_->disconnect();
    }
    busy_ = false;
}

// Ends a connect/disconnect that held the busy flag itself. An interrupt
// aimed at it has no lease to act on later.
void SessionManager::releaseExclusive() {
    std::lock_guard<std::mutex> lk(leaseMutex_);
    pendingDisconnect_ = false;
    busy_ = false;
}

bool SessionManager::interruptHolder() {
    std::lock_guard<std::mutex> lk(leaseMutex_);
    if (!busy_.load()) return false;
    pendingDisconnect_ = true;
    client_->interrupt();
    return true;
}

bool SessionManager::connect(const SessionOptions& opt, SftpError& err) {
    err.clear();
    if (!tryMarkBusy()) {
        err.set(ErrorKind::Busy, "A transfer is in progress");
        return false;
    }
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(connectMutex_);
        if (client_->isConnected()) {
            PROSFTP_LOGI("Dropping previous connection before reconnecting");
            client_->disconnect();
        }
        ok = client_->connect(opt, err);
        if (!ok) {
            PROSFTP_LOGW("Connect to %s failed: %s", redacted(opt.host).c_str(),
                         err.describe().c_str());
        }
    }
    releaseExclusive();
    return ok;
}

void SessionManager::disconnect() {
    std::lock_guard<std::mutex> lk(connectMutex_);
    while (!tryMarkBusy()) {
        if (interruptHolder()) {
            PROSFTP_LOGW("Disconnect requested during a transfer; interrupting it");
            return;
        }
    }
    client_->disconnect();
    releaseExclusive();
}

bool SessionManager::isConnected() const {
    return client_->isConnected();
}

SessionManager::Lease SessionManager::acquire(SftpError& err) {
    if (!tryMarkBusy()) {
        err.set(ErrorKind::Busy, "A transfer is in progress");
        return Lease();
    }
    if (!client_->isConnected()) {
        releaseExclusive();
        err.set(ErrorKind::NotConnected, "Not connected");
        return Lease();
    }
    return Lease(this);
}

void SessionManager::interrupt() {
    interruptHolder();
}

} // namespace prosftp
