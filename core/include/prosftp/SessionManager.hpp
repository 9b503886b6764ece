// Owns the single authenticated connection of a client session and hands it
// out through an exclusive lease. While a lease is held (a transfer is in
// flight) every other operation is rejected with ErrorKind::Busy.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace prosftp {

class SessionManager {
public:
    // Move-only proof of exclusive use of the connection. Releasing it (or
    // destroying it) makes the session available again.
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { release(); }

        explicit operator bool() const { return owner_ != nullptr; }
        SftpClient& client() const;
        void release();

    private:
        friend class SessionManager;
        explicit Lease(SessionManager* owner) : owner_(owner) {}
        SessionManager* owner_ = nullptr;
    };

    explicit SessionManager(std::unique_ptr<SftpClient> client);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Drops any previous connection first. No retries.
    bool connect(const SessionOptions& opt, SftpError& err);
    // Idempotent. While a lease is held the connection is interrupted and
    // closed as soon as the lease is released.
    void disconnect();
    bool isConnected() const;
    bool isBusy() const { return busy_.load(); }

    // Fails with Busy when a lease is outstanding, NotConnected when there is
    // no live connection.
    Lease acquire(SftpError& err);

    // Hard cancel: breaks blocking I/O of the current lease holder. The
    // connection is closed when the lease is released.
    void interrupt();

private:
    std::unique_ptr<SftpClient> client_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> pendingDisconnect_{false};
    std::mutex connectMutex_;
    // Orders pendingDisconnect_ against the end of a lease.
    std::mutex leaseMutex_;

    bool tryMarkBusy();
    void releaseLease();
    void releaseExclusive();
    bool interruptHolder();
};

} // namespace prosftp
