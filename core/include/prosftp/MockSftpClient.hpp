// In-process SftpClient backed by a local sandbox directory. Remote "/x" maps
// to <sandbox>/x. exec() understands the handful of commands the transfer
// engine issues (tar, rm -f, mkdir -p) and runs them against the sandbox.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace prosftp {

class MockSftpClient : public SftpClient {
public:
    explicit MockSftpClient(std::string sandboxRoot);

    bool connect(const SessionOptions& opt, SftpError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              SftpError& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             SftpError& err,
             ProgressFn progress = {},
             CancelFn shouldCancel = {}) override;

    bool put(const std::string& local,
             const std::string& remote,
             SftpError& err,
             ProgressFn progress = {},
             CancelFn shouldCancel = {}) override;

    bool exists(const std::string& remote_path, bool& isDir, SftpError& err) override;
    bool stat(const std::string& remote_path, FileInfo& info, SftpError& err) override;
    bool mkdir(const std::string& remote_dir, SftpError& err, unsigned int mode = 0755) override;
    bool removeFile(const std::string& remote_path, SftpError& err) override;
    bool exec(const std::string& command, ExecResult& result, SftpError& err) override;
    void interrupt() override;

    // ---- Test knobs ----
    // Password required by connect(); empty accepts any credentials.
    void setAcceptedPassword(std::string pw) { acceptedPassword_ = std::move(pw); }
    // false makes connect() fail with NetworkError.
    void setReachable(bool v) { reachable_ = v; }
    // false simulates a host missing from known_hosts.
    void setHostKnown(bool v) { hostKnown_ = v; }
    // The next exec() returns this exit status and stderr without running.
    void failNextExec(int exitCode, std::string stderrText);
    // removeFile() fails with RemoteIOError for every path.
    void setRemoveFailure(bool v) { removeFails_ = v; }
    // stat() fails with RemoteIOError for paths under this prefix.
    void setStatFailure(std::string prefix) { statFailPrefix_ = std::move(prefix); }
    // Simulated run time of every exec(). Exceeding the session's
    // command_timeout_sec drops the connection like the libssh2 backend.
    void setExecDuration(int seconds) { execDurationSec_ = seconds; }
    // Bytes moved per get/put step (progress granularity).
    void setChunkSize(std::size_t n) { chunk_ = n ? n : 1; }
    // Per chunk, after progress; lets tests observe an in-flight transfer.
    void setChunkHook(std::function<void()> hook) { chunkHook_ = std::move(hook); }

    std::vector<std::string> execLog() const;
    const std::string& sandboxRoot() const { return root_; }
    // Local path backing a remote path ("" when it escapes the sandbox).
    std::string localPathFor(const std::string& remote) const;

private:
    std::string root_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    SessionOptions lastOpt_{};

    std::string acceptedPassword_;
    bool reachable_ = true;
    bool hostKnown_ = true;
    bool removeFails_ = false;
    std::size_t chunk_ = 64 * 1024;
    int execDurationSec_ = 0;
    std::string statFailPrefix_;
    std::function<void()> chunkHook_;

    mutable std::mutex logMutex_;
    std::vector<std::string> execLog_;
    bool failExec_ = false;
    int failExitCode_ = 0;
    std::string failStderr_;

    bool requireConnected(SftpError& err) const;
    bool resolve(const std::string& remote, std::string& local, SftpError& err) const;
    bool copyStream(const std::string& from, const std::string& to, bool upload,
                    SftpError& err, const ProgressFn& progress, const CancelFn& shouldCancel);
    int runCommand(const std::vector<std::string>& argv, std::string& stderrText);
};

} // namespace prosftp
