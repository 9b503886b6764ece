#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>
#include <vector>

// Forward declarations of libssh2's internal (underscored) types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace prosftp {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Libssh2SftpClient(const Libssh2SftpClient&) = delete;
    Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

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

    bool exists(const std::string& remote_path,
                bool& isDir,
                SftpError& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              SftpError& err) override;

    bool mkdir(const std::string& remote_dir,
               SftpError& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    SftpError& err) override;

    bool exec(const std::string& command,
              ExecResult& result,
              SftpError& err) override;

    void interrupt() override;

private:
    std::atomic<bool> connected_{false};
    std::atomic<int>  sock_{-1};
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;
    int sessionTimeoutMs_ = 20000;
    int commandTimeoutSec_ = 0;

    bool tcpConnect(const std::string& host, uint16_t port, int timeoutSec, SftpError& err);
    bool verifyHostKey(const SessionOptions& opt, SftpError& err);
    bool authenticate(const SessionOptions& opt, SftpError& err);
    bool ensureConnected(SftpError& err) const;
    std::string lastSessionError() const;
    // Maps the last libssh2/SFTP failure to RemoteIOError or NetworkError.
    void setRemoteError(SftpError& err, const std::string& what);
    bool waitSocket(int timeoutMs) const;
};

} // namespace prosftp
