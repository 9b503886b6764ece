// Abstract interface for SSH/SFTP operations. Concrete implementations
// (libssh2, mock) must follow this API to keep the transfer logic decoupled
// from the backend.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>

namespace prosftp {

class SftpClient {
public:
    using ProgressFn = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelFn = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, SftpError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." excluded, unsorted)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      SftpError& err) = 0;

    // Download a remote file to a local path, creating/truncating it.
    // shouldCancel is polled between chunks; a cancelled call returns false
    // with ErrorKind::Cancelled and leaves the partial file behind.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     SftpError& err,
                     ProgressFn progress = {},
                     CancelFn shouldCancel = {}) = 0;

    // Upload a local file to a remote path, creating/truncating it.
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     SftpError& err,
                     ProgressFn progress = {},
                     CancelFn shouldCancel = {}) = 0;

    // Check existence (leaves err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        SftpError& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      SftpError& err) = 0;

    // Single-level mkdir; parents must exist.
    virtual bool mkdir(const std::string& remote_dir,
                       SftpError& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            SftpError& err) = 0;

    // Run a shell command on the remote host and collect its exit status
    // and output. A non-zero exit is not an error of exec() itself.
    virtual bool exec(const std::string& command,
                      ExecResult& result,
                      SftpError& err) = 0;

    // Force blocking I/O to fail fast. Safe to call from another thread.
    // The connection is unusable afterwards.
    virtual void interrupt() = 0;
};

} // namespace prosftp
