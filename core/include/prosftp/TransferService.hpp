// Front-end facing facade: one session, its lister and a single background
// worker running transfer tasks. Each started task hands back the channel its
// progress, status lines and final report arrive on.
#pragma once
#include "ProgressChannel.hpp"
#include "RemoteBrowser.hpp"
#include "SessionManager.hpp"
#include "TransferEngine.hpp"
#include <memory>
#include <mutex>
#include <thread>

namespace prosftp {

class TransferService {
public:
    explicit TransferService(std::unique_ptr<SftpClient> client,
                             TransferConfig cfg = TransferConfig::fromEnvironment());
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    bool connect(const SessionOptions& opt, SftpError& err);
    // Aborts a running task first and waits for it.
    void disconnect();
    bool isConnected() const { return session_.isConnected(); }

    bool listRemote(const std::string& path, std::vector<FileInfo>& out, SftpError& err);
    bool makeRemoteDirectory(const std::string& path, SftpError& err);

    // Starts a task on the worker thread. Returns nullptr with Busy or
    // NotConnected in err when the session cannot be leased.
    std::shared_ptr<ProgressChannel> start(const TransferTask& task, SftpError& err);

    std::shared_ptr<ProgressChannel> uploadFiles(const std::vector<std::string>& localPaths,
                                                 const std::string& remoteDir, SftpError& err);
    std::shared_ptr<ProgressChannel> uploadFolder(const std::string& localDir, const std::string& remoteDir,
                                                  bool extractRemotely, SftpError& err);
    std::shared_ptr<ProgressChannel> downloadFiles(const std::vector<std::string>& remotePaths,
                                                   const std::string& localDir, SftpError& err);
    std::shared_ptr<ProgressChannel> downloadFolder(const std::string& remoteDir, const std::string& localDir,
                                                    bool extractLocally, SftpError& err);

    // Cooperative: the task stops at the next chunk or step boundary.
    void cancel();
    // Hard: also closes the connection under the running task.
    void abort();
    bool isRunning() const { return session_.isBusy(); }
    // Blocks until the worker of the last task has exited.
    void wait();

    SessionManager& session() { return session_; }
    RemoteBrowser& browser() { return browser_; }
    const TransferEngine& engine() const { return engine_; }

private:
    SessionManager session_;
    RemoteBrowser browser_;
    TransferEngine engine_;

    std::mutex mtx_; // guards worker_ and current_
    std::thread worker_;
    std::shared_ptr<ProgressChannel> current_;
};

} // namespace prosftp
