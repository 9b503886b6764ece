#include "prosftp/TransferService.hpp"
#include "prosftp/Log.hpp"

namespace prosftp {

TransferService::TransferService(std::unique_ptr<SftpClient> client, TransferConfig cfg)
    : session_(std::move(client)), browser_(session_), engine_(std::move(cfg)) {}

TransferService::~TransferService() {
    abort();
    wait();
}

bool TransferService::connect(const SessionOptions& opt, SftpError& err) {
    return session_.connect(opt, err);
}

void TransferService::disconnect() {
    if (isRunning()) {
        PROSFTP_LOGW("Disconnect requested while a transfer is running; aborting it");
        abort();
    }
    wait();
    session_.disconnect();
}

bool TransferService::listRemote(const std::string& path, std::vector<FileInfo>& out, SftpError& err) {
    return browser_.list(path, out, err);
}

bool TransferService::makeRemoteDirectory(const std::string& path, SftpError& err) {
    return browser_.makeDirectory(path, err);
}

std::shared_ptr<ProgressChannel> TransferService::start(const TransferTask& task, SftpError& err) {
    err.clear();
    SessionManager::Lease lease = session_.acquire(err);
    if (!lease) {
        PROSFTP_LOGW("Cannot start %s: %s", transferKindName(task.kind), err.describe().c_str());
        return nullptr;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    // The previous worker released its lease, so it is done or about to be.
    if (worker_.joinable()) worker_.join();

    auto channel = std::make_shared<ProgressChannel>(CancelToken());
    current_ = channel;
    worker_ = std::thread([this, channel, task, lease = std::move(lease)]() mutable {
        TransferReport report = engine_.run(
            lease, task,
            [&channel](std::uint64_t done, std::uint64_t total) { channel->publishProgress(done, total); },
            channel->cancelToken(),
            [&channel](const std::string& text) { channel->publishStatus(text); });
        lease.release();
        channel->finish(std::move(report));
    });
    return channel;
}

std::shared_ptr<ProgressChannel> TransferService::uploadFiles(const std::vector<std::string>& localPaths,
                                                              const std::string& remoteDir, SftpError& err) {
    TransferTask task;
    task.kind = TransferKind::UploadFiles;
    task.sources = localPaths;
    task.destination = remoteDir;
    return start(task, err);
}

std::shared_ptr<ProgressChannel> TransferService::uploadFolder(const std::string& localDir,
                                                               const std::string& remoteDir,
                                                               bool extractRemotely, SftpError& err) {
    TransferTask task;
    task.kind = TransferKind::UploadFolder;
    task.sources = {localDir};
    task.destination = remoteDir;
    task.extract = extractRemotely;
    return start(task, err);
}

std::shared_ptr<ProgressChannel> TransferService::downloadFiles(const std::vector<std::string>& remotePaths,
                                                                const std::string& localDir, SftpError& err) {
    TransferTask task;
    task.kind = TransferKind::DownloadFiles;
    task.sources = remotePaths;
    task.destination = localDir;
    return start(task, err);
}

std::shared_ptr<ProgressChannel> TransferService::downloadFolder(const std::string& remoteDir,
                                                                 const std::string& localDir,
                                                                 bool extractLocally, SftpError& err) {
    TransferTask task;
    task.kind = TransferKind::DownloadFolder;
    task.sources = {remoteDir};
    task.destination = localDir;
    task.extract = extractLocally;
    return start(task, err);
}

void TransferService::cancel() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (current_) current_->requestCancel();
}

void TransferService::abort() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (current_) current_->requestCancel();
    }
    session_.interrupt();
}

void TransferService::wait() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (worker_.joinable()) worker_.join();
}

} // namespace prosftp
