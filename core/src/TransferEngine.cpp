#include "prosftp/TransferEngine.hpp"
#include "prosftp/ArchiveHelper.hpp"
#include "prosftp/Log.hpp"
#include "prosftp/ProgressChannel.hpp"
#include "prosftp/RemoteBrowser.hpp"
#include "prosftp/RemotePath.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace prosftp {

namespace {

// State of one task: aggregated progress, the report being built and the
// collaborators every step needs.
class TransferRun {
public:
    TransferRun(const SessionManager::Lease& lease, const TransferConfig& cfg,
                const TransferEngine::ProgressFn& progress, const CancelToken& cancel,
                const TransferEngine::StatusFn& status)
        : client_(lease ? &lease.client() : nullptr),
          progress_(progress),
          status_(status),
          cancel_(cancel),
          throttle_(cfg.progress_step_bytes, cfg.progress_interval) {}

    bool ready() {
        if (client_) return true;
        SftpError err;
        err.set(ErrorKind::NotConnected, "No session lease");
        return fail(TransferPhase::Prepare, err);
    }

    SftpClient& client() { return *client_; }
    TransferReport& report() { return report_; }
    const CancelToken& cancelToken() const { return cancel_; }

    void status(const std::string& text) {
        PROSFTP_LOGD("%s", text.c_str());
        if (status_) status_(text);
    }

    void setTotal(std::uint64_t total) { report_.bytes_total = total; }

    void emit(std::uint64_t done, bool force = false) {
        if (done < report_.bytes_done) done = report_.bytes_done;
        report_.bytes_done = done;
        if (!progress_) return;
        if (throttle_.shouldEmit(done, report_.bytes_total) || force)
            progress_(done, report_.bytes_total);
    }

    // Per-file progress of get/put offset by the files already finished.
    SftpClient::ProgressFn fileProgress(bool& started) {
        return [this, &started](std::size_t done, std::size_t total) {
            started = true;
            // A total that could not be known up front comes from the transfer.
            if (base_ + total > report_.bytes_total) report_.bytes_total = base_ + total;
            emit(base_ + done);
        };
    }

    void fileDone(std::uint64_t size) {
        base_ += size;
        emit(base_);
    }

    bool cancelled() {
        if (!cancel_.isCancelled()) return false;
        report_.status = TransferStatus::Cancelled;
        report_.error.set(ErrorKind::Cancelled, "Cancelled by user");
        return true;
    }

    // Records the primary error; always returns false.
    bool fail(TransferPhase phase, const SftpError& err) {
        report_.error = err;
        report_.connection_lost = err.kind == ErrorKind::NetworkError || (client_ && !client_->isConnected());
        if (err.kind == ErrorKind::Cancelled || (report_.connection_lost && cancel_.isCancelled())) {
            report_.status = TransferStatus::Cancelled;
            if (err.kind != ErrorKind::Cancelled)
                report_.error.set(ErrorKind::Cancelled, "Cancelled by user (connection closed)");
        } else {
            report_.status = TransferStatus::Failed;
            report_.failed_phase = phase;
        }
        return false;
    }

    void cleanup(const std::string& note) {
        if (!note.empty()) report_.cleanup_issues.push_back(note);
    }

    void discardRemote(const std::string& path) {
        if (!client_->isConnected()) {
            cleanup("Partial remote file left behind: " + path);
            return;
        }
        FileInfo fi;
        SftpError err;
        if (client_->stat(path, fi, err)) cleanup(archive::removeRemote(*client_, path));
    }

    void discardLocal(const std::string& path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) cleanup("Could not remove partial local file " + path + ": " + ec.message());
    }

    TransferReport take() {
        if (report_.ok())
            PROSFTP_LOGI("Transfer finished: %s", report_.summary().c_str());
        else
            PROSFTP_LOGW("Transfer finished: %s", report_.summary().c_str());
        return std::move(report_);
    }

private:
    SftpClient* client_;
    const TransferEngine::ProgressFn& progress_;
    const TransferEngine::StatusFn& status_;
    const CancelToken& cancel_;
    ProgressThrottle throttle_;
    TransferReport report_;
    std::uint64_t base_ = 0;
};

bool ensureLocalDir(TransferRun& run, const std::string& localDir) {
    std::error_code ec;
    fs::create_directories(localDir, ec);
    if (ec || !fs::is_directory(localDir, ec)) {
        SftpError err;
        err.set(ErrorKind::LocalIOError, "Could not create local directory " + localDir +
                                             (ec ? ": " + ec.message() : std::string()));
        return run.fail(TransferPhase::Prepare, err);
    }
    return true;
}

bool uploadMany(TransferRun& run, const std::vector<std::string>& locals, const std::string& remoteDir) {
    SftpError err;
    if (locals.empty()) {
        err.set(ErrorKind::LocalIOError, "Nothing to upload");
        return run.fail(TransferPhase::Prepare, err);
    }
    std::vector<std::uint64_t> sizes;
    std::uint64_t total = 0;
    for (const auto& p : locals) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            err.set(ErrorKind::LocalIOError, "Not a regular file: " + p);
            return run.fail(TransferPhase::Prepare, err);
        }
        const auto size = fs::file_size(p, ec);
        if (ec) {
            err.set(ErrorKind::LocalIOError, "Could not stat " + p + ": " + ec.message());
            return run.fail(TransferPhase::Prepare, err);
        }
        sizes.push_back(size);
        total += size;
    }
    if (!makeRemoteDirectories(run.client(), remoteDir, err)) return run.fail(TransferPhase::Prepare, err);

    run.setTotal(total);
    run.emit(0, true);
    for (std::size_t i = 0; i < locals.size(); ++i) {
        if (run.cancelled()) return false;
        const std::string name = fs::path(locals[i]).filename().string();
        const std::string remote = joinRemote(remoteDir, name);
        run.status("Uploading " + name);
        bool started = false;
        if (!run.client().put(locals[i], remote, err, run.fileProgress(started),
                              run.cancelToken().asPredicate())) {
            if (started || err.kind == ErrorKind::Cancelled) run.discardRemote(remote);
            return run.fail(TransferPhase::Transfer, err);
        }
        run.fileDone(sizes[i]);
        run.report().outputs.push_back(remote);
    }
    return true;
}

bool downloadMany(TransferRun& run, const std::vector<std::string>& remotes, const std::string& localDir) {
    SftpError err;
    if (remotes.empty()) {
        err.set(ErrorKind::RemoteIOError, "Nothing to download");
        return run.fail(TransferPhase::Prepare, err);
    }
    std::vector<std::uint64_t> sizes;
    std::uint64_t total = 0;
    for (const auto& r : remotes) {
        FileInfo info;
        if (!run.client().stat(r, info, err)) {
            if (err.empty()) err.set(ErrorKind::RemoteIOError, "No such remote file: " + r);
            return run.fail(TransferPhase::Prepare, err);
        }
        if (info.is_dir) {
            err.set(ErrorKind::RemoteIOError, "Is a directory: " + r);
            return run.fail(TransferPhase::Prepare, err);
        }
        sizes.push_back(info.size);
        total += info.size;
    }
    if (!ensureLocalDir(run, localDir)) return false;

    run.setTotal(total);
    run.emit(0, true);
    for (std::size_t i = 0; i < remotes.size(); ++i) {
        if (run.cancelled()) return false;
        const std::string name = baseNameRemote(remotes[i]);
        const std::string local = (fs::path(localDir) / name).string();
        run.status("Downloading " + name);
        bool started = false;
        if (!run.client().get(remotes[i], local, err, run.fileProgress(started),
                              run.cancelToken().asPredicate())) {
            if (started || err.kind == ErrorKind::Cancelled) run.discardLocal(local);
            return run.fail(TransferPhase::Transfer, err);
        }
        run.fileDone(sizes[i]);
        run.report().outputs.push_back(local);
    }
    return true;
}

bool uploadFolderSteps(TransferRun& run, const TransferConfig& cfg, const std::string& localDir,
                       const std::string& remoteDir, bool extract) {
    SftpError err;
    std::error_code ec;
    fs::path src = fs::path(localDir).lexically_normal();
    if (!src.has_filename()) src = src.parent_path();
    if (!fs::is_directory(src, ec)) {
        err.set(ErrorKind::LocalIOError, "Not a directory: " + localDir);
        return run.fail(TransferPhase::Prepare, err);
    }
    const std::string folder = src.filename().string();
    const std::string target = normalizeRemote(remoteDir);

    run.status("Compressing " + folder);
    std::string localArchive;
    if (!archive::compressLocal(src.string(), localArchive, err, cfg.local_temp_dir))
        return run.fail(TransferPhase::Archive, err);
    if (run.cancelled()) {
        run.cleanup(archive::removeLocal(localArchive));
        return false;
    }
    const auto size = fs::file_size(localArchive, ec);
    run.setTotal(ec ? 0 : size);
    run.emit(0, true);

    if (!makeRemoteDirectories(run.client(), target, err)) {
        run.cleanup(archive::removeLocal(localArchive));
        return run.fail(TransferPhase::Prepare, err);
    }

    const std::string remoteArchive = joinRemote(target, folder + ".tar.gz");
    run.status("Uploading " + folder + ".tar.gz");
    bool started = false;
    const bool sent = run.client().put(localArchive, remoteArchive, err, run.fileProgress(started),
                                       run.cancelToken().asPredicate());
    run.cleanup(archive::removeLocal(localArchive));
    if (!sent) {
        if (started || err.kind == ErrorKind::Cancelled) run.discardRemote(remoteArchive);
        return run.fail(TransferPhase::Transfer, err);
    }
    run.fileDone(run.report().bytes_total);

    if (!extract) {
        run.report().outputs.push_back(remoteArchive);
        return true;
    }
    if (run.cancelled()) {
        run.cleanup(archive::removeRemote(run.client(), remoteArchive));
        return false;
    }
    run.status("Extracting " + folder + " on the remote host");
    if (!archive::extractRemote(run.client(), remoteArchive, target, err)) {
        // The archive stays for diagnosis.
        run.report().outputs.push_back(remoteArchive);
        return run.fail(TransferPhase::Extract, err);
    }
    run.cleanup(archive::removeRemote(run.client(), remoteArchive));
    run.report().outputs.push_back(joinRemote(target, folder));
    return true;
}

bool downloadFolderSteps(TransferRun& run, const TransferConfig& cfg, const std::string& remoteDir,
                         const std::string& localDir, bool extract) {
    SftpError err;
    const std::string source = normalizeRemote(remoteDir);
    if (source == "/") {
        err.set(ErrorKind::RemoteIOError, "Refusing to archive the remote root");
        return run.fail(TransferPhase::Prepare, err);
    }
    FileInfo info;
    if (!run.client().stat(source, info, err)) {
        if (err.empty()) err.set(ErrorKind::RemoteIOError, "No such remote directory: " + source);
        return run.fail(TransferPhase::Prepare, err);
    }
    if (!info.is_dir) {
        err.set(ErrorKind::RemoteIOError, "Not a directory: " + source);
        return run.fail(TransferPhase::Prepare, err);
    }
    if (!ensureLocalDir(run, localDir)) return false;

    const std::string folder = baseNameRemote(source);
    const std::string scratch =
        joinRemote(cfg.remote_scratch_dir, folder + "_" + archive::uniqueSuffix() + ".tar.gz");

    run.status("Compressing " + folder + " on the remote host");
    if (!archive::compressRemote(run.client(), source, scratch, err)) {
        run.discardRemote(scratch);
        return run.fail(TransferPhase::Archive, err);
    }
    if (run.cancelled()) {
        run.cleanup(archive::removeRemote(run.client(), scratch));
        return false;
    }
    FileInfo archiveInfo;
    SftpError statErr;
    if (run.client().stat(scratch, archiveInfo, statErr)) run.setTotal(archiveInfo.size);
    run.emit(0, true);

    const std::string localArchive = (fs::path(localDir) / baseNameRemote(scratch)).string();
    run.status("Downloading " + folder);
    bool started = false;
    const bool got = run.client().get(scratch, localArchive, err, run.fileProgress(started),
                                      run.cancelToken().asPredicate());
    run.cleanup(archive::removeRemote(run.client(), scratch));
    if (!got) {
        if (started || err.kind == ErrorKind::Cancelled) run.discardLocal(localArchive);
        return run.fail(TransferPhase::Transfer, err);
    }
    run.fileDone(run.report().bytes_total);

    if (!extract) {
        run.report().outputs.push_back(localArchive);
        return true;
    }
    if (run.cancelled()) {
        run.discardLocal(localArchive);
        return false;
    }
    run.status("Extracting " + folder);
    if (!archive::extractLocal(localArchive, localDir, err)) {
        run.report().outputs.push_back(localArchive);
        return run.fail(TransferPhase::Extract, err);
    }
    run.cleanup(archive::removeLocal(localArchive));
    run.report().outputs.push_back((fs::path(localDir) / folder).string());
    return true;
}

} // namespace

TransferReport TransferEngine::run(const SessionManager::Lease& lease, const TransferTask& task,
                                   const ProgressFn& progress, const CancelToken& cancel,
                                   const StatusFn& status) const {
    PROSFTP_LOGI("%s: %zu source(s) -> %s", transferKindName(task.kind), task.sources.size(),
                 redacted(task.destination).c_str());
    const bool folder = task.kind == TransferKind::UploadFolder || task.kind == TransferKind::DownloadFolder;
    if (folder && task.sources.size() != 1) {
        TransferRun run(lease, cfg_, progress, cancel, status);
        SftpError err;
        err.set(task.kind == TransferKind::UploadFolder ? ErrorKind::LocalIOError : ErrorKind::RemoteIOError,
                "A folder transfer takes exactly one source");
        run.fail(TransferPhase::Prepare, err);
        return run.take();
    }
    switch (task.kind) {
    case TransferKind::UploadFiles:
        return uploadFiles(lease, task.sources, task.destination, progress, cancel, status);
    case TransferKind::DownloadFiles:
        return downloadFiles(lease, task.sources, task.destination, progress, cancel, status);
    case TransferKind::UploadFolder:
        return uploadFolder(lease, task.sources.front(), task.destination, task.extract, progress, cancel, status);
    case TransferKind::DownloadFolder:
        return downloadFolder(lease, task.sources.front(), task.destination, task.extract, progress, cancel,
                              status);
    }
    return TransferReport{};
}

TransferReport TransferEngine::uploadFile(const SessionManager::Lease& lease, const std::string& localPath,
                                          const std::string& remoteDir, const ProgressFn& progress,
                                          const CancelToken& cancel) const {
    return uploadFiles(lease, {localPath}, remoteDir, progress, cancel);
}

TransferReport TransferEngine::downloadFile(const SessionManager::Lease& lease, const std::string& remotePath,
                                            const std::string& localDir, const ProgressFn& progress,
                                            const CancelToken& cancel) const {
    return downloadFiles(lease, {remotePath}, localDir, progress, cancel);
}

TransferReport TransferEngine::uploadFiles(const SessionManager::Lease& lease,
                                           const std::vector<std::string>& localPaths,
                                           const std::string& remoteDir, const ProgressFn& progress,
                                           const CancelToken& cancel, const StatusFn& status) const {
    TransferRun run(lease, cfg_, progress, cancel, status);
    if (run.ready()) uploadMany(run, localPaths, remoteDir);
    return run.take();
}

TransferReport TransferEngine::downloadFiles(const SessionManager::Lease& lease,
                                             const std::vector<std::string>& remotePaths,
                                             const std::string& localDir, const ProgressFn& progress,
                                             const CancelToken& cancel, const StatusFn& status) const {
    TransferRun run(lease, cfg_, progress, cancel, status);
    if (run.ready()) downloadMany(run, remotePaths, localDir);
    return run.take();
}

TransferReport TransferEngine::uploadFolder(const SessionManager::Lease& lease, const std::string& localDir,
                                            const std::string& remoteDir, bool extractRemotely,
                                            const ProgressFn& progress, const CancelToken& cancel,
                                            const StatusFn& status) const {
    TransferRun run(lease, cfg_, progress, cancel, status);
    if (run.ready()) uploadFolderSteps(run, cfg_, localDir, remoteDir, extractRemotely);
    return run.take();
}

TransferReport TransferEngine::downloadFolder(const SessionManager::Lease& lease, const std::string& remoteDir,
                                              const std::string& localDir, bool extractLocally,
                                              const ProgressFn& progress, const CancelToken& cancel,
                                              const StatusFn& status) const {
    TransferRun run(lease, cfg_, progress, cancel, status);
    if (run.ready()) downloadFolderSteps(run, cfg_, remoteDir, localDir, extractLocally);
    return run.take();
}

} // namespace prosftp
