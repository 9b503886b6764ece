// File and folder transfers over a leased session. Every operation runs to
// completion on the calling thread and returns a TransferReport; errors never
// escape as exceptions.
#pragma once
#include "CancelToken.hpp"
#include "SessionManager.hpp"
#include "TransferTypes.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace prosftp {

class TransferEngine {
public:
    // (bytesDone, bytesTotal) aggregated over the whole task.
    using ProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;
    // Human readable step descriptions ("Compressing photos").
    using StatusFn = std::function<void(const std::string&)>;

    explicit TransferEngine(TransferConfig cfg = {}) : cfg_(std::move(cfg)) {}

    // Dispatches on task.kind.
    TransferReport run(const SessionManager::Lease& lease, const TransferTask& task,
                       const ProgressFn& progress, const CancelToken& cancel,
                       const StatusFn& status = {}) const;

    // remoteDir/basename(localPath)
    TransferReport uploadFile(const SessionManager::Lease& lease, const std::string& localPath,
                              const std::string& remoteDir, const ProgressFn& progress,
                              const CancelToken& cancel) const;
    // localDir/basename(remotePath); localDir is created when missing.
    TransferReport downloadFile(const SessionManager::Lease& lease, const std::string& remotePath,
                                const std::string& localDir, const ProgressFn& progress,
                                const CancelToken& cancel) const;

    TransferReport uploadFiles(const SessionManager::Lease& lease, const std::vector<std::string>& localPaths,
                               const std::string& remoteDir, const ProgressFn& progress,
                               const CancelToken& cancel, const StatusFn& status = {}) const;
    TransferReport downloadFiles(const SessionManager::Lease& lease, const std::vector<std::string>& remotePaths,
                                 const std::string& localDir, const ProgressFn& progress,
                                 const CancelToken& cancel, const StatusFn& status = {}) const;

    // Local tar.gz, mkdir -p remoteDir, upload as remoteDir/<folder>.tar.gz,
    // optional remote extraction.
    TransferReport uploadFolder(const SessionManager::Lease& lease, const std::string& localDir,
                                const std::string& remoteDir, bool extractRemotely,
                                const ProgressFn& progress, const CancelToken& cancel,
                                const StatusFn& status = {}) const;
    // Remote tar.gz in the scratch directory, download into localDir, optional
    // local extraction.
    TransferReport downloadFolder(const SessionManager::Lease& lease, const std::string& remoteDir,
                                  const std::string& localDir, bool extractLocally,
                                  const ProgressFn& progress, const CancelToken& cancel,
                                  const StatusFn& status = {}) const;

    const TransferConfig& config() const { return cfg_; }

private:
    TransferConfig cfg_;
};

} // namespace prosftp
