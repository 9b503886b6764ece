// Transfer tasks, their reports and the tunables of the transfer engine.
#pragma once
#include "SftpTypes.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prosftp {

enum class TransferKind { UploadFiles, UploadFolder, DownloadFiles, DownloadFolder };

enum class TransferStatus { Success, Cancelled, Failed };

// Step of a task that produced the primary error.
enum class TransferPhase {
    None,
    Prepare,  // argument checks, stat, mkdir -p
    Archive,  // local or remote compression
    Transfer, // put/get
    Extract   // local or remote extraction
};

// One user request. Sources are local paths for uploads and remote paths for
// downloads; destination is the directory on the other side.
struct TransferTask {
    TransferKind kind = TransferKind::UploadFiles;
    std::vector<std::string> sources;
    std::string destination;
    bool extract = false; // folder kinds only
};

struct TransferReport {
    TransferStatus status = TransferStatus::Success;
    SftpError error;                    // empty on success
    TransferPhase failed_phase = TransferPhase::None;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::vector<std::string> outputs;        // files/folders produced on the destination side
    std::vector<std::string> cleanup_issues; // failed best-effort cleanups, never fatal
    bool connection_lost = false;            // hard cancel or transport failure

    bool ok() const { return status == TransferStatus::Success; }
    std::string summary() const;
};

struct TransferConfig {
    // Progress is forwarded at most once per step or interval, whichever
    // comes first, plus at the start and the end of each transfer.
    std::uint64_t progress_step_bytes = 64 * 1024;
    std::chrono::milliseconds progress_interval{100};
    // Remote directory for transient archives of folder downloads.
    std::string remote_scratch_dir = "/tmp";
    // Local directory for transient archives of folder uploads; empty means
    // the system temp directory.
    std::string local_temp_dir;

    // Defaults overridden by PRO_SFTP_PROGRESS_STEP_KB, PRO_SFTP_PROGRESS_MS,
    // PRO_SFTP_SCRATCH_DIR and PRO_SFTP_TMPDIR.
    static TransferConfig fromEnvironment();
};

const char* transferKindName(TransferKind kind);
const char* transferStatusName(TransferStatus status);
const char* transferPhaseName(TransferPhase phase);

} // namespace prosftp
