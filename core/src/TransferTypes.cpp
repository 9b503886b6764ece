#include "prosftp/TransferTypes.hpp"
#include "prosftp/RuntimeLogging.hpp"

namespace prosftp {

const char* transferKindName(TransferKind kind) {
    switch (kind) {
    case TransferKind::UploadFiles:
        return "UploadFiles";
    case TransferKind::UploadFolder:
        return "UploadFolder";
    case TransferKind::DownloadFiles:
        return "DownloadFiles";
    case TransferKind::DownloadFolder:
        return "DownloadFolder";
    }
    return "Unknown";
}

const char* transferStatusName(TransferStatus status) {
    switch (status) {
    case TransferStatus::Success:
        return "Success";
    case TransferStatus::Cancelled:
        return "Cancelled";
    case TransferStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* transferPhaseName(TransferPhase phase) {
    switch (phase) {
    case TransferPhase::None:
        return "None";
    case TransferPhase::Prepare:
        return "Prepare";
    case TransferPhase::Archive:
        return "Archive";
    case TransferPhase::Transfer:
        return "Transfer";
    case TransferPhase::Extract:
        return "Extract";
    }
    return "Unknown";
}

std::string TransferReport::summary() const {
    std::string out = transferStatusName(status);
    if (status == TransferStatus::Failed) {
        out += std::string(" during ") + transferPhaseName(failed_phase);
        if (!error.empty()) out += ": " + error.describe();
    }
    out += " (" + std::to_string(bytes_done) + "/" + std::to_string(bytes_total) + " bytes)";
    if (!cleanup_issues.empty())
        out += ", " + std::to_string(cleanup_issues.size()) + " cleanup issue(s)";
    return out;
}

TransferConfig TransferConfig::fromEnvironment() {
    TransferConfig cfg;
    cfg.progress_step_bytes =
        static_cast<std::uint64_t>(envPositiveLong("PRO_SFTP_PROGRESS_STEP_KB", 64)) * 1024;
    cfg.progress_interval =
        std::chrono::milliseconds(envPositiveLong("PRO_SFTP_PROGRESS_MS", 100));
    const std::string scratch = rawEnv("PRO_SFTP_SCRATCH_DIR");
    if (!scratch.empty()) cfg.remote_scratch_dir = scratch;
    cfg.local_temp_dir = rawEnv("PRO_SFTP_TMPDIR");
    return cfg;
}

} // namespace prosftp
