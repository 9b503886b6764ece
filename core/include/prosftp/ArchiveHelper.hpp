// tar.gz archives of whole directories, created and extracted either on the
// local machine (zlib + ustar framing) or on the remote host (tar over exec).
#pragma once
#include "SftpClient.hpp"
#include <string>

namespace prosftp {
namespace archive {

// ---- Local side ----------------------------------------------------------

// Writes a gzip-compressed tar of dirPath to archivePath. Entry names are
// rooted at the directory's own name ("photos/a.jpg"), so extraction
// recreates the folder.
bool createTarGz(const std::string& dirPath, const std::string& archivePath, SftpError& err);

// createTarGz into a fresh file under tempDir (system temp dir when empty).
bool compressLocal(const std::string& dirPath, std::string& archivePath, SftpError& err,
                   const std::string& tempDir = {});

// Extracts a tar.gz (ustar, GNU or pax) into destDir, creating it if needed.
// Entries with absolute paths, ".." components or paths through symlinks are
// rejected.
bool extractLocal(const std::string& archivePath, const std::string& destDir, SftpError& err);

// Best-effort removal; returns a diagnostic line on failure, empty otherwise.
std::string removeLocal(const std::string& path);

// ---- Remote side ---------------------------------------------------------

std::string compressCommand(const std::string& dirPath, const std::string& destArchive);
std::string extractCommand(const std::string& archivePath, const std::string& destDir);

// tar -czf destArchive -C parent(dirPath) basename(dirPath)
bool compressRemote(SftpClient& client, const std::string& dirPath,
                    const std::string& destArchive, SftpError& err);
// tar -xzf archivePath -C destDir
bool extractRemote(SftpClient& client, const std::string& archivePath,
                   const std::string& destDir, SftpError& err);
// Best-effort removal; logged, never raised. Returns a diagnostic line on
// failure, empty otherwise.
std::string removeRemote(SftpClient& client, const std::string& path);

// Collision-resistant suffix: "<unix-seconds>_<8 hex chars>".
std::string uniqueSuffix();

} // namespace archive
} // namespace prosftp
