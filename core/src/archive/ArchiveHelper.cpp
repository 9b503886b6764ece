#include "prosftp/ArchiveHelper.hpp"
#include "prosftp/Log.hpp"
#include "prosftp/RemotePath.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <random>

namespace fs = std::filesystem;

namespace prosftp {
namespace archive {

namespace {

std::string trimmed(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// tar treats a leading '-' as an option.
std::string safeOperand(const std::string& word) {
    return (!word.empty() && word[0] == '-') ? "./" + word : word;
}

bool runTar(SftpClient& client, const std::string& command, const char* what, SftpError& err) {
    ExecResult res;
    PROSFTP_LOGD("exec: %s", command.c_str());
    if (!client.exec(command, res, err)) return false;
    if (res.exit_code != 0) {
        std::string detail = trimmed(res.err);
        if (detail.empty()) detail = trimmed(res.out);
        err.set(ErrorKind::RemoteCommandError,
                std::string(what) + " failed (exit " + std::to_string(res.exit_code) + ")" +
                    (detail.empty() ? std::string() : ": " + detail));
        PROSFTP_LOGW("%s", err.message.c_str());
        return false;
    }
    return true;
}

} // namespace

bool compressLocal(const std::string& dirPath, std::string& archivePath, SftpError& err,
                   const std::string& tempDir) {
    std::error_code ec;
    fs::path dir = tempDir.empty() ? fs::temp_directory_path(ec) : fs::path(tempDir);
    if (ec) {
        err.set(ErrorKind::LocalIOError, "No temporary directory: " + ec.message());
        return false;
    }
    fs::path src = fs::path(dirPath).lexically_normal();
    if (!src.has_filename()) src = src.parent_path();
    const fs::path out = dir / ("prosftp-" + uniqueSuffix() + "_" + src.filename().string() + ".tar.gz");
    if (!createTarGz(dirPath, out.string(), err)) return false;
    archivePath = out.string();
    return true;
}

std::string removeLocal(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (!ec) return {};
    const std::string note = "Could not remove local " + path + ": " + ec.message();
    PROSFTP_LOGW("%s", note.c_str());
    return note;
}

std::string compressCommand(const std::string& dirPath, const std::string& destArchive) {
    const std::string dir = normalizeRemote(dirPath);
    return "tar -czf " + shellQuote(destArchive) + " -C " + shellQuote(parentRemote(dir)) + " " +
           shellQuote(safeOperand(baseNameRemote(dir)));
}

std::string extractCommand(const std::string& archivePath, const std::string& destDir) {
    return "tar -xzf " + shellQuote(safeOperand(archivePath)) + " -C " + shellQuote(normalizeRemote(destDir));
}

bool compressRemote(SftpClient& client, const std::string& dirPath,
                    const std::string& destArchive, SftpError& err) {
    if (normalizeRemote(dirPath) == "/") {
        err.set(ErrorKind::RemoteIOError, "Refusing to archive the remote root");
        return false;
    }
    return runTar(client, compressCommand(dirPath, destArchive), "Remote compression", err);
}

bool extractRemote(SftpClient& client, const std::string& archivePath,
                   const std::string& destDir, SftpError& err) {
    return runTar(client, extractCommand(archivePath, destDir), "Remote extraction", err);
}

std::string removeRemote(SftpClient& client, const std::string& path) {
    if (!client.isConnected()) {
        const std::string note = "Could not remove remote " + path + ": not connected";
        PROSFTP_LOGW("%s", note.c_str());
        return note;
    }
    SftpError err;
    if (client.removeFile(path, err)) return {};
    const std::string note = "Could not remove remote " + path + ": " + err.message;
    PROSFTP_LOGW("%s", note.c_str());
    return note;
}

std::string uniqueSuffix() {
    static std::mt19937 rng{std::random_device{}()};
    static std::mutex m;
    std::uint32_t r;
    {
        std::lock_guard<std::mutex> lk(m);
        r = static_cast<std::uint32_t>(rng());
    }
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08x", r);
    return std::to_string(static_cast<long long>(std::time(nullptr))) + "_" + hex;
}

} // namespace archive
} // namespace prosftp
