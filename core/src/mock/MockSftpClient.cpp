#include "prosftp/MockSftpClient.hpp"
#include "prosftp/ArchiveHelper.hpp"
#include "prosftp/Log.hpp"
#include "prosftp/RemotePath.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace prosftp {

namespace {

// Shell words with '...' / "..." quoting and backslash escapes. "&&" is kept
// as its own token.
std::vector<std::string> shellSplit(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool inWord = false;
    for (std::size_t i = 0; i < cmd.size(); ++i) {
        const char c = cmd[i];
        if (c == '\'') {
            inWord = true;
            const std::size_t end = cmd.find('\'', i + 1);
            const std::size_t stop = end == std::string::npos ? cmd.size() : end;
            cur.append(cmd, i + 1, stop - i - 1);
            i = stop;
        } else if (c == '"') {
            inWord = true;
            for (++i; i < cmd.size() && cmd[i] != '"'; ++i) {
                if (cmd[i] == '\\' && i + 1 < cmd.size()) ++i;
                cur.push_back(cmd[i]);
            }
        } else if (c == '\\' && i + 1 < cmd.size()) {
            inWord = true;
            cur.push_back(cmd[++i]);
        } else if (c == ' ' || c == '\t') {
            if (inWord) out.push_back(cur);
            cur.clear();
            inWord = false;
        } else {
            inWord = true;
            cur.push_back(c);
        }
    }
    if (inWord) out.push_back(cur);
    return out;
}

void fillInfo(const std::string& name, const struct stat& sb, FileInfo& fi) {
    fi.name = name;
    fi.is_dir = S_ISDIR(sb.st_mode);
    fi.size = static_cast<std::uint64_t>(sb.st_size);
    fi.mtime = static_cast<std::uint64_t>(sb.st_mtime);
    fi.mode = static_cast<std::uint32_t>(sb.st_mode);
}

} // namespace

MockSftpClient::MockSftpClient(std::string sandboxRoot) : root_(std::move(sandboxRoot)) {
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
}

bool MockSftpClient::connect(const SessionOptions& opt, SftpError& err) {
    err.clear();
    interrupted_ = false;
    if (opt.host.empty()) {
        err.set(ErrorKind::NetworkError, "Host is required");
        return false;
    }
    if (opt.username.empty()) {
        err.set(ErrorKind::AuthError, "User is required");
        return false;
    }
    if (!reachable_) {
        err.set(ErrorKind::NetworkError, "Could not connect to " + opt.host);
        return false;
    }
    if (!hostKnown_) {
        switch (opt.known_hosts_policy) {
        case KnownHostsPolicy::Strict:
            err.set(ErrorKind::UntrustedHost, "Host not present in known_hosts");
            return false;
        case KnownHostsPolicy::AcceptNew:
            if (!opt.hostkey_confirm_cb ||
                !opt.hostkey_confirm_cb(opt.host, opt.port, "ssh-ed25519", "SHA256:mock-fingerprint")) {
                err.set(ErrorKind::UntrustedHost, "Host key rejected");
                return false;
            }
            hostKnown_ = true;
            break;
        case KnownHostsPolicy::Off:
            PROSFTP_LOGW("Host key verification disabled");
            break;
        }
    }
    if (!acceptedPassword_.empty() && (!opt.password || *opt.password != acceptedPassword_)) {
        err.set(ErrorKind::AuthError, "Authentication failed");
        return false;
    }
    lastOpt_ = opt;
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    connected_ = false;
}

void MockSftpClient::interrupt() {
    interrupted_ = true;
}

void MockSftpClient::failNextExec(int exitCode, std::string stderrText) {
    std::lock_guard<std::mutex> lk(logMutex_);
    failExec_ = true;
    failExitCode_ = exitCode;
    failStderr_ = std::move(stderrText);
}

std::vector<std::string> MockSftpClient::execLog() const {
    std::lock_guard<std::mutex> lk(logMutex_);
    return execLog_;
}

bool MockSftpClient::requireConnected(SftpError& err) const {
    if (!connected_) {
        err.set(ErrorKind::NotConnected, "Not connected");
        return false;
    }
    return true;
}

std::string MockSftpClient::localPathFor(const std::string& remote) const {
    std::string p = normalizeRemote(remote);
    if (p.front() != '/') p = "/" + p;
    for (const auto& comp : fs::path(p)) {
        if (comp == "..") return {};
    }
    return p == "/" ? root_ : root_ + p;
}

bool MockSftpClient::resolve(const std::string& remote, std::string& local, SftpError& err) const {
    local = localPathFor(remote);
    if (local.empty()) {
        err.set(ErrorKind::RemoteIOError, "Path escapes the remote root: " + remote);
        return false;
    }
    return true;
}

bool MockSftpClient::list(const std::string& remote_path, std::vector<FileInfo>& out, SftpError& err) {
    if (!requireConnected(err)) return false;
    std::string local;
    if (!resolve(remote_path, local, err)) return false;
    std::error_code ec;
    if (!fs::is_directory(local, ec)) {
        err.set(ErrorKind::RemoteIOError, "sftp_opendir failed for: " + normalizeRemote(remote_path));
        return false;
    }
    out.clear();
    for (fs::directory_iterator it(local, ec), end; !ec && it != end; it.increment(ec)) {
        struct stat sb{};
        if (::lstat(it->path().c_str(), &sb) != 0) continue;
        FileInfo fi;
        fillInfo(it->path().filename().string(), sb, fi);
        out.push_back(std::move(fi));
    }
    if (ec) {
        err.set(ErrorKind::RemoteIOError, "readdir failed: " + ec.message());
        return false;
    }
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path, FileInfo& info, SftpError& err) {
    if (!requireConnected(err)) return false;
    std::string local;
    if (!resolve(remote_path, local, err)) return false;
    if (!statFailPrefix_.empty() && normalizeRemote(remote_path).rfind(statFailPrefix_, 0) == 0) {
        err.set(ErrorKind::RemoteIOError, "stat failed: Permission denied");
        return false;
    }
    struct stat sb{};
    if (::stat(local.c_str(), &sb) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return false;
        err.set(ErrorKind::RemoteIOError, std::string("stat failed: ") + std::strerror(errno));
        return false;
    }
    fillInfo(baseNameRemote(remote_path), sb, info);
    info.path = normalizeRemote(remote_path);
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path, bool& isDir, SftpError& err) {
    isDir = false;
    FileInfo fi;
    if (!stat(remote_path, fi, err)) return false;
    isDir = fi.is_dir;
    return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir, SftpError& err, unsigned int mode) {
    if (!requireConnected(err)) return false;
    std::string local;
    if (!resolve(remote_dir, local, err)) return false;
    if (::mkdir(local.c_str(), static_cast<mode_t>(mode)) != 0) {
        err.set(ErrorKind::RemoteIOError, "mkdir failed for " + normalizeRemote(remote_dir) + ": " +
                                              std::strerror(errno));
        return false;
    }
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path, SftpError& err) {
    if (!requireConnected(err)) return false;
    if (removeFails_) {
        err.set(ErrorKind::RemoteIOError, "Permission denied");
        return false;
    }
    std::string local;
    if (!resolve(remote_path, local, err)) return false;
    if (::unlink(local.c_str()) != 0) {
        err.set(ErrorKind::RemoteIOError, "unlink failed for " + normalizeRemote(remote_path) + ": " +
                                              std::strerror(errno));
        return false;
    }
    return true;
}

bool MockSftpClient::copyStream(const std::string& from, const std::string& to, bool upload,
                                SftpError& err, const ProgressFn& progress, const CancelFn& shouldCancel) {
    const ErrorKind srcKind = upload ? ErrorKind::LocalIOError : ErrorKind::RemoteIOError;
    const ErrorKind dstKind = upload ? ErrorKind::RemoteIOError : ErrorKind::LocalIOError;

    std::error_code ec;
    if (!fs::is_regular_file(from, ec)) {
        err.set(srcKind, "No such file: " + from);
        return false;
    }
    const auto total = static_cast<std::size_t>(fs::file_size(from, ec));
    std::ifstream in(from, std::ios::binary);
    if (!in.is_open()) {
        err.set(srcKind, "Could not open " + from + " (" + std::strerror(errno) + ")");
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err.set(dstKind, "Could not open " + to + " for writing (" + std::strerror(errno) + ")");
        return false;
    }

    std::vector<char> buf(chunk_);
    std::size_t done = 0;
    while (done < total) {
        if (interrupted_) {
            connected_ = false;
            err.set(ErrorKind::NetworkError, "Connection interrupted");
            return false;
        }
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            return false;
        }
        in.read(buf.data(), static_cast<std::streamsize>(std::min(buf.size(), total - done)));
        const auto n = static_cast<std::size_t>(in.gcount());
        if (n == 0) {
            err.set(srcKind, "Unexpected end of " + from);
            return false;
        }
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) {
            err.set(dstKind, "Write failed on " + to);
            return false;
        }
        done += n;
        if (progress) progress(done, total);
        if (chunkHook_) chunkHook_();
    }
    if (total == 0 && progress) progress(0, 0);
    out.close();
    if (!out) {
        err.set(dstKind, "Could not finish " + to);
        return false;
    }
    return true;
}

bool MockSftpClient::get(const std::string& remote, const std::string& local, SftpError& err,
                         ProgressFn progress, CancelFn shouldCancel) {
    if (!requireConnected(err)) return false;
    std::string src;
    if (!resolve(remote, src, err)) return false;
    return copyStream(src, local, false, err, progress, shouldCancel);
}

bool MockSftpClient::put(const std::string& local, const std::string& remote, SftpError& err,
                         ProgressFn progress, CancelFn shouldCancel) {
    if (!requireConnected(err)) return false;
    std::string dst;
    if (!resolve(remote, dst, err)) return false;
    return copyStream(local, dst, true, err, progress, shouldCancel);
}

bool MockSftpClient::exec(const std::string& command, ExecResult& result, SftpError& err) {
    if (!requireConnected(err)) return false;
    if (interrupted_) {
        connected_ = false;
        err.set(ErrorKind::NetworkError, "Connection interrupted");
        return false;
    }
    result = ExecResult{};
    {
        std::lock_guard<std::mutex> lk(logMutex_);
        execLog_.push_back(command);
        if (lastOpt_.command_timeout_sec > 0 && execDurationSec_ > lastOpt_.command_timeout_sec) {
            connected_ = false;
            err.set(ErrorKind::NetworkError, "Remote command timed out after " +
                                                 std::to_string(lastOpt_.command_timeout_sec) +
                                                 " s; connection closed");
            return false;
        }
        if (failExec_) {
            failExec_ = false;
            result.exit_code = failExitCode_;
            result.err = failStderr_;
            return true;
        }
    }

    std::vector<std::string> argv;
    for (const auto& tok : shellSplit(command)) {
        if (tok == "&&") {
            result.exit_code = runCommand(argv, result.err);
            if (result.exit_code != 0) return true;
            argv.clear();
        } else {
            argv.push_back(tok);
        }
    }
    result.exit_code = runCommand(argv, result.err);
    return true;
}

int MockSftpClient::runCommand(const std::vector<std::string>& argv, std::string& stderrText) {
    if (argv.empty()) return 0;
    const std::string& prog = argv[0];
    std::error_code ec;

    if (prog == "mkdir" && argv.size() >= 3 && argv[1] == "-p") {
        for (std::size_t i = 2; i < argv.size(); ++i) {
            const std::string local = localPathFor(argv[i]);
            fs::create_directories(local, ec);
            if (local.empty() || ec) {
                stderrText += "mkdir: cannot create directory '" + argv[i] + "'\n";
                return 1;
            }
        }
        return 0;
    }
    if (prog == "rm" && argv.size() >= 3 && argv[1] == "-f") {
        for (std::size_t i = 2; i < argv.size(); ++i) {
            const std::string local = localPathFor(argv[i]);
            if (!local.empty()) fs::remove(local, ec);
        }
        return 0;
    }
    if (prog == "tar" && argv.size() >= 5) {
        const std::string& mode = argv[1];
        const std::string archive = localPathFor(argv[2]);
        if (argv[3] != "-C" || archive.empty()) {
            stderrText += "tar: unsupported arguments\n";
            return 2;
        }
        const std::string dir = localPathFor(argv[4]);
        SftpError terr;
        if (mode == "-czf" && argv.size() == 6) {
            if (!fs::exists(fs::path(dir) / argv[5], ec)) {
                stderrText += "tar: " + argv[5] + ": Cannot stat: No such file or directory\n";
                return 2;
            }
            if (!archive::createTarGz((fs::path(dir) / argv[5]).lexically_normal().string(), archive, terr)) {
                stderrText += "tar: " + terr.message + "\n";
                return 2;
            }
            return 0;
        }
        if (mode == "-xzf" && argv.size() == 5) {
            if (!fs::is_directory(dir, ec)) {
                stderrText += "tar: " + argv[4] + ": Cannot open: No such file or directory\n";
                return 2;
            }
            if (!archive::extractLocal(archive, dir, terr)) {
                stderrText += "tar: " + terr.message + "\n";
                return 2;
            }
            return 0;
        }
    }
    stderrText += "sh: " + prog + ": command not found\n";
    return 127;
}

} // namespace prosftp
