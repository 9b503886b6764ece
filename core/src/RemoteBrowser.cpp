#include "prosftp/RemoteBrowser.hpp"
#include "prosftp/Log.hpp"
#include "prosftp/RemotePath.hpp"

#include <algorithm>
#include <cctype>

namespace prosftp {

namespace {

// <0, 0, >0 like strcmp, ASCII case folded
int compareNoCase(const std::string& a, const std::string& b) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // namespace

RemoteBrowser::RemoteBrowser(SessionManager& session, std::string root)
    : session_(session), root_(normalizeRemote(root)) {}

void RemoteBrowser::setRoot(const std::string& root) {
    root_ = normalizeRemote(root);
}

void RemoteBrowser::sortEntries(std::vector<FileInfo>& entries) {
    std::sort(entries.begin(), entries.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // dirs first
        const int c = compareNoCase(a.name, b.name);
        if (c != 0) return c < 0;
        return a.name < b.name; // "A" before "a" for a stable display
    });
}

bool RemoteBrowser::list(const std::string& path, std::vector<FileInfo>& out, SftpError& err) {
    err.clear();
    auto lease = session_.acquire(err);
    if (!lease) return false;

    const std::string dir = normalizeRemote(path);
    std::vector<FileInfo> entries;
    if (!lease.client().list(dir, entries, err)) {
        PROSFTP_LOGW("Listing %s failed: %s", dir.c_str(), err.describe().c_str());
        return false;
    }
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const FileInfo& e) { return e.name == "." || e.name == ".."; }),
                  entries.end());
    for (auto& e : entries) e.path = joinRemote(dir, e.name);
    sortEntries(entries);
    out = std::move(entries);
    return true;
}

std::string RemoteBrowser::navigateInto(const std::string& current, const std::string& name) const {
    if (name.empty() || name == ".") return normalizeRemote(current);
    if (name == "..") return navigateUp(current);
    return joinRemote(current, name);
}

std::string RemoteBrowser::navigateUp(const std::string& current) const {
    const std::string p = normalizeRemote(current);
    if (p == root_) return p;
    // Absolute paths outside the root jump back to it; relative paths are
    // resolved by the server and only lose their last component.
    if (p.front() == '/' && !isWithinRemote(p, root_)) return root_;
    return parentRemote(p);
}

bool RemoteBrowser::makeDirectory(const std::string& path, SftpError& err) {
    err.clear();
    auto lease = session_.acquire(err);
    if (!lease) return false;
    return makeRemoteDirectories(lease.client(), path, err);
}

bool makeRemoteDirectories(SftpClient& client, const std::string& path, SftpError& err) {
    const std::string target = normalizeRemote(path);
    if (target == "/") return true;

    const bool absolute = target.front() == '/';
    std::string prefix;
    std::size_t pos = absolute ? 1 : 0;
    while (pos < target.size()) {
        std::size_t next = target.find('/', pos);
        if (next == std::string::npos) next = target.size();
        const std::string component = target.substr(pos, next - pos);
        if (absolute || !prefix.empty()) prefix += "/";
        prefix += component;
        pos = next + 1;

        FileInfo st;
        err.clear();
        if (client.stat(prefix, st, err)) {
            if (!st.is_dir) {
                err.set(ErrorKind::RemoteIOError, "Not a directory: " + prefix);
                return false;
            }
            continue;
        }
        if (!err.empty()) return false;
        if (!client.mkdir(prefix, err)) {
            // Someone else may have created it in the meantime.
            SftpError again;
            if (client.stat(prefix, st, again) && st.is_dir) {
                err.clear();
                continue;
            }
            return false;
        }
        PROSFTP_LOGD("Created remote directory %s", prefix.c_str());
    }
    err.clear();
    return true;
}

} // namespace prosftp
