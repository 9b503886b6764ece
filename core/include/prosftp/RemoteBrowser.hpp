// Remote directory lister and navigator on top of the session's connection.
#pragma once
#include "SessionManager.hpp"
#include <string>
#include <vector>

namespace prosftp {

class RemoteBrowser {
public:
    explicit RemoteBrowser(SessionManager& session, std::string root = "/");

    // Entries of a remote directory, directories first, then by name
    // ignoring case. Every entry carries its full remote path.
    bool list(const std::string& path, std::vector<FileInfo>& out, SftpError& err);

    // "." stays, ".." goes up; any other name is joined with '/'.
    std::string navigateInto(const std::string& current, const std::string& name) const;
    // Parent directory; a no-op at the configured root.
    std::string navigateUp(const std::string& current) const;

    // mkdir -p
    bool makeDirectory(const std::string& path, SftpError& err);

    const std::string& root() const { return root_; }
    void setRoot(const std::string& root);

    static void sortEntries(std::vector<FileInfo>& entries);

private:
    SessionManager& session_;
    std::string root_;
};

// Creates path and any missing ancestors through an already leased client.
// Succeeds when the directory exists; fails when a component is not a
// directory.
bool makeRemoteDirectories(SftpClient& client, const std::string& path, SftpError& err);

} // namespace prosftp
