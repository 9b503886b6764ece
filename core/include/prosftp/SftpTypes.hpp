// Basic types shared between the front end and the core for sessions,
// remote metadata and error reporting. Kept plain so they copy across threads.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace prosftp {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: confirm and store new hosts; reject changed keys.
    Off         // No verification (not recommended, logged on every connect).
};

// Error categories surfaced by every layer of the core.
enum class ErrorKind {
    None,
    AuthError,          // credentials or auth method rejected
    NetworkError,       // resolve/connect/handshake/timeout/reset
    UntrustedHost,      // host key missing from or mismatching known_hosts
    NotConnected,       // remote operation without a live connection
    RemoteIOError,      // remote path missing, permission denied
    LocalIOError,       // local disk full, permission denied
    RemoteCommandError, // non-zero exit of a remote shell command
    Cancelled,          // user-initiated; not a failure
    Busy                // a transfer already owns the session
};

const char *errorKindName(ErrorKind kind);

// Error out-parameter. Empty means "no error"; kind and message are set
// together through set().
struct SftpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool empty() const { return kind == ErrorKind::None && message.empty(); }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    // "RemoteIOError: sftp_opendir failed for: /x"
    std::string describe() const;
};

// One remote directory entry. Rebuilt on every listing.
struct FileInfo {
    std::string   name;      // base name
    std::string   path;      // full normalized remote path (filled by listers)
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// Result of a remote shell command.
struct ExecResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one element per prompt.
// If it returns false the backend falls back to a user/password heuristic.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Returns true to accept and store, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom keyboard-interactive handling (e.g. OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;

    int connect_timeout_sec = 12;
    // Upper bound for remote commands (tar). 0 waits for the command to exit;
    // when exceeded the connection is closed as in a hard cancel.
    int command_timeout_sec = 0;
};

} // namespace prosftp
