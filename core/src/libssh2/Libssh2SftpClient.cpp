// libssh2 backend: manages the TCP socket, the SSH session and the SFTP
// channel. Includes keepalive, known_hosts validation and remote exec.
#include "prosftp/Libssh2SftpClient.hpp"
#include "prosftp/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace prosftp {

namespace {

// libssh2 global init (once per process)
std::once_flag g_libssh2_once;

const std::size_t kChunk = 64 * 1024;

// Context for kbd-interactive: answers user name and password by prompt text
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: front end callback for prompts
};

char* dupForLibssh2(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

bool promptAsksForUser(const char* prompt) {
    std::string p(prompt ? prompt : "");
    for (char& c : p) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

// keyboard-interactive callback: answers prompts with user/password
void kbint_password_callback(const char* name, int name_len,
                             const char* instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // Let the front end answer first if it installed a callback.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve(static_cast<std::size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            texts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        const std::string nm = (name && name_len > 0) ? std::string(name, static_cast<std::size_t>(name_len)) : std::string();
        const std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, static_cast<std::size_t>(instruction_len)) : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) && static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string& a = answers[static_cast<std::size_t>(i)];
                responses[i].text = a.empty() ? nullptr : dupForLibssh2(a.data(), a.size());
                responses[i].length = responses[i].text ? static_cast<unsigned int>(a.size()) : 0;
            }
            return;
        }
        // callback could not answer: fall back to the heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        const char* ans = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupForLibssh2(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char* hostKeyAlgName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
#endif
    default: return "UNKNOWN";
    }
}

std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* prefix = "SHA1:";
#endif
    const unsigned char* h = reinterpret_cast<const unsigned char*>(libssh2_hostkey_hash(session, hashType));
    if (!h) return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

// Try up to three ssh-agent identities.
bool tryAgentAuth(LIBSSH2_SESSION* session, const std::string& user) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    bool authed = false;
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (arc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

bool isSocketError(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           rc == LIBSSH2_ERROR_TIMEOUT;
}

const char* sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "no space left on remote filesystem";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    case LIBSSH2_FX_WRITE_PROTECT:
        return "write protected";
    default:
        return "sftp failure";
    }
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        if (libssh2_init(0) != 0)
            PROSFTP_LOGE("libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, int timeoutSec, SftpError& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::NetworkError, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // No SO_RCVTIMEO/SO_SNDTIMEO: they interfere with userauth on some
        // servers. libssh2_session_set_timeout bounds blocking calls instead.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so an unreachable host fails within timeoutSec.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, timeoutSec * 1000) == 1 ? 0 : -1;
            if (rc == 0) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0 || soErr != 0)
                    rc = -1;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::NetworkError, "Could not connect to host/port.");
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, SftpError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) {
        PROSFTP_LOGW("Host key verification disabled for %s:%u",
                     redacted(opt.host).c_str(), static_cast<unsigned>(opt.port));
        return true;
    }

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::NetworkError, "Could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::UntrustedHost, "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::NetworkError, "Could not obtain host key");
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int typemaskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemaskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemaskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemaskHash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::UntrustedHost, "Host key does not match known_hosts");
        return false;
    }
    if (opt.known_hosts_policy != KnownHostsPolicy::AcceptNew) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::UntrustedHost, "Unknown host (not in known_hosts)");
        return false;
    }

    // TOFU: ask the user through the callback
    const std::string fp = hostKeyFingerprint(session_);
    const bool confirmed = opt.hostkey_confirm_cb &&
                           opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype), fp);
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::UntrustedHost, "Unknown host: fingerprint not confirmed by user");
        return false;
    }
    if (khPath.empty()) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::UntrustedHost, "known_hosts path is not defined");
        return false;
    }
    std::string hostEntry = opt.host;
    if (opt.port != 22) hostEntry = "[" + opt.host + "]:" + std::to_string(opt.port);
    const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int addrc = libssh2_knownhost_addc(nh, hostEntry.c_str(), nullptr,
                                             hostkey, keylen, nullptr, 0, addMask, nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::LocalIOError, "Could not add/write host in known_hosts");
        return false;
    }
    libssh2_knownhost_free(nh);
    PROSFTP_LOGI("Stored new host key %s for %s", fp.c_str(), redacted(opt.host).c_str());
    return true;
}

// Authentication prefers what the user gave explicitly:
// 1) private key, 2) password then keyboard-interactive, 3) ssh-agent.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, SftpError& err) {
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr, // public key derived from the private one
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err.set(isSocketError(rc) ? ErrorKind::NetworkError : ErrorKind::AuthError,
                    "Public key authentication failed: " + lastSessionError());
            return false;
        }
        return true;
    }

    std::string authlist;
    auto loadAuthList = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              static_cast<unsigned>(opt.username.size()));
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (!opt.password.has_value()) {
        loadAuthList();
        if (hasMethod("publickey") && tryAgentAuth(session_, opt.username)) return true;
        err.set(ErrorKind::AuthError, "No credentials: key/agent/password unavailable");
        return false;
    }

    // Password first, without userauth_list, to avoid spending attempts on
    // 'none' or agent keys.
    int rcPw = -1;
    for (;;) {
        rcPw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
        if (rcPw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rcPw == 0) return true;
    if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
        rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
        err.set(ErrorKind::AuthError, "Server closed the connection after the password attempt");
        return false;
    }

    loadAuthList();
    int rcKbd = -1;
    if (hasMethod("keyboard-interactive")) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        for (;;) {
            rcKbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
            if (rcKbd != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs) *abs = nullptr;
        if (rcKbd == 0) return true;
    }
    if (hasMethod("publickey") && tryAgentAuth(session_, opt.username)) return true;

    err.set(ErrorKind::AuthError,
            std::string("Password/keyboard-interactive authentication failed") +
                (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                " [rc_pw=" + std::to_string(rcPw) + ", rc_kbd=" + std::to_string(rcKbd) + "]");
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, SftpError& err) {
    if (connected_) {
        err.set(ErrorKind::NetworkError, "Already connected");
        return false;
    }
    sessionTimeoutMs_ = (opt.connect_timeout_sec > 0 ? opt.connect_timeout_sec : 12) * 1000;
    commandTimeoutSec_ = opt.command_timeout_sec > 0 ? opt.command_timeout_sec : 0;

    if (!tcpConnect(opt.host, opt.port, sessionTimeoutMs_ / 1000, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        disconnect();
        err.set(ErrorKind::NetworkError, "libssh2_session_init failed");
        return false;
    }
    // Blocking mode with a bounded timeout for every call.
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, sessionTimeoutMs_);

    if (libssh2_session_handshake(session_, sock_.load()) != 0) {
        err.set(ErrorKind::NetworkError, "SSH handshake failed: " + lastSessionError());
        disconnect();
        return false;
    }
    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorKind::NetworkError, "Could not initialize SFTP: " + lastSessionError());
        disconnect();
        return false;
    }

    connected_ = true;
    PROSFTP_LOGI("Connected to %s:%u as %s", redacted(opt.host).c_str(),
                 static_cast<unsigned>(opt.port), redacted(opt.username).c_str());
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int s = sock_.exchange(-1);
    if (s != -1) ::close(s);
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    const int s = sock_.load();
    if (s != -1) ::shutdown(s, SHUT_RDWR);
}

bool Libssh2SftpClient::ensureConnected(SftpError& err) const {
    if (!connected_ || !sftp_) {
        err.set(ErrorKind::NotConnected, "Not connected");
        return false;
    }
    return true;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
}

void Libssh2SftpClient::setRemoteError(SftpError& err, const std::string& what) {
    const int rc = libssh2_session_last_errno(session_);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        err.set(ErrorKind::RemoteIOError, what + " (" + sftpStatusText(libssh2_sftp_last_error(sftp_)) + ")");
        return;
    }
    if (isSocketError(rc)) {
        // The transport is gone; further calls on this session are pointless.
        connected_ = false;
        err.set(ErrorKind::NetworkError, what + ": " + lastSessionError());
        return;
    }
    const std::string detail = lastSessionError();
    err.set(ErrorKind::RemoteIOError, detail.empty() ? what : what + ": " + detail);
}

bool Libssh2SftpClient::waitSocket(int timeoutMs) const {
    const int s = sock_.load();
    if (s == -1 || !session_) return false;
    struct pollfd pfd{};
    pfd.fd = s;
    const int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;
    if (pfd.events == 0) pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeoutMs) >= 0;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             SftpError& err) {
    if (!ensureConnected(err)) return false;

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        setRemoteError(err, "sftp_opendir failed for: " + path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..") continue;
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            setRemoteError(err, "sftp_readdir_ex failed for: " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Download a remote file to a local path with progress and cooperative cancel.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            SftpError& err,
                            ProgressFn progress,
                            CancelFn shouldCancel) {
    if (!ensureConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        setRemoteError(err, "Could not stat remote file " + remote);
        return false;
    }
    const std::size_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::size_t>(st.filesize) : 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        setRemoteError(err, "Could not open remote file for reading: " + remote);
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err.set(ErrorKind::LocalIOError, "Could not open local file for writing: " + local +
                                             " (" + std::strerror(errno) + ")");
        return false;
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    bool ok = true;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) != static_cast<std::size_t>(n)) {
                err.set(ErrorKind::LocalIOError, "Local write failed: " + local + " (" + std::strerror(errno) + ")");
                ok = false;
                break;
            }
            done += static_cast<std::size_t>(n);
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            setRemoteError(err, "Remote read failed: " + remote);
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        err.set(ErrorKind::LocalIOError, "Could not finish writing local file: " + local);
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

// Upload a local file to a remote path (create/truncate) with progress and cancel.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            SftpError& err,
                            ProgressFn progress,
                            CancelFn shouldCancel) {
    if (!ensureConnected(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err.set(ErrorKind::LocalIOError, "Could not open local file for reading: " + local +
                                             " (" + std::strerror(errno) + ")");
        return false;
    }

    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                   0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        setRemoteError(err, "Could not open remote file for writing: " + remote);
        return false;
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    bool ok = true;

    while (ok) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err.set(ErrorKind::LocalIOError, "Local read failed: " + local);
                ok = false;
            }
            break; // EOF
        }
        const char* p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                setRemoteError(err, "Remote write failed: " + remote);
                ok = false;
                break;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::size_t>(w);
        }
        if (ok && progress) progress(done, total);
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               SftpError& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

// Detailed remote metadata. Returns false with an empty err when missing.
bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             SftpError& err) {
    if (!ensureConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
            if (sftpErr == LIBSSH2_FX_NO_SUCH_FILE || sftpErr == LIBSSH2_FX_NO_SUCH_PATH) {
                err.clear();
                return false; // does not exist
            }
        }
        setRemoteError(err, "Remote stat failed: " + remote_path);
        return false;
    }
    info.name.clear();
    info.path = remote_path;
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::uint64_t>(st.filesize) : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? static_cast<std::uint64_t>(st.mtime) : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? static_cast<std::uint32_t>(st.permissions) : 0;
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              SftpError& err,
                              unsigned int mode) {
    if (!ensureConnected(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) != 0) {
        setRemoteError(err, "sftp_mkdir failed for: " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   SftpError& err) {
    if (!ensureConnected(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        setRemoteError(err, "sftp_unlink failed for: " + remote_path);
        return false;
    }
    return true;
}

// Runs the command on a fresh session channel. stdout and stderr are drained
// in non-blocking mode so neither window can stall the other.
bool Libssh2SftpClient::exec(const std::string& command,
                             ExecResult& result,
                             SftpError& err) {
    if (!ensureConnected(err)) return false;
    result = ExecResult{};

    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        setRemoteError(err, "Could not open SSH channel");
        return false;
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        setRemoteError(err, "Remote exec request rejected");
        libssh2_channel_free(ch);
        return false;
    }
    PROSFTP_LOGD("exec: %s", command.c_str());

    libssh2_session_set_blocking(session_, 0);
    // commandTimeoutSec_ == 0 waits until the command exits or interrupt()
    // breaks the socket.
    const bool bounded = commandTimeoutSec_ > 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(commandTimeoutSec_);
    char buf[16384];
    bool failed = false;
    bool timedOut = false;
    auto drain = [&]() -> bool {
        bool progressed = false;
        ssize_t n;
        while ((n = libssh2_channel_read(ch, buf, sizeof(buf))) > 0) {
            result.out.append(buf, static_cast<std::size_t>(n));
            progressed = true;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) failed = true;
        while ((n = libssh2_channel_read_stderr(ch, buf, sizeof(buf))) > 0) {
            result.err.append(buf, static_cast<std::size_t>(n));
            progressed = true;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) failed = true;
        return progressed;
    };
    while (!failed) {
        const bool progressed = drain();
        if (failed) break;
        if (libssh2_channel_eof(ch)) {
            drain();
            break;
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        if (!progressed) waitSocket(200);
    }
    libssh2_session_set_blocking(session_, 1);

    if (timedOut) {
        // The command may still be running remotely. Drop the connection so
        // the half-read session is never reused.
        PROSFTP_LOGW("Remote command exceeded %d s; closing the connection", commandTimeoutSec_);
        libssh2_channel_free(ch);
        interrupt();
        connected_ = false;
        err.set(ErrorKind::NetworkError,
                "Remote command timed out after " + std::to_string(commandTimeoutSec_) + " s; connection closed");
        return false;
    }
    if (failed) {
        setRemoteError(err, "Reading remote command output failed");
        libssh2_channel_free(ch);
        return false;
    }
    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    result.exit_code = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    return true;
}

} // namespace prosftp
