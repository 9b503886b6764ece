// Session manager and remote lister against the sandbox-backed mock client.
#include "TestSupport.hpp"
#include "prosftp/MockSftpClient.hpp"
#include "prosftp/RemoteBrowser.hpp"
#include "prosftp/SessionManager.hpp"

#include <memory>
#include <string>
#include <vector>

using prosftp_test::TempDir;
using prosftp_test::TestContext;
using prosftp_test::writeFile;

namespace {

prosftp::SessionOptions validOptions() {
    prosftp::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    opt.password = std::string("secret");
    return opt;
}

void seedRemote(const TempDir &remote) {
    std::error_code ec;
    std::filesystem::create_directories(remote / "home/luis/proyectos", ec);
    std::filesystem::create_directories(remote / "home/guest", ec);
    std::filesystem::create_directories(remote / "home/Admin", ec);
    std::filesystem::create_directories(remote / "var/log", ec);
    writeFile(remote / "home/luis/foto.jpg", std::string(34567, 'j'));
    writeFile(remote / "home/notes.md", std::string(2048, 'n'));
    writeFile(remote / "home/Readme.txt", "r");
    writeFile(remote / "home/a.txt", "a");
    writeFile(remote / "readme.txt", std::string(1280, 'r'));
}

std::unique_ptr<prosftp::MockSftpClient> makeClient(const TempDir &remote) {
    auto c = std::make_unique<prosftp::MockSftpClient>(remote.str());
    c->setAcceptedPassword("secret");
    return c;
}

void test_session_defaults(TestContext &t) {
    prosftp::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == prosftp::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(o.connect_timeout_sec == 12, "connect timeout should default to 12s");
    t.check(o.command_timeout_sec == 300,
            "remote command timeout should default to 300s");
}

void test_connect_validation(TestContext &t) {
    TempDir remote("validation");
    prosftp::MockSftpClient c(remote.str());
    c.setAcceptedPassword("secret");
    prosftp::SftpError err;
    auto opt = validOptions();

    opt.host.clear();
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(err.kind == prosftp::ErrorKind::NetworkError,
            "empty host should be a NetworkError");

    opt = validOptions();
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");
    t.check(err.kind == prosftp::ErrorKind::AuthError,
            "empty user should be an AuthError");

    opt = validOptions();
    opt.password = std::string("wrong");
    t.check(!c.connect(opt, err), "connect should fail with a wrong password");
    t.check(err.kind == prosftp::ErrorKind::AuthError,
            "wrong password should be an AuthError");
    t.check(!c.isConnected(), "failed auth must leave the client disconnected");

    opt = validOptions();
    t.check(c.connect(opt, err), "connect should succeed with valid credentials");
    t.check(err.empty(), "successful connect should not set an error");
    t.check(c.isConnected(), "client should report connected after connect");
}

void test_unreachable_host(TestContext &t) {
    TempDir remote("unreachable");
    prosftp::MockSftpClient c(remote.str());
    c.setReachable(false);
    prosftp::SftpError err;
    t.check(!c.connect(validOptions(), err), "unreachable host should fail");
    t.check(err.kind == prosftp::ErrorKind::NetworkError,
            "unreachable host should be a NetworkError");
}

void test_host_key_policies(TestContext &t) {
    TempDir remote("hostkey");
    prosftp::SftpError err;
    auto opt = validOptions();
    opt.password.reset();

    {
        prosftp::MockSftpClient c(remote.str());
        c.setHostKnown(false);
        t.check(!c.connect(opt, err), "Strict should reject an unknown host");
        t.check(err.kind == prosftp::ErrorKind::UntrustedHost,
                "unknown host under Strict should be UntrustedHost");
    }
    {
        prosftp::MockSftpClient c(remote.str());
        c.setHostKnown(false);
        opt.known_hosts_policy = prosftp::KnownHostsPolicy::AcceptNew;
        std::string seenFp;
        opt.hostkey_confirm_cb = [&](const std::string &, std::uint16_t,
                                     const std::string &, const std::string &fp) {
            seenFp = fp;
            return false;
        };
        t.check(!c.connect(opt, err), "AcceptNew should fail when the user declines");
        t.check(err.kind == prosftp::ErrorKind::UntrustedHost,
                "declined fingerprint should be UntrustedHost");
        t.check(!seenFp.empty(), "confirm callback should receive the fingerprint");

        opt.hostkey_confirm_cb = [](const std::string &, std::uint16_t,
                                    const std::string &, const std::string &) {
            return true;
        };
        t.check(c.connect(opt, err), "AcceptNew should connect once confirmed");
    }
    {
        prosftp::MockSftpClient c(remote.str());
        c.setHostKnown(false);
        opt.known_hosts_policy = prosftp::KnownHostsPolicy::Off;
        opt.hostkey_confirm_cb = nullptr;
        t.check(c.connect(opt, err), "Off should connect without verification");
    }
}

void test_lease_exclusivity(TestContext &t) {
    TempDir remote("lease");
    prosftp::SessionManager session(makeClient(remote));
    prosftp::SftpError err;

    auto none = session.acquire(err);
    t.check(!none, "acquire should fail before connect");
    t.check(err.kind == prosftp::ErrorKind::NotConnected,
            "acquire before connect should be NotConnected");

    t.check(session.connect(validOptions(), err), "session connect should succeed");
    auto first = session.acquire(err);
    t.check(static_cast<bool>(first), "first acquire should succeed");
    t.check(session.isBusy(), "session should be busy while leased");

    auto second = session.acquire(err);
    t.check(!second, "second acquire should fail while the first is held");
    t.check(err.kind == prosftp::ErrorKind::Busy, "second acquire should be Busy");

    t.check(!session.connect(validOptions(), err), "connect while leased should fail");
    t.check(err.kind == prosftp::ErrorKind::Busy, "connect while leased should be Busy");

    prosftp::SessionManager::Lease moved = std::move(first);
    t.check(!first && moved, "moving a lease should transfer ownership");
    moved.release();
    t.check(!session.isBusy(), "released lease should free the session");
    t.check(session.isConnected(), "releasing a lease keeps the connection");

    auto again = session.acquire(err);
    t.check(static_cast<bool>(again), "acquire after release should succeed");
}

void test_disconnect_during_lease(TestContext &t) {
    TempDir remote("pending");
    prosftp::SessionManager session(makeClient(remote));
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "connect should succeed");
    {
        auto lease = session.acquire(err);
        session.disconnect();
        t.check(session.isBusy(), "disconnect must not steal an active lease");
    }
    t.check(!session.isConnected(),
            "connection should be closed once the lease is released");
    session.disconnect();
    t.check(!session.isConnected(), "disconnect should be idempotent");
}

void test_interrupt_only_hits_the_holder(TestContext &t) {
    TempDir remote("interrupt");
    prosftp::SessionManager session(makeClient(remote));
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "connect should succeed");

    session.interrupt();
    {
        auto lease = session.acquire(err);
        t.check(static_cast<bool>(lease), "interrupt while idle must not block the next lease");
    }
    t.check(session.isConnected(), "interrupt while idle must not close a later lease");

    {
        auto lease = session.acquire(err);
        session.interrupt();
    }
    t.check(!session.isConnected(), "interrupt of a lease holder closes the connection on release");

    t.check(session.connect(validOptions(), err), "reconnect after an interrupt should succeed");
    {
        auto lease = session.acquire(err);
        t.check(static_cast<bool>(lease), "lease after reconnect should be granted");
    }
    t.check(session.isConnected(), "no stale disconnect may survive into the new connection");
}

void test_reconnect_drops_previous(TestContext &t) {
    TempDir remote("reconnect");
    prosftp::SessionManager session(makeClient(remote));
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "first connect should succeed");
    t.check(session.connect(validOptions(), err), "second connect should succeed");
    t.check(session.isConnected(), "session should stay connected after reconnect");

    auto bad = validOptions();
    bad.password = std::string("nope");
    t.check(!session.connect(bad, err), "reconnect with bad credentials should fail");
    t.check(!session.isConnected(),
            "failed reconnect leaves no connection behind");
}

void test_list_sorting(TestContext &t) {
    TempDir remote("list");
    seedRemote(remote);
    prosftp::SessionManager session(makeClient(remote));
    prosftp::RemoteBrowser browser(session);
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "connect should succeed before list");

    std::vector<prosftp::FileInfo> out;
    t.check(browser.list("/home", out, err), "list('/home') should succeed");
    const std::vector<std::string> expected = {"Admin", "guest", "luis",
                                               "a.txt", "notes.md", "Readme.txt"};
    t.check(out.size() == expected.size(), "list('/home') should return 6 entries");
    if (out.size() == expected.size()) {
        for (std::size_t i = 0; i < expected.size(); ++i) {
            t.check(out[i].name == expected[i],
                    "entry " + std::to_string(i) + " should be " + expected[i]);
        }
        t.check(out[0].is_dir && out[2].is_dir && !out[3].is_dir,
                "directories should come before files");
        t.check(out[4].path == "/home/notes.md", "entries should carry full paths");
        t.check(out[4].size == 2048, "entry sizes should be reported");
    }
}

void test_list_root_and_empty_path(TestContext &t) {
    TempDir remote("root");
    seedRemote(remote);
    prosftp::SessionManager session(makeClient(remote));
    prosftp::RemoteBrowser browser(session);
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "connect should succeed");

    std::vector<prosftp::FileInfo> root;
    t.check(browser.list("/", root, err), "list('/') should succeed");
    t.check(root.size() == 3, "list('/') should return home, var and readme.txt");
    if (root.size() == 3) {
        t.check(root[0].is_dir && root[0].name == "home", "root[0] should be 'home'");
        t.check(root[1].is_dir && root[1].name == "var", "root[1] should be 'var'");
        t.check(!root[2].is_dir && root[2].name == "readme.txt",
                "root[2] should be 'readme.txt'");
        t.check(root[0].path == "/home", "top-level paths should not double the slash");
    }
    for (const auto &e : root)
        t.check(e.name != "." && e.name != "..", "dot entries must never be listed");

    std::vector<prosftp::FileInfo> emptyPath;
    t.check(browser.list("", emptyPath, err), "list('') should be treated as '/'");
    t.check(emptyPath.size() == root.size(), "list('') should match the root listing");
}

void test_list_errors(TestContext &t) {
    TempDir remote("listerr");
    seedRemote(remote);
    prosftp::SessionManager session(makeClient(remote));
    prosftp::RemoteBrowser browser(session);
    prosftp::SftpError err;
    std::vector<prosftp::FileInfo> out;

    t.check(!browser.list("/", out, err), "list should fail when disconnected");
    t.check(err.kind == prosftp::ErrorKind::NotConnected,
            "list while disconnected should be NotConnected");

    t.check(session.connect(validOptions(), err), "connect should succeed");
    t.check(!browser.list("/does-not-exist", out, err), "missing path should fail");
    t.check(err.kind == prosftp::ErrorKind::RemoteIOError,
            "missing path should be a RemoteIOError");

    auto lease = session.acquire(err);
    t.check(!browser.list("/", out, err), "list should fail while a transfer runs");
    t.check(err.kind == prosftp::ErrorKind::Busy, "list during a transfer should be Busy");
}

void test_navigation(TestContext &t) {
    TempDir remote("nav");
    prosftp::SessionManager session(makeClient(remote));
    prosftp::RemoteBrowser browser(session);

    const std::vector<std::string> dirs = {"/", "/home", "/home/luis", "docs", "docs/work", "."};
    for (const auto &p : dirs) {
        const std::string child = browser.navigateInto(p, "proyectos");
        t.check(browser.navigateUp(child) == p, "navigateUp(navigateInto(" + p + ")) should return " + p);
        t.check(browser.navigateInto(p, ".") == p, "navigateInto(" + p + ", '.') should stay");
    }
    t.check(browser.navigateInto("/", "home") == "/home", "join at root should not double '/'");
    t.check(browser.navigateInto("/home/", "luis") == "/home/luis", "trailing slash should be normalized");
    t.check(browser.navigateInto("/home", "..") == "/", "'..' should go up one level");
    t.check(browser.navigateUp("/") == "/", "navigateUp at '/' is a no-op");
    t.check(browser.navigateUp("docs") == ".", "relative top-level path goes up to '.'");

    browser.setRoot("/home");
    t.check(browser.navigateUp("/home") == "/home", "navigateUp at the configured root is a no-op");
    t.check(browser.navigateUp("/home/luis") == "/home", "navigateUp below the root still works");
    t.check(browser.navigateUp("/var/log") == "/home", "navigateUp outside the root returns to it");
}

void test_make_directory(TestContext &t) {
    TempDir remote("mkdir");
    seedRemote(remote);
    prosftp::SessionManager session(makeClient(remote));
    prosftp::RemoteBrowser browser(session);
    prosftp::SftpError err;
    t.check(session.connect(validOptions(), err), "connect should succeed");

    t.check(browser.makeDirectory("/home/luis/a/b/c", err), "mkdir -p should create missing ancestors");
    t.check(std::filesystem::is_directory(remote / "home/luis/a/b/c"), "nested directory should exist");
    t.check(browser.makeDirectory("/home/luis/a/b/c", err), "mkdir -p on an existing directory should succeed");
    t.check(browser.makeDirectory("/", err), "mkdir -p '/' should succeed");

    t.check(!browser.makeDirectory("/home/notes.md/x", err), "a file in the path should fail");
    t.check(err.kind == prosftp::ErrorKind::RemoteIOError, "file in path should be a RemoteIOError");
    t.checkContains(err.message, "Not a directory", "error should name the offending component");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_unreachable_host(t);
    test_host_key_policies(t);
    test_lease_exclusivity(t);
    test_disconnect_during_lease(t);
    test_interrupt_only_hits_the_holder(t);
    test_reconnect_drops_previous(t);
    test_list_sorting(t);
    test_list_root_and_empty_path(t);
    test_list_errors(t);
    test_navigation(t);
    test_make_directory(t);
    return t.finish("prosftp_core_mock_tests");
}
