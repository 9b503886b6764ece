// Integration tests for the libssh2 backend against a real SFTP server with a
// POSIX shell and tar. Skipped (exit code 77) unless the PRO_SFTP_IT_* env
// vars are set.
#include "TestSupport.hpp"
#include "prosftp/Libssh2SftpClient.hpp"
#include "prosftp/RemotePath.hpp"
#include "prosftp/TransferService.hpp"

#include <algorithm>
#include <chrono>
#include <optional>

namespace fs = std::filesystem;
using prosftp_test::patterned;
using prosftp_test::readFile;
using prosftp_test::TempDir;
using prosftp_test::TestContext;
using prosftp_test::writeFile;

namespace {

constexpr int kSkipExitCode = 77;

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

bool listContainsName(const std::vector<prosftp::FileInfo> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const prosftp::FileInfo &e) {
                           return e.name == name;
                       });
}

prosftp::TransferReport runToEnd(
    const std::shared_ptr<prosftp::ProgressChannel> &ch) {
    prosftp::TransferEvent ev;
    while (ch && ch->next(ev, std::chrono::minutes(5))) {
        if (ev.type == prosftp::TransferEvent::Type::Finished)
            return ev.report;
    }
    prosftp::TransferReport timedOut;
    timedOut.status = prosftp::TransferStatus::Failed;
    timedOut.error.set(prosftp::ErrorKind::NetworkError,
                       "no terminal event");
    return timedOut;
}

} // namespace

int main() {
    const auto host = envValue("PRO_SFTP_IT_SFTP_HOST");
    const auto user = envValue("PRO_SFTP_IT_SFTP_USER");
    const auto pass = envValue("PRO_SFTP_IT_SFTP_PASS");
    const auto keyPath = envValue("PRO_SFTP_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("PRO_SFTP_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("PRO_SFTP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] prosftp_libssh2_integration_tests requires env "
                     "vars: PRO_SFTP_IT_SFTP_HOST, PRO_SFTP_IT_SFTP_USER and "
                     "one auth method (PRO_SFTP_IT_SFTP_PASS or "
                     "PRO_SFTP_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] PRO_SFTP_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }
    std::uint16_t port = 22;
    if (!parsePort(envValue("PRO_SFTP_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] PRO_SFTP_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    prosftp::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = prosftp::KnownHostsPolicy::Off;

    TestContext t;
    TempDir local("it");
    const std::string suite =
        prosftp::joinRemote(remoteBase, "prosftp-it-" + uniqueToken());
    prosftp::TransferConfig cfg;
    cfg.remote_scratch_dir = remoteBase;
    prosftp::TransferService service(
        std::make_unique<prosftp::Libssh2SftpClient>(), cfg);

    prosftp::SftpError err;
    t.check(service.connect(opt, err), "connect should succeed: " + err.describe());

    // Single file: upload, list, download back.
    const std::string payload = patterned(300 * 1024, 42);
    writeFile(local / "payload.bin", payload);
    if (t.failures == 0) {
        const auto report = runToEnd(service.uploadFiles(
            {(local / "payload.bin").string()}, suite, err));
        t.check(report.ok(), "file upload should succeed: " + report.summary());
        std::vector<prosftp::FileInfo> entries;
        t.check(service.listRemote(suite, entries, err),
                "list(suite) should succeed: " + err.describe());
        t.check(listContainsName(entries, "payload.bin"),
                "list should include payload.bin");
    }
    if (t.failures == 0) {
        const auto report = runToEnd(service.downloadFiles(
            {prosftp::joinRemote(suite, "payload.bin")},
            (local / "back").string(), err));
        t.check(report.ok(), "file download should succeed: " + report.summary());
        t.check(readFile(local / "back" / "payload.bin") == payload,
                "downloaded content should match uploaded payload");
    }

    // Folder upload with remote extraction.
    writeFile(local / "tree" / "a.txt", "alpha\n");
    writeFile(local / "tree" / "nested dir" / "b.bin", patterned(70 * 1024, 7));
    if (t.failures == 0) {
        const auto report = runToEnd(service.uploadFolder(
            (local / "tree").string(), suite, true, err));
        t.check(report.ok(), "folder upload should succeed: " + report.summary());
        std::vector<prosftp::FileInfo> entries;
        t.check(service.listRemote(prosftp::joinRemote(suite, "tree"), entries, err),
                "extracted folder should be listable: " + err.describe());
        t.check(listContainsName(entries, "nested dir"),
                "extracted folder should contain the nested directory");
        entries.clear();
        t.check(service.listRemote(suite, entries, err), "list(suite) should succeed");
        t.check(!listContainsName(entries, "tree.tar.gz"),
                "uploaded archive should be removed after extraction");
    }

    // Folder download with local extraction.
    if (t.failures == 0) {
        const auto report = runToEnd(service.downloadFolder(
            prosftp::joinRemote(suite, "tree"), (local / "mirror").string(),
            true, err));
        t.check(report.ok(), "folder download should succeed: " + report.summary());
        t.check(readFile(local / "mirror" / "tree" / "nested dir" / "b.bin") ==
                    patterned(70 * 1024, 7),
                "folder should survive the round trip");
    }

    // Remove the suite directory regardless of the result.
    service.wait();
    {
        prosftp::SftpError leaseErr;
        auto lease = service.session().acquire(leaseErr);
        if (lease) {
            prosftp::ExecResult res;
            prosftp::SftpError execErr;
            if (!lease.client().exec("rm -rf " + prosftp::shellQuote(suite), res, execErr) ||
                res.exit_code != 0)
                std::cerr << "[WARN] could not remove " << suite << "\n";
        }
    }
    service.disconnect();
    return t.finish("prosftp_libssh2_integration_tests");
}
