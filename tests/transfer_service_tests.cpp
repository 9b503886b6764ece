// Background tasks through TransferService: channel delivery, Busy, cancel,
// abort and disconnect while a transfer is in flight.
#include "TestSupport.hpp"
#include "prosftp/MockSftpClient.hpp"
#include "prosftp/TransferService.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using prosftp_test::patterned;
using prosftp_test::readFile;
using prosftp_test::TempDir;
using prosftp_test::TestContext;
using prosftp_test::writeFile;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

struct Harness {
    TempDir remote{"svc-remote"};
    TempDir local{"svc-local"};
    // Set by the chunk hook once a transfer is moving; the hook then holds the
    // worker until gate opens.
    std::atomic<bool> inFlight{false};
    std::atomic<bool> gate{true};

    prosftp::MockSftpClient *mock = nullptr;
    std::unique_ptr<prosftp::TransferService> service;

    Harness() {
        std::error_code ec;
        fs::create_directories(remote / "tmp", ec);
        auto client = std::make_unique<prosftp::MockSftpClient>(remote.str());
        client->setChunkSize(4096);
        client->setChunkHook([this] {
            inFlight = true;
            while (!gate.load()) std::this_thread::sleep_for(1ms);
        });
        mock = client.get();
        prosftp::TransferConfig cfg;
        cfg.remote_scratch_dir = "/tmp";
        cfg.local_temp_dir = local.str();
        service = std::make_unique<prosftp::TransferService>(std::move(client), cfg);
    }

    bool connect() {
        prosftp::SessionOptions opt;
        opt.host = "example.test";
        opt.username = "alice";
        prosftp::SftpError err;
        return service->connect(opt, err);
    }

    bool waitInFlight() {
        for (int i = 0; i < 5000 && !inFlight.load(); ++i) std::this_thread::sleep_for(1ms);
        return inFlight.load();
    }
};

struct Drained {
    bool finished = false;
    std::vector<std::string> statuses;
    std::uint64_t lastProgress = 0;
    bool monotonic = true;
    prosftp::TransferReport report;
};

Drained drain(prosftp::ProgressChannel &ch) {
    Drained d;
    prosftp::TransferEvent ev;
    while (ch.next(ev, 10000ms)) {
        if (ev.type == prosftp::TransferEvent::Type::Finished) {
            d.finished = true;
            d.report = ev.report;
            break;
        }
        if (ev.type == prosftp::TransferEvent::Type::Status) {
            d.statuses.push_back(ev.message);
        } else {
            if (ev.bytes_done < d.lastProgress) d.monotonic = false;
            d.lastProgress = ev.bytes_done;
        }
    }
    return d;
}

void test_not_connected(TestContext &t) {
    Harness h;
    prosftp::SftpError err;
    auto ch = h.service->uploadFiles({"/nope"}, "/up", err);
    t.check(!ch, "no task without a connection");
    t.check(err.kind == prosftp::ErrorKind::NotConnected, "should fail with NotConnected");
    t.check(!h.service->isRunning(), "nothing should be running");
}

void test_upload_and_list(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.local / "a.bin", patterned(80 * 1024, 1));
    writeFile(h.local / "b.bin", patterned(20 * 1024, 2));
    prosftp::SftpError err;
    auto ch = h.service->uploadFiles({(h.local / "a.bin").string(), (h.local / "b.bin").string()}, "/inbox",
                                     err);
    t.check(ch != nullptr, "task should start: " + err.message);
    if (!ch) return;
    const Drained d = drain(*ch);
    h.service->wait();
    t.check(d.finished && d.report.ok(), "upload should finish successfully: " + d.report.summary());
    t.check(d.monotonic, "delivered progress should never decrease");
    t.check(d.lastProgress == d.report.bytes_total, "final progress should reach the total");
    t.check(d.statuses.size() == 2, "one status line per file");
    t.check(ch->isCompleted(), "terminal event should be marked delivered");
    t.check(!h.service->isRunning(), "service should be idle after the task");

    std::vector<prosftp::FileInfo> entries;
    t.check(h.service->listRemote("/inbox", entries, err), "listing after the task should work");
    t.check(entries.size() == 2 && entries[0].name == "a.bin", "listing should show the uploaded files");
}

void test_busy_while_running(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.local / "big.bin", patterned(256 * 1024, 3));
    h.gate = false;
    prosftp::SftpError err;
    auto ch = h.service->uploadFiles({(h.local / "big.bin").string()}, "/inbox", err);
    t.check(ch != nullptr, "first task should start");
    t.check(h.waitInFlight(), "transfer should begin");

    t.check(h.service->isRunning(), "service should report a running task");
    auto second = h.service->downloadFiles({"/inbox/big.bin"}, h.local.str(), err);
    t.check(!second && err.kind == prosftp::ErrorKind::Busy, "a second task should be refused with Busy");
    std::vector<prosftp::FileInfo> entries;
    t.check(!h.service->listRemote("/", entries, err) && err.kind == prosftp::ErrorKind::Busy,
            "listing should be refused with Busy");
    t.check(!h.service->makeRemoteDirectory("/x", err) && err.kind == prosftp::ErrorKind::Busy,
            "mkdir should be refused with Busy");

    h.gate = true;
    if (ch) {
        const Drained d = drain(*ch);
        t.check(d.report.ok(), "first task should still complete");
    }
    h.service->wait();
    t.check(readFile(h.remote / "inbox/big.bin") == patterned(256 * 1024, 3), "uploaded content should match");
    t.check(h.service->listRemote("/", entries, err), "session should be free again");
}

void test_cancel(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.local / "big.bin", patterned(512 * 1024, 4));
    h.gate = false;
    prosftp::SftpError err;
    auto ch = h.service->uploadFiles({(h.local / "big.bin").string()}, "/inbox", err);
    t.check(ch != nullptr && h.waitInFlight(), "transfer should begin");
    h.service->cancel();
    h.gate = true;
    if (ch) {
        const Drained d = drain(*ch);
        t.check(d.report.status == prosftp::TransferStatus::Cancelled, "task should end Cancelled");
        t.check(!d.report.connection_lost, "cooperative cancel keeps the connection");
        t.check(ch->cancelRequested(), "channel should remember the request");
    }
    h.service->wait();
    t.check(h.service->isConnected(), "session should stay connected");
    t.check(!fs::exists(h.remote / "inbox/big.bin"), "partial remote file should be removed");
}

void test_abort(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.remote / "srv/big.bin", patterned(512 * 1024, 5));
    h.gate = false;
    prosftp::SftpError err;
    auto ch = h.service->downloadFiles({"/srv/big.bin"}, (h.local / "dl").string(), err);
    t.check(ch != nullptr && h.waitInFlight(), "transfer should begin");
    h.service->abort();
    h.gate = true;
    if (ch) {
        const Drained d = drain(*ch);
        t.check(d.report.status == prosftp::TransferStatus::Cancelled, "abort should end Cancelled");
        t.check(d.report.connection_lost, "abort should flag the lost connection");
    }
    h.service->wait();
    t.check(!h.service->isConnected(), "abort should close the connection");
    t.check(!fs::exists(h.local / "dl" / "big.bin"), "partial local file should be removed");

    t.check(h.connect(), "reconnect after abort should work");
    std::vector<prosftp::FileInfo> entries;
    t.check(h.service->listRemote("/srv", entries, err), "listing after reconnect should work");
}

void test_disconnect_during_transfer(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.local / "big.bin", patterned(512 * 1024, 6));
    h.gate = false;
    prosftp::SftpError err;
    auto ch = h.service->uploadFiles({(h.local / "big.bin").string()}, "/inbox", err);
    t.check(ch != nullptr && h.waitInFlight(), "transfer should begin");
    std::thread closer([&h] { h.service->disconnect(); });
    std::this_thread::sleep_for(20ms);
    h.gate = true;
    closer.join();
    t.check(!h.service->isConnected(), "disconnect should leave the session closed");
    t.check(!h.service->isRunning(), "disconnect should wait for the task");
    if (ch) {
        const Drained d = drain(*ch);
        t.check(d.finished && d.report.status == prosftp::TransferStatus::Cancelled,
                "interrupted task should end Cancelled");
    }
}

void test_folder_round_trip(TestContext &t) {
    Harness h;
    t.check(h.connect(), "connect should succeed");
    writeFile(h.local / "site" / "index.html", "<html></html>");
    writeFile(h.local / "site" / "img" / "logo.png", patterned(30 * 1024, 7));
    prosftp::SftpError err;

    auto up = h.service->uploadFolder((h.local / "site").string(), "/www", true, err);
    t.check(up != nullptr, "folder upload should start");
    if (up) t.check(drain(*up).report.ok(), "folder upload should succeed");
    h.service->wait();
    t.check(readFile(h.remote / "www/site/index.html") == "<html></html>", "folder should be extracted remotely");

    const fs::path back = h.local / "back";
    auto down = h.service->downloadFolder("/www/site", back.string(), true, err);
    t.check(down != nullptr, "folder download should start");
    if (down) {
        const Drained d = drain(*down);
        t.check(d.report.ok(), "folder download should succeed: " + d.report.summary());
        t.check(d.statuses.size() >= 3, "compress, download and extract should be announced");
    }
    h.service->wait();
    t.check(readFile(back / "site" / "img" / "logo.png") == patterned(30 * 1024, 7),
            "folder should round-trip through both directions");
}

} // namespace

int main() {
    TestContext t;
    test_not_connected(t);
    test_upload_and_list(t);
    test_busy_while_running(t);
    test_cancel(t);
    test_abort(t);
    test_disconnect_during_transfer(t);
    test_folder_round_trip(t);
    return t.finish("prosftp_transfer_service_tests");
}
