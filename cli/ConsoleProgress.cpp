#include "ConsoleProgress.hpp"

#include <QLoggingCategory>

#include <csignal>
#include <cstdio>

Q_DECLARE_LOGGING_CATEGORY(pcCli)

namespace {

volatile std::sig_atomic_t g_interrupts = 0;

void onSigint(int) {
    g_interrupts = g_interrupts + 1;
}

QString humanBytes(std::uint64_t n) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(n);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? QString("%1 B").arg(n) : QString("%1 %2").arg(v, 0, 'f', 1).arg(units[u]);
}

} // namespace

ConsoleProgress::ConsoleProgress(prosftp::TransferService& service,
                                 std::shared_ptr<prosftp::ProgressChannel> channel,
                                 QObject* parent)
    : QObject(parent), service_(service), channel_(std::move(channel)) {
    timer_.setInterval(50);
    connect(&timer_, &QTimer::timeout, this, &ConsoleProgress::poll);
}

void ConsoleProgress::installSignalHandler() {
    std::signal(SIGINT, onSigint);
}

int ConsoleProgress::exitCodeFor(const prosftp::TransferReport& report) {
    switch (report.status) {
    case prosftp::TransferStatus::Success:
        return 0;
    case prosftp::TransferStatus::Cancelled:
        return 130;
    case prosftp::TransferStatus::Failed:
        break;
    }
    return 1;
}

void ConsoleProgress::start() {
    timer_.start();
}

void ConsoleProgress::poll() {
    const int pending = static_cast<int>(g_interrupts);
    if (pending > handledInterrupts_) {
        handledInterrupts_ = pending;
        closeLine();
        if (pending == 1) {
            std::fprintf(stderr, "Cancelling... (press Ctrl+C again to abort)\n");
            service_.cancel();
        } else {
            std::fprintf(stderr, "Aborting, closing the connection\n");
            service_.abort();
        }
    }

    prosftp::TransferEvent ev;
    while (channel_->tryNext(ev)) {
        if (ev.type == prosftp::TransferEvent::Type::Finished) {
            timer_.stop();
            closeLine();
            report_ = ev.report;
            for (const auto& issue : report_.cleanup_issues)
                qCWarning(pcCli).noquote() << "cleanup:" << QString::fromStdString(issue);
            for (const auto& path : report_.outputs)
                std::fprintf(stderr, "  -> %s\n", path.c_str());
            std::fprintf(stderr, "%s\n", report_.summary().c_str());
            emit finished(exitCodeFor(report_));
            return;
        }
        render(ev);
    }
}

void ConsoleProgress::render(const prosftp::TransferEvent& ev) {
    if (ev.type == prosftp::TransferEvent::Type::Status) {
        closeLine();
        std::fprintf(stderr, "%s\n", ev.message.c_str());
        return;
    }
    QString line = humanBytes(ev.bytes_done);
    if (ev.bytes_total > 0) {
        const int pct = static_cast<int>(ev.bytes_done * 100 / ev.bytes_total);
        line = QString("%1% %2 / %3").arg(pct, 3).arg(line, humanBytes(ev.bytes_total));
    }
    std::fprintf(stderr, "\r%-48s", line.toLocal8Bit().constData());
    std::fflush(stderr);
    lineOpen_ = true;
}

void ConsoleProgress::closeLine() {
    if (!lineOpen_) return;
    std::fprintf(stderr, "\n");
    lineOpen_ = false;
}
