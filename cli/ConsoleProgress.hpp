// Drains a transfer's ProgressChannel on the Qt event loop and renders it on
// stderr. SIGINT requests cancellation; a second SIGINT aborts the connection.
#pragma once
#include "prosftp/ProgressChannel.hpp"
#include "prosftp/TransferService.hpp"

#include <QObject>
#include <QTimer>
#include <memory>

class ConsoleProgress : public QObject {
    Q_OBJECT
public:
    ConsoleProgress(prosftp::TransferService& service,
                    std::shared_ptr<prosftp::ProgressChannel> channel,
                    QObject* parent = nullptr);

    void start();
    const prosftp::TransferReport& report() const { return report_; }

    static void installSignalHandler();
    // 0 success, 1 failure, 130 cancelled
    static int exitCodeFor(const prosftp::TransferReport& report);

signals:
    void finished(int exitCode);

private slots:
    void poll();

private:
    prosftp::TransferService& service_;
    std::shared_ptr<prosftp::ProgressChannel> channel_;
    QTimer timer_;
    prosftp::TransferReport report_;
    int handledInterrupts_ = 0;
    bool lineOpen_ = false;

    void render(const prosftp::TransferEvent& ev);
    void closeLine();
};
