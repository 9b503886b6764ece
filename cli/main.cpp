// prosftp: console front end over the transfer core.
#include "CliOptions.hpp"
#include "ConsoleProgress.hpp"
#include "prosftp/Libssh2SftpClient.hpp"
#include "prosftp/Log.hpp"
#include "prosftp/TransferService.hpp"

#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>

#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(pcCli, "prosftp.cli")

namespace {

// Core log lines go through the Qt category so QT_LOGGING_RULES applies.
// Info lines stay quiet unless PRO_SFTP_LOG is set.
void installCoreLogBridge() {
    prosftp::setLogSink([](prosftp::LogLevel level, const std::string& msg) {
        const QString text = QString::fromStdString(msg);
        switch (level) {
        case prosftp::LogLevel::Debug:
            qCDebug(pcCli).noquote() << text;
            break;
        case prosftp::LogLevel::Info:
            if (!prosftp::normalizedEnv("PRO_SFTP_LOG").empty())
                qCInfo(pcCli).noquote() << text;
            break;
        case prosftp::LogLevel::Warning:
            qCWarning(pcCli).noquote() << text;
            break;
        case prosftp::LogLevel::Error:
            qCCritical(pcCli).noquote() << text;
            break;
        }
    });
}

int reportError(const char* what, const prosftp::SftpError& err) {
    std::fprintf(stderr, "%s: %s\n", what, err.describe().c_str());
    return err.kind == prosftp::ErrorKind::Cancelled ? 130 : 1;
}

int runListing(prosftp::TransferService& service, const CliOptions& opt) {
    const std::string path = opt.args.isEmpty() ? "/" : opt.args.front().toStdString();
    std::vector<prosftp::FileInfo> entries;
    prosftp::SftpError err;
    if (!service.listRemote(path, entries, err)) return reportError("ls", err);
    for (const auto& e : entries) {
        std::printf("%c %12llu  %s%s\n", e.is_dir ? 'd' : '-', static_cast<unsigned long long>(e.size),
                    e.name.c_str(), e.is_dir ? "/" : "");
    }
    return 0;
}

std::vector<std::string> toStd(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(list.size()));
    for (const auto& s : list) out.push_back(s.toStdString());
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("prosftp");
    QCoreApplication::setOrganizationName("ProSFTP");
    QCoreApplication::setApplicationVersion("0.1.0");
    installCoreLogBridge();

    CliOptions opt;
    QString parseError;
    if (!parseCliOptions(app, opt, parseError)) {
        std::fprintf(stderr, "prosftp: %s\nTry 'prosftp --help'.\n", parseError.toLocal8Bit().constData());
        return 2;
    }

    prosftp::TransferConfig cfg = prosftp::TransferConfig::fromEnvironment();
    if (!opt.scratchDir.isEmpty()) cfg.remote_scratch_dir = opt.scratchDir.toStdString();
    prosftp::TransferService service(std::make_unique<prosftp::Libssh2SftpClient>(), cfg);

    prosftp::SftpError err;
    if (!service.connect(opt.session, err)) return reportError("connect", err);
    qCInfo(pcCli) << "Connected";
    rememberCliOptions(opt);

    if (opt.command == "ls") {
        const int rc = runListing(service, opt);
        service.disconnect();
        return rc;
    }
    if (opt.command == "mkdir") {
        const bool ok = service.makeRemoteDirectory(opt.args.front().toStdString(), err);
        service.disconnect();
        return ok ? 0 : reportError("mkdir", err);
    }

    QStringList sources = opt.args;
    const std::string destination = sources.takeLast().toStdString();
    std::shared_ptr<prosftp::ProgressChannel> channel;
    if (opt.command == "put") {
        channel = service.uploadFiles(toStd(sources), destination, err);
    } else if (opt.command == "put-dir") {
        channel = service.uploadFolder(QFileInfo(sources.front()).absoluteFilePath().toStdString(), destination,
                                       opt.extract, err);
    } else if (opt.command == "get") {
        channel = service.downloadFiles(toStd(sources), destination, err);
    } else {
        channel = service.downloadFolder(sources.front().toStdString(), destination, opt.extract, err);
    }
    if (!channel) return reportError(opt.command.toLocal8Bit().constData(), err);

    ConsoleProgress::installSignalHandler();
    ConsoleProgress progress(service, channel);
    QObject::connect(&progress, &ConsoleProgress::finished, &app, [](int code) { QCoreApplication::exit(code); });
    progress.start();
    const int rc = app.exec();
    service.disconnect();
    return rc;
}
