#include "CliOptions.hpp"
#include "prosftp/RuntimeLogging.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QSettings>

#include <cstdio>
#include <iostream>
#include <string>

#include <termios.h>
#include <unistd.h>

namespace {

const QStringList kCommands = {"ls", "mkdir", "put", "put-dir", "get", "get-dir"};

// Reads one line from the terminal with echo disabled.
std::string promptSecret(const std::string& prompt) {
    std::fprintf(stderr, "%s", prompt.c_str());
    std::fflush(stderr);
    termios oldt{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios noecho = oldt;
        noecho.c_lflag &= static_cast<tcflag_t>(~ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
    }
    std::string line;
    std::getline(std::cin, line);
    if (tty) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::fprintf(stderr, "\n");
    }
    return line;
}

bool confirmHostKey(const std::string& host, std::uint16_t port, const std::string& alg,
                    const std::string& fp) {
    std::fprintf(stderr,
                 "The authenticity of host '%s:%u' can't be established.\n"
                 "%s key fingerprint is %s.\n"
                 "Trust it and add it to known_hosts? [y/N] ",
                 host.c_str(), static_cast<unsigned>(port), alg.c_str(), fp.c_str());
    std::fflush(stderr);
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

bool expectedArgs(const QString& cmd, int n) {
    if (cmd == "ls") return n <= 1;
    if (cmd == "mkdir") return n == 1;
    if (cmd == "put-dir" || cmd == "get-dir") return n == 2;
    return n >= 2; // put / get: sources... destination
}

} // namespace

prosftp::KnownHostsPolicy policyFromString(const QString& s, bool* ok) {
    const QString v = s.trimmed().toLower();
    if (ok) *ok = true;
    if (v == "accept-new" || v == "acceptnew" || v == "tofu") return prosftp::KnownHostsPolicy::AcceptNew;
    if (v == "off" || v == "no") return prosftp::KnownHostsPolicy::Off;
    if (v != "strict" && ok) *ok = false;
    return prosftp::KnownHostsPolicy::Strict;
}

QString policyToString(prosftp::KnownHostsPolicy p) {
    switch (p) {
    case prosftp::KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case prosftp::KnownHostsPolicy::Off:
        return "off";
    case prosftp::KnownHostsPolicy::Strict:
        break;
    }
    return "strict";
}

bool parseCliOptions(const QCoreApplication& app, CliOptions& out, QString& error) {
    QSettings s("ProSFTP", "ProSFTP");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "SFTP file and folder transfers. Folders travel as a single tar.gz archive.");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption hostOpt({"H", "host"}, "Remote host.", "host", s.value("Session/host").toString());
    const QCommandLineOption portOpt({"p", "port"}, "SSH port.", "port", s.value("Session/port", 22).toString());
    const QCommandLineOption userOpt({"u", "user"}, "User name.", "user", s.value("Session/user").toString());
    const QCommandLineOption keyOpt({"i", "identity"}, "Private key file.", "path",
                                    s.value("Session/keyPath").toString());
    const QCommandLineOption khOpt("known-hosts", "known_hosts file (default ~/.ssh/known_hosts).", "path",
                                   s.value("Security/knownHosts").toString());
    const QCommandLineOption policyOpt("host-key-policy", "strict, accept-new or off.", "policy",
                                       s.value("Security/khPolicy", "strict").toString());
    const QCommandLineOption extractOpt({"x", "extract"}, "Extract folder archives at the destination.");
    const QCommandLineOption scratchOpt("scratch-dir", "Remote directory for temporary archives.", "dir",
                                        s.value("Transfer/scratchDir").toString());
    parser.addOptions({hostOpt, portOpt, userOpt, keyOpt, khOpt, policyOpt, extractOpt, scratchOpt});
    parser.addPositionalArgument("command", "ls | mkdir | put | put-dir | get | get-dir");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    if (!parser.parse(app.arguments())) {
        error = parser.errorText();
        return false;
    }
    if (parser.isSet("help")) parser.showHelp(0);
    if (parser.isSet("version")) parser.showVersion();

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() || !kCommands.contains(positional.front())) {
        error = "Expected one of: " + kCommands.join(", ");
        return false;
    }
    out.command = positional.takeFirst();
    out.args = positional;
    if (!expectedArgs(out.command, out.args.size())) {
        error = "Wrong number of arguments for '" + out.command + "'";
        return false;
    }

    bool portOk = false;
    const int port = parser.value(portOpt).toInt(&portOk);
    if (!portOk || port <= 0 || port > 65535) {
        error = "Invalid port: " + parser.value(portOpt);
        return false;
    }
    bool policyOk = false;
    out.session.known_hosts_policy = policyFromString(parser.value(policyOpt), &policyOk);
    if (!policyOk) {
        error = "Invalid host key policy: " + parser.value(policyOpt);
        return false;
    }

    out.session.host = parser.value(hostOpt).toStdString();
    out.session.port = static_cast<std::uint16_t>(port);
    out.session.username = parser.value(userOpt).toStdString();
    if (out.session.host.empty() || out.session.username.empty()) {
        error = "--host and --user are required";
        return false;
    }
    if (!parser.value(keyOpt).isEmpty())
        out.session.private_key_path = QDir::cleanPath(parser.value(keyOpt)).toStdString();
    if (!parser.value(khOpt).isEmpty()) out.session.known_hosts_path = parser.value(khOpt).toStdString();
    out.extract = parser.isSet(extractOpt);
    out.scratchDir = parser.value(scratchOpt);

    const std::string envPassword = prosftp::rawEnv("PRO_SFTP_PASSWORD");
    if (!envPassword.empty()) {
        out.session.password = envPassword;
    } else if (!out.session.private_key_path && ::isatty(STDIN_FILENO)) {
        out.session.password = promptSecret(out.session.username + "@" + out.session.host + "'s password: ");
    }
    if (out.session.private_key_path) {
        const std::string pass = prosftp::rawEnv("PRO_SFTP_KEY_PASSPHRASE");
        if (!pass.empty()) out.session.private_key_passphrase = pass;
    }
    out.session.hostkey_confirm_cb = confirmHostKey;
    return true;
}

void rememberCliOptions(const CliOptions& opt) {
    QSettings s("ProSFTP", "ProSFTP");
    s.setValue("Session/host", QString::fromStdString(opt.session.host));
    s.setValue("Session/port", static_cast<int>(opt.session.port));
    s.setValue("Session/user", QString::fromStdString(opt.session.username));
    if (opt.session.private_key_path)
        s.setValue("Session/keyPath", QString::fromStdString(*opt.session.private_key_path));
    if (opt.session.known_hosts_path)
        s.setValue("Security/knownHosts", QString::fromStdString(*opt.session.known_hosts_path));
    s.setValue("Security/khPolicy", policyToString(opt.session.known_hosts_policy));
    if (!opt.scratchDir.isEmpty()) s.setValue("Transfer/scratchDir", opt.scratchDir);
}
