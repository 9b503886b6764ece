// Command line and persisted defaults of the prosftp console front end.
#pragma once
#include "prosftp/SftpTypes.hpp"
#include <QString>
#include <QStringList>

class QCoreApplication;

struct CliOptions {
    QString command;   // ls | mkdir | put | put-dir | get | get-dir
    QStringList args;  // positional arguments after the command
    prosftp::SessionOptions session;
    bool extract = false;
    QString scratchDir; // remote scratch directory override
};

// Parses argv on top of the QSettings defaults. On failure error holds a
// message for the user (or is empty when --help/--version already printed).
bool parseCliOptions(const QCoreApplication& app, CliOptions& out, QString& error);

// Stores host/port/user/key/policy/scratch dir as the next defaults.
void rememberCliOptions(const CliOptions& opt);

prosftp::KnownHostsPolicy policyFromString(const QString& s, bool* ok = nullptr);
QString policyToString(prosftp::KnownHostsPolicy p);
