/*
 * remotefiles: remote file access over SSH/SFTP
 *
 * Copyright (c) 2025 Timo Erkvaara / CPUNK
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>
#include <QUuid>

#include <cstdio>
#include <memory>

#include "AuditLogger.h"
#include "ConnectionPool.h"
#include "CredentialResolver.h"
#include "FileSessionManager.h"
#include "HostStore.h"
#include "LibsshTransport.h"
#include "Logger.h"
#include "RemoteSettings.h"
#include "Sync/DirectorySynchronizer.h"
#include "Transfer/SessionTransferBackend.h"
#include "Transfer/TransferCoordinator.h"

// main.cpp
// --------
// Command-line front end for the remote file layer.
//
//   remotefiles hosts
//   remotefiles ls   <host-id> <remote-dir>
//   remotefiles get  <host-id> <remote-file> <local-file>
//   remotefiles put  <host-id> <local-file> <remote-file>
//   remotefiles sync <host-id> <local-dir> <remote-dir> [--apply] [--mirror]
//
// Hosts come from hosts.json (HostStore). Secrets are read from the
// environment as REMOTEFILES_SECRET_<KEY> (key upper-cased, non-alnum -> '_').

// Secret store backed by environment variables.
class EnvSecretStore : public SecretStore
{
public:
    QString secret(const QString& key) const override
    {
        QString name = key.toUpper();
        for (QChar& c : name) {
            if (!c.isLetterOrNumber())
                c = '_';
        }
        return qEnvironmentVariable(("REMOTEFILES_SECRET_" + name).toUtf8().constData());
    }

    void setSecret(const QString& key, const QString& value) override
    {
        Q_UNUSED(key);
        Q_UNUSED(value);
    }
};

static void printLine(const QString& s)
{
    std::fprintf(stdout, "%s\n", s.toUtf8().constData());
}

static int fail(const RemoteError& e)
{
    std::fprintf(stderr, "error: %s\n", e.toString().toUtf8().constData());
    return 1;
}

static void printProgress(const TransferProgress& p)
{
    std::fprintf(stderr, "\r%3d%%  %s   ", p.percent, p.speedLabel.toUtf8().constData());
    std::fflush(stderr);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Stable keys for QSettings and QStandardPaths.
    QCoreApplication::setOrganizationName("CPUNK");
    QCoreApplication::setApplicationName("remotefiles");
    QCoreApplication::setApplicationVersion("0.9.0-alpha");

    QCommandLineParser parser;
    parser.setApplicationDescription("Remote file access over SSH/SFTP");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "hosts | ls | get | put | sync");
    QCommandLineOption applyOpt("apply", "sync: execute the plan instead of printing it");
    QCommandLineOption mirrorOpt("mirror", "sync: delete remote entries missing locally");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging");
    parser.addOption(applyOpt);
    parser.addOption(mirrorOpt);
    parser.addOption(verboseOpt);
    parser.process(app);

    QSettings s;
    Logger::setLogLevel(parser.isSet(verboseOpt) ? 2 : s.value("logging/level", 1).toInt());
    Logger::setLogFilePathOverride(s.value("logging/filePath").toString());
    Logger::setRotation(s.value("logging/maxBytes", 2 * 1024 * 1024).toLongLong(),
                        s.value("logging/keep", 3).toInt());
    Logger::install("remotefiles");
    AuditLogger::install("remotefiles");
    AuditLogger::setSessionId(QUuid::createUuid().toString(QUuid::WithoutBraces));
    AuditLogger::writeEvent("session.start");

    RemoteSettings settings = RemoteSettings::load(s);
    settings.sanitize();

    QString storeErr;
    const QVector<HostDescriptor> hosts = HostStore::load(&storeErr);
    if (!storeErr.isEmpty())
        qWarning().noquote() << QString("[AUTH] %1").arg(storeErr);

    const QStringList args = parser.positionalArguments();
    const QString cmd = args.value(0);

    if (cmd == "hosts") {
        for (const HostDescriptor& h : hosts)
            printLine(QString("%1\t%2\t%3").arg(h.id, h.displayTarget(), authMethodName(h.auth)));
        return 0;
    }

    const QStringList known{"ls", "get", "put", "sync"};
    if (!known.contains(cmd) || args.size() < (cmd == "ls" ? 3 : 4)) {
        parser.showHelp(2);
    }

    ConnectionPool pool(&LibsshTransport::create);
    auto resolver = std::make_shared<DefaultCredentialResolver>(std::make_shared<EnvSecretStore>());
    FileSessionManager sessions(&pool, resolver, settings);
    sessions.setHealthMonitoring(false);
    sessions.setHosts(hosts);

    RemoteError err;
    const std::shared_ptr<RemoteFileSession> session = sessions.sessionFor(args.at(1), &err);
    if (!session)
        return fail(err);

    int rc = 0;
    if (cmd == "ls") {
        FileEntryList entries;
        if (!session->list(args.at(2), &entries, true, &err))
            return fail(err);
        for (const FileEntry& e : entries) {
            printLine(QString("%1 %2 %3 %4 %5%6")
                          .arg(e.permissions, -10)
                          .arg(e.owner, -8)
                          .arg(e.size, 12)
                          .arg(e.modified.toString("yyyy-MM-dd HH:mm"), e.name,
                               e.isSymlink() ? QString(" -> %1").arg(e.symlinkTarget) : QString()));
        }
    } else if (cmd == "get") {
        if (!session->get(args.at(2), args.at(3), printProgress, nullptr, &err))
            rc = fail(err);
        std::fprintf(stderr, "\n");
    } else if (cmd == "put") {
        if (!session->put(args.at(2), args.at(3), printProgress, nullptr, &err))
            rc = fail(err);
        std::fprintf(stderr, "\n");
    } else if (cmd == "sync") {
        TransferCoordinator coordinator(std::make_shared<SessionTransferBackend>(&sessions), settings);
        DirectorySynchronizer sync(&sessions, std::make_shared<QtLocalFileSystem>(), &coordinator);

        const SyncSide left = SyncSide::local(args.at(2));
        const SyncSide right = SyncSide::remote(session->host(), args.at(3));
        SyncOptions options;

        QVector<SyncItem> items;
        if (!sync.compare(left, right, options, &items, &err))
            return fail(err);
        if (parser.isSet(mirrorOpt))
            items = DirectorySynchronizer::withDeletions(items, SyncItem::Direction::LeftToRight);

        for (const SyncItem& it : items)
            printLine(QString("%1\t%2\t%3\t%4").arg(syncActionName(it.action), syncDirectionName(it.direction),
                                                    it.name, it.reason));

        if (parser.isSet(applyOpt)) {
            SyncReport report;
            if (!sync.execute(left, right, items, options, nullptr, &report, &err))
                rc = fail(err);

            if (rc == 0 && report.queued > 0) {
                QObject::connect(&coordinator, &TransferCoordinator::queueChanged, &app,
                                 [&app](const TransferQueueSummary& q) {
                                     if (q.active == 0 && q.queued == 0)
                                         app.quit();
                                 });
                coordinator.processQueue();
                app.exec();

                for (const TransferJob& j : coordinator.allJobs()) {
                    if (j.status == TransferJob::Status::Error) {
                        std::fprintf(stderr, "error: %s: %s\n", j.fileName.toUtf8().constData(),
                                     j.error.toUtf8().constData());
                        rc = 1;
                    }
                }
            }
            printLine(QString("executed=%1 queued=%2 skipped=%3")
                          .arg(report.executed).arg(report.queued).arg(report.skipped));
        }
    }

    sessions.dispose();
    pool.dispose();
    AuditLogger::writeEvent("session.end");
    Logger::shutdown();
    return rc;
}
