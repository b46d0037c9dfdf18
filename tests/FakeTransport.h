#pragma once

#include <QByteArray>
#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QHash>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QThread>

#include <atomic>
#include <functional>
#include <memory>

#include "CredentialResolver.h"
#include "HostDescriptor.h"
#include "RemoteTransport.h"

class FakeTransport;
struct FakeWire;

// In-memory SSH host shared by every FakeTransport a test opens against it.
//
// Operation names used for counting, delays and failure injection:
//   connect sftp list stat lstat readlink expand mkdir rmdir unlink
//   rename chmod open create read write close exec keepalive
class FakeServer : public std::enable_shared_from_this<FakeServer>
{
public:
    using ExecHandler = std::function<bool(const QString& command, ExecResult* out, RemoteError* err)>;

    struct Node {
        FileEntry::Type type = FileEntry::Type::File;
        QByteArray data;
        quint32 permissions = 0644;
        QDateTime modified;
        QString linkTarget;
    };

    explicit FakeServer(const QString& home = QStringLiteral("/home/alice"));

    QString home() const { return m_home; }

    // Parents are created as needed.
    void addDir(const QString& path, const QDateTime& modified = QDateTime());
    void addFile(const QString& path, const QByteArray& data, const QDateTime& modified = QDateTime());
    void addSymlink(const QString& path, const QString& target);

    bool hasNode(const QString& path) const;
    QByteArray fileData(const QString& path) const;
    quint32 permissions(const QString& path) const;
    QStringList paths() const;

    void failNext(const QString& op, const RemoteError& error, int count = 1);
    void failAlways(const QString& op, const RemoteError& error);
    void clearFailures();
    // The call sleeps `ms` while holding its connection's wire lock, like a
    // libssh call blocked on the socket. Closing the transport cuts the
    // sleep short with a connection reset.
    void setDelay(const QString& op, int ms);

    // Once `bytes` have been served by reads (all files), the next read
    // fails with a connection reset. One shot.
    void breakReadAfter(qint64 bytes);

    void setExpandSupported(bool supported);
    void setExecHandler(ExecHandler handler);

    int transportsOpened() const;
    int transportsClosed() const;
    int callCount(const QString& op) const;
    QStringList commands() const;

    std::shared_ptr<FakeTransport> lastTransport() const;

    TransportFactory factory();

    // Used by the fake transport and channel.
    bool enter(const QString& op, RemoteError* err);
    void noteOpened(const std::shared_ptr<FakeTransport>& t);
    void noteClosed();
    bool runExec(const QString& command, ExecResult* out, RemoteError* err);

    QString resolve(const QString& path) const;
    bool listDirectory(const QString& path, FileEntryList* out, RemoteError* err);
    bool stat(const QString& path, bool follow, FileEntry* out, RemoteError* err);
    bool readLink(const QString& path, QString* target, RemoteError* err);
    bool expandPath(const QString& path, QString* out, RemoteError* err);
    bool makeDirectory(const QString& path, int mode, RemoteError* err);
    bool removeDirectory(const QString& path, RemoteError* err);
    bool removeFile(const QString& path, RemoteError* err);
    bool rename(const QString& from, const QString& to, RemoteError* err);
    bool chmod(const QString& path, int mode, RemoteError* err);
    bool truncate(const QString& path, RemoteError* err);
    qint64 readAt(const QString& path, qint64 offset, char* buf, qint64 maxLen, RemoteError* err);
    qint64 append(const QString& path, const char* buf, qint64 len, RemoteError* err);

private:
    FileEntry entryFor(const QString& path, const Node& n) const;
    bool parentIsDirLocked(const QString& path) const;

    mutable QMutex m_mutex;
    QString m_home;
    QMap<QString, Node> m_nodes;

    QHash<QString, QList<RemoteError>> m_failNext;
    QHash<QString, RemoteError> m_failAlways;
    QHash<QString, int> m_delays;
    QHash<QString, int> m_calls;
    qint64 m_readBudget = -1;
    bool m_expandSupported = true;
    ExecHandler m_exec;
    QStringList m_commands;

    int m_opened = 0;
    int m_closed = 0;
    std::weak_ptr<FakeTransport> m_last;
};

class FakeTransport : public RemoteTransport,
                      public std::enable_shared_from_this<FakeTransport>
{
public:
    explicit FakeTransport(std::shared_ptr<FakeServer> server);
    ~FakeTransport() override;

    bool open(const HostDescriptor& host, const AuthMaterial& auth, RemoteError* err = nullptr) override;
    void close() override;
    bool isOpen() const override;
    void setClosedHandler(ClosedHandler handler) override;
    std::shared_ptr<SftpChannel> openSftp(RemoteError* err = nullptr) override;
    bool exec(const QString& command, ExecResult* out, int timeoutMs, RemoteError* err = nullptr) override;
    bool sendKeepAlive(RemoteError* err = nullptr) override;

    // The peer went away: marks the transport closed and fires the handler.
    void dropUnexpectedly(const QString& reason);

    // True while a call holds this connection's wire lock.
    bool isBusy() const;

    QString lastAuthDescription() const;

private:
    std::shared_ptr<FakeServer> m_server;
    std::shared_ptr<FakeWire> m_wire;
    ClosedHandler m_closedHandler;
    mutable QMutex m_mutex;
    QString m_authDescription;
};

// Returns fixed password material; counts calls.
class StaticCredentialResolver : public CredentialResolver
{
public:
    bool resolve(const HostDescriptor& host, AuthMaterial* out, RemoteError* err = nullptr) override;

    std::atomic_int calls{0};
    bool fail = false;
};

HostDescriptor makeTestHost(const QString& id = QStringLiteral("h1"));

// Processes events until `done` holds or `timeoutMs` passes.
inline bool pumpUntil(const std::function<bool()>& done, int timeoutMs = 5000)
{
    QElapsedTimer t;
    t.start();
    while (!done()) {
        if (t.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(5);
    }
    return true;
}
