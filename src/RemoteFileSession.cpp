// RemoteFileSession.cpp
#include "RemoteFileSession.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QMetaObject>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QSemaphore>
#include <QThread>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>

#include "AuditLogger.h"
#include "RemotePath.h"

// ------------------------------------------------------------
// Bounded calls on the session I/O pool
//
// The worker owns copies of everything it touches (handles, buffers),
// so a call that times out may finish later without dangling.
// ------------------------------------------------------------
template <typename T>
struct TimedCall
{
    QSemaphore done;
    bool ok = false;
    T value{};
    RemoteError error;
};

template <typename T>
static bool callWithTimeout(QThreadPool* pool,
                            int timeoutMs,
                            RemoteError::TimeoutPhase phase,
                            const QString& what,
                            std::function<bool(T*, RemoteError*)> fn,
                            T* out,
                            RemoteError* err)
{
    auto call = std::make_shared<TimedCall<T>>();
    QFuture<void> f = QtConcurrent::run(pool, [call, fn]() {
        call->ok = fn(&call->value, &call->error);
        call->done.release();
    });
    Q_UNUSED(f);

    if (!call->done.tryAcquire(1, timeoutMs))
        return setError(err, RemoteError::timeout(phase, what, timeoutMs));

    if (!call->ok) {
        if (!call->error.isError())
            call->error = RemoteError(RemoteError::Kind::RemoteFailure, QString("%1 failed.").arg(what));
        return setError(err, call->error);
    }
    if (out) *out = std::move(call->value);
    return true;
}

static void sleepUnlessCancelled(int ms, const CancelFlag& cancel)
{
    QElapsedTimer t;
    t.start();
    while (t.elapsed() < ms) {
        if (cancel && cancel->load())
            return;
        QThread::msleep((unsigned long)qMin<qint64>(50, ms - t.elapsed()));
    }
}

static bool isCancelled(const CancelFlag& cancel)
{
    return cancel && cancel->load();
}

// ------------------------------------------------------------
// Session lifecycle
// ------------------------------------------------------------
RemoteFileSession::RemoteFileSession(const HostDescriptor& host,
                                     ConnectionPool* pool,
                                     std::shared_ptr<CredentialResolver> resolver,
                                     std::shared_ptr<DirectoryCache> cache,
                                     const RemoteSettings& settings,
                                     QObject* parent)
    : QObject(parent),
      m_host(host),
      m_pool(pool),
      m_resolver(std::move(resolver)),
      m_cache(std::move(cache)),
      m_settings(settings)
{
    m_health.hostId = m_host.id;

    if (!m_cache)
        m_cache = std::make_shared<DirectoryCache>(m_settings.cacheMaxBytes, m_settings.cacheTtlMs);

    m_io.setMaxThreadCount(8);
    m_io.setExpiryTimeout(30000);

    m_healthTimer = new QTimer(this);
    m_healthTimer->setInterval(m_settings.healthIntervalMs);
    QObject::connect(m_healthTimer, &QTimer::timeout, this, [this]() {
        if (state() != State::Ready || m_probeRunning.load())
            return;
        QFuture<void> f = QtConcurrent::run(&m_io, [this]() { runHealthProbe(); });
        Q_UNUSED(f);
    });
}

RemoteFileSession::~RemoteFileSession()
{
    close();
}

RemoteFileSession::State RemoteFileSession::state() const
{
    QMutexLocker lock(&m_mutex);
    return m_state;
}

ConnectionHealth RemoteFileSession::health() const
{
    QMutexLocker lock(&m_mutex);
    return m_health;
}

QString RemoteFileSession::stateName(State s)
{
    switch (s) {
    case State::Uninitialized: return "uninitialized";
    case State::Connecting:    return "connecting";
    case State::Ready:         return "ready";
    case State::Unhealthy:     return "unhealthy";
    case State::Reconnecting:  return "reconnecting";
    case State::Closed:        return "closed";
    }
    return "unknown";
}

void RemoteFileSession::setState(State s)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == s)
            return;
        m_state = s;
    }
    qInfo().noquote() << QString("[SFTP] host='%1' state=%2").arg(m_host.id, stateName(s));
    emit stateChanged();
}

bool RemoteFileSession::open(RemoteError* err)
{
    return withRetry(QStringLiteral("Connect"), [this](RemoteError* e) {
        Handles h;
        return ensureReady(&h, e);
    }, err);
}

void RemoteFileSession::close()
{
    if (QThread::currentThread() == m_healthTimer->thread())
        m_healthTimer->stop();
    else
        QMetaObject::invokeMethod(m_healthTimer, "stop", Qt::QueuedConnection);

    Handles h;
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == State::Closed)
            return;
        h = m_handles;
        m_handles = Handles{};
        m_state = State::Closed;
    }

    h.sftp.reset();
    if (h.transport)
        m_pool->release(m_host.id, h.transport.get());

    qInfo().noquote() << QString("[SFTP] host='%1' session closed").arg(m_host.id);
    emit stateChanged();
}

bool RemoteFileSession::ensureReady(Handles* out, RemoteError* err)
{
    const RemoteError closedErr(RemoteError::Kind::Connection,
                                QString("Session for '%1' is closed.").arg(m_host.id));
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == State::Closed)
            return setError(err, closedErr);
        if (m_handles.sftp && !m_reconnectRequested && m_handles.transport->isOpen()) {
            *out = m_handles;
            return true;
        }
    }

    QMutexLocker connectLock(&m_connectMutex);

    bool reconnect = false;
    Handles stale;
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == State::Closed)
            return setError(err, closedErr);
        // Someone else connected while we waited for m_connectMutex.
        if (m_handles.sftp && !m_reconnectRequested && m_handles.transport->isOpen()) {
            *out = m_handles;
            return true;
        }
        reconnect = (m_state != State::Uninitialized && m_state != State::Connecting);
        stale = m_handles;
        m_handles = Handles{};
        m_reconnectRequested = false;
    }

    if (stale.transport) {
        stale.sftp.reset();
        m_pool->release(m_host.id, stale.transport.get());
    }

    setState(reconnect ? State::Reconnecting : State::Connecting);
    const State failedState = reconnect ? State::Unhealthy : State::Uninitialized;

    for (int attempt = 0; attempt < 2; ++attempt) {
        RemoteError e;
        std::shared_ptr<RemoteTransport> transport = m_pool->acquire(m_host, *m_resolver, &e);
        if (!transport) {
            setState(failedState);
            return setError(err, e);
        }

        std::shared_ptr<SftpChannel> sftp;
        const bool ok = callWithTimeout<std::shared_ptr<SftpChannel>>(
            &m_io, m_settings.sftpInitTimeoutMs, RemoteError::TimeoutPhase::Init,
            QStringLiteral("SFTP init"),
            [transport](std::shared_ptr<SftpChannel>* o, RemoteError* ie) {
                *o = transport->openSftp(ie);
                return *o != nullptr;
            },
            &sftp, &e);

        if (ok) {
            {
                QMutexLocker lock(&m_mutex);
                if (m_state == State::Closed) {
                    lock.unlock();
                    sftp.reset();
                    m_pool->release(m_host.id, transport.get());
                    return setError(err, closedErr);
                }
                m_handles.transport = transport;
                m_handles.sftp = sftp;
                m_health.reset();
                *out = m_handles;
            }
            setState(State::Ready);
            emit healthChanged();
            return true;
        }

        if (e.kind() == RemoteError::Kind::Timeout && attempt == 0) {
            // A hung subsystem request leaves the connection unusable: force a fresh one.
            qWarning().noquote() << QString("[SFTP] %1 host='%2' -> reconnecting once")
                                        .arg(e.message(), m_host.id);
            transport->close();
            m_pool->release(m_host.id, transport.get());
            continue;
        }

        m_pool->release(m_host.id, transport.get());
        setState(failedState);
        return setError(err, e);
    }

    setState(failedState);
    return setError(err, RemoteError::timeout(RemoteError::TimeoutPhase::Init,
                                              QStringLiteral("SFTP init"),
                                              m_settings.sftpInitTimeoutMs));
}

void RemoteFileSession::dropConnection(const QString& reason)
{
    Handles h;
    {
        QMutexLocker lock(&m_mutex);
        h = m_handles;
        m_handles = Handles{};
        if (m_state != State::Closed)
            m_reconnectRequested = true;
    }

    if (!h.transport)
        return;

    qInfo().noquote() << QString("[SFTP] dropping connection host='%1': %2").arg(m_host.id, reason);
    h.sftp.reset();
    m_pool->release(m_host.id, h.transport.get());
}

bool RemoteFileSession::withRetry(const QString& what,
                                  const std::function<bool(RemoteError*)>& attempt,
                                  RemoteError* err,
                                  CancelFlag cancel)
{
    if (err) err->clear();

    const int attempts = qMax(0, m_settings.maxRetries) + 1;
    RemoteError last;

    for (int i = 0; i < attempts; ++i) {
        if (i > 0) {
            const int delay = m_settings.retryDelayMs(i - 1);
            qInfo().noquote() << QString("[SFTP] retry %1/%2 '%3' host='%4' in %5 ms")
                                     .arg(i).arg(attempts - 1).arg(what, m_host.id).arg(delay);
            sleepUnlessCancelled(delay, cancel);
        }

        if (isCancelled(cancel))
            return setError(err, RemoteError(RemoteError::Kind::Cancelled,
                                             QString("%1 cancelled.").arg(what)));

        last.clear();
        if (attempt(&last))
            return true;

        if (!last.isError())
            last = RemoteError(RemoteError::Kind::RemoteFailure, QString("%1 failed.").arg(what));

        if (!last.isTransient() || state() == State::Closed)
            return setError(err, last);

        qWarning().noquote() << QString("[SFTP] %1 failed (attempt %2/%3) host='%4': %5")
                                    .arg(what).arg(i + 1).arg(attempts).arg(m_host.id, last.message());
        dropConnection(last.message());
    }

    qWarning().noquote() << QString("[SFTP] %1 gave up after %2 attempt(s) host='%3'")
                                .arg(what).arg(attempts).arg(m_host.id);
    return setError(err, RemoteError::retryExhausted(attempts, last));
}

template <typename T>
bool RemoteFileSession::attemptOnce(const QString& what, Body<T> body, T* out, RemoteError* err,
                                    int timeoutMs, RemoteError::TimeoutPhase phase)
{
    Handles h;
    if (!ensureReady(&h, err))
        return false;

    const int t = (timeoutMs > 0) ? timeoutMs : m_settings.operationTimeoutMs;
    return callWithTimeout<T>(&m_io, t, phase, what,
                              [h, body](T* o, RemoteError* e) { return body(h, o, e); },
                              out, err);
}

template <typename T>
bool RemoteFileSession::runOp(const QString& what, Body<T> body, T* out, RemoteError* err, int timeoutMs)
{
    return withRetry(what, [&](RemoteError* e) {
        return attemptOnce<T>(what, body, out, e, timeoutMs);
    }, err);
}

bool RemoteFileSession::closeRemoteFile(const std::shared_ptr<SftpFile>& file, RemoteError* err)
{
    bool closed = false;
    return callWithTimeout<bool>(&m_io, m_settings.operationTimeoutMs, RemoteError::TimeoutPhase::Operation,
                                 QStringLiteral("Close"),
                                 [file](bool* o, RemoteError* e) { return *o = file->close(e); },
                                 &closed, err);
}

void RemoteFileSession::invalidateParent(const QString& path)
{
    m_cache->invalidateParent(m_host.id, path);
}

// ------------------------------------------------------------
// Browsing
// ------------------------------------------------------------
QString RemoteFileSession::expandPath(const QString& path)
{
    const QString p = path.trimmed();
    if (!RemotePath::needsTildeExpansion(p))
        return p;

    const bool homeRelative = (p == "~" || p.startsWith("~/"));
    if (homeRelative) {
        QMutexLocker lock(&m_mutex);
        if (!m_home.isEmpty())
            return RemotePath::substituteHome(p, m_home);
    }

    const QString target = homeRelative ? QStringLiteral("~") : p;
    QString expanded;
    RemoteError e;
    const bool ok = attemptOnce<QString>(
        QString("Expand '%1'").arg(target),
        [target](Handles h, QString* o, RemoteError* ie) { return h.sftp->expandPath(target, o, ie); },
        &expanded, &e, m_settings.pathExpandTimeoutMs, RemoteError::TimeoutPhase::PathExpand);

    if (!ok || expanded.isEmpty()) {
        const QString fallback = RemotePath::tildeFallback(p);
        qWarning().noquote() << QString("[SFTP] cannot expand '%1' host='%2' (%3) -> using '%4'")
                                    .arg(p, m_host.id, e.message(), fallback);
        return fallback;
    }

    if (!homeRelative)
        return expanded;

    {
        QMutexLocker lock(&m_mutex);
        m_home = expanded;
    }
    return RemotePath::substituteHome(p, expanded);
}

void RemoteFileSession::clearCache(const QString& path)
{
    if (path.trimmed().isEmpty()) {
        m_cache->clearHost(m_host.id);
        return;
    }
    m_cache->invalidate(m_host.id, RemotePath::normalize(expandPath(path)));
}

bool RemoteFileSession::listRaw(const QString& path, FileEntryList* out, RemoteError* err)
{
    return runOp<FileEntryList>(
        QString("List '%1'").arg(path),
        [path](Handles h, FileEntryList* o, RemoteError* e) { return h.sftp->listDirectory(path, o, e); },
        out, err);
}

bool RemoteFileSession::list(const QString& path, FileEntryList* out, bool useCache, RemoteError* err)
{
    if (err) err->clear();
    if (out) out->clear();

    const QString p = RemotePath::normalize(expandPath(path));

    FileEntryList entries;
    if (useCache && m_cache->lookup(m_host.id, p, &entries)) {
        qDebug().noquote() << QString("[SFTP] list host='%1' path='%2' (cached, %3 entries)")
                                  .arg(m_host.id, p).arg(entries.size());
        if (out) *out = entries;
        return true;
    }

    Body<FileEntryList> body = [p](Handles h, FileEntryList* o, RemoteError* e) -> bool {
        FileEntryList raw;
        if (!h.sftp->listDirectory(p, &raw, e))
            return false;

        for (FileEntry& fe : raw) {
            if (fe.isDirectory())
                fe.size = -1;
            if (!fe.isSymlink())
                continue;

            QString target;
            RemoteError linkErr;
            if (h.sftp->readLink(fe.path, &target, &linkErr)) {
                fe.symlinkTarget = target;
            } else if (linkErr.kind() == RemoteError::Kind::Connection) {
                *e = linkErr;
                return false;
            } else {
                fe.symlinkTarget = QStringLiteral("(unresolved)");
            }
        }

        sortForListing(&raw);
        *o = raw;
        return true;
    };

    if (!runOp<FileEntryList>(QString("List '%1'").arg(p), body, &entries, err))
        return false;

    m_cache->insert(m_host.id, p, entries);
    qDebug().noquote() << QString("[SFTP] list host='%1' path='%2' entries=%3")
                              .arg(m_host.id, p).arg(entries.size());
    if (out) *out = entries;
    return true;
}

bool RemoteFileSession::stat(const QString& path, FileEntry* out, RemoteError* err)
{
    const QString p = expandPath(path);
    return runOp<FileEntry>(
        QString("Stat '%1'").arg(p),
        [p](Handles h, FileEntry* o, RemoteError* e) { return h.sftp->stat(p, o, e); },
        out, err);
}

bool RemoteFileSession::exists(const QString& path, bool* out, RemoteError* err)
{
    FileEntry info;
    RemoteError e;
    if (stat(path, &info, &e)) {
        if (out) *out = true;
        if (err) err->clear();
        return true;
    }
    if (e.kind() == RemoteError::Kind::NotFound) {
        if (out) *out = false;
        if (err) err->clear();
        return true;
    }
    return setError(err, e);
}

// ------------------------------------------------------------
// Health
// ------------------------------------------------------------
void RemoteFileSession::startHealthMonitoring()
{
    m_healthTimer->setInterval(m_settings.healthIntervalMs);
    m_healthTimer->start();
    qInfo().noquote() << QString("[SFTP] health monitor on host='%1' every %2 ms")
                             .arg(m_host.id).arg(m_settings.healthIntervalMs);
}

void RemoteFileSession::stopHealthMonitoring()
{
    m_healthTimer->stop();
}

void RemoteFileSession::runHealthProbe()
{
    if (m_probeRunning.exchange(true))
        return;
    struct ProbeGuard {
        std::atomic_bool& flag;
        ~ProbeGuard() { flag.store(false); }
    } guard{m_probeRunning};

    Handles h;
    {
        QMutexLocker lock(&m_mutex);
        if (m_state != State::Ready || !m_handles.sftp)
            return;
        h = m_handles;
    }

    const bool keepAlive = m_host.keepAlive;
    QElapsedTimer t;
    t.start();

    FileEntry ignored;
    RemoteError e;
    const bool ok = callWithTimeout<FileEntry>(
        &m_io, m_settings.healthProbeTimeoutMs, RemoteError::TimeoutPhase::Operation,
        QStringLiteral("Health probe"),
        [h, keepAlive](FileEntry* o, RemoteError* ie) {
            if (keepAlive && !h.transport->sendKeepAlive(ie))
                return false;
            return h.sftp->stat(QStringLiteral("."), o, ie);
        },
        &ignored, &e);
    const qint64 ms = t.elapsed();

    if (!ok) {
        qWarning().noquote() << QString("[SFTP] health probe FAILED host='%1': %2").arg(m_host.id, e.message());
        noteHealthFailure(e.message());
        return;
    }

    qint64 avg = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_health.recordLatency(ms);
        avg = m_health.averageLatencyMs();
    }
    emit healthChanged();

    if (avg > m_settings.latencyReconnectMs) {
        qWarning().noquote() << QString("[SFTP] host='%1' average latency %2 ms > %3 ms -> reconnect")
                                    .arg(m_host.id).arg(avg).arg(m_settings.latencyReconnectMs);
        {
            QMutexLocker lock(&m_mutex);
            m_health.reset();
        }
        dropConnection(QString("average latency %1 ms").arg(avg));
    } else if (avg > m_settings.latencyWarnMs) {
        qWarning().noquote() << QString("[SFTP] host='%1' high latency: %2 ms (avg %3 ms)")
                                    .arg(m_host.id).arg(ms).arg(avg);
    }
}

void RemoteFileSession::noteHealthFailure(const QString& error)
{
    bool becameUnhealthy = false;
    int failures = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_health.recordFailure(error);
        failures = m_health.consecutiveFailures;
        if (failures >= m_settings.healthFailureThreshold && m_health.healthy) {
            m_health.healthy = false;
            becameUnhealthy = true;
        }
    }
    emit healthChanged();

    if (!becameUnhealthy)
        return;

    qWarning().noquote() << QString("[SFTP] host='%1' unhealthy after %2 consecutive failure(s)")
                                .arg(m_host.id).arg(failures);
    if (state() != State::Closed)
        setState(State::Unhealthy);
    dropConnection(QString("unhealthy: %1").arg(error));
}

void RemoteFileSession::noteTransferStall(qint64 stalledMs)
{
    qWarning().noquote() << QString("[SFTP] transfer stalled host='%1' for %2 ms").arg(m_host.id).arg(stalledMs);
    noteHealthFailure(QString("Transfer stalled for %1 ms").arg(stalledMs));
}

// ------------------------------------------------------------
// Downloads
// ------------------------------------------------------------
QString RemoteFileSession::partialPath(const QString& localPath)
{
    return localPath + QStringLiteral(".part");
}

bool RemoteFileSession::restartDownload(const QString& localPath)
{
    const QString part = partialPath(localPath);
    if (!QFileInfo::exists(part))
        return true;
    return QFile::remove(part);
}

bool RemoteFileSession::get(const QString& remotePath, const QString& localPath,
                            ProgressFn progress, CancelFlag cancel, RemoteError* err)
{
    if (err) err->clear();

    if (remotePath.trimmed().isEmpty() || localPath.trimmed().isEmpty())
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                         QStringLiteral("Download needs a remote and a local path.")));

    const QString remote = expandPath(remotePath);
    qInfo().noquote() << QString("[SFTP] get host='%1' '%2' -> '%3'").arg(m_host.id, remote, localPath);

    const bool ok = withRetry(QString("Download '%1'").arg(remote), [&](RemoteError* e) {
        return downloadAttempt(remote, localPath, progress, cancel, e);
    }, err, cancel);

    if (ok)
        qInfo().noquote() << QString("[SFTP] get OK '%1'").arg(localPath);
    return ok;
}

bool RemoteFileSession::downloadAttempt(const QString& remotePath, const QString& localPath,
                                        const ProgressFn& progress, const CancelFlag& cancel,
                                        RemoteError* err)
{
    FileEntry info;
    if (!attemptOnce<FileEntry>(QString("Stat '%1'").arg(remotePath),
                                [remotePath](Handles h, FileEntry* o, RemoteError* e) {
                                    return h.sftp->stat(remotePath, o, e);
                                },
                                &info, err))
        return false;

    if (info.isDirectory())
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                         QString("'%1' is a directory.").arg(remotePath)));

    const qint64 total = info.size;
    const QString part = partialPath(localPath);

    const QString localDir = QFileInfo(localPath).absolutePath();
    if (!QDir().mkpath(localDir))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot create local folder '%1'.").arg(localDir)));

    qint64 offset = QFileInfo::exists(part) ? QFileInfo(part).size() : 0;
    if (offset > 0 && offset >= total) {
        qInfo().noquote() << QString("[SFTP] partial '%1' is not smaller than remote (%2 >= %3) -> restart")
                                 .arg(part).arg(offset).arg(total);
        QFile::remove(part);
        offset = 0;
    }

    QFile out(part);
    const QIODevice::OpenMode mode = (offset > 0) ? (QIODevice::WriteOnly | QIODevice::Append)
                                                  : (QIODevice::WriteOnly | QIODevice::Truncate);
    if (!out.open(mode))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot write '%1': %2").arg(part, out.errorString())));

    if (offset > 0)
        qInfo().noquote() << QString("[SFTP] resuming '%1' at %2/%3 bytes").arg(remotePath).arg(offset).arg(total);

    std::shared_ptr<SftpFile> file;
    if (!attemptOnce<std::shared_ptr<SftpFile>>(
            QString("Open '%1'").arg(remotePath),
            [remotePath, offset](Handles h, std::shared_ptr<SftpFile>* o, RemoteError* e) {
                std::unique_ptr<SftpFile> f = h.sftp->openRead(remotePath, offset, e);
                if (!f)
                    return false;
                *o = std::move(f);
                return true;
            },
            &file, err))
        return false;

    const int chunk = qMax(1024, m_settings.chunkSize);
    qint64 done = offset;
    qint64 moved = 0;
    QElapsedTimer elapsed;
    elapsed.start();
    QElapsedTimer sinceData;
    sinceData.start();

    while (true) {
        if (isCancelled(cancel)) {
            out.close();
            RemoteError ignored;
            if (!closeRemoteFile(file, &ignored))
                qDebug().noquote() << QString("[SFTP] close after cancel: %1").arg(ignored.message());
            qInfo().noquote() << QString("[SFTP] get cancelled '%1' (%2 bytes kept in .part)")
                                     .arg(remotePath).arg(done);
            return setError(err, RemoteError(RemoteError::Kind::Cancelled,
                                             QString("Download of '%1' cancelled.").arg(remotePath)));
        }

        QByteArray data;
        const bool ok = callWithTimeout<QByteArray>(
            &m_io, m_settings.operationTimeoutMs, RemoteError::TimeoutPhase::Operation,
            QString("Read '%1'").arg(remotePath),
            [file, chunk](QByteArray* o, RemoteError* e) {
                o->resize(chunk);
                const qint64 n = file->read(o->data(), chunk, e);
                if (n < 0)
                    return false;
                o->resize((int)n);
                return true;
            },
            &data, err);
        if (!ok) {
            out.close();
            return false;
        }

        if (sinceData.elapsed() > m_settings.stallThresholdMs)
            noteTransferStall(sinceData.elapsed());

        if (data.isEmpty())
            break;

        if (out.write(data) != data.size()) {
            const QString why = out.errorString();
            out.close();
            return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                             QString("Write to '%1' failed: %2").arg(part, why)));
        }

        done += data.size();
        moved += data.size();
        sinceData.restart();

        if (progress) {
            TransferProgress p;
            p.bytesDone = done;
            p.bytesTotal = total;
            p.percent = (total > 0) ? int(qMin<qint64>(100, done * 100 / total)) : 100;
            p.bytesPerSecond = moved * 1000 / qMax<qint64>(1, elapsed.elapsed());
            p.speedLabel = formatSpeed(p.bytesPerSecond);
            progress(p);
        }
    }

    out.close();
    {
        RemoteError closeErr;
        if (!closeRemoteFile(file, &closeErr))
            qDebug().noquote() << QString("[SFTP] close '%1': %2").arg(remotePath, closeErr.message());
    }

    if (!verifyDownload(remotePath, part, total, err))
        return false;

    if (QFileInfo::exists(localPath) && !QFile::remove(localPath))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot replace '%1'.").arg(localPath)));
    if (!QFile::rename(part, localPath))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot move '%1' to '%2'.").arg(part, localPath)));

    if (progress && total == 0) {
        TransferProgress p;
        p.percent = 100;
        p.speedLabel = formatSpeed(0);
        progress(p);
    }
    return true;
}

bool RemoteFileSession::verifyDownload(const QString& remotePath, const QString& partPath,
                                       qint64 expectedSize, RemoteError* err)
{
    const qint64 got = QFileInfo(partPath).size();
    if (got != expectedSize) {
        if (got > expectedSize)
            QFile::remove(partPath);
        return setError(err, RemoteError(RemoteError::Kind::ChecksumMismatch,
                                         QString("Size mismatch for '%1': expected %2 bytes, got %3.")
                                             .arg(remotePath).arg(expectedSize).arg(got)));
    }

    if (!m_settings.verifyChecksum)
        return true;

    QString remoteHex;
    if (!checksum(remotePath, ChecksumAlgorithm::Md5, &remoteHex, err))
        return false;

    QFile f(partPath);
    if (!f.open(QIODevice::ReadOnly))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot read '%1': %2").arg(partPath, f.errorString())));
    QCryptographicHash hash(QCryptographicHash::Md5);
    if (!hash.addData(&f))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot hash '%1'.").arg(partPath)));
    f.close();

    const QString localHex = QString::fromLatin1(hash.result().toHex());
    if (localHex.compare(remoteHex, Qt::CaseInsensitive) != 0) {
        QFile::remove(partPath);
        return setError(err, RemoteError(RemoteError::Kind::ChecksumMismatch,
                                         QString("Checksum mismatch for '%1': remote %2, local %3.")
                                             .arg(remotePath, remoteHex, localHex)));
    }
    return true;
}

// ------------------------------------------------------------
// Uploads
// ------------------------------------------------------------
bool RemoteFileSession::put(const QString& localPath, const QString& remotePath,
                            ProgressFn progress, CancelFlag cancel, RemoteError* err)
{
    if (err) err->clear();

    if (remotePath.trimmed().isEmpty() || localPath.trimmed().isEmpty())
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                         QStringLiteral("Upload needs a local and a remote path.")));

    const QFileInfo li(localPath);
    if (!li.exists() || !li.isFile())
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Local file not found: %1").arg(localPath)));

    const QString remote = expandPath(remotePath);
    qInfo().noquote() << QString("[SFTP] put host='%1' '%2' -> '%3'").arg(m_host.id, localPath, remote);

    RemoteError e;
    const bool ok = withRetry(QString("Upload '%1'").arg(remote), [&](RemoteError* ae) {
        return uploadAttempt(localPath, remote, progress, cancel, ae);
    }, &e, cancel);

    if (!ok) {
        // Attempts that died on the wire left their .part behind.
        if (e.kind() == RemoteError::Kind::RetryExhausted)
            removeStalePart(remote + QStringLiteral(".part"));
        return setError(err, e);
    }

    invalidateParent(remote);
    qInfo().noquote() << QString("[SFTP] put OK '%1'").arg(remote);
    return true;
}

void RemoteFileSession::removeStalePart(const QString& tmp)
{
    bool removed = false;
    RemoteError e;
    if (attemptOnce<bool>(QString("Unlink '%1'").arg(tmp),
                          [tmp](Handles h, bool* o, RemoteError* ue) { return *o = h.sftp->removeFile(tmp, ue); },
                          &removed, &e))
        qInfo().noquote() << QString("[SFTP] removed stale '%1' host='%2'").arg(tmp, m_host.id);
    else if (e.kind() != RemoteError::Kind::NotFound)
        qWarning().noquote() << QString("[SFTP] could not remove '%1' host='%2': %3")
                                    .arg(tmp, m_host.id, e.message());
}

bool RemoteFileSession::uploadAttempt(const QString& localPath, const QString& remotePath,
                                      const ProgressFn& progress, const CancelFlag& cancel,
                                      RemoteError* err)
{
    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot read '%1': %2").arg(localPath, in.errorString())));

    const qint64 total = in.size();
    const QString tmp = remotePath + QStringLiteral(".part");

    std::shared_ptr<SftpFile> file;
    if (!attemptOnce<std::shared_ptr<SftpFile>>(
            QString("Create '%1'").arg(tmp),
            [tmp](Handles h, std::shared_ptr<SftpFile>* o, RemoteError* e) {
                std::unique_ptr<SftpFile> f = h.sftp->openWrite(tmp, e);
                if (!f)
                    return false;
                *o = std::move(f);
                return true;
            },
            &file, err))
        return false;

    auto discardTemp = [&]() {
        RemoteError closeErr;
        if (!closeRemoteFile(file, &closeErr))
            qDebug().noquote() << QString("[SFTP] close '%1': %2").arg(tmp, closeErr.message());
        bool removed = false;
        RemoteError rmErr;
        if (!attemptOnce<bool>(QString("Unlink '%1'").arg(tmp),
                               [tmp](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->removeFile(tmp, e); },
                               &removed, &rmErr))
            qDebug().noquote() << QString("[SFTP] could not remove '%1': %2").arg(tmp, rmErr.message());
    };

    const int chunk = qMax(1024, m_settings.chunkSize);
    qint64 done = 0;
    QElapsedTimer elapsed;
    elapsed.start();

    while (true) {
        if (isCancelled(cancel)) {
            discardTemp();
            return setError(err, RemoteError(RemoteError::Kind::Cancelled,
                                             QString("Upload of '%1' cancelled.").arg(localPath)));
        }

        const QByteArray data = in.read(chunk);
        if (data.isEmpty()) {
            if (!in.atEnd()) {
                discardTemp();
                return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                                 QString("Read from '%1' failed: %2").arg(localPath, in.errorString())));
            }
            break;
        }

        QElapsedTimer chunkTimer;
        chunkTimer.start();
        qint64 written = 0;
        const bool ok = callWithTimeout<qint64>(
            &m_io, m_settings.operationTimeoutMs, RemoteError::TimeoutPhase::Operation,
            QString("Write '%1'").arg(tmp),
            [file, data](qint64* o, RemoteError* e) {
                qint64 off = 0;
                while (off < data.size()) {
                    const qint64 n = file->write(data.constData() + off, data.size() - off, e);
                    if (n < 0)
                        return false;
                    off += n;
                }
                *o = off;
                return true;
            },
            &written, err);
        if (!ok) {
            if (err && err->kind() != RemoteError::Kind::Connection && err->kind() != RemoteError::Kind::Timeout)
                discardTemp();
            return false;
        }

        if (chunkTimer.elapsed() > m_settings.stallThresholdMs)
            noteTransferStall(chunkTimer.elapsed());

        done += written;
        if (progress) {
            TransferProgress p;
            p.bytesDone = done;
            p.bytesTotal = total;
            p.percent = (total > 0) ? int(qMin<qint64>(100, done * 100 / total)) : 100;
            p.bytesPerSecond = done * 1000 / qMax<qint64>(1, elapsed.elapsed());
            p.speedLabel = formatSpeed(p.bytesPerSecond);
            progress(p);
        }
    }

    if (!closeRemoteFile(file, err))
        return false;

    // Some servers refuse rename over an existing file: unlink and retry.
    bool renamed = false;
    return attemptOnce<bool>(
        QString("Rename '%1'").arg(tmp),
        [tmp, remotePath](Handles h, bool* o, RemoteError* e) {
            if (h.sftp->rename(tmp, remotePath, e))
                return *o = true;
            RemoteError unlinkErr;
            if (!h.sftp->removeFile(remotePath, &unlinkErr) && unlinkErr.kind() != RemoteError::Kind::NotFound) {
                *e = unlinkErr;
                return false;
            }
            e->clear();
            return *o = h.sftp->rename(tmp, remotePath, e);
        },
        &renamed, err);
}

// ------------------------------------------------------------
// Directory transfers
// ------------------------------------------------------------
bool RemoteFileSession::getDirectory(const QString& remoteDir, const QString& localDir,
                                     ItemProgressFn progress, CancelFlag cancel, RemoteError* err)
{
    if (err) err->clear();

    const QString root = RemotePath::normalize(expandPath(remoteDir));

    struct Item { QString remote; QString rel; };
    QVector<Item> files;
    QStringList dirs;

    QVector<QString> stack{root};
    while (!stack.isEmpty()) {
        if (isCancelled(cancel))
            return setError(err, RemoteError(RemoteError::Kind::Cancelled, QStringLiteral("Download cancelled.")));

        const QString dir = stack.takeLast();
        FileEntryList entries;
        if (!listRaw(dir, &entries, err))
            return false;

        for (const FileEntry& e : entries) {
            const QString rel = RemotePath::relativeTo(root, e.path);
            if (e.isDirectory()) {
                dirs << rel;
                stack.push_back(e.path);
            } else {
                files.push_back({e.path, rel});
            }
        }
    }

    const QDir base(localDir);
    if (!QDir().mkpath(localDir))
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot create local folder '%1'.").arg(localDir)));
    for (const QString& rel : dirs) {
        if (!base.mkpath(rel))
            return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                             QString("Cannot create local folder '%1'.").arg(base.filePath(rel))));
    }

    qInfo().noquote() << QString("[SFTP] getDirectory host='%1' '%2' -> '%3' (%4 files, %5 folders)")
                             .arg(m_host.id, root, localDir).arg(files.size()).arg(dirs.size());

    for (int i = 0; i < files.size(); ++i) {
        if (progress)
            progress(i + 1, files.size(), files[i].rel);
        if (!get(files[i].remote, base.filePath(files[i].rel), nullptr, cancel, err))
            return false;
    }
    return true;
}

bool RemoteFileSession::ensureRemoteDir(const QString& path, RemoteError* err)
{
    RemoteError mkErr;
    bool made = false;
    if (runOp<bool>(QString("Mkdir '%1'").arg(path),
                    [path](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->makeDirectory(path, 0755, e); },
                    &made, &mkErr)) {
        invalidateParent(path);
        return true;
    }

    // Already there is fine.
    FileEntry info;
    RemoteError statErr;
    if (stat(path, &info, &statErr) && info.isDirectory())
        return true;
    return setError(err, mkErr);
}

bool RemoteFileSession::putDirectory(const QString& localDir, const QString& remoteDir,
                                     ItemProgressFn progress, CancelFlag cancel, RemoteError* err)
{
    if (err) err->clear();

    const QFileInfo li(localDir);
    if (!li.exists() || !li.isDir())
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Local folder not found: %1").arg(localDir)));

    const QString root = RemotePath::normalize(expandPath(remoteDir));
    const QDir base(localDir);

    QStringList dirs;
    QStringList files;
    QDirIterator it(localDir, QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fi = it.fileInfo();
        const QString rel = QDir::fromNativeSeparators(base.relativeFilePath(fi.filePath()));
        if (fi.isDir())
            dirs << rel;
        else if (fi.isFile())
            files << rel;
    }

    // Parents before children.
    std::sort(dirs.begin(), dirs.end(), [](const QString& a, const QString& b) {
        const int da = a.count('/');
        const int db = b.count('/');
        return (da != db) ? (da < db) : (a < b);
    });
    files.sort();

    qInfo().noquote() << QString("[SFTP] putDirectory host='%1' '%2' -> '%3' (%4 files, %5 folders)")
                             .arg(m_host.id, localDir, root).arg(files.size()).arg(dirs.size());

    if (!ensureRemoteDir(root, err))
        return false;
    for (const QString& rel : dirs) {
        if (isCancelled(cancel))
            return setError(err, RemoteError(RemoteError::Kind::Cancelled, QStringLiteral("Upload cancelled.")));
        if (!ensureRemoteDir(RemotePath::join(root, rel), err))
            return false;
    }

    for (int i = 0; i < files.size(); ++i) {
        if (progress)
            progress(i + 1, files.size(), files[i]);
        if (!put(base.filePath(files[i]), RemotePath::join(root, files[i]), nullptr, cancel, err))
            return false;
    }
    return true;
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------
bool RemoteFileSession::remove(const QString& path, bool recursive, RemoteError* err)
{
    if (err) err->clear();
    const QString p = RemotePath::normalize(expandPath(path));

    FileEntry info;
    if (!runOp<FileEntry>(QString("Lstat '%1'").arg(p),
                          [p](Handles h, FileEntry* o, RemoteError* e) { return h.sftp->lstat(p, o, e); },
                          &info, err))
        return false;

    bool done = false;
    if (!info.isDirectory()) {
        if (!runOp<bool>(QString("Unlink '%1'").arg(p),
                         [p](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->removeFile(p, e); },
                         &done, err))
            return false;
        invalidateParent(p);
        qInfo().noquote() << QString("[SFTP] removed file host='%1' '%2'").arg(m_host.id, p);
        return true;
    }

    QStringList files;
    QStringList dirs{p};
    if (recursive) {
        QVector<QString> stack{p};
        while (!stack.isEmpty()) {
            const QString dir = stack.takeLast();
            FileEntryList entries;
            if (!listRaw(dir, &entries, err))
                return false;
            for (const FileEntry& e : entries) {
                if (e.isDirectory()) {
                    dirs << e.path;
                    stack.push_back(e.path);
                } else {
                    files << e.path;
                }
            }
        }
    }

    for (const QString& f : files) {
        if (!runOp<bool>(QString("Unlink '%1'").arg(f),
                         [f](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->removeFile(f, e); },
                         &done, err))
            return false;
    }

    // Deepest first.
    std::sort(dirs.begin(), dirs.end(), [](const QString& a, const QString& b) {
        return a.count('/') > b.count('/');
    });
    for (const QString& d : dirs) {
        if (!runOp<bool>(QString("Rmdir '%1'").arg(d),
                         [d](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->removeDirectory(d, e); },
                         &done, err))
            return false;
        m_cache->invalidate(m_host.id, d);
    }

    invalidateParent(p);
    qInfo().noquote() << QString("[SFTP] removed folder host='%1' '%2' (%3 files, %4 folders)")
                             .arg(m_host.id, p).arg(files.size()).arg(dirs.size());
    return true;
}

bool RemoteFileSession::mkdir(const QString& path, int mode, RemoteError* err)
{
    const QString p = RemotePath::normalize(expandPath(path));
    bool done = false;
    if (!runOp<bool>(QString("Mkdir '%1'").arg(p),
                     [p, mode](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->makeDirectory(p, mode, e); },
                     &done, err))
        return false;
    invalidateParent(p);
    return true;
}

bool RemoteFileSession::rename(const QString& from, const QString& to, RemoteError* err)
{
    const QString a = RemotePath::normalize(expandPath(from));
    const QString b = RemotePath::normalize(expandPath(to));
    bool done = false;
    if (!runOp<bool>(QString("Rename '%1'").arg(a),
                     [a, b](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->rename(a, b, e); },
                     &done, err))
        return false;

    invalidateParent(a);
    invalidateParent(b);
    m_cache->invalidate(m_host.id, a);
    return true;
}

bool RemoteFileSession::chmod(const QString& path, int mode, RemoteError* err)
{
    const QString p = RemotePath::normalize(expandPath(path));
    bool done = false;
    if (!runOp<bool>(QString("Chmod '%1'").arg(p),
                     [p, mode](Handles h, bool* o, RemoteError* e) { return *o = h.sftp->chmod(p, mode, e); },
                     &done, err))
        return false;
    invalidateParent(p);
    return true;
}

bool RemoteFileSession::chmodRecursive(const QString& root, int mode, ItemProgressFn progress, RemoteError* err)
{
    if (err) err->clear();
    const QString r = RemotePath::normalize(expandPath(root));

    // Phase 1: discover everything first so progress has a total.
    QStringList paths{r};
    QVector<QString> stack{r};
    while (!stack.isEmpty()) {
        const QString dir = stack.takeLast();
        FileEntryList entries;
        if (!listRaw(dir, &entries, err))
            return false;
        for (const FileEntry& e : entries) {
            paths << e.path;
            if (e.isDirectory())
                stack.push_back(e.path);
        }
    }

    // Phase 2: apply. Individual failures are logged and skipped.
    int failed = 0;
    for (int i = 0; i < paths.size(); ++i) {
        const QString p = paths[i];
        bool done = false;
        RemoteError e;
        if (!runOp<bool>(QString("Chmod '%1'").arg(p),
                         [p, mode](Handles h, bool* o, RemoteError* ie) { return *o = h.sftp->chmod(p, mode, ie); },
                         &done, &e)) {
            failed++;
            qWarning().noquote() << QString("[SFTP] chmod FAILED '%1': %2 (skipped)").arg(p, e.message());
        }
        if (progress)
            progress(i + 1, paths.size(), RemotePath::fileName(p));
    }

    m_cache->clearHost(m_host.id);
    qInfo().noquote() << QString("[SFTP] chmod -R %1 host='%2' '%3': %4 item(s), %5 skipped")
                             .arg(QString::number(mode, 8), m_host.id, r)
                             .arg(paths.size()).arg(failed);
    return true;
}

bool RemoteFileSession::chown(const QString& path, const QString& owner, const QString& group,
                              bool recursive, RemoteError* err)
{
    if (owner.trimmed().isEmpty())
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument, QStringLiteral("chown needs an owner.")));

    const QString p = RemotePath::normalize(expandPath(path));
    const QString who = group.trimmed().isEmpty() ? owner.trimmed() : (owner.trimmed() + ":" + group.trimmed());
    const QString cmd = QString("chown %1%2 %3")
                            .arg(recursive ? QStringLiteral("-R ") : QString(),
                                 RemotePath::shQuote(who), RemotePath::shQuote(p));
    if (!executeCommand(cmd, nullptr, err))
        return false;

    if (recursive)
        m_cache->clearHost(m_host.id);
    else
        invalidateParent(p);
    return true;
}

bool RemoteFileSession::copy(const QString& src, const QString& dst, RemoteError* err)
{
    if (err) err->clear();
    const QString s = RemotePath::normalize(expandPath(src));
    const QString d = RemotePath::normalize(expandPath(dst));

    ExecResult r;
    RemoteError e;
    // -T: an existing directory at `d` is merged into, as the SFTP walk does.
    const QString cmd = QString("cp -rT %1 %2").arg(RemotePath::shQuote(s), RemotePath::shQuote(d));
    if (exec(cmd, &r, -1, &e) && r.exitCode == 0) {
        invalidateParent(d);
        m_cache->invalidate(m_host.id, d);
        return true;
    }

    qInfo().noquote() << QString("[SFTP] cp unavailable host='%1' (%2) -> copying over SFTP")
                             .arg(m_host.id, e.isError() ? e.message() : r.stderrText.trimmed());
    if (!copyBySftp(s, d, err))
        return false;

    invalidateParent(d);
    m_cache->invalidate(m_host.id, d);
    return true;
}

bool RemoteFileSession::copyBySftp(const QString& src, const QString& dst, RemoteError* err)
{
    FileEntry info;
    if (!stat(src, &info, err))
        return false;
    if (!info.isDirectory())
        return streamRemoteFile(src, dst, err);

    QVector<QPair<QString, QString>> stack{qMakePair(src, dst)};
    while (!stack.isEmpty()) {
        const QPair<QString, QString> pair = stack.takeLast();
        if (!ensureRemoteDir(pair.second, err))
            return false;

        FileEntryList entries;
        if (!listRaw(pair.first, &entries, err))
            return false;
        for (const FileEntry& e : entries) {
            const QString target = RemotePath::join(pair.second, e.name);
            if (e.isDirectory())
                stack.push_back(qMakePair(e.path, target));
            else if (!streamRemoteFile(e.path, target, err))
                return false;
        }
    }
    return true;
}

bool RemoteFileSession::streamRemoteFile(const QString& src, const QString& dst, RemoteError* err)
{
    return withRetry(QString("Copy '%1'").arg(src), [&](RemoteError* e) {
        return streamRemoteFileAttempt(src, dst, e);
    }, err);
}

bool RemoteFileSession::streamRemoteFileAttempt(const QString& src, const QString& dst, RemoteError* err)
{
    using FilePair = QPair<std::shared_ptr<SftpFile>, std::shared_ptr<SftpFile>>;
    FilePair files;
    if (!attemptOnce<FilePair>(
            QString("Open '%1'").arg(src),
            [src, dst](Handles h, FilePair* o, RemoteError* e) {
                std::unique_ptr<SftpFile> in = h.sftp->openRead(src, 0, e);
                if (!in)
                    return false;
                std::unique_ptr<SftpFile> out = h.sftp->openWrite(dst, e);
                if (!out)
                    return false;
                o->first = std::move(in);
                o->second = std::move(out);
                return true;
            },
            &files, err))
        return false;

    const int chunk = qMax(1024, m_settings.chunkSize);
    const std::shared_ptr<SftpFile> in = files.first;
    const std::shared_ptr<SftpFile> out = files.second;

    while (true) {
        qint64 n = 0;
        const bool ok = callWithTimeout<qint64>(
            &m_io, m_settings.operationTimeoutMs, RemoteError::TimeoutPhase::Operation,
            QString("Copy '%1'").arg(src),
            [in, out, chunk](qint64* o, RemoteError* e) {
                QByteArray buf(chunk, Qt::Uninitialized);
                const qint64 got = in->read(buf.data(), chunk, e);
                if (got < 0)
                    return false;
                qint64 off = 0;
                while (off < got) {
                    const qint64 w = out->write(buf.constData() + off, got - off, e);
                    if (w < 0)
                        return false;
                    off += w;
                }
                *o = got;
                return true;
            },
            &n, err);
        if (!ok)
            return false;
        if (n == 0)
            break;
    }

    RemoteError closeErr;
    if (!closeRemoteFile(in, &closeErr))
        qDebug().noquote() << QString("[SFTP] close '%1': %2").arg(src, closeErr.message());
    return closeRemoteFile(out, err);
}

bool RemoteFileSession::move(const QString& src, const QString& dst, RemoteError* err)
{
    if (err) err->clear();
    const QString s = RemotePath::normalize(expandPath(src));
    const QString d = RemotePath::normalize(expandPath(dst));

    RemoteError renameErr;
    if (rename(s, d, &renameErr))
        return true;
    if (renameErr.kind() == RemoteError::Kind::NotFound || renameErr.kind() == RemoteError::Kind::RetryExhausted)
        return setError(err, renameErr);

    ExecResult r;
    RemoteError e;
    const QString cmd = QString("mv %1 %2").arg(RemotePath::shQuote(s), RemotePath::shQuote(d));
    if (exec(cmd, &r, -1, &e) && r.exitCode == 0) {
        invalidateParent(s);
        invalidateParent(d);
        m_cache->invalidate(m_host.id, s);
        return true;
    }

    qInfo().noquote() << QString("[SFTP] move host='%1' '%2' -> '%3': falling back to copy + delete")
                             .arg(m_host.id, s, d);
    if (!copy(s, d, err))
        return false;
    return remove(s, true, err);
}

bool RemoteFileSession::createSymlink(const QString& target, const QString& linkPath, RemoteError* err)
{
    const QString link = RemotePath::normalize(expandPath(linkPath));
    const QString cmd = QString("ln -s %1 %2").arg(RemotePath::shQuote(target), RemotePath::shQuote(link));
    if (!executeCommand(cmd, nullptr, err))
        return false;
    invalidateParent(link);
    return true;
}

bool RemoteFileSession::resolveSymlink(const QString& path, QString* out, RemoteError* err)
{
    const QString p = RemotePath::normalize(expandPath(path));
    QString text;
    if (!executeCommand(QString("readlink -f %1").arg(RemotePath::shQuote(p)), &text, err))
        return false;
    if (out) *out = text.trimmed();
    return true;
}

// ------------------------------------------------------------
// Queries and commands
// ------------------------------------------------------------
bool RemoteFileSession::calculateDirectorySize(const QString& root, qint64* outBytes, int maxDepth,
                                               SizeProgressFn progress, RemoteError* err)
{
    if (err) err->clear();
    const QString r = RemotePath::normalize(expandPath(root));

    qint64 total = 0;
    int files = 0;

    QVector<QPair<QString, int>> stack{qMakePair(r, 0)};
    while (!stack.isEmpty()) {
        const QPair<QString, int> dir = stack.takeLast();
        FileEntryList entries;
        if (!listRaw(dir.first, &entries, err))
            return false;

        for (const FileEntry& e : entries) {
            if (e.isDirectory()) {
                if (maxDepth < 0 || dir.second < maxDepth)
                    stack.push_back(qMakePair(e.path, dir.second + 1));
                continue;
            }
            total += qMax<qint64>(0, e.size);
            files++;
            if (progress && files % 10 == 0)
                progress(files, total);
        }
    }

    if (progress)
        progress(files, total);
    if (outBytes) *outBytes = total;
    return true;
}

bool RemoteFileSession::checksum(const QString& path, ChecksumAlgorithm algorithm, QString* outHex,
                                 RemoteError* err)
{
    QString tool;
    switch (algorithm) {
    case ChecksumAlgorithm::Md5:    tool = QStringLiteral("md5sum"); break;
    case ChecksumAlgorithm::Sha1:   tool = QStringLiteral("sha1sum"); break;
    case ChecksumAlgorithm::Sha256: tool = QStringLiteral("sha256sum"); break;
    }

    const QString p = expandPath(path);
    QString text;
    if (!executeCommand(QString("%1 %2").arg(tool, RemotePath::shQuote(p)), &text, err))
        return false;

    static const QRegularExpression re(QStringLiteral("^([a-fA-F0-9]+)"));
    const QRegularExpressionMatch m = re.match(text.trimmed());
    if (!m.hasMatch())
        return setError(err, RemoteError(RemoteError::Kind::RemoteFailure,
                                         QString("Unexpected %1 output for '%2'.").arg(tool, p)));
    if (outHex) *outHex = m.captured(1).toLower();
    return true;
}

bool RemoteFileSession::exec(const QString& command, ExecResult* out, int timeoutMs, RemoteError* err)
{
    if (command.trimmed().isEmpty())
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument, QStringLiteral("Empty command.")));

    const int t = (timeoutMs > 0) ? timeoutMs : m_settings.operationTimeoutMs;
    const QString head = command.section(' ', 0, 0);
    qDebug().noquote() << QString("[SFTP] exec host='%1' cmd='%2 ...'").arg(m_host.id, head);

    ExecResult r;
    RemoteError e;
    // The transport enforces `t` itself; the outer bound only catches a wedged channel.
    const bool ok = runOp<ExecResult>(QString("Command '%1'").arg(head),
                                      [command, t](Handles h, ExecResult* o, RemoteError* ee) {
                                          return h.transport->exec(command, o, t, ee);
                                      },
                                      &r, &e, t + 2000);

    QJsonObject f = AuditLogger::commandFields(command);
    f.insert("hostId", m_host.id);
    if (ok)
        f.insert("exitCode", r.exitCode);
    else
        f.insert("error", e.message().left(400));
    AuditLogger::writeEvent("remote.exec", f);

    if (!ok)
        return setError(err, e);
    if (out) *out = r;
    if (err) err->clear();
    return true;
}

bool RemoteFileSession::executeCommand(const QString& command, QString* stdoutText, RemoteError* err)
{
    ExecResult r;
    if (!exec(command, &r, -1, err))
        return false;

    if (r.exitCode != 0) {
        const QString why = r.stderrText.trimmed().isEmpty() ? r.stdoutText.trimmed() : r.stderrText.trimmed();
        return setError(err, RemoteError(RemoteError::Kind::RemoteFailure,
                                         QString("Command failed with code %1: %2").arg(r.exitCode).arg(why)));
    }

    if (stdoutText) *stdoutText = r.stdoutText;
    if (err) err->clear();
    return true;
}
