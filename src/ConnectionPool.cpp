// ConnectionPool.cpp
#include "ConnectionPool.h"

#include <QDebug>
#include <QJsonObject>
#include <QMutexLocker>
#include <QVector>

#include "AuditLogger.h"

static QJsonObject hostAuditFields(const HostDescriptor& host)
{
    return QJsonObject{
        {"hostId", host.id},
        {"target", host.displayTarget()},
        {"auth", authMethodName(host.auth)}
    };
}

ConnectionPool::ConnectionPool(TransportFactory factory)
    : m_factory(std::move(factory))
{
}

ConnectionPool::~ConnectionPool()
{
    dispose();
}

std::shared_ptr<RemoteTransport> ConnectionPool::acquire(const HostDescriptor& host,
                                                         CredentialResolver& resolver,
                                                         RemoteError* err)
{
    if (err) err->clear();

    if (!host.isValid()) {
        setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                  QString("Host '%1' is missing id, address or username.").arg(host.id)));
        return nullptr;
    }

    {
        QMutexLocker lock(&m_mutex);

        // Another thread is opening this host: wait for its outcome.
        while (m_opening.contains(host.id))
            m_openFinished.wait(&m_mutex);

        auto it = m_entries.find(host.id);
        if (it != m_entries.end() && !it->transport->isOpen()) {
            // Closed without telling us (e.g. forced close by a holder): replace it.
            qWarning().noquote() << QString("[POOL] stale transport host='%1' -> reopening").arg(host.id);
            it->transport->setClosedHandler(nullptr);
            m_entries.erase(it);
            it = m_entries.end();
        }
        if (it != m_entries.end()) {
            it->refCount++;
            qDebug().noquote() << QString("[POOL] reuse host='%1' refCount=%2").arg(host.id).arg(it->refCount);
            return it->transport;
        }

        m_opening.insert(host.id);
        m_disposed = false;
    }

    qInfo().noquote() << QString("[POOL] opening host='%1' target='%2'").arg(host.id, host.displayTarget());

    // Slow part (auth + network) runs without the pool lock.
    std::shared_ptr<RemoteTransport> transport;
    RemoteError openErr;
    {
        AuthMaterial material;
        if (resolver.resolve(host, &material, &openErr)) {
            transport = m_factory ? m_factory() : nullptr;
            if (!transport) {
                openErr = RemoteError(RemoteError::Kind::Connection,
                                      QStringLiteral("No transport factory configured."));
            } else {
                const QString hostId = host.id;
                transport->setClosedHandler([this, hostId](RemoteTransport* which, const QString& reason) {
                    onTransportClosed(hostId, which, reason);
                });
                if (!transport->open(host, material, &openErr)) {
                    transport->setClosedHandler(nullptr);
                    transport.reset();
                }
            }
        }
    }

    QMutexLocker lock(&m_mutex);
    m_opening.remove(host.id);
    m_openFinished.wakeAll();

    if (!transport) {
        lock.unlock();
        if (!openErr.isError())
            openErr = RemoteError(RemoteError::Kind::Connection, QStringLiteral("Connection failed."));

        qWarning().noquote() << QString("[POOL] open FAILED host='%1': %2").arg(host.id, openErr.toString());

        QJsonObject f = hostAuditFields(host);
        f.insert("error", openErr.message().left(400));
        AuditLogger::writeEvent("pool.open_failed", f);

        setError(err, openErr);
        return nullptr;
    }

    Entry e;
    e.transport = transport;
    e.refCount = 1;
    e.host = host;
    m_entries.insert(host.id, e);
    m_openedCount++;
    lock.unlock();

    qInfo().noquote() << QString("[POOL] open OK host='%1' refCount=1").arg(host.id);
    AuditLogger::writeEvent("pool.open", hostAuditFields(host));
    return transport;
}

void ConnectionPool::release(const QString& hostId, const RemoteTransport* expected)
{
    std::shared_ptr<RemoteTransport> toClose;
    HostDescriptor host;
    {
        QMutexLocker lock(&m_mutex);

        auto it = m_entries.find(hostId);
        if (it == m_entries.end()) {
            qDebug().noquote() << QString("[POOL] release host='%1': no pooled connection").arg(hostId);
            return;
        }
        if (expected && it->transport.get() != expected) {
            qDebug().noquote() << QString("[POOL] release host='%1': stale transport ignored").arg(hostId);
            return;
        }

        it->refCount--;
        if (it->refCount > 0) {
            qDebug().noquote() << QString("[POOL] release host='%1' refCount=%2").arg(hostId).arg(it->refCount);
            return;
        }

        toClose = it->transport;
        host = it->host;
        m_entries.erase(it);
    }

    // Close outside the lock: libssh may block on disconnect.
    toClose->setClosedHandler(nullptr);
    toClose->close();

    qInfo().noquote() << QString("[POOL] closed host='%1' (last reference released)").arg(hostId);
    AuditLogger::writeEvent("pool.close", hostAuditFields(host));
}

std::shared_ptr<RemoteTransport> ConnectionPool::getConnection(const QString& hostId) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_entries.constFind(hostId);
    return (it == m_entries.constEnd()) ? nullptr : it->transport;
}

bool ConnectionPool::hasConnection(const QString& hostId) const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.contains(hostId);
}

int ConnectionPool::getRefCount(const QString& hostId) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_entries.constFind(hostId);
    return (it == m_entries.constEnd()) ? 0 : it->refCount;
}

int ConnectionPool::openedCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_openedCount;
}

void ConnectionPool::dispose()
{
    QVector<Entry> all;
    {
        QMutexLocker lock(&m_mutex);
        if (m_disposed && m_entries.isEmpty())
            return;
        m_disposed = true;
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it)
            all.push_back(it.value());
        m_entries.clear();
    }

    for (const Entry& e : all) {
        e.transport->setClosedHandler(nullptr);
        e.transport->close();
        AuditLogger::writeEvent("pool.close", hostAuditFields(e.host));
    }

    if (!all.isEmpty())
        qInfo().noquote() << QString("[POOL] disposed %1 connection(s)").arg(all.size());
}

void ConnectionPool::onTransportClosed(const QString& hostId, RemoteTransport* which, const QString& reason)
{
    std::shared_ptr<RemoteTransport> dropped;
    HostDescriptor host;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_entries.find(hostId);
        if (it == m_entries.end() || it->transport.get() != which)
            return;
        dropped = it->transport;
        host = it->host;
        m_entries.erase(it);
    }

    qWarning().noquote() << QString("[POOL] connection lost host='%1': %2 (entry removed)").arg(hostId, reason);

    QJsonObject f = hostAuditFields(host);
    f.insert("reason", reason.left(400));
    AuditLogger::writeEvent("pool.lost", f);

    // `dropped` dies here; the caller that reported the loss still holds its own reference.
}
