#pragma once

#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QWaitCondition>

#include <memory>

#include "CredentialResolver.h"
#include "HostDescriptor.h"
#include "RemoteError.h"
#include "RemoteTransport.h"

/*
    ConnectionPool
    --------------
    At most one live transport per host id, shared by reference count.

    - acquire() opens on first use and bumps the count afterwards
    - release() drops the count; the transport closes at zero
    - a transport that dies on its own is removed immediately; holders see
      errors on their next call and acquire again
    - a failed open is never registered

    Construct once and pass it to whoever needs connections.
*/
class ConnectionPool
{
public:
    explicit ConnectionPool(TransportFactory factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Returns nullptr and fills err on Connection/Authentication failure.
    std::shared_ptr<RemoteTransport> acquire(const HostDescriptor& host,
                                             CredentialResolver& resolver,
                                             RemoteError* err = nullptr);

    // `expected` guards against releasing a newer transport for the same
    // host after the one you held was dropped. No-op when absent.
    void release(const QString& hostId, const RemoteTransport* expected = nullptr);

    std::shared_ptr<RemoteTransport> getConnection(const QString& hostId) const;
    bool hasConnection(const QString& hostId) const;
    int  getRefCount(const QString& hostId) const;

    // Transports opened over the pool's lifetime.
    int openedCount() const;

    void dispose();

private:
    struct Entry {
        std::shared_ptr<RemoteTransport> transport;
        int refCount = 0;
        HostDescriptor host;
    };

    void onTransportClosed(const QString& hostId, RemoteTransport* which, const QString& reason);

    TransportFactory m_factory;

    mutable QMutex m_mutex;
    QWaitCondition m_openFinished;
    QHash<QString, Entry> m_entries;
    QSet<QString> m_opening;      // host ids with an open() in flight
    int m_openedCount = 0;
    bool m_disposed = false;
};
