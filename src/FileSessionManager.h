#pragma once

#include <QMutex>
#include <QObject>
#include <QString>
#include <QVector>

#include <memory>
#include <unordered_map>

#include "ConnectionPool.h"
#include "CredentialResolver.h"
#include "DirectoryCache.h"
#include "HostDescriptor.h"
#include "RemoteFileSession.h"
#include "RemoteSettings.h"

// One RemoteFileSession per host, all sharing one pool and one listing cache.
// Sessions live on the manager's thread (their health timers need its event
// loop). closeSession()/dispose() close a session and forget it; a caller
// still holding it sees Connection errors, and the object is freed with the
// last holder. The pool must outlive every holder.
class FileSessionManager : public QObject
{
    Q_OBJECT
public:
    FileSessionManager(ConnectionPool* pool,
                       std::shared_ptr<CredentialResolver> resolver,
                       const RemoteSettings& settings = RemoteSettings(),
                       QObject* parent = nullptr);
    ~FileSessionManager() override;

    void setHosts(const QVector<HostDescriptor>& hosts);
    QVector<HostDescriptor> hosts() const;
    bool findHost(const QString& hostId, HostDescriptor* out) const;

    std::shared_ptr<RemoteFileSession> session(const HostDescriptor& host);

    // nullptr + NotFound error when the id is not among setHosts().
    std::shared_ptr<RemoteFileSession> sessionFor(const QString& hostId, RemoteError* err = nullptr);

    void closeSession(const QString& hostId);
    void dispose();

    void setHealthMonitoring(bool enabled);
    bool healthMonitoring() const;

    std::shared_ptr<DirectoryCache> cache() const { return m_cache; }
    const RemoteSettings& settings() const { return m_settings; }
    ConnectionPool* pool() const { return m_pool; }

private:
    ConnectionPool* m_pool = nullptr;
    std::shared_ptr<CredentialResolver> m_resolver;
    RemoteSettings m_settings;
    std::shared_ptr<DirectoryCache> m_cache;

    mutable QMutex m_mutex;
    QVector<HostDescriptor> m_hosts;
    std::unordered_map<QString, std::shared_ptr<RemoteFileSession>> m_sessions;
    bool m_healthMonitoring = true;
};
