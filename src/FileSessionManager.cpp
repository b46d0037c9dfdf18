// FileSessionManager.cpp
#include "FileSessionManager.h"

#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>

// Sessions own a QTimer: free them on their own thread.
static void destroySession(RemoteFileSession* s)
{
    if (QThread::currentThread() == s->thread())
        delete s;
    else
        s->deleteLater();
}

FileSessionManager::FileSessionManager(ConnectionPool* pool,
                                       std::shared_ptr<CredentialResolver> resolver,
                                       const RemoteSettings& settings,
                                       QObject* parent)
    : QObject(parent),
      m_pool(pool),
      m_resolver(std::move(resolver)),
      m_settings(settings),
      m_cache(std::make_shared<DirectoryCache>(settings.cacheMaxBytes, settings.cacheTtlMs))
{
}

FileSessionManager::~FileSessionManager()
{
    dispose();
}

void FileSessionManager::setHosts(const QVector<HostDescriptor>& hosts)
{
    QStringList gone;
    {
        QMutexLocker lock(&m_mutex);
        m_hosts = hosts;
        for (const auto& kv : m_sessions) {
            bool still = false;
            for (const HostDescriptor& h : hosts) {
                if (h.id == kv.first) {
                    still = true;
                    break;
                }
            }
            if (!still)
                gone << kv.first;
        }
    }

    for (const QString& id : gone)
        closeSession(id);
}

QVector<HostDescriptor> FileSessionManager::hosts() const
{
    QMutexLocker lock(&m_mutex);
    return m_hosts;
}

bool FileSessionManager::findHost(const QString& hostId, HostDescriptor* out) const
{
    QMutexLocker lock(&m_mutex);
    for (const HostDescriptor& h : m_hosts) {
        if (h.id == hostId) {
            if (out) *out = h;
            return true;
        }
    }
    return false;
}

std::shared_ptr<RemoteFileSession> FileSessionManager::session(const HostDescriptor& host)
{
    QMutexLocker lock(&m_mutex);

    auto it = m_sessions.find(host.id);
    if (it != m_sessions.end()) {
        if (it->second->state() != RemoteFileSession::State::Closed)
            return it->second;
        m_sessions.erase(it);
    }

    std::shared_ptr<RemoteFileSession> s(new RemoteFileSession(host, m_pool, m_resolver, m_cache, m_settings),
                                         destroySession);
    if (s->thread() != thread())
        s->moveToThread(thread());
    if (m_healthMonitoring)
        QMetaObject::invokeMethod(s.get(), "startHealthMonitoring", Qt::QueuedConnection);

    qInfo().noquote() << QString("[SFTP] session created host='%1' target='%2'")
                             .arg(host.id, host.displayTarget());

    m_sessions[host.id] = s;
    return s;
}

std::shared_ptr<RemoteFileSession> FileSessionManager::sessionFor(const QString& hostId, RemoteError* err)
{
    if (err) err->clear();

    HostDescriptor host;
    if (!findHost(hostId, &host)) {
        setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Unknown host id '%1'.").arg(hostId)));
        return nullptr;
    }
    return session(host);
}

void FileSessionManager::closeSession(const QString& hostId)
{
    std::shared_ptr<RemoteFileSession> s;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_sessions.find(hostId);
        if (it == m_sessions.end())
            return;
        s = std::move(it->second);
        m_sessions.erase(it);
    }

    // Holders mid-call keep the object alive; their next remote step fails.
    s->close();
    m_cache->clearHost(hostId);
}

void FileSessionManager::dispose()
{
    QStringList ids;
    {
        QMutexLocker lock(&m_mutex);
        for (const auto& kv : m_sessions)
            ids << kv.first;
    }

    for (const QString& id : ids)
        closeSession(id);

    m_cache->clear();
    if (!ids.isEmpty())
        qInfo().noquote() << QString("[SFTP] disposed %1 session(s)").arg(ids.size());
}

void FileSessionManager::setHealthMonitoring(bool enabled)
{
    QVector<std::shared_ptr<RemoteFileSession>> all;
    {
        QMutexLocker lock(&m_mutex);
        m_healthMonitoring = enabled;
        for (const auto& kv : m_sessions)
            all.push_back(kv.second);
    }

    for (const auto& s : all)
        QMetaObject::invokeMethod(s.get(), enabled ? "startHealthMonitoring" : "stopHealthMonitoring",
                                  Qt::QueuedConnection);
}

bool FileSessionManager::healthMonitoring() const
{
    QMutexLocker lock(&m_mutex);
    return m_healthMonitoring;
}
