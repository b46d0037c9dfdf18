// DirectoryCache.cpp
#include "DirectoryCache.h"

#include <QDateTime>
#include <QDebug>
#include <QMutexLocker>
#include <QStringList>

#include "RemotePath.h"

DirectoryCache::DirectoryCache(qint64 maxBytes, int ttlMs)
    : m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); }),
      m_maxBytes(maxBytes),
      m_ttlMs(ttlMs)
{
}

void DirectoryCache::setClock(Clock clock)
{
    QMutexLocker lock(&m_mutex);
    m_clock = std::move(clock);
}

void DirectoryCache::setTtlMs(int ttlMs)
{
    QMutexLocker lock(&m_mutex);
    m_ttlMs = ttlMs;
}

void DirectoryCache::setMaxBytes(qint64 maxBytes)
{
    QMutexLocker lock(&m_mutex);
    m_maxBytes = maxBytes;
    while (m_totalBytes > m_maxBytes && !m_entries.isEmpty())
        evictOldestLocked();
}

int DirectoryCache::ttlMs() const
{
    QMutexLocker lock(&m_mutex);
    return m_ttlMs;
}

qint64 DirectoryCache::maxBytes() const
{
    QMutexLocker lock(&m_mutex);
    return m_maxBytes;
}

QString DirectoryCache::keyFor(const QString& hostId, const QString& path)
{
    return hostId + QLatin1Char('\n') + RemotePath::normalize(path);
}

bool DirectoryCache::lookup(const QString& hostId, const QString& path, FileEntryList* out)
{
    QMutexLocker lock(&m_mutex);

    const QString key = keyFor(hostId, path);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;

    const qint64 now = m_clock();
    if (now - it->fetchedAt >= m_ttlMs) {
        removeLocked(key);
        return false;
    }

    it->lastAccess = now;
    it->accessCount++;
    if (out) *out = it->files;
    return true;
}

void DirectoryCache::insert(const QString& hostId, const QString& path, const FileEntryList& entries)
{
    QMutexLocker lock(&m_mutex);

    const QString key = keyFor(hostId, path);
    removeLocked(key);

    const qint64 bytes = estimateSize(entries);
    if (bytes > m_maxBytes) {
        qDebug().noquote() << QString("[SFTP] cache skip host='%1' path='%2' (%3 bytes > capacity)")
                              .arg(hostId, path).arg(bytes);
        return;
    }

    while (m_totalBytes + bytes > m_maxBytes && !m_entries.isEmpty())
        evictOldestLocked();

    const qint64 now = m_clock();
    Entry e;
    e.files = entries;
    e.fetchedAt = now;
    e.lastAccess = now;
    e.accessCount = 1;
    e.bytes = bytes;

    m_entries.insert(key, e);
    m_totalBytes += bytes;
}

void DirectoryCache::invalidate(const QString& hostId, const QString& path)
{
    QMutexLocker lock(&m_mutex);
    removeLocked(keyFor(hostId, path));
}

void DirectoryCache::invalidateParent(const QString& hostId, const QString& path)
{
    QMutexLocker lock(&m_mutex);
    removeLocked(keyFor(hostId, RemotePath::parent(path)));
}

void DirectoryCache::clearHost(const QString& hostId)
{
    QMutexLocker lock(&m_mutex);

    const QString prefix = hostId + QLatin1Char('\n');
    QStringList doomed;
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        if (it.key().startsWith(prefix))
            doomed << it.key();
    }
    for (const QString& k : doomed)
        removeLocked(k);
}

void DirectoryCache::clear()
{
    QMutexLocker lock(&m_mutex);
    m_entries.clear();
    m_totalBytes = 0;
}

bool DirectoryCache::contains(const QString& hostId, const QString& path) const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.contains(keyFor(hostId, path));
}

int DirectoryCache::accessCount(const QString& hostId, const QString& path) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_entries.constFind(keyFor(hostId, path));
    return (it == m_entries.constEnd()) ? 0 : it->accessCount;
}

int DirectoryCache::entryCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.size();
}

qint64 DirectoryCache::totalBytes() const
{
    QMutexLocker lock(&m_mutex);
    return m_totalBytes;
}

qint64 DirectoryCache::evictionCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_evictions;
}

qint64 DirectoryCache::estimateSize(const FileEntryList& entries)
{
    // Rough: fixed per-entry overhead plus UTF-16 string payloads.
    qint64 total = 64;
    for (const FileEntry& e : entries) {
        total += 96;
        total += 2 * (e.name.size() + e.path.size() + e.permissions.size()
                      + e.owner.size() + e.group.size() + e.symlinkTarget.size());
    }
    return total;
}

void DirectoryCache::removeLocked(const QString& key)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return;
    m_totalBytes -= it->bytes;
    m_entries.erase(it);
}

void DirectoryCache::evictOldestLocked()
{
    auto oldest = m_entries.end();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (oldest == m_entries.end() || it->lastAccess < oldest->lastAccess)
            oldest = it;
    }
    if (oldest == m_entries.end())
        return;

    qDebug().noquote() << QString("[SFTP] cache evict key='%1' bytes=%2")
                          .arg(QString(oldest.key()).replace('\n', ':')).arg(oldest->bytes);
    m_totalBytes -= oldest->bytes;
    m_entries.erase(oldest);
    m_evictions++;
}
