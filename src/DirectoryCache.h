#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QtGlobal>

#include <functional>

#include "FileEntry.h"

// Listing cache shared by all sessions of one FileSessionManager.
//
// Keyed by (host id, normalized path). Entries expire after the TTL.
// The byte total (estimated) never exceeds maxBytes: the entry with the
// oldest lastAccess is evicted before an insert would overflow.
class DirectoryCache
{
public:
    using Clock = std::function<qint64()>;   // ms, monotonic enough for TTL math

    explicit DirectoryCache(qint64 maxBytes = 50LL * 1024 * 1024, int ttlMs = 30000);

    void setClock(Clock clock);
    void setTtlMs(int ttlMs);
    void setMaxBytes(qint64 maxBytes);
    int ttlMs() const;
    qint64 maxBytes() const;

    // Fresh hit => fills `out`, touches lastAccess/accessCount.
    // Expired entries are dropped and reported as a miss.
    bool lookup(const QString& hostId, const QString& path, FileEntryList* out);

    void insert(const QString& hostId, const QString& path, const FileEntryList& entries);

    void invalidate(const QString& hostId, const QString& path);
    void invalidateParent(const QString& hostId, const QString& path);
    void clearHost(const QString& hostId);
    void clear();

    bool contains(const QString& hostId, const QString& path) const;   // ignores TTL
    int accessCount(const QString& hostId, const QString& path) const;
    int entryCount() const;
    qint64 totalBytes() const;
    qint64 evictionCount() const;

    static qint64 estimateSize(const FileEntryList& entries);

private:
    struct Entry {
        FileEntryList files;
        qint64 fetchedAt = 0;
        qint64 lastAccess = 0;
        int accessCount = 0;
        qint64 bytes = 0;
    };

    static QString keyFor(const QString& hostId, const QString& path);
    void removeLocked(const QString& key);
    void evictOldestLocked();

    mutable QMutex m_mutex;
    QHash<QString, Entry> m_entries;
    Clock m_clock;
    qint64 m_maxBytes;
    int m_ttlMs;
    qint64 m_totalBytes = 0;
    qint64 m_evictions = 0;
};
