#pragma once

#include <QHash>
#include <QString>
#include <QVector>

#include <memory>

#include "../FileEntry.h"
#include "../RemoteError.h"
#include "../TransferProgress.h"
#include "LocalFileSystem.h"
#include "SyncTypes.h"

class FileSessionManager;
class RemoteFileSession;
class TransferCoordinator;

/*
    DirectorySynchronizer
    ---------------------
    Diffs two trees (each local or on a host) and applies the result.

    compare() never proposes deletions; withDeletions() is the explicit
    opt-in for mirroring. execute() routes each item by side kinds:
    local/local through LocalFileSystem, local/remote through get/put
    (or the TransferCoordinator for large files), remote/remote through
    RemoteFileSession::copy on one host or a temporary local file across
    hosts.
*/
class DirectorySynchronizer
{
public:
    using EntryMap = QHash<QString, FileEntry>;   // relative path -> entry

    DirectorySynchronizer(FileSessionManager* sessions,
                          std::shared_ptr<LocalFileSystem> local,
                          TransferCoordinator* coordinator = nullptr);

    bool compare(const SyncSide& left, const SyncSide& right, const SyncOptions& options,
                 QVector<SyncItem>* out, RemoteError* err = nullptr);

    // Pure classification of two already-listed trees, sorted by name.
    static QVector<SyncItem> classify(const EntryMap& left, const EntryMap& right,
                                      const SyncOptions& options);

    static bool passesFilters(const QString& name, const SyncOptions& options);

    // One-sided items on the mirror target become deletions of that side.
    static QVector<SyncItem> withDeletions(const QVector<SyncItem>& items,
                                           SyncItem::Direction mirrorDirection);

    // Stops at the first failure (reported in `report` and `err`).
    bool execute(const SyncSide& left, const SyncSide& right, const QVector<SyncItem>& items,
                 const SyncOptions& options, ItemProgressFn progress = nullptr,
                 SyncReport* report = nullptr, RemoteError* err = nullptr);

private:
    bool listTree(const SyncSide& side, const SyncOptions& options, QString* resolvedRoot,
                  EntryMap* out, RemoteError* err);
    std::shared_ptr<RemoteFileSession> sessionFor(const SyncSide& side, RemoteError* err);

    static QString pathOn(const SyncSide& side, const QString& root, const QString& name);

    bool makeDirectory(const SyncSide& side, const QString& path, RemoteError* err);
    bool ensureRemoteDirs(RemoteFileSession* s, const QString& dir, RemoteError* err);
    bool transferFile(const SyncSide& from, const SyncSide& to, const SyncItem& item,
                      const QString& src, const QString& dst, const SyncOptions& options,
                      SyncReport* report, RemoteError* err);
    bool removePath(const SyncSide& side, const QString& path, bool isDir, RemoteError* err);

    FileSessionManager* m_sessions = nullptr;
    std::shared_ptr<LocalFileSystem> m_local;
    TransferCoordinator* m_coordinator = nullptr;
};
