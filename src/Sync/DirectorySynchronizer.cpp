// DirectorySynchronizer.cpp
#include "DirectorySynchronizer.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <QTemporaryDir>

#include <algorithm>

#include "../FileSessionManager.h"
#include "../RemoteFileSession.h"
#include "../RemotePath.h"
#include "../Transfer/TransferCoordinator.h"

// =====================================================
// Helpers
// =====================================================

static bool globMatches(const QString& glob, const QString& name)
{
    const QRegularExpression re(QRegularExpression::wildcardToRegularExpression(glob));
    return re.isValid() && re.match(name).hasMatch();
}

static int depthOf(const QString& rel)
{
    return rel.count('/');
}

static bool isBelow(const QString& rel, const QString& dir)
{
    return rel.startsWith(dir + "/");
}

static qint64 mtimeMs(const QDateTime& t)
{
    return t.isValid() ? t.toMSecsSinceEpoch() : 0;
}

DirectorySynchronizer::DirectorySynchronizer(FileSessionManager* sessions,
                                             std::shared_ptr<LocalFileSystem> local,
                                             TransferCoordinator* coordinator)
    : m_sessions(sessions),
      m_local(std::move(local)),
      m_coordinator(coordinator)
{
}

std::shared_ptr<RemoteFileSession> DirectorySynchronizer::sessionFor(const SyncSide& side, RemoteError* err)
{
    if (!m_sessions) {
        setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                  QStringLiteral("No session manager for a remote side.")));
        return nullptr;
    }
    return m_sessions->session(side.host);
}

QString DirectorySynchronizer::pathOn(const SyncSide& side, const QString& root, const QString& name)
{
    if (side.isRemote())
        return RemotePath::join(root, name);
    return QDir::fromNativeSeparators(QDir(root).filePath(name));
}

bool DirectorySynchronizer::passesFilters(const QString& name, const SyncOptions& options)
{
    if (!options.includeGlob.trimmed().isEmpty() && !globMatches(options.includeGlob.trimmed(), name))
        return false;
    if (!options.excludeGlob.trimmed().isEmpty() && globMatches(options.excludeGlob.trimmed(), name))
        return false;
    return true;
}

// =====================================================
// Compare
// =====================================================

bool DirectorySynchronizer::listTree(const SyncSide& side, const SyncOptions& options,
                                     QString* resolvedRoot, EntryMap* out, RemoteError* err)
{
    std::shared_ptr<RemoteFileSession> session;
    QString root;

    if (side.isRemote()) {
        session = sessionFor(side, err);
        if (!session)
            return false;
        root = RemotePath::normalize(session->expandPath(side.root));
    } else {
        root = QDir::fromNativeSeparators(QDir::cleanPath(QDir(side.root).absolutePath()));
    }
    if (resolvedRoot) *resolvedRoot = root;

    QVector<QString> stack{root};
    while (!stack.isEmpty()) {
        const QString dir = stack.takeLast();

        FileEntryList entries;
        const bool ok = side.isRemote() ? session->list(dir, &entries, false, err)
                                        : m_local->list(dir, &entries, err);
        if (!ok)
            return false;

        for (const FileEntry& e : entries) {
            if (e.isDirectory())
                stack.push_back(e.path);

            if (!passesFilters(e.name, options))
                continue;

            const QString rel = side.isRemote()
                                    ? RemotePath::relativeTo(root, e.path)
                                    : QDir::fromNativeSeparators(QDir(root).relativeFilePath(e.path));
            if (!rel.isEmpty())
                out->insert(rel, e);
        }
    }
    return true;
}

bool DirectorySynchronizer::compare(const SyncSide& left, const SyncSide& right, const SyncOptions& options,
                                    QVector<SyncItem>* out, RemoteError* err)
{
    if (err) err->clear();
    if (out) out->clear();

    qInfo().noquote() << QString("[SYNC] compare %1 <-> %2").arg(left.describe(), right.describe());

    EntryMap l;
    EntryMap r;
    if (!listTree(left, options, nullptr, &l, err) || !listTree(right, options, nullptr, &r, err)) {
        qWarning().noquote() << QString("[SYNC] compare FAILED: %1").arg(err ? err->message() : QString());
        return false;
    }

    const QVector<SyncItem> items = classify(l, r, options);
    qInfo().noquote() << QString("[SYNC] compare done: left=%1 right=%2 differences=%3")
                             .arg(l.size()).arg(r.size()).arg(items.size());
    if (out) *out = items;
    return true;
}

QVector<SyncItem> DirectorySynchronizer::classify(const EntryMap& left, const EntryMap& right,
                                                  const SyncOptions& options)
{
    QSet<QString> names;
    for (auto it = left.constBegin(); it != left.constEnd(); ++it)
        names.insert(it.key());
    for (auto it = right.constBegin(); it != right.constEnd(); ++it)
        names.insert(it.key());

    QStringList sorted = names.values();
    sorted.sort();

    QVector<SyncItem> items;
    for (const QString& name : sorted) {
        const auto li = left.constFind(name);
        const auto ri = right.constFind(name);
        const bool hasLeft = (li != left.constEnd());
        const bool hasRight = (ri != right.constEnd());

        SyncItem item;
        item.name = name;
        if (hasLeft) {
            item.leftPath = li->path;
            item.leftSize = li->size;
            item.leftModified = li->modified;
            item.type = li->type;
        }
        if (hasRight) {
            item.rightPath = ri->path;
            item.rightSize = ri->size;
            item.rightModified = ri->modified;
            if (!hasLeft)
                item.type = ri->type;
        }

        if (hasLeft && !hasRight) {
            item.action = SyncItem::Action::Copy;
            item.direction = SyncItem::Direction::LeftToRight;
            item.reason = QStringLiteral("Only on left side");
            items.push_back(item);
            continue;
        }
        if (!hasLeft && hasRight) {
            item.action = SyncItem::Action::Copy;
            item.direction = SyncItem::Direction::RightToLeft;
            item.reason = QStringLiteral("Only on right side");
            items.push_back(item);
            continue;
        }

        if (li->type != ri->type) {
            item.action = SyncItem::Action::Skip;
            item.direction = SyncItem::Direction::Conflict;
            item.reason = QString("Type mismatch (%1 vs %2)").arg(fileTypeName(li->type), fileTypeName(ri->type));
            items.push_back(item);
            continue;
        }

        if (li->isDirectory())
            continue;

        const qint64 lt = mtimeMs(li->modified);
        const qint64 rt = mtimeMs(ri->modified);

        QString reason;
        if (options.compareSize && li->size != ri->size) {
            reason = QString("Size differs (left %1 bytes, right %2 bytes)").arg(li->size).arg(ri->size);
        } else if (options.compareDate && qAbs(lt - rt) > options.toleranceMs) {
            reason = QString("Modification time differs (%1 is newer)")
                         .arg(lt > rt ? QStringLiteral("left") : QStringLiteral("right"));
        }
        if (reason.isEmpty())
            continue;

        item.action = SyncItem::Action::Update;
        item.direction = (lt > rt) ? SyncItem::Direction::LeftToRight : SyncItem::Direction::RightToLeft;
        item.reason = reason;
        items.push_back(item);
    }
    return items;
}

QVector<SyncItem> DirectorySynchronizer::withDeletions(const QVector<SyncItem>& items,
                                                       SyncItem::Direction mirrorDirection)
{
    if (mirrorDirection == SyncItem::Direction::Conflict)
        return items;

    // Items that exist only on the mirror target.
    const SyncItem::Direction targetOnly = (mirrorDirection == SyncItem::Direction::LeftToRight)
                                               ? SyncItem::Direction::RightToLeft
                                               : SyncItem::Direction::LeftToRight;
    const QString side = (mirrorDirection == SyncItem::Direction::LeftToRight) ? QStringLiteral("right")
                                                                               : QStringLiteral("left");

    QVector<SyncItem> out;
    QStringList deletedDirs;
    for (const SyncItem& it : items) {
        if (it.action == SyncItem::Action::Copy && it.direction == targetOnly) {
            bool covered = false;
            for (const QString& d : deletedDirs) {
                if (isBelow(it.name, d)) {
                    covered = true;
                    break;
                }
            }
            if (covered)
                continue;

            SyncItem del = it;
            del.action = SyncItem::Action::Delete;
            del.direction = mirrorDirection;
            del.reason = QString("Only on %1 side (mirror)").arg(side);
            if (del.isDirectory())
                deletedDirs << del.name;
            out.push_back(del);
            continue;
        }
        out.push_back(it);
    }
    return out;
}

// =====================================================
// Execute
// =====================================================

bool DirectorySynchronizer::ensureRemoteDirs(RemoteFileSession* s, const QString& dir, RemoteError* err)
{
    QStringList missing;
    QString cur = RemotePath::normalize(dir);
    while (cur != "/" && cur != ".") {
        bool there = false;
        if (!s->exists(cur, &there, err))
            return false;
        if (there)
            break;
        missing.prepend(cur);
        cur = RemotePath::parent(cur);
    }

    for (const QString& d : missing) {
        if (!s->mkdir(d, 0755, err))
            return false;
    }
    return true;
}

bool DirectorySynchronizer::makeDirectory(const SyncSide& side, const QString& path, RemoteError* err)
{
    if (!side.isRemote())
        return m_local->makePath(path, err);

    const std::shared_ptr<RemoteFileSession> s = sessionFor(side, err);
    return s && ensureRemoteDirs(s.get(), path, err);
}

bool DirectorySynchronizer::removePath(const SyncSide& side, const QString& path, bool isDir, RemoteError* err)
{
    if (!side.isRemote())
        return m_local->remove(path, err);

    const std::shared_ptr<RemoteFileSession> s = sessionFor(side, err);
    return s && s->remove(path, isDir, err);
}

bool DirectorySynchronizer::transferFile(const SyncSide& from, const SyncSide& to, const SyncItem& item,
                                         const QString& src, const QString& dst, const SyncOptions& options,
                                         SyncReport* report, RemoteError* err)
{
    const qint64 size = qMax<qint64>(0, (item.direction == SyncItem::Direction::LeftToRight) ? item.leftSize
                                                                                            : item.rightSize);
    const bool queue = m_coordinator && options.largeFileThreshold >= 0 && size >= options.largeFileThreshold;

    // local -> local
    if (!from.isRemote() && !to.isRemote())
        return m_local->copy(src, dst, err);

    // local -> remote
    if (!from.isRemote() && to.isRemote()) {
        const std::shared_ptr<RemoteFileSession> s = sessionFor(to, err);
        if (!s || !ensureRemoteDirs(s.get(), RemotePath::parent(dst), err))
            return false;

        if (queue) {
            TransferJob job;
            job.kind = TransferJob::Kind::Upload;
            job.hostId = to.host.id;
            job.fileName = item.name;
            job.localPath = src;
            job.remotePath = dst;
            job.totalBytes = size;
            job.priority = options.queuedPriority;
            const QString id = m_coordinator->addJob(job);
            if (report) {
                report->queued++;
                report->queuedJobIds << id;
            }
            return true;
        }
        return s->put(src, dst, nullptr, nullptr, err);
    }

    // remote -> local
    if (from.isRemote() && !to.isRemote()) {
        if (!m_local->makePath(QFileInfo(dst).absolutePath(), err))
            return false;

        if (queue) {
            TransferJob job;
            job.kind = TransferJob::Kind::Download;
            job.hostId = from.host.id;
            job.fileName = item.name;
            job.localPath = dst;
            job.remotePath = src;
            job.totalBytes = size;
            job.priority = options.queuedPriority;
            const QString id = m_coordinator->addJob(job);
            if (report) {
                report->queued++;
                report->queuedJobIds << id;
            }
            return true;
        }

        const std::shared_ptr<RemoteFileSession> s = sessionFor(from, err);
        return s && s->get(src, dst, nullptr, nullptr, err);
    }

    // remote -> remote, same host
    if (from.host.id == to.host.id) {
        const std::shared_ptr<RemoteFileSession> s = sessionFor(from, err);
        if (!s || !ensureRemoteDirs(s.get(), RemotePath::parent(dst), err))
            return false;
        return s->copy(src, dst, err);
    }

    // remote -> remote across hosts, staged through a temporary file
    QTemporaryDir tmp;
    if (!tmp.isValid())
        return setError(err, RemoteError(RemoteError::Kind::LocalIo,
                                         QString("Cannot create a temporary folder: %1").arg(tmp.errorString())));

    const QString staged = tmp.filePath(RemotePath::fileName(src));
    const std::shared_ptr<RemoteFileSession> a = sessionFor(from, err);
    if (!a || !a->get(src, staged, nullptr, nullptr, err))
        return false;

    const std::shared_ptr<RemoteFileSession> b = sessionFor(to, err);
    if (!b || !ensureRemoteDirs(b.get(), RemotePath::parent(dst), err))
        return false;
    return b->put(staged, dst, nullptr, nullptr, err);
}

bool DirectorySynchronizer::execute(const SyncSide& left, const SyncSide& right, const QVector<SyncItem>& items,
                                    const SyncOptions& options, ItemProgressFn progress,
                                    SyncReport* report, RemoteError* err)
{
    if (err) err->clear();

    SyncReport local;
    SyncReport* rep = report ? report : &local;
    *rep = SyncReport();

    // Resolve roots the same way compare() did ("~" on remote sides).
    QString leftRoot = left.root;
    QString rightRoot = right.root;
    if (left.isRemote()) {
        const std::shared_ptr<RemoteFileSession> s = sessionFor(left, err);
        if (!s) return false;
        leftRoot = RemotePath::normalize(s->expandPath(left.root));
    }
    if (right.isRemote()) {
        const std::shared_ptr<RemoteFileSession> s = sessionFor(right, err);
        if (!s) return false;
        rightRoot = RemotePath::normalize(s->expandPath(right.root));
    }

    QVector<SyncItem> dirs;
    QVector<SyncItem> files;
    QVector<SyncItem> deletes;
    for (const SyncItem& it : items) {
        if (it.action == SyncItem::Action::Skip || it.direction == SyncItem::Direction::Conflict) {
            rep->skipped++;
            continue;
        }
        if (it.action == SyncItem::Action::Delete)
            deletes.push_back(it);
        else if (it.isDirectory())
            dirs.push_back(it);
        else
            files.push_back(it);
    }

    std::sort(dirs.begin(), dirs.end(), [](const SyncItem& a, const SyncItem& b) {
        return (depthOf(a.name) != depthOf(b.name)) ? depthOf(a.name) < depthOf(b.name) : a.name < b.name;
    });
    std::sort(deletes.begin(), deletes.end(), [](const SyncItem& a, const SyncItem& b) {
        return (depthOf(a.name) != depthOf(b.name)) ? depthOf(a.name) > depthOf(b.name) : a.name > b.name;
    });

    QVector<SyncItem> ordered;
    ordered << dirs << files << deletes;

    qInfo().noquote() << QString("[SYNC] execute %1 <-> %2: %3 folder(s), %4 file(s), %5 deletion(s), %6 skipped")
                             .arg(left.describe(), right.describe())
                             .arg(dirs.size()).arg(files.size()).arg(deletes.size()).arg(rep->skipped);

    for (int i = 0; i < ordered.size(); ++i) {
        const SyncItem& it = ordered[i];
        if (progress)
            progress(i + 1, ordered.size(), it.name);

        const bool toRight = (it.direction == SyncItem::Direction::LeftToRight);
        const SyncSide& from = toRight ? left : right;
        const SyncSide& to = toRight ? right : left;
        const QString fromRoot = toRight ? leftRoot : rightRoot;
        const QString toRoot = toRight ? rightRoot : leftRoot;

        const QString srcPath = toRight ? it.leftPath : it.rightPath;
        QString dstPath = toRight ? it.rightPath : it.leftPath;
        if (dstPath.isEmpty())
            dstPath = pathOn(to, toRoot, it.name);

        RemoteError e;
        bool ok = false;
        if (it.action == SyncItem::Action::Delete) {
            ok = removePath(to, dstPath, it.isDirectory(), &e);
        } else if (it.isDirectory()) {
            ok = makeDirectory(to, dstPath, &e);
        } else {
            const QString src = srcPath.isEmpty() ? pathOn(from, fromRoot, it.name) : srcPath;
            const int queuedBefore = rep->queued;
            ok = transferFile(from, to, it, src, dstPath, options, rep, &e);
            if (ok && rep->queued != queuedBefore)
                continue;
        }

        if (!ok) {
            rep->failed++;
            rep->errors.push_back(qMakePair(it.name, e.toString()));
            qWarning().noquote() << QString("[SYNC] %1 '%2' FAILED: %3")
                                        .arg(syncActionName(it.action), it.name, e.toString());
            return setError(err, e);
        }

        rep->executed++;
        qDebug().noquote() << QString("[SYNC] %1 %2 '%3'")
                                  .arg(syncActionName(it.action), syncDirectionName(it.direction), it.name);
    }

    qInfo().noquote() << QString("[SYNC] execute done: executed=%1 queued=%2 skipped=%3")
                             .arg(rep->executed).arg(rep->queued).arg(rep->skipped);
    return true;
}
