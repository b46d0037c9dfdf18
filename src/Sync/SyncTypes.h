#pragma once

#include <QDateTime>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include "../FileEntry.h"
#include "../HostDescriptor.h"

// One root of a comparison: a local folder or a folder on a host.
struct SyncSide {
    enum class Kind {
        Local,
        Remote
    };

    Kind           kind = Kind::Local;
    HostDescriptor host;     // Remote only
    QString        root;

    static SyncSide local(const QString& root);
    static SyncSide remote(const HostDescriptor& host, const QString& root);

    bool isRemote() const { return kind == Kind::Remote; }
    QString describe() const;   // "local:/x" or "host-id:/x"
};

struct SyncOptions {
    bool    compareSize = true;
    bool    compareDate = true;
    qint64  toleranceMs = 2000;
    QString includeGlob;               // matched against entry names; empty => all
    QString excludeGlob;

    // Transfers of at least this many bytes go through the coordinator
    // (when one is attached). < 0 => never queue.
    qint64  largeFileThreshold = 10LL * 1024 * 1024;
    int     queuedPriority = 5;
};

struct SyncItem {
    enum class Direction {
        LeftToRight,
        RightToLeft,
        Conflict
    };

    enum class Action {
        Copy,
        Update,
        Delete,
        Skip
    };

    QString   name;                    // path relative to both roots
    QString   leftPath;                // empty when absent on the left
    QString   rightPath;
    Direction direction = Direction::LeftToRight;
    Action    action = Action::Skip;
    QString   reason;

    qint64    leftSize = -1;
    qint64    rightSize = -1;
    QDateTime leftModified;
    QDateTime rightModified;
    FileEntry::Type type = FileEntry::Type::File;

    bool isDirectory() const { return type == FileEntry::Type::Directory; }
};

QString syncDirectionName(SyncItem::Direction d);
QString syncActionName(SyncItem::Action a);

struct SyncReport {
    int executed = 0;
    int queued = 0;
    int skipped = 0;
    int failed = 0;
    QStringList queuedJobIds;
    QVector<QPair<QString, QString>> errors;   // (item name, message)
};
