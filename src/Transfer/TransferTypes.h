#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

struct TransferJob {
    enum class Kind {
        Upload,
        Download
    };

    enum class Status {
        Pending,
        Active,
        Paused,
        Cancelled,
        Completed,
        Error
    };

    QString id;
    Kind    kind = Kind::Download;
    QString hostId;
    QString fileName;          // display only
    QString localPath;
    QString remotePath;
    qint64  totalBytes = 0;    // 0 => unknown until the first progress report

    Status  status = Status::Pending;
    int     progress = 0;      // percent
    qint64  bytesPerSecond = 0;
    QString speedLabel;
    qint64  bytesTransferred = 0;

    int       priority = 1;    // higher runs sooner
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime completedAt;
    QString   error;

    quint64 sequence = 0;      // insertion order, assigned by the coordinator

    bool isTerminal() const;
};

QString transferKindName(TransferJob::Kind kind);
QString transferStatusName(TransferJob::Status status);

struct TransferQueueSummary {
    int    active = 0;
    qint64 totalBytesPerSecond = 0;
    int    queued = 0;            // pending + paused
};

Q_DECLARE_METATYPE(TransferJob)
Q_DECLARE_METATYPE(TransferQueueSummary)
