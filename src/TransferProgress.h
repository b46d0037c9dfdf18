#pragma once

#include <QString>
#include <QtGlobal>

#include <atomic>
#include <functional>
#include <memory>

// Progress snapshot for one streaming transfer (at most one per chunk).
struct TransferProgress
{
    int     percent = 0;
    QString speedLabel;        // "512 B/s", "12.5 KB/s", "3.2 MB/s"
    qint64  bytesDone = 0;
    qint64  bytesTotal = 0;
    qint64  bytesPerSecond = 0;
};

using ProgressFn = std::function<void(const TransferProgress&)>;

// (current, total, item name) for multi-item walks.
using ItemProgressFn = std::function<void(int current, int total, const QString& name)>;

// Cooperative cancel flag checked between chunks.
using CancelFlag = std::shared_ptr<std::atomic_bool>;

inline CancelFlag makeCancelFlag()
{
    return std::make_shared<std::atomic_bool>(false);
}

QString formatSpeed(qint64 bytesPerSecond);

