#include "TransferProgress.h"

QString formatSpeed(qint64 bytesPerSecond)
{
    if (bytesPerSecond < 1024)
        return QString("%1 B/s").arg(qMax<qint64>(0, bytesPerSecond));
    if (bytesPerSecond < 1024 * 1024)
        return QString("%1 KB/s").arg(bytesPerSecond / 1024.0, 0, 'f', 1);
    return QString("%1 MB/s").arg(bytesPerSecond / (1024.0 * 1024.0), 0, 'f', 1);
}
