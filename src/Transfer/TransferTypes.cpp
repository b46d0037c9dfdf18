#include "TransferTypes.h"

bool TransferJob::isTerminal() const
{
    return status == Status::Completed || status == Status::Cancelled || status == Status::Error;
}

QString transferKindName(TransferJob::Kind kind)
{
    return (kind == TransferJob::Kind::Upload) ? QStringLiteral("upload") : QStringLiteral("download");
}

QString transferStatusName(TransferJob::Status status)
{
    switch (status) {
    case TransferJob::Status::Pending:   return "pending";
    case TransferJob::Status::Active:    return "active";
    case TransferJob::Status::Paused:    return "paused";
    case TransferJob::Status::Cancelled: return "cancelled";
    case TransferJob::Status::Completed: return "completed";
    case TransferJob::Status::Error:     return "error";
    }
    return "unknown";
}
