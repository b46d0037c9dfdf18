#pragma once

#include "TransferBackend.h"

class FileSessionManager;

// Runs jobs through the host's RemoteFileSession (resumable get, put).
class SessionTransferBackend : public TransferBackend
{
public:
    explicit SessionTransferBackend(FileSessionManager* sessions);

    bool download(const TransferJob& job, const ProgressFn& progress,
                  const CancelFlag& cancel, RemoteError* err) override;
    bool upload(const TransferJob& job, const ProgressFn& progress,
                const CancelFlag& cancel, RemoteError* err) override;

private:
    FileSessionManager* m_sessions = nullptr;
};
