#include "SessionTransferBackend.h"

#include "../FileSessionManager.h"

SessionTransferBackend::SessionTransferBackend(FileSessionManager* sessions)
    : m_sessions(sessions)
{
}

bool SessionTransferBackend::download(const TransferJob& job, const ProgressFn& progress,
                                      const CancelFlag& cancel, RemoteError* err)
{
    const std::shared_ptr<RemoteFileSession> s = m_sessions->sessionFor(job.hostId, err);
    if (!s)
        return false;
    return s->get(job.remotePath, job.localPath, progress, cancel, err);
}

bool SessionTransferBackend::upload(const TransferJob& job, const ProgressFn& progress,
                                    const CancelFlag& cancel, RemoteError* err)
{
    const std::shared_ptr<RemoteFileSession> s = m_sessions->sessionFor(job.hostId, err);
    if (!s)
        return false;
    return s->put(job.localPath, job.remotePath, progress, cancel, err);
}
