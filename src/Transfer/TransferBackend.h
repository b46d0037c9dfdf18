#pragma once

#include "../RemoteError.h"
#include "../TransferProgress.h"
#include "TransferTypes.h"

// What the coordinator calls to move bytes for one job. Runs on a worker
// thread; must return promptly once `cancel` is set.
class TransferBackend
{
public:
    virtual ~TransferBackend() = default;

    virtual bool download(const TransferJob& job, const ProgressFn& progress,
                          const CancelFlag& cancel, RemoteError* err) = 0;
    virtual bool upload(const TransferJob& job, const ProgressFn& progress,
                        const CancelFlag& cancel, RemoteError* err) = 0;
};
