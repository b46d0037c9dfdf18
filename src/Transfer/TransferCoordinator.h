#pragma once

#include <QFutureWatcher>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QThreadPool>
#include <QTimer>
#include <QVector>

#include <memory>

#include "../RemoteError.h"
#include "../RemoteSettings.h"
#include "../TransferProgress.h"
#include "TransferBackend.h"
#include "TransferQueue.h"
#include "TransferTypes.h"

/*
    TransferCoordinator
    -------------------
    Priority queue of upload/download jobs with a global and a per-host
    concurrency cap.

    - A scheduler tick admits pending jobs in queue order while the global
      cap has room; jobs whose host is at its cap are skipped, not blocked on
    - Job bodies run on a worker pool through the TransferBackend
    - pause/cancel raise the job's abort flag; pause re-queues it (the
      download .part survives), cancel moves it to the completed list
    - Every job is in exactly one of: queue, active set, completed list

    Lives on its owner thread; signals are emitted there.
*/
class TransferCoordinator : public QObject
{
    Q_OBJECT
public:
    explicit TransferCoordinator(std::shared_ptr<TransferBackend> backend,
                                 const RemoteSettings& settings = RemoteSettings(),
                                 QObject* parent = nullptr);
    ~TransferCoordinator() override;

    // Assigns id (if empty), createdAt and sequence; the job starts pending.
    QString addJob(TransferJob job);

    bool pauseJob(const QString& id);
    bool resumeJob(const QString& id);
    bool cancelJob(const QString& id);

    // Drops completed/cancelled/failed jobs. Returns how many.
    int clearCompleted();

    // Active first, then queue order, then finished jobs.
    QVector<TransferJob> allJobs() const;
    bool job(const QString& id, TransferJob* out) const;
    TransferQueueSummary summary() const;

    int activeCount() const;
    int queuedCount() const;
    int activeCountForHost(const QString& hostId) const;

    void setMaxConcurrentGlobal(int n);
    void setMaxConcurrentPerHost(int n);
    void setTickInterval(int ms);
    int maxConcurrentGlobal() const;
    int maxConcurrentPerHost() const;

    // Aborts everything, waits for workers and stops the scheduler.
    void dispose();

public slots:
    // One scheduler tick.
    void processQueue();

signals:
    void jobUpdated(const TransferJob& job);
    void queueChanged(const TransferQueueSummary& summary);

private:
    enum class StopReason {
        None,
        Pause,
        Cancel
    };

    struct Outcome {
        bool ok = false;
        RemoteError error;
    };

    struct ActiveJob {
        TransferJob job;
        CancelFlag abort;
        StopReason stop = StopReason::None;
        bool resumeAfterStop = false;
        QPointer<QFutureWatcher<Outcome>> watcher;
    };

    void launch(const TransferJob& job, const CancelFlag& abort);
    void onProgress(const QString& id, const TransferProgress& p);
    void onFinished(const QString& id, const Outcome& outcome);

    // Caller holds m_mutex.
    void finishLocked(TransferJob job, TransferJob::Status status, const QString& error);
    TransferQueueSummary summaryLocked() const;

    void publish(const TransferJob& job);
    void publishSummary();
    void audit(const TransferJob& job);

    std::shared_ptr<TransferBackend> m_backend;

    mutable QMutex m_mutex;
    TransferQueue m_queue;
    QHash<QString, ActiveJob> m_active;
    QVector<TransferJob> m_completed;
    quint64 m_nextSequence = 1;
    int m_maxGlobal = 5;
    int m_maxPerHost = 3;
    bool m_disposed = false;

    QTimer* m_tick = nullptr;

    // Declared last: destroyed first, after dispose() drained it.
    QThreadPool m_workers;
};
