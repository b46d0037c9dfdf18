// TransferCoordinator.cpp
#include "TransferCoordinator.h"

#include <QDebug>
#include <QDir>
#include <QJsonObject>
#include <QMetaObject>
#include <QMutexLocker>
#include <QUuid>
#include <QtConcurrent/QtConcurrent>

#include "../AuditLogger.h"
#include "../RemotePath.h"

static QString displayName(const TransferJob& j)
{
    if (!j.fileName.trimmed().isEmpty())
        return j.fileName.trimmed();
    const QString source = (j.kind == TransferJob::Kind::Download) ? j.remotePath : j.localPath;
    return RemotePath::fileName(QDir::fromNativeSeparators(source));
}

TransferCoordinator::TransferCoordinator(std::shared_ptr<TransferBackend> backend,
                                         const RemoteSettings& settings,
                                         QObject* parent)
    : QObject(parent),
      m_backend(std::move(backend)),
      m_maxGlobal(qMax(1, settings.maxConcurrentGlobal)),
      m_maxPerHost(qMax(1, settings.maxConcurrentPerHost))
{
    qRegisterMetaType<TransferJob>("TransferJob");
    qRegisterMetaType<TransferQueueSummary>("TransferQueueSummary");

    m_workers.setMaxThreadCount(m_maxGlobal);

    m_tick = new QTimer(this);
    m_tick->setInterval(qMax(10, settings.schedulerTickMs));
    connect(m_tick, &QTimer::timeout, this, &TransferCoordinator::processQueue);
    m_tick->start();
}

TransferCoordinator::~TransferCoordinator()
{
    dispose();
}

// =====================================================
// Public API
// =====================================================

QString TransferCoordinator::addJob(TransferJob job)
{
    {
        QMutexLocker lock(&m_mutex);
        if (job.id.trimmed().isEmpty())
            job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        job.fileName = displayName(job);
        job.status = TransferJob::Status::Pending;
        job.progress = 0;
        job.bytesTransferred = 0;
        job.bytesPerSecond = 0;
        job.speedLabel.clear();
        job.error.clear();
        if (!job.createdAt.isValid())
            job.createdAt = QDateTime::currentDateTimeUtc();
        job.sequence = m_nextSequence++;
        m_queue.push(job);
    }

    qInfo().noquote() << QString("[XFER] queued %1 id=%2 host='%3' file='%4' priority=%5")
                             .arg(transferKindName(job.kind), job.id, job.hostId, job.fileName)
                             .arg(job.priority);
    publish(job);
    publishSummary();
    return job.id;
}

bool TransferCoordinator::pauseJob(const QString& id)
{
    TransferJob updated;
    {
        QMutexLocker lock(&m_mutex);

        auto it = m_active.find(id);
        if (it != m_active.end()) {
            if (it->stop != StopReason::None)
                return it->stop == StopReason::Pause;
            it->stop = StopReason::Pause;
            it->resumeAfterStop = false;
            it->abort->store(true);
            it->job.status = TransferJob::Status::Paused;
            it->job.bytesPerSecond = 0;
            it->job.speedLabel.clear();
            updated = it->job;
        } else if (TransferJob* q = m_queue.find(id)) {
            if (q->status != TransferJob::Status::Pending)
                return q->status == TransferJob::Status::Paused;
            q->status = TransferJob::Status::Paused;
            updated = *q;
        } else {
            return false;
        }
    }

    qInfo().noquote() << QString("[XFER] paused id=%1").arg(id);
    publish(updated);
    publishSummary();
    return true;
}

bool TransferCoordinator::resumeJob(const QString& id)
{
    TransferJob updated;
    {
        QMutexLocker lock(&m_mutex);

        auto it = m_active.find(id);
        if (it != m_active.end()) {
            // Still winding down: re-queue as pending when the worker returns.
            if (it->stop != StopReason::Pause)
                return false;
            it->resumeAfterStop = true;
            it->job.status = TransferJob::Status::Pending;
            updated = it->job;
        } else if (TransferJob* q = m_queue.find(id)) {
            if (q->status != TransferJob::Status::Paused)
                return false;
            q->status = TransferJob::Status::Pending;
            updated = *q;
        } else {
            return false;
        }
    }

    qInfo().noquote() << QString("[XFER] resumed id=%1").arg(id);
    publish(updated);
    publishSummary();
    return true;
}

bool TransferCoordinator::cancelJob(const QString& id)
{
    TransferJob updated;
    {
        QMutexLocker lock(&m_mutex);

        auto it = m_active.find(id);
        if (it != m_active.end()) {
            if (it->stop == StopReason::Cancel)
                return true;
            it->stop = StopReason::Cancel;
            it->abort->store(true);
            it->job.status = TransferJob::Status::Cancelled;
            it->job.bytesPerSecond = 0;
            it->job.speedLabel.clear();
            updated = it->job;
        } else {
            TransferJob q;
            if (!m_queue.take(id, &q))
                return false;
            finishLocked(q, TransferJob::Status::Cancelled, QString());
            updated = m_completed.last();
        }
    }

    qInfo().noquote() << QString("[XFER] cancelled id=%1").arg(id);
    publish(updated);
    publishSummary();
    return true;
}

int TransferCoordinator::clearCompleted()
{
    int n = 0;
    {
        QMutexLocker lock(&m_mutex);
        n = m_completed.size();
        m_completed.clear();
    }
    if (n > 0)
        publishSummary();
    return n;
}

QVector<TransferJob> TransferCoordinator::allJobs() const
{
    QMutexLocker lock(&m_mutex);

    QVector<TransferJob> out;
    out.reserve(m_active.size() + m_queue.size() + m_completed.size());

    QVector<TransferJob> active;
    for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it)
        active.push_back(it->job);
    std::sort(active.begin(), active.end(), &TransferQueue::runsBefore);

    out += active;
    out += m_queue.jobs();
    out += m_completed;
    return out;
}

bool TransferCoordinator::job(const QString& id, TransferJob* out) const
{
    QMutexLocker lock(&m_mutex);

    auto it = m_active.constFind(id);
    if (it != m_active.constEnd()) {
        if (out) *out = it->job;
        return true;
    }
    if (const TransferJob* q = m_queue.find(id)) {
        if (out) *out = *q;
        return true;
    }
    for (const TransferJob& j : m_completed) {
        if (j.id == id) {
            if (out) *out = j;
            return true;
        }
    }
    return false;
}

TransferQueueSummary TransferCoordinator::summary() const
{
    QMutexLocker lock(&m_mutex);
    return summaryLocked();
}

TransferQueueSummary TransferCoordinator::summaryLocked() const
{
    TransferQueueSummary s;
    for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it) {
        if (it->job.status != TransferJob::Status::Active)
            continue;
        s.active++;
        s.totalBytesPerSecond += it->job.bytesPerSecond;
    }
    s.queued = m_queue.size();
    return s;
}

int TransferCoordinator::activeCount() const
{
    QMutexLocker lock(&m_mutex);
    return summaryLocked().active;
}

int TransferCoordinator::queuedCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_queue.size();
}

int TransferCoordinator::activeCountForHost(const QString& hostId) const
{
    QMutexLocker lock(&m_mutex);
    int n = 0;
    for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it) {
        if (it->job.hostId == hostId && it->job.status == TransferJob::Status::Active)
            n++;
    }
    return n;
}

void TransferCoordinator::setMaxConcurrentGlobal(int n)
{
    QMutexLocker lock(&m_mutex);
    m_maxGlobal = qBound(1, n, 64);
    m_workers.setMaxThreadCount(m_maxGlobal);
}

void TransferCoordinator::setMaxConcurrentPerHost(int n)
{
    QMutexLocker lock(&m_mutex);
    m_maxPerHost = qBound(1, n, 64);
}

void TransferCoordinator::setTickInterval(int ms)
{
    m_tick->setInterval(qMax(10, ms));
}

int TransferCoordinator::maxConcurrentGlobal() const
{
    QMutexLocker lock(&m_mutex);
    return m_maxGlobal;
}

int TransferCoordinator::maxConcurrentPerHost() const
{
    QMutexLocker lock(&m_mutex);
    return m_maxPerHost;
}

void TransferCoordinator::dispose()
{
    QVector<TransferJob> cancelled;
    {
        QMutexLocker lock(&m_mutex);
        if (m_disposed)
            return;
        m_disposed = true;

        for (auto it = m_active.begin(); it != m_active.end(); ++it) {
            it->stop = StopReason::Cancel;
            it->abort->store(true);
        }
        while (!m_queue.isEmpty()) {
            finishLocked(m_queue.takeAt(0), TransferJob::Status::Cancelled, QString());
            cancelled.push_back(m_completed.last());
        }
    }

    m_tick->stop();
    m_workers.waitForDone();

    {
        QMutexLocker lock(&m_mutex);
        const QList<QString> ids = m_active.keys();
        for (const QString& id : ids) {
            ActiveJob a = m_active.take(id);
            if (a.watcher)
                a.watcher->disconnect(this);
            finishLocked(a.job, TransferJob::Status::Cancelled, QString());
            cancelled.push_back(m_completed.last());
        }
    }

    if (!cancelled.isEmpty())
        qInfo().noquote() << QString("[XFER] disposed: %1 job(s) cancelled").arg(cancelled.size());
    for (const TransferJob& j : cancelled)
        publish(j);
    publishSummary();
}

// =====================================================
// Scheduler
// =====================================================

void TransferCoordinator::processQueue()
{
    QVector<QPair<TransferJob, CancelFlag>> admitted;
    {
        QMutexLocker lock(&m_mutex);
        if (m_disposed)
            return;

        // Jobs still winding down after pause/cancel hold their slot.
        int running = m_active.size();
        QHash<QString, int> perHost;
        for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it)
            perHost[it->job.hostId]++;

        int i = 0;
        while (i < m_queue.size() && running < m_maxGlobal) {
            const TransferJob& candidate = m_queue.at(i);
            if (candidate.status != TransferJob::Status::Pending
                || perHost.value(candidate.hostId) >= m_maxPerHost) {
                ++i;
                continue;
            }

            TransferJob j = m_queue.takeAt(i);
            j.status = TransferJob::Status::Active;
            j.startedAt = QDateTime::currentDateTimeUtc();
            j.error.clear();

            ActiveJob a;
            a.job = j;
            a.abort = makeCancelFlag();
            m_active.insert(j.id, a);

            perHost[j.hostId]++;
            running++;
            admitted.push_back(qMakePair(j, a.abort));
        }
    }

    for (const auto& p : admitted) {
        qInfo().noquote() << QString("[XFER] start %1 id=%2 host='%3' file='%4'")
                                 .arg(transferKindName(p.first.kind), p.first.id, p.first.hostId, p.first.fileName);
        launch(p.first, p.second);
        publish(p.first);
    }
    if (!admitted.isEmpty())
        publishSummary();
}

void TransferCoordinator::launch(const TransferJob& job, const CancelFlag& abort)
{
    auto* watcher = new QFutureWatcher<Outcome>(this);
    const QString id = job.id;

    connect(watcher, &QFutureWatcher<Outcome>::finished, this, [this, watcher, id]() {
        const Outcome outcome = watcher->future().result();
        watcher->deleteLater();
        onFinished(id, outcome);
    });

    {
        QMutexLocker lock(&m_mutex);
        auto it = m_active.find(id);
        if (it != m_active.end())
            it->watcher = watcher;
    }

    std::shared_ptr<TransferBackend> backend = m_backend;
    ProgressFn progress = [this, id](const TransferProgress& p) {
        QMetaObject::invokeMethod(this, [this, id, p]() { onProgress(id, p); }, Qt::QueuedConnection);
    };

    watcher->setFuture(QtConcurrent::run(&m_workers, [backend, job, progress, abort]() -> Outcome {
        Outcome o;
        if (abort->load()) {
            o.error = RemoteError(RemoteError::Kind::Cancelled, QStringLiteral("Transfer cancelled."));
            return o;
        }
        if (job.kind == TransferJob::Kind::Download)
            o.ok = backend->download(job, progress, abort, &o.error);
        else
            o.ok = backend->upload(job, progress, abort, &o.error);
        return o;
    }));
}

void TransferCoordinator::onProgress(const QString& id, const TransferProgress& p)
{
    TransferJob updated;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_active.find(id);
        if (it == m_active.end() || it->stop != StopReason::None)
            return;

        TransferJob& j = it->job;
        j.progress = qBound(0, p.percent, 100);
        j.bytesTransferred = p.bytesDone;
        j.bytesPerSecond = p.bytesPerSecond;
        j.speedLabel = p.speedLabel;
        if (p.bytesTotal > 0)
            j.totalBytes = p.bytesTotal;
        updated = j;
    }

    publish(updated);
    publishSummary();
}

void TransferCoordinator::onFinished(const QString& id, const Outcome& outcome)
{
    TransferJob updated;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_active.find(id);
        if (it == m_active.end())
            return;

        ActiveJob a = *it;
        m_active.erase(it);

        TransferJob j = a.job;
        j.bytesPerSecond = 0;
        j.speedLabel.clear();

        if (a.stop == StopReason::Pause && !outcome.ok) {
            j.status = a.resumeAfterStop ? TransferJob::Status::Pending : TransferJob::Status::Paused;
            m_queue.push(j);
            updated = j;
        } else if (a.stop == StopReason::Cancel || (!outcome.ok && outcome.error.kind() == RemoteError::Kind::Cancelled)) {
            finishLocked(j, TransferJob::Status::Cancelled, QString());
            updated = m_completed.last();
        } else if (outcome.ok) {
            j.progress = 100;
            if (j.totalBytes > 0)
                j.bytesTransferred = j.totalBytes;
            finishLocked(j, TransferJob::Status::Completed, QString());
            updated = m_completed.last();
        } else {
            finishLocked(j, TransferJob::Status::Error, outcome.error.toString());
            updated = m_completed.last();
        }
    }

    qInfo().noquote() << QString("[XFER] %1 id=%2 file='%3'%4")
                             .arg(transferStatusName(updated.status), updated.id, updated.fileName,
                                  updated.error.isEmpty() ? QString() : QString(" error='%1'").arg(updated.error));
    publish(updated);

    // Free slot: admit the next job now rather than on the next tick.
    processQueue();
    publishSummary();
}

void TransferCoordinator::finishLocked(TransferJob job, TransferJob::Status status, const QString& error)
{
    job.status = status;
    job.error = error;
    job.completedAt = QDateTime::currentDateTimeUtc();
    job.bytesPerSecond = 0;
    job.speedLabel.clear();
    m_completed.push_back(job);
    audit(job);
}

// =====================================================
// Signals and audit
// =====================================================

void TransferCoordinator::publish(const TransferJob& job)
{
    emit jobUpdated(job);
}

void TransferCoordinator::publishSummary()
{
    emit queueChanged(summary());
}

void TransferCoordinator::audit(const TransferJob& job)
{
    QJsonObject f{
        {"jobId", job.id},
        {"kind", transferKindName(job.kind)},
        {"hostId", job.hostId},
        {"file", job.fileName},
        {"bytes", QString::number(job.bytesTransferred)},
        {"priority", job.priority}
    };
    if (job.startedAt.isValid())
        f.insert("durationMs", QString::number(job.startedAt.msecsTo(job.completedAt)));
    if (!job.error.isEmpty())
        f.insert("error", job.error.left(400));

    const char* name = "transfer.completed";
    if (job.status == TransferJob::Status::Cancelled)
        name = "transfer.cancelled";
    else if (job.status == TransferJob::Status::Error)
        name = "transfer.failed";
    AuditLogger::writeEvent(QString::fromLatin1(name), f);
}
