#pragma once

#include <QString>
#include <QVector>

#include "TransferTypes.h"

// Waiting jobs (pending and paused), kept in admission order:
// priority desc, then createdAt asc, then sequence asc.
class TransferQueue
{
public:
    void push(const TransferJob& job);

    // Removes and returns the job; false if it is not queued.
    bool take(const QString& id, TransferJob* out = nullptr);

    TransferJob* find(const QString& id);
    const TransferJob* find(const QString& id) const;

    const TransferJob& at(int index) const { return m_jobs.at(index); }
    TransferJob takeAt(int index);

    int  size() const { return m_jobs.size(); }
    bool isEmpty() const { return m_jobs.isEmpty(); }
    void clear() { m_jobs.clear(); }

    const QVector<TransferJob>& jobs() const { return m_jobs; }

    // Strict weak ordering used for admission.
    static bool runsBefore(const TransferJob& a, const TransferJob& b);

private:
    QVector<TransferJob> m_jobs;
};
