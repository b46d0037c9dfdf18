#include "TransferQueue.h"

#include <algorithm>

bool TransferQueue::runsBefore(const TransferJob& a, const TransferJob& b)
{
    if (a.priority != b.priority)
        return a.priority > b.priority;
    if (a.createdAt != b.createdAt)
        return a.createdAt < b.createdAt;
    return a.sequence < b.sequence;
}

void TransferQueue::push(const TransferJob& job)
{
    auto it = std::upper_bound(m_jobs.begin(), m_jobs.end(), job, &TransferQueue::runsBefore);
    m_jobs.insert(it, job);
}

bool TransferQueue::take(const QString& id, TransferJob* out)
{
    for (int i = 0; i < m_jobs.size(); ++i) {
        if (m_jobs[i].id == id) {
            const TransferJob j = takeAt(i);
            if (out) *out = j;
            return true;
        }
    }
    return false;
}

TransferJob* TransferQueue::find(const QString& id)
{
    for (TransferJob& j : m_jobs) {
        if (j.id == id)
            return &j;
    }
    return nullptr;
}

const TransferJob* TransferQueue::find(const QString& id) const
{
    for (const TransferJob& j : m_jobs) {
        if (j.id == id)
            return &j;
    }
    return nullptr;
}

TransferJob TransferQueue::takeAt(int index)
{
    return m_jobs.takeAt(index);
}
