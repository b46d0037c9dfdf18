#include "ConnectionHealth.h"

void ConnectionHealth::recordLatency(qint64 ms)
{
    m_samples[m_next] = ms;
    m_next = (m_next + 1) % kLatencySamples;
    if (m_count < kLatencySamples)
        m_count++;

    lastCheck = QDateTime::currentDateTime();
    consecutiveFailures = 0;
    healthy = true;
    lastError.clear();
}

void ConnectionHealth::recordFailure(const QString& error)
{
    lastCheck = QDateTime::currentDateTime();
    consecutiveFailures++;
    lastError = error;
}

void ConnectionHealth::reset()
{
    const QString id = hostId;
    *this = ConnectionHealth{};
    hostId = id;
}

qint64 ConnectionHealth::averageLatencyMs() const
{
    if (m_count == 0)
        return 0;

    qint64 sum = 0;
    for (int i = 0; i < m_count; ++i)
        sum += m_samples[i];
    return sum / m_count;
}
