#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

// Health record for one monitored session.
struct ConnectionHealth
{
    static constexpr int kLatencySamples = 10;

    QString   hostId;
    QDateTime lastCheck;
    int       consecutiveFailures = 0;
    bool      healthy = true;
    QString   lastError;

    // Adds a sample; the oldest one drops out once the ring is full.
    void recordLatency(qint64 ms);
    void recordFailure(const QString& error);
    void reset();

    int sampleCount() const { return m_count; }
    qint64 averageLatencyMs() const;

private:
    qint64 m_samples[kLatencySamples] = {};
    int m_next = 0;
    int m_count = 0;
};
