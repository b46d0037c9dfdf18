#pragma once

#include <QString>
#include <QtGlobal>

class QSettings;

// Tunables for sessions, cache, health monitor and transfer queue.
// Defaults are the values used when nothing is configured.
struct RemoteSettings
{
    // sftp/
    int sftpInitTimeoutMs   = 30000;
    int operationTimeoutMs  = 30000;
    int pathExpandTimeoutMs = 15000;
    int connectTimeoutSec   = 20;
    int maxRetries          = 3;
    int retryInitialDelayMs = 1000;
    int retryMaxDelayMs     = 10000;
    double retryBackoffFactor = 2.0;

    // cache/
    int    cacheTtlMs    = 30000;
    qint64 cacheMaxBytes = 50LL * 1024 * 1024;

    // health/
    int healthIntervalMs       = 30000;
    int healthProbeTimeoutMs   = 5000;
    int healthFailureThreshold = 3;
    int latencyWarnMs          = 1000;
    int latencyReconnectMs     = 5000;

    // transfer/
    int  maxConcurrentGlobal  = 5;
    int  maxConcurrentPerHost = 3;
    int  schedulerTickMs      = 1000;
    int  chunkSize            = 64 * 1024;
    bool verifyChecksum       = false;
    int  stallThresholdMs     = 5000;
    int  stallCheckIntervalMs = 2000;

    // Delay before retry `attempt` (0-based): min(initial * factor^attempt, max).
    int retryDelayMs(int attempt) const;

    static RemoteSettings load(QSettings& s);
    void save(QSettings& s) const;

    // Out-of-range values are clamped to sane bounds.
    void sanitize();
};
