// RemoteSettings.cpp
#include "RemoteSettings.h"

#include <QSettings>

#include <cmath>

int RemoteSettings::retryDelayMs(int attempt) const
{
    const double d = retryInitialDelayMs * std::pow(retryBackoffFactor, qMax(0, attempt));
    return (int)qMin<double>(d, retryMaxDelayMs);
}

RemoteSettings RemoteSettings::load(QSettings& s)
{
    RemoteSettings r;

    s.beginGroup("sftp");
    r.sftpInitTimeoutMs   = s.value("initTimeoutMs", r.sftpInitTimeoutMs).toInt();
    r.operationTimeoutMs  = s.value("operationTimeoutMs", r.operationTimeoutMs).toInt();
    r.pathExpandTimeoutMs = s.value("pathExpandTimeoutMs", r.pathExpandTimeoutMs).toInt();
    r.connectTimeoutSec   = s.value("connectTimeoutSec", r.connectTimeoutSec).toInt();
    r.maxRetries          = s.value("maxRetries", r.maxRetries).toInt();
    r.retryInitialDelayMs = s.value("retryInitialDelayMs", r.retryInitialDelayMs).toInt();
    r.retryMaxDelayMs     = s.value("retryMaxDelayMs", r.retryMaxDelayMs).toInt();
    r.retryBackoffFactor  = s.value("retryBackoffFactor", r.retryBackoffFactor).toDouble();
    s.endGroup();

    s.beginGroup("cache");
    r.cacheTtlMs    = s.value("ttlMs", r.cacheTtlMs).toInt();
    r.cacheMaxBytes = s.value("maxBytes", r.cacheMaxBytes).toLongLong();
    s.endGroup();

    s.beginGroup("health");
    r.healthIntervalMs       = s.value("intervalMs", r.healthIntervalMs).toInt();
    r.healthProbeTimeoutMs   = s.value("probeTimeoutMs", r.healthProbeTimeoutMs).toInt();
    r.healthFailureThreshold = s.value("failureThreshold", r.healthFailureThreshold).toInt();
    r.latencyWarnMs          = s.value("latencyWarnMs", r.latencyWarnMs).toInt();
    r.latencyReconnectMs     = s.value("latencyReconnectMs", r.latencyReconnectMs).toInt();
    s.endGroup();

    s.beginGroup("transfer");
    r.maxConcurrentGlobal  = s.value("maxConcurrentGlobal", r.maxConcurrentGlobal).toInt();
    r.maxConcurrentPerHost = s.value("maxConcurrentPerHost", r.maxConcurrentPerHost).toInt();
    r.schedulerTickMs      = s.value("schedulerTickMs", r.schedulerTickMs).toInt();
    r.chunkSize            = s.value("chunkSize", r.chunkSize).toInt();
    r.verifyChecksum       = s.value("verifyChecksum", r.verifyChecksum).toBool();
    r.stallThresholdMs     = s.value("stallThresholdMs", r.stallThresholdMs).toInt();
    r.stallCheckIntervalMs = s.value("stallCheckIntervalMs", r.stallCheckIntervalMs).toInt();
    s.endGroup();

    r.sanitize();
    return r;
}

void RemoteSettings::save(QSettings& s) const
{
    s.beginGroup("sftp");
    s.setValue("initTimeoutMs", sftpInitTimeoutMs);
    s.setValue("operationTimeoutMs", operationTimeoutMs);
    s.setValue("pathExpandTimeoutMs", pathExpandTimeoutMs);
    s.setValue("connectTimeoutSec", connectTimeoutSec);
    s.setValue("maxRetries", maxRetries);
    s.setValue("retryInitialDelayMs", retryInitialDelayMs);
    s.setValue("retryMaxDelayMs", retryMaxDelayMs);
    s.setValue("retryBackoffFactor", retryBackoffFactor);
    s.endGroup();

    s.beginGroup("cache");
    s.setValue("ttlMs", cacheTtlMs);
    s.setValue("maxBytes", cacheMaxBytes);
    s.endGroup();

    s.beginGroup("health");
    s.setValue("intervalMs", healthIntervalMs);
    s.setValue("probeTimeoutMs", healthProbeTimeoutMs);
    s.setValue("failureThreshold", healthFailureThreshold);
    s.setValue("latencyWarnMs", latencyWarnMs);
    s.setValue("latencyReconnectMs", latencyReconnectMs);
    s.endGroup();

    s.beginGroup("transfer");
    s.setValue("maxConcurrentGlobal", maxConcurrentGlobal);
    s.setValue("maxConcurrentPerHost", maxConcurrentPerHost);
    s.setValue("schedulerTickMs", schedulerTickMs);
    s.setValue("chunkSize", chunkSize);
    s.setValue("verifyChecksum", verifyChecksum);
    s.setValue("stallThresholdMs", stallThresholdMs);
    s.setValue("stallCheckIntervalMs", stallCheckIntervalMs);
    s.endGroup();
}

void RemoteSettings::sanitize()
{
    sftpInitTimeoutMs   = qBound(100, sftpInitTimeoutMs, 10 * 60 * 1000);
    operationTimeoutMs  = qBound(100, operationTimeoutMs, 60 * 60 * 1000);
    pathExpandTimeoutMs = qBound(100, pathExpandTimeoutMs, 10 * 60 * 1000);
    connectTimeoutSec   = qBound(1, connectTimeoutSec, 600);
    maxRetries          = qBound(0, maxRetries, 20);
    retryInitialDelayMs = qBound(0, retryInitialDelayMs, 60 * 1000);
    retryMaxDelayMs     = qMax(retryInitialDelayMs, retryMaxDelayMs);
    if (retryBackoffFactor < 1.0) retryBackoffFactor = 1.0;

    cacheTtlMs    = qMax(0, cacheTtlMs);
    cacheMaxBytes = qMax<qint64>(0, cacheMaxBytes);

    healthIntervalMs       = qMax(10, healthIntervalMs);
    healthProbeTimeoutMs   = qMax(10, healthProbeTimeoutMs);
    healthFailureThreshold = qMax(1, healthFailureThreshold);
    latencyWarnMs          = qMax(1, latencyWarnMs);
    latencyReconnectMs     = qMax(latencyWarnMs, latencyReconnectMs);

    maxConcurrentGlobal  = qBound(1, maxConcurrentGlobal, 64);
    maxConcurrentPerHost = qBound(1, maxConcurrentPerHost, maxConcurrentGlobal);
    schedulerTickMs      = qMax(10, schedulerTickMs);
    chunkSize            = qBound(4096, chunkSize, 4 * 1024 * 1024);
    stallThresholdMs     = qMax(100, stallThresholdMs);
    stallCheckIntervalMs = qMax(50, stallCheckIntervalMs);
}
