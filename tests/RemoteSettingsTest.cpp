#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "RemoteSettings.h"

TEST(RemoteSettingsTest, Defaults) {
    const RemoteSettings s;
    EXPECT_EQ(s.sftpInitTimeoutMs, 30000);
    EXPECT_EQ(s.operationTimeoutMs, 30000);
    EXPECT_EQ(s.pathExpandTimeoutMs, 15000);
    EXPECT_EQ(s.maxRetries, 3);
    EXPECT_EQ(s.cacheTtlMs, 30000);
    EXPECT_EQ(s.cacheMaxBytes, 50LL * 1024 * 1024);
    EXPECT_EQ(s.healthIntervalMs, 30000);
    EXPECT_EQ(s.healthFailureThreshold, 3);
    EXPECT_EQ(s.maxConcurrentGlobal, 5);
    EXPECT_EQ(s.maxConcurrentPerHost, 3);
    EXPECT_EQ(s.chunkSize, 64 * 1024);
    EXPECT_FALSE(s.verifyChecksum);
}

TEST(RemoteSettingsTest, RetryDelayDoublesUpToCap) {
    const RemoteSettings s;
    EXPECT_EQ(s.retryDelayMs(0), 1000);
    EXPECT_EQ(s.retryDelayMs(1), 2000);
    EXPECT_EQ(s.retryDelayMs(2), 4000);
    EXPECT_EQ(s.retryDelayMs(3), 8000);
    EXPECT_EQ(s.retryDelayMs(4), 10000);
    EXPECT_EQ(s.retryDelayMs(10), 10000);
}

TEST(RemoteSettingsTest, SaveAndLoadThroughIni) {
    QTemporaryDir dir;
    const QString ini = dir.filePath("remotefiles.ini");

    RemoteSettings s;
    s.operationTimeoutMs = 12345;
    s.maxRetries = 5;
    s.cacheTtlMs = 1000;
    s.maxConcurrentPerHost = 2;
    s.verifyChecksum = true;
    {
        QSettings qs(ini, QSettings::IniFormat);
        s.save(qs);
    }

    QSettings qs(ini, QSettings::IniFormat);
    const RemoteSettings loaded = RemoteSettings::load(qs);
    EXPECT_EQ(loaded.operationTimeoutMs, 12345);
    EXPECT_EQ(loaded.maxRetries, 5);
    EXPECT_EQ(loaded.cacheTtlMs, 1000);
    EXPECT_EQ(loaded.maxConcurrentPerHost, 2);
    EXPECT_TRUE(loaded.verifyChecksum);
    EXPECT_EQ(loaded.sftpInitTimeoutMs, 30000);
}

TEST(RemoteSettingsTest, SanitizeClampsOutOfRangeValues) {
    RemoteSettings s;
    s.maxRetries = -4;
    s.chunkSize = 10;
    s.maxConcurrentGlobal = 0;
    s.maxConcurrentPerHost = 50;
    s.retryInitialDelayMs = 5000;
    s.retryMaxDelayMs = 100;
    s.retryBackoffFactor = 0.5;
    s.latencyWarnMs = 3000;
    s.latencyReconnectMs = 10;
    s.sanitize();

    EXPECT_EQ(s.maxRetries, 0);
    EXPECT_EQ(s.chunkSize, 4096);
    EXPECT_EQ(s.maxConcurrentGlobal, 1);
    EXPECT_EQ(s.maxConcurrentPerHost, 1);
    EXPECT_EQ(s.retryMaxDelayMs, 5000);
    EXPECT_DOUBLE_EQ(s.retryBackoffFactor, 1.0);
    EXPECT_EQ(s.latencyReconnectMs, 3000);
}
