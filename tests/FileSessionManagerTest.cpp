#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrent>

#include <atomic>
#include <memory>

#include "ConnectionPool.h"
#include "FakeTransport.h"
#include "FileSessionManager.h"

class FileSessionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<FileSessionManager> sessions;
    QTemporaryDir local;

    void SetUp() override {
        pool = std::make_unique<ConnectionPool>(server->factory());

        RemoteSettings s;
        s.retryInitialDelayMs = 5;
        s.retryMaxDelayMs = 20;
        s.chunkSize = 1024;
        sessions = std::make_unique<FileSessionManager>(pool.get(), std::make_shared<StaticCredentialResolver>(), s);
        sessions->setHealthMonitoring(false);
        sessions->setHosts({makeTestHost("h1"), makeTestHost("h2")});
    }

    void TearDown() override {
        sessions.reset();
        pool.reset();
    }
};

TEST_F(FileSessionManagerTest, OneSessionPerHost) {
    const std::shared_ptr<RemoteFileSession> a = sessions->sessionFor("h1");
    const std::shared_ptr<RemoteFileSession> b = sessions->sessionFor("h1");
    const std::shared_ptr<RemoteFileSession> c = sessions->sessionFor("h2");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a->host().id, "h1");
}

TEST_F(FileSessionManagerTest, UnknownHostIsNotFound) {
    RemoteError err;
    EXPECT_EQ(sessions->sessionFor("nope", &err), nullptr);
    EXPECT_EQ(err.kind(), RemoteError::Kind::NotFound);
}

TEST_F(FileSessionManagerTest, ClosingDuringDownloadLeavesTheCallerSafe) {
    server->addFile("/srv/big.bin", QByteArray(64 * 1024, 'x'));
    server->setDelay("read", 20);

    std::shared_ptr<RemoteFileSession> s = sessions->sessionFor("h1");
    ASSERT_NE(s, nullptr);
    const std::weak_ptr<RemoteFileSession> weak = s;

    const QString target = local.filePath("big.bin");
    std::atomic_bool started{false};
    RemoteError err;
    QFuture<bool> done = QtConcurrent::run([s, target, &started, &err]() {
        return s->get("/srv/big.bin", target,
                      [&started](const TransferProgress&) { started = true; }, nullptr, &err);
    });
    ASSERT_TRUE(pumpUntil([&started]() { return started.load(); }, 5000));

    sessions->closeSession("h1");
    s.reset();
    EXPECT_FALSE(weak.expired());

    done.waitForFinished();
    EXPECT_FALSE(done.result());
    EXPECT_EQ(err.kind(), RemoteError::Kind::Connection);
    EXPECT_FALSE(QFile::exists(target));
    EXPECT_TRUE(QFile::exists(RemoteFileSession::partialPath(target)));
    EXPECT_TRUE(pumpUntil([&weak]() { return weak.expired(); }, 2000));
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    server->setDelay("read", 0);
    const std::shared_ptr<RemoteFileSession> again = sessions->sessionFor("h1");
    ASSERT_NE(again, nullptr);
    EXPECT_NE(again->state(), RemoteFileSession::State::Closed);
    ASSERT_TRUE(again->get("/srv/big.bin", target, nullptr, nullptr, &err)) << err.toString().toStdString();
    EXPECT_EQ(QFile(target).size(), 64 * 1024);
}

TEST_F(FileSessionManagerTest, DroppedHostClosesItsSessionForHolders) {
    server->addDir("/srv");
    const std::shared_ptr<RemoteFileSession> s = sessions->sessionFor("h2");
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(s->open());

    sessions->setHosts({makeTestHost("h1")});
    EXPECT_EQ(s->state(), RemoteFileSession::State::Closed);
    EXPECT_FALSE(pool->hasConnection("h2"));

    RemoteError err;
    EXPECT_FALSE(s->list("/srv", nullptr, false, &err));
    EXPECT_EQ(err.kind(), RemoteError::Kind::Connection);
    EXPECT_EQ(sessions->sessionFor("h2", &err), nullptr);
    EXPECT_EQ(err.kind(), RemoteError::Kind::NotFound);
}

TEST_F(FileSessionManagerTest, DisposeKeepsHeldSessionsUsableAsObjects) {
    const std::shared_ptr<RemoteFileSession> s = sessions->sessionFor("h1");
    ASSERT_TRUE(s->open());

    sessions->dispose();
    EXPECT_EQ(s->state(), RemoteFileSession::State::Closed);
    EXPECT_FALSE(pool->hasConnection("h1"));

    RemoteError err;
    EXPECT_FALSE(s->list("/", nullptr, false, &err));
    EXPECT_EQ(err.kind(), RemoteError::Kind::Connection);
}
