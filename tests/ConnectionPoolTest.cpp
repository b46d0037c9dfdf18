#include <gtest/gtest.h>

#include <QtConcurrent/QtConcurrent>
#include <QFuture>
#include <QVector>

#include "ConnectionPool.h"
#include "FakeTransport.h"

class ConnectionPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    StaticCredentialResolver resolver;
    std::unique_ptr<ConnectionPool> pool;
    HostDescriptor host = makeTestHost("h1");

    void SetUp() override { pool = std::make_unique<ConnectionPool>(server->factory()); }
};

TEST_F(ConnectionPoolTest, AcquireOpensOnceAndCountsReferences) {
    RemoteError err;
    auto a = pool->acquire(host, resolver, &err);
    auto b = pool->acquire(host, resolver, &err);
    auto c = pool->acquire(host, resolver, &err);

    ASSERT_TRUE(a);
    EXPECT_EQ(a, b);
    EXPECT_EQ(b, c);
    EXPECT_EQ(pool->getRefCount("h1"), 3);
    EXPECT_EQ(server->transportsOpened(), 1);
    EXPECT_EQ(resolver.calls.load(), 1);
    EXPECT_TRUE(pool->hasConnection("h1"));
}

TEST_F(ConnectionPoolTest, LastReleaseClosesAndRemovesEntry) {
    const int n = 4;
    for (int i = 0; i < n; ++i)
        ASSERT_TRUE(pool->acquire(host, resolver));

    for (int i = 0; i < n - 1; ++i) {
        pool->release("h1");
        EXPECT_TRUE(pool->hasConnection("h1"));
        EXPECT_EQ(server->transportsClosed(), 0);
    }

    pool->release("h1");
    EXPECT_FALSE(pool->hasConnection("h1"));
    EXPECT_EQ(pool->getRefCount("h1"), 0);
    EXPECT_EQ(pool->getConnection("h1"), nullptr);
    EXPECT_EQ(server->transportsOpened(), 1);
    EXPECT_EQ(server->transportsClosed(), 1);
}

TEST_F(ConnectionPoolTest, ReleaseOfUnknownHostIsANoOp) {
    pool->release("nobody");
    EXPECT_FALSE(pool->hasConnection("nobody"));
    EXPECT_EQ(server->transportsClosed(), 0);
}

TEST_F(ConnectionPoolTest, FailedOpenIsNotRegistered) {
    server->failNext("connect", RemoteError(RemoteError::Kind::Connection, "Connection refused"));

    RemoteError err;
    EXPECT_EQ(pool->acquire(host, resolver, &err), nullptr);
    EXPECT_EQ(err.kind(), RemoteError::Kind::Connection);
    EXPECT_FALSE(pool->hasConnection("h1"));

    EXPECT_TRUE(pool->acquire(host, resolver, &err));
    EXPECT_EQ(pool->getRefCount("h1"), 1);
}

TEST_F(ConnectionPoolTest, CredentialFailurePropagates) {
    resolver.fail = true;

    RemoteError err;
    EXPECT_EQ(pool->acquire(host, resolver, &err), nullptr);
    EXPECT_EQ(err.kind(), RemoteError::Kind::Authentication);
    EXPECT_EQ(server->transportsOpened(), 0);
}

TEST_F(ConnectionPoolTest, InvalidHostIsRejected) {
    HostDescriptor bad = host;
    bad.address.clear();

    RemoteError err;
    EXPECT_EQ(pool->acquire(bad, resolver, &err), nullptr);
    EXPECT_EQ(err.kind(), RemoteError::Kind::InvalidArgument);
}

TEST_F(ConnectionPoolTest, UnexpectedCloseRemovesEntry) {
    ASSERT_TRUE(pool->acquire(host, resolver));
    ASSERT_TRUE(pool->acquire(host, resolver));

    server->lastTransport()->dropUnexpectedly("Connection reset by peer");
    EXPECT_FALSE(pool->hasConnection("h1"));

    // The next acquire opens a fresh transport.
    auto again = pool->acquire(host, resolver);
    ASSERT_TRUE(again);
    EXPECT_TRUE(again->isOpen());
    EXPECT_EQ(server->transportsOpened(), 2);
    EXPECT_EQ(pool->getRefCount("h1"), 1);
}

TEST_F(ConnectionPoolTest, StaleReleaseDoesNotTouchNewTransport) {
    auto first = pool->acquire(host, resolver);
    ASSERT_TRUE(first);
    server->lastTransport()->dropUnexpectedly("gone");

    auto second = pool->acquire(host, resolver);
    ASSERT_TRUE(second);

    pool->release("h1", first.get());
    EXPECT_EQ(pool->getRefCount("h1"), 1);
    EXPECT_TRUE(second->isOpen());
}

TEST_F(ConnectionPoolTest, ConcurrentAcquiresShareOneTransport) {
    server->setDelay("connect", 100);

    QVector<QFuture<std::shared_ptr<RemoteTransport>>> futures;
    for (int i = 0; i < 6; ++i)
        futures.push_back(QtConcurrent::run([this]() { return pool->acquire(host, resolver); }));

    std::shared_ptr<RemoteTransport> first;
    for (auto& f : futures) {
        auto t = f.result();
        ASSERT_TRUE(t);
        if (!first) first = t;
        EXPECT_EQ(t, first);
    }
    EXPECT_EQ(server->transportsOpened(), 1);
    EXPECT_EQ(pool->getRefCount("h1"), 6);
}

TEST_F(ConnectionPoolTest, SeparateHostsGetSeparateTransports) {
    auto a = pool->acquire(makeTestHost("a"), resolver);
    auto b = pool->acquire(makeTestHost("b"), resolver);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a, b);
    EXPECT_EQ(pool->openedCount(), 2);
}

TEST_F(ConnectionPoolTest, DisposeClosesEverything) {
    ASSERT_TRUE(pool->acquire(makeTestHost("a"), resolver));
    ASSERT_TRUE(pool->acquire(makeTestHost("b"), resolver));

    pool->dispose();
    EXPECT_FALSE(pool->hasConnection("a"));
    EXPECT_FALSE(pool->hasConnection("b"));
    EXPECT_EQ(server->transportsClosed(), 2);
}
