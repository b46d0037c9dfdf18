#include <gtest/gtest.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "HostStore.h"

class HostStoreTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    QString path;

    void SetUp() override {
        path = dir.filePath("hosts.json");
        HostStore::setConfigPathOverride(path);
    }

    void TearDown() override { HostStore::setConfigPathOverride(QString()); }

    void writeRaw(const QByteArray& data) {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(data);
    }
};

TEST_F(HostStoreTest, MissingFileIsEmptyWithoutError) {
    QString err = "stale";
    EXPECT_TRUE(HostStore::load(&err).isEmpty());
    EXPECT_TRUE(err.isEmpty());
    EXPECT_EQ(HostStore::configPath(), path);
}

TEST_F(HostStoreTest, SaveAndLoadEveryAuthKind) {
    QVector<HostDescriptor> hosts;

    HostDescriptor a;
    a.id = "pw";
    a.name = "Password host";
    a.address = "192.0.2.1";
    a.port = 2222;
    a.username = "alice";
    a.auth = PasswordAuth{"pw-secret"};
    hosts << a;

    HostDescriptor b;
    b.id = "key";
    b.address = "192.0.2.2";
    b.username = "bob";
    b.auth = PrivateKeyAuth{"~/.ssh/id_ed25519", "key-pass"};
    b.keepAlive = false;
    hosts << b;

    HostDescriptor c;
    c.id = "agent";
    c.address = "192.0.2.3";
    c.username = "carol";
    c.auth = AgentAuth{"/run/user/1000/agent.sock"};
    hosts << c;

    HostDescriptor d;
    d.id = "vault";
    d.address = "192.0.2.4";
    d.username = "dave";
    d.auth = VaultSecretAuth{"cred-42"};
    d.credentialId = "cred-42";
    hosts << d;

    QString err;
    ASSERT_TRUE(HostStore::save(hosts, &err)) << err.toStdString();

    const QVector<HostDescriptor> loaded = HostStore::load(&err);
    ASSERT_TRUE(err.isEmpty()) << err.toStdString();
    ASSERT_EQ(loaded.size(), 4);

    EXPECT_EQ(loaded[0].name, "Password host");
    EXPECT_EQ(loaded[0].port, 2222);
    ASSERT_TRUE(std::holds_alternative<PasswordAuth>(loaded[0].auth));
    EXPECT_EQ(std::get<PasswordAuth>(loaded[0].auth).secretKey, "pw-secret");

    ASSERT_TRUE(std::holds_alternative<PrivateKeyAuth>(loaded[1].auth));
    EXPECT_EQ(std::get<PrivateKeyAuth>(loaded[1].auth).keyPath, "~/.ssh/id_ed25519");
    EXPECT_EQ(std::get<PrivateKeyAuth>(loaded[1].auth).passphraseKey, "key-pass");
    EXPECT_FALSE(loaded[1].keepAlive);

    ASSERT_TRUE(std::holds_alternative<AgentAuth>(loaded[2].auth));
    EXPECT_EQ(std::get<AgentAuth>(loaded[2].auth).socketOverride, "/run/user/1000/agent.sock");

    ASSERT_TRUE(std::holds_alternative<VaultSecretAuth>(loaded[3].auth));
    EXPECT_EQ(std::get<VaultSecretAuth>(loaded[3].auth).credentialId, "cred-42");
    EXPECT_EQ(loaded[3].credentialId, "cred-42");
}

TEST_F(HostStoreTest, FileHoldsNoSecretValues) {
    HostDescriptor h;
    h.id = "h";
    h.address = "192.0.2.9";
    h.username = "u";
    h.auth = PasswordAuth{"lookup-key"};
    ASSERT_TRUE(HostStore::save({h}));

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QJsonObject root = QJsonDocument::fromJson(f.readAll()).object();
    const QJsonObject auth = root.value("hosts").toArray().at(0).toObject().value("auth").toObject();
    EXPECT_EQ(auth.value("type").toString(), "password");
    EXPECT_EQ(auth.value("secret_key").toString(), "lookup-key");
    EXPECT_FALSE(auth.contains("password"));
}

TEST_F(HostStoreTest, InvalidAndDuplicateHostsAreSkipped) {
    writeRaw(R"({"hosts": [
        {"id": "ok", "address": "192.0.2.1", "username": "a", "port": 99999},
        {"id": "no-address", "username": "a"},
        {"id": "ok", "address": "192.0.2.2", "username": "b"},
        "not an object",
        {"id": "defaults", "address": "192.0.2.3", "username": "c", "extra": true}
    ]})");

    const QVector<HostDescriptor> loaded = HostStore::load();
    ASSERT_EQ(loaded.size(), 2);
    EXPECT_EQ(loaded[0].id, "ok");
    EXPECT_EQ(loaded[0].address, "192.0.2.1");
    EXPECT_EQ(loaded[0].port, 22);
    EXPECT_EQ(loaded[1].id, "defaults");
    EXPECT_TRUE(std::holds_alternative<AgentAuth>(loaded[1].auth));
    EXPECT_TRUE(loaded[1].keepAlive);
}

TEST_F(HostStoreTest, MalformedJsonReportsError) {
    writeRaw("{ not json");

    QString err;
    EXPECT_TRUE(HostStore::load(&err).isEmpty());
    EXPECT_FALSE(err.isEmpty());
}

TEST(HostDescriptorTest, DisplayTargetAndValidity) {
    HostDescriptor h;
    EXPECT_FALSE(h.isValid());

    h.id = "x";
    h.address = "example.org";
    h.username = "root";
    h.port = 0;
    EXPECT_TRUE(h.isValid());
    EXPECT_EQ(h.displayTarget(), "root@example.org:22");
    EXPECT_EQ(authMethodName(h.auth), "agent");
}
