#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <QTemporaryDir>

#include "AuditLogger.h"

class AuditLoggerTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    QString previousDir;

    void SetUp() override {
        previousDir = AuditLogger::auditDir();
        AuditLogger::setAuditDirOverride(dir.path());
        AuditLogger::setEnabled(true);
    }

    void TearDown() override {
        AuditLogger::setEnabled(true);
        AuditLogger::setSessionId(QString());
        AuditLogger::setAuditDirOverride(previousDir);
    }

    QVector<QJsonObject> events() const {
        QVector<QJsonObject> out;
        QFile f(AuditLogger::currentLogFilePath());
        if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
            return out;
        const QList<QByteArray> lines = f.readAll().split('\n');
        for (const QByteArray& line : lines) {
            if (!line.trimmed().isEmpty())
                out.push_back(QJsonDocument::fromJson(line).object());
        }
        return out;
    }
};

TEST_F(AuditLoggerTest, WritesOneJsonObjectPerLine) {
    AuditLogger::setSessionId("session-1");
    const qint64 before = AuditLogger::eventCount();

    AuditLogger::writeEvent("pool.connect", QJsonObject{{"hostId", "h1"}, {"ok", true}});
    AuditLogger::writeEvent("pool.close", QJsonObject{{"hostId", "h1"}});

    EXPECT_EQ(AuditLogger::eventCount(), before + 2);
    EXPECT_TRUE(AuditLogger::currentLogFilePath().startsWith(dir.path()));
    EXPECT_TRUE(AuditLogger::currentLogFilePath().endsWith(".jsonl"));

    const QVector<QJsonObject> e = events();
    ASSERT_EQ(e.size(), 2);
    EXPECT_EQ(e[0].value("event").toString(), "pool.connect");
    EXPECT_EQ(e[0].value("hostId").toString(), "h1");
    EXPECT_TRUE(e[0].value("ok").toBool());
    EXPECT_EQ(e[0].value("session_id").toString(), "session-1");
    EXPECT_FALSE(e[0].value("ts").toString().isEmpty());
    EXPECT_TRUE(e[0].contains("pid"));
    EXPECT_EQ(e[1].value("seq").toDouble(), e[0].value("seq").toDouble() + 1);
}

TEST_F(AuditLoggerTest, DisabledDropsEvents) {
    AuditLogger::setEnabled(false);
    EXPECT_FALSE(AuditLogger::isEnabled());

    const qint64 before = AuditLogger::eventCount();
    AuditLogger::writeEvent("ignored");
    EXPECT_EQ(AuditLogger::eventCount(), before);
    EXPECT_TRUE(events().isEmpty());
}

TEST_F(AuditLoggerTest, CommandFieldsDoNotLeakArguments) {
    const QJsonObject f = AuditLogger::commandFields("  mysql -u root -psecret ");
    EXPECT_EQ(f.value("cmd_head").toString(), "mysql");
    EXPECT_EQ(f.value("cmd_hash").toString().size(), 16);
    EXPECT_FALSE(QJsonDocument(f).toJson().contains("secret"));

    EXPECT_TRUE(AuditLogger::commandFields("   ").isEmpty());
}
