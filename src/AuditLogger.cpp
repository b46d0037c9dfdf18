// AuditLogger.cpp
#include "AuditLogger.h"

#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>

// =====================================================
// Process-wide state, all guarded by g_mutex.
// =====================================================

static QMutex  g_mutex;
static QString g_appName;
static QString g_sessionId;
static QString g_dirOverride;
static bool    g_enabled = true;
static qint64  g_seq = 0;

static QFile*  g_file = nullptr;   // today's file, owned here
static QString g_openDay;
static QString g_openPath;

// =====================================================
// Helpers (callers hold g_mutex)
// =====================================================

static QString today()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd");
}

static QString dirLocked()
{
    const QString ov = g_dirOverride.trimmed();
    if (!ov.isEmpty())
        return QDir::cleanPath(ov);
    return QDir::cleanPath(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/audit");
}

static QString pathForDayLocked(const QString& day)
{
    return QDir(dirLocked()).filePath(QString("audit-%1.jsonl").arg(day));
}

static void closeLocked()
{
    if (g_file) {
        if (g_file->isOpen())
            g_file->close();
        delete g_file;
        g_file = nullptr;
    }
    g_openDay.clear();
    g_openPath.clear();
}

// Reopens on day change or directory change.
static bool ensureOpenLocked()
{
    const QString day = today();
    const QString want = pathForDayLocked(day);

    if (g_file && g_file->isOpen() && g_openDay == day && g_openPath == want)
        return true;

    closeLocked();
    QDir().mkpath(dirLocked());

    g_file = new QFile(want);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        closeLocked();
        return false;
    }

    g_openDay = day;
    g_openPath = want;
    return true;
}

// =====================================================
// Public API
// =====================================================

namespace AuditLogger {

void install(const QString& appName)
{
    // No qInfo here: the Logger may be routed through us one day.
    QMutexLocker lock(&g_mutex);
    g_appName = appName;
    g_seq = 0;
    ensureOpenLocked();
}

void setSessionId(const QString& sessionId)
{
    QMutexLocker lock(&g_mutex);
    g_sessionId = sessionId;
}

QString sessionId()
{
    QMutexLocker lock(&g_mutex);
    return g_sessionId;
}

void setEnabled(bool enabled)
{
    QMutexLocker lock(&g_mutex);
    g_enabled = enabled;
    if (!enabled)
        closeLocked();
}

bool isEnabled()
{
    QMutexLocker lock(&g_mutex);
    return g_enabled;
}

QString auditDir()
{
    QMutexLocker lock(&g_mutex);
    return dirLocked();
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_openPath.isEmpty() ? pathForDayLocked(today()) : g_openPath;
}

void setAuditDirOverride(const QString& absoluteDirPath)
{
    QMutexLocker lock(&g_mutex);

    const QString v = absoluteDirPath.trimmed().isEmpty()
                          ? QString()
                          : QDir::cleanPath(absoluteDirPath.trimmed());
    if (v == g_dirOverride)
        return;

    g_dirOverride = v;
    closeLocked();
}

qint64 eventCount()
{
    QMutexLocker lock(&g_mutex);
    return g_seq;
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_mutex);

    // Quiet failure: no file => event dropped.
    if (!g_enabled || !ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("seq", (double)++g_seq);
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("pid", (double)QCoreApplication::applicationPid());
    if (!g_sessionId.isEmpty())
        o.insert("session_id", g_sessionId);

    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    g_file->write(QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n");
    g_file->flush();
}

QJsonObject commandFields(const QString& command)
{
    const QString trimmed = command.trimmed();
    QJsonObject f;
    if (trimmed.isEmpty())
        return f;

    const QByteArray h = QCryptographicHash::hash(trimmed.toUtf8(), QCryptographicHash::Sha256).toHex();
    f.insert("cmd_hash", QString::fromLatin1(h.left(16)));
    f.insert("cmd_head", trimmed.section(' ', 0, 0).left(64));
    return f;
}

} // namespace AuditLogger
