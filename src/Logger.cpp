// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Process-wide state
// =====================================================

static QFile*     g_file = nullptr;
static QMutex     g_mutex;
static QString    g_path;
static QString    g_pathOverride;
static QAtomicInt g_level(1);
static qint64     g_rotateBytes = 2 * 1024 * 1024;
static int        g_rotateKeep = 3;
static QtMessageHandler g_previous = nullptr;
static bool       g_installed = false;

static thread_local bool g_inHandler = false;

static const char* levelName(QtMsgType t)
{
    switch (t) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0: WARN and up. 1: INFO and up. 2: everything.
static bool passesLevel(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtFatalMsg || type == QtCriticalMsg || type == QtWarningMsg)
        return true;
    if (type == QtInfoMsg)
        return lvl >= 1;
    return lvl >= 2;
}

// One record per physical line.
static QString oneLine(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', ' ');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

// =====================================================
// Rotation: log -> log.1 -> ... -> log.<keep>
// =====================================================
static void rotateIfNeeded(const QString& path)
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.size() < g_rotateBytes)
        return;

    const QString oldest = path + "." + QString::number(g_rotateKeep);
    if (QFileInfo::exists(oldest))
        QFile::remove(oldest);

    for (int i = g_rotateKeep - 1; i >= 1; --i) {
        const QString from = path + "." + QString::number(i);
        if (QFileInfo::exists(from))
            QFile::rename(from, path + "." + QString::number(i + 1));
    }
    if (g_rotateKeep >= 1)
        QFile::rename(path, path + ".1");
    else
        QFile::remove(path);
}

// Caller holds g_mutex.
static bool reopenLocked(const QString& path)
{
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    g_file = new QFile(path);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: cannot open %s\n", path.toUtf8().constData());
        std::fflush(stderr);
        delete g_file;
        g_file = nullptr;
        return false;
    }
    g_path = path;
    return true;
}

static void writeRecord(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = QString("%1 [%2] ").arg(ts, QString::fromLatin1(levelName(type)));
    if (ctx.file && ctx.function)
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    line += oneLine(Logger::redact(msg));

    QMutexLocker lock(&g_mutex);

    if (!g_file) {
        std::fprintf(stderr, "%s\n", line.toUtf8().constData());
        std::fflush(stderr);
        return;
    }

    if (g_file->size() >= g_rotateBytes)
        reopenLocked(g_path);
    if (!g_file) {
        std::fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    QTextStream out(g_file);
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    out.setEncoding(QStringConverter::Utf8);
#else
    out.setCodec("UTF-8");
#endif
    out << line << "\n";
    out.flush();
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (passesLevel(type) && !g_inHandler) {
        g_inHandler = true;
        writeRecord(type, ctx, msg);
        g_inHandler = false;
    }

    if (type == QtFatalMsg)
        std::abort();
}

// =====================================================
// Public API
// =====================================================
namespace Logger {

void install(const QString& appName)
{
    QString path;
    {
        QMutexLocker lock(&g_mutex);
        if (!g_pathOverride.isEmpty()) {
            path = g_pathOverride;
        } else {
            const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/logs";
            path = dir + "/" + appName + ".log";
        }
        reopenLocked(path);
    }

    QtMessageHandler prev = qInstallMessageHandler(handler);
    if (!g_installed) {
        g_previous = prev;
        g_installed = true;
    }
    qInfo().noquote() << QString("Logger initialized: %1 (level %2)").arg(logFilePath()).arg(logLevel());
}

void shutdown()
{
    if (g_installed) {
        qInstallMessageHandler(g_previous);
        g_previous = nullptr;
        g_installed = false;
    }

    QMutexLocker lock(&g_mutex);
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setRotation(qint64 maxBytes, int keep)
{
    QMutexLocker lock(&g_mutex);
    g_rotateBytes = qMax<qint64>(1024, maxBytes);
    g_rotateKeep = qBound(0, keep, 20);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);
    const QString p = absoluteFilePath.trimmed();
    g_pathOverride = p.isEmpty() ? QString() : QDir::cleanPath(p);

    // Cleared: keep writing where we are until the next install().
    if (g_pathOverride.isEmpty())
        return;

    if (g_installed)
        reopenLocked(g_pathOverride);
}

QString logDirPath()
{
    const QString p = logFilePath();
    return p.isEmpty() ? QString() : QFileInfo(p).absolutePath();
}

QString redact(const QString& text)
{
    static const QRegularExpression kv(
        QStringLiteral("\\b(password|passphrase|secret|token)(\\s*[=:]\\s*)(\\S+)"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression pem(
        QStringLiteral("-----BEGIN ([A-Z ]*)PRIVATE KEY-----.*?-----END \\1PRIVATE KEY-----"),
        QRegularExpression::DotMatchesEverythingOption);

    QString out = text;
    out.replace(kv, QStringLiteral("\\1\\2***"));
    out.replace(pem, QStringLiteral("[private key redacted]"));
    return out;
}

} // namespace Logger
