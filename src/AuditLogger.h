#pragma once

#include <QString>
#include <QJsonObject>

// Append-only JSONL audit trail for connection and transfer events.
// One file per local day: <dir>/audit-YYYY-MM-DD.jsonl
namespace AuditLogger {
    void install(const QString& appName);

    void setSessionId(const QString& sessionId);
    QString sessionId();

    // Disabled => writeEvent() is a no-op (default: enabled).
    void setEnabled(bool enabled);
    bool isEnabled();

    QString auditDir();
    QString currentLogFilePath();
    void setAuditDirOverride(const QString& absoluteDirPath); // empty => default

    // Number of events written since install (process-wide).
    qint64 eventCount();

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());

    // Short non-reversible id for a command line (hash + first token).
    QJsonObject commandFields(const QString& command);
}
