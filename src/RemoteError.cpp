// RemoteError.cpp
#include "RemoteError.h"

#include <QStringList>

static const char* const kTransientPatterns[] = {
    "ECONNRESET",
    "ETIMEDOUT",
    "ENOTFOUND",
    "EAI_AGAIN",
    "EPIPE",
    "ECONNREFUSED",
    "Connection lost",
    "Connection closed",
    "Connection reset",
    "Connection refused",
    "socket hang up",
    "Socket error",
    "network error",
    "Broken pipe",
    "timeout",
    "timed out",
};

RemoteError::RemoteError(Kind kind, const QString& message, const QString& hint)
    : m_kind(kind),
      m_message(message),
      m_hint(hint)
{
}

RemoteError RemoteError::timeout(TimeoutPhase phase, const QString& operation, int timeoutMs)
{
    QString hint;
    switch (phase) {
        case TimeoutPhase::Init:
            hint = QStringLiteral("The SFTP subsystem did not start. Check that sftp-server is enabled on the host.");
            break;
        case TimeoutPhase::PathExpand:
            hint = QStringLiteral("The server did not answer the path expansion request. Use an absolute path.");
            break;
        case TimeoutPhase::Operation:
        case TimeoutPhase::None:
            hint = QStringLiteral("The host or network may be slow. Retry, or raise the operation timeout.");
            break;
    }

    RemoteError e(Kind::Timeout,
                  QString("%1 timed out after %2 ms").arg(operation).arg(timeoutMs),
                  hint);
    e.m_phase = phase;
    return e;
}

RemoteError RemoteError::retryExhausted(int attempts, const RemoteError& last)
{
    RemoteError e(Kind::RetryExhausted,
                  QString("Operation failed after %1 attempts: %2").arg(attempts).arg(last.message()),
                  last.hint());
    e.m_cause = std::make_shared<RemoteError>(last);
    return e;
}

bool RemoteError::isTransient() const
{
    switch (m_kind) {
        case Kind::Connection:
        case Kind::Timeout:
            return true;
        case Kind::RemoteFailure:
            return looksTransient(m_message);
        default:
            return false;
    }
}

QString RemoteError::toString() const
{
    if (m_kind == Kind::None)
        return QString();

    QString s = QString("%1: %2").arg(kindName(m_kind), m_message);
    if (m_kind == Kind::Timeout)
        s += QString(" [phase=%1]").arg(phaseName(m_phase));
    if (!m_hint.isEmpty())
        s += QString(" (hint: %1)").arg(m_hint);
    if (m_cause && m_kind != Kind::RetryExhausted)
        s += QString(" <- %1").arg(m_cause->toString());
    return s;
}

void RemoteError::clear()
{
    m_kind = Kind::None;
    m_phase = TimeoutPhase::None;
    m_message.clear();
    m_hint.clear();
    m_cause.reset();
}

QString RemoteError::kindName(Kind kind)
{
    switch (kind) {
        case Kind::None:             return "None";
        case Kind::Connection:       return "ConnectionError";
        case Kind::Authentication:   return "AuthenticationError";
        case Kind::Timeout:          return "TimeoutError";
        case Kind::Permission:       return "PermissionError";
        case Kind::NotFound:         return "NotFoundError";
        case Kind::ChecksumMismatch: return "ChecksumMismatchError";
        case Kind::RetryExhausted:   return "RetryExhaustedError";
        case Kind::Cancelled:        return "CancelledError";
        case Kind::RemoteFailure:    return "RemoteFailure";
        case Kind::LocalIo:          return "LocalIoError";
        case Kind::InvalidArgument:  return "InvalidArgument";
    }
    return "Error";
}

QString RemoteError::phaseName(TimeoutPhase phase)
{
    switch (phase) {
        case TimeoutPhase::None:       return "none";
        case TimeoutPhase::Init:       return "init";
        case TimeoutPhase::Operation:  return "operation";
        case TimeoutPhase::PathExpand: return "pathExpand";
    }
    return "none";
}

bool RemoteError::looksTransient(const QString& text)
{
    if (text.trimmed().isEmpty())
        return false;

    for (const char* p : kTransientPatterns) {
        if (text.contains(QLatin1String(p), Qt::CaseInsensitive))
            return true;
    }
    return false;
}
