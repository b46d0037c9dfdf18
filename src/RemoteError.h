#pragma once

#include <QString>
#include <memory>

// RemoteError
// -----------
// Value type describing why a remote operation failed.
// Operations return bool and fill an optional RemoteError* (never thrown).
//
// A RetryExhausted error keeps the last transient failure as its cause.
class RemoteError
{
public:
    enum class Kind {
        None,
        Connection,
        Authentication,
        Timeout,
        Permission,
        NotFound,
        ChecksumMismatch,
        RetryExhausted,
        Cancelled,
        RemoteFailure,   // command exit code, protocol status we don't map
        LocalIo,
        InvalidArgument
    };

    enum class TimeoutPhase {
        None,
        Init,
        Operation,
        PathExpand
    };

    RemoteError() = default;
    RemoteError(Kind kind, const QString& message, const QString& hint = QString());

    static RemoteError timeout(TimeoutPhase phase, const QString& operation, int timeoutMs);
    static RemoteError retryExhausted(int attempts, const RemoteError& last);

    Kind kind() const { return m_kind; }
    TimeoutPhase phase() const { return m_phase; }
    QString message() const { return m_message; }
    QString hint() const { return m_hint; }
    const RemoteError* cause() const { return m_cause.get(); }

    bool isError() const { return m_kind != Kind::None; }

    // Reset, timeout and "connection lost" style failures. Retried with backoff.
    bool isTransient() const;

    // Message plus hint, and the cause chain when present.
    QString toString() const;

    void clear();

    static QString kindName(Kind kind);
    static QString phaseName(TimeoutPhase phase);

    // Pattern match on raw error text from the transport or a remote command.
    static bool looksTransient(const QString& text);

private:
    Kind         m_kind  = Kind::None;
    TimeoutPhase m_phase = TimeoutPhase::None;
    QString      m_message;
    QString      m_hint;
    std::shared_ptr<const RemoteError> m_cause;
};

// Convenience for the `if (err) *err = ...` pattern used everywhere.
inline bool setError(RemoteError* err, const RemoteError& value)
{
    if (err) *err = value;
    return false;
}
