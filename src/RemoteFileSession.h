// RemoteFileSession.h
//
// Resilient file operations for one host over a pooled connection.
//   - Listing cache (shared DirectoryCache, TTL + LRU)
//   - Per-call timeouts and exponential-backoff retry of transient failures
//   - Periodic health probe; an unhealthy session reconnects on next use
//   - Resumable downloads through "<local>.part"
//   - Command-exec fast paths (cp, mv, checksums) with SFTP fallbacks
//
// All operations block the calling thread; call them from worker threads.

#pragma once

#include <QMutex>
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <QTimer>

#include <atomic>
#include <functional>
#include <memory>

#include "ConnectionHealth.h"
#include "ConnectionPool.h"
#include "CredentialResolver.h"
#include "DirectoryCache.h"
#include "FileEntry.h"
#include "HostDescriptor.h"
#include "RemoteError.h"
#include "RemoteSettings.h"
#include "RemoteTransport.h"
#include "TransferProgress.h"

class RemoteFileSession : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Uninitialized,
        Connecting,
        Ready,
        Unhealthy,
        Reconnecting,
        Closed
    };

    enum class ChecksumAlgorithm {
        Md5,
        Sha1,
        Sha256
    };

    // (files counted, bytes so far)
    using SizeProgressFn = std::function<void(int files, qint64 bytes)>;

    RemoteFileSession(const HostDescriptor& host,
                      ConnectionPool* pool,
                      std::shared_ptr<CredentialResolver> resolver,
                      std::shared_ptr<DirectoryCache> cache,
                      const RemoteSettings& settings = RemoteSettings(),
                      QObject* parent = nullptr);
    ~RemoteFileSession() override;

    const HostDescriptor& host() const { return m_host; }
    QString hostId() const { return m_host.id; }

    State state() const;
    ConnectionHealth health() const;
    static QString stateName(State s);

    // Connects (pool acquire + SFTP init) if needed. Other calls do this implicitly.
    bool open(RemoteError* err = nullptr);

    // Releases this session's pool reference. Further calls fail.
    void close();

    // ------------------------------------------------------------
    // Browsing
    // ------------------------------------------------------------
    bool list(const QString& path, FileEntryList* out, bool useCache = true, RemoteError* err = nullptr);
    bool stat(const QString& path, FileEntry* out, RemoteError* err = nullptr);
    bool exists(const QString& path, bool* out, RemoteError* err = nullptr);

    // "~" and "~/x" via the server; falls back when the server cannot expand.
    QString expandPath(const QString& path);

    void clearCache(const QString& path = QString());

    // ------------------------------------------------------------
    // Transfers
    // ------------------------------------------------------------

    // Resumes from "<local>.part" when it is smaller than the remote file.
    // The .part file survives failure and cancellation.
    bool get(const QString& remotePath, const QString& localPath,
             ProgressFn progress = nullptr, CancelFlag cancel = nullptr,
             RemoteError* err = nullptr);

    // Not resumable; written to "<remote>.part" then renamed.
    bool put(const QString& localPath, const QString& remotePath,
             ProgressFn progress = nullptr, CancelFlag cancel = nullptr,
             RemoteError* err = nullptr);

    bool getDirectory(const QString& remoteDir, const QString& localDir,
                      ItemProgressFn progress = nullptr, CancelFlag cancel = nullptr,
                      RemoteError* err = nullptr);
    bool putDirectory(const QString& localDir, const QString& remoteDir,
                      ItemProgressFn progress = nullptr, CancelFlag cancel = nullptr,
                      RemoteError* err = nullptr);

    // Deletes "<local>.part" so the next get() starts from zero.
    static bool restartDownload(const QString& localPath);
    static QString partialPath(const QString& localPath);

    // ------------------------------------------------------------
    // Mutations (invalidate affected cache entries)
    // ------------------------------------------------------------
    bool remove(const QString& path, bool recursive = false, RemoteError* err = nullptr);
    bool mkdir(const QString& path, int mode = 0755, RemoteError* err = nullptr);
    bool rename(const QString& from, const QString& to, RemoteError* err = nullptr);
    bool chmod(const QString& path, int mode, RemoteError* err = nullptr);
    bool chmodRecursive(const QString& root, int mode, ItemProgressFn progress = nullptr,
                        RemoteError* err = nullptr);
    bool chown(const QString& path, const QString& owner, const QString& group = QString(),
               bool recursive = false, RemoteError* err = nullptr);
    bool copy(const QString& src, const QString& dst, RemoteError* err = nullptr);
    bool move(const QString& src, const QString& dst, RemoteError* err = nullptr);
    bool createSymlink(const QString& target, const QString& linkPath, RemoteError* err = nullptr);
    bool resolveSymlink(const QString& path, QString* out, RemoteError* err = nullptr);

    // ------------------------------------------------------------
    // Queries and commands
    // ------------------------------------------------------------

    // maxDepth < 0 => unlimited. Progress every 10 files.
    bool calculateDirectorySize(const QString& root, qint64* outBytes, int maxDepth = -1,
                                SizeProgressFn progress = nullptr, RemoteError* err = nullptr);

    bool checksum(const QString& path, ChecksumAlgorithm algorithm, QString* outHex,
                  RemoteError* err = nullptr);

    // Raw exec: non-zero exit codes are returned in `out`, not as errors.
    bool exec(const QString& command, ExecResult* out, int timeoutMs = -1, RemoteError* err = nullptr);

    // Exec that fails on non-zero exit ("Command failed with code N: <stderr>").
    bool executeCommand(const QString& command, QString* stdoutText = nullptr, RemoteError* err = nullptr);

public slots:
    void startHealthMonitoring();
    void stopHealthMonitoring();

    // One probe: stat(".") with the probe timeout. Runs on the calling thread.
    void runHealthProbe();

signals:
    void stateChanged();
    void healthChanged();

private:
    struct Handles {
        std::shared_ptr<RemoteTransport> transport;
        std::shared_ptr<SftpChannel> sftp;
    };

    template <typename T>
    using Body = std::function<bool(Handles, T*, RemoteError*)>;

    bool ensureReady(Handles* out, RemoteError* err);
    void setState(State s);

    // Releases our pool reference; the next call reconnects.
    void dropConnection(const QString& reason);

    // Outer retry: transient failures drop the connection and back off.
    bool withRetry(const QString& what, const std::function<bool(RemoteError*)>& attempt,
                   RemoteError* err, CancelFlag cancel = nullptr);

    // ensureReady + one body call bounded by timeoutMs (<= 0 => operation timeout).
    template <typename T>
    bool attemptOnce(const QString& what, Body<T> body, T* out, RemoteError* err, int timeoutMs = -1,
                     RemoteError::TimeoutPhase phase = RemoteError::TimeoutPhase::Operation);

    // withRetry(attemptOnce(...))
    template <typename T>
    bool runOp(const QString& what, Body<T> body, T* out, RemoteError* err, int timeoutMs = -1);

    bool downloadAttempt(const QString& remotePath, const QString& localPath,
                         const ProgressFn& progress, const CancelFlag& cancel, RemoteError* err);
    bool uploadAttempt(const QString& localPath, const QString& remotePath,
                       const ProgressFn& progress, const CancelFlag& cancel, RemoteError* err);
    bool copyBySftp(const QString& src, const QString& dst, RemoteError* err);
    bool streamRemoteFile(const QString& src, const QString& dst, RemoteError* err);
    bool streamRemoteFileAttempt(const QString& src, const QString& dst, RemoteError* err);
    bool ensureRemoteDir(const QString& path, RemoteError* err);
    bool listRaw(const QString& path, FileEntryList* out, RemoteError* err);
    bool closeRemoteFile(const std::shared_ptr<SftpFile>& file, RemoteError* err);
    void removeStalePart(const QString& tmp);
    bool verifyDownload(const QString& remotePath, const QString& partPath, qint64 expectedSize,
                        RemoteError* err);

    void noteTransferStall(qint64 stalledMs);
    void noteHealthFailure(const QString& error);
    void invalidateParent(const QString& path);

    HostDescriptor m_host;
    ConnectionPool* m_pool = nullptr;
    std::shared_ptr<CredentialResolver> m_resolver;
    std::shared_ptr<DirectoryCache> m_cache;
    RemoteSettings m_settings;

    mutable QMutex m_mutex;           // state, handles, health, home
    QMutex m_connectMutex;            // one connect at a time
    State m_state = State::Uninitialized;
    Handles m_handles;
    bool m_reconnectRequested = false;
    ConnectionHealth m_health;
    QString m_home;                   // cached "~" expansion

    QTimer* m_healthTimer = nullptr;
    std::atomic_bool m_probeRunning{false};

    // Declared last: destroyed first, waits for in-flight calls that use `this`.
    QThreadPool m_io;
};
