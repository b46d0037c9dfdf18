#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include <functional>
#include <memory>

#include "AuthMaterial.h"
#include "FileEntry.h"
#include "HostDescriptor.h"
#include "RemoteError.h"

// ------------------------------------------------------------
// Transport seam
//
// RemoteTransport is one authenticated SSH connection. SftpChannel is
// one SFTP subsystem on it; SftpFile is an open remote file handle.
// LibsshTransport implements these with libssh; tests use an in-memory
// fake. All calls are blocking and report failures through RemoteError.
// ------------------------------------------------------------

struct ExecResult
{
    QString stdoutText;
    QString stderrText;
    int     exitCode = -1;
};

class SftpFile
{
public:
    virtual ~SftpFile() = default;

    // Returns bytes read, 0 at EOF, -1 on error.
    virtual qint64 read(char* buf, qint64 maxLen, RemoteError* err = nullptr) = 0;

    // Returns bytes written, -1 on error.
    virtual qint64 write(const char* buf, qint64 len, RemoteError* err = nullptr) = 0;

    virtual bool close(RemoteError* err = nullptr) = 0;
};

class SftpChannel
{
public:
    virtual ~SftpChannel() = default;

    // Entries without "." and "..". Symlinks are reported as Symlink (lstat semantics).
    virtual bool listDirectory(const QString& path, FileEntryList* out, RemoteError* err = nullptr) = 0;

    // Follows symlinks.
    virtual bool stat(const QString& path, FileEntry* out, RemoteError* err = nullptr) = 0;
    virtual bool lstat(const QString& path, FileEntry* out, RemoteError* err = nullptr) = 0;

    virtual bool readLink(const QString& path, QString* target, RemoteError* err = nullptr) = 0;

    // OpenSSH "expand-path@openssh.com" extension (resolves "~").
    virtual bool expandPath(const QString& path, QString* expanded, RemoteError* err = nullptr) = 0;

    virtual bool makeDirectory(const QString& path, int mode, RemoteError* err = nullptr) = 0;
    virtual bool removeDirectory(const QString& path, RemoteError* err = nullptr) = 0;
    virtual bool removeFile(const QString& path, RemoteError* err = nullptr) = 0;
    virtual bool rename(const QString& from, const QString& to, RemoteError* err = nullptr) = 0;
    virtual bool chmod(const QString& path, int mode, RemoteError* err = nullptr) = 0;

    virtual std::unique_ptr<SftpFile> openRead(const QString& path, qint64 offset,
                                               RemoteError* err = nullptr) = 0;

    // Creates or truncates.
    virtual std::unique_ptr<SftpFile> openWrite(const QString& path, RemoteError* err = nullptr) = 0;
};

class RemoteTransport
{
public:
    // Invoked at most once when the connection drops unexpectedly.
    using ClosedHandler = std::function<void(RemoteTransport* transport, const QString& reason)>;

    virtual ~RemoteTransport() = default;

    virtual bool open(const HostDescriptor& host, const AuthMaterial& auth,
                      RemoteError* err = nullptr) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual void setClosedHandler(ClosedHandler handler) = 0;

    virtual std::shared_ptr<SftpChannel> openSftp(RemoteError* err = nullptr) = 0;

    // Non-zero exit code is not an error at this level; it is in `out`.
    virtual bool exec(const QString& command, ExecResult* out, int timeoutMs,
                      RemoteError* err = nullptr) = 0;

    virtual bool sendKeepAlive(RemoteError* err = nullptr) = 0;
};

using TransportFactory = std::function<std::shared_ptr<RemoteTransport>()>;
