// LibsshTransport.cpp
#include "LibsshTransport.h"

#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <libssh/callbacks.h>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <atomic>
#include <functional>

// ------------------------------------------------------------
// Shared connection state. Outlives the transport while SFTP
// channels or open files still reference it; ssh_free runs last.
// ------------------------------------------------------------
struct LibsshConnection
{
    QMutex mutex;                  // serializes every libssh call on `session`
    ssh_session session = nullptr; // set once by open(), freed by the destructor
    std::atomic_bool open{false};  // readable without `mutex`

    std::function<void(const QString&)> lostHook;
    std::atomic_bool lostReported{false};

    ~LibsshConnection()
    {
        if (session) {
            if (ssh_is_connected(session))
                ssh_disconnect(session);
            ssh_free(session);
            session = nullptr;
        }
    }

    // Must be called WITHOUT `mutex` held.
    void reportLost(const QString& reason)
    {
        if (lostReported.exchange(true))
            return;
        open = false;
        if (lostHook)
            lostHook(reason);
    }
};

// ------------------------------------------------------------
// Small helper to turn libssh's last error into QString
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

// Caller holds conn->mutex.
static bool sessionAlive(const LibsshConnection& c)
{
    return c.open.load() && c.session && ssh_is_connected(c.session);
}

// Caller holds conn->mutex. Maps SFTP status codes to error kinds.
static RemoteError sftpFailure(const LibsshConnection& c,
                               sftp_session sftp,
                               const QString& what,
                               const QString& path)
{
    if (!sessionAlive(c))
        return RemoteError(RemoteError::Kind::Connection,
                           QString("%1 '%2': Connection lost").arg(what, path));

    const int code = sftp ? sftp_get_error(sftp) : -1;
    const QString detail = libsshError(c.session);

    switch (code) {
        case SSH_FX_NO_SUCH_FILE:
        case SSH_FX_NO_SUCH_PATH:
            return RemoteError(RemoteError::Kind::NotFound,
                               QString("%1 '%2': No such file or directory").arg(what, path));
        case SSH_FX_PERMISSION_DENIED:
            return RemoteError(RemoteError::Kind::Permission,
                               QString("%1 '%2': Permission denied").arg(what, path),
                               QStringLiteral("Check ownership and mode of the path on the host."));
        case SSH_FX_NO_CONNECTION:
        case SSH_FX_CONNECTION_LOST:
            return RemoteError(RemoteError::Kind::Connection,
                               QString("%1 '%2': Connection lost").arg(what, path));
        case SSH_FX_FILE_ALREADY_EXISTS:
            return RemoteError(RemoteError::Kind::RemoteFailure,
                               QString("%1 '%2': File already exists").arg(what, path));
        default:
            break;
    }

    return RemoteError(RemoteError::Kind::RemoteFailure,
                       QString("%1 '%2' failed (sftp status %3): %4")
                           .arg(what, path).arg(code).arg(detail));
}

static QString ownerFromLongname(const char* longname, int field)
{
    // "drwxr-xr-x 2 user group 4096 Jan 1 12:00 name"
    if (!longname) return QString();
    const QStringList parts = QString::fromUtf8(longname).split(' ', Qt::SkipEmptyParts);
    return (parts.size() > field) ? parts.at(field) : QString();
}

static FileEntry entryFromAttributes(sftp_attributes a, const QString& name, const QString& path)
{
    FileEntry e;
    e.name = name;
    e.path = path;
    e.mode = (quint32)a->permissions;
    e.type = fileTypeFromMode(e.mode);
    if (a->type == SSH_FILEXFER_TYPE_SYMLINK)
        e.type = FileEntry::Type::Symlink;
    else if (a->type == SSH_FILEXFER_TYPE_DIRECTORY)
        e.type = FileEntry::Type::Directory;
    e.size = (qint64)a->size;
    e.permissions = permissionString(e.mode);
    e.modified = QDateTime::fromSecsSinceEpoch((qint64)a->mtime);

    e.owner = a->owner ? QString::fromUtf8(a->owner) : ownerFromLongname(a->longname, 2);
    e.group = a->group ? QString::fromUtf8(a->group) : ownerFromLongname(a->longname, 3);
    if (e.owner.isEmpty()) e.owner = QString::number(a->uid);
    if (e.group.isEmpty()) e.group = QString::number(a->gid);
    return e;
}

static QString joinRemote(const QString& dir, const QString& name)
{
    return dir.endsWith('/') ? (dir + name) : (dir + "/" + name);
}

// ------------------------------------------------------------
// SFTP subsystem handle (sftp_free before the session goes away)
// ------------------------------------------------------------
struct LibsshSftpHandle
{
    std::shared_ptr<LibsshConnection> conn;
    sftp_session sftp = nullptr;

    ~LibsshSftpHandle()
    {
        if (sftp) {
            QMutexLocker lock(&conn->mutex);
            sftp_free(sftp);
            sftp = nullptr;
        }
    }
};

// ------------------------------------------------------------
// Open remote file
// ------------------------------------------------------------
class LibsshSftpFile : public SftpFile
{
public:
    LibsshSftpFile(std::shared_ptr<LibsshSftpHandle> h, sftp_file f, const QString& path)
        : m_h(std::move(h)), m_file(f), m_path(path) {}

    ~LibsshSftpFile() override
    {
        RemoteError ignored;
        if (m_file && !close(&ignored))
            qWarning().noquote() << QString("[SFTP] close on destroy failed: %1").arg(ignored.message());
    }

    qint64 read(char* buf, qint64 maxLen, RemoteError* err) override
    {
        if (err) err->clear();
        RemoteError e;
        qint64 n = -1;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!m_file || !sessionAlive(*m_h->conn)) {
                e = RemoteError(RemoteError::Kind::Connection,
                                QString("Read '%1': Connection lost").arg(m_path));
            } else {
                n = (qint64)sftp_read(m_file, buf, (size_t)maxLen);
                if (n < 0)
                    e = sftpFailure(*m_h->conn, m_h->sftp, "Read", m_path);
            }
        }
        return finish(n, e, err);
    }

    qint64 write(const char* buf, qint64 len, RemoteError* err) override
    {
        if (err) err->clear();
        RemoteError e;
        qint64 n = -1;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!m_file || !sessionAlive(*m_h->conn)) {
                e = RemoteError(RemoteError::Kind::Connection,
                                QString("Write '%1': Connection lost").arg(m_path));
            } else {
                n = (qint64)sftp_write(m_file, buf, (size_t)len);
                if (n < 0)
                    e = sftpFailure(*m_h->conn, m_h->sftp, "Write", m_path);
            }
        }
        return finish(n, e, err);
    }

    bool close(RemoteError* err) override
    {
        if (err) err->clear();
        if (!m_file) return true;

        QMutexLocker lock(&m_h->conn->mutex);
        const int rc = sftp_close(m_file);
        m_file = nullptr;
        if (rc != SSH_NO_ERROR && sessionAlive(*m_h->conn)) {
            if (err) *err = sftpFailure(*m_h->conn, m_h->sftp, "Close", m_path);
            return false;
        }
        return true;
    }

private:
    qint64 finish(qint64 n, const RemoteError& e, RemoteError* err)
    {
        if (!e.isError()) return n;
        if (err) *err = e;
        if (e.kind() == RemoteError::Kind::Connection)
            m_h->conn->reportLost(e.message());
        return -1;
    }

    std::shared_ptr<LibsshSftpHandle> m_h;
    sftp_file m_file = nullptr;
    QString m_path;
};

// ------------------------------------------------------------
// SFTP channel
// ------------------------------------------------------------
class LibsshSftpChannel : public SftpChannel
{
public:
    explicit LibsshSftpChannel(std::shared_ptr<LibsshSftpHandle> h) : m_h(std::move(h)) {}

    bool listDirectory(const QString& path, FileEntryList* out, RemoteError* err) override
    {
        if (err) err->clear();
        if (out) out->clear();

        FileEntryList items;
        RemoteError e;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, "List", path)) return fail(e, err);

            sftp_dir dir = sftp_opendir(m_h->sftp, path.toUtf8().constData());
            if (!dir) {
                e = sftpFailure(*m_h->conn, m_h->sftp, "List", path);
            } else {
                while (sftp_attributes a = sftp_readdir(m_h->sftp, dir)) {
                    const QString name = QString::fromUtf8(a->name ? a->name : "");
                    if (name != "." && name != "..")
                        items.push_back(entryFromAttributes(a, name, joinRemote(path, name)));
                    sftp_attributes_free(a);
                }
                if (!sftp_dir_eof(dir))
                    e = sftpFailure(*m_h->conn, m_h->sftp, "List", path);
                sftp_closedir(dir);
            }
        }
        if (e.isError()) return fail(e, err);

        if (out) *out = items;
        return true;
    }

    bool stat(const QString& path, FileEntry* out, RemoteError* err) override
    {
        return statImpl(path, out, /*follow*/ true, err);
    }

    bool lstat(const QString& path, FileEntry* out, RemoteError* err) override
    {
        return statImpl(path, out, /*follow*/ false, err);
    }

    bool readLink(const QString& path, QString* target, RemoteError* err) override
    {
        if (err) err->clear();
        RemoteError e;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, "Readlink", path)) return fail(e, err);

            char* t = sftp_readlink(m_h->sftp, path.toUtf8().constData());
            if (!t) {
                e = sftpFailure(*m_h->conn, m_h->sftp, "Readlink", path);
            } else {
                if (target) *target = QString::fromUtf8(t);
                ssh_string_free_char(t);
            }
        }
        return e.isError() ? fail(e, err) : true;
    }

    bool expandPath(const QString& path, QString* expanded, RemoteError* err) override
    {
        if (err) err->clear();
#if LIBSSH_VERSION_INT >= SSH_VERSION_INT(0, 11, 0)
        RemoteError e;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, "Expand path", path)) return fail(e, err);

            if (!sftp_extension_supported(m_h->sftp, "expand-path@openssh.com", "1")) {
                e = RemoteError(RemoteError::Kind::RemoteFailure,
                                QStringLiteral("Server does not support expand-path@openssh.com"));
            } else {
                char* p = sftp_expand_path(m_h->sftp, path.toUtf8().constData());
                if (!p) {
                    e = sftpFailure(*m_h->conn, m_h->sftp, "Expand path", path);
                } else {
                    if (expanded) *expanded = QString::fromUtf8(p);
                    ssh_string_free_char(p);
                }
            }
        }
        return e.isError() ? fail(e, err) : true;
#else
        Q_UNUSED(path);
        Q_UNUSED(expanded);
        return setError(err, RemoteError(RemoteError::Kind::RemoteFailure,
                                         QStringLiteral("expand-path requires libssh 0.11 or newer")));
#endif
    }

    bool makeDirectory(const QString& path, int mode, RemoteError* err) override
    {
        return simpleCall("Mkdir", path, err, [&](sftp_session s) {
            return sftp_mkdir(s, path.toUtf8().constData(), (mode_t)mode);
        });
    }

    bool removeDirectory(const QString& path, RemoteError* err) override
    {
        return simpleCall("Rmdir", path, err, [&](sftp_session s) {
            return sftp_rmdir(s, path.toUtf8().constData());
        });
    }

    bool removeFile(const QString& path, RemoteError* err) override
    {
        return simpleCall("Unlink", path, err, [&](sftp_session s) {
            return sftp_unlink(s, path.toUtf8().constData());
        });
    }

    bool rename(const QString& from, const QString& to, RemoteError* err) override
    {
        return simpleCall("Rename", from, err, [&](sftp_session s) {
            return sftp_rename(s, from.toUtf8().constData(), to.toUtf8().constData());
        });
    }

    bool chmod(const QString& path, int mode, RemoteError* err) override
    {
        return simpleCall("Chmod", path, err, [&](sftp_session s) {
            return sftp_chmod(s, path.toUtf8().constData(), (mode_t)mode);
        });
    }

    std::unique_ptr<SftpFile> openRead(const QString& path, qint64 offset, RemoteError* err) override
    {
        if (err) err->clear();
        RemoteError e;
        sftp_file f = nullptr;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, "Open", path)) { fail(e, err); return nullptr; }

            f = sftp_open(m_h->sftp, path.toUtf8().constData(), O_RDONLY, 0);
            if (!f) {
                e = sftpFailure(*m_h->conn, m_h->sftp, "Open", path);
            } else if (offset > 0 && sftp_seek64(f, (uint64_t)offset) != 0) {
                e = sftpFailure(*m_h->conn, m_h->sftp, "Seek", path);
                sftp_close(f);
                f = nullptr;
            }
        }
        if (e.isError()) { fail(e, err); return nullptr; }
        return std::make_unique<LibsshSftpFile>(m_h, f, path);
    }

    std::unique_ptr<SftpFile> openWrite(const QString& path, RemoteError* err) override
    {
        if (err) err->clear();
        RemoteError e;
        sftp_file f = nullptr;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, "Create", path)) { fail(e, err); return nullptr; }

            f = sftp_open(m_h->sftp, path.toUtf8().constData(),
                          O_WRONLY | O_CREAT | O_TRUNC,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
            if (!f)
                e = sftpFailure(*m_h->conn, m_h->sftp, "Create", path);
        }
        if (e.isError()) { fail(e, err); return nullptr; }
        return std::make_unique<LibsshSftpFile>(m_h, f, path);
    }

private:
    // Caller holds conn->mutex.
    bool alive(RemoteError* e, const QString& what, const QString& path)
    {
        if (sessionAlive(*m_h->conn)) return true;
        *e = RemoteError(RemoteError::Kind::Connection,
                         QString("%1 '%2': Connection lost").arg(what, path));
        return false;
    }

    // Must be called WITHOUT conn->mutex held (may notify the pool).
    bool fail(const RemoteError& e, RemoteError* err)
    {
        if (err) *err = e;
        if (e.kind() == RemoteError::Kind::Connection)
            m_h->conn->reportLost(e.message());
        return false;
    }

    template <typename Fn>
    bool simpleCall(const QString& what, const QString& path, RemoteError* err, Fn fn)
    {
        if (err) err->clear();
        RemoteError e;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (!alive(&e, what, path)) {
                // fall through to fail() below, outside the lock
            } else if (fn(m_h->sftp) != SSH_OK) {
                e = sftpFailure(*m_h->conn, m_h->sftp, what, path);
            }
        }
        return e.isError() ? fail(e, err) : true;
    }

    bool statImpl(const QString& path, FileEntry* out, bool follow, RemoteError* err)
    {
        if (err) err->clear();
        RemoteError e;
        FileEntry entry;
        {
            QMutexLocker lock(&m_h->conn->mutex);
            if (alive(&e, "Stat", path)) {
                sftp_attributes a = follow
                                        ? sftp_stat(m_h->sftp, path.toUtf8().constData())
                                        : sftp_lstat(m_h->sftp, path.toUtf8().constData());
                if (!a) {
                    e = sftpFailure(*m_h->conn, m_h->sftp, "Stat", path);
                } else {
                    const int slash = path.lastIndexOf('/');
                    const QString name = (slash < 0) ? path : path.mid(slash + 1);
                    entry = entryFromAttributes(a, name.isEmpty() ? path : name, path);
                    sftp_attributes_free(a);
                }
            }
        }
        if (e.isError()) return fail(e, err);

        if (out) *out = entry;
        return true;
    }

    std::shared_ptr<LibsshSftpHandle> m_h;
};

// ------------------------------------------------------------
// LibsshTransport
// ------------------------------------------------------------

LibsshTransport::LibsshTransport()
    : m_conn(std::make_shared<LibsshConnection>())
{
}

LibsshTransport::~LibsshTransport()
{
    close();
}

std::shared_ptr<RemoteTransport> LibsshTransport::create()
{
    return std::make_shared<LibsshTransport>();
}

bool LibsshTransport::open(const HostDescriptor& host, const AuthMaterial& auth, RemoteError* err)
{
    if (err) err->clear();

    const QString address = host.address.trimmed();
    const QString user = host.username.trimmed();
    const int port = (host.port > 0) ? host.port : 22;
    m_target = host.displayTarget();

    if (address.isEmpty() || user.isEmpty()) {
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                         QStringLiteral("Host address and username are required.")));
    }

    qInfo().noquote() << QString("[SSH] connect start target='%1' auth=%2")
                         .arg(m_target, auth.describe());

    ssh_session s = ssh_new();
    if (!s) {
        return setError(err, RemoteError(RemoteError::Kind::Connection,
                                         QStringLiteral("ssh_new() failed.")));
    }

    auto failAndFree = [&](RemoteError::Kind kind, const QString& msg, const QString& hint = QString()) -> bool {
        qWarning().noquote() << QString("[SSH] connect FAILED target='%1': %2").arg(m_target, msg);
        if (ssh_is_connected(s))
            ssh_disconnect(s);
        ssh_free(s);
        return setError(err, RemoteError(kind, msg, hint));
    };

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) {
        if (ssh_options_set(s, opt, val) != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
        }
    };

    optSet(SSH_OPTIONS_HOST, address.toUtf8().constData(), "HOST");
    optSet(SSH_OPTIONS_USER, user.toUtf8().constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");

    long timeoutSec = m_connectTimeoutSec;
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    if (auth.hasAgent()) {
#if LIBSSH_VERSION_INT >= SSH_VERSION_INT(0, 10, 0)
        optSet(SSH_OPTIONS_IDENTITY_AGENT, QFile::encodeName(auth.agentSocket).constData(), "IDENTITY_AGENT");
#else
        qputenv("SSH_AUTH_SOCK", QFile::encodeName(auth.agentSocket));
#endif
    }

    int rc = ssh_connect(s);
    if (rc != SSH_OK)
        return failAndFree(RemoteError::Kind::Connection,
                           QString("ssh_connect failed: %1").arg(libsshError(s)),
                           QStringLiteral("Check the address, port and that sshd is reachable."));

    // Host key: accepted; the trust decision is made by the caller's UI layer.
    ssh_key serverKey = nullptr;
    if (ssh_get_server_publickey(s, &serverKey) == SSH_OK && serverKey) {
        unsigned char* hash = nullptr;
        size_t hlen = 0;
        if (ssh_get_publickey_hash(serverKey, SSH_PUBLICKEY_HASH_SHA256, &hash, &hlen) == 0) {
            char* fp = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hlen);
            if (fp) {
                m_fingerprint = QString::fromLatin1(fp);
                ssh_string_free_char(fp);
            }
            ssh_clean_pubkey_hash(&hash);
        }
        ssh_key_free(serverKey);
    }
    qInfo().noquote() << QString("[SSH] host key target='%1' fingerprint=%2")
                         .arg(m_target, m_fingerprint.isEmpty() ? "?" : m_fingerprint);

    // Authentication strategy: agent, then key, then password (+ keyboard-interactive).
    rc = SSH_AUTH_DENIED;

    if (auth.hasAgent()) {
        rc = ssh_userauth_agent(s, nullptr);
        if (rc == SSH_AUTH_SUCCESS)
            qInfo().noquote() << QString("[SSH] auth OK via agent target='%1'").arg(m_target);
    }

    if (rc != SSH_AUTH_SUCCESS && auth.hasPrivateKey()) {
        ssh_key pkey = nullptr;
        const char* pass = auth.passphrase.isEmpty() ? nullptr : auth.passphrase.constData();
        if (ssh_pki_import_privkey_base64(auth.privateKey.constData(), pass,
                                          nullptr, nullptr, &pkey) != SSH_OK) {
            return failAndFree(RemoteError::Kind::Authentication,
                               QStringLiteral("Could not parse private key (wrong passphrase or unsupported format)."),
                               QStringLiteral("Check the key file and its passphrase."));
        }
        rc = ssh_userauth_publickey(s, nullptr, pkey);
        ssh_key_free(pkey);
        if (rc == SSH_AUTH_SUCCESS)
            qInfo().noquote() << QString("[SSH] auth OK via publickey target='%1'").arg(m_target);
    }

    if (rc != SSH_AUTH_SUCCESS && auth.hasPassword()) {
        rc = ssh_userauth_password(s, nullptr, auth.password.constData());

        if (rc != SSH_AUTH_SUCCESS && auth.tryKeyboardInteractive) {
            // Answer every prompt with the password (typical PAM setup).
            rc = ssh_userauth_kbdint(s, nullptr, nullptr);
            while (rc == SSH_AUTH_INFO) {
                const int prompts = ssh_userauth_kbdint_getnprompts(s);
                for (int i = 0; i < prompts; ++i)
                    ssh_userauth_kbdint_setanswer(s, (unsigned int)i, auth.password.constData());
                rc = ssh_userauth_kbdint(s, nullptr, nullptr);
            }
        }
        if (rc == SSH_AUTH_SUCCESS)
            qInfo().noquote() << QString("[SSH] auth OK via password target='%1'").arg(m_target);
    }

    if (rc != SSH_AUTH_SUCCESS) {
        return failAndFree(RemoteError::Kind::Authentication,
                           QString("Authentication failed for %1: %2").arg(m_target, libsshError(s)),
                           QStringLiteral("Verify the username and credentials configured for this host."));
    }

    {
        QMutexLocker lock(&m_conn->mutex);
        m_conn->session = s;
        m_conn->open = true;
    }

    std::weak_ptr<LibsshTransport> weak = weak_from_this();
    m_conn->lostHook = [weak](const QString& reason) {
        if (auto self = weak.lock())
            self->connectionLost(reason);
    };

    qInfo().noquote() << QString("[SSH] connect OK target='%1'").arg(m_target);
    return true;
}

// Never waits for a call in flight: a worker stuck in sftp_read() or
// sftp_init() holds the mutex until libssh gives up on the socket.
void LibsshTransport::close()
{
    if (!m_conn->open.exchange(false) || !m_conn->session)
        return;

    qInfo().noquote() << QString("[SSH] disconnect target='%1'").arg(m_target);

    if (m_conn->mutex.tryLock()) {
        ssh_disconnect(m_conn->session);
        m_conn->mutex.unlock();
        return;
    }

    // Busy: shut the socket down so the blocked call fails now.
    // ssh_free() still runs with the last reference to the connection.
    const socket_t fd = ssh_get_fd(m_conn->session);
    if (fd != SSH_INVALID_SOCKET)
        ::shutdown(fd, SHUT_RDWR);
    qDebug().noquote() << QString("[SSH] target='%1' busy, socket shut down").arg(m_target);
}

bool LibsshTransport::isOpen() const
{
    if (!m_conn->open.load())
        return false;
    if (!m_conn->mutex.tryLock())
        return true;   // a call is running on it
    const bool alive = sessionAlive(*m_conn);
    m_conn->mutex.unlock();
    return alive;
}

void LibsshTransport::setClosedHandler(ClosedHandler handler)
{
    QMutexLocker lock(&m_handlerMutex);
    m_closedHandler = std::move(handler);
}

void LibsshTransport::connectionLost(const QString& reason)
{
    qWarning().noquote() << QString("[SSH] connection lost target='%1': %2").arg(m_target, reason);

    ClosedHandler h;
    {
        QMutexLocker lock(&m_handlerMutex);
        h = m_closedHandler;
    }
    if (h)
        h(this, reason);
}

std::shared_ptr<SftpChannel> LibsshTransport::openSftp(RemoteError* err)
{
    if (err) err->clear();

    auto handle = std::make_shared<LibsshSftpHandle>();
    handle->conn = m_conn;

    RemoteError e;
    {
        QMutexLocker lock(&m_conn->mutex);
        if (!sessionAlive(*m_conn)) {
            e = RemoteError(RemoteError::Kind::Connection, QStringLiteral("Not connected."));
        } else {
            sftp_session sftp = sftp_new(m_conn->session);
            if (!sftp) {
                e = RemoteError(RemoteError::Kind::Connection,
                                QString("sftp_new failed: %1").arg(libsshError(m_conn->session)));
            } else if (sftp_init(sftp) != SSH_OK) {
                e = RemoteError(RemoteError::Kind::RemoteFailure,
                                QString("sftp_init failed: %1").arg(libsshError(m_conn->session)),
                                QStringLiteral("Check that the SFTP subsystem is enabled in sshd_config."));
                sftp_free(sftp);
            } else {
                handle->sftp = sftp;
            }
            if (e.isError() && !ssh_is_connected(m_conn->session))
                e = RemoteError(RemoteError::Kind::Connection, QStringLiteral("Connection lost during SFTP init"));
        }
    }

    if (e.isError()) {
        if (e.kind() == RemoteError::Kind::Connection)
            m_conn->reportLost(e.message());
        setError(err, e);
        return nullptr;
    }

    return std::make_shared<LibsshSftpChannel>(handle);
}

bool LibsshTransport::exec(const QString& command, ExecResult* out, int timeoutMs, RemoteError* err)
{
    if (err) err->clear();
    if (out) *out = ExecResult{};

    ssh_channel ch = nullptr;
    QString failure;
    {
        QMutexLocker lock(&m_conn->mutex);
        if (!sessionAlive(*m_conn)) {
            lock.unlock();
            m_conn->reportLost(QStringLiteral("Not connected."));
            return setError(err, RemoteError(RemoteError::Kind::Connection, QStringLiteral("Not connected.")));
        }

        ch = ssh_channel_new(m_conn->session);
        if (!ch) {
            failure = "ssh_channel_new failed.";
        } else if (ssh_channel_open_session(ch) != SSH_OK) {
            failure = "ssh_channel_open_session failed: " + libsshError(m_conn->session);
        } else if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK) {
            failure = "ssh_channel_request_exec failed: " + libsshError(m_conn->session);
        }
    }

    auto cleanup = [&]() {
        QMutexLocker lock(&m_conn->mutex);
        if (ch) {
            if (ssh_channel_is_open(ch)) {
                ssh_channel_send_eof(ch);
                ssh_channel_close(ch);
            }
            ssh_channel_free(ch);
            ch = nullptr;
        }
    };

    auto fail = [&](const QString& msg) -> bool {
        bool lost = false;
        {
            QMutexLocker lock(&m_conn->mutex);
            lost = !ssh_is_connected(m_conn->session);
        }
        cleanup();
        if (lost) {
            m_conn->reportLost(msg);
            return setError(err, RemoteError(RemoteError::Kind::Connection, "Connection lost: " + msg));
        }
        return setError(err, RemoteError(RemoteError::Kind::RemoteFailure, msg));
    };

    if (!failure.isEmpty())
        return fail(failure);

    QByteArray outBuf, errBuf;
    char buf[4096];

    QElapsedTimer timer;
    timer.start();

    // Caller holds conn->mutex.
    auto readAvailable = [&](int isStderr) -> bool {
        while (true) {
            const int n = ssh_channel_read_nonblocking(ch, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR)
                return false;
            if (n <= 0)
                break;
            if (isStderr) errBuf.append(buf, n);
            else          outBuf.append(buf, n);
        }
        return true;
    };

    while (true) {
        if (timeoutMs > 0 && timer.elapsed() > timeoutMs) {
            cleanup();
            return setError(err, RemoteError::timeout(RemoteError::TimeoutPhase::Operation,
                                                      QStringLiteral("Remote command"), timeoutMs));
        }

        bool eof = false;
        QString stepError;
        {
            // Lock per tick so SFTP traffic on the same session keeps flowing.
            QMutexLocker lock(&m_conn->mutex);

            const int availOut = ssh_channel_poll_timeout(ch, /*timeoutMs*/ 50, /*is_stderr*/ 0);
            if (availOut == SSH_ERROR)
                stepError = "ssh_channel_poll_timeout(stdout) failed: " + libsshError(m_conn->session);
            else if (!readAvailable(0) || !readAvailable(1))
                stepError = "ssh_channel_read failed: " + libsshError(m_conn->session);
            else if (ssh_channel_is_eof(ch)) {
                // Drain whatever is still buffered.
                if (!readAvailable(0) || !readAvailable(1))
                    stepError = "ssh_channel_read(drain) failed: " + libsshError(m_conn->session);
                eof = true;
            }
        }

        if (!stepError.isEmpty())
            return fail(stepError);
        if (eof)
            break;
    }

    int exitCode = -1;
    {
        QMutexLocker lock(&m_conn->mutex);
        exitCode = ssh_channel_get_exit_status(ch);
    }
    cleanup();

    if (out) {
        out->stdoutText = QString::fromUtf8(outBuf);
        out->stderrText = QString::fromUtf8(errBuf);
        out->exitCode = exitCode;
    }
    return true;
}

bool LibsshTransport::sendKeepAlive(RemoteError* err)
{
    if (err) err->clear();

    bool lost = false;
    {
        QMutexLocker lock(&m_conn->mutex);
        if (!sessionAlive(*m_conn) || ssh_send_ignore(m_conn->session, "keepalive") != SSH_OK)
            lost = true;
    }
    if (lost) {
        m_conn->reportLost(QStringLiteral("keep-alive failed"));
        return setError(err, RemoteError(RemoteError::Kind::Connection,
                                         QStringLiteral("Connection lost (keep-alive failed)")));
    }
    return true;
}
