// LibsshTransport.h
//
// RemoteTransport backed by libssh.
//   - One ssh_session per transport; SFTP channels and exec channels share it
//   - Calls on the session are serialized by a per-connection mutex;
//     close() and isOpen() never wait on it
//   - Host keys are accepted and their SHA-256 fingerprint is logged
//   - Never log secrets (passwords, passphrases, key material)

#pragma once

#include <QMutex>
#include <QString>
#include <memory>

#include "RemoteTransport.h"

struct LibsshConnection;

class LibsshTransport : public RemoteTransport,
                        public std::enable_shared_from_this<LibsshTransport>
{
public:
    LibsshTransport();
    ~LibsshTransport() override;

    static std::shared_ptr<RemoteTransport> create();

    // Seconds for ssh_connect + auth (libssh SSH_OPTIONS_TIMEOUT).
    void setConnectTimeoutSec(int sec) { m_connectTimeoutSec = sec; }

    bool open(const HostDescriptor& host, const AuthMaterial& auth,
              RemoteError* err = nullptr) override;
    void close() override;
    bool isOpen() const override;

    void setClosedHandler(ClosedHandler handler) override;

    std::shared_ptr<SftpChannel> openSftp(RemoteError* err = nullptr) override;

    bool exec(const QString& command, ExecResult* out, int timeoutMs,
              RemoteError* err = nullptr) override;

    bool sendKeepAlive(RemoteError* err = nullptr) override;

    QString hostKeyFingerprint() const { return m_fingerprint; }

private:
    void connectionLost(const QString& reason);

    std::shared_ptr<LibsshConnection> m_conn;
    mutable QMutex m_handlerMutex;
    ClosedHandler m_closedHandler;
    QString m_target;
    QString m_fingerprint;
    int m_connectTimeoutSec = 20;
};
