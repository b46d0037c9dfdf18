#pragma once

#include <QByteArray>
#include <QString>

// Resolved credentials for one connection attempt.
// Secret buffers are wiped (sodium_memzero) when the object dies.
// Never log the contents; use describe().
class AuthMaterial
{
public:
    AuthMaterial() = default;
    AuthMaterial(const AuthMaterial& other) = default;
    AuthMaterial& operator=(const AuthMaterial& other);
    ~AuthMaterial();

    QByteArray password;        // UTF-8
    QByteArray privateKey;      // PEM / OpenSSH text
    QString    privateKeyPath;  // informational; key text is already loaded
    QByteArray passphrase;
    QString    agentSocket;
    bool       tryKeyboardInteractive = false;

    bool hasPassword() const { return !password.isEmpty(); }
    bool hasPrivateKey() const { return !privateKey.isEmpty(); }
    bool hasAgent() const { return !agentSocket.isEmpty(); }
    bool isEmpty() const { return !hasPassword() && !hasPrivateKey() && !hasAgent(); }

    // e.g. "key+passphrase", "agent", "password+keyboard-interactive"
    QString describe() const;

    void wipe();
};
