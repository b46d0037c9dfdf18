#pragma once

#include <QString>
#include <variant>

// -----------------------------
// Auth configuration (one of)
// -----------------------------

// Password looked up in the secret store under `secretKey`.
struct PasswordAuth {
    QString secretKey;
};

// Private key file; optional passphrase looked up under `passphraseKey`.
struct PrivateKeyAuth {
    QString keyPath;
    QString passphraseKey;
};

// Running ssh-agent. Empty override => $SSH_AUTH_SOCK.
struct AgentAuth {
    QString socketOverride;
};

// Stored credential; the secret may be a password, key text or a key path.
struct VaultSecretAuth {
    QString credentialId;
};

using AuthMethod = std::variant<PasswordAuth, PrivateKeyAuth, AgentAuth, VaultSecretAuth>;

QString authMethodName(const AuthMethod& auth);

// -----------------------------
// Host identity
// -----------------------------
struct HostDescriptor {
    QString    id;           // stable key for pool/cache
    QString    name;         // display only
    QString    address;
    int        port = 22;
    QString    username;
    AuthMethod auth = AgentAuth{};
    bool       keepAlive = true;
    QString    credentialId; // optional external reference

    // "user@address:port" (no secrets)
    QString displayTarget() const;
    bool isValid() const;
};
