#pragma once

#include <QHash>
#include <QMutex>
#include <QString>

#include <memory>

#include "AuthMaterial.h"
#include "HostDescriptor.h"
#include "RemoteError.h"

// Opaque secret storage (OS keychain, encrypted vault, ...).
class SecretStore
{
public:
    virtual ~SecretStore() = default;

    // Empty when the key is unknown.
    virtual QString secret(const QString& key) const = 0;
    virtual void setSecret(const QString& key, const QString& value) = 0;
};

class MemorySecretStore : public SecretStore
{
public:
    QString secret(const QString& key) const override;
    void setSecret(const QString& key, const QString& value) override;

private:
    mutable QMutex m_mutex;
    QHash<QString, QString> m_values;
};

// Interactive fallback when an agent is configured but not reachable.
// Implemented by the UI layer; all calls may block on user input.
class AuthPrompt
{
public:
    enum class Choice {
        Password,
        KeyFile,
        Cancel
    };

    virtual ~AuthPrompt() = default;

    virtual Choice chooseMethod(const HostDescriptor& host) = 0;
    virtual bool promptPassword(const HostDescriptor& host, QString* password) = 0;
    virtual bool promptKeyFile(const HostDescriptor& host, QString* keyPath, QString* passphrase) = 0;
};

class CredentialResolver
{
public:
    virtual ~CredentialResolver() = default;
    virtual bool resolve(const HostDescriptor& host, AuthMaterial* out, RemoteError* err = nullptr) = 0;
};

// Resolves each AuthMethod variant:
//   password   -> secret store
//   key        -> key file (+ passphrase from secret store)
//   agent      -> socket override or $SSH_AUTH_SOCK, else AuthPrompt
//   credential -> secret store; key text, key path or password by content
class DefaultCredentialResolver : public CredentialResolver
{
public:
    explicit DefaultCredentialResolver(std::shared_ptr<SecretStore> secrets,
                                       std::shared_ptr<AuthPrompt> prompt = nullptr);

    bool resolve(const HostDescriptor& host, AuthMaterial* out, RemoteError* err = nullptr) override;

private:
    bool resolvePassword(const HostDescriptor& host, const PasswordAuth& a, AuthMaterial* out, RemoteError* err);
    bool resolveKey(const HostDescriptor& host, const PrivateKeyAuth& a, AuthMaterial* out, RemoteError* err);
    bool resolveAgent(const HostDescriptor& host, const AgentAuth& a, AuthMaterial* out, RemoteError* err);
    bool resolveVault(const HostDescriptor& host, const VaultSecretAuth& a, AuthMaterial* out, RemoteError* err);
    bool resolveInteractive(const HostDescriptor& host, AuthMaterial* out, RemoteError* err);

    std::shared_ptr<SecretStore> m_secrets;
    std::shared_ptr<AuthPrompt>  m_prompt;
};

// "~/x" -> "$HOME/x"
QString expandLocalHome(const QString& path);

// Reads a key file into `out`. Authentication error when unreadable.
bool readPrivateKeyFile(const QString& path, QByteArray* out, RemoteError* err = nullptr);
