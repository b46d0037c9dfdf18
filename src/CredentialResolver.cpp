// CredentialResolver.cpp
#include "CredentialResolver.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>

// =====================================================
// MemorySecretStore
// =====================================================

QString MemorySecretStore::secret(const QString& key) const
{
    QMutexLocker lock(&m_mutex);
    return m_values.value(key);
}

void MemorySecretStore::setSecret(const QString& key, const QString& value)
{
    QMutexLocker lock(&m_mutex);
    m_values.insert(key, value);
}

// =====================================================
// Helpers
// =====================================================

QString expandLocalHome(const QString& path)
{
    const QString p = path.trimmed();
    if (p == "~")
        return QDir::homePath();
    if (p.startsWith("~/"))
        return QDir::homePath() + p.mid(1);
    return p;
}

bool readPrivateKeyFile(const QString& path, QByteArray* out, RemoteError* err)
{
    if (err) err->clear();

    const QString p = expandLocalHome(path);
    QFile f(p);
    if (!f.open(QIODevice::ReadOnly)) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QString("Cannot read private key '%1': %2").arg(p, f.errorString()),
                                         QStringLiteral("Check the key path configured for this host.")));
    }

    const QByteArray data = f.readAll();
    f.close();

    if (data.trimmed().isEmpty()) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QString("Private key file '%1' is empty.").arg(p)));
    }

    if (out) *out = data;
    return true;
}

static bool looksLikeKeyText(const QString& s)
{
    return s.contains("BEGIN") || s.contains("PRIVATE KEY");
}

static bool looksLikeKeyPath(const QString& s)
{
    const QString t = s.trimmed();
    return t.startsWith('/') || t.startsWith('~');
}

// =====================================================
// DefaultCredentialResolver
// =====================================================

DefaultCredentialResolver::DefaultCredentialResolver(std::shared_ptr<SecretStore> secrets,
                                                     std::shared_ptr<AuthPrompt> prompt)
    : m_secrets(std::move(secrets)),
      m_prompt(std::move(prompt))
{
}

bool DefaultCredentialResolver::resolve(const HostDescriptor& host, AuthMaterial* out, RemoteError* err)
{
    if (err) err->clear();
    if (!out) {
        return setError(err, RemoteError(RemoteError::Kind::InvalidArgument,
                                         QStringLiteral("resolve: out is null.")));
    }
    out->wipe();

    bool ok = false;
    if (const auto* a = std::get_if<PasswordAuth>(&host.auth))
        ok = resolvePassword(host, *a, out, err);
    else if (const auto* a = std::get_if<PrivateKeyAuth>(&host.auth))
        ok = resolveKey(host, *a, out, err);
    else if (const auto* a = std::get_if<AgentAuth>(&host.auth))
        ok = resolveAgent(host, *a, out, err);
    else if (const auto* a = std::get_if<VaultSecretAuth>(&host.auth))
        ok = resolveVault(host, *a, out, err);

    if (ok) {
        qInfo().noquote() << QString("[AUTH] resolved host='%1' method=%2 material=%3")
                             .arg(host.id, authMethodName(host.auth), out->describe());
    } else {
        out->wipe();
        qWarning().noquote() << QString("[AUTH] resolve FAILED host='%1' method=%2: %3")
                                .arg(host.id, authMethodName(host.auth),
                                     err ? err->message() : QString("unknown error"));
    }
    return ok;
}

bool DefaultCredentialResolver::resolvePassword(const HostDescriptor& host, const PasswordAuth& a,
                                                AuthMaterial* out, RemoteError* err)
{
    const QString key = a.secretKey.trimmed().isEmpty() ? host.id : a.secretKey.trimmed();
    const QString pw = m_secrets ? m_secrets->secret(key) : QString();
    if (pw.isEmpty()) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QString("No password stored for host '%1'.").arg(host.id),
                                         QStringLiteral("Save the password for this host first.")));
    }

    out->password = pw.toUtf8();
    out->tryKeyboardInteractive = true;
    return true;
}

bool DefaultCredentialResolver::resolveKey(const HostDescriptor& host, const PrivateKeyAuth& a,
                                           AuthMaterial* out, RemoteError* err)
{
    Q_UNUSED(host);

    if (a.keyPath.trimmed().isEmpty()) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QStringLiteral("No private key path configured.")));
    }

    if (!readPrivateKeyFile(a.keyPath, &out->privateKey, err))
        return false;

    out->privateKeyPath = expandLocalHome(a.keyPath);
    if (m_secrets && !a.passphraseKey.trimmed().isEmpty())
        out->passphrase = m_secrets->secret(a.passphraseKey.trimmed()).toUtf8();
    return true;
}

bool DefaultCredentialResolver::resolveAgent(const HostDescriptor& host, const AgentAuth& a,
                                             AuthMaterial* out, RemoteError* err)
{
    const QString socket = a.socketOverride.trimmed().isEmpty()
                               ? qEnvironmentVariable("SSH_AUTH_SOCK").trimmed()
                               : a.socketOverride.trimmed();

    if (!socket.isEmpty() && QFileInfo::exists(socket)) {
        out->agentSocket = socket;
        return true;
    }

    qInfo().noquote() << QString("[AUTH] agent unavailable host='%1' (socket '%2') -> interactive fallback")
                         .arg(host.id, socket);
    return resolveInteractive(host, out, err);
}

bool DefaultCredentialResolver::resolveVault(const HostDescriptor& host, const VaultSecretAuth& a,
                                             AuthMaterial* out, RemoteError* err)
{
    const QString id = a.credentialId.trimmed().isEmpty() ? host.credentialId.trimmed()
                                                          : a.credentialId.trimmed();
    const QString value = (m_secrets && !id.isEmpty()) ? m_secrets->secret(id) : QString();
    if (value.isEmpty()) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QString("Credential '%1' not found.").arg(id),
                                         QStringLiteral("The stored credential may have been deleted.")));
    }

    if (looksLikeKeyText(value)) {
        out->privateKey = value.toUtf8();
        return true;
    }
    if (looksLikeKeyPath(value)) {
        if (!readPrivateKeyFile(value, &out->privateKey, err))
            return false;
        out->privateKeyPath = expandLocalHome(value);
        return true;
    }

    out->password = value.toUtf8();
    out->tryKeyboardInteractive = true;
    return true;
}

bool DefaultCredentialResolver::resolveInteractive(const HostDescriptor& host, AuthMaterial* out,
                                                   RemoteError* err)
{
    if (!m_prompt) {
        return setError(err, RemoteError(RemoteError::Kind::Authentication,
                                         QStringLiteral("SSH agent not available (SSH_AUTH_SOCK not set)."),
                                         QStringLiteral("Start ssh-agent or configure a password or key for this host.")));
    }

    const RemoteError cancelled(RemoteError::Kind::Authentication,
                                QStringLiteral("Authentication cancelled by user."));

    switch (m_prompt->chooseMethod(host)) {
        case AuthPrompt::Choice::Password: {
            QString pw;
            if (!m_prompt->promptPassword(host, &pw) || pw.isEmpty())
                return setError(err, cancelled);
            out->password = pw.toUtf8();
            out->tryKeyboardInteractive = true;
            return true;
        }
        case AuthPrompt::Choice::KeyFile: {
            QString path, passphrase;
            if (!m_prompt->promptKeyFile(host, &path, &passphrase) || path.trimmed().isEmpty())
                return setError(err, cancelled);
            if (!readPrivateKeyFile(path, &out->privateKey, err))
                return false;
            out->privateKeyPath = expandLocalHome(path);
            out->passphrase = passphrase.toUtf8();
            return true;
        }
        case AuthPrompt::Choice::Cancel:
            break;
    }
    return setError(err, cancelled);
}
