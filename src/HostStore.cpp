#include "HostStore.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

static QString g_pathOverride;

// -----------------------------
// Auth <-> JSON
// -----------------------------
static QJsonObject authToJson(const AuthMethod& auth)
{
    QJsonObject o;
    o["type"] = authMethodName(auth);

    if (const auto* a = std::get_if<PasswordAuth>(&auth)) {
        if (!a->secretKey.trimmed().isEmpty())
            o["secret_key"] = a->secretKey.trimmed();
    } else if (const auto* a = std::get_if<PrivateKeyAuth>(&auth)) {
        o["key_path"] = a->keyPath;
        if (!a->passphraseKey.trimmed().isEmpty())
            o["passphrase_key"] = a->passphraseKey.trimmed();
    } else if (const auto* a = std::get_if<AgentAuth>(&auth)) {
        if (!a->socketOverride.trimmed().isEmpty())
            o["socket"] = a->socketOverride.trimmed();
    } else if (const auto* a = std::get_if<VaultSecretAuth>(&auth)) {
        o["credential_id"] = a->credentialId;
    }
    return o;
}

static AuthMethod authFromJson(const QJsonObject& o)
{
    const QString type = o.value("type").toString("agent").trimmed().toLower();

    if (type == "password")
        return PasswordAuth{o.value("secret_key").toString().trimmed()};
    if (type == "key")
        return PrivateKeyAuth{o.value("key_path").toString(), o.value("passphrase_key").toString().trimmed()};
    if (type == "credential")
        return VaultSecretAuth{o.value("credential_id").toString()};
    return AgentAuth{o.value("socket").toString().trimmed()};
}

// -----------------------------
// Host <-> JSON
// -----------------------------
static QJsonObject hostToJson(const HostDescriptor& h)
{
    QJsonObject o;
    o["id"] = h.id.trimmed();
    if (!h.name.trimmed().isEmpty())
        o["name"] = h.name.trimmed();
    o["address"] = h.address.trimmed();
    o["port"] = h.port;
    o["username"] = h.username.trimmed();
    o["auth"] = authToJson(h.auth);
    o["keep_alive"] = h.keepAlive;
    if (!h.credentialId.trimmed().isEmpty())
        o["credential_id"] = h.credentialId.trimmed();
    return o;
}

static HostDescriptor hostFromJson(const QJsonObject& o)
{
    HostDescriptor h;
    h.id = o.value("id").toString().trimmed();
    h.name = o.value("name").toString();
    h.address = o.value("address").toString().trimmed();
    h.port = o.value("port").toInt(22);
    if (h.port <= 0 || h.port > 65535)
        h.port = 22;
    h.username = o.value("username").toString().trimmed();
    h.auth = authFromJson(o.value("auth").toObject());
    h.keepAlive = o.value("keep_alive").toBool(true);
    h.credentialId = o.value("credential_id").toString().trimmed();
    return h;
}

QString HostStore::configPath()
{
    if (!g_pathOverride.isEmpty())
        return g_pathOverride;

    QString cfgDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (cfgDir.trimmed().isEmpty())
        cfgDir = QDir(QDir::homePath()).filePath(".config/remotefiles");

    QDir().mkpath(cfgDir);
    return QDir(cfgDir).filePath("hosts.json");
}

void HostStore::setConfigPathOverride(const QString& absoluteFilePath)
{
    const QString p = absoluteFilePath.trimmed();
    g_pathOverride = p.isEmpty() ? QString() : QDir::cleanPath(p);
}

QVector<HostDescriptor> HostStore::load(QString* err)
{
    QVector<HostDescriptor> out;

    QFile f(configPath());
    if (!f.exists()) {
        if (err) err->clear();
        return out;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QCoreApplication::translate("HostStore", "Could not open hosts.json: %1")
                            .arg(f.errorString());
        return out;
    }

    const QByteArray data = f.readAll();
    f.close();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QCoreApplication::translate("HostStore", "Invalid JSON in hosts.json: %1")
                            .arg(perr.errorString());
        return out;
    }

    const QJsonArray arr = doc.object().value("hosts").toArray();
    out.reserve(arr.size());

    for (const auto& v : arr) {
        if (!v.isObject()) continue;
        const HostDescriptor h = hostFromJson(v.toObject());
        if (!h.isValid()) continue;

        bool duplicate = false;
        for (const HostDescriptor& seen : out) {
            if (seen.id == h.id) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) continue;   // first one wins
        out.push_back(h);
    }

    if (err) err->clear();
    return out;
}

bool HostStore::save(const QVector<HostDescriptor>& hosts, QString* err)
{
    QJsonArray arr;
    for (const auto& h : hosts) {
        if (!h.isValid()) continue;
        arr.append(hostToJson(h));
    }

    QJsonObject root;
    root["format"] = 1;
    root["hosts"] = arr;

    const QString path = configPath();
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = QCoreApplication::translate("HostStore", "Could not write hosts.json: %1")
                            .arg(f.errorString());
        return false;
    }

    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        if (err) *err = QCoreApplication::translate("HostStore", "Could not write hosts.json: %1")
                            .arg(f.errorString());
        return false;
    }

    if (err) err->clear();
    return true;
}
