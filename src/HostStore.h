#pragma once

#include <QString>
#include <QVector>

#include "HostDescriptor.h"

/*
    HostStore
    ---------
    Persists host descriptors to hosts.json (AppConfigLocation).

    - Secrets are never written: auth entries only name the secret-store
      key, key path, agent socket or credential id.
    - Hosts without id, address or username are skipped on load.
    - Unknown fields are ignored; missing optional fields get defaults.
*/
class HostStore
{
public:
    static QString configPath();                  // .../hosts.json

    // Tests point this at a temp file. Empty => default location.
    static void setConfigPathOverride(const QString& absoluteFilePath);

    // Missing file => empty list, no error.
    static QVector<HostDescriptor> load(QString* err = nullptr);
    static bool save(const QVector<HostDescriptor>& hosts, QString* err = nullptr);
};
