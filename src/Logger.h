#pragma once
#include <QString>
#include <QtGlobal>

// Process-wide log sink: installs a Qt message handler that writes one
// line per record to a size-rotated file (stderr until install()).
namespace Logger {
    void install(const QString& appName);

    // Restores the default Qt handler and closes the file.
    void shutdown();

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // The file rolls to .1, .2, ... once it reaches maxBytes; `keep` old files survive.
    void setRotation(qint64 maxBytes, int keep);

    QString logFilePath();
    void setLogFilePathOverride(const QString& absoluteFilePath);  // empty => default
    QString logDirPath();

    // Masks password=, passphrase=, secret= and token= values and PEM key bodies.
    QString redact(const QString& text);
}
