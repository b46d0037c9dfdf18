#pragma once

#include <QByteArray>
#include <QString>

#include "../FileEntry.h"
#include "../RemoteError.h"

class QFileInfo;

// Local side of a sync. Failures are reported as LocalIo/NotFound errors.
class LocalFileSystem
{
public:
    virtual ~LocalFileSystem() = default;

    virtual bool list(const QString& path, FileEntryList* out, RemoteError* err = nullptr) = 0;
    virtual bool stat(const QString& path, FileEntry* out, RemoteError* err = nullptr) = 0;

    // Overwrites dst.
    virtual bool copy(const QString& src, const QString& dst, RemoteError* err = nullptr) = 0;
    virtual bool move(const QString& src, const QString& dst, RemoteError* err = nullptr) = 0;

    // Folders are removed with their contents.
    virtual bool remove(const QString& path, RemoteError* err = nullptr) = 0;

    virtual bool read(const QString& path, QByteArray* out, RemoteError* err = nullptr) = 0;
    virtual bool makePath(const QString& path, RemoteError* err = nullptr) = 0;
};

class QtLocalFileSystem : public LocalFileSystem
{
public:
    bool list(const QString& path, FileEntryList* out, RemoteError* err = nullptr) override;
    bool stat(const QString& path, FileEntry* out, RemoteError* err = nullptr) override;
    bool copy(const QString& src, const QString& dst, RemoteError* err = nullptr) override;
    bool move(const QString& src, const QString& dst, RemoteError* err = nullptr) override;
    bool remove(const QString& path, RemoteError* err = nullptr) override;
    bool read(const QString& path, QByteArray* out, RemoteError* err = nullptr) override;
    bool makePath(const QString& path, RemoteError* err = nullptr) override;

    static FileEntry entryFromInfo(const QFileInfo& fi);
};
