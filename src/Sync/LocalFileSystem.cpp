#include "LocalFileSystem.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

static quint32 modeFromInfo(const QFileInfo& fi)
{
    quint32 mode = 0;
    if (fi.isSymLink())
        mode |= 0120000;
    else if (fi.isDir())
        mode |= 0040000;
    else
        mode |= 0100000;

    const QFile::Permissions p = fi.permissions();
    if (p & QFile::ReadOwner)  mode |= 0400;
    if (p & QFile::WriteOwner) mode |= 0200;
    if (p & QFile::ExeOwner)   mode |= 0100;
    if (p & QFile::ReadGroup)  mode |= 0040;
    if (p & QFile::WriteGroup) mode |= 0020;
    if (p & QFile::ExeGroup)   mode |= 0010;
    if (p & QFile::ReadOther)  mode |= 0004;
    if (p & QFile::WriteOther) mode |= 0002;
    if (p & QFile::ExeOther)   mode |= 0001;
    return mode;
}

static bool localError(RemoteError* err, const QString& message)
{
    return setError(err, RemoteError(RemoteError::Kind::LocalIo, message));
}

FileEntry QtLocalFileSystem::entryFromInfo(const QFileInfo& fi)
{
    FileEntry e;
    e.name = fi.fileName();
    e.path = QDir::fromNativeSeparators(fi.absoluteFilePath());
    e.mode = modeFromInfo(fi);
    e.type = fileTypeFromMode(e.mode);
    e.size = (e.type == FileEntry::Type::Directory) ? -1 : fi.size();
    e.modified = fi.lastModified();
    e.permissions = permissionString(e.mode);
    e.owner = fi.owner();
    e.group = fi.group();
    if (fi.isSymLink())
        e.symlinkTarget = fi.symLinkTarget();
    return e;
}

bool QtLocalFileSystem::list(const QString& path, FileEntryList* out, RemoteError* err)
{
    if (err) err->clear();
    if (out) out->clear();

    const QDir dir(path);
    if (!dir.exists())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local folder not found: %1").arg(path)));

    const QFileInfoList infos =
        dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);

    FileEntryList entries;
    entries.reserve(infos.size());
    for (const QFileInfo& fi : infos)
        entries.push_back(entryFromInfo(fi));
    sortForListing(&entries);

    if (out) *out = entries;
    return true;
}

bool QtLocalFileSystem::stat(const QString& path, FileEntry* out, RemoteError* err)
{
    if (err) err->clear();
    const QFileInfo fi(path);
    if (!fi.exists() && !fi.isSymLink())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local path not found: %1").arg(path)));
    if (out) *out = entryFromInfo(fi);
    return true;
}

bool QtLocalFileSystem::copy(const QString& src, const QString& dst, RemoteError* err)
{
    if (err) err->clear();
    if (!QFileInfo(src).isFile())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local file not found: %1").arg(src)));

    if (!makePath(QFileInfo(dst).absolutePath(), err))
        return false;

    if (QFileInfo::exists(dst) && !QFile::remove(dst))
        return localError(err, QString("Cannot replace '%1'.").arg(dst));

    QFile in(src);
    if (!in.copy(dst))
        return localError(err, QString("Copy '%1' -> '%2' failed: %3").arg(src, dst, in.errorString()));
    return true;
}

bool QtLocalFileSystem::move(const QString& src, const QString& dst, RemoteError* err)
{
    if (err) err->clear();
    const QFileInfo fi(src);
    if (!fi.exists())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local path not found: %1").arg(src)));

    if (!makePath(QFileInfo(dst).absolutePath(), err))
        return false;

    if (QDir().rename(src, dst))
        return true;

    // Across filesystems: copy then delete (files only).
    if (fi.isDir())
        return localError(err, QString("Cannot move folder '%1' to '%2'.").arg(src, dst));
    if (!copy(src, dst, err))
        return false;
    return remove(src, err);
}

bool QtLocalFileSystem::remove(const QString& path, RemoteError* err)
{
    if (err) err->clear();
    const QFileInfo fi(path);
    if (!fi.exists() && !fi.isSymLink())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local path not found: %1").arg(path)));

    if (fi.isDir() && !fi.isSymLink()) {
        if (!QDir(path).removeRecursively())
            return localError(err, QString("Cannot delete folder '%1'.").arg(path));
        return true;
    }

    if (!QFile::remove(path))
        return localError(err, QString("Cannot delete '%1'.").arg(path));
    return true;
}

bool QtLocalFileSystem::read(const QString& path, QByteArray* out, RemoteError* err)
{
    if (err) err->clear();
    QFile f(path);
    if (!f.exists())
        return setError(err, RemoteError(RemoteError::Kind::NotFound, QString("Local file not found: %1").arg(path)));
    if (!f.open(QIODevice::ReadOnly))
        return localError(err, QString("Cannot read '%1': %2").arg(path, f.errorString()));
    if (out) *out = f.readAll();
    return true;
}

bool QtLocalFileSystem::makePath(const QString& path, RemoteError* err)
{
    if (err) err->clear();
    if (QDir().mkpath(path))
        return true;
    return localError(err, QString("Cannot create local folder '%1'.").arg(path));
}
