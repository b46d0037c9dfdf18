#pragma once

#include <QString>
#include <QVector>
#include <QDateTime>
#include <QtGlobal>

// One remote (or local) directory entry as shown in a file browser.
struct FileEntry
{
    enum class Type {
        File,
        Directory,
        Symlink
    };

    QString   name;           // basename
    QString   path;           // absolute path
    qint64    size = 0;       // bytes; -1 for directories in listings (not computed)
    Type      type = Type::File;
    QDateTime modified;
    quint32   mode = 0;       // st_mode (type + permission bits)
    QString   permissions;    // "drwxr-xr-x"
    QString   owner;
    QString   group;
    QString   symlinkTarget;  // only for Symlink; "(unresolved)" when readlink failed

    bool isDirectory() const { return type == Type::Directory; }
    bool isSymlink() const { return type == Type::Symlink; }
    bool isFile() const { return type == Type::File; }
};

using FileEntryList = QVector<FileEntry>;

// st_mode helpers (POSIX bit layout, same on the SFTP wire).
FileEntry::Type fileTypeFromMode(quint32 mode);
QString permissionString(quint32 mode);
QString fileTypeName(FileEntry::Type type);

// Directories first, then by name.
void sortForListing(FileEntryList* entries);
