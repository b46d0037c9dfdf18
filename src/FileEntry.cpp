// FileEntry.cpp
#include "FileEntry.h"

#include <algorithm>

#include <sys/stat.h>

FileEntry::Type fileTypeFromMode(quint32 mode)
{
    switch (mode & S_IFMT) {
        case S_IFDIR: return FileEntry::Type::Directory;
        case S_IFLNK: return FileEntry::Type::Symlink;
        default:      return FileEntry::Type::File;
    }
}

QString permissionString(quint32 mode)
{
    QString s(10, QLatin1Char('-'));

    switch (mode & S_IFMT) {
        case S_IFDIR: s[0] = 'd'; break;
        case S_IFLNK: s[0] = 'l'; break;
        default: break;
    }

    static const quint32 bits[9] = {
        S_IRUSR, S_IWUSR, S_IXUSR,
        S_IRGRP, S_IWGRP, S_IXGRP,
        S_IROTH, S_IWOTH, S_IXOTH
    };
    static const char letters[3] = { 'r', 'w', 'x' };

    for (int i = 0; i < 9; ++i) {
        if (mode & bits[i])
            s[i + 1] = QLatin1Char(letters[i % 3]);
    }

    // setuid / setgid / sticky replace the execute slot
    if (mode & S_ISUID) s[3] = (mode & S_IXUSR) ? 's' : 'S';
    if (mode & S_ISGID) s[6] = (mode & S_IXGRP) ? 's' : 'S';
    if (mode & S_ISVTX) s[9] = (mode & S_IXOTH) ? 't' : 'T';

    return s;
}

QString fileTypeName(FileEntry::Type type)
{
    switch (type) {
        case FileEntry::Type::File:      return "file";
        case FileEntry::Type::Directory: return "directory";
        case FileEntry::Type::Symlink:   return "symlink";
    }
    return "file";
}

void sortForListing(FileEntryList* entries)
{
    if (!entries) return;

    std::stable_sort(entries->begin(), entries->end(),
                     [](const FileEntry& a, const FileEntry& b) {
        if (a.isDirectory() != b.isDirectory())
            return a.isDirectory();
        return QString::localeAwareCompare(a.name, b.name) < 0;
    });
}
