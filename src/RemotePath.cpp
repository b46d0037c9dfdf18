// RemotePath.cpp
#include "RemotePath.h"

#include <QStringList>

namespace RemotePath {

QString normalize(const QString& path)
{
    const QString p = path.trimmed();
    if (p.isEmpty())
        return QStringLiteral(".");

    const bool absolute = p.startsWith('/');
    const QStringList parts = p.split('/', Qt::SkipEmptyParts);

    QStringList out;
    for (const QString& part : parts) {
        if (part == ".")
            continue;
        if (part == "..") {
            if (!out.isEmpty() && out.last() != "..")
                out.removeLast();
            else if (!absolute)
                out.push_back(part);
            continue;
        }
        out.push_back(part);
    }

    if (absolute)
        return "/" + out.join('/');
    if (out.isEmpty())
        return QStringLiteral(".");
    return out.join('/');
}

QString parent(const QString& path)
{
    const QString p = normalize(path);
    if (p == "/")
        return p;

    const int slash = p.lastIndexOf('/');
    if (slash < 0)
        return QStringLiteral(".");
    if (slash == 0)
        return QStringLiteral("/");
    return p.left(slash);
}

QString join(const QString& dir, const QString& name)
{
    if (dir.isEmpty())
        return name;
    if (name.startsWith('/'))
        return name;
    return dir.endsWith('/') ? (dir + name) : (dir + "/" + name);
}

QString fileName(const QString& path)
{
    const QString p = normalize(path);
    if (p == "/")
        return p;
    const int slash = p.lastIndexOf('/');
    return (slash < 0) ? p : p.mid(slash + 1);
}

QString relativeTo(const QString& root, const QString& path)
{
    const QString r = normalize(root);
    const QString p = normalize(path);

    if (p == r)
        return QString();

    const QString prefix = (r == "/") ? r : (r + "/");
    if (!p.startsWith(prefix))
        return QString();
    return p.mid(prefix.size());
}

bool needsTildeExpansion(const QString& path)
{
    return path.trimmed().startsWith('~');
}

QString tildeFallback(const QString& path)
{
    const QString p = path.trimmed();
    if (p.startsWith("~/") && p.size() > 2)
        return normalize(p.mid(2));
    return QStringLiteral(".");
}

QString substituteHome(const QString& path, const QString& home)
{
    const QString p = path.trimmed();
    if (p == "~")
        return home;
    if (p.startsWith("~/"))
        return join(home, p.mid(2));
    return p;
}

QString shQuote(const QString& s)
{
    QString out = s;
    out.replace('\'', "'\"'\"'");
    return "'" + out + "'";
}

} // namespace RemotePath
