#pragma once

#include <QString>

// POSIX path helpers for remote paths (always '/' separated, independent
// of the local platform).
namespace RemotePath {
    // Collapses "//", "/./" and "a/.." segments; strips a trailing '/'.
    // "" becomes ".", "~" and "~/x" are kept as-is for later expansion.
    QString normalize(const QString& path);

    // Parent directory: parent("/x") == "/", parent("a") == ".".
    QString parent(const QString& path);

    QString join(const QString& dir, const QString& name);
    QString fileName(const QString& path);

    // Path of `path` below `root`, or empty if it is not inside root.
    QString relativeTo(const QString& root, const QString& path);

    // "~", "~/x", "~user/x"
    bool needsTildeExpansion(const QString& path);

    // Used when the server cannot expand "~": the SFTP working directory
    // is the login directory, so "~" -> "." and "~/x" -> "x".
    QString tildeFallback(const QString& path);

    // Replace a leading "~" with an already expanded home directory.
    QString substituteHome(const QString& path, const QString& home);

    // Single-quote for a POSIX shell.
    QString shQuote(const QString& s);
}
