// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace Utils::PathUtils {

QString normalizePath(QStringView path)
{
    QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        cleaned.clear();
    return cleaned;
}

QString absoluteCleanPath(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    return QDir::cleanPath(QFileInfo(cleaned).absoluteFilePath());
}

QString basename(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    const int slash = cleaned.lastIndexOf('/');
    if (slash < 0)
        return cleaned;
    if (slash == cleaned.size() - 1)
        return {};
    return cleaned.mid(slash + 1);
}

QString parentDirectory(QStringView path)
{
    const QString absolute = absoluteCleanPath(path);
    if (absolute.isEmpty())
        return {};
    return QFileInfo(absolute).absolutePath();
}

QString pathLookupKey(const QString& absolutePath)
{
#if defined(Q_OS_WIN)
    return absolutePath.toLower();
#else
    return absolutePath;
#endif
}

bool pathsEqual(const QString& lhs, const QString& rhs)
{
    return QString::compare(lhs, rhs, kPathCase) == 0;
}

QString stablePathKey(const QString& absolutePath, int length)
{
    const QByteArray hash =
        QCryptographicHash::hash(pathLookupKey(absolutePath).toUtf8(), QCryptographicHash::Sha1).toHex();
    return QString::fromLatin1(hash.left(qMax(1, length)));
}

} // namespace Utils::PathUtils
