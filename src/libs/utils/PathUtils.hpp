// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/Qt>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

#if defined(Q_OS_WIN)
constexpr Qt::CaseSensitivity kPathCase = Qt::CaseInsensitive;
#else
constexpr Qt::CaseSensitivity kPathCase = Qt::CaseSensitive;
#endif

UTILS_EXPORT QString normalizePath(QStringView path);
UTILS_EXPORT QString absoluteCleanPath(QStringView path);
UTILS_EXPORT QString basename(QStringView path);
UTILS_EXPORT QString parentDirectory(QStringView path);

// Key used for hash lookups of file paths; folds case where the filesystem does.
UTILS_EXPORT QString pathLookupKey(const QString& absolutePath);
UTILS_EXPORT bool pathsEqual(const QString& lhs, const QString& rhs);

// Short, stable directory name derived from an absolute path.
UTILS_EXPORT QString stablePathKey(const QString& absolutePath, int length = 16);

} // namespace Utils::PathUtils
