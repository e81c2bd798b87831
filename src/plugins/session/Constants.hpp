// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

namespace Session::Constants {
constexpr inline quint64 kDocumentOpenMaxBytes = 16 * 1024 * 1024;

constexpr inline int kDefaultAutosaveIntervalSeconds = 30;
constexpr inline int kDefaultBackupRetentionCount = 10;
constexpr inline qint64 kDefaultBackupRetentionAgeSeconds = 0;
constexpr inline int kDefaultMaxRecentFiles = 10;
constexpr inline char kDefaultFallbackEncoding[] = "ISO-8859-1";

constexpr inline char kBackupDirName[] = ".backups";
constexpr inline char kBackupSuffix[] = ".backup";
constexpr inline char kBackupTimestampFormat[] = "yyyyMMdd'T'HHmmsszzz";

constexpr inline char kUntitledScheme[] = "untitled:";

constexpr inline int kMonitorDebounceMs = 100;
} // namespace Session::Constants
