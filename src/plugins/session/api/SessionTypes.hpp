// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/Constants.hpp"
#include "session/SessionGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace Session::Api {

enum class SessionError : unsigned char {
	None,
	NotOpen,
	ReadError,
	WriteError,
	UnsavedChanges,
	Conflict
};

using SessionResult = Utils::BasicResult<SessionError>;

enum class LineEnding : unsigned char {
	Lf,
	CrLf,
	Cr
};

struct SESSION_EXPORT TextEncoding final {
	QString name = QStringLiteral("UTF-8");
	bool byteOrderMark = false;

	bool operator==(const TextEncoding&) const = default;
};

struct SESSION_EXPORT DocumentInfo final {
	QString path;
	QString text;
	bool dirty = false;
	bool orphaned = false;
	bool conflicted = false;
	bool untitled = false;
	QDateTime lastSyncedAt;
	TextEncoding encoding;
	LineEnding lineEnding = LineEnding::Lf;
	quint64 revision = 0;

	bool isValid() const noexcept { return !path.isEmpty(); }

	explicit operator bool () const noexcept { return isValid(); }
};

struct SESSION_EXPORT BackupRecord final {
	QString documentPath;
	QString backupFilePath;
	QDateTime createdAt;
	int sequence = 0;
	qint64 sizeBytes = 0;

	bool isValid() const noexcept { return !backupFilePath.isEmpty() && createdAt.isValid(); }
};

enum class ExternalChangeKind : unsigned char {
	Modified,
	Deleted,
	Renamed
};

struct SESSION_EXPORT ExternalChangeEvent final {
	QString path;
	ExternalChangeKind kind = ExternalChangeKind::Modified;
	QString newPath;
};

enum class ConflictResolution : unsigned char {
	KeepLocal,
	ReloadFromDisk
};

// Backup retention: a record survives only while it is within the newest
// backupRetentionCount records and younger than backupRetentionAgeSeconds.
// A zero bound is disabled.
struct SESSION_EXPORT SessionConfig final {
	bool autosaveEnabled = true;
	int autosaveIntervalSeconds = Constants::kDefaultAutosaveIntervalSeconds;
	bool backupsEnabled = true;
	int backupRetentionCount = Constants::kDefaultBackupRetentionCount;
	qint64 backupRetentionAgeSeconds = Constants::kDefaultBackupRetentionAgeSeconds;
	QString backupRoot;
	QString fallbackEncoding = QString::fromLatin1(Constants::kDefaultFallbackEncoding);
	bool flushOnExit = true;
	bool asyncIo = true;
	int maxRecentFiles = Constants::kDefaultMaxRecentFiles;
};

} // namespace Session::Api

Q_DECLARE_METATYPE(Session::Api::DocumentInfo)
Q_DECLARE_METATYPE(Session::Api::BackupRecord)
Q_DECLARE_METATYPE(Session::Api::ExternalChangeEvent)
