// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QObject>
#include <QtCore/QVector>

namespace Session::Api {

// Tracks open documents, their dirty/saved state, auto-save and backup rotation.
// All calls and signals happen on the thread that owns the manager.
class SESSION_EXPORT ISessionStateManager : public QObject {
	Q_OBJECT

public:
	using QObject::QObject;
	~ISessionStateManager() override = default;

	virtual SessionResult openDocument(const QString& path, DocumentInfo& outDocument) = 0;
	virtual void openDocumentAsync(const QString& path) = 0;
	virtual DocumentInfo createUntitled() = 0;

	virtual void markDirty(const QString& path) = 0;
	virtual void updateBuffer(const QString& path, const QString& text) = 0;

	virtual SessionResult save(const QString& path) = 0;
	virtual SessionResult saveAs(const QString& path, const QString& newPath) = 0;
	virtual SessionResult saveAll() = 0;

	virtual SessionResult autoSaveTick() = 0;
	virtual int autoSaveTickAsync() = 0;
	virtual SessionResult flush() = 0;
	// Snapshots every dirty buffer that is still unsaved into a backup without touching
	// its file. Each such document is reported as an error, so a caller about to discard
	// buffers learns what was kept where.
	virtual SessionResult backupUnsaved() = 0;

	virtual SessionResult reconcile(const ExternalChangeEvent& event) = 0;
	virtual SessionResult resolveConflict(const QString& path, ConflictResolution resolution) = 0;

	virtual SessionResult closeDocument(const QString& path, bool discard = false) = 0;
	virtual SessionResult closeAll(bool discard) = 0;

	virtual SessionResult pruneBackups(const QString& path) = 0;
	virtual QVector<BackupRecord> backups(const QString& path) const = 0;
	virtual SessionResult restoreBackup(const QString& path, const QDateTime& createdAt) = 0;

	virtual DocumentInfo document(const QString& path) const = 0;
	virtual bool isTracked(const QString& path) const = 0;
	virtual bool isDirty(const QString& path) const = 0;
	virtual QVector<DocumentInfo> openDocuments() const = 0;

	virtual SessionConfig config() const = 0;
	virtual void setConfig(const SessionConfig& config) = 0;

signals:
	void documentOpened(const Session::Api::DocumentInfo& document);
	void openFailed(const QString& path, const QString& error);
	void documentClosed(const QString& path);
	void documentSaved(const QString& path);
	void saveFailed(const QString& path, const QString& error);
	void dirtyStateChanged(const QString& path, bool dirty);
	void documentReloaded(const QString& path);
	void documentOrphaned(const QString& path);
	void documentRenamed(const QString& oldPath, const QString& newPath);
	void conflictDetected(const QString& path);
	void backupCreated(const Session::Api::BackupRecord& record);
	void autoSaveIdle();
};

} // namespace Session::Api
