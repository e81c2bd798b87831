// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/api/ISessionStateManager.hpp"
#include "session/backup/BackupStore.hpp"

#include <utils/filesystem/FileSystemUtils.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QThreadPool>
#include <QtCore/QVector>

#include <functional>

namespace Session::Internal {

class SESSION_EXPORT SessionStateManagerImpl final : public Session::Api::ISessionStateManager {
	Q_OBJECT

public:
	using Clock = std::function<QDateTime()>;

	explicit SessionStateManagerImpl(QObject* parent = nullptr);
	~SessionStateManagerImpl() override;

	Api::SessionResult openDocument(const QString& path, Api::DocumentInfo& outDocument) override;
	void openDocumentAsync(const QString& path) override;
	Api::DocumentInfo createUntitled() override;

	void markDirty(const QString& path) override;
	void updateBuffer(const QString& path, const QString& text) override;

	Api::SessionResult save(const QString& path) override;
	Api::SessionResult saveAs(const QString& path, const QString& newPath) override;
	Api::SessionResult saveAll() override;

	Api::SessionResult autoSaveTick() override;
	int autoSaveTickAsync() override;
	Api::SessionResult flush() override;
	Api::SessionResult backupUnsaved() override;

	Api::SessionResult reconcile(const Api::ExternalChangeEvent& event) override;
	Api::SessionResult resolveConflict(const QString& path, Api::ConflictResolution resolution) override;

	Api::SessionResult closeDocument(const QString& path, bool discard = false) override;
	Api::SessionResult closeAll(bool discard) override;

	Api::SessionResult pruneBackups(const QString& path) override;
	QVector<Api::BackupRecord> backups(const QString& path) const override;
	Api::SessionResult restoreBackup(const QString& path, const QDateTime& createdAt) override;

	Api::DocumentInfo document(const QString& path) const override;
	bool isTracked(const QString& path) const override;
	bool isDirty(const QString& path) const override;
	QVector<Api::DocumentInfo> openDocuments() const override;

	Api::SessionConfig config() const override;
	void setConfig(const Api::SessionConfig& config) override;

	void setClock(Clock clock);
	// Called on the writing thread just before a temporary file replaces its target.
	void setCommitGate(Utils::FileSystemUtils::CommitGate gate);

	int pendingAutoSaves() const noexcept { return m_autoSavesInFlight; }
	bool isOpening(const QString& path) const;

	static QString normalizeDocumentPath(const QString& path);

private:
	struct DocumentState final {
		Api::DocumentInfo info;
		QString diskText;
		QString pendingWriteText;
		bool writeInFlight = false;
		quint64 token = 0;
		quint64 appliedWriteSerial = 0;
	};

	struct AutoSaveJob final {
		QString path;
		quint64 token = 0;
		quint64 revision = 0;
		quint64 serial = 0;
		QString text;
		QByteArray bytes;
		Api::BackupRecord backup;
	};

	struct AutoSaveOutcome final {
		Api::SessionResult backupResult;
		Api::SessionResult writeResult;
	};

	DocumentState* mutableState(const QString& path);
	const DocumentState* state(const QString& path) const;

	void insertDocument(DocumentState state);
	void removeDocument(const QString& key);
	void rekeyDocument(const QString& oldKey, const QString& newPath);

	void setDirty(DocumentState& state, bool dirty);
	void markSynced(DocumentState& state, const QString& text, quint64 serial);
	void applyDiskText(DocumentState& state, const QString& text, const Api::TextEncoding& encoding,
					   Api::LineEnding lineEnding);

	Api::SessionResult encodeBuffer(const DocumentState& state, QByteArray& outBytes) const;
	Api::SessionResult writeCanonical(DocumentState& state, const QString& targetPath, const QByteArray& bytes);
	Api::SessionResult backupThenWrite(DocumentState& state, const QByteArray& bytes, Api::BackupRecord& outRecord);
	Api::SessionResult autoSaveDocument(const QString& key);
	Api::SessionResult pruneBackupsFor(const QString& path);
	bool isAutoSaveCandidate(const DocumentState& state) const;

	Api::SessionResult orphanDocument(DocumentState& state);
	Api::SessionResult reconcileModified(DocumentState& state);
	Api::SessionResult reconcileRenamed(DocumentState& state, const QString& newPath);

	void handleAsyncOpenFinished(const QString& key, const QString& path, quint64 token,
								 const Api::SessionResult& result, const Api::DocumentInfo& loaded);
	void handleAutoSaveFinished(const AutoSaveJob& job, const AutoSaveOutcome& outcome);
	void waitForWrites();

	QDateTime now() const;
	Utils::FileSystemUtils::AtomicWriteOptions writeOptions() const;

	QHash<QString, DocumentState> m_documents;
	QVector<QString> m_openOrder;
	QHash<QString, quint64> m_pendingOpens;
	BackupStore m_backups;
	Api::SessionConfig m_config;
	Clock m_clock;
	Utils::FileSystemUtils::CommitGate m_commitGate;
	QThreadPool m_ioPool;
	quint64 m_nextToken = 0;
	quint64 m_nextWriteSerial = 0;
	int m_untitledCounter = 0;
	int m_autoSavesInFlight = 0;
};

} // namespace Session::Internal
