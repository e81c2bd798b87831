// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/internal/SessionStateManagerImpl.hpp"

#include "session/Constants.hpp"
#include "session/codec/TextFileCodec.hpp"

#include <utils/PathUtils.hpp>
#include <utils/async/AsyncTask.hpp>

#include <QtCore/QEventLoop>
#include <QtCore/QFileInfo>

#include <algorithm>
#include <utility>

namespace Session::Internal {

namespace {

using Api::BackupRecord;
using Api::DocumentInfo;
using Api::ExternalChangeEvent;
using Api::ExternalChangeKind;
using Api::SessionError;
using Api::SessionResult;

struct LoadedDocument final {
    SessionResult result;
    bool missing = false;
    TextCodec::DecodedText decoded;
};

// Runs on worker threads as well as the main thread; touches no manager state.
LoadedDocument loadDocumentFile(const QString& path, const QString& fallbackEncoding)
{
    LoadedDocument loaded;

    QByteArray bytes;
    const auto read = Utils::FileSystemUtils::readFileBytes(path, bytes, Constants::kDocumentOpenMaxBytes);
    if (!read) {
        loaded.missing = read.kind == Utils::FileSystemUtils::ReadFailure::NotFound;
        loaded.result = SessionResult::failure(SessionError::ReadError, read.errors);
        return loaded;
    }

    const TextCodec::CodecResult decoded = TextCodec::decode(bytes, fallbackEncoding, loaded.decoded);
    if (!decoded) {
        loaded.result = SessionResult::failure(SessionError::ReadError,
                                               QStringLiteral("Cannot decode %1: %2").arg(path, decoded.message()));
    }
    return loaded;
}

DocumentInfo makeDocumentInfo(const QString& path, const TextCodec::DecodedText& decoded, const QDateTime& syncedAt)
{
    DocumentInfo info;
    info.path = path;
    info.text = decoded.text;
    info.encoding = decoded.encoding;
    info.lineEnding = decoded.lineEnding;
    info.lastSyncedAt = syncedAt;
    return info;
}

bool isUntitledPath(const QString& path)
{
    return path.startsWith(QLatin1String(Constants::kUntitledScheme));
}

QString documentKey(const QString& normalizedPath)
{
    return Utils::PathUtils::pathLookupKey(normalizedPath);
}

} // namespace

SessionStateManagerImpl::SessionStateManagerImpl(QObject* parent)
    : Session::Api::ISessionStateManager(parent)
{
    qRegisterMetaType<Api::DocumentInfo>();
    qRegisterMetaType<Api::BackupRecord>();
    qRegisterMetaType<Api::ExternalChangeEvent>();

    // One writer thread keeps background writes in submission order.
    m_ioPool.setMaxThreadCount(1);
}

SessionStateManagerImpl::~SessionStateManagerImpl()
{
    m_ioPool.waitForDone();
}

QString SessionStateManagerImpl::normalizeDocumentPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (isUntitledPath(trimmed))
        return trimmed;
    return Utils::PathUtils::absoluteCleanPath(trimmed);
}

void SessionStateManagerImpl::setClock(Clock clock)
{
    m_clock = clock;
    m_backups.setClock(std::move(clock));
}

void SessionStateManagerImpl::setCommitGate(Utils::FileSystemUtils::CommitGate gate)
{
    m_commitGate = std::move(gate);
}

QDateTime SessionStateManagerImpl::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTimeUtc();
}

Utils::FileSystemUtils::AtomicWriteOptions SessionStateManagerImpl::writeOptions() const
{
    Utils::FileSystemUtils::AtomicWriteOptions options;
    options.commitGate = m_commitGate;
    return options;
}

Api::SessionConfig SessionStateManagerImpl::config() const
{
    return m_config;
}

void SessionStateManagerImpl::setConfig(const Api::SessionConfig& config)
{
    m_config = config;
    m_config.autosaveIntervalSeconds = std::max(1, m_config.autosaveIntervalSeconds);
    m_config.backupRetentionCount = std::max(0, m_config.backupRetentionCount);
    m_config.backupRetentionAgeSeconds = std::max<qint64>(0, m_config.backupRetentionAgeSeconds);
    m_config.maxRecentFiles = std::max(0, m_config.maxRecentFiles);
    m_backups.setBackupRoot(m_config.backupRoot);
}

SessionStateManagerImpl::DocumentState* SessionStateManagerImpl::mutableState(const QString& path)
{
    auto it = m_documents.find(documentKey(path));
    return it == m_documents.end() ? nullptr : &it.value();
}

const SessionStateManagerImpl::DocumentState* SessionStateManagerImpl::state(const QString& path) const
{
    auto it = m_documents.constFind(documentKey(path));
    return it == m_documents.cend() ? nullptr : &it.value();
}

void SessionStateManagerImpl::insertDocument(DocumentState state)
{
    const QString key = documentKey(state.info.path);
    const QString path = state.info.path;
    const bool untitled = state.info.untitled;

    state.token = ++m_nextToken;
    if (!m_openOrder.contains(key))
        m_openOrder.push_back(key);
    m_documents.insert(key, std::move(state));

    if (!untitled)
        m_backups.discoverExisting(path);
}

void SessionStateManagerImpl::removeDocument(const QString& key)
{
    const auto it = m_documents.constFind(key);
    if (it == m_documents.cend())
        return;

    if (!it->info.untitled)
        m_backups.forget(it->info.path);
    m_documents.erase(it);
    m_openOrder.removeAll(key);
}

void SessionStateManagerImpl::rekeyDocument(const QString& oldKey, const QString& newPath)
{
    DocumentState moved = m_documents.take(oldKey);
    moved.info.path = newPath;

    const QString newKey = documentKey(newPath);
    m_documents.insert(newKey, std::move(moved));

    const qsizetype index = m_openOrder.indexOf(oldKey);
    if (index >= 0)
        m_openOrder[index] = newKey;
    else
        m_openOrder.push_back(newKey);
}

void SessionStateManagerImpl::setDirty(DocumentState& state, bool dirty)
{
    if (state.info.dirty == dirty)
        return;
    state.info.dirty = dirty;
    emit dirtyStateChanged(state.info.path, dirty);
}

void SessionStateManagerImpl::markSynced(DocumentState& state, const QString& text, quint64 serial)
{
    state.diskText = text;
    state.appliedWriteSerial = serial;
    state.info.lastSyncedAt = now();
    state.info.orphaned = false;
}

void SessionStateManagerImpl::applyDiskText(DocumentState& state, const QString& text,
                                            const Api::TextEncoding& encoding, Api::LineEnding lineEnding)
{
    state.info.text = text;
    state.info.encoding = encoding;
    state.info.lineEnding = lineEnding;
    state.info.conflicted = false;
    state.info.orphaned = false;
    ++state.info.revision;
    state.diskText = text;
    state.info.lastSyncedAt = now();
}

Api::SessionResult SessionStateManagerImpl::encodeBuffer(const DocumentState& state, QByteArray& outBytes) const
{
    const TextCodec::CodecResult encoded = TextCodec::encode(state.info.text, state.info.encoding, outBytes);
    if (!encoded) {
        return SessionResult::failure(SessionError::WriteError,
                                      QStringLiteral("Cannot encode %1 as %2: %3")
                                          .arg(state.info.path, state.info.encoding.name, encoded.message()));
    }
    return SessionResult::success();
}

void SessionStateManagerImpl::waitForWrites()
{
    m_ioPool.waitForDone();
}

Api::SessionResult SessionStateManagerImpl::writeCanonical(DocumentState& state, const QString& targetPath,
                                                           const QByteArray& bytes)
{
    // A background write for this document must land before a newer synchronous one.
    if (state.writeInFlight)
        waitForWrites();

    const auto written = Utils::FileSystemUtils::writeFileAtomically(targetPath, bytes, writeOptions());
    if (!written)
        return SessionResult::failure(SessionError::WriteError, written.errors);
    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::backupThenWrite(DocumentState& state, const QByteArray& bytes,
                                                            BackupRecord& outRecord)
{
    const QString path = state.info.path;

    SessionResult result;
    if (m_config.backupsEnabled)
        result = m_backups.createBackup(path, bytes, outRecord);

    // Without its backup the canonical file is left alone.
    if (result)
        result = writeCanonical(state, path, bytes);
    return result;
}

Api::SessionResult SessionStateManagerImpl::openDocument(const QString& path, DocumentInfo& outDocument)
{
    outDocument = {};

    const QString normalized = normalizeDocumentPath(path);
    if (normalized.isEmpty()) {
        const QString message = QStringLiteral("Cannot open document: path is empty.");
        emit openFailed(path, message);
        return SessionResult::failure(SessionError::ReadError, message);
    }

    if (const DocumentState* existing = state(normalized)) {
        outDocument = existing->info;
        return SessionResult::success();
    }

    if (isUntitledPath(normalized)) {
        const QString message = QStringLiteral("Untitled document is not open: %1").arg(normalized);
        emit openFailed(normalized, message);
        return SessionResult::failure(SessionError::ReadError, message);
    }

    m_pendingOpens.remove(documentKey(normalized));

    const LoadedDocument loaded = loadDocumentFile(normalized, m_config.fallbackEncoding);
    if (!loaded.result) {
        qCWarning(sessionlog).noquote() << QStringLiteral("Open failed: %1").arg(loaded.result.message());
        emit openFailed(normalized, loaded.result.message());
        return loaded.result;
    }

    DocumentState created;
    created.info = makeDocumentInfo(normalized, loaded.decoded, now());
    created.diskText = created.info.text;
    outDocument = created.info;
    insertDocument(std::move(created));

    qCInfo(sessionlog).noquote() << QStringLiteral("Opened %1 (%2)").arg(normalized, outDocument.encoding.name);
    emit documentOpened(outDocument);
    return SessionResult::success();
}

void SessionStateManagerImpl::openDocumentAsync(const QString& path)
{
    const QString normalized = normalizeDocumentPath(path);
    if (normalized.isEmpty() || isUntitledPath(normalized)) {
        DocumentInfo existing;
        if (openDocument(path, existing))
            emit documentOpened(existing);
        return;
    }

    if (const DocumentState* existing = state(normalized)) {
        emit documentOpened(existing->info);
        return;
    }

    const QString key = documentKey(normalized);
    if (m_pendingOpens.contains(key))
        return;

    const quint64 token = ++m_nextToken;
    m_pendingOpens.insert(key, token);

    const QString fallback = m_config.fallbackEncoding;
    Utils::Async::run<LoadedDocument>(
        this,
        [normalized, fallback]() { return loadDocumentFile(normalized, fallback); },
        [this, key, normalized, token](LoadedDocument loaded) {
            DocumentInfo info;
            if (loaded.result)
                info = makeDocumentInfo(normalized, loaded.decoded, now());
            handleAsyncOpenFinished(key, normalized, token, loaded.result, info);
        },
        &m_ioPool);
}

bool SessionStateManagerImpl::isOpening(const QString& path) const
{
    return m_pendingOpens.contains(documentKey(normalizeDocumentPath(path)));
}

void SessionStateManagerImpl::handleAsyncOpenFinished(const QString& key, const QString& path, quint64 token,
                                                      const SessionResult& result, const DocumentInfo& loaded)
{
    const auto pending = m_pendingOpens.constFind(key);
    if (pending == m_pendingOpens.cend() || pending.value() != token) {
        qCDebug(sessionlog).noquote() << QStringLiteral("Dropping stale open of %1").arg(path);
        return;
    }
    m_pendingOpens.erase(pending);

    if (m_documents.contains(key))
        return;

    if (!result) {
        qCWarning(sessionlog).noquote() << QStringLiteral("Open failed: %1").arg(result.message());
        emit openFailed(path, result.message());
        return;
    }

    DocumentState created;
    created.info = loaded;
    created.diskText = loaded.text;
    insertDocument(std::move(created));

    qCInfo(sessionlog).noquote() << QStringLiteral("Opened %1 (%2)").arg(path, loaded.encoding.name);
    emit documentOpened(loaded);
}

Api::DocumentInfo SessionStateManagerImpl::createUntitled()
{
    DocumentState created;
    created.info.path = QStringLiteral("%1%2").arg(QLatin1String(Constants::kUntitledScheme)).arg(++m_untitledCounter);
    created.info.untitled = true;
    created.info.dirty = true;

    const DocumentInfo info = created.info;
    insertDocument(std::move(created));

    emit documentOpened(info);
    return info;
}

void SessionStateManagerImpl::markDirty(const QString& path)
{
    DocumentState* s = mutableState(normalizeDocumentPath(path));
    if (!s)
        return;

    // The revision moves even when already dirty so a pending background save
    // knows the buffer changed after its snapshot.
    ++s->info.revision;
    setDirty(*s, true);
}

void SessionStateManagerImpl::updateBuffer(const QString& path, const QString& text)
{
    DocumentState* s = mutableState(normalizeDocumentPath(path));
    if (!s || s->info.text == text)
        return;

    s->info.text = text;
    ++s->info.revision;
    setDirty(*s, true);
}

Api::SessionResult SessionStateManagerImpl::save(const QString& path)
{
    const QString normalized = normalizeDocumentPath(path);
    DocumentState* s = mutableState(normalized);
    if (!s)
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));

    const QString documentPath = s->info.path;
    BackupRecord record;
    SessionResult result;
    if (s->info.untitled) {
        result = SessionResult::failure(SessionError::WriteError,
                                        QStringLiteral("%1 has no file path; use Save As.").arg(documentPath));
    } else {
        QByteArray bytes;
        result = encodeBuffer(*s, bytes);
        if (result)
            result = backupThenWrite(*s, bytes, record);
    }

    if (!result) {
        qCWarning(sessionlog).noquote() << QStringLiteral("Save failed: %1").arg(result.message());
        emit saveFailed(documentPath, result.message());
        return result;
    }

    markSynced(*s, s->info.text, ++m_nextWriteSerial);
    s->info.conflicted = false;
    setDirty(*s, false);

    qCInfo(sessionlog).noquote() << QStringLiteral("Saved %1").arg(documentPath);
    if (record.isValid())
        emit backupCreated(record);
    emit documentSaved(documentPath);
    return pruneBackupsFor(documentPath);
}

Api::SessionResult SessionStateManagerImpl::saveAs(const QString& path, const QString& newPath)
{
    const QString normalized = normalizeDocumentPath(path);
    DocumentState* s = mutableState(normalized);
    if (!s)
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));

    const QString oldPath = s->info.path;
    const QString target = normalizeDocumentPath(newPath);
    if (target.isEmpty() || isUntitledPath(target)) {
        const QString message = QStringLiteral("Invalid target path for %1: '%2'").arg(oldPath, newPath);
        emit saveFailed(oldPath, message);
        return SessionResult::failure(SessionError::WriteError, message);
    }

    const QString oldKey = documentKey(oldPath);
    const QString newKey = documentKey(target);
    if (oldKey == newKey && !s->info.untitled)
        return save(oldPath);

    if (m_documents.contains(newKey)) {
        const QString message = QStringLiteral("Cannot save %1 as %2: target is already open.").arg(oldPath, target);
        emit saveFailed(oldPath, message);
        return SessionResult::failure(SessionError::WriteError, message);
    }

    // Overwriting a file on disk gets the same backup an ordinary save of it would.
    const bool backupTarget = m_config.backupsEnabled && QFileInfo::exists(target);

    QByteArray bytes;
    BackupRecord record;
    SessionResult result = encodeBuffer(*s, bytes);
    if (result && backupTarget) {
        m_backups.discoverExisting(target);
        result = m_backups.createBackup(target, bytes, record);
    }
    if (result)
        result = writeCanonical(*s, target, bytes);
    if (!result) {
        if (backupTarget)
            m_backups.forget(target);
        qCWarning(sessionlog).noquote() << QStringLiteral("Save As failed: %1").arg(result.message());
        emit saveFailed(oldPath, result.message());
        return result;
    }

    const bool wasUntitled = s->info.untitled;
    rekeyDocument(oldKey, target);
    if (!wasUntitled)
        m_backups.forget(oldPath);
    m_backups.discoverExisting(target);

    s = mutableState(target);
    s->info.untitled = false;
    s->info.conflicted = false;
    markSynced(*s, s->info.text, ++m_nextWriteSerial);
    setDirty(*s, false);

    qCInfo(sessionlog).noquote() << QStringLiteral("Saved %1 as %2").arg(oldPath, target);
    emit documentRenamed(oldPath, target);
    if (record.isValid())
        emit backupCreated(record);
    emit documentSaved(target);
    return backupTarget ? pruneBackupsFor(target) : SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::saveAll()
{
    SessionResult result;

    const QVector<QString> order = m_openOrder;
    for (const QString& key : order) {
        const auto it = m_documents.constFind(key);
        if (it == m_documents.cend() || !it->info.dirty || it->info.untitled)
            continue;

        if (it->info.conflicted) {
            result.addError(SessionError::Conflict,
                            QStringLiteral("%1 changed on disk; resolve the conflict before saving.")
                                .arg(it->info.path));
            continue;
        }

        result.merge(save(it->info.path));
    }

    return result;
}

bool SessionStateManagerImpl::isAutoSaveCandidate(const DocumentState& state) const
{
    return state.info.dirty && !state.info.untitled && !state.info.conflicted && !state.writeInFlight;
}

Api::SessionResult SessionStateManagerImpl::pruneBackupsFor(const QString& path)
{
    const SessionResult pruned =
        m_backups.prune(path, m_config.backupRetentionCount, m_config.backupRetentionAgeSeconds);
    if (!pruned)
        qCWarning(sessionlog).noquote() << QStringLiteral("Backup pruning failed: %1").arg(pruned.message());
    return pruned;
}

Api::SessionResult SessionStateManagerImpl::autoSaveDocument(const QString& key)
{
    DocumentState* s = &m_documents[key];
    const QString path = s->info.path;

    QByteArray bytes;
    BackupRecord record;
    SessionResult result = encodeBuffer(*s, bytes);
    if (result)
        result = backupThenWrite(*s, bytes, record);

    if (!result) {
        qCWarning(sessionlog).noquote() << QStringLiteral("Auto-save failed: %1").arg(result.message());
        emit saveFailed(path, result.message());
        return result;
    }

    markSynced(*s, s->info.text, ++m_nextWriteSerial);
    setDirty(*s, false);

    qCDebug(sessionlog).noquote() << QStringLiteral("Auto-saved %1").arg(path);
    if (record.isValid())
        emit backupCreated(record);
    emit documentSaved(path);

    return pruneBackupsFor(path);
}

Api::SessionResult SessionStateManagerImpl::autoSaveTick()
{
    SessionResult result;

    const QVector<QString> order = m_openOrder;
    for (const QString& key : order) {
        const auto it = m_documents.constFind(key);
        if (it == m_documents.cend() || !isAutoSaveCandidate(it.value()))
            continue;
        result.merge(autoSaveDocument(key));
    }

    return result;
}

int SessionStateManagerImpl::autoSaveTickAsync()
{
    int scheduled = 0;

    const QVector<QString> order = m_openOrder;
    for (const QString& key : order) {
        auto it = m_documents.find(key);
        if (it == m_documents.end() || !isAutoSaveCandidate(it.value()))
            continue;

        DocumentState& s = it.value();

        AutoSaveJob job;
        job.path = s.info.path;
        job.token = s.token;
        job.revision = s.info.revision;
        job.text = s.info.text;

        const SessionResult encoded = encodeBuffer(s, job.bytes);
        if (!encoded) {
            qCWarning(sessionlog).noquote() << QStringLiteral("Auto-save failed: %1").arg(encoded.message());
            emit saveFailed(job.path, encoded.message());
            continue;
        }

        if (m_config.backupsEnabled)
            job.backup = m_backups.planBackup(job.path);
        job.serial = ++m_nextWriteSerial;

        s.writeInFlight = true;
        s.pendingWriteText = job.text;
        ++m_autoSavesInFlight;
        ++scheduled;

        Utils::FileSystemUtils::AtomicWriteOptions options = writeOptions();
        if (QFileInfo::exists(job.path)) {
            // Renamed or deleted while queued: committing would recreate the old path.
            options.commitGate = [gate = options.commitGate](const QString& target) {
                if (!QFileInfo::exists(target))
                    return false;
                return !gate || gate(target);
            };
        }

        Utils::Async::run<AutoSaveOutcome>(
            this,
            [job, options]() {
                AutoSaveOutcome outcome;
                if (job.backup.isValid()) {
                    const auto backup =
                        Utils::FileSystemUtils::writeFileAtomically(job.backup.backupFilePath, job.bytes);
                    if (!backup) {
                        outcome.backupResult = SessionResult::failure(
                            SessionError::WriteError,
                            QStringLiteral("Failed to create backup for %1: %2").arg(job.path, backup.message()));
                        return outcome;
                    }
                }

                const auto written = Utils::FileSystemUtils::writeFileAtomically(job.path, job.bytes, options);
                if (!written)
                    outcome.writeResult = SessionResult::failure(SessionError::WriteError, written.errors);
                return outcome;
            },
            [this, job](AutoSaveOutcome outcome) { handleAutoSaveFinished(job, outcome); },
            &m_ioPool);
    }

    return scheduled;
}

void SessionStateManagerImpl::handleAutoSaveFinished(const AutoSaveJob& job, const AutoSaveOutcome& outcome)
{
    m_autoSavesInFlight = std::max(0, m_autoSavesInFlight - 1);

    DocumentState* s = nullptr;
    for (auto it = m_documents.begin(); it != m_documents.end(); ++it) {
        if (it->token == job.token) {
            s = &it.value();
            break;
        }
    }

    if (!s) {
        qCDebug(sessionlog).noquote() << QStringLiteral("Dropping auto-save result for closed %1").arg(job.path);
    } else {
        s->writeInFlight = false;
        s->pendingWriteText.clear();

        const QString currentPath = s->info.path;
        const SessionResult written = !outcome.backupResult ? outcome.backupResult : outcome.writeResult;

        if (!Utils::PathUtils::pathsEqual(currentPath, job.path)) {
            qCDebug(sessionlog).noquote()
                << QStringLiteral("Dropping auto-save result for %1, now %2").arg(job.path, currentPath);
        } else if (!written) {
            if (outcome.backupResult && job.backup.isValid()) {
                BackupRecord record = job.backup;
                record.sizeBytes = job.bytes.size();
                m_backups.commitBackup(record);
            }
            qCWarning(sessionlog).noquote() << QStringLiteral("Auto-save failed: %1").arg(written.message());
            emit saveFailed(currentPath, written.message());
        } else {
            BackupRecord record;
            if (job.backup.isValid()) {
                record = job.backup;
                record.sizeBytes = job.bytes.size();
                m_backups.commitBackup(record);
            }

            bool saved = false;
            if (job.serial > s->appliedWriteSerial) {
                markSynced(*s, job.text, job.serial);
                if (s->info.revision == job.revision) {
                    setDirty(*s, false);
                    saved = true;
                }
            }

            qCDebug(sessionlog).noquote() << QStringLiteral("Auto-saved %1").arg(currentPath);
            pruneBackupsFor(currentPath);
            if (record.isValid())
                emit backupCreated(record);
            if (saved)
                emit documentSaved(currentPath);
        }
    }

    if (m_autoSavesInFlight == 0)
        emit autoSaveIdle();
}

Api::SessionResult SessionStateManagerImpl::flush()
{
    if (m_autoSavesInFlight > 0) {
        QEventLoop loop;
        const QMetaObject::Connection connection =
            connect(this, &ISessionStateManager::autoSaveIdle, &loop, &QEventLoop::quit);
        while (m_autoSavesInFlight > 0)
            loop.exec(QEventLoop::ExcludeUserInputEvents);
        disconnect(connection);
    }

    return autoSaveTick();
}

Api::SessionResult SessionStateManagerImpl::backupUnsaved()
{
    SessionResult result;

    const QVector<QString> order = m_openOrder;
    for (const QString& key : order) {
        const auto it = m_documents.find(key);
        if (it == m_documents.end() || !it->info.dirty)
            continue;

        DocumentState& s = it.value();
        const QString path = s.info.path;
        const SessionError kind = s.info.conflicted ? SessionError::Conflict : SessionError::UnsavedChanges;

        if (s.info.untitled) {
            if (!s.info.text.isEmpty())
                result.addError(kind, QStringLiteral("%1 has unsaved changes and no file path.").arg(path));
            continue;
        }

        if (!m_config.backupsEnabled) {
            result.addError(kind, QStringLiteral("%1 has unsaved changes; backups are disabled.").arg(path));
            continue;
        }

        QByteArray bytes;
        BackupRecord record;
        SessionResult kept = encodeBuffer(s, bytes);
        if (kept)
            kept = m_backups.createBackup(path, bytes, record);
        if (!kept) {
            qCWarning(sessionlog).noquote()
                << QStringLiteral("Backup of unsaved %1 failed: %2").arg(path, kept.message());
            result.addError(kind, QStringLiteral("%1 has unsaved changes: %2").arg(path, kept.message()));
            continue;
        }

        qCInfo(sessionlog).noquote() << QStringLiteral("Kept unsaved %1 in %2").arg(path, record.backupFilePath);
        emit backupCreated(record);
        result.addError(kind, QStringLiteral("%1 has unsaved changes; kept in backup %2.")
                                  .arg(path, record.backupFilePath));
        result.merge(pruneBackupsFor(path));
    }

    return result;
}

Api::SessionResult SessionStateManagerImpl::orphanDocument(DocumentState& state)
{
    if (state.info.orphaned)
        return SessionResult::success();

    state.info.orphaned = true;
    qCInfo(sessionlog).noquote() << QStringLiteral("%1 was deleted on disk").arg(state.info.path);
    emit documentOrphaned(state.info.path);
    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::reconcileModified(DocumentState& state)
{
    const QString path = state.info.path;
    const LoadedDocument loaded = loadDocumentFile(path, m_config.fallbackEncoding);
    if (!loaded.result) {
        if (loaded.missing)
            return orphanDocument(state);
        qCWarning(sessionlog).noquote() << QStringLiteral("Reload failed: %1").arg(loaded.result.message());
        return loaded.result;
    }

    state.info.orphaned = false;

    const QString& diskText = loaded.decoded.text;
    if (diskText == state.diskText || (state.writeInFlight && diskText == state.pendingWriteText))
        return SessionResult::success();

    if (!state.info.dirty) {
        applyDiskText(state, diskText, loaded.decoded.encoding, loaded.decoded.lineEnding);
        qCInfo(sessionlog).noquote() << QStringLiteral("Reloaded %1 after external change").arg(path);
        emit documentReloaded(path);
        return SessionResult::success();
    }

    if (diskText == state.info.text) {
        state.diskText = diskText;
        state.info.conflicted = false;
        state.info.lastSyncedAt = now();
        setDirty(state, false);
        return SessionResult::success();
    }

    state.info.conflicted = true;
    qCWarning(sessionlog).noquote() << QStringLiteral("%1 changed on disk while it has unsaved edits").arg(path);
    emit conflictDetected(path);
    return SessionResult::failure(SessionError::Conflict,
                                  QStringLiteral("%1 changed on disk while it has unsaved edits.").arg(path));
}

Api::SessionResult SessionStateManagerImpl::reconcileRenamed(DocumentState& state, const QString& newPath)
{
    const QString oldPath = state.info.path;
    const QString target = normalizeDocumentPath(newPath);
    if (target.isEmpty() || isUntitledPath(target))
        return orphanDocument(state);

    const QString oldKey = documentKey(oldPath);
    const QString newKey = documentKey(target);
    if (oldKey == newKey)
        return SessionResult::success();

    if (m_documents.contains(newKey)) {
        qCInfo(sessionlog).noquote()
            << QStringLiteral("%1 was renamed onto already open %2").arg(oldPath, target);
        return orphanDocument(state);
    }

    // A background write still aimed at the old path must land before the document moves.
    if (state.writeInFlight)
        waitForWrites();

    rekeyDocument(oldKey, target);
    m_backups.rekey(oldPath, target);

    qCInfo(sessionlog).noquote() << QStringLiteral("%1 was renamed to %2").arg(oldPath, target);
    emit documentRenamed(oldPath, target);
    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::reconcile(const ExternalChangeEvent& event)
{
    DocumentState* s = mutableState(normalizeDocumentPath(event.path));
    if (!s || s->info.untitled)
        return SessionResult::success();

    switch (event.kind) {
    case ExternalChangeKind::Modified:
        return reconcileModified(*s);
    case ExternalChangeKind::Deleted:
        // Replace-by-rename editors report a delete for a file that is back already.
        if (QFileInfo::exists(s->info.path))
            return reconcileModified(*s);
        return orphanDocument(*s);
    case ExternalChangeKind::Renamed:
        return reconcileRenamed(*s, event.newPath);
    }

    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::resolveConflict(const QString& path, Api::ConflictResolution resolution)
{
    DocumentState* s = mutableState(normalizeDocumentPath(path));
    if (!s)
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));

    if (!s->info.conflicted)
        return SessionResult::success();

    if (resolution == Api::ConflictResolution::KeepLocal) {
        s->info.conflicted = false;
        qCInfo(sessionlog).noquote() << QStringLiteral("Keeping local edits of %1").arg(s->info.path);
        return SessionResult::success();
    }

    const QString documentPath = s->info.path;
    const LoadedDocument loaded = loadDocumentFile(documentPath, m_config.fallbackEncoding);
    if (!loaded.result)
        return loaded.result;

    applyDiskText(*s, loaded.decoded.text, loaded.decoded.encoding, loaded.decoded.lineEnding);
    setDirty(*s, false);

    qCInfo(sessionlog).noquote() << QStringLiteral("Discarded local edits of %1").arg(documentPath);
    emit documentReloaded(documentPath);
    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::closeDocument(const QString& path, bool discard)
{
    const QString normalized = normalizeDocumentPath(path);
    const QString key = documentKey(normalized);

    const bool cancelledOpen = m_pendingOpens.remove(key) > 0;

    const DocumentState* s = state(normalized);
    if (!s) {
        if (cancelledOpen)
            return SessionResult::success();
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));
    }

    if (s->info.dirty && !discard) {
        return SessionResult::failure(SessionError::UnsavedChanges,
                                      QStringLiteral("%1 has unsaved changes.").arg(s->info.path));
    }

    const QString closedPath = s->info.path;
    removeDocument(key);

    qCInfo(sessionlog).noquote() << QStringLiteral("Closed %1").arg(closedPath);
    emit documentClosed(closedPath);
    return SessionResult::success();
}

Api::SessionResult SessionStateManagerImpl::closeAll(bool discard)
{
    m_pendingOpens.clear();

    SessionResult result;
    const QVector<QString> order = m_openOrder;
    for (const QString& key : order) {
        const auto it = m_documents.constFind(key);
        if (it == m_documents.cend())
            continue;
        result.merge(closeDocument(it->info.path, discard));
    }
    return result;
}

Api::SessionResult SessionStateManagerImpl::pruneBackups(const QString& path)
{
    const DocumentState* s = state(normalizeDocumentPath(path));
    if (!s)
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));
    return pruneBackupsFor(s->info.path);
}

QVector<Api::BackupRecord> SessionStateManagerImpl::backups(const QString& path) const
{
    const DocumentState* s = state(normalizeDocumentPath(path));
    if (!s)
        return {};
    return m_backups.records(s->info.path);
}

Api::SessionResult SessionStateManagerImpl::restoreBackup(const QString& path, const QDateTime& createdAt)
{
    DocumentState* s = mutableState(normalizeDocumentPath(path));
    if (!s)
        return SessionResult::failure(SessionError::NotOpen, QStringLiteral("Document is not open: %1").arg(path));

    const BackupRecord record = m_backups.findRecord(s->info.path, createdAt);
    if (!record.isValid()) {
        return SessionResult::failure(SessionError::ReadError,
                                      QStringLiteral("No backup of %1 at %2")
                                          .arg(s->info.path, createdAt.toString(Qt::ISODateWithMs)));
    }

    QByteArray bytes;
    const auto read = Utils::FileSystemUtils::readFileBytes(record.backupFilePath, bytes,
                                                            Constants::kDocumentOpenMaxBytes);
    if (!read)
        return SessionResult::failure(SessionError::ReadError, read.errors);

    TextCodec::DecodedText decoded;
    const TextCodec::CodecResult decodedResult = TextCodec::decode(bytes, s->info.encoding.name, decoded);
    if (!decodedResult) {
        return SessionResult::failure(SessionError::ReadError,
                                      QStringLiteral("Cannot decode backup %1: %2")
                                          .arg(record.backupFilePath, decodedResult.message()));
    }

    s->info.text = decoded.text;
    ++s->info.revision;
    setDirty(*s, true);

    qCInfo(sessionlog).noquote() << QStringLiteral("Restored %1 from %2").arg(s->info.path, record.backupFilePath);
    return SessionResult::success();
}

Api::DocumentInfo SessionStateManagerImpl::document(const QString& path) const
{
    const DocumentState* s = state(normalizeDocumentPath(path));
    return s ? s->info : DocumentInfo{};
}

bool SessionStateManagerImpl::isTracked(const QString& path) const
{
    return state(normalizeDocumentPath(path)) != nullptr;
}

bool SessionStateManagerImpl::isDirty(const QString& path) const
{
    const DocumentState* s = state(normalizeDocumentPath(path));
    return s && s->info.dirty;
}

QVector<Api::DocumentInfo> SessionStateManagerImpl::openDocuments() const
{
    QVector<DocumentInfo> out;
    out.reserve(m_openOrder.size());
    for (const QString& key : m_openOrder) {
        const auto it = m_documents.constFind(key);
        if (it != m_documents.cend())
            out.push_back(it->info);
    }
    return out;
}

} // namespace Session::Internal
