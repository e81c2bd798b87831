// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/backup/BackupStore.hpp"

#include "session/Constants.hpp"

#include <utils/PathUtils.hpp>
#include <utils/filesystem/FileSystemUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QTimeZone>

#include <algorithm>
#include <utility>

namespace Session::Internal {

namespace {

using Api::BackupRecord;
using Api::SessionError;
using Api::SessionResult;

bool recordLess(const BackupRecord& lhs, const BackupRecord& rhs)
{
    if (lhs.createdAt != rhs.createdAt)
        return lhs.createdAt < rhs.createdAt;
    return lhs.sequence < rhs.sequence;
}

QDateTime truncatedToMillis(const QDateTime& dt)
{
    return QDateTime::fromMSecsSinceEpoch(dt.toMSecsSinceEpoch(), QTimeZone::utc());
}

QDateTime parseTimestamp(const QString& stamp)
{
    const QString format = QString::fromLatin1(Constants::kBackupTimestampFormat);
    const QDateTime local = QDateTime::fromString(stamp, format);
    if (!local.isValid())
        return {};
    return QDateTime(local.date(), local.time(), QTimeZone::utc());
}

} // namespace

BackupStore::BackupStore(Clock clock)
    : m_clock(std::move(clock))
{
}

void BackupStore::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

QDateTime BackupStore::now() const
{
    return truncatedToMillis(m_clock ? m_clock() : QDateTime::currentDateTimeUtc());
}

QString BackupStore::backupRoot() const
{
    return m_backupRoot;
}

void BackupStore::setBackupRoot(const QString& root)
{
    m_backupRoot = Utils::PathUtils::absoluteCleanPath(root);
}

QString BackupStore::backupDirectoryFor(const QString& documentPath) const
{
    const QString parent = Utils::PathUtils::parentDirectory(documentPath);
    if (m_backupRoot.isEmpty())
        return QDir(parent).filePath(QString::fromLatin1(Constants::kBackupDirName));

    return QDir(m_backupRoot).filePath(Utils::PathUtils::stablePathKey(parent));
}

QString BackupStore::backupFileName(const QString& documentPath, const QDateTime& createdAt, int sequence)
{
    QString name = Utils::PathUtils::basename(documentPath);
    name += u'.';
    name += createdAt.toUTC().toString(QString::fromLatin1(Constants::kBackupTimestampFormat));
    if (sequence > 0)
        name += QStringLiteral("-%1").arg(sequence);
    name += QString::fromLatin1(Constants::kBackupSuffix);
    return name;
}

BackupStore::Cursor BackupStore::nextCursor(const QString& key)
{
    Cursor last = m_lastPlanned.value(key);
    const auto recordsIt = m_records.constFind(key);
    if (recordsIt != m_records.cend() && !recordsIt->isEmpty()) {
        const BackupRecord& newest = recordsIt->constLast();
        const bool newerOnDisk = !last.createdAt.isValid()
                                 || newest.createdAt > last.createdAt
                                 || (newest.createdAt == last.createdAt && newest.sequence > last.sequence);
        if (newerOnDisk) {
            last.createdAt = newest.createdAt;
            last.sequence = newest.sequence;
        }
    }

    Cursor next;
    next.createdAt = now();
    if (last.createdAt.isValid() && next.createdAt <= last.createdAt) {
        next.createdAt = last.createdAt;
        next.sequence = last.sequence + 1;
    }

    m_lastPlanned.insert(key, next);
    return next;
}

BackupRecord BackupStore::planBackup(const QString& documentPath)
{
    const QString key = Utils::PathUtils::pathLookupKey(documentPath);
    const Cursor cursor = nextCursor(key);

    BackupRecord record;
    record.documentPath = documentPath;
    record.createdAt = cursor.createdAt;
    record.sequence = cursor.sequence;
    record.backupFilePath = QDir(backupDirectoryFor(documentPath))
                                .filePath(backupFileName(documentPath, cursor.createdAt, cursor.sequence));
    return record;
}

void BackupStore::commitBackup(const BackupRecord& record)
{
    if (!record.isValid())
        return;

    auto& list = m_records[Utils::PathUtils::pathLookupKey(record.documentPath)];
    const auto pos = std::upper_bound(list.begin(), list.end(), record, recordLess);
    list.insert(pos, record);
}

SessionResult BackupStore::createBackup(const QString& documentPath, const QByteArray& bytes, BackupRecord& outRecord)
{
    outRecord = {};

    BackupRecord record = planBackup(documentPath);
    const auto written = Utils::FileSystemUtils::writeFileAtomically(record.backupFilePath, bytes);
    if (!written) {
        return SessionResult::failure(SessionError::WriteError,
                                      QStringLiteral("Failed to create backup for %1: %2")
                                          .arg(documentPath, written.message()));
    }

    record.sizeBytes = bytes.size();
    commitBackup(record);
    outRecord = record;
    return SessionResult::success();
}

int BackupStore::discoverExisting(const QString& documentPath)
{
    const QString key = Utils::PathUtils::pathLookupKey(documentPath);
    const QDir dir(backupDirectoryFor(documentPath));
    if (!dir.exists())
        return 0;

    const QString base = Utils::PathUtils::basename(documentPath);
    const QRegularExpression pattern(
        QStringLiteral("^%1\\.(\\d{8}T\\d{9})(?:-(\\d+))?%2$")
            .arg(QRegularExpression::escape(base),
                 QRegularExpression::escape(QString::fromLatin1(Constants::kBackupSuffix))));

    QVector<BackupRecord> found;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden);
    for (const QFileInfo& info : entries) {
        const QRegularExpressionMatch match = pattern.match(info.fileName());
        if (!match.hasMatch())
            continue;

        const QDateTime createdAt = parseTimestamp(match.captured(1));
        if (!createdAt.isValid())
            continue;

        BackupRecord record;
        record.documentPath = documentPath;
        record.backupFilePath = info.absoluteFilePath();
        record.createdAt = createdAt;
        record.sequence = match.captured(2).isEmpty() ? 0 : match.captured(2).toInt();
        record.sizeBytes = info.size();
        found.push_back(record);
    }

    auto& list = m_records[key];
    for (const BackupRecord& record : std::as_const(found)) {
        const bool known = std::any_of(list.cbegin(), list.cend(), [&](const BackupRecord& existing) {
            return Utils::PathUtils::pathsEqual(existing.backupFilePath, record.backupFilePath);
        });
        if (!known)
            list.push_back(record);
    }
    std::sort(list.begin(), list.end(), recordLess);

    return found.size();
}

QVector<BackupRecord> BackupStore::records(const QString& documentPath) const
{
    return m_records.value(Utils::PathUtils::pathLookupKey(documentPath));
}

BackupRecord BackupStore::findRecord(const QString& documentPath, const QDateTime& createdAt) const
{
    const QVector<BackupRecord> list = records(documentPath);
    // Newest first, so a timestamp shared by several records resolves to the latest one.
    for (auto it = list.crbegin(); it != list.crend(); ++it) {
        if (it->createdAt == createdAt)
            return *it;
    }
    return {};
}

SessionResult BackupStore::prune(const QString& documentPath, int maxCount, qint64 maxAgeSeconds)
{
    const QString key = Utils::PathUtils::pathLookupKey(documentPath);
    auto it = m_records.find(key);
    if (it == m_records.end() || it->isEmpty())
        return SessionResult::success();

    QVector<BackupRecord>& list = *it;
    const qsizetype total = list.size();

    qsizetype keepFrom = 0;
    if (maxCount > 0 && total > maxCount)
        keepFrom = total - maxCount;

    if (maxAgeSeconds > 0) {
        const QDateTime cutoff = now().addSecs(-maxAgeSeconds);
        while (keepFrom < total && list.at(keepFrom).createdAt < cutoff)
            ++keepFrom;
    }

    SessionResult result = SessionResult::success();
    QVector<BackupRecord> survivors;
    survivors.reserve(total - keepFrom);

    for (qsizetype i = 0; i < total; ++i) {
        const BackupRecord& record = list.at(i);
        if (i >= keepFrom) {
            survivors.push_back(record);
            continue;
        }

        QFile file(record.backupFilePath);
        if (file.exists() && !file.remove()) {
            result.addError(SessionError::WriteError,
                            QStringLiteral("Failed to remove backup %1: %2")
                                .arg(record.backupFilePath, file.errorString()));
            survivors.push_back(record);
            continue;
        }

        qCDebug(sessionlog) << "Session: pruned backup" << record.backupFilePath;
    }

    list = std::move(survivors);
    return result;
}

void BackupStore::rekey(const QString& oldPath, const QString& newPath)
{
    const QString oldKey = Utils::PathUtils::pathLookupKey(oldPath);
    const QString newKey = Utils::PathUtils::pathLookupKey(newPath);
    if (oldKey == newKey)
        return;

    QVector<BackupRecord> moved = m_records.take(oldKey);
    for (BackupRecord& record : moved)
        record.documentPath = newPath;

    auto& target = m_records[newKey];
    target.append(moved);
    std::sort(target.begin(), target.end(), recordLess);

    if (m_lastPlanned.contains(oldKey))
        m_lastPlanned.insert(newKey, m_lastPlanned.take(oldKey));
}

void BackupStore::forget(const QString& documentPath)
{
    const QString key = Utils::PathUtils::pathLookupKey(documentPath);
    m_records.remove(key);
    m_lastPlanned.remove(key);
}

} // namespace Session::Internal
