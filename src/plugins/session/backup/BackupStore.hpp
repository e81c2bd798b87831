// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>

namespace Session::Internal {

class SESSION_EXPORT BackupStore final
{
public:
    using Clock = std::function<QDateTime()>;

    explicit BackupStore(Clock clock = {});

    void setClock(Clock clock);
    QDateTime now() const;

    QString backupRoot() const;
    void setBackupRoot(const QString& root);

    QString backupDirectoryFor(const QString& documentPath) const;

    // Reserves the next record for `documentPath`. Timestamps never go backwards;
    // records sharing a millisecond get increasing sequence numbers.
    Api::BackupRecord planBackup(const QString& documentPath);
    void commitBackup(const Api::BackupRecord& record);

    Api::SessionResult createBackup(const QString& documentPath,
                                    const QByteArray& bytes,
                                    Api::BackupRecord& outRecord);

    // Loads records left on disk by earlier runs. Returns the number found.
    int discoverExisting(const QString& documentPath);

    QVector<Api::BackupRecord> records(const QString& documentPath) const;
    Api::BackupRecord findRecord(const QString& documentPath, const QDateTime& createdAt) const;

    Api::SessionResult prune(const QString& documentPath, int maxCount, qint64 maxAgeSeconds);

    void rekey(const QString& oldPath, const QString& newPath);
    void forget(const QString& documentPath);

    static QString backupFileName(const QString& documentPath, const QDateTime& createdAt, int sequence);

private:
    struct Cursor final {
        QDateTime createdAt;
        int sequence = 0;
    };

    Cursor nextCursor(const QString& key);

    Clock m_clock;
    QString m_backupRoot;
    QHash<QString, QVector<Api::BackupRecord>> m_records;
    QHash<QString, Cursor> m_lastPlanned;
};

} // namespace Session::Internal
