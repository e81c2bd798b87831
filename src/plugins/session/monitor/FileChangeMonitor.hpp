// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <QtCore/QTimer>

QT_BEGIN_NAMESPACE
class QFileSystemWatcher;
QT_END_NAMESPACE

namespace Session::Internal {

// Watches individual files and reports them as modified or deleted once the
// notifications settle. A file's parent directory is watched too, so a file
// that is deleted and recreated is still noticed.
class SESSION_EXPORT FileChangeMonitor final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int debounceMs READ debounceMs WRITE setDebounceMs)
    Q_PROPERTY(int pollIntervalMs READ pollIntervalMs WRITE setPollIntervalMs)

public:
    explicit FileChangeMonitor(QObject* parent = nullptr);

    void watch(const QString& path);
    void unwatch(const QString& path);
    // Takes the current on-disk state as the new baseline and restores the watch,
    // which replace-by-rename writes drop.
    void rewatch(const QString& path);
    void clear();

    bool isWatching(const QString& path) const;
    QStringList watchedPaths() const;

    int debounceMs() const;
    void setDebounceMs(int ms);

    // 0 disables polling.
    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    // Checks every watched file now, bypassing the debounce.
    void pollNow();

signals:
    void changeDetected(const Session::Api::ExternalChangeEvent& event);

private slots:
    void handleFileChanged(const QString& path);
    void handleDirectoryChanged(const QString& path);
    void flushChanges();

private:
    struct Fingerprint final {
        bool exists = false;
        QDateTime modified;
        qint64 size = -1;

        bool operator==(const Fingerprint&) const = default;
    };

    struct Entry final {
        QString path;
        QString directory;
        Fingerprint fingerprint;
    };

    static Fingerprint fingerprintOf(const QString& path);

    void schedule(const QString& key);
    void check(const QString& key);
    void attachWatcher(const Entry& entry);
    void releaseDirectory(const QString& directory);

    QPointer<QFileSystemWatcher> m_watcher;
    QHash<QString, Entry> m_entries;
    QHash<QString, int> m_directoryRefs;
    QSet<QString> m_pending;
    QTimer m_flushTimer;
    QTimer m_pollTimer;
    int m_debounceMs = 0;
    int m_pollIntervalMs = 0;
};

} // namespace Session::Internal
