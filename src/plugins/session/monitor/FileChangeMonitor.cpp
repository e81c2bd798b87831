// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/monitor/FileChangeMonitor.hpp"

#include "session/Constants.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QFileInfo>
#include <QtCore/QFileSystemWatcher>

#include <algorithm>

namespace Session::Internal {

using Api::ExternalChangeEvent;
using Api::ExternalChangeKind;

FileChangeMonitor::FileChangeMonitor(QObject* parent)
    : QObject(parent)
    , m_watcher(new QFileSystemWatcher(this))
    , m_debounceMs(Constants::kMonitorDebounceMs)
{
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(m_debounceMs);

    connect(&m_flushTimer, &QTimer::timeout, this, &FileChangeMonitor::flushChanges);
    connect(&m_pollTimer, &QTimer::timeout, this, &FileChangeMonitor::pollNow);

    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &FileChangeMonitor::handleFileChanged);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &FileChangeMonitor::handleDirectoryChanged);
}

FileChangeMonitor::Fingerprint FileChangeMonitor::fingerprintOf(const QString& path)
{
    const QFileInfo info(path);
    Fingerprint fp;
    fp.exists = info.exists() && info.isFile();
    if (fp.exists) {
        fp.modified = info.lastModified();
        fp.size = info.size();
    }
    return fp;
}

void FileChangeMonitor::attachWatcher(const Entry& entry)
{
    if (!m_watcher)
        return;

    if (entry.fingerprint.exists && !m_watcher->files().contains(entry.path))
        m_watcher->addPath(entry.path);
    if (QFileInfo::exists(entry.directory) && !m_watcher->directories().contains(entry.directory))
        m_watcher->addPath(entry.directory);
}

void FileChangeMonitor::releaseDirectory(const QString& directory)
{
    auto it = m_directoryRefs.find(directory);
    if (it == m_directoryRefs.end())
        return;

    if (--it.value() > 0)
        return;

    m_directoryRefs.erase(it);
    if (m_watcher && m_watcher->directories().contains(directory))
        m_watcher->removePath(directory);
}

void FileChangeMonitor::watch(const QString& path)
{
    const QString absolute = Utils::PathUtils::absoluteCleanPath(path);
    if (absolute.isEmpty())
        return;

    const QString key = Utils::PathUtils::pathLookupKey(absolute);
    if (m_entries.contains(key)) {
        rewatch(absolute);
        return;
    }

    Entry entry;
    entry.path = absolute;
    entry.directory = Utils::PathUtils::parentDirectory(absolute);
    entry.fingerprint = fingerprintOf(absolute);

    ++m_directoryRefs[entry.directory];
    attachWatcher(entry);
    m_entries.insert(key, entry);
}

void FileChangeMonitor::unwatch(const QString& path)
{
    const QString key = Utils::PathUtils::pathLookupKey(Utils::PathUtils::absoluteCleanPath(path));
    const auto it = m_entries.constFind(key);
    if (it == m_entries.cend())
        return;

    const Entry entry = it.value();
    m_entries.erase(it);
    m_pending.remove(key);

    if (m_watcher && m_watcher->files().contains(entry.path))
        m_watcher->removePath(entry.path);
    releaseDirectory(entry.directory);
}

void FileChangeMonitor::rewatch(const QString& path)
{
    const QString key = Utils::PathUtils::pathLookupKey(Utils::PathUtils::absoluteCleanPath(path));
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return;

    it->fingerprint = fingerprintOf(it->path);
    m_pending.remove(key);
    attachWatcher(it.value());
}

void FileChangeMonitor::clear()
{
    if (m_watcher) {
        const QStringList files = m_watcher->files();
        const QStringList directories = m_watcher->directories();
        if (!files.isEmpty())
            m_watcher->removePaths(files);
        if (!directories.isEmpty())
            m_watcher->removePaths(directories);
    }

    m_entries.clear();
    m_directoryRefs.clear();
    m_pending.clear();
    m_flushTimer.stop();
}

bool FileChangeMonitor::isWatching(const QString& path) const
{
    return m_entries.contains(Utils::PathUtils::pathLookupKey(Utils::PathUtils::absoluteCleanPath(path)));
}

QStringList FileChangeMonitor::watchedPaths() const
{
    QStringList out;
    out.reserve(m_entries.size());
    for (const Entry& entry : m_entries)
        out.push_back(entry.path);
    out.sort();
    return out;
}

int FileChangeMonitor::debounceMs() const
{
    return m_debounceMs;
}

void FileChangeMonitor::setDebounceMs(int ms)
{
    m_debounceMs = std::max(0, ms);
    m_flushTimer.setInterval(m_debounceMs);
}

int FileChangeMonitor::pollIntervalMs() const
{
    return m_pollIntervalMs;
}

void FileChangeMonitor::setPollIntervalMs(int ms)
{
    m_pollIntervalMs = std::max(0, ms);
    if (m_pollIntervalMs == 0) {
        m_pollTimer.stop();
        return;
    }
    m_pollTimer.start(m_pollIntervalMs);
}

void FileChangeMonitor::schedule(const QString& key)
{
    m_pending.insert(key);
    if (!m_flushTimer.isActive())
        m_flushTimer.start();
}

void FileChangeMonitor::handleFileChanged(const QString& path)
{
    const QString key = Utils::PathUtils::pathLookupKey(path);
    if (m_entries.contains(key))
        schedule(key);
}

void FileChangeMonitor::handleDirectoryChanged(const QString& path)
{
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        if (Utils::PathUtils::pathsEqual(it->directory, path))
            schedule(it.key());
    }
}

void FileChangeMonitor::flushChanges()
{
    QStringList keys = m_pending.values();
    m_pending.clear();
    keys.sort();

    for (const QString& key : std::as_const(keys))
        check(key);
}

void FileChangeMonitor::pollNow()
{
    m_flushTimer.stop();
    m_pending.clear();

    QStringList keys = m_entries.keys();
    keys.sort();
    for (const QString& key : std::as_const(keys))
        check(key);
}

void FileChangeMonitor::check(const QString& key)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return;

    const Fingerprint current = fingerprintOf(it->path);
    const Fingerprint previous = it->fingerprint;
    it->fingerprint = current;
    attachWatcher(it.value());

    if (current == previous)
        return;

    ExternalChangeEvent event;
    event.path = it->path;
    if (!current.exists) {
        if (!previous.exists)
            return;
        event.kind = ExternalChangeKind::Deleted;
    } else {
        event.kind = ExternalChangeKind::Modified;
    }

    qCDebug(sessionlog).noquote() << QStringLiteral("External %1 of %2")
                                         .arg(event.kind == ExternalChangeKind::Deleted ? QStringLiteral("delete")
                                                                                        : QStringLiteral("change"),
                                              event.path);
    emit changeDetected(event);
}

} // namespace Session::Internal
