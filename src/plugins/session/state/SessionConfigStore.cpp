// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/state/SessionConfigStore.hpp"

#include "session/Constants.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QSet>

#include <algorithm>
#include <utility>

namespace Session::Internal {

namespace {

using namespace Qt::StringLiterals;

const QString kAutosaveEnabledKey = u"session/autosaveEnabled"_s;
const QString kAutosaveIntervalKey = u"session/autosaveIntervalSeconds"_s;
const QString kBackupsEnabledKey = u"session/backupsEnabled"_s;
const QString kBackupRetentionCountKey = u"session/backupRetentionCount"_s;
const QString kBackupRetentionAgeKey = u"session/backupRetentionAgeSeconds"_s;
const QString kBackupRootKey = u"session/backupRoot"_s;
const QString kFallbackEncodingKey = u"session/fallbackEncoding"_s;
const QString kFlushOnExitKey = u"session/flushOnExit"_s;
const QString kAsyncIoKey = u"session/asyncIo"_s;
const QString kMaxRecentFilesKey = u"session/maxRecentFiles"_s;

const QString kRecentFilesState = u"session/recentFiles"_s;
const QString kOpenDocumentsState = u"session/openDocuments"_s;
const QString kPathsKey = u"paths"_s;

QString normalizedFilePath(const QString& path)
{
    if (path.startsWith(QLatin1String(Constants::kUntitledScheme)))
        return {};
    return Utils::PathUtils::absoluteCleanPath(path);
}

QStringList uniquePaths(const QStringList& paths)
{
    QStringList out;
    QSet<QString> seen;
    for (const QString& raw : paths) {
        const QString path = normalizedFilePath(raw);
        if (path.isEmpty())
            continue;
        const QString key = Utils::PathUtils::pathLookupKey(path);
        if (seen.contains(key))
            continue;
        seen.insert(key);
        out.push_back(path);
    }
    return out;
}

} // namespace

SessionConfigStore::SessionConfigStore()
    : m_env(makeEnvironment())
{
}

SessionConfigStore::SessionConfigStore(Utils::Environment environment)
    : m_env(std::move(environment))
{
}

Utils::Environment SessionConfigStore::makeEnvironment(const QString& sessionKey)
{
    Utils::EnvironmentConfig cfg;
    cfg.applicationName = QStringLiteral("Qalam");
    cfg.sessionKey = sessionKey;
    return Utils::Environment(cfg);
}

Api::SessionConfig SessionConfigStore::loadConfig() const
{
    using Utils::EnvironmentScope;

    const Api::SessionConfig defaults;
    Api::SessionConfig config;

    config.autosaveEnabled = m_env.setting(EnvironmentScope::Global, kAutosaveEnabledKey, defaults.autosaveEnabled).toBool();
    config.autosaveIntervalSeconds = std::max(
        1, m_env.setting(EnvironmentScope::Global, kAutosaveIntervalKey, defaults.autosaveIntervalSeconds).toInt());
    config.backupsEnabled = m_env.setting(EnvironmentScope::Global, kBackupsEnabledKey, defaults.backupsEnabled).toBool();
    config.backupRetentionCount = std::max(
        0, m_env.setting(EnvironmentScope::Global, kBackupRetentionCountKey, defaults.backupRetentionCount).toInt());
    config.backupRetentionAgeSeconds = std::max<qint64>(
        0,
        m_env.setting(EnvironmentScope::Global, kBackupRetentionAgeKey, defaults.backupRetentionAgeSeconds).toLongLong());
    config.backupRoot = m_env.setting(EnvironmentScope::Global, kBackupRootKey, defaults.backupRoot).toString().trimmed();

    const QString fallback =
        m_env.setting(EnvironmentScope::Global, kFallbackEncodingKey, defaults.fallbackEncoding).toString().trimmed();
    config.fallbackEncoding = fallback.isEmpty() ? defaults.fallbackEncoding : fallback;

    config.flushOnExit = m_env.setting(EnvironmentScope::Global, kFlushOnExitKey, defaults.flushOnExit).toBool();
    config.asyncIo = m_env.setting(EnvironmentScope::Global, kAsyncIoKey, defaults.asyncIo).toBool();
    config.maxRecentFiles =
        std::max(0, m_env.setting(EnvironmentScope::Global, kMaxRecentFilesKey, defaults.maxRecentFiles).toInt());

    return config;
}

void SessionConfigStore::saveConfig(const Api::SessionConfig& config)
{
    using Utils::EnvironmentScope;

    m_env.setSetting(EnvironmentScope::Global, kAutosaveEnabledKey, config.autosaveEnabled);
    m_env.setSetting(EnvironmentScope::Global, kAutosaveIntervalKey, config.autosaveIntervalSeconds);
    m_env.setSetting(EnvironmentScope::Global, kBackupsEnabledKey, config.backupsEnabled);
    m_env.setSetting(EnvironmentScope::Global, kBackupRetentionCountKey, config.backupRetentionCount);
    m_env.setSetting(EnvironmentScope::Global, kBackupRetentionAgeKey, config.backupRetentionAgeSeconds);
    m_env.setSetting(EnvironmentScope::Global, kBackupRootKey, config.backupRoot);
    m_env.setSetting(EnvironmentScope::Global, kFallbackEncodingKey, config.fallbackEncoding);
    m_env.setSetting(EnvironmentScope::Global, kFlushOnExitKey, config.flushOnExit);
    m_env.setSetting(EnvironmentScope::Global, kAsyncIoKey, config.asyncIo);
    m_env.setSetting(EnvironmentScope::Global, kMaxRecentFilesKey, config.maxRecentFiles);
}

QStringList SessionConfigStore::loadPathList(Utils::EnvironmentScope scope, const QString& stateName) const
{
    const auto loaded = m_env.loadState(scope, stateName);
    if (loaded.status != Utils::StateLoadResult::Status::Ok) {
        if (loaded.status == Utils::StateLoadResult::Status::Corrupt)
            qCWarning(sessionlog).noquote() << QStringLiteral("Ignoring %1: %2").arg(stateName, loaded.error);
        return {};
    }

    QStringList paths;
    const QJsonArray array = loaded.object.value(kPathsKey).toArray();
    paths.reserve(array.size());
    for (const QJsonValue& value : array)
        paths.push_back(value.toString());
    return uniquePaths(paths);
}

Utils::StateSaveResult SessionConfigStore::savePathList(Utils::EnvironmentScope scope, const QString& stateName,
                                                        const QStringList& paths)
{
    QJsonArray array;
    for (const QString& path : paths)
        array.push_back(path);

    QJsonObject document;
    document.insert(kPathsKey, array);

    const Utils::StateSaveResult saved = m_env.saveState(scope, stateName, document);
    if (!saved)
        qCWarning(sessionlog).noquote() << QStringLiteral("Failed to store %1: %2").arg(stateName, saved.message());
    return saved;
}

QStringList SessionConfigStore::recentFiles() const
{
    return loadPathList(Utils::EnvironmentScope::Global, kRecentFilesState);
}

Utils::StateSaveResult SessionConfigStore::addRecentFile(const QString& path, int maxEntries)
{
    const QString normalized = normalizedFilePath(path);
    if (normalized.isEmpty())
        return Utils::StateSaveResult::success();

    QStringList paths = recentFiles();
    paths.removeIf([&](const QString& existing) { return Utils::PathUtils::pathsEqual(existing, normalized); });
    paths.prepend(normalized);

    if (maxEntries >= 0 && paths.size() > maxEntries)
        paths.resize(maxEntries);

    return savePathList(Utils::EnvironmentScope::Global, kRecentFilesState, paths);
}

Utils::StateSaveResult SessionConfigStore::clearRecentFiles()
{
    return savePathList(Utils::EnvironmentScope::Global, kRecentFilesState, {});
}

QStringList SessionConfigStore::openDocuments() const
{
    return loadPathList(Utils::EnvironmentScope::Session, kOpenDocumentsState);
}

Utils::StateSaveResult SessionConfigStore::saveOpenDocuments(const QStringList& paths)
{
    return savePathList(Utils::EnvironmentScope::Session, kOpenDocumentsState, uniquePaths(paths));
}

} // namespace Session::Internal
