// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"

#include "utils/PathUtils.hpp"
#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QStandardPaths>

namespace Utils {

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    EnvironmentPaths out;

    const QString appCfg =
        !cfg.configRootOverride.isEmpty()
            ? cfg.configRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);

    const QString appName = cfg.applicationName.isEmpty() ? QStringLiteral("Qalam") : cfg.applicationName;
    out.globalConfigDir = QDir(QDir(appCfg).filePath(appName)).absolutePath();

    const QString sessionKey = cfg.sessionKey.isEmpty() ? QStringLiteral("default")
                                                        : PathUtils::stablePathKey(cfg.sessionKey, 40);
    out.sessionConfigDir =
        QDir(QDir(out.globalConfigDir).filePath(QStringLiteral("sessions/%1").arg(sessionKey))).absolutePath();

    return out;
}

QString QtEnvironmentPersistencePolicy::scopeDir(EnvironmentScope scope, const EnvironmentPaths& paths)
{
    switch (scope) {
    case EnvironmentScope::Global:
        return paths.globalConfigDir;
    case EnvironmentScope::Session:
        return paths.sessionConfigDir;
    }
    return paths.globalConfigDir;
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::openSettings(EnvironmentScope scope, const EnvironmentPaths& paths) const
{
    const QString file = scope == EnvironmentScope::Global ? QStringLiteral("qalam.ini")
                                                           : QStringLiteral("session.ini");
    auto h = SettingsHandle{};
    h.settings = std::make_unique<QSettings>(QDir(scopeDir(scope, paths)).filePath(file), QSettings::IniFormat);
    h.settings->setFallbacksEnabled(false);
    return h;
}

QVariant QtEnvironmentPersistencePolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtEnvironmentPersistencePolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (!h.settings) return;
    h.settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::syncSettings(SettingsHandle& h) const
{
    if (!h.settings) return;
    h.settings->sync();
    if (h.settings->status() != QSettings::NoError)
        qCWarning(utilslog) << "Failed to sync settings file:" << h.settings->fileName();
}

bool QtEnvironmentPersistencePolicy::ensureScopeStorage(EnvironmentScope scope, const EnvironmentPaths& paths,
                                                        QString* error) const
{
    const QString dir = scopeDir(scope, paths);
    if (dir.isEmpty()) {
        if (error) *error = QStringLiteral("Scope storage directory is empty.");
        return false;
    }

    QDir d(dir);
    if (d.exists() || d.mkpath(QStringLiteral(".")))
        return true;

    if (error) *error = QStringLiteral("Failed to create directory: %1").arg(dir);
    return false;
}

QString QtEnvironmentPersistencePolicy::stateFilePath(EnvironmentScope scope,
                                                     const EnvironmentPaths& paths,
                                                     QStringView name,
                                                     bool backup)
{
    const QString file = backup
        ? QStringLiteral("%1.json.bak").arg(name.toString())
        : QStringLiteral("%1.json").arg(name.toString());

    return QDir(scopeDir(scope, paths)).filePath(QStringLiteral("state/%1").arg(file));
}

bool QtEnvironmentPersistencePolicy::readStateBytes(EnvironmentScope scope, const EnvironmentPaths& paths,
                                                    QStringView name, bool useBackup,
                                                    QByteArray* out, QString* error) const
{
    const QString path = stateFilePath(scope, paths, name, useBackup);

    QByteArray bytes;
    const FileSystemUtils::ReadResult read = FileSystemUtils::readFileBytes(path, bytes);
    if (!read) {
        // not found is not an error
        if (error)
            *error = read.kind == FileSystemUtils::ReadFailure::NotFound ? QString() : read.message();
        return false;
    }

    if (out) *out = bytes;
    if (error) error->clear();
    return true;
}

bool QtEnvironmentPersistencePolicy::writeStateBytesAtomic(EnvironmentScope scope, const EnvironmentPaths& paths,
                                                           QStringView name, const QByteArray& bytes,
                                                           QString* error) const
{
    const QString primary = stateFilePath(scope, paths, name, /*backup=*/false);
    const QString backup  = stateFilePath(scope, paths, name, /*backup=*/true);

    if (QFile::exists(primary)) {
        if (QFile::exists(backup) && !QFile::remove(backup))
            qCWarning(utilslog) << "Failed to remove stale state backup:" << backup;
        if (!QFile::copy(primary, backup))
            qCWarning(utilslog) << "Failed to copy state document to backup:" << backup;
    }

    const FileSystemUtils::WriteResult written = FileSystemUtils::writeFileAtomically(primary, bytes);
    if (!written) {
        if (error) *error = written.message();
        return false;
    }

    if (error) error->clear();
    return true;
}

} // namespace Utils
