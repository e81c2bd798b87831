// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <utils/EnvironmentQtPolicy.hpp>

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Session::Internal {

// Session settings live in the global INI file; the recent-files list is a global
// state document and the open-document list is stored per session.
class SESSION_EXPORT SessionConfigStore final
{
public:
    SessionConfigStore();
    explicit SessionConfigStore(Utils::Environment environment);

    Api::SessionConfig loadConfig() const;
    void saveConfig(const Api::SessionConfig& config);

    QStringList recentFiles() const;
    Utils::StateSaveResult addRecentFile(const QString& path, int maxEntries);
    Utils::StateSaveResult clearRecentFiles();

    QStringList openDocuments() const;
    Utils::StateSaveResult saveOpenDocuments(const QStringList& paths);

    const Utils::Environment& environment() const noexcept { return m_env; }

    static Utils::Environment makeEnvironment(const QString& sessionKey = {});

private:
    Utils::StateSaveResult savePathList(Utils::EnvironmentScope scope, const QString& stateName,
                                        const QStringList& paths);
    QStringList loadPathList(Utils::EnvironmentScope scope, const QString& stateName) const;

    Utils::Environment m_env;
};

} // namespace Session::Internal
