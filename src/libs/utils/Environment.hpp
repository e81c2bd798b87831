// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <cstddef>
#include <utility>

namespace Utils {

enum class EnvironmentScope : unsigned char {
    Global,
    Session
};

struct EnvironmentConfig final {
    QString applicationName;

    QString configRootOverride;
    // Identifies the session scope, e.g. the directory the editor was started in.
    QString sessionKey;

    std::size_t maxStateDocumentBytes = 1u * 1024u * 1024u;   // 1 MiB
};

struct EnvironmentPaths final {
    QString globalConfigDir;
    QString sessionConfigDir;
};

struct StateLoadResult final {
    enum class Status : unsigned char {
        Ok,
        NotFound,
        Corrupt
    };

    Status status = Status::NotFound;
    QJsonObject object;
    bool fromBackup = false;
    QString error;
};

enum class StateError : unsigned char {
    None,
    Storage,
    TooLarge,
    Write
};

using StateSaveResult = BasicResult<StateError>;

// Settings plus JSON state documents, with the storage backend supplied by a policy.
// The policy keeps the logic testable without touching the user's real config dir.
template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths() const noexcept { return m_paths; }

    Policy& policy() noexcept { return m_policy; }
    const Policy& policy() const noexcept { return m_policy; }

    QVariant setting(EnvironmentScope scope, QStringView key, const QVariant& def = {}) const
    {
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsValue(h, key, def);
    }

    void setSetting(EnvironmentScope scope, QStringView key, const QVariant& value)
    {
        auto h = m_policy.openSettings(scope, m_paths);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    // Primary document first, then the backup copy written before the last save.
    StateLoadResult loadState(EnvironmentScope scope, QStringView name) const
    {
        StateLoadResult result;

        for (const bool useBackup : {false, true}) {
            QByteArray bytes;
            QString err;
            if (!m_policy.readStateBytes(scope, m_paths, name, useBackup, &bytes, &err)) {
                if (!err.isEmpty())
                    result.error = err;
                continue;
            }

            StateLoadResult parsed = parseJson(bytes, useBackup);
            if (parsed.status == StateLoadResult::Status::Ok)
                return parsed;
            result.error = parsed.error;
        }

        result.status = result.error.isEmpty() ? StateLoadResult::Status::NotFound
                                               : StateLoadResult::Status::Corrupt;
        return result;
    }

    StateSaveResult saveState(EnvironmentScope scope, QStringView name, const QJsonObject& object) const
    {
        QString err;
        if (!m_policy.ensureScopeStorage(scope, m_paths, &err)) {
            return StateSaveResult::failure(StateError::Storage,
                                            err.isEmpty() ? QStringLiteral("Failed to ensure storage.") : err);
        }

        const QByteArray bytes = QJsonDocument(object).toJson(QJsonDocument::Compact);
        if (static_cast<std::size_t>(bytes.size()) > m_config.maxStateDocumentBytes) {
            return StateSaveResult::failure(
                StateError::TooLarge,
                QStringLiteral("State document exceeds maxStateDocumentBytes (limit: %1).")
                    .arg(m_config.maxStateDocumentBytes));
        }

        if (!m_policy.writeStateBytesAtomic(scope, m_paths, name, bytes, &err))
            return StateSaveResult::failure(StateError::Write, err);

        return StateSaveResult::success();
    }

private:
    StateLoadResult parseJson(const QByteArray& bytes, bool fromBackup) const
    {
        StateLoadResult result;
        result.fromBackup = fromBackup;

        if (static_cast<std::size_t>(bytes.size()) > m_config.maxStateDocumentBytes) {
            result.status = StateLoadResult::Status::Corrupt;
            result.error = QStringLiteral("State document exceeds maxStateDocumentBytes (limit: %1).")
                               .arg(m_config.maxStateDocumentBytes);
            return result;
        }

        QJsonParseError pe{};
        const QJsonDocument doc = QJsonDocument::fromJson(bytes, &pe);
        if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
            result.status = StateLoadResult::Status::Corrupt;
            result.error = QStringLiteral("Invalid JSON state document.");
            return result;
        }

        result.status = StateLoadResult::Status::Ok;
        result.object = doc.object();
        return result;
    }

    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils
