// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QStringList>
#include <QtCore/QTimer>

#include <memory>

namespace Session {

namespace Internal {
class FileChangeMonitor;
class SessionConfigStore;
class SessionStateManagerImpl;
} // namespace Internal

namespace Api {
class ISessionStateManager;
} // namespace Api

// Application-level owner of the session: one manager, its auto-save timer,
// the file monitor and the persisted configuration.
class SESSION_EXPORT SessionHost final : public QObject
{
    Q_OBJECT

public:
    explicit SessionHost(QObject* parent = nullptr);
    explicit SessionHost(std::unique_ptr<Internal::SessionConfigStore> store, QObject* parent = nullptr);
    ~SessionHost() override;

    Api::ISessionStateManager* manager() const;
    Internal::SessionStateManagerImpl* managerImpl() const;
    Internal::FileChangeMonitor* monitor() const;
    Internal::SessionConfigStore* configStore() const;

    void applyConfig(const Api::SessionConfig& config);

    // Loads the stored configuration and reopens the documents of the last run.
    // Returns the paths that failed to reopen.
    QStringList start();
    // Same, but runs with `config` in place of the stored one, which is left untouched.
    QStringList start(const Api::SessionConfig& config);
    Api::SessionResult shutdown();
    bool isRunning() const noexcept { return m_running; }

    void triggerAutoSave();

    int autosaveIntervalMs() const;

signals:
    void started();
    void stopped();

private:
    void wireManager();
    void rememberOpenDocuments();

    std::unique_ptr<Internal::SessionConfigStore> m_store;
    Internal::SessionStateManagerImpl* m_manager = nullptr;
    Internal::FileChangeMonitor* m_monitor = nullptr;
    QTimer m_autosaveTimer;
    bool m_running = false;
};

} // namespace Session
