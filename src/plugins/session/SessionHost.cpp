// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/SessionHost.hpp"

#include "session/internal/SessionStateManagerImpl.hpp"
#include "session/monitor/FileChangeMonitor.hpp"
#include "session/state/SessionConfigStore.hpp"

#include <QtCore/QStringList>

#include <utility>

Q_LOGGING_CATEGORY(sessionlog, "qalam.session")

namespace Session {

SessionHost::SessionHost(QObject* parent)
    : SessionHost(std::make_unique<Internal::SessionConfigStore>(), parent)
{
}

SessionHost::SessionHost(std::unique_ptr<Internal::SessionConfigStore> store, QObject* parent)
    : QObject(parent)
    , m_store(std::move(store))
    , m_manager(new Internal::SessionStateManagerImpl(this))
    , m_monitor(new Internal::FileChangeMonitor(this))
{
    if (!m_store)
        m_store = std::make_unique<Internal::SessionConfigStore>();

    connect(&m_autosaveTimer, &QTimer::timeout, this, &SessionHost::triggerAutoSave);
    wireManager();
}

SessionHost::~SessionHost()
{
    if (m_running)
        shutdown();
}

Api::ISessionStateManager* SessionHost::manager() const
{
    return m_manager;
}

Internal::SessionStateManagerImpl* SessionHost::managerImpl() const
{
    return m_manager;
}

Internal::FileChangeMonitor* SessionHost::monitor() const
{
    return m_monitor;
}

Internal::SessionConfigStore* SessionHost::configStore() const
{
    return m_store.get();
}

int SessionHost::autosaveIntervalMs() const
{
    return m_autosaveTimer.interval();
}

void SessionHost::wireManager()
{
    connect(m_monitor, &Internal::FileChangeMonitor::changeDetected, this,
            [this](const Api::ExternalChangeEvent& event) {
                const Api::SessionResult result = m_manager->reconcile(event);
                if (!result && result.kind != Api::SessionError::Conflict)
                    qCWarning(sessionlog).noquote() << QStringLiteral("Reconcile failed: %1").arg(result.message());
            });

    connect(m_manager, &Api::ISessionStateManager::documentOpened, this,
            [this](const Api::DocumentInfo& document) {
                if (document.untitled)
                    return;
                m_monitor->watch(document.path);
                m_store->addRecentFile(document.path, m_manager->config().maxRecentFiles);
                if (m_running)
                    rememberOpenDocuments();
            });

    connect(m_manager, &Api::ISessionStateManager::documentClosed, this, [this](const QString& path) {
        m_monitor->unwatch(path);
        if (m_running)
            rememberOpenDocuments();
    });

    connect(m_manager, &Api::ISessionStateManager::documentSaved, m_monitor,
            [this](const QString& path) { m_monitor->rewatch(path); });
    connect(m_manager, &Api::ISessionStateManager::documentReloaded, m_monitor,
            [this](const QString& path) { m_monitor->rewatch(path); });

    connect(m_manager, &Api::ISessionStateManager::documentRenamed, this,
            [this](const QString& oldPath, const QString& newPath) {
                m_monitor->unwatch(oldPath);
                m_monitor->watch(newPath);
                m_store->addRecentFile(newPath, m_manager->config().maxRecentFiles);
                if (m_running)
                    rememberOpenDocuments();
            });
}

void SessionHost::rememberOpenDocuments()
{
    QStringList paths;
    const QVector<Api::DocumentInfo> documents = m_manager->openDocuments();
    for (const Api::DocumentInfo& document : documents) {
        if (!document.untitled)
            paths.push_back(document.path);
    }
    m_store->saveOpenDocuments(paths);
}

void SessionHost::applyConfig(const Api::SessionConfig& config)
{
    m_manager->setConfig(config);

    const Api::SessionConfig applied = m_manager->config();
    m_autosaveTimer.setInterval(applied.autosaveIntervalSeconds * 1000);
    if (m_running && applied.autosaveEnabled)
        m_autosaveTimer.start();
    else
        m_autosaveTimer.stop();
}

QStringList SessionHost::start()
{
    return start(m_store->loadConfig());
}

QStringList SessionHost::start(const Api::SessionConfig& config)
{
    applyConfig(config);

    QStringList failed;
    const QStringList previous = m_store->openDocuments();
    for (const QString& path : previous) {
        Api::DocumentInfo document;
        const Api::SessionResult opened = m_manager->openDocument(path, document);
        if (!opened) {
            qCWarning(sessionlog).noquote() << QStringLiteral("Could not reopen %1: %2").arg(path, opened.message());
            failed.push_back(path);
        }
    }

    m_running = true;
    applyConfig(m_manager->config());
    rememberOpenDocuments();

    qCInfo(sessionlog).noquote() << QStringLiteral("Session started with %1 document(s)")
                                        .arg(m_manager->openDocuments().size());
    emit started();
    return failed;
}

void SessionHost::triggerAutoSave()
{
    const Api::SessionConfig config = m_manager->config();
    if (config.asyncIo) {
        m_manager->autoSaveTickAsync();
        return;
    }

    const Api::SessionResult result = m_manager->autoSaveTick();
    if (!result)
        qCWarning(sessionlog).noquote() << QStringLiteral("Auto-save cycle failed: %1").arg(result.message());
}

Api::SessionResult SessionHost::shutdown()
{
    m_autosaveTimer.stop();

    Api::SessionResult result;
    if (m_manager->config().flushOnExit)
        result.merge(m_manager->flush());

    // Buffers the flush left dirty go to a backup and are reported before they are dropped.
    result.merge(m_manager->backupUnsaved());

    rememberOpenDocuments();
    m_running = false;

    result.merge(m_manager->closeAll(true));
    m_monitor->clear();

    if (!result)
        qCWarning(sessionlog).noquote() << QStringLiteral("Session stopped with errors: %1").arg(result.message());
    else
        qCInfo(sessionlog) << "Session stopped";

    emit stopped();
    return result;
}

} // namespace Session
