// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "session/SessionHost.hpp"
#include "session/api/ISessionStateManager.hpp"
#include "session/internal/SessionStateManagerImpl.hpp"
#include "session/monitor/FileChangeMonitor.hpp"
#include "session/state/SessionConfigStore.hpp"
#include "session/tests/SessionTestSupport.hpp"

#include <QtCore/QDir>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>

#include <memory>

namespace {

using Session::SessionHost;
using Session::Api::BackupRecord;
using Session::Api::DocumentInfo;
using Session::Api::ISessionStateManager;
using Session::Api::SessionConfig;
using Session::Internal::SessionConfigStore;
using SessionTests::ensureApp;
using SessionTests::readText;
using SessionTests::writeFile;

class SessionHostTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureApp();
        ASSERT_TRUE(m_config.isValid());
        ASSERT_TRUE(m_work.isValid());
    }

    Utils::Environment environment() const
    {
        Utils::EnvironmentConfig cfg;
        cfg.applicationName = QStringLiteral("QalamHostTests");
        cfg.configRootOverride = m_config.path();
        cfg.sessionKey = m_work.path();
        return Utils::Environment(cfg);
    }

    std::unique_ptr<SessionConfigStore> makeStore(const SessionConfig& config = {}) const
    {
        auto store = std::make_unique<SessionConfigStore>(environment());
        store->saveConfig(config);
        return store;
    }

    QString dir() const { return m_work.path(); }

    QTemporaryDir m_config;
    QTemporaryDir m_work;
};

} // namespace

TEST_F(SessionHostTest, StartReopensTheLastSession)
{
    const QString a = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    const QString missing = QDir(dir()).filePath(QStringLiteral("missing.txt"));

    auto store = makeStore();
    ASSERT_TRUE(store->saveOpenDocuments({a, missing}).ok);

    SessionHost host(std::move(store));
    QSignalSpy started(&host, &SessionHost::started);

    const QStringList failed = host.start();
    EXPECT_EQ(failed, QStringList{missing});
    EXPECT_TRUE(host.isRunning());
    EXPECT_EQ(started.count(), 1);
    EXPECT_TRUE(host.manager()->isTracked(a));
    EXPECT_TRUE(host.monitor()->isWatching(a));
    EXPECT_EQ(host.configStore()->openDocuments(), QStringList{a});

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, OpeningAndClosingUpdatesStoredLists)
{
    const QString a = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    const QString b = writeFile(dir(), QStringLiteral("b.txt"), QStringLiteral("b"));

    SessionHost host(makeStore());
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(a, doc).ok);
    ASSERT_TRUE(host.manager()->openDocument(b, doc).ok);
    host.manager()->createUntitled();

    EXPECT_EQ(host.configStore()->openDocuments(), (QStringList{a, b}));
    EXPECT_EQ(host.configStore()->recentFiles(), (QStringList{b, a}));

    ASSERT_TRUE(host.manager()->closeDocument(a).ok);
    EXPECT_FALSE(host.monitor()->isWatching(a));
    EXPECT_EQ(host.configStore()->openDocuments(), QStringList{b});
    EXPECT_EQ(host.configStore()->recentFiles(), (QStringList{b, a}));

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, ExternalEditsReachTheManager)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("before"));

    SessionHost host(makeStore());
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(path, doc).ok);
    QSignalSpy reloaded(host.manager(), &ISessionStateManager::documentReloaded);

    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("after a long edit"));
    host.monitor()->pollNow();

    EXPECT_EQ(reloaded.count(), 1);
    EXPECT_EQ(host.manager()->document(path).text, QStringLiteral("after a long edit"));

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, OwnSavesAreNotReportedBack)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("v1"));

    SessionHost host(makeStore());
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(path, doc).ok);
    QSignalSpy reloaded(host.manager(), &ISessionStateManager::documentReloaded);
    QSignalSpy conflicts(host.manager(), &ISessionStateManager::conflictDetected);

    host.manager()->updateBuffer(path, QStringLiteral("v2 from the editor"));
    ASSERT_TRUE(host.manager()->save(path).ok);
    host.manager()->updateBuffer(path, QStringLiteral("v3"));
    host.monitor()->pollNow();

    EXPECT_EQ(reloaded.count(), 0);
    EXPECT_EQ(conflicts.count(), 0);
    EXPECT_EQ(host.manager()->document(path).text, QStringLiteral("v3"));

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, SaveAsMovesTheWatch)
{
    SessionHost host(makeStore());
    host.start();

    const DocumentInfo untitled = host.manager()->createUntitled();
    host.manager()->updateBuffer(untitled.path, QStringLiteral("draft"));

    const QString target = QDir(dir()).filePath(QStringLiteral("draft.txt"));
    ASSERT_TRUE(host.manager()->saveAs(untitled.path, target).ok);

    EXPECT_TRUE(host.monitor()->isWatching(target));
    EXPECT_EQ(host.configStore()->openDocuments(), QStringList{target});
    EXPECT_EQ(host.configStore()->recentFiles().value(0), target);

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, ConfigDrivesTheAutosaveTimer)
{
    SessionConfig config;
    config.autosaveIntervalSeconds = 7;

    SessionHost host(makeStore(config));
    host.start();
    EXPECT_EQ(host.autosaveIntervalMs(), 7000);

    config.autosaveIntervalSeconds = 0;
    host.applyConfig(config);
    EXPECT_EQ(host.autosaveIntervalMs(), 1000);

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, TimerAutoSavesDirtyDocuments)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("v1"));

    SessionConfig config;
    config.autosaveIntervalSeconds = 1;
    config.asyncIo = false;

    SessionHost host(makeStore(config));
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(path, doc).ok);
    QSignalSpy saved(host.manager(), &ISessionStateManager::documentSaved);

    host.manager()->updateBuffer(path, QStringLiteral("v2"));
    ASSERT_TRUE(saved.wait(5000));

    EXPECT_EQ(readText(path), QStringLiteral("v2"));
    EXPECT_FALSE(host.manager()->isDirty(path));
    EXPECT_EQ(host.manager()->backups(path).size(), 1);

    ASSERT_TRUE(host.shutdown().ok);
}

TEST_F(SessionHostTest, ShutdownFlushesAndRemembersDocuments)
{
    const QString a = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a1"));
    const QString b = writeFile(dir(), QStringLiteral("b.txt"), QStringLiteral("b1"));

    SessionHost host(makeStore());
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(a, doc).ok);
    ASSERT_TRUE(host.manager()->openDocument(b, doc).ok);
    host.manager()->updateBuffer(a, QStringLiteral("a2"));
    ASSERT_EQ(host.managerImpl()->autoSaveTickAsync(), 1);
    host.manager()->updateBuffer(b, QStringLiteral("b2"));

    QSignalSpy stopped(&host, &SessionHost::stopped);
    const auto r = host.shutdown();
    ASSERT_TRUE(r.ok) << r.errors.join("\n").toStdString();

    EXPECT_EQ(stopped.count(), 1);
    EXPECT_FALSE(host.isRunning());
    EXPECT_EQ(readText(a), QStringLiteral("a2"));
    EXPECT_EQ(readText(b), QStringLiteral("b2"));
    EXPECT_TRUE(host.manager()->openDocuments().isEmpty());
    EXPECT_TRUE(host.monitor()->watchedPaths().isEmpty());
    EXPECT_EQ(host.configStore()->openDocuments(), (QStringList{a, b}));
}

TEST_F(SessionHostTest, ShutdownWithoutFlushKeepsEditsInABackup)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("v1"));

    SessionConfig config;
    config.flushOnExit = false;

    SessionHost host(makeStore(config));
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(path, doc).ok);
    host.manager()->updateBuffer(path, QStringLiteral("v2"));
    QSignalSpy created(host.manager(), &ISessionStateManager::backupCreated);

    const auto r = host.shutdown();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, Session::Api::SessionError::UnsavedChanges);
    EXPECT_EQ(readText(path), QStringLiteral("v1"));

    ASSERT_EQ(created.count(), 1);
    EXPECT_EQ(readText(created.at(0).at(0).value<BackupRecord>().backupFilePath), QStringLiteral("v2"));
    EXPECT_FALSE(host.isRunning());
    EXPECT_TRUE(host.manager()->openDocuments().isEmpty());
    EXPECT_EQ(host.configStore()->openDocuments(), QStringList{path});
}

TEST_F(SessionHostTest, ShutdownWithConflictedDocumentKeepsItsEdits)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("base"));

    SessionHost host(makeStore());
    host.start();

    DocumentInfo doc;
    ASSERT_TRUE(host.manager()->openDocument(path, doc).ok);
    host.manager()->updateBuffer(path, QStringLiteral("local"));

    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("external edit"));
    host.monitor()->pollNow();
    ASSERT_TRUE(host.manager()->document(path).conflicted);

    QSignalSpy created(host.manager(), &ISessionStateManager::backupCreated);
    const auto r = host.shutdown();

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, Session::Api::SessionError::Conflict);
    EXPECT_EQ(readText(path), QStringLiteral("external edit"));

    ASSERT_EQ(created.count(), 1);
    const auto record = created.at(0).at(0).value<BackupRecord>();
    EXPECT_EQ(record.documentPath, path);
    EXPECT_EQ(readText(record.backupFilePath), QStringLiteral("local"));
    EXPECT_TRUE(r.message().contains(record.backupFilePath));
}

TEST_F(SessionHostTest, ConfigOverridesAreNotPersisted)
{
    SessionConfig stored;
    stored.autosaveIntervalSeconds = 7;

    SessionHost host(makeStore(stored));

    SessionConfig overridden = host.configStore()->loadConfig();
    overridden.autosaveIntervalSeconds = 3;
    overridden.asyncIo = false;
    overridden.backupRoot = QDir(dir()).filePath(QStringLiteral("backups"));
    host.start(overridden);

    EXPECT_EQ(host.autosaveIntervalMs(), 3000);
    EXPECT_FALSE(host.manager()->config().asyncIo);
    EXPECT_EQ(host.manager()->config().backupRoot, overridden.backupRoot);

    overridden.autosaveIntervalSeconds = 4;
    host.applyConfig(overridden);
    EXPECT_EQ(host.autosaveIntervalMs(), 4000);

    const SessionConfig reloaded = host.configStore()->loadConfig();
    EXPECT_EQ(reloaded.autosaveIntervalSeconds, 7);
    EXPECT_TRUE(reloaded.asyncIo);
    EXPECT_TRUE(reloaded.backupRoot.isEmpty());

    ASSERT_TRUE(host.shutdown().ok);
}
