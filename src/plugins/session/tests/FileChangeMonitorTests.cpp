// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "session/monitor/FileChangeMonitor.hpp"
#include "session/tests/SessionTestSupport.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>

namespace {

using Session::Api::ExternalChangeEvent;
using Session::Api::ExternalChangeKind;
using Session::Internal::FileChangeMonitor;
using SessionTests::ensureApp;
using SessionTests::writeFile;

ExternalChangeEvent eventAt(const QSignalSpy& spy, int index)
{
    return spy.at(index).at(0).value<ExternalChangeEvent>();
}

class FileChangeMonitorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureApp();
        qRegisterMetaType<ExternalChangeEvent>();
        ASSERT_TRUE(m_temp.isValid());
    }

    QString dir() const { return m_temp.path(); }

    QTemporaryDir m_temp;
    FileChangeMonitor monitor;
};

} // namespace

TEST_F(FileChangeMonitorTest, TracksWatchedPaths)
{
    const QString b = writeFile(dir(), QStringLiteral("b.txt"), QStringLiteral("b"));
    const QString a = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));

    monitor.watch(b);
    monitor.watch(a);
    monitor.watch(QDir(dir()).filePath(QStringLiteral("x/../a.txt")));

    EXPECT_EQ(monitor.watchedPaths(), (QStringList{a, b}));
    EXPECT_TRUE(monitor.isWatching(a));

    monitor.unwatch(a);
    EXPECT_FALSE(monitor.isWatching(a));
    EXPECT_TRUE(monitor.isWatching(b));

    monitor.clear();
    EXPECT_TRUE(monitor.watchedPaths().isEmpty());
}

TEST_F(FileChangeMonitorTest, UnchangedFilesStayQuiet)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    monitor.pollNow();
    EXPECT_EQ(changes.count(), 0);
}

TEST_F(FileChangeMonitorTest, ReportsModification)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a longer body"));
    monitor.pollNow();
    monitor.pollNow();

    ASSERT_EQ(changes.count(), 1);
    EXPECT_EQ(eventAt(changes, 0).path, path);
    EXPECT_EQ(eventAt(changes, 0).kind, ExternalChangeKind::Modified);
}

TEST_F(FileChangeMonitorTest, ReportsDeletionOnceAndThenRecreation)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    ASSERT_TRUE(QFile::remove(path));
    monitor.pollNow();
    monitor.pollNow();

    ASSERT_EQ(changes.count(), 1);
    EXPECT_EQ(eventAt(changes, 0).kind, ExternalChangeKind::Deleted);
    EXPECT_TRUE(monitor.isWatching(path));

    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("back"));
    monitor.pollNow();

    ASSERT_EQ(changes.count(), 2);
    EXPECT_EQ(eventAt(changes, 1).kind, ExternalChangeKind::Modified);
}

TEST_F(FileChangeMonitorTest, RewatchTakesTheCurrentFileAsBaseline)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("written by us"));
    monitor.rewatch(path);
    monitor.pollNow();

    EXPECT_EQ(changes.count(), 0);
}

TEST_F(FileChangeMonitorTest, MissingFileCanBeWatchedUntilItAppears)
{
    const QString path = QDir(dir()).filePath(QStringLiteral("later.txt"));
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    monitor.pollNow();
    EXPECT_EQ(changes.count(), 0);

    writeFile(dir(), QStringLiteral("later.txt"), QStringLiteral("here"));
    monitor.pollNow();
    ASSERT_EQ(changes.count(), 1);
    EXPECT_EQ(eventAt(changes, 0).kind, ExternalChangeKind::Modified);
}

TEST_F(FileChangeMonitorTest, UnwatchedFilesAreNotReported)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.watch(path);
    monitor.unwatch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("changed"));
    monitor.pollNow();
    EXPECT_EQ(changes.count(), 0);
}

TEST_F(FileChangeMonitorTest, PollingTimerReportsChanges)
{
    const QString path = writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("a"));
    monitor.setDebounceMs(10);
    monitor.setPollIntervalMs(25);
    EXPECT_EQ(monitor.pollIntervalMs(), 25);
    monitor.watch(path);

    QSignalSpy changes(&monitor, &FileChangeMonitor::changeDetected);
    writeFile(dir(), QStringLiteral("a.txt"), QStringLiteral("changed on disk"));

    ASSERT_TRUE(changes.count() > 0 || changes.wait(5000));
    EXPECT_EQ(eventAt(changes, 0).path, path);
    EXPECT_EQ(eventAt(changes, 0).kind, ExternalChangeKind::Modified);

    monitor.setPollIntervalMs(-5);
    EXPECT_EQ(monitor.pollIntervalMs(), 0);
}
