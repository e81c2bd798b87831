// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <gtest/gtest.h>

#include <QtCore/QByteArray>
#include <QtCore/QCoreApplication>
#include <QtCore/QDate>
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTime>
#include <QtCore/QTimeZone>

#include <functional>
#include <memory>

namespace SessionTests {

inline QCoreApplication* ensureApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;

    static int argc = 1;
    static char arg0[] = "qalam-session-tests";
    static char* argv[] = {arg0, nullptr};
    static QCoreApplication* app = new QCoreApplication(argc, argv);
    return app;
}

inline QString writeBytes(const QString& dir, const QString& name, const QByteArray& bytes)
{
    const QString path = QDir(dir).filePath(name);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    EXPECT_EQ(file.write(bytes), bytes.size());
    file.close();
    return path;
}

inline QString writeFile(const QString& dir, const QString& name, const QString& content)
{
    return writeBytes(dir, name, content.toUtf8());
}

inline QByteArray readBytes(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return file.readAll();
}

inline QString readText(const QString& path)
{
    return QString::fromUtf8(readBytes(path));
}

// Clock that only moves when a test moves it.
class ManualClock final
{
public:
    ManualClock()
        : m_now(std::make_shared<QDateTime>(QDate(2026, 3, 1), QTime(12, 30, 45, 123), QTimeZone::utc()))
    {}

    QDateTime now() const { return *m_now; }
    void advanceMs(qint64 ms) { *m_now = m_now->addMSecs(ms); }
    void advanceSecs(qint64 secs) { *m_now = m_now->addSecs(secs); }
    void set(const QDateTime& dt) { *m_now = dt; }

    std::function<QDateTime()> function() const
    {
        auto now = m_now;
        return [now]() { return *now; };
    }

private:
    std::shared_ptr<QDateTime> m_now;
};

} // namespace SessionTests
