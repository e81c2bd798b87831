// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Environment.hpp"
#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QVariant>

#include <memory>

namespace {

using namespace Qt::StringLiterals;

using Utils::BasicEnvironment;
using Utils::EnvironmentConfig;
using Utils::EnvironmentPaths;
using Utils::EnvironmentScope;
using Utils::StateError;
using Utils::StateLoadResult;

struct InMemoryPersistencePolicy
{
    struct Store {
        QHash<int, QHash<QString, QVariant>> settings;
        QHash<QString, QByteArray> primary;
        QHash<QString, QByteArray> backup;
        QHash<int, bool> failEnsureScope;
    };

    struct SettingsHandle {
        std::shared_ptr<Store> store;
        EnvironmentScope scope = EnvironmentScope::Global;
    };

    std::shared_ptr<Store> store = std::make_shared<Store>();

    EnvironmentPaths resolvePaths(const EnvironmentConfig&) const
    {
        EnvironmentPaths p;
        p.globalConfigDir = "/mem/global";
        p.sessionConfigDir = "/mem/session";
        return p;
    }

    SettingsHandle openSettings(EnvironmentScope scope, const EnvironmentPaths&) const
    {
        SettingsHandle h;
        h.store = store;
        h.scope = scope;
        return h;
    }

    QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
    {
        return h.store->settings.value(int(h.scope)).value(key.toString(), def);
    }

    void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
    {
        h.store->settings[int(h.scope)].insert(key.toString(), value);
    }

    void syncSettings(SettingsHandle&) const {}

    bool ensureScopeStorage(EnvironmentScope scope, const EnvironmentPaths&, QString* error) const
    {
        if (store->failEnsureScope.value(int(scope), false)) {
            if (error) *error = "ensureScopeStorage failed (simulated)";
            return false;
        }
        if (error) error->clear();
        return true;
    }

    static QString keyFor(EnvironmentScope scope, QStringView name)
    {
        return QString::number(int(scope)) + ":" + name.toString();
    }

    bool readStateBytes(EnvironmentScope scope, const EnvironmentPaths&, QStringView name,
                        bool useBackup, QByteArray* out, QString* error) const
    {
        const auto& map = useBackup ? store->backup : store->primary;
        const auto it = map.find(keyFor(scope, name));
        if (error) error->clear();
        if (it == map.end())
            return false;
        if (out) *out = it.value();
        return true;
    }

    bool writeStateBytesAtomic(EnvironmentScope scope, const EnvironmentPaths&, QStringView name,
                               const QByteArray& bytes, QString* error) const
    {
        const QString k = keyFor(scope, name);
        if (store->primary.contains(k))
            store->backup[k] = store->primary.value(k);
        store->primary[k] = bytes;
        if (error) error->clear();
        return true;
    }
};

using Env = BasicEnvironment<InMemoryPersistencePolicy>;

EnvironmentConfig makeConfig(std::size_t maxBytes = 4u * 1024u * 1024u)
{
    EnvironmentConfig cfg;
    cfg.applicationName = "Qalam";
    cfg.maxStateDocumentBytes = maxBytes;
    return cfg;
}

} // namespace

TEST(EnvironmentTests, SettingsRoundTrip)
{
    Env env(makeConfig());

    EXPECT_FALSE(env.setting(EnvironmentScope::Global, u"session/foo"_s).isValid());
    env.setSetting(EnvironmentScope::Global, u"session/foo"_s, 123);
    EXPECT_EQ(env.setting(EnvironmentScope::Global, u"session/foo"_s).toInt(), 123);
    EXPECT_EQ(env.setting(EnvironmentScope::Session, u"session/foo"_s, 42).toInt(), 42);
}

TEST(EnvironmentTests, SaveLoadStateRoundTrip)
{
    Env env(makeConfig());

    QJsonObject o;
    o["x"] = 1;
    o["name"] = "recent";

    const auto save = env.saveState(EnvironmentScope::Session, u"recent"_s, o);
    EXPECT_TRUE(save.ok) << save.message().toStdString();

    const auto load = env.loadState(EnvironmentScope::Session, u"recent"_s);
    EXPECT_EQ(load.status, StateLoadResult::Status::Ok);
    EXPECT_FALSE(load.fromBackup);
    EXPECT_EQ(load.object.value("x").toInt(), 1);
    EXPECT_EQ(load.object.value("name").toString(), "recent");
}

TEST(EnvironmentTests, LoadMissingStateIsNotFound)
{
    Env env(makeConfig());

    const auto load = env.loadState(EnvironmentScope::Global, u"missing"_s);
    EXPECT_EQ(load.status, StateLoadResult::Status::NotFound);
    EXPECT_TRUE(load.object.isEmpty());
}

TEST(EnvironmentTests, SaveRejectsOversizedDocument)
{
    Env env(makeConfig(/*maxBytes=*/32));

    QJsonObject o;
    o["big"] = QString(200, 'x');

    const auto save = env.saveState(EnvironmentScope::Global, u"too_big"_s, o);
    EXPECT_FALSE(save.ok);
    EXPECT_EQ(save.kind, StateError::TooLarge);
}

TEST(EnvironmentTests, SaveReportsStorageFailure)
{
    Env env(makeConfig());
    env.policy().store->failEnsureScope[int(EnvironmentScope::Session)] = true;

    const auto save = env.saveState(EnvironmentScope::Session, u"any"_s, QJsonObject{});
    EXPECT_FALSE(save.ok);
    EXPECT_EQ(save.kind, StateError::Storage);
}

TEST(EnvironmentTests, CorruptPrimaryFallsBackToLastKnownGood)
{
    Env env(makeConfig());

    QJsonObject first;
    first["v"] = 1;
    ASSERT_TRUE(env.saveState(EnvironmentScope::Session, u"layout"_s, first).ok);

    QJsonObject second;
    second["v"] = 2;
    ASSERT_TRUE(env.saveState(EnvironmentScope::Session, u"layout"_s, second).ok);

    const QString k = InMemoryPersistencePolicy::keyFor(EnvironmentScope::Session, u"layout"_s);
    env.policy().store->primary[k] = QByteArray("{not valid json");

    const auto load = env.loadState(EnvironmentScope::Session, u"layout"_s);
    EXPECT_EQ(load.status, StateLoadResult::Status::Ok);
    EXPECT_TRUE(load.fromBackup);
    EXPECT_EQ(load.object.value("v").toInt(), 1);
}

TEST(EnvironmentTests, QtPolicyStoresUnderConfigRoot)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    EnvironmentConfig cfg = makeConfig();
    cfg.configRootOverride = temp.path();
    cfg.sessionKey = "/home/user/project";
    Utils::Environment env(cfg);

    EXPECT_EQ(env.paths().globalConfigDir, QDir(temp.path()).filePath("Qalam"));
    EXPECT_TRUE(env.paths().sessionConfigDir.startsWith(env.paths().globalConfigDir + "/sessions/"));

    env.setSetting(EnvironmentScope::Global, u"session/autosaveIntervalSeconds"_s, 12);
    EXPECT_TRUE(QFile::exists(QDir(env.paths().globalConfigDir).filePath("qalam.ini")));

    Utils::Environment reopened(cfg);
    EXPECT_EQ(reopened.setting(EnvironmentScope::Global, u"session/autosaveIntervalSeconds"_s).toInt(), 12);

    QJsonObject o;
    o["paths"] = "a";
    ASSERT_TRUE(env.saveState(EnvironmentScope::Session, u"session/openDocuments"_s, o).ok);
    EXPECT_TRUE(QFile::exists(QDir(env.paths().sessionConfigDir).filePath("state/session/openDocuments.json")));

    const auto load = reopened.loadState(EnvironmentScope::Session, u"session/openDocuments"_s);
    EXPECT_EQ(load.status, StateLoadResult::Status::Ok);
    EXPECT_EQ(load.object.value("paths").toString(), "a");
}

TEST(EnvironmentTests, QtPolicyRecoversFromCorruptPrimaryFile)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    EnvironmentConfig cfg = makeConfig();
    cfg.configRootOverride = temp.path();
    Utils::Environment env(cfg);

    QJsonObject first;
    first["v"] = 1;
    ASSERT_TRUE(env.saveState(EnvironmentScope::Global, u"recent"_s, first).ok);
    QJsonObject second;
    second["v"] = 2;
    ASSERT_TRUE(env.saveState(EnvironmentScope::Global, u"recent"_s, second).ok);

    const QString primary = QDir(env.paths().globalConfigDir).filePath("state/recent.json");
    QFile file(primary);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{truncated");
    file.close();

    const auto load = env.loadState(EnvironmentScope::Global, u"recent"_s);
    EXPECT_EQ(load.status, StateLoadResult::Status::Ok);
    EXPECT_TRUE(load.fromBackup);
    EXPECT_EQ(load.object.value("v").toInt(), 1);
}
