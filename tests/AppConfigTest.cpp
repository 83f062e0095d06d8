#include "AppConfig.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtGlobal>

TEST(AppConfigTest, DefaultsMatchTheCommonPedal) {
    const AppConfig config;
    EXPECT_EQ(config.rewindSeconds, 3);
    EXPECT_EQ(config.forwardSeconds, 3);
    EXPECT_EQ(config.holdRewindIntervalMs, 500);
    EXPECT_EQ(config.playStartRewindSeconds, 1);

    const PedalKeyMap keys = config.keyMap();
    EXPECT_EQ(keys.left, 288u);
    EXPECT_EQ(keys.middle, 290u);
    EXPECT_EQ(keys.right, 289u);

    const PedalTiming timing = config.timing();
    EXPECT_DOUBLE_EQ(timing.startRewindSec, 1.0);
    EXPECT_DOUBLE_EQ(timing.repeatRewindSec, 3.0);
    EXPECT_EQ(timing.holdRepeatInterval.count(), 500);

    const PedalCandidateList candidates = config.candidates();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].vendorId, 0x0911);
    EXPECT_EQ(candidates[0].productId, 0x1844);
}

TEST(AppConfigTest, ParsesHexIdsAndOrdersCandidates) {
    const QByteArray json = R"({
        "application": {"rewindSeconds": 5, "holdRewindIntervalMs": 250},
        "input": {"devicePath": "/dev/input/by-id/usb-pedal", "selectedModel": "Infinity"},
        "pedals": [
            {"name": "Infinity", "vendorId": "0x05f3", "productId": "0x00ff",
             "leftCode": 256, "middleCode": 257, "rightCode": "0x102"},
            {"name": "Olympus", "vendorId": 1972, "productId": "0x0126"}
        ]
    })";

    bool ok = false;
    const AppConfig config = ConfigStore::fromJson(json, &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(config.rewindSeconds, 5);
    EXPECT_EQ(config.forwardSeconds, 3);
    EXPECT_EQ(config.holdRewindIntervalMs, 250);
    ASSERT_EQ(config.pedals.size(), 2u);
    EXPECT_EQ(config.pedals[0].vendorId, 0x05f3);
    EXPECT_EQ(config.pedals[0].rightCode, 0x102u);
    EXPECT_EQ(config.pedals[1].vendorId, 1972);
    EXPECT_EQ(config.pedals[1].productId, 0x0126);

    const PedalCandidateList candidates = config.candidates();
    ASSERT_EQ(candidates.size(), 4u);
    EXPECT_EQ(candidates[0].vendorId, kDefaultPedalVendorId);
    EXPECT_EQ(candidates[1].vendorId, 0x05f3);
    EXPECT_EQ(candidates[2].vendorId, 1972);
    EXPECT_EQ(candidates[3].kind, PedalCandidate::Kind::Path);
    EXPECT_EQ(candidates[3].path, QStringLiteral("/dev/input/by-id/usb-pedal"));

    const PedalKeyMap keys = config.keyMap();
    EXPECT_EQ(keys.left, 256u);
    EXPECT_EQ(keys.middle, 257u);
    EXPECT_EQ(keys.right, 0x102u);
}

TEST(AppConfigTest, UnknownSelectedModelFallsBackToDefaults) {
    bool ok = false;
    const AppConfig config = ConfigStore::fromJson(R"({"input": {"selectedModel": "nope"}})", &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(config.keyMap().right, kDefaultRightCode);
}

TEST(AppConfigTest, BadValuesKeepDefaults) {
    bool ok = false;
    const AppConfig config = ConfigStore::fromJson(R"({
        "application": {"rewindSeconds": -4},
        "pedalDefaults": {"vendorId": "not-hex", "productId": "0x1ffff"},
        "pedals": [{"name": "no ids"}, 7]
    })", &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(config.rewindSeconds, 3);
    EXPECT_EQ(config.pedalDefaults.vendorId, kDefaultPedalVendorId);
    EXPECT_EQ(config.pedalDefaults.productId, kDefaultPedalProductId);
    EXPECT_TRUE(config.pedals.empty());
}

TEST(AppConfigTest, CodesBeyond32BitsKeepDefaults) {
    bool ok = false;
    const AppConfig config = ConfigStore::fromJson(R"({
        "pedalDefaults": {"leftCode": 1e12, "middleCode": 4294967296, "rightCode": 4294967295}
    })", &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(config.pedalDefaults.leftCode, kDefaultLeftCode);
    EXPECT_EQ(config.pedalDefaults.middleCode, kDefaultMiddleCode);
    EXPECT_EQ(config.pedalDefaults.rightCode, 4294967295u);
}

TEST(AppConfigTest, SaveThenLoadKeepsEveryField) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const ConfigStore store(dir.path());

    AppConfig config;
    config.defaultOpenDir = dir.path();
    config.forwardSeconds = 10;
    config.playStartRewindSeconds = 2;
    config.devicePath = QStringLiteral("/dev/input/event9");
    config.selectedModel = QStringLiteral("Infinity");
    config.pedals.push_back(PedalModel{QStringLiteral("Infinity"), 0x05f3, 0x00ff, 256, 257, 258});

    QString error;
    ASSERT_TRUE(store.save(config, &error)) << error.toStdString();

    const ConfigLoadResult loaded = store.loadOrDefault();
    EXPECT_FALSE(loaded.missing);
    EXPECT_FALSE(loaded.malformed);
    EXPECT_EQ(loaded.config.defaultOpenDir, dir.path());
    EXPECT_EQ(loaded.config.forwardSeconds, 10);
    EXPECT_EQ(loaded.config.playStartRewindSeconds, 2);
    EXPECT_EQ(loaded.config.devicePath, QStringLiteral("/dev/input/event9"));
    ASSERT_EQ(loaded.config.pedals.size(), 1u);
    EXPECT_EQ(loaded.config.pedals[0].productId, 0x00ff);
    EXPECT_EQ(loaded.config.keyMap().right, 258u);
}

TEST(AppConfigTest, MissingFileYieldsDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const ConfigStore store(dir.filePath(QStringLiteral("nested")));

    const ConfigLoadResult loaded = store.loadOrDefault();
    EXPECT_TRUE(loaded.missing);
    EXPECT_EQ(loaded.config.rewindSeconds, 3);
    EXPECT_EQ(loaded.path, QDir(dir.filePath(QStringLiteral("nested"))).filePath(QStringLiteral("config.json")));
}

TEST(AppConfigTest, MalformedFileYieldsDefaultsAndIsLeftAlone) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const ConfigStore store(dir.path());
    {
        QFile file(store.configPath());
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("{ \"application\": ");
    }

    const ConfigLoadResult loaded = store.loadOrDefault();
    EXPECT_TRUE(loaded.malformed);
    EXPECT_EQ(loaded.config.holdRewindIntervalMs, 500);

    QFile file(store.configPath());
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), QByteArray("{ \"application\": "));
}

TEST(AppConfigTest, EnvironmentOverridesConfigDirectory) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    qputenv("PEDALSCRIBE_CONFIG_DIR", dir.path().toLocal8Bit());
    const ConfigStore store;
    qunsetenv("PEDALSCRIBE_CONFIG_DIR");

    EXPECT_EQ(store.configPath(), QDir(dir.path()).filePath(QStringLiteral("config.json")));
}

TEST(AppConfigTest, OpenDirFallsBackWhenConfiguredDirIsMissing) {
    AppConfig config;
    config.defaultOpenDir = QStringLiteral("/definitely/not/here");
    const QString resolved = config.resolveDefaultOpenDir();
    EXPECT_NE(resolved, config.defaultOpenDir);
    EXPECT_TRUE(QFileInfo(resolved).isDir());

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    config.defaultOpenDir = dir.path();
    EXPECT_EQ(config.resolveDefaultOpenDir(), dir.path());
}
