#include "pedal/PedalDiscovery.h"

#include <gtest/gtest.h>

namespace {
InputDeviceInfo device(const char* path, quint16 vendor, quint16 product) {
    InputDeviceInfo info;
    info.path = QString::fromLatin1(path);
    info.name = QStringLiteral("dev");
    info.vendorId = vendor;
    info.productId = product;
    return info;
}
}

TEST(PedalDiscoveryTest, CandidateOrderBeatsEnumerationOrder) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844), PedalCandidate::byId(0x05f3, 0x00ff)};
    const std::vector<InputDeviceInfo> devices {device("/dev/input/event2", 0x05f3, 0x00ff),
                                                device("/dev/input/event7", 0x0911, 0x1844)};

    const auto targets = rankDiscoveryTargets(candidates, devices);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].path, QStringLiteral("/dev/input/event7"));
    EXPECT_EQ(targets[0].vendorId, 0x0911);
    EXPECT_EQ(targets[1].path, QStringLiteral("/dev/input/event2"));
    EXPECT_FALSE(targets[0].explicitPath);
}

TEST(PedalDiscoveryTest, UnmatchedDevicesAreIgnored) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844)};
    const std::vector<InputDeviceInfo> devices {device("/dev/input/event0", 0x046d, 0xc52b),
                                                device("/dev/input/event1", 0x0911, 0x0001)};

    EXPECT_TRUE(rankDiscoveryTargets(candidates, devices).empty());
}

TEST(PedalDiscoveryTest, EveryInterfaceOfAMatchingPedalIsTried) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844)};
    const std::vector<InputDeviceInfo> devices {device("/dev/input/event4", 0x0911, 0x1844),
                                                device("/dev/input/event5", 0x0911, 0x1844)};

    const auto targets = rankDiscoveryTargets(candidates, devices);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].path, QStringLiteral("/dev/input/event4"));
    EXPECT_EQ(targets[1].path, QStringLiteral("/dev/input/event5"));
}

TEST(PedalDiscoveryTest, DuplicateCandidatesDoNotRepeatPaths) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844),
                                         PedalCandidate::byId(0x0911, 0x1844),
                                         PedalCandidate::byPath(QStringLiteral("/dev/input/event3"))};
    const std::vector<InputDeviceInfo> devices {device("/dev/input/event3", 0x0911, 0x1844)};

    const auto targets = rankDiscoveryTargets(candidates, devices);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_FALSE(targets[0].explicitPath);
}

TEST(PedalDiscoveryTest, ExplicitPathIsKeptWhenNotEnumerated) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844),
                                         PedalCandidate::byPath(QStringLiteral("/dev/input/by-id/pedal"))};

    const auto targets = rankDiscoveryTargets(candidates, {});
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].path, QStringLiteral("/dev/input/by-id/pedal"));
    EXPECT_TRUE(targets[0].explicitPath);
    EXPECT_EQ(targets[0].vendorId, 0);
}

TEST(PedalDiscoveryTest, ExplicitPathRanksAfterIdMatches) {
    const PedalCandidateList candidates {PedalCandidate::byId(0x0911, 0x1844),
                                         PedalCandidate::byPath(QStringLiteral("/dev/input/event9"))};
    const std::vector<InputDeviceInfo> devices {device("/dev/input/event9", 0x1234, 0x5678),
                                                device("/dev/input/event1", 0x0911, 0x1844)};

    const auto targets = rankDiscoveryTargets(candidates, devices);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].path, QStringLiteral("/dev/input/event1"));
    EXPECT_EQ(targets[1].path, QStringLiteral("/dev/input/event9"));
    EXPECT_EQ(targets[1].vendorId, 0x1234);
}
