#include "audio/DeferredRelease.h"

#include <gtest/gtest.h>

#include <memory>

namespace {
struct Tracked {
    explicit Tracked(int* destroyed) : m_destroyed(destroyed) {}
    ~Tracked() { ++*m_destroyed; }
    int* m_destroyed;
};
}

TEST(DeferredReleaseTest, HoldsRetiredObjectUntilInFlightCycleCompletes) {
    int destroyed = 0;
    DeferredRelease<Tracked> retired;
    auto stream = std::make_shared<Tracked>(&destroyed);
    // The real-time side still holds a reference from the cycle in progress.
    std::weak_ptr<Tracked> seenByCycle = stream;

    retired.retire(std::move(stream), 5);
    retired.collect(5);
    EXPECT_EQ(destroyed, 0);
    EXPECT_FALSE(seenByCycle.expired());

    retired.collect(6);
    EXPECT_EQ(destroyed, 1);
    EXPECT_EQ(retired.size(), 0u);
}

TEST(DeferredReleaseTest, CollectsOnlyEntriesOlderThanCompletedCycle) {
    int destroyed = 0;
    DeferredRelease<Tracked> retired;
    retired.retire(std::make_shared<Tracked>(&destroyed), 1);
    retired.retire(std::make_shared<Tracked>(&destroyed), 3);
    retired.retire(nullptr, 3);
    EXPECT_EQ(retired.size(), 2u);

    retired.collect(2);
    EXPECT_EQ(destroyed, 1);
    EXPECT_EQ(retired.size(), 1u);

    retired.clear();
    EXPECT_EQ(destroyed, 2);
}
