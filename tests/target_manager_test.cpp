#include <gtest/gtest.h>
#include <idpick/maths.hpp>
#include <idpick/target_manager.hpp>
#include "fake_backend.hpp"
#include <limits>

using namespace idpick;

TEST(FloorPot, LargestPowerOfTwoNotAbove) {
    EXPECT_EQ(floor_pot(102.4), 64);
    EXPECT_EQ(floor_pot(128.0), 128);
    EXPECT_EQ(floor_pot(127.9), 64);
    EXPECT_EQ(floor_pot(1.0), 1);
    EXPECT_EQ(floor_pot(0.3), 1);
    EXPECT_EQ(floor_pot(1000.0), 512);
}

TEST(FloorPot, SaturatesAtLargestIntPowerOfTwo) {
    constexpr int largest = 1 << 30;
    EXPECT_EQ(floor_pot(static_cast<double>(largest)), largest);
    EXPECT_EQ(floor_pot(1e12), largest);
    EXPECT_EQ(floor_pot(std::numeric_limits<double>::infinity()), largest);
    EXPECT_EQ(floor_pot(std::numeric_limits<double>::quiet_NaN()), 1);
}

TEST(TargetSize, CollapsedViewportGivesMinimumSquare) {
    const float zero = 0.0f;
    EXPECT_EQ(compute_target_size(0.0f, 1024.0f / zero, 5, 64), (target_size{64, 64}));
    EXPECT_EQ(compute_target_size(0.0f, std::numeric_limits<float>::quiet_NaN(), 5, 64), (target_size{64, 64}));
    EXPECT_EQ(compute_target_size(-10.0f, 2.0f, 5, 64), (target_size{64, 64}));
    EXPECT_EQ(compute_target_size(512.0f, 0.0f, 5, 100), (target_size{64, 64}));
}

TEST(TargetSize, HugeRatioStaysInIntRange) {
    EXPECT_EQ(compute_target_size(512.0f, 1e12f, 5, 64), (target_size{1 << 30, 64}));
}

TEST(TargetSize, DownscalesViewportToPowersOfTwo) {
    EXPECT_EQ(compute_target_size(512.0f, 2.0f, 5, 64), (target_size{128, 64}));
}

TEST(TargetSize, NeverBelowMinimumHeight) {
    EXPECT_EQ(compute_target_size(100.0f, 1.0f, 5, 64), (target_size{64, 64}));
    EXPECT_EQ(compute_target_size(1080.0f, 16.0f / 9.0f, 5, 64), (target_size{128, 128}));
    EXPECT_EQ(compute_target_size(1440.0f, 2.5f, 5, 64), (target_size{512, 256}));
}

TEST(TargetSize, NarrowViewportsKeepAtLeastOneColumn) {
    EXPECT_EQ(compute_target_size(512.0f, 0.001f, 5, 64), (target_size{1, 64}));
}

TEST(TargetManager, AllocatesLazilyAndOnlyOnce) {
    test::fake_backend backend;
    target_manager targets {backend, 5, 64};
    EXPECT_FALSE(targets.allocated());

    for (int frame = 0; frame < 2; frame++) {
        targets.fit(512.0f, 2.0f);
        targets.acquire();
    }
    EXPECT_EQ(backend.allocations, 1);
    EXPECT_EQ(targets.current().width, 128);
    EXPECT_EQ(targets.current().height, 64);
}

TEST(TargetManager, ResizeDropsStorage) {
    test::fake_backend backend;
    target_manager targets {backend, 5, 64};
    targets.fit(512.0f, 2.0f);
    targets.acquire();
    ASSERT_TRUE(targets.allocated());

    EXPECT_TRUE(targets.fit(2048.0f, 2.0f));
    EXPECT_FALSE(targets.allocated());
    auto& target = targets.acquire();
    EXPECT_EQ(backend.allocations, 2);
    EXPECT_EQ(target.width, 512);
    EXPECT_EQ(target.height, 256);
    auto* storage = dynamic_cast<test::fake_storage*>(target.storage.get());
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(storage->width, 512);
}

TEST(TargetManager, SameSizeIsNoOp) {
    test::fake_backend backend;
    target_manager targets {backend, 5, 64};
    EXPECT_TRUE(targets.resize(32, 16));
    targets.acquire();
    EXPECT_FALSE(targets.resize(32, 16));
    EXPECT_TRUE(targets.allocated());
}

TEST(TargetManager, AllocationFailurePropagates) {
    test::fake_backend backend;
    backend.fail_allocation = true;
    target_manager targets {backend, 5, 64};
    targets.fit(512.0f, 2.0f);
    EXPECT_THROW(targets.acquire(), std::runtime_error);
    EXPECT_FALSE(targets.allocated());
}

TEST(TargetManager, ReleaseKeepsSize) {
    test::fake_backend backend;
    target_manager targets {backend, 5, 64};
    targets.fit(512.0f, 2.0f);
    targets.acquire();
    targets.release();
    EXPECT_FALSE(targets.allocated());
    EXPECT_EQ(targets.current().width, 128);
}
