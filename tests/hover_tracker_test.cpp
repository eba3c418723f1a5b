#include <gtest/gtest.h>
#include <idpick/hover_tracker.hpp>
#include "fake_backend.hpp"
#include <string>
#include <vector>

using namespace idpick;

namespace {
    struct HoverTracker : ::testing::Test {
        std::vector<std::string> calls;
        int gaze_clicks = 0;
        gaze_interface gaze {[this]() { gaze_clicks++; }};
        hover_tracker hover {gaze};
        test::recording_gaze dwell;

        pickable_object make(object_id id, const std::string& name, bool interactive = true) {
            pickable_object object;
            object.id = id;
            object.interactive = interactive;
            object.over = [this, name]() { calls.push_back(name + ".over"); };
            object.out = [this, name]() { calls.push_back(name + ".out"); };
            object.click = [this, name]() { calls.push_back(name + ".click"); };
            return object;
        }
    };
}

TEST_F(HoverTracker, StartsWithNothingHovered) {
    EXPECT_EQ(hover.current(), nullptr);
}

TEST_F(HoverTracker, MovingBetweenObjectsCallsOutThenOver) {
    auto a = make(1, "A");
    auto b = make(2, "B");
    hover.check(&a, nullptr);
    calls.clear();

    hover.check(&b, nullptr);
    EXPECT_EQ(calls, (std::vector<std::string>{"A.out", "B.over"}));
    EXPECT_EQ(hover.current(), &b);
}

TEST_F(HoverTracker, MovingToBackgroundCallsOutOnce) {
    auto a = make(1, "A");
    hover.check(&a, nullptr);
    calls.clear();

    hover.check(nullptr, nullptr);
    hover.check(nullptr, nullptr);
    EXPECT_EQ(calls, (std::vector<std::string>{"A.out"}));
    EXPECT_EQ(hover.current(), nullptr);
}

TEST_F(HoverTracker, OverFiresOnEveryCheck) {
    auto a = make(1, "A");
    hover.check(&a, nullptr);
    hover.check(&a, nullptr);
    hover.check(&a, nullptr);
    EXPECT_EQ(calls, (std::vector<std::string>{"A.over", "A.over", "A.over"}));
}

TEST_F(HoverTracker, NonInteractiveObjectClearsHover) {
    auto a = make(1, "A");
    auto inert = make(2, "inert", false);
    hover.check(&a, nullptr);
    calls.clear();

    hover.check(&inert, nullptr);
    EXPECT_EQ(calls, (std::vector<std::string>{"A.out"}));
    EXPECT_EQ(hover.current(), nullptr);
}

TEST_F(HoverTracker, SameIdFromAnotherInstanceIsTheSameObject) {
    auto first = make(5, "first");
    auto second = make(5, "second");
    hover.check(&first, nullptr);
    calls.clear();

    hover.check(&second, nullptr);
    EXPECT_EQ(calls, (std::vector<std::string>{"second.over"}));
    EXPECT_EQ(hover.current(), &second);
}

TEST_F(HoverTracker, MissingHandlersAreSkipped) {
    pickable_object bare;
    bare.id = 3;
    auto a = make(1, "A");
    hover.check(&bare, nullptr);
    hover.check(&a, nullptr);
    hover.check(&bare, nullptr);
    hover.click();
    EXPECT_EQ(calls, (std::vector<std::string>{"A.over", "A.out"}));
}

TEST_F(HoverTracker, ClearsHoverEvenWithoutOutHandler) {
    pickable_object bare;
    bare.id = 3;
    hover.check(&bare, nullptr);
    hover.check(nullptr, nullptr);
    EXPECT_EQ(hover.current(), nullptr);
}

TEST_F(HoverTracker, GazeRestartsOnlyOnNewObjects) {
    auto a = make(1, "A");
    auto b = make(2, "B");
    hover.check(&a, &dwell);
    hover.check(&a, &dwell);
    hover.check(&b, &dwell);
    hover.check(nullptr, &dwell);
    EXPECT_EQ(dwell.events, (std::vector<std::string>{"start", "start", "stop"}));
}

TEST_F(HoverTracker, GazeTargetsTheTrackersInterface) {
    auto a = make(1, "A");
    hover.check(&a, &dwell);
    ASSERT_EQ(dwell.target, &gaze);
    dwell.target->complete();
    EXPECT_EQ(gaze_clicks, 1);
}

TEST_F(HoverTracker, ClickUsesCachedHover) {
    auto d = make(4, "D");
    hover.check(&d, nullptr);
    calls.clear();

    hover.click();
    EXPECT_EQ(calls, (std::vector<std::string>{"D.click"}));
}

TEST_F(HoverTracker, ClickWithoutHoverDoesNothing) {
    hover.click();
    EXPECT_TRUE(calls.empty());
}
