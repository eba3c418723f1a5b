#include <gtest/gtest.h>
#include <idpick/gaze.hpp>
#include <chrono>

using namespace idpick;
using namespace std::chrono_literals;

TEST(GazeDwell, CompletesOnceAfterDelay) {
    int completions = 0;
    gaze_interface target {[&]() { completions++; }};
    gaze_dwell dwell {500ms};

    dwell.start(target);
    dwell.update(300ms);
    EXPECT_EQ(completions, 0);
    EXPECT_NEAR(dwell.progress(), 0.6f, 1e-4f);

    dwell.update(250ms);
    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(dwell.active());

    dwell.update(1s);
    EXPECT_EQ(completions, 1);
}

TEST(GazeDwell, StopCancelsCountdown) {
    int completions = 0;
    gaze_interface target {[&]() { completions++; }};
    gaze_dwell dwell {100ms};

    dwell.start(target);
    dwell.update(90ms);
    dwell.stop();
    dwell.update(1s);
    EXPECT_EQ(completions, 0);
    EXPECT_FLOAT_EQ(dwell.progress(), 0.0f);
}

TEST(GazeDwell, RestartResetsProgress) {
    int completions = 0;
    gaze_interface target {[&]() { completions++; }};
    gaze_dwell dwell {100ms};

    dwell.start(target);
    dwell.update(90ms);
    dwell.start(target);
    dwell.update(90ms);
    EXPECT_EQ(completions, 0);
    dwell.update(10ms);
    EXPECT_EQ(completions, 1);
}

TEST(GazeDwell, IdleUpdatesDoNothing) {
    gaze_dwell dwell {100ms};
    dwell.update(1s);
    EXPECT_FALSE(dwell.active());
}

TEST(GazeInterface, EmptyCallbackIsHarmless) {
    gaze_interface target {nullptr};
    EXPECT_NO_THROW(target.complete());
}
