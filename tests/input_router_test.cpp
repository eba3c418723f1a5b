#include <gtest/gtest.h>
#include <idpick/input_router.hpp>
#include <vector>

using namespace idpick;

namespace {
    struct InputRouter : ::testing::Test {
        viewport_system viewports;
        std::vector<glm::vec2> clicks;
        std::vector<glm::vec2> moves;
        input_router router {
            viewports,
            [this](glm::vec2 pos) { clicks.push_back(pos); },
            [this](glm::vec2 pos) { moves.push_back(pos); }
        };

        void SetUp() override {
            viewports.active_viewport().rect = rectangle{{100.0f, 50.0f}, {400.0f, 200.0f}};
        }
    };
}

TEST_F(InputRouter, NothingIsRoutedBeforeStart) {
    viewports.on_pointer_click(pointer_event{{300.0f, 150.0f}});
    EXPECT_TRUE(clicks.empty());
    EXPECT_FALSE(router.pointer_attached());
}

TEST_F(InputRouter, NormalizesPointerPositionsToViewport) {
    router.start();
    viewports.on_pointer_click(pointer_event{{300.0f, 150.0f}});
    viewports.on_pointer_move(pointer_event{{100.0f, 250.0f}});
    ASSERT_EQ(clicks.size(), 1u);
    EXPECT_FLOAT_EQ(clicks[0].x, 0.5f);
    EXPECT_FLOAT_EQ(clicks[0].y, 0.5f);
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_FLOAT_EQ(moves[0].x, 0.0f);
    EXPECT_FLOAT_EQ(moves[0].y, 1.0f);
}

TEST_F(InputRouter, RepeatedAddDoesNotDuplicateHandlers) {
    router.start();
    router.add_handlers();
    router.add_handlers();
    viewports.on_pointer_move(pointer_event{{300.0f, 150.0f}});
    EXPECT_EQ(moves.size(), 1u);
    EXPECT_EQ(viewports.on_pointer_move.num_slots(), 1u);
}

TEST_F(InputRouter, VrModeDetachesPointer) {
    router.start();
    viewports.set_vr(true);
    EXPECT_FALSE(router.pointer_attached());
    viewports.on_pointer_click(pointer_event{{300.0f, 150.0f}});
    EXPECT_TRUE(clicks.empty());

    viewports.set_vr(false);
    EXPECT_TRUE(router.pointer_attached());
    viewports.on_pointer_click(pointer_event{{300.0f, 150.0f}});
    EXPECT_EQ(clicks.size(), 1u);
}

TEST_F(InputRouter, StartingInVrLeavesPointerDetached) {
    viewports.set_vr(true);
    router.start();
    EXPECT_FALSE(router.pointer_attached());
}

TEST_F(InputRouter, StopTearsEverythingDown) {
    router.start();
    router.stop();
    EXPECT_EQ(viewports.on_pointer_click.num_slots(), 0u);
    EXPECT_EQ(viewports.on_pointer_move.num_slots(), 0u);
    EXPECT_EQ(viewports.on_vr_change.num_slots(), 0u);

    viewports.set_vr(true);
    viewports.set_vr(false);
    EXPECT_FALSE(router.pointer_attached());
}
