#include <gtest/gtest.h>
#include <idpick/util.hpp>
#include <stdexcept>
#include <vector>

using namespace idpick;

namespace {
    // Stands in for a global capability flag such as GL_BLEND
    struct flag {
        bool on = true;
        std::vector<bool> writes;
        std::function<void(bool)> setter() {
            return [this](bool value) {
                on = value;
                writes.push_back(value);
            };
        }
    };
}

TEST(ScopedToggle, RestoresEnabledStateOnScopeExit) {
    flag blend;
    {
        const scoped_toggle off {blend.on, false, blend.setter()};
        EXPECT_FALSE(blend.on);
    }
    EXPECT_TRUE(blend.on);
    EXPECT_EQ(blend.writes, (std::vector<bool>{false, true}));
}

TEST(ScopedToggle, LeavesDisabledStateDisabled) {
    flag multisample;
    multisample.on = false;
    {
        const scoped_toggle off {multisample.on, false, multisample.setter()};
    }
    EXPECT_FALSE(multisample.on);
}

TEST(ScopedToggle, RestoresWhenScopeThrows) {
    flag blend;
    EXPECT_THROW({
        const scoped_toggle off(blend.on, false, blend.setter());
        throw std::runtime_error("draw failed");
    }, std::runtime_error);
    EXPECT_TRUE(blend.on);
}

TEST(FileContents, MissingFileThrows) {
    EXPECT_THROW(file_contents("/nonexistent/shader.glsl"), std::runtime_error);
}
