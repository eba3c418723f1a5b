#ifndef IDPICK_RENDER_BACKEND_HPP_INCLUDED
#define IDPICK_RENDER_BACKEND_HPP_INCLUDED

#include <idpick/camera.hpp>
#include <idpick/scene.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include <glm/vec2.hpp>

namespace idpick {
    // Device memory behind a render target, released by destruction
    struct gpu_target {
        virtual ~gpu_target() = default;
    };

    struct render_target {
        int width = 1;
        int height = 1;
        // Empty until allocated and after every resize
        std::unique_ptr<gpu_target> storage;
    };

    struct render_backend {
        virtual ~render_backend() = default;
        // Throws std::runtime_error when device memory can't be allocated
        virtual std::unique_ptr<gpu_target> allocate(int width, int height) = 0;
        virtual void clear_target(render_target& target, bool colour, bool depth, bool stencil) = 0;
        virtual void render(const scene& s, const camera_pose& pose, render_target& target, bool clear) = 0;
        // Blocks until every command touching target has completed. Returns w * h * 4 RGBA bytes.
        virtual std::vector<std::uint8_t> read_pixels(const render_target& target, int x, int y, int w, int h) = 0;
        // Draws source as a textured quad centred at centre (NDC) into destination, or the default framebuffer if null
        virtual void blit(const render_target& source, render_target* destination, glm::vec2 centre, float scale) = 0;
    };
}

#endif
