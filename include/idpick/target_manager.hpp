#ifndef IDPICK_TARGET_MANAGER_HPP_INCLUDED
#define IDPICK_TARGET_MANAGER_HPP_INCLUDED

#include <idpick/render_backend.hpp>

namespace idpick {
    struct target_size {
        int width;
        int height;
        bool operator==(const target_size&) const = default;
    };

    // Power-of-two identity target size for a viewport, shrunk by downscale but never below min_height.
    // A zero, negative or non-finite height or ratio gives the min_height square.
    target_size compute_target_size(float viewport_height, float viewport_ratio, int downscale, int min_height);

    // Owns the low resolution identity target. A resize drops the device storage; it is
    // reallocated by the next acquire(), so never resize between a pass and its readback.
    class target_manager {
        render_backend& backend;
        render_target target;
        int downscale;
        int min_height;
    public:
        target_manager(render_backend& backend, int downscale, int min_height);

        // Returns true when the size changed and the storage was dropped
        bool fit(float viewport_height, float viewport_ratio);
        bool resize(int width, int height);
        render_target& acquire();
        const render_target& current() const;
        bool allocated() const;
        void release();
    };
}

#endif
