#ifndef IDPICK_VIEWPORT_HPP_INCLUDED
#define IDPICK_VIEWPORT_HPP_INCLUDED

#include <idpick/camera.hpp>
#include <idpick/gaze.hpp>
#include <idpick/material.hpp>
#include <idpick/render_backend.hpp>
#include <boost/signals2.hpp>
#include <glm/vec2.hpp>

namespace idpick {
    struct rectangle {
        glm::vec2 origin {0.0f};
        glm::vec2 size {1.0f};
        float width() const;
        float height() const;
        float ratio() const;
    };

    struct pointer_event {
        // Pixels from the top-left corner of the canvas
        glm::vec2 screen;
    };

    struct viewport {
        rectangle rect;
        idpick::camera* camera = nullptr;
        idpick::view* view = nullptr;
        // Where the scene is drawn; null for the default framebuffer
        render_target* scene_target = nullptr;
        // Dwell detector of the camera, used in VR mode
        gaze_control* gaze = nullptr;

        glm::vec2 relative(glm::vec2 screen) const;
        glm::vec2 normalized(glm::vec2 screen) const;
    };

    struct viewport_system {
        viewport active;
        boost::signals2::signal<void(const pointer_event&)> on_pointer_click;
        boost::signals2::signal<void(const pointer_event&)> on_pointer_move;
        boost::signals2::signal<void()> on_vr_change;
        boost::signals2::signal<void()> on_scene_load_complete;

        viewport& active_viewport();
        bool vr() const;
        void set_vr(bool enabled);
    private:
        bool vr_enabled = false;
    };
}

#endif
