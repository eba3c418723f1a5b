#ifndef IDPICK_PICKER_HPP_INCLUDED
#define IDPICK_PICKER_HPP_INCLUDED

#include <idpick/camera.hpp>
#include <idpick/colour_codec.hpp>
#include <idpick/config.hpp>
#include <idpick/gaze.hpp>
#include <idpick/hover_tracker.hpp>
#include <idpick/identity_pass.hpp>
#include <idpick/input_router.hpp>
#include <idpick/material.hpp>
#include <idpick/pickable.hpp>
#include <idpick/pixel_resolver.hpp>
#include <idpick/render_backend.hpp>
#include <idpick/target_manager.hpp>
#include <idpick/viewport.hpp>
#include <boost/signals2.hpp>
#include <glm/vec2.hpp>
#include <optional>

namespace idpick {
    /*
     * Colour-coded object picking for the active viewport.
     *
     * Every frame the owner calls update(), which sizes the identity target, renders the
     * pickable scene into it with the pick material, and in VR mode checks what sits at
     * the screen centre. Pointer clicks and moves are resolved against the last pass.
     * Nothing happens until the viewport system reports the scene as loaded.
     *
     * viewports and picking must outlive the picker or destroy() must be called first.
     */
    class picker {
        viewport_system* viewports;
        picking_interface* picking;
        picking_config cfg;
        colour_codec colours;
        target_manager targets;
        identity_pass pass;
        pixel_resolver resolver;
        std::optional<gaze_interface> gaze;
        hover_tracker hover;
        input_router router;
        boost::signals2::scoped_connection scene_load_connection;
        boost::signals2::scoped_connection vr_connection;
        bool ready = false;

        void on_scene_load_complete();
        void on_vr_change();
        void on_pointer_click(glm::vec2 normalized);
        void on_pointer_move(glm::vec2 normalized);
        void check_pointer(glm::vec2 normalized);
        void click();
    public:
        picker(viewport_system& viewports, picking_interface& picking, render_backend& backend,
               material_registry& materials, picking_config settings = {});
        picker(const picker&) = delete;
        picker& operator=(const picker&) = delete;
        ~picker();

        // cam overrides the active viewport's camera for this frame
        void update(const camera* cam = nullptr);
        void destroy();

        pickable_object* object_at(glm::vec2 normalized) const;
        pickable_object* hovered() const;
        const colour_codec& codec() const;
        const render_target& target() const;
        const picking_config& config() const;
        bool is_ready() const;
    };
}

#endif
