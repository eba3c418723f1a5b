#ifndef IDPICK_APP_HPP_INCLUDED
#define IDPICK_APP_HPP_INCLUDED
#include <idpick/camera.hpp>
#include <idpick/config.hpp>
#include <idpick/gaze.hpp>
#include <idpick/gl_backend.hpp>
#include <idpick/material.hpp>
#include <idpick/pickable.hpp>
#include <idpick/picker.hpp>
#include <idpick/scene.hpp>
#include <idpick/viewport.hpp>
#include <idpick/window.hpp>
#include <string>
#include <unordered_map>
#include <entt/entt.hpp>

namespace idpick {
    struct named {
        std::string name;
    };

    // Pickable objects live as components of entities; ids index back into the registry
    struct demo_world : picking_interface {
        entt::registry entities;
        std::unordered_map<object_id, entt::entity> by_id;
        idpick::scene pickables;
        bool picking_enabled = true;

        entt::entity spawn(object_id id, std::string name, scene_node node, const colour_codec& codec);
        bool enabled() const override;
        idpick::scene& scene() override;
        pickable_object* object_with_id(object_id id) override;
    };

    struct rectilinear_view : view {
        const idpick::camera& cam;
        explicit rectilinear_view(const idpick::camera& cam);
        view_type type() const override;
        void update_uniforms(material& mat) const override;
    };

    struct app {
        glfw_context glfw;
        idpick::window win;
        gl_backend backend;
        material_registry materials;
        idpick::camera cam;
        rectilinear_view current_view;
        gaze_dwell gaze;
        viewport_system viewports;
        demo_world world;
        picker picking;

        explicit app(const config& cfg);

        void build_world();
        void on_key(int key, int scancode, int action, int mods);
        void on_mouse_button(int button, int action, int mods);
        void toggle_vr();
        void draw();
        void run();
    };
}
#endif
