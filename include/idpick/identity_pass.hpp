#ifndef IDPICK_IDENTITY_PASS_HPP_INCLUDED
#define IDPICK_IDENTITY_PASS_HPP_INCLUDED

#include <idpick/camera.hpp>
#include <idpick/material.hpp>
#include <idpick/render_backend.hpp>
#include <idpick/scene.hpp>
#include <idpick/viewport.hpp>
#include <glm/vec2.hpp>

namespace idpick {
    // Renders the pickable scene into the identity target with the view's pick material
    class identity_pass {
        render_backend& backend;
        material_registry& materials;
    public:
        // Placement of the debug dump in the scene target, in NDC
        static constexpr float dump_scale = 0.7f;
        static constexpr float dump_offset = 0.35f;

        identity_pass(render_backend& backend, material_registry& materials);
        // Stereo cameras are collapsed to their left eye: the pass is never split per eye.
        void run(scene& pickables, const viewport& vp, const camera& cam, render_target& target);
        // Debug only: draws target into the top-left corner of the viewport's scene target
        void dump(const render_target& target, const viewport& vp);
    };
}

#endif
