#include <idpick/identity_pass.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace {
    // Restores the scene's own material once the pass is over, also when the backend throws
    struct material_override {
        idpick::scene& target;
        idpick::material* previous;
        material_override(idpick::scene& target, idpick::material& replacement) :
            target(target),
            previous(target.override_material)
        {
            target.override_material = &replacement;
        }
        material_override(const material_override&) = delete;
        material_override& operator=(const material_override&) = delete;
        ~material_override() {
            target.override_material = previous;
        }
    };
}

idpick::identity_pass::identity_pass(render_backend& backend, material_registry& materials) :
    backend(backend),
    materials(materials)
{
}

void idpick::identity_pass::run(scene& pickables, const viewport& vp, const camera& cam, render_target& target) {
    if (!vp.view) {
        throw std::runtime_error("Identity pass needs a viewport with a view");
    }
    auto& pick_material = materials.get(vp.view->type(), material_kind::pick);
    vp.view->update_uniforms(pick_material);

    material_override installed {pickables, pick_material};
    backend.clear_target(target, true, true, false);
    backend.render(pickables, cam.mono_pose(), target, false);
}

void idpick::identity_pass::dump(const render_target& target, const viewport& vp) {
    backend.blit(target, vp.scene_target, glm::vec2{-dump_offset, dump_offset}, dump_scale);
}
