#include <idpick/picker.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

idpick::picker::picker(viewport_system& viewports, picking_interface& picking, render_backend& backend,
                       material_registry& materials, picking_config settings) :
    viewports(&viewports),
    picking(&picking),
    cfg(settings),
    colours{cfg.dump},
    targets(backend, cfg.downscale, cfg.min_height),
    pass(backend, materials),
    resolver(backend),
    gaze(std::in_place, [this]() { click(); }),
    hover(*gaze),
    router(viewports,
           [this](glm::vec2 pos) { on_pointer_click(pos); },
           [this](glm::vec2 pos) { on_pointer_move(pos); })
{
    validate(cfg);
    scene_load_connection = viewports.on_scene_load_complete.connect([this]() { on_scene_load_complete(); });
}

idpick::picker::~picker() {
    destroy();
}

void idpick::picker::on_scene_load_complete() {
    if (ready) {
        return;
    }
    spdlog::info("Scene loaded, picking enabled");
    ready = true;
    router.start();
    vr_connection = viewports->on_vr_change.connect([this]() { on_vr_change(); });
}

void idpick::picker::on_vr_change() {
    if (viewports->vr()) {
        return;
    }
    // A dwell started in VR must not complete into pointer mode
    if (auto* gaze_timer = viewports->active_viewport().gaze) {
        gaze_timer->stop();
    }
}

void idpick::picker::on_pointer_click(const glm::vec2 normalized) {
    if (!picking || !picking->enabled()) {
        return;
    }
    spdlog::debug("Pointer click event ({}, {})", normalized.x, normalized.y);
    // Clicks resolve afresh, the hover state may be stale
    auto object = object_at(normalized);
    if (!object || !object->click) {
        return;
    }
    object->click();
}

void idpick::picker::on_pointer_move(const glm::vec2 normalized) {
    if (!picking || !picking->enabled()) {
        return;
    }
    check_pointer(normalized);
}

void idpick::picker::check_pointer(const glm::vec2 normalized) {
    gaze_control* gaze_timer = viewports->vr() ? viewports->active_viewport().gaze : nullptr;
    hover.check(object_at(normalized), gaze_timer);
}

void idpick::picker::click() {
    if (!viewports || !viewports->vr() || !picking || !picking->enabled()) {
        return;
    }
    hover.click();
}

idpick::pickable_object* idpick::picker::object_at(const glm::vec2 normalized) const {
    if (!ready || !picking) {
        return nullptr;
    }
    return resolver.object_at(*picking, targets.current(), normalized);
}

void idpick::picker::update(const camera* cam) {
    if (!ready) {
        return;
    }

    auto& vp = viewports->active_viewport();
    if (!(vp.rect.width() > 0.0f && vp.rect.height() > 0.0f)) {
        spdlog::debug("Viewport {}x{} has no area, identity pass skipped", vp.rect.width(), vp.rect.height());
        return;
    }
    if (!cam) {
        cam = vp.camera;
    }
    if (!cam) {
        throw std::runtime_error("Picking update needs a camera but the active viewport has none");
    }

    // Resize before the pass: a resize drops the storage the readback reads from
    targets.fit(vp.rect.height(), vp.rect.ratio());
    auto& target = targets.acquire();
    pass.run(picking->scene(), vp, *cam, target);

    if (cfg.dump) {
        pass.dump(target, vp);
    }

    if (viewports->vr() && picking->enabled()) {
        check_pointer(glm::vec2{0.5f, 0.5f});
    }
}

void idpick::picker::destroy() {
    if (!viewports) {
        return;
    }
    // Listeners go first so nothing fires into a half torn down picker
    scene_load_connection.disconnect();
    vr_connection.disconnect();
    router.stop();

    if (auto* gaze_timer = viewports->active_viewport().gaze) {
        gaze_timer->stop();
    }
    gaze.reset();
    targets.release();
    hover.reset();
    ready = false;
    picking = nullptr;
    viewports = nullptr;
}

idpick::pickable_object* idpick::picker::hovered() const {
    return hover.current();
}

const idpick::colour_codec& idpick::picker::codec() const {
    return colours;
}

const idpick::render_target& idpick::picker::target() const {
    return targets.current();
}

const idpick::picking_config& idpick::picker::config() const {
    return cfg;
}

bool idpick::picker::is_ready() const {
    return ready;
}
