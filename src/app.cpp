#include <idpick/app.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <array>
#include <chrono>
#include <cmath>
#include <complex>
#include <memory>

namespace {
    // Opaque disc on a transparent square: only the disc may report a hit
    std::shared_ptr<const idpick::bitmap> make_disc_mask(int size) {
        auto mask = std::make_shared<idpick::bitmap>(idpick::bitmap{size, size, {}});
        mask->rgba.reserve(static_cast<std::size_t>(size) * size * 4);
        const float radius = size * 0.5f;
        for (int y = 0; y < size; y++) {
            for (int x = 0; x < size; x++) {
                const float dx = x + 0.5f - radius;
                const float dy = y + 0.5f - radius;
                const std::uint8_t alpha = dx * dx + dy * dy <= radius * radius ? 255 : 0;
                mask->rgba.insert(mask->rgba.end(), {255, 255, 255, alpha});
            }
        }
        return mask;
    }
}

entt::entity idpick::demo_world::spawn(object_id id, std::string name, scene_node node, const colour_codec& codec) {
    auto& added = pickables.add(id, std::move(node), codec);
    const auto entity = entities.create();
    entities.emplace<named>(entity, std::move(name));
    entities.emplace<pickable_object>(entity, pickable_object{id});
    by_id.emplace(id, entity);
    spdlog::debug("Spawned {} with id {} (colour {}, {}, {})",
                  entities.get<named>(entity).name, id, added.pick_colour.r, added.pick_colour.g, added.pick_colour.b);
    return entity;
}

bool idpick::demo_world::enabled() const {
    return picking_enabled;
}

idpick::scene& idpick::demo_world::scene() {
    return pickables;
}

idpick::pickable_object* idpick::demo_world::object_with_id(object_id id) {
    auto entity_it = by_id.find(id);
    if (entity_it == by_id.end()) {
        return nullptr;
    }
    return entities.try_get<pickable_object>(entity_it->second);
}

idpick::rectilinear_view::rectilinear_view(const idpick::camera& cam) : cam(cam) {
}

idpick::view_type idpick::rectilinear_view::type() const {
    return view_type::rectilinear;
}

void idpick::rectilinear_view::update_uniforms(material& mat) const {
    mat.uniforms["aspect_ratio"] = cam.aspect_ratio;
    mat.uniforms["zoom"] = cam.zoom_factor;
}

idpick::app::app(const config& cfg) :
    win { glfw.make_window(1024, 768, "idpick") },
    backend { win },
    cam {
        {0.0f, 0.0f, 0.0f}, // focus
        0.8, // altitude
        std::polar(0.6, glm::half_pi<double>() / 2.0),
        12.0f, // zoom
        static_cast<float>(win.width()) / win.height() // aspect ratio
    },
    current_view { cam },
    gaze { cfg.picking.gaze_delay },
    picking { viewports, world, backend, materials, cfg.picking }
{
    materials.add(view_type::rectilinear, material_kind::main, material{"scene", {}});
    materials.add(view_type::rectilinear, material_kind::pick, material{"pick", {}});

    auto& vp = viewports.active_viewport();
    vp.rect = rectangle{{0.0f, 0.0f}, {static_cast<float>(win.width()), static_cast<float>(win.height())}};
    vp.camera = &cam;
    vp.view = &current_view;
    vp.gaze = &gaze;

    win.on_key.connect([&](int a, int b, int c, int d) { on_key(a, b, c, d); });
    win.on_mouse_button.connect([&](int button, int action, int mods) { on_mouse_button(button, action, mods); });
    win.on_cursor_move.connect([&](double x, double y) {
        viewports.on_pointer_move(pointer_event{{static_cast<float>(x), static_cast<float>(y)}});
    });
    win.on_framebuffer_size.connect([&](int width, int height) {
        if (width == 0 || height == 0) {
            return;
        }
        cam.aspect_ratio = static_cast<float>(width) / height;
        viewports.active_viewport().rect.size = glm::vec2{static_cast<float>(win.width()), static_cast<float>(win.height())};
        glViewport(0, 0, width, height);
    });

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    build_world();
}

void idpick::app::build_world() {
    const auto quad = make_quad(glm::vec2{3.0f});
    const std::array<glm::vec4, 5> colours {
        glm::vec4{0.85f, 0.33f, 0.31f, 1.0f},
        glm::vec4{0.36f, 0.72f, 0.36f, 1.0f},
        glm::vec4{0.5f, 0.5f, 0.5f, 1.0f},
        glm::vec4{0.26f, 0.55f, 0.79f, 1.0f},
        glm::vec4{0.94f, 0.68f, 0.31f, 1.0f}
    };
    for (int i = 0; i < 5; i++) {
        const object_id id = static_cast<object_id>(i + 1);
        scene_node node {
            .id = id,
            .shape = quad,
            .transform = glm::translate(glm::mat4{1.0f}, glm::vec3{(i - 2) * 4.0f, 0.0f, 0.0f}),
            .colour = colours[i]
        };
        if (id == 4) {
            node.alpha_map = make_disc_mask(64);
        }
        const auto entity = world.spawn(id, fmt::format("panel {}", id), std::move(node), picking.codec());
        auto& object = world.entities.get<pickable_object>(entity);
        if (id == 3) {
            // Drawn but inert: hovering it clears the hover state
            object.interactive = false;
            continue;
        }
        const auto label = world.entities.get<named>(entity).name;
        const std::size_t index = world.pickables.nodes.size() - 1;
        const glm::vec4 base = colours[i];
        object.over = [this, index, base]() {
            world.pickables.nodes[index].colour = glm::vec4{glm::vec3{base} * 1.4f, base.a};
        };
        object.out = [this, index, base]() { world.pickables.nodes[index].colour = base; };
        object.click = [label]() { spdlog::info("Clicked {}", label); };
    }
    viewports.on_scene_load_complete();
}

void idpick::app::on_key(const int key, const int scancode, const int action, const int mods) {
    if (action != GLFW_PRESS) {
        return;
    }
    switch (key) {
    case GLFW_KEY_ESCAPE:
        win.close();
        break;
    case GLFW_KEY_V:
        toggle_vr();
        break;
    case GLFW_KEY_P:
        world.picking_enabled = !world.picking_enabled;
        spdlog::info("Picking {}", world.picking_enabled ? "enabled" : "disabled");
        break;
    case GLFW_KEY_SPACE:
        cam.use_ortho = !cam.use_ortho;
        break;
    }
}

void idpick::app::on_mouse_button(const int button, const int action, const int mods) {
    if (button == GLFW_MOUSE_BUTTON_LEFT && action == GLFW_RELEASE) {
        const glm::dvec2 pos = win.cursor();
        viewports.on_pointer_click(pointer_event{{static_cast<float>(pos.x), static_cast<float>(pos.y)}});
    }
}

void idpick::app::toggle_vr() {
    if (viewports.vr()) {
        cam.leave_stereo();
        viewports.set_vr(false);
    } else {
        cam.enter_stereo(0.065f * cam.zoom_factor);
        viewports.set_vr(true);
    }
}

void idpick::app::draw() {
    // No headset here: VR mode previews the left eye
    glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
    backend.render(world.scene(), cam.mono_pose(), nullptr, true);
    picking.update();
}

void idpick::app::run() {
    auto then = std::chrono::steady_clock::now();
    while (!win.should_close()) {
        glfw.poll();
        const auto now = std::chrono::steady_clock::now();
        gaze.update(now - then);
        then = now;
        draw();
        win.swap();
    }
    picking.destroy();
}
