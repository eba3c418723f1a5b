#ifndef IDPICK_TESTS_FAKE_BACKEND_HPP_INCLUDED
#define IDPICK_TESTS_FAKE_BACKEND_HPP_INCLUDED

#include <idpick/colour_codec.hpp>
#include <idpick/gaze.hpp>
#include <idpick/material.hpp>
#include <idpick/pickable.hpp>
#include <idpick/render_backend.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace idpick::test {
    struct fake_storage : gpu_target {
        int width;
        int height;
        fake_storage(int width, int height) : width(width), height(height) {
        }
    };

    // Deterministic stand-in for a GPU: texels hold whatever ids the test paints
    struct fake_backend : render_backend {
        struct clear_call {
            bool colour;
            bool depth;
            bool stencil;
        };
        struct render_call {
            std::optional<std::string> override_program;
            camera_pose pose;
            bool clear;
        };
        struct blit_call {
            render_target* destination;
            glm::vec2 centre;
            float scale;
        };

        int allocations = 0;
        int reads = 0;
        bool fail_allocation = false;
        bool fail_render = false;
        std::vector<clear_call> clears;
        std::vector<render_call> renders;
        std::vector<blit_call> blits;
        std::map<std::pair<int, int>, object_id> painted;
        object_id fill = 0;
        std::optional<glm::ivec2> last_read;
        std::function<void()> on_render;

        void paint(int x, int y, object_id id) {
            painted[{x, y}] = id;
        }

        std::unique_ptr<gpu_target> allocate(int width, int height) override {
            if (fail_allocation) {
                throw std::runtime_error("out of device memory");
            }
            allocations++;
            return std::make_unique<fake_storage>(width, height);
        }
        void clear_target(render_target&, bool colour, bool depth, bool stencil) override {
            clears.push_back(clear_call{colour, depth, stencil});
        }
        void render(const scene& s, const camera_pose& pose, render_target&, bool clear) override {
            std::optional<std::string> program;
            if (s.override_material) {
                program = s.override_material->program;
            }
            renders.push_back(render_call{program, pose, clear});
            if (on_render) {
                on_render();
            }
            if (fail_render) {
                throw std::runtime_error("device lost");
            }
        }
        std::vector<std::uint8_t> read_pixels(const render_target& target, int x, int y, int w, int h) override {
            if (!target.storage) {
                throw std::logic_error("read from an unallocated target");
            }
            reads++;
            last_read = glm::ivec2{x, y};
            std::vector<std::uint8_t> data;
            for (int row = y; row < y + h; row++) {
                for (int column = x; column < x + w; column++) {
                    auto painted_it = painted.find({column, row});
                    const object_id id = painted_it == painted.end() ? fill : painted_it->second;
                    const auto rgb = encode_colour(id);
                    data.insert(data.end(), {rgb.r, rgb.g, rgb.b, 255});
                }
            }
            return data;
        }
        void blit(const render_target&, render_target* destination, glm::vec2 centre, float scale) override {
            blits.push_back(blit_call{destination, centre, scale});
        }
    };

    struct test_world : picking_interface {
        bool is_enabled = true;
        idpick::scene pickables;
        std::map<object_id, pickable_object> objects;
        int lookups = 0;

        pickable_object& add(object_id id, bool interactive = true) {
            auto& object = objects[id];
            object.id = id;
            object.interactive = interactive;
            return object;
        }
        bool enabled() const override {
            return is_enabled;
        }
        idpick::scene& scene() override {
            return pickables;
        }
        pickable_object* object_with_id(object_id id) override {
            lookups++;
            auto object_it = objects.find(id);
            return object_it == objects.end() ? nullptr : &object_it->second;
        }
    };

    struct test_view : view {
        view_type kind = view_type::rectilinear;
        mutable int updates = 0;
        view_type type() const override {
            return kind;
        }
        void update_uniforms(material& mat) const override {
            updates++;
            mat.uniforms["frame"] = updates;
        }
    };

    // Records gaze starts and stops instead of timing anything
    struct recording_gaze : gaze_control {
        std::vector<std::string> events;
        const gaze_interface* target = nullptr;
        void start(const gaze_interface& gaze_target) override {
            events.push_back("start");
            target = &gaze_target;
        }
        void stop() override {
            events.push_back("stop");
            target = nullptr;
        }
    };
}

#endif
