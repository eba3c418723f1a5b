#include <idpick/gl_backend.hpp>
#include <idpick/util.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <glm/gtc/type_ptr.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <array>
#include <functional>
#include <optional>
#include <stdexcept>

namespace {
    bool is_enabled(const GLenum cap) {
        return glIsEnabled(cap) == GL_TRUE;
    }

    std::function<void(bool)> capability(const GLenum cap) {
        return [cap](bool on) {
            if (on) {
                glEnable(cap);
            } else {
                glDisable(cap);
            }
        };
    }

    void set_uniform(GLint location, const idpick::uniform_value& value) {
        if (location == -1) {
            return;
        }
        std::visit(overloaded {
            [&](int v) { glUniform1i(location, v); },
            [&](float v) { glUniform1f(location, v); },
            [&](const glm::vec2& v) { glUniform2fv(location, 1, glm::value_ptr(v)); },
            [&](const glm::vec3& v) { glUniform3fv(location, 1, glm::value_ptr(v)); },
            [&](const glm::vec4& v) { glUniform4fv(location, 1, glm::value_ptr(v)); },
            [&](const glm::mat4& v) { glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(v)); }
        }, value);
    }
}

idpick::gl_backend::target_storage::target_storage(gl::framebuffer fbo, gl::texture2d colour, gl::renderbuffer depth) :
    fbo(std::move(fbo)),
    colour(std::move(colour)),
    depth(std::move(depth))
{
}

idpick::gl_backend::gl_backend(idpick::window& win) :
    win(win),
    opaque(win.gl.make_texture(1, 1, GL_RGBA8, GL_RGBA, std::array<std::uint8_t, 4>{255, 255, 255, 255}.data())),
    blit_quad(make_quad(glm::vec2{2.0f})),
    scene_material{"scene", {}}
{
}

idpick::gl::program& idpick::gl_backend::program(const std::string& name) {
    auto program_it = programs.find(name);
    if (program_it != programs.end()) {
        return program_it->second;
    }
    spdlog::info("Compiling program {}", name);
    auto linked = win.gl.link (
        win.gl.compile(file_contents(fmt::format("shaders/{}_vertex.glsl", name)), GL_VERTEX_SHADER),
        win.gl.compile(file_contents(fmt::format("shaders/{}_fragment.glsl", name)), GL_FRAGMENT_SHADER),
        gl::common_attribute_names
    );
    return programs.emplace(name, std::move(linked)).first->second;
}

idpick::gl_backend::uploaded& idpick::gl_backend::upload(const geometry& shape) {
    auto upload_it = geometries.find(&shape);
    if (upload_it != geometries.end()) {
        return upload_it->second;
    }
    auto positions = win.gl.make_buffer<GL_ARRAY_BUFFER>(shape.positions.begin(), shape.positions.end());
    auto texcoords = win.gl.make_buffer<GL_ARRAY_BUFFER>(shape.texcoords.begin(), shape.texcoords.end());
    auto elements = win.gl.make_buffer<GL_ELEMENT_ARRAY_BUFFER>(shape.elements.begin(), shape.elements.end());
    auto vertex_array = win.gl.make_vertex_array({
        gl::attribute_source{positions, gl::POSITION, 3, GL_FLOAT},
        gl::attribute_source{texcoords, gl::TEXCOORD_0, 2, GL_FLOAT}
    }, &elements);
    auto [it, emplaced] = geometries.emplace (
        &shape,
        uploaded {
            std::move(positions),
            std::move(texcoords),
            std::move(elements),
            std::move(vertex_array),
            static_cast<GLsizei>(shape.elements.size())
        }
    );
    return it->second;
}

idpick::gl::texture2d& idpick::gl_backend::alpha_map(const scene_node& node) {
    if (!node.alpha_map) {
        return opaque;
    }
    auto map_it = alpha_maps.find(node.alpha_map.get());
    if (map_it != alpha_maps.end()) {
        return map_it->second;
    }
    return alpha_maps.emplace(node.alpha_map.get(), win.gl.make_texture(*node.alpha_map)).first->second;
}

const idpick::gl_backend::target_storage* idpick::gl_backend::storage_of(const render_target& target) {
    return dynamic_cast<const target_storage*>(target.storage.get());
}

void idpick::gl_backend::bind(const render_target* target) {
    if (!target) {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, win.framebuffer_width(), win.framebuffer_height());
        return;
    }
    auto storage = storage_of(*target);
    if (!storage) {
        throw std::runtime_error(fmt::format("Render target {}x{} has no GL storage", target->width, target->height));
    }
    storage->fbo.bind();
    glViewport(0, 0, target->width, target->height);
}

std::unique_ptr<idpick::gpu_target> idpick::gl_backend::allocate(int width, int height) {
    auto colour = win.gl.make_texture(width, height, GL_RGBA8, GL_RGBA);
    auto depth = win.gl.make_renderbuffer(width, height, GL_DEPTH_COMPONENT24);
    auto fbo = win.gl.make_framebuffer();
    fbo.bind();
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, *colour.hnd, 0);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, *depth.hnd);
    if (!fbo.complete()) {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        throw std::runtime_error(fmt::format("Could not allocate a complete {}x{} framebuffer", width, height));
    }
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    spdlog::debug("Allocated {}x{} framebuffer", width, height);
    return std::make_unique<target_storage>(std::move(fbo), std::move(colour), std::move(depth));
}

void idpick::gl_backend::clear_target(render_target& target, bool colour, bool depth, bool stencil) {
    bind(&target);
    GLbitfield mask = 0;
    if (colour) {
        // Black decodes to id 0, which is never registered
        glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
        mask |= GL_COLOR_BUFFER_BIT;
    }
    if (depth) mask |= GL_DEPTH_BUFFER_BIT;
    if (stencil) mask |= GL_STENCIL_BUFFER_BIT;
    glClear(mask);
}

void idpick::gl_backend::render(const scene& s, const camera_pose& pose, render_target& target, bool clear) {
    render(s, pose, &target, clear);
}

void idpick::gl_backend::render(const scene& s, const camera_pose& pose, render_target* target, bool clear) {
    bind(target);
    if (clear) {
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    }
    const material& mat = s.override_material ? *s.override_material : scene_material;
    // The identity pass must write exact colours
    std::optional<scoped_toggle> blend;
    std::optional<scoped_toggle> multisample;
    if (s.override_material) {
        blend.emplace(is_enabled(GL_BLEND), false, capability(GL_BLEND));
        multisample.emplace(is_enabled(GL_MULTISAMPLE), false, capability(GL_MULTISAMPLE));
    }

    auto& prog = program(mat.program);
    prog.use();
    for (const auto& [name, value] : mat.uniforms) {
        set_uniform(prog.uniform(name.c_str()), value);
    }
    glUniformMatrix4fv(prog.uniform("view"), 1, GL_FALSE, glm::value_ptr(pose.view));
    glUniformMatrix4fv(prog.uniform("projection"), 1, GL_FALSE, glm::value_ptr(pose.projection));
    const GLint model_uniform = prog.uniform("model");
    const GLint colour_uniform = prog.uniform("colour");
    const GLint pick_colour_uniform = prog.uniform("pick_colour");
    glUniform1i(prog.uniform("alpha_map"), 0);

    for (const auto& node : s.nodes) {
        if (!node.shape) {
            continue;
        }
        auto& shape = upload(*node.shape);
        glUniformMatrix4fv(model_uniform, 1, GL_FALSE, glm::value_ptr(node.transform));
        glUniform4fv(colour_uniform, 1, glm::value_ptr(node.colour));
        const glm::vec3 pick = normalized_colour(node.pick_colour);
        glUniform3fv(pick_colour_uniform, 1, glm::value_ptr(pick));
        alpha_map(node).activate(0);
        shape.vertex_array.bind();
        glDrawElements(GL_TRIANGLES, shape.element_count, GL_UNSIGNED_INT, nullptr);
    }
    glBindVertexArray(0);
}

std::vector<std::uint8_t> idpick::gl_backend::read_pixels(const render_target& target, int x, int y, int w, int h) {
    bind(&target);
    std::vector<std::uint8_t> data(static_cast<std::size_t>(w) * h * 4);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(x, y, w, h, GL_RGBA, GL_UNSIGNED_BYTE, data.data());
    if (const GLenum error = glGetError(); error != GL_NO_ERROR) {
        throw std::runtime_error(fmt::format("glReadPixels failed with {:#x}", error));
    }
    return data;
}

void idpick::gl_backend::blit(const render_target& source, render_target* destination, glm::vec2 centre, float scale) {
    auto storage = storage_of(source);
    if (!storage) {
        return;
    }
    bind(destination);
    const scoped_toggle depth_test {is_enabled(GL_DEPTH_TEST), false, capability(GL_DEPTH_TEST)};
    auto& prog = program("blit");
    prog.use();
    const glm::mat4 placement = glm::scale(glm::translate(glm::mat4{1.0f}, glm::vec3{centre, 0.0f}), glm::vec3{scale * 0.5f, scale * 0.5f, 1.0f});
    glUniformMatrix4fv(prog.uniform("placement"), 1, GL_FALSE, glm::value_ptr(placement));
    glUniform1i(prog.uniform("source"), 0);
    storage->colour.activate(0);
    upload(*blit_quad).vertex_array.bind();
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(blit_quad->elements.size()), GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}
