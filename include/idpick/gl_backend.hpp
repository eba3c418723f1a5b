#ifndef IDPICK_GL_BACKEND_HPP_INCLUDED
#define IDPICK_GL_BACKEND_HPP_INCLUDED

#include <idpick/gl.hpp>
#include <idpick/render_backend.hpp>
#include <idpick/window.hpp>
#include <string>
#include <unordered_map>

namespace idpick {
    // OpenGL 4 implementation: RGBA8 colour texture + depth renderbuffer per target
    class gl_backend : public render_backend {
        struct target_storage : gpu_target {
            gl::framebuffer fbo;
            gl::texture2d colour;
            gl::renderbuffer depth;
            target_storage(gl::framebuffer fbo, gl::texture2d colour, gl::renderbuffer depth);
        };
        struct uploaded {
            gl::buffer<GL_ARRAY_BUFFER> positions;
            gl::buffer<GL_ARRAY_BUFFER> texcoords;
            gl::buffer<GL_ELEMENT_ARRAY_BUFFER> elements;
            gl::vao vertex_array;
            GLsizei element_count;
        };

        idpick::window& win;
        std::unordered_map<std::string, gl::program> programs;
        std::unordered_map<const geometry*, uploaded> geometries;
        std::unordered_map<const bitmap*, gl::texture2d> alpha_maps;
        gl::texture2d opaque;
        std::shared_ptr<const geometry> blit_quad;

        gl::program& program(const std::string& name);
        uploaded& upload(const geometry& shape);
        gl::texture2d& alpha_map(const scene_node& node);
        void bind(const render_target* target);
        static const target_storage* storage_of(const render_target& target);
    public:
        // Material used by render() when the scene has no override
        material scene_material;

        explicit gl_backend(idpick::window& win);
        std::unique_ptr<gpu_target> allocate(int width, int height) override;
        void clear_target(render_target& target, bool colour, bool depth, bool stencil) override;
        void render(const scene& s, const camera_pose& pose, render_target& target, bool clear) override;
        void render(const scene& s, const camera_pose& pose, render_target* target, bool clear);
        std::vector<std::uint8_t> read_pixels(const render_target& target, int x, int y, int w, int h) override;
        void blit(const render_target& source, render_target* destination, glm::vec2 centre, float scale) override;
    };
}

#endif
