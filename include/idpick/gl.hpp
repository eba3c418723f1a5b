#ifndef IDPICK_GL_HPP_INCLUDED
#define IDPICK_GL_HPP_INCLUDED
#include <glad/glad.h>
#include <idpick/unique.hpp>
#include <idpick/scene.hpp>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace idpick::gl {
    using string = std::basic_string<GLchar>;

    struct shader_deleter {
        void operator()(GLuint) const;
    };
    using shader_hnd = unique<GLuint, shader_deleter>;
    struct shader {
        shader_hnd hnd;
        explicit shader(shader_hnd shader);
    };

    struct program_deleter {
        void operator()(GLuint) const;
    };
    using program_hnd = unique<GLuint, program_deleter>;
    struct program {
        program_hnd hnd;
        explicit program(program_hnd program);
        GLint uniform(const char* name) const;
        void use() const;
    };

    enum common_attribute_locations : GLuint {
        POSITION,
        TEXCOORD_0
    };
    inline const std::vector<std::pair<idpick::gl::string, GLuint>> common_attribute_names = {
        {"POSITION", POSITION},
        {"TEXCOORD_0", TEXCOORD_0}
    };

    struct buffer_deleter {
        void operator()(GLuint) const;
    };
    using buffer_hnd = unique<GLuint, buffer_deleter>;
    template<GLenum target>
    struct buffer {
        buffer_hnd hnd;
        explicit buffer(buffer_hnd buffer) : hnd(std::move(buffer)) {
        }
        void bind() const {
            glBindBuffer(target, *hnd);
            if (glGetError() == GL_INVALID_OPERATION) {
                throw std::runtime_error("Invalid bind!\n");
            }
        }
        template <typename It>
        void upload(const It begin, const It end, GLenum hint = GL_STATIC_DRAW) {
            bind();
            glBufferData (
                target,
                std::distance(begin, end) * sizeof(typename std::iterator_traits<It>::value_type),
                std::to_address(begin),
                hint
            );
        }
    };

    struct texture_deleter {
        void operator()(GLuint) const;
    };
    using texture_hnd = unique<GLuint, texture_deleter>;
    template<GLenum target>
    struct texture {
        texture_hnd hnd;
        explicit texture(texture_hnd texture) : hnd(std::move(texture)) {
        }
        void bind() const {
            glBindTexture(target, *hnd);
        }
        void activate(GLuint texture_unit) const {
            glActiveTexture(GL_TEXTURE0 + texture_unit);
            bind();
        }
    };
    using texture2d = texture<GL_TEXTURE_2D>;

    struct framebuffer_deleter {
        void operator()(GLuint) const;
    };
    using framebuffer_hnd = unique<GLuint, framebuffer_deleter>;
    struct framebuffer {
        framebuffer_hnd hnd;
        explicit framebuffer(framebuffer_hnd fbo);
        void bind() const;
        bool complete() const;
    };

    struct renderbuffer_deleter {
        void operator()(GLuint) const;
    };
    using renderbuffer_hnd = unique<GLuint, renderbuffer_deleter>;
    struct renderbuffer {
        renderbuffer_hnd hnd;
        explicit renderbuffer(renderbuffer_hnd hnd);
        void bind() const;
    };

    struct vao_deleter {
        void operator()(GLuint) const;
    };
    using vao_hnd = unique<GLuint, vao_deleter>;
    struct vao {
        vao_hnd hnd;
        explicit vao(vao_hnd hnd);
        void bind() const;
    };

    struct attribute_source {
        buffer<GL_ARRAY_BUFFER>& source;
        GLuint location;
        GLint size;
        GLenum type;
    };

    struct context {
        shader compile(std::string source, GLenum type);
        program link(const shader&, const shader&, const std::vector<std::pair<string, GLuint>>& locations = {});
        texture2d make_texture(int w, int h, GLenum internal_format, GLenum format, const void* pixels = nullptr);
        texture2d make_texture(const idpick::bitmap& bmp);
        framebuffer make_framebuffer();
        renderbuffer make_renderbuffer(int w, int h, GLenum format);
        vao make_vertex_array(const std::vector<attribute_source>& attributes, const buffer<GL_ELEMENT_ARRAY_BUFFER>* elements);
        template<typename T, typename F>
        T make_hnd(F&& generate) {
            GLuint hnd;
            generate(1, &hnd);
            return T{hnd};
        }
        template<GLenum target>
        buffer<target> make_buffer() {
            buffer<target> buffer { make_hnd<buffer_hnd>(glGenBuffers) };
            buffer.bind();
            return buffer;
        }
        template<GLenum target, typename It>
        buffer<target> make_buffer(It begin, It end, GLenum usage_hint = GL_STATIC_DRAW) {
            auto buffer = make_buffer<target>();
            buffer.upload(begin, end, usage_hint);
            return buffer;
        }
        explicit context();
    };
}

#endif
