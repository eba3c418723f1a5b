#include <idpick/gl.hpp>
#include <GLFW/glfw3.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <array>

namespace {
    std::string debug_type_to_string(GLenum type) {
        switch(type) {
        case GL_DEBUG_TYPE_ERROR: return "error";
        case GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR: return "deprecation warning";
        case GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR: return "undefined behaviour";
        case GL_DEBUG_TYPE_PORTABILITY: return "implementation specific behaviour";
        case GL_DEBUG_TYPE_PERFORMANCE: return "performance issue";
        case GL_DEBUG_TYPE_MARKER: return "command stream annotation";
        case GL_DEBUG_TYPE_PUSH_GROUP: return "group pushing";
        case GL_DEBUG_TYPE_POP_GROUP: return "group popping";
        case GL_DEBUG_TYPE_OTHER: return "other issue";
        default: return "unknown issue";
        }
    }
    std::string debug_source_to_string(GLenum source) {
        switch (source) {
        case GL_DEBUG_SOURCE_API: return "GL";
        case GL_DEBUG_SOURCE_WINDOW_SYSTEM: return "GLX";
        case GL_DEBUG_SOURCE_SHADER_COMPILER: return "Compiler";
        case GL_DEBUG_SOURCE_THIRD_PARTY: return "3rd Party";
        case GL_DEBUG_SOURCE_APPLICATION: return "This";
        case GL_DEBUG_SOURCE_OTHER: return "Other";
        default: return "Unknown";
        }
    }
    std::string debug_severity_to_string(GLenum severity) {
        switch(severity) {
        case GL_DEBUG_SEVERITY_HIGH: return "high";
        case GL_DEBUG_SEVERITY_MEDIUM: return "medium";
        case GL_DEBUG_SEVERITY_LOW: return "low";
        case GL_DEBUG_SEVERITY_NOTIFICATION: return "notification";
        default: return "Unknown";
        }
    }

    void APIENTRY opengl_debug_callback(
        GLenum source, GLenum type, GLuint, GLenum severity,
        GLsizei, const GLchar* message, const void*) {
        spdlog::debug (
            "{}: {} severity {}: {}",
            debug_source_to_string(source),
            debug_severity_to_string(severity),
            debug_type_to_string(type),
            message
        );
    }
}

idpick::gl::context::context() {
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        throw std::runtime_error("Could not load opengl extensions");
    }
    spdlog::info("Loaded opengl {}.{}", GLVersion.major, GLVersion.minor);
    if (GLAD_GL_KHR_debug) {
        glDebugMessageCallback(opengl_debug_callback, nullptr);
    }
}

void idpick::gl::shader_deleter::operator()(GLuint shader) const {
    glDeleteShader(shader);
}

idpick::gl::shader::shader(shader_hnd shader): hnd(std::move(shader)) {
}

idpick::gl::shader idpick::gl::context::compile(std::string source, GLenum type) {
    shader_hnd shader {glCreateShader(type)};
    if (*shader == 0) {
        shader.release();
        throw std::runtime_error(fmt::format("glCreateShader failed. Reason: {}", glGetError()));
    }
    std::array<GLchar const* const, 1> const sources = { source.c_str() };
    std::array<GLint const, 1> const lengths = { static_cast<GLint>(source.size()) };
    glShaderSource(*shader, 1, sources.data(), lengths.data());
    glCompileShader(*shader);
    GLint status;
    glGetShaderiv(*shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length;
        glGetShaderiv(*shader, GL_INFO_LOG_LENGTH, &log_length);
        idpick::gl::string log(log_length, ' ');
        glGetShaderInfoLog(*shader, log_length, nullptr, log.data());
        throw std::runtime_error(fmt::format("Shader compilation failed because: {}", log));
    }
    return idpick::gl::shader{std::move(shader)};
}

void idpick::gl::program_deleter::operator()(GLuint program) const {
    glDeleteProgram(program);
}

idpick::gl::program::program(program_hnd program): hnd(std::move(program)) {
}

GLint idpick::gl::program::uniform(const char* name) const {
    return glGetUniformLocation(*hnd, name);
}

void idpick::gl::program::use() const {
    glUseProgram(*hnd);
}

idpick::gl::program idpick::gl::context::link(const shader& vertex, const shader& fragment, const std::vector<std::pair<string, GLuint>>& locations) {
    program_hnd program {glCreateProgram()};
    if (*program == 0) {
        program.release();
        throw std::runtime_error(fmt::format("glCreateProgram failed. Reason: {}", glGetError()));
    }
    glAttachShader(*program, *vertex.hnd);
    glAttachShader(*program, *fragment.hnd);
    glBindFragDataLocation(*program, 0, "out_colour");
    for (const auto& [attr_name, attr_location] : locations) {
        glBindAttribLocation(*program, attr_location, attr_name.c_str());
    }

    glLinkProgram(*program);
    GLint status;
    glGetProgramiv(*program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length;
        glGetProgramiv(*program, GL_INFO_LOG_LENGTH, &log_length);
        idpick::gl::string log(log_length, ' ');
        glGetProgramInfoLog(*program, log_length, nullptr, log.data());
        throw std::runtime_error(fmt::format("Program linking failed because: {}", log));
    }
    return idpick::gl::program{std::move(program)};
}

void idpick::gl::buffer_deleter::operator()(GLuint buffer) const {
    glDeleteBuffers(1, &buffer);
}

void idpick::gl::texture_deleter::operator()(GLuint hnd) const {
    glDeleteTextures(1, &hnd);
}

idpick::gl::texture2d idpick::gl::context::make_texture(int w, int h, GLenum internal_format, GLenum format, const void* pixels) {
    texture2d tex { make_hnd<texture_hnd>(glGenTextures) };
    tex.bind();
    glTexImage2D(GL_TEXTURE_2D, 0, internal_format, w, h, 0, format, GL_UNSIGNED_BYTE, pixels);
    // Identity colours must never be blended between texels
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    return tex;
}

idpick::gl::texture2d idpick::gl::context::make_texture(const idpick::bitmap& bmp) {
    if (bmp.rgba.size() != static_cast<std::size_t>(bmp.width) * bmp.height * 4) {
        throw std::runtime_error(fmt::format("Bitmap {}x{} has {} bytes, expected RGBA", bmp.width, bmp.height, bmp.rgba.size()));
    }
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    return make_texture(bmp.width, bmp.height, GL_RGBA8, GL_RGBA, bmp.rgba.data());
}

void idpick::gl::framebuffer_deleter::operator()(GLuint hnd) const {
    glDeleteFramebuffers(1, &hnd);
}

idpick::gl::framebuffer::framebuffer(framebuffer_hnd fbo) : hnd {std::move(fbo)} {
}

void idpick::gl::framebuffer::bind() const {
    glBindFramebuffer(GL_FRAMEBUFFER, *hnd);
}

bool idpick::gl::framebuffer::complete() const {
    bind();
    return glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
}

idpick::gl::framebuffer idpick::gl::context::make_framebuffer() {
    return idpick::gl::framebuffer{make_hnd<framebuffer_hnd>(glGenFramebuffers)};
}

void idpick::gl::renderbuffer_deleter::operator()(GLuint hnd) const {
    glDeleteRenderbuffers(1, &hnd);
}

idpick::gl::renderbuffer::renderbuffer(renderbuffer_hnd old) : hnd {std::move(old)} {
}

void idpick::gl::renderbuffer::bind() const {
    glBindRenderbuffer(GL_RENDERBUFFER, *hnd);
}

idpick::gl::renderbuffer idpick::gl::context::make_renderbuffer(int w, int h, GLenum format) {
    renderbuffer buffer { make_hnd<renderbuffer_hnd>(glGenRenderbuffers) };
    buffer.bind();
    glRenderbufferStorage(GL_RENDERBUFFER, format, w, h);
    return buffer;
}

void idpick::gl::vao_deleter::operator()(GLuint hnd) const {
    glDeleteVertexArrays(1, &hnd);
}

idpick::gl::vao::vao(vao_hnd old) : hnd {std::move(old)} {
}

void idpick::gl::vao::bind() const {
    glBindVertexArray(*hnd);
}

idpick::gl::vao idpick::gl::context::make_vertex_array(const std::vector<attribute_source>& attributes, const buffer<GL_ELEMENT_ARRAY_BUFFER>* elements) {
    vao array { make_hnd<vao_hnd>(glGenVertexArrays) };
    array.bind();
    for (const auto& attribute : attributes) {
        attribute.source.bind();
        glEnableVertexAttribArray(attribute.location);
        glVertexAttribPointer(attribute.location, attribute.size, attribute.type, GL_FALSE, 0, nullptr);
    }
    if (elements) {
        elements->bind();
    }
    glBindVertexArray(0);
    return array;
}
