#ifndef IDPICK_WINDOW_HPP_INCLUDED
#define IDPICK_WINDOW_HPP_INCLUDED

#include <idpick/gl.hpp>
#include <GLFW/glfw3.h>
#include <memory>
#include <boost/signals2.hpp>
#include <glm/vec2.hpp>

namespace idpick {
    struct window_deleter {
        void operator()(GLFWwindow* w) const;
    };
    using window_hnd = std::unique_ptr<GLFWwindow, window_deleter>;
    struct glfw_context;

    struct window {
        glfw_context& glfw;
        window_hnd hnd;
        gl::context gl;
        boost::signals2::signal<void(int, int)> on_framebuffer_size;
        boost::signals2::signal<void(int, int, int, int)> on_key;
        boost::signals2::signal<void(double, double)> on_cursor_move;
        boost::signals2::signal<void(int, int, int)> on_mouse_button;
        window(glfw_context&, window_hnd);
        window(const window&&) = delete; //if implemented, glfwuserpointer must be updated
        int width() const;
        int height() const;
        int framebuffer_width() const;
        int framebuffer_height() const;
        glm::dvec2 cursor() const;
        bool should_close() const;
        void swap();
        void close();
    };

    struct glfw_context {
        explicit glfw_context();
        window make_window(int w, int h, const char* title);
        void poll();
        ~glfw_context();
    };
}

#endif
