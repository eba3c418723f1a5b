#include <idpick/window.hpp>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {
    void glfw_error_callback(int error, const char* description) {
        spdlog::error("glfw3 error[{}]: {}", error, description);
    }
    void glfw_dispatch_framebuffer_size(GLFWwindow* w, int width, int height) {
        reinterpret_cast<idpick::window*>(glfwGetWindowUserPointer(w))->on_framebuffer_size(width, height);
    }
    void glfw_dispatch_key(GLFWwindow* w, int key, int scancode, int action, int mods) {
        reinterpret_cast<idpick::window*>(glfwGetWindowUserPointer(w))->on_key(key, scancode, action, mods);
    }
    void glfw_dispatch_cursor_pos(GLFWwindow* w, double xpos, double ypos) {
        reinterpret_cast<idpick::window*>(glfwGetWindowUserPointer(w))->on_cursor_move(xpos, ypos);
    }
    void glfw_dispatch_mouse_button(GLFWwindow* w, int button, int action, int mods) {
        reinterpret_cast<idpick::window*>(glfwGetWindowUserPointer(w))->on_mouse_button(button, action, mods);
    }
}

void idpick::window_deleter::operator()(GLFWwindow* win) const {
    glfwDestroyWindow(win);
}

idpick::window::window(glfw_context& glfw, window_hnd old_hnd) : glfw(glfw), hnd(std::move(old_hnd)) {
    glfwSetWindowUserPointer(hnd.get(), this);
    glfwSetInputMode(hnd.get(), GLFW_CURSOR, GLFW_CURSOR_NORMAL);
    glfwSetFramebufferSizeCallback(hnd.get(), glfw_dispatch_framebuffer_size);
    glfwSetKeyCallback(hnd.get(), glfw_dispatch_key);
    glfwSetCursorPosCallback(hnd.get(), glfw_dispatch_cursor_pos);
    glfwSetMouseButtonCallback(hnd.get(), glfw_dispatch_mouse_button);
}

int idpick::window::width() const {
    int width, height;
    glfwGetWindowSize(hnd.get(), &width, &height);
    return width;
}

int idpick::window::height() const {
    int width, height;
    glfwGetWindowSize(hnd.get(), &width, &height);
    return height;
}

int idpick::window::framebuffer_width() const {
    int width, height;
    glfwGetFramebufferSize(hnd.get(), &width, &height);
    return width;
}

int idpick::window::framebuffer_height() const {
    int width, height;
    glfwGetFramebufferSize(hnd.get(), &width, &height);
    return height;
}

glm::dvec2 idpick::window::cursor() const {
    glm::dvec2 pos;
    glfwGetCursorPos(hnd.get(), &pos.x, &pos.y);
    return pos;
}

bool idpick::window::should_close() const {
    return glfwWindowShouldClose(hnd.get());
}

void idpick::window::swap() {
    glfwSwapBuffers(hnd.get());
}

void idpick::window::close() {
    glfwSetWindowShouldClose(hnd.get(), true);
}

idpick::glfw_context::glfw_context() {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        throw std::runtime_error("Could not initialise glfw");
    } else {
        spdlog::info("Initialized glfw {}", glfwGetVersionString());
    }
}

idpick::window idpick::glfw_context::make_window(int width, int height, const char* title) {
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, true);
    auto window = window_hnd{glfwCreateWindow(width, height, title, nullptr, nullptr)};
    if (!window) {
        throw std::runtime_error("Could not create opengl window");
    }
    glfwMakeContextCurrent(window.get());
    glfwSwapInterval(1);
    spdlog::info("Created {}x{} window, context {}.{}", width, height,
                 glfwGetWindowAttrib(window.get(), GLFW_CONTEXT_VERSION_MAJOR),
                 glfwGetWindowAttrib(window.get(), GLFW_CONTEXT_VERSION_MINOR));
    return idpick::window{*this, std::move(window)};
}

void idpick::glfw_context::poll() {
    glfwPollEvents();
}

idpick::glfw_context::~glfw_context() {
    glfwTerminate();
}
