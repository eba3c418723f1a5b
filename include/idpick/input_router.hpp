#ifndef IDPICK_INPUT_ROUTER_HPP_INCLUDED
#define IDPICK_INPUT_ROUTER_HPP_INCLUDED

#include <idpick/viewport.hpp>
#include <boost/signals2.hpp>
#include <functional>
#include <glm/vec2.hpp>

namespace idpick {
    // Feeds pointer events, as normalized viewport positions, to the picker while not in VR.
    // In VR there is no pointer: the owner polls the screen centre every frame instead.
    class input_router {
    public:
        using handler = std::function<void(glm::vec2)>;
    private:
        viewport_system& viewports;
        handler on_click;
        handler on_move;
        boost::signals2::scoped_connection click_connection;
        boost::signals2::scoped_connection move_connection;
        boost::signals2::scoped_connection vr_connection;
    public:
        input_router(viewport_system& viewports, handler on_click, handler on_move);
        input_router(const input_router&) = delete;
        input_router& operator=(const input_router&) = delete;

        // Installs pointer handlers for the current mode and follows VR mode changes from now on
        void start();
        void add_handlers();
        void remove_handlers();
        void stop();
        bool pointer_attached() const;
    };
}

#endif
