#ifndef IDPICK_PICKABLE_HPP_INCLUDED
#define IDPICK_PICKABLE_HPP_INCLUDED

#include <idpick/colour_codec.hpp>
#include <idpick/scene.hpp>
#include <functional>

namespace idpick {
    // Handlers are optional capabilities: an empty function means the object does not react.
    struct pickable_object {
        object_id id = 0;
        bool interactive = true;
        std::function<void()> click;
        std::function<void()> over;
        std::function<void()> out;
    };

    // Exposes the pickable part of a scene. Objects stay owned by the implementation.
    struct picking_interface {
        virtual ~picking_interface() = default;
        virtual bool enabled() const = 0;
        virtual idpick::scene& scene() = 0;
        // nullptr when nothing is registered under id, which is what background pixels decode to
        virtual pickable_object* object_with_id(object_id id) = 0;
    };
}

#endif
