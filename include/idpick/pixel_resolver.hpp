#ifndef IDPICK_PIXEL_RESOLVER_HPP_INCLUDED
#define IDPICK_PIXEL_RESOLVER_HPP_INCLUDED

#include <idpick/colour_codec.hpp>
#include <idpick/pickable.hpp>
#include <idpick/render_backend.hpp>
#include <optional>
#include <glm/vec2.hpp>

namespace idpick {
    // Maps a normalized viewport position (origin top-left) to a texel of a bottom-origin target
    std::optional<glm::ivec2> target_texel(const render_target& target, glm::vec2 normalized);

    class pixel_resolver {
        render_backend& backend;
    public:
        explicit pixel_resolver(render_backend& backend);
        // Reads back one texel; stalls until the pass that wrote target has completed.
        // Empty when position is outside the viewport or target has never been rendered.
        std::optional<object_id> id_at(const render_target& target, glm::vec2 normalized) const;
        pickable_object* object_at(picking_interface& interface, const render_target& target, glm::vec2 normalized) const;
    };
}

#endif
