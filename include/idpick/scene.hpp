#ifndef IDPICK_SCENE_HPP_INCLUDED
#define IDPICK_SCENE_HPP_INCLUDED

#include <idpick/colour_codec.hpp>
#include <idpick/material.hpp>
#include <cstdint>
#include <memory>
#include <vector>
#include <glm/glm.hpp>

namespace idpick {
    struct geometry {
        std::vector<glm::vec3> positions;
        std::vector<glm::vec2> texcoords;
        std::vector<std::uint32_t> elements;
    };
    std::shared_ptr<const geometry> make_quad(glm::vec2 size);

    // Tightly packed 8-bit RGBA, first row at the bottom
    struct bitmap {
        int width;
        int height;
        std::vector<std::uint8_t> rgba;
    };

    struct scene_node {
        object_id id;
        std::shared_ptr<const geometry> shape;
        glm::mat4 transform {1.0f};
        glm::vec4 colour {1.0f};
        // Alpha of this map masks both the visible surface and the identity colour
        std::shared_ptr<const bitmap> alpha_map;
        glm::u8vec3 pick_colour {0, 0, 0};
    };

    struct scene {
        std::vector<scene_node> nodes;
        // Replaces every node's material while set; null for the regular pass
        material* override_material = nullptr;

        // Registers node under id and assigns its identity colour. Throws if id does not fit in a colour.
        scene_node& add(object_id id, scene_node node, const colour_codec& codec);
    };
}

#endif
