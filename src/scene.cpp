#include <idpick/scene.hpp>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

std::shared_ptr<const idpick::geometry> idpick::make_quad(const glm::vec2 size) {
    const glm::vec2 half = size * 0.5f;
    return std::make_shared<const geometry>(geometry {
        .positions = {
            {-half.x, -half.y, 0.0f},
            { half.x, -half.y, 0.0f},
            { half.x,  half.y, 0.0f},
            {-half.x,  half.y, 0.0f}
        },
        .texcoords = {
            {0.0f, 0.0f},
            {1.0f, 0.0f},
            {1.0f, 1.0f},
            {0.0f, 1.0f}
        },
        .elements = {0, 1, 2, 0, 2, 3}
    });
}

idpick::scene_node& idpick::scene::add(const object_id id, scene_node node, const colour_codec& codec) {
    if (id > max_object_id) {
        throw std::runtime_error(fmt::format("Object id {:#x} does not fit in an identity colour (max {:#x})", id, max_object_id));
    }
    node.id = id;
    node.pick_colour = codec.encode(id);
    return nodes.emplace_back(std::move(node));
}
