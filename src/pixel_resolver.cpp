#include <idpick/pixel_resolver.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::optional<glm::ivec2> idpick::target_texel(const render_target& target, const glm::vec2 normalized) {
    // Negated so NaN from a zero-sized viewport is rejected too
    if (!(normalized.x >= 0.0f && normalized.x <= 1.0f && normalized.y >= 0.0f && normalized.y <= 1.0f)) {
        return std::nullopt;
    }
    // Render targets are bottom-origin, viewports top-origin
    const int x = static_cast<int>(std::floor(normalized.x * target.width));
    const int y = static_cast<int>(std::floor((1.0f - normalized.y) * target.height));
    return glm::ivec2 {
        std::clamp(x, 0, target.width - 1),
        std::clamp(y, 0, target.height - 1)
    };
}

idpick::pixel_resolver::pixel_resolver(render_backend& backend) : backend(backend) {
}

std::optional<idpick::object_id> idpick::pixel_resolver::id_at(const render_target& target, const glm::vec2 normalized) const {
    if (!target.storage) {
        return std::nullopt;
    }
    const auto texel = target_texel(target, normalized);
    if (!texel) {
        return std::nullopt;
    }
    const auto data = backend.read_pixels(target, texel->x, texel->y, 1, 1);
    if (data.size() < 4) {
        throw std::runtime_error(fmt::format("Readback of texel ({}, {}) returned {} bytes", texel->x, texel->y, data.size()));
    }
    // Alpha only masks fragments during the pass, it is not part of the id
    return decode_colour(glm::u8vec3{data[0], data[1], data[2]});
}

idpick::pickable_object* idpick::pixel_resolver::object_at(picking_interface& interface, const render_target& target, const glm::vec2 normalized) const {
    const auto id = id_at(target, normalized);
    if (!id) {
        return nullptr;
    }
    return interface.object_with_id(*id);
}
