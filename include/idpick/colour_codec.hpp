#ifndef IDPICK_COLOUR_CODEC_HPP_INCLUDED
#define IDPICK_COLOUR_CODEC_HPP_INCLUDED

#include <cstdint>
#include <glm/vec3.hpp>
#include <glm/gtc/type_precision.hpp>

namespace idpick {
    using object_id = std::uint32_t;

    // Largest identifier that fits in an 8-bit-per-channel RGB colour
    inline constexpr object_id max_object_id = 0xFFFFFF;

    inline const glm::u8vec3 dump_colour {255, 0, 0};

    // Packs id as 0xRRGGBB. ids above max_object_id are a caller bug and are not checked here.
    glm::u8vec3 encode_colour(object_id id);
    object_id decode_colour(glm::u8vec3 rgb);
    glm::vec3 normalized_colour(glm::u8vec3 rgb);

    struct colour_codec {
        // When set, every object encodes to dump_colour so the identity buffer is visible on screen
        bool dump = false;

        glm::u8vec3 encode(object_id id) const;
        object_id decode(glm::u8vec3 rgb) const;
    };
}

#endif
