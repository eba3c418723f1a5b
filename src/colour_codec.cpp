#include <idpick/colour_codec.hpp>

glm::u8vec3 idpick::encode_colour(const object_id id) {
    return glm::u8vec3 {
        static_cast<std::uint8_t>((id >> 16) & 0xFF),
        static_cast<std::uint8_t>((id >> 8) & 0xFF),
        static_cast<std::uint8_t>(id & 0xFF)
    };
}

idpick::object_id idpick::decode_colour(const glm::u8vec3 rgb) {
    return (static_cast<object_id>(rgb.r) << 16)
         | (static_cast<object_id>(rgb.g) << 8)
         | static_cast<object_id>(rgb.b);
}

glm::vec3 idpick::normalized_colour(const glm::u8vec3 rgb) {
    return glm::vec3{rgb} / 255.0f;
}

glm::u8vec3 idpick::colour_codec::encode(const object_id id) const {
    if (dump) {
        return dump_colour;
    }
    return encode_colour(id);
}

idpick::object_id idpick::colour_codec::decode(const glm::u8vec3 rgb) const {
    return decode_colour(rgb);
}
