#ifndef IDPICK_MATERIAL_HPP_INCLUDED
#define IDPICK_MATERIAL_HPP_INCLUDED

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <glm/glm.hpp>

namespace idpick {
    using uniform_value = std::variant<int, float, glm::vec2, glm::vec3, glm::vec4, glm::mat4>;

    struct material {
        // Shader program name; backends resolve it to shaders/<program>_{vertex,fragment}.glsl
        std::string program;
        std::unordered_map<std::string, uniform_value> uniforms;
    };

    enum class view_type {
        rectilinear,
        flat,
        gopro
    };
    std::string_view to_string(view_type type);

    enum class material_kind {
        main,
        pick
    };
    std::string_view to_string(material_kind kind);

    // Projection model of a viewport. Each view keeps its material uniforms in sync with its own state.
    struct view {
        virtual ~view() = default;
        virtual view_type type() const = 0;
        virtual void update_uniforms(material& mat) const = 0;
    };

    class material_registry {
        std::map<std::pair<view_type, material_kind>, material> materials;
    public:
        material& add(view_type type, material_kind kind, material mat);
        material& get(view_type type, material_kind kind);
        bool has(view_type type, material_kind kind) const;
    };
}

#endif
