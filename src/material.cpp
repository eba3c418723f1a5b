#include <idpick/material.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string_view idpick::to_string(const view_type type) {
    switch (type) {
    case view_type::rectilinear: return "rectilinear";
    case view_type::flat: return "flat";
    case view_type::gopro: return "gopro";
    default: return "unknown";
    }
}

std::string_view idpick::to_string(const material_kind kind) {
    switch (kind) {
    case material_kind::main: return "main";
    case material_kind::pick: return "pick";
    default: return "unknown";
    }
}

idpick::material& idpick::material_registry::add(view_type type, material_kind kind, material mat) {
    spdlog::info("Registering {} material \"{}\" for {} view", to_string(kind), mat.program, to_string(type));
    auto [it, emplaced] = materials.insert_or_assign(std::make_pair(type, kind), std::move(mat));
    return it->second;
}

idpick::material& idpick::material_registry::get(view_type type, material_kind kind) {
    auto material_it = materials.find(std::make_pair(type, kind));
    if (material_it == materials.end()) {
        throw std::runtime_error(fmt::format("No {} material registered for {} view", to_string(kind), to_string(type)));
    }
    return material_it->second;
}

bool idpick::material_registry::has(view_type type, material_kind kind) const {
    return materials.find(std::make_pair(type, kind)) != materials.end();
}
