#include <idpick/target_manager.hpp>
#include <idpick/maths.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

idpick::target_size idpick::compute_target_size(const float viewport_height, const float viewport_ratio, const int downscale, const int min_height) {
    if (!(viewport_height > 0.0f) || !std::isfinite(viewport_height) || !(viewport_ratio > 0.0f) || !std::isfinite(viewport_ratio)) {
        // Collapsed viewport: the smallest square target
        const int edge = floor_pot(min_height);
        return target_size{edge, edge};
    }
    const double scaled = static_cast<double>(viewport_height) / downscale;
    const int height = floor_pot(std::max(static_cast<double>(min_height), scaled));
    const int width = floor_pot(static_cast<double>(height) * viewport_ratio);
    return target_size{width, height};
}

idpick::target_manager::target_manager(render_backend& backend, const int downscale, const int min_height) :
    backend(backend),
    downscale(downscale),
    min_height(min_height)
{
}

bool idpick::target_manager::fit(const float viewport_height, const float viewport_ratio) {
    const auto [width, height] = compute_target_size(viewport_height, viewport_ratio, downscale, min_height);
    return resize(width, height);
}

bool idpick::target_manager::resize(const int width, const int height) {
    if (target.width == width && target.height == height) {
        return false;
    }
    spdlog::debug("Identity target resized from {}x{} to {}x{}", target.width, target.height, width, height);
    target.storage.reset();
    target.width = width;
    target.height = height;
    return true;
}

idpick::render_target& idpick::target_manager::acquire() {
    if (!target.storage) {
        target.storage = backend.allocate(target.width, target.height);
    }
    return target;
}

const idpick::render_target& idpick::target_manager::current() const {
    return target;
}

bool idpick::target_manager::allocated() const {
    return static_cast<bool>(target.storage);
}

void idpick::target_manager::release() {
    target.storage.reset();
}
