#include <idpick/viewport.hpp>
#include <spdlog/spdlog.h>

float idpick::rectangle::width() const {
    return size.x;
}

float idpick::rectangle::height() const {
    return size.y;
}

float idpick::rectangle::ratio() const {
    return size.x / size.y;
}

glm::vec2 idpick::viewport::relative(const glm::vec2 screen) const {
    return screen - rect.origin;
}

glm::vec2 idpick::viewport::normalized(const glm::vec2 screen) const {
    return relative(screen) / rect.size;
}

idpick::viewport& idpick::viewport_system::active_viewport() {
    return active;
}

bool idpick::viewport_system::vr() const {
    return vr_enabled;
}

void idpick::viewport_system::set_vr(const bool enabled) {
    if (vr_enabled == enabled) {
        return;
    }
    vr_enabled = enabled;
    spdlog::info("VR mode {}", enabled ? "on" : "off");
    on_vr_change();
}
