#include <idpick/hover_tracker.hpp>
#include <spdlog/spdlog.h>

idpick::hover_tracker::hover_tracker(const gaze_interface& gaze_target) : gaze_target(gaze_target) {
}

void idpick::hover_tracker::check(pickable_object* object, gaze_control* gaze) {
    if (!object || !object->interactive) {
        if (hovered) {
            spdlog::debug("Hover out of object {}", hovered->id);
            pickable_object* previous = hovered;
            hovered = nullptr;
            if (previous->out) {
                previous->out();
            }
        }
        if (gaze) {
            gaze->stop();
        }
        return;
    }

    // Lookups may hand out a new instance for the same id, so compare ids
    const bool same_object = hovered && hovered->id == object->id;
    if (!same_object) {
        if (hovered) {
            spdlog::debug("Hover moved from object {} to {}", hovered->id, object->id);
            if (hovered->out) {
                hovered->out();
            }
        } else {
            spdlog::debug("Hover over object {}", object->id);
        }
        if (gaze) {
            gaze->start(gaze_target);
        }
    }
    hovered = object;

    if (hovered->over) {
        hovered->over();
    }
}

void idpick::hover_tracker::click() const {
    if (!hovered || !hovered->click) {
        return;
    }
    hovered->click();
}

idpick::pickable_object* idpick::hover_tracker::current() const {
    return hovered;
}

void idpick::hover_tracker::reset() {
    hovered = nullptr;
}
