#include <idpick/gaze.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

idpick::gaze_interface::gaze_interface(std::function<void()> on_complete) : on_complete(std::move(on_complete)) {
}

void idpick::gaze_interface::complete() const {
    if (on_complete) {
        on_complete();
    }
}

idpick::gaze_dwell::gaze_dwell(const std::chrono::milliseconds delay) : delay(delay) {
}

void idpick::gaze_dwell::start(const gaze_interface& new_target) {
    spdlog::debug("Gaze dwell started ({} ms)", delay.count());
    target = &new_target;
    elapsed = std::chrono::duration<double>{0.0};
}

void idpick::gaze_dwell::stop() {
    if (target) {
        spdlog::debug("Gaze dwell stopped");
    }
    target = nullptr;
    elapsed = std::chrono::duration<double>{0.0};
}

void idpick::gaze_dwell::update(const std::chrono::duration<double> dt) {
    if (!target) {
        return;
    }
    elapsed += dt;
    if (elapsed >= delay) {
        // Disarm first: the callback may restart the dwell
        const gaze_interface* completed = std::exchange(target, nullptr);
        elapsed = std::chrono::duration<double>{0.0};
        spdlog::debug("Gaze dwell complete");
        completed->complete();
    }
}

bool idpick::gaze_dwell::active() const {
    return target != nullptr;
}

float idpick::gaze_dwell::progress() const {
    if (!target) {
        return 0.0f;
    }
    const std::chrono::duration<double> total = delay;
    return static_cast<float>(std::min(1.0, elapsed / total));
}
