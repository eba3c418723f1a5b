#include <idpick/input_router.hpp>
#include <spdlog/spdlog.h>
#include <utility>

idpick::input_router::input_router(viewport_system& viewports, handler on_click, handler on_move) :
    viewports(viewports),
    on_click(std::move(on_click)),
    on_move(std::move(on_move))
{
}

void idpick::input_router::start() {
    add_handlers();
    if (!vr_connection.connected()) {
        vr_connection = viewports.on_vr_change.connect([this]() { add_handlers(); });
    }
}

void idpick::input_router::add_handlers() {
    remove_handlers();
    if (viewports.vr()) {
        spdlog::debug("VR mode: pointer handlers detached, polling screen centre");
        return;
    }
    if (!click_connection.connected()) {
        click_connection = viewports.on_pointer_click.connect([this](const pointer_event& event) {
            on_click(viewports.active_viewport().normalized(event.screen));
        });
    }
    if (!move_connection.connected()) {
        move_connection = viewports.on_pointer_move.connect([this](const pointer_event& event) {
            on_move(viewports.active_viewport().normalized(event.screen));
        });
    }
}

void idpick::input_router::remove_handlers() {
    click_connection.disconnect();
    move_connection.disconnect();
}

void idpick::input_router::stop() {
    vr_connection.disconnect();
    remove_handlers();
}

bool idpick::input_router::pointer_attached() const {
    return click_connection.connected() && move_connection.connected();
}
