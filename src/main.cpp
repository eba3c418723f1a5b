#include <idpick/app.hpp>
#include <idpick/config.hpp>
#include <spdlog/spdlog.h>
#include <exception>

int main(const int argc, const char** argv) {
    try {
        idpick::config cfg;
        if (argc > 1) {
            cfg = idpick::load_config(argv[1]);
        }
        spdlog::set_level(cfg.log_level);
        idpick::app frontend { cfg };
        frontend.run();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}
