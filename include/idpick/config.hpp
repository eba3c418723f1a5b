#ifndef IDPICK_CONFIG_HPP_INCLUDED
#define IDPICK_CONFIG_HPP_INCLUDED

#include <chrono>
#include <string>
#include <spdlog/spdlog.h>

namespace idpick {
    struct picking_config {
        // Raising downscale or lowering min_height trades accuracy for a cheaper pass and readback
        int downscale = 5;
        int min_height = 64;
        bool dump = false;
        std::chrono::milliseconds gaze_delay {2000};
    };

    struct config {
        picking_config picking;
        spdlog::level::level_enum log_level = spdlog::level::info;
    };

    // Throws std::runtime_error when a value is out of range
    void validate(const picking_config& cfg);

    // Lines of `"key", value`. Unknown keys and malformed lines are logged and skipped;
    // numbers outside the int range throw std::runtime_error.
    config parse_config(const std::string& contents);
    config load_config(const std::string& filename);
}

#endif
