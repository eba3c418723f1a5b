#include <idpick/config.hpp>
#include <idpick/csv_parser.hpp>
#include <idpick/util.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {
    int to_int(const std::string& key, const double value) {
        // Negated so NaN is rejected as well
        if (!(value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())) {
            throw std::runtime_error(fmt::format("\"{}\" value {} is out of range", key, value));
        }
        return static_cast<int>(std::lround(value));
    }

    bool apply(idpick::config& cfg, const std::string& key, const double value) {
        if (key == "downscale") {
            cfg.picking.downscale = to_int(key, value);
        } else if (key == "min height") {
            cfg.picking.min_height = to_int(key, value);
        } else if (key == "dump") {
            cfg.picking.dump = value != 0.0;
        } else if (key == "gaze delay") {
            cfg.picking.gaze_delay = std::chrono::milliseconds{to_int(key, value)};
        } else if (key == "log level") {
            cfg.log_level = static_cast<spdlog::level::level_enum>(std::clamp(to_int(key, value), 0, 6));
        } else {
            return false;
        }
        return true;
    }
}

void idpick::validate(const picking_config& cfg) {
    if (cfg.downscale <= 0) {
        throw std::runtime_error(fmt::format("downscale must be positive, got {}", cfg.downscale));
    }
    if (cfg.min_height < 1) {
        throw std::runtime_error(fmt::format("min height must be at least 1, got {}", cfg.min_height));
    }
    if (cfg.gaze_delay.count() < 0) {
        throw std::runtime_error(fmt::format("gaze delay must not be negative, got {} ms", cfg.gaze_delay.count()));
    }
}

idpick::config idpick::parse_config(const std::string& contents) {
    config cfg;
    std::istringstream lines {contents};
    std::string line;
    int line_number = 0;
    while (std::getline(lines, line)) {
        line_number++;
        csv_parser parser {line.cbegin(), line.cend()};
        if (parser.at_end() || parser.try_parse_literal("#")) {
            continue;
        }
        auto key = parser.try_parse_quoted();
        if (!key || !parser.next_field()) {
            spdlog::error("config line {}: expected a quoted key followed by a comma", line_number);
            continue;
        }
        auto value = parser.try_parse_double();
        if (!value || !parser.at_end()) {
            spdlog::error("config line {}: expected a number for \"{}\"", line_number, *key);
            continue;
        }
        if (!apply(cfg, *key, *value)) {
            spdlog::warn("config line {}: unknown key \"{}\" ignored", line_number, *key);
        }
    }
    validate(cfg.picking);
    return cfg;
}

idpick::config idpick::load_config(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        throw std::runtime_error(fmt::format("Config file \"{}\" does not exist", filename));
    }
    auto cfg = parse_config(file_contents(filename));
    spdlog::info("Loaded config {}: downscale {}, min height {}, dump {}, gaze delay {} ms",
                 filename, cfg.picking.downscale, cfg.picking.min_height, cfg.picking.dump, cfg.picking.gaze_delay.count());
    return cfg;
}
