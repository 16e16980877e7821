#include "presenter_config.h"

#include <exception>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "logging_policy.h"
#include "pixel_format.h"

namespace planeflip {

namespace {

auto const& config_logger() {
    static const auto logger = make_logger("config");
    return logger;
}

}  // anonymous namespace

template <typename T>
void from_json(nlohmann::json const& j, XY<T>& xy) {
    CHECK_ARG(j.is_array() && j.size() == 2, "Bad size: {}", j.dump());
    j.at(0).get_to(xy.x);
    j.at(1).get_to(xy.y);
}

void from_json(nlohmann::json const& j, PlaneBlend& blend) {
    blend = {};
    blend.mode = parse_blend_mode(j.value("mode", "premultiplied"));
    blend.alpha = j.value("alpha", 255);
    CHECK_ARG(
        blend.alpha >= 0 && blend.alpha <= 255, "Bad alpha: {}", j.dump()
    );
    if (j.contains("zpos") && !j.at("zpos").is_null())
        blend.zpos = j.at("zpos").get<uint64_t>();
}

void from_json(nlohmann::json const& j, PresenterPlaneConfig& plane) {
    plane = {};
    plane.fourcc = find_pixel_format(j.at("format").get<std::string>()).fourcc;
    plane.flip = parse_flip_preference(j.value("flip", "auto"));
    if (j.contains("blend") && !j.at("blend").is_null())
        plane.blend = j.at("blend").get<PlaneBlend>();
}

void from_json(nlohmann::json const& j, PresenterConfig& config) {
    config = {};
    config.device = j.value("device", "");
    if (j.contains("mode")) j.at("mode").get_to(config.mode);
    CHECK_ARG(
        config.mode.x >= 0 && config.mode.y >= 0 && !config.mode.x == !config.mode.y,
        "Bad mode: {}", j.at("mode").dump()
    );

    config.buffers = j.value("buffers", 3);
    CHECK_ARG(config.buffers >= 2, "Need 2+ buffers, not {}", config.buffers);

    auto& planes = config.planes;
    planes.poll_timeout = j.value("poll_timeout", 0.1);
    planes.stop_grace = j.value("stop_grace", 2.0);
    CHECK_ARG(planes.poll_timeout > 0, "Bad poll_timeout: {}", planes.poll_timeout);
    CHECK_ARG(planes.stop_grace > 0, "Bad stop_grace: {}", planes.stop_grace);

    if (j.contains("primary")) {
        j.at("primary").get_to(planes.primary);
    } else {
        planes.primary.fourcc = find_pixel_format("XRGB8888").fourcc;
    }

    if (j.contains("overlay") && !j.at("overlay").is_null())
        planes.overlay = j.at("overlay").get<PresenterPlaneConfig>();
}

PresenterConfig parse_presenter_config(std::string_view text) {
    try {
        auto const config = nlohmann::json::parse(text).get<PresenterConfig>();
        DEBUG(
            config_logger(), "Config: dev=\"{}\" mode={} buffers={}{}",
            config.device, debug(config.mode), config.buffers,
            config.planes.overlay ? " +overlay" : ""
        );
        return config;
    } catch (nlohmann::json::exception const& je) {
        std::throw_with_nested(std::invalid_argument(
            fmt::format("Bad config ({}): {}", je.what(), text)
        ));
    }
}

FlipPreference parse_flip_preference(std::string_view text) {
    if (text == "auto") return FlipPreference::kAuto;
    if (text == "async") return FlipPreference::kAsync;
    if (text == "vblank") return FlipPreference::kVblank;
    if (text == "legacy") return FlipPreference::kLegacy;
    throw std::invalid_argument(fmt::format("Unknown flip mode \"{}\"", text));
}

BlendMode parse_blend_mode(std::string_view text) {
    if (text == "none") return BlendMode::kNone;
    if (text == "premultiplied") return BlendMode::kPremultiplied;
    if (text == "coverage") return BlendMode::kCoverage;
    throw std::invalid_argument(fmt::format("Unknown blend mode \"{}\"", text));
}

}  // namespace planeflip
