#include "plane_properties.h"

#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "logging_policy.h"

namespace planeflip {

namespace {

auto const& plane_logger() {
    static const auto logger = make_logger("plane");
    return logger;
}

// Property name to struct member, for both lookup and validation.
using PropField = std::pair<std::string_view, uint32_t PlaneProperties::*>;

PropField const required_props[] = {
    {"FB_ID", &PlaneProperties::FB_ID},
    {"CRTC_ID", &PlaneProperties::CRTC_ID},
    {"CRTC_X", &PlaneProperties::CRTC_X},
    {"CRTC_Y", &PlaneProperties::CRTC_Y},
    {"CRTC_W", &PlaneProperties::CRTC_W},
    {"CRTC_H", &PlaneProperties::CRTC_H},
    {"SRC_X", &PlaneProperties::SRC_X},
    {"SRC_Y", &PlaneProperties::SRC_Y},
    {"SRC_W", &PlaneProperties::SRC_W},
    {"SRC_H", &PlaneProperties::SRC_H},
};

PropField const optional_props[] = {
    {"pixel blend mode", &PlaneProperties::pixel_blend_mode},
    {"alpha", &PlaneProperties::alpha},
    {"zpos", &PlaneProperties::zpos},
};

}  // anonymous namespace

std::vector<std::string_view> PlaneProperties::missing() const {
    std::vector<std::string_view> out;
    for (auto const& [name, field] : required_props) {
        if (!(this->*field)) out.push_back(name);
    }
    return out;
}

PlaneProperties resolve_plane_properties(
    DisplayDevice* device, uint32_t plane_id
) {
    CHECK_ARG(plane_id, "No plane id given");
    auto const& logger = plane_logger();
    auto const props = device->object_properties(plane_id);

    PlaneProperties out = {};
    out.plane_id = plane_id;
    auto const lookup = [&](auto const& fields) {
        for (auto const& [name, field] : fields) {
            auto const iter = props.find(std::string(name));
            if (iter != props.end()) out.*field = iter->second.prop_id;
        }
    };
    lookup(required_props);
    lookup(optional_props);

    auto const type_iter = props.find("type");
    if (type_iter != props.end()) out.type = type_iter->second.value;

    if (out.is_valid()) {
        DEBUG(logger, "pl{} properties: {}", plane_id, debug(out));
    } else {
        logger->warn(
            "pl{} lacks atomic properties: {}",
            plane_id, fmt::join(out.missing(), ", ")
        );
    }
    return out;
}

std::string debug(PlaneProperties const& p) {
    std::string out = fmt::format("pl{}", p.plane_id);
    switch (p.type) {
        case 0: out += " overlay"; break;
        case 1: out += " primary"; break;
        case 2: out += " cursor"; break;
        default: out += fmt::format(" type{}", p.type);
    }

    out += p.is_valid() ? " atomic" : " legacy-only";
    if (p.pixel_blend_mode) out += " +blend";
    if (p.alpha) out += " +alpha";
    if (p.zpos) out += " +zpos";
    return out;
}

}  // namespace planeflip
