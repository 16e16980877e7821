// Atomic modesetting property ids of a display plane.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "display_device.h"

namespace planeflip {

// Property ids for one plane, resolved once by resolve_plane_properties().
// Zero means the plane does not expose that property.
struct PlaneProperties {
    uint32_t plane_id = 0;
    uint64_t type = 0;  // DRM_PLANE_TYPE_* ("type" property value)

    // Required for atomic use
    uint32_t FB_ID = 0;
    uint32_t CRTC_ID = 0;
    uint32_t CRTC_X = 0, CRTC_Y = 0, CRTC_W = 0, CRTC_H = 0;
    uint32_t SRC_X = 0, SRC_Y = 0, SRC_W = 0, SRC_H = 0;

    // Optional composition controls
    uint32_t pixel_blend_mode = 0;
    uint32_t alpha = 0;
    uint32_t zpos = 0;

    // True if every required property id was found.
    bool is_valid() const { return missing().empty(); }

    // Names of required properties that were not found.
    std::vector<std::string_view> missing() const;
};

// Queries the kernel for a plane's properties. Read-only.
PlaneProperties resolve_plane_properties(DisplayDevice*, uint32_t plane_id);

std::string debug(PlaneProperties const&);

}  // namespace planeflip
