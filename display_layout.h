// Discovery of a connector, CRTC, mode and planes to present on.

#pragma once

#include <drm/drm.h>

#include <cstdint>
#include <string>
#include <vector>

#include "display_device.h"
#include "xy.h"

namespace planeflip {

// Values of the plane "type" property.
enum PlaneType : uint64_t { kOverlayPlane = 0, kPrimaryPlane = 1, kCursorPlane = 2 };

// A connector (video output) and its modes. Returned by scan_connectors().
struct ConnectorInfo {
    uint32_t id = 0;
    std::string name;             // Like "HDMI-1"
    bool connected = false;       // True if a monitor is detected
    uint32_t encoder_id = 0;      // Current encoder, if any
    std::vector<uint32_t> encoder_ids;
    std::vector<drm_mode_modeinfo> modes;  // First is usually preferred
};

// A display plane. Returned by scan_planes().
struct PlaneInfo {
    uint32_t id = 0;
    uint64_t type = kOverlayPlane;
    uint32_t crtc_id = 0;         // Currently attached CRTC, if any
    uint32_t possible_crtcs = 0;  // Bitmask of CRTC indexes
    std::vector<uint32_t> formats;
};

// Where to present: chosen by find_display_layout().
struct DisplayLayout {
    uint32_t connector_id = 0;
    std::string connector_name;
    uint32_t crtc_id = 0;
    drm_mode_modeinfo mode = {};
    uint32_t primary_plane_id = 0;
    uint32_t overlay_plane_id = 0;  // 0 if no overlay was requested

    XY<int> size() const { return {mode.hdisplay, mode.vdisplay}; }
};

std::vector<uint32_t> scan_crtcs(DisplayDevice*);
std::vector<ConnectorInfo> scan_connectors(DisplayDevice*);
std::vector<PlaneInfo> scan_planes(DisplayDevice*);

// Picks the first connected connector with a mode of the given size
// (or its preferred mode for 0x0), a CRTC for it, its primary plane, and
// (if overlay_fourcc is nonzero) an overlay plane supporting that format.
// Throws std::runtime_error if nothing suitable exists.
DisplayLayout find_display_layout(
    DisplayDevice*, XY<int> size, uint32_t overlay_fourcc = 0
);

// Sets the mode with a legacy (non-atomic) SETCRTC call, scanning out fb_id
// on the primary plane. Throws std::system_error on failure.
void set_crtc_mode(DisplayDevice*, DisplayLayout const&, uint32_t fb_id);

std::string debug(drm_mode_modeinfo const&);
std::string debug(DisplayLayout const&);
std::string debug(PlaneInfo const&);

}  // namespace planeflip
