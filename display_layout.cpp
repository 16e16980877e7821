#include "display_layout.h"

#include <algorithm>

#include <fmt/core.h>

#include "logging_policy.h"
#include "pixel_format.h"

namespace planeflip {

namespace {

auto const& layout_logger() {
    static const auto logger = make_logger("layout");
    return logger;
}

std::string connector_name(uint32_t type, uint32_t type_id) {
    std::string name;
    switch (type) {
        case DRM_MODE_CONNECTOR_HDMIA: name = "HDMI"; break;
#define T(x) case DRM_MODE_CONNECTOR_##x: name = #x; break
        T(Unknown);
        T(VGA);
        T(DVII);
        T(DVID);
        T(DVIA);
        T(Composite);
        T(SVIDEO);
        T(LVDS);
        T(Component);
        T(9PinDIN);
        T(DisplayPort);
        T(HDMIB);
        T(TV);
        T(eDP);
        T(VIRTUAL);
        T(DSI);
        T(DPI);
        T(WRITEBACK);
#undef T
        default: name = fmt::format("[#{}]", type);
    }
    return fmt::format("{}-{}", name, type_id);
}

drm_mode_get_encoder get_encoder(DisplayDevice* device, uint32_t id) {
    drm_mode_get_encoder edat = {};
    edat.encoder_id = id;
    device->fd()->ioc<DRM_IOCTL_MODE_GETENCODER>(&edat).ex("DRM encoder");
    return edat;
}

}  // anonymous namespace

std::vector<uint32_t> scan_crtcs(DisplayDevice* device) {
    drm_mode_card_res res = {};
    std::vector<uint32_t> crtc_ids;
    do {
        res.count_fbs = res.count_encoders = res.count_connectors = 0;
        device->fd()->ioc<DRM_IOCTL_MODE_GETRESOURCES>(&res).ex("DRM resources");
    } while (size_vec(&res.crtc_id_ptr, &res.count_crtcs, &crtc_ids));
    return crtc_ids;
}

std::vector<ConnectorInfo> scan_connectors(DisplayDevice* device) {
    auto const& fd = device->fd();
    drm_mode_card_res res = {};
    std::vector<uint32_t> conn_ids;
    do {
        res.count_fbs = res.count_encoders = res.count_crtcs = 0;
        fd->ioc<DRM_IOCTL_MODE_GETRESOURCES>(&res).ex("DRM resources");
    } while (size_vec(&res.connector_id_ptr, &res.count_connectors, &conn_ids));

    std::vector<ConnectorInfo> out;
    for (auto const conn_id : conn_ids) {
        ConnectorInfo info = {};
        drm_mode_get_connector cdat = {};
        cdat.connector_id = conn_id;
        do {
            cdat.count_props = 0;
            fd->ioc<DRM_IOCTL_MODE_GETCONNECTOR>(&cdat).ex("DRM connector");
        } while (
            size_vec(&cdat.modes_ptr, &cdat.count_modes, &info.modes) +
            size_vec(&cdat.encoders_ptr, &cdat.count_encoders, &info.encoder_ids)
        );

        info.id = conn_id;
        info.name = connector_name(cdat.connector_type, cdat.connector_type_id);
        info.connected = (cdat.connection == 1);
        info.encoder_id = cdat.encoder_id;
        std::erase_if(info.modes, [](drm_mode_modeinfo const& m) {
            return m.flags & DRM_MODE_FLAG_3D_MASK;
        });
        out.push_back(std::move(info));
    }
    return out;
}

std::vector<PlaneInfo> scan_planes(DisplayDevice* device) {
    auto const& fd = device->fd();
    drm_mode_get_plane_res pres = {};
    std::vector<uint32_t> plane_ids;
    do {
        fd->ioc<DRM_IOCTL_MODE_GETPLANERESOURCES>(&pres).ex("DRM planes");
    } while (size_vec(&pres.plane_id_ptr, &pres.count_planes, &plane_ids));

    std::vector<PlaneInfo> out;
    for (auto const plane_id : plane_ids) {
        PlaneInfo info = {};
        drm_mode_get_plane pdat = {};
        pdat.plane_id = plane_id;
        do {
            fd->ioc<DRM_IOCTL_MODE_GETPLANE>(&pdat).ex("DRM plane");
        } while (
            size_vec(&pdat.format_type_ptr, &pdat.count_format_types, &info.formats)
        );

        info.id = plane_id;
        info.crtc_id = pdat.crtc_id;
        info.possible_crtcs = pdat.possible_crtcs;
        auto const props = device->object_properties(plane_id);
        auto const type_iter = props.find("type");
        if (type_iter != props.end()) info.type = type_iter->second.value;
        out.push_back(std::move(info));
    }
    return out;
}

DisplayLayout find_display_layout(
    DisplayDevice* device, XY<int> size, uint32_t overlay_fourcc
) {
    auto const& logger = layout_logger();
    auto const crtcs = scan_crtcs(device);
    auto const planes = scan_planes(device);

    for (auto const& conn : scan_connectors(device)) {
        if (!conn.connected) {
            TRACE(logger, "{} not connected", conn.name);
            continue;
        }

        auto mode = std::find_if(
            conn.modes.begin(), conn.modes.end(),
            [&](drm_mode_modeinfo const& m) {
                return size
                    ? (m.hdisplay == size.x && m.vdisplay == size.y)
                    : (m.type & DRM_MODE_TYPE_PREFERRED);
            }
        );
        if (!size && mode == conn.modes.end()) mode = conn.modes.begin();
        if (mode == conn.modes.end()) {
            DEBUG(logger, "{} has no {} mode", conn.name, debug(size));
            continue;
        }

        // Prefer the CRTC already driving this connector.
        uint32_t crtc_id = 0;
        if (conn.encoder_id) crtc_id = get_encoder(device, conn.encoder_id).crtc_id;
        for (size_t e = 0; !crtc_id && e < conn.encoder_ids.size(); ++e) {
            auto const enc = get_encoder(device, conn.encoder_ids[e]);
            for (size_t i = 0; i < crtcs.size(); ++i) {
                if (enc.possible_crtcs & (1 << i)) {
                    crtc_id = crtcs[i];
                    break;
                }
            }
        }

        auto const crtc_iter = std::find(crtcs.begin(), crtcs.end(), crtc_id);
        if (!crtc_id || crtc_iter == crtcs.end()) {
            DEBUG(logger, "{} has no usable CRTC", conn.name);
            continue;
        }

        uint32_t const crtc_bit = 1 << (crtc_iter - crtcs.begin());
        DisplayLayout out = {};
        out.connector_id = conn.id;
        out.connector_name = conn.name;
        out.crtc_id = crtc_id;
        out.mode = *mode;
        for (auto const& plane : planes) {
            if (!(plane.possible_crtcs & crtc_bit)) continue;
            if (plane.type == kPrimaryPlane && !out.primary_plane_id)
                out.primary_plane_id = plane.id;

            auto const& formats = plane.formats;
            if (
                overlay_fourcc && plane.type == kOverlayPlane &&
                !out.overlay_plane_id &&
                std::find(formats.begin(), formats.end(), overlay_fourcc) !=
                    formats.end()
            ) {
                out.overlay_plane_id = plane.id;
            }
        }

        CHECK_RUNTIME(
            out.primary_plane_id,
            "No primary plane for {} (crtc{})", conn.name, crtc_id
        );
        CHECK_RUNTIME(
            !overlay_fourcc || out.overlay_plane_id,
            "No {} overlay plane for {} (crtc{})",
            debug_fourcc(overlay_fourcc), conn.name, crtc_id
        );

        logger->info("Display layout: {}", debug(out));
        return out;
    }

    CHECK_RUNTIME(
        false, "No connected display for {} mode on {}",
        size ? debug(size) : "preferred", device->dev_file()
    );
    return {};
}

void set_crtc_mode(
    DisplayDevice* device, DisplayLayout const& layout, uint32_t fb_id
) {
    CHECK_ARG(fb_id, "Mode set for {} without framebuffer", layout.connector_name);
    uint32_t connector_id = layout.connector_id;
    drm_mode_crtc cdat = {};
    cdat.set_connectors_ptr = (uint64_t) &connector_id;
    cdat.count_connectors = 1;
    cdat.crtc_id = layout.crtc_id;
    cdat.fb_id = fb_id;
    cdat.mode_valid = 1;
    cdat.mode = layout.mode;

    DEBUG(layout_logger(), "Set crtc{} fb{} {}", layout.crtc_id, fb_id, debug(layout.mode));
    device->fd()->ioc<DRM_IOCTL_MODE_SETCRTC>(&cdat).ex(
        fmt::format("Set {} mode {}", layout.connector_name, debug(layout.mode))
    );
}

std::string debug(drm_mode_modeinfo const& mode) {
    double const hz = (mode.htotal && mode.vtotal)
        ? mode.clock * 1000.0 / (mode.htotal * mode.vtotal) : mode.vrefresh;
    return fmt::format(
        "{}x{}{}@{:.4g}Hz", mode.hdisplay, mode.vdisplay,
        (mode.flags & DRM_MODE_FLAG_INTERLACE) ? "i" : "", hz
    );
}

std::string debug(DisplayLayout const& l) {
    std::string out = fmt::format(
        "{} crtc{} {} primary=pl{}",
        l.connector_name, l.crtc_id, debug(l.mode), l.primary_plane_id
    );
    if (l.overlay_plane_id) out += fmt::format(" overlay=pl{}", l.overlay_plane_id);
    return out;
}

std::string debug(PlaneInfo const& p) {
    std::string out = fmt::format("pl{}", p.id);
    switch (p.type) {
        case kOverlayPlane: out += " overlay"; break;
        case kPrimaryPlane: out += " primary"; break;
        case kCursorPlane: out += " cursor"; break;
        default: out += fmt::format(" type{}", p.type);
    }
    if (p.crtc_id) out += fmt::format(" [crtc{}]", p.crtc_id);
    out += fmt::format(" crtcs=0x{:x}", p.possible_crtcs);
    for (size_t i = 0; i < p.formats.size(); ++i)
        out += (i ? "," : " ") + debug_fourcc(p.formats[i]);
    return out;
}

}  // namespace planeflip
