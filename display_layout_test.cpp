#include "display_layout.h"

#include <drm_fourcc.h>

#include <doctest/doctest.h>

#include "fake_drm.h"

namespace planeflip {

TEST_CASE("Display layout discovery") {
    FakeRig rig;
    using namespace basic_display;

    auto const preferred = find_display_layout(rig.device.get(), {});
    CHECK(preferred.connector_id == connector);
    CHECK(preferred.connector_name == "HDMI-1");
    CHECK(preferred.crtc_id == crtc);
    CHECK(preferred.size() == XY<int>{1920, 1080});
    CHECK(preferred.primary_plane_id == primary);
    CHECK(preferred.overlay_plane_id == 0);
    CHECK(debug(preferred.mode) == "1920x1080@60Hz");
    CHECK(debug(preferred) == "HDMI-1 crtc41 1920x1080@60Hz primary=pl50");

    auto const small = find_display_layout(
        rig.device.get(), {1280, 720}, DRM_FORMAT_NV12
    );
    CHECK(small.size() == XY<int>{1280, 720});
    CHECK(small.overlay_plane_id == overlay);

    CHECK_THROWS_AS(
        find_display_layout(rig.device.get(), {800, 600}), std::runtime_error
    );
    CHECK_THROWS_AS(
        find_display_layout(rig.device.get(), {}, DRM_FORMAT_YUYV),
        std::runtime_error
    );
}

TEST_CASE("Display layout without a current encoder") {
    auto const drm = std::make_shared<FakeDrm>();
    auto const sys = std::make_shared<FakeSystem>();
    sys->add_device("/dev/dri/card0", drm);

    drm->add_crtc(60);
    drm->add_crtc(61);
    drm->add_encoder(70, 0, 0x2);

    FakeConnector off = {};
    off.id = 80;
    off.type = DRM_MODE_CONNECTOR_DSI;
    off.connected = false;
    off.encoder_ids = {70};
    off.modes = {fake_mode(800, 480, 60, true)};
    drm->add_connector(off);

    FakeConnector dp = {};
    dp.id = 81;
    dp.type = DRM_MODE_CONNECTOR_DisplayPort;
    dp.type_id = 2;
    dp.encoder_ids = {70};
    dp.modes = {fake_mode(1024, 768, 75, false), fake_mode(640, 480, 60, false)};
    drm->add_connector(dp);

    drm->add_plane(90, 1, 0x1, {DRM_FORMAT_XRGB8888});  // Wrong CRTC
    drm->add_plane(91, 1, 0x2, {DRM_FORMAT_XRGB8888});

    auto const device = open_display_device(sys, "/dev/dri/card0");
    auto const layout = find_display_layout(device.get(), {});
    CHECK(layout.connector_id == 81);
    CHECK(layout.connector_name == "DisplayPort-2");
    CHECK(layout.crtc_id == 61);
    CHECK(layout.size() == XY<int>{1024, 768});  // First mode, none preferred
    CHECK(layout.primary_plane_id == 91);

    auto const connectors = scan_connectors(device.get());
    REQUIRE(connectors.size() == 2);
    CHECK(connectors[0].name == "DSI-1");
    CHECK_FALSE(connectors[0].connected);
    CHECK(connectors[1].modes.size() == 2);
    CHECK(scan_crtcs(device.get()) == std::vector<uint32_t>{60, 61});
}

TEST_CASE("Plane scan") {
    FakeRig rig;
    auto const planes = scan_planes(rig.device.get());
    REQUIRE(planes.size() == 3);
    CHECK(planes[0].id == basic_display::primary);
    CHECK(planes[0].type == kPrimaryPlane);
    CHECK(planes[1].type == kOverlayPlane);
    CHECK(planes[1].formats.size() == 3);
    CHECK(planes[1].formats[0] == DRM_FORMAT_NV12);
    CHECK(planes[2].type == kCursorPlane);
    CHECK(planes[2].possible_crtcs == 0x1);
    CHECK(debug(planes[2]) == "pl52 cursor crtcs=0x1 AR24");
}

TEST_CASE("Legacy mode set") {
    FakeRig rig;
    auto const layout = find_display_layout(rig.device.get(), {1280, 720});
    auto const buf = rig.buffers->allocate_buffer({1280, 720}, DRM_FORMAT_XRGB8888);
    auto const fb_id = rig.buffers->create_framebuffer(buf.get());
    REQUIRE(fb_id);

    set_crtc_mode(rig.device.get(), layout, fb_id);
    auto const sets = rig.drm->mode_sets();
    REQUIRE(sets.size() == 1);
    CHECK(sets[0].crtc_id == basic_display::crtc);
    CHECK(sets[0].fb_id == fb_id);
    CHECK(sets[0].connector_ids == std::vector<uint32_t>{basic_display::connector});
    CHECK(sets[0].mode.hdisplay == 1280);

    CHECK_THROWS_AS(
        set_crtc_mode(rig.device.get(), layout, 0), std::invalid_argument
    );
    CHECK_THROWS_AS(
        set_crtc_mode(rig.device.get(), layout, 4321), std::system_error
    );
}

}  // namespace planeflip
