#include "display_device.h"

#include <vector>

#include <doctest/doctest.h>

#include "fake_drm.h"

namespace planeflip {

TEST_CASE("Display device open") {
    FakeRig rig;
    CHECK(rig.device->dev_file() == "/dev/dri/card0");
    CHECK(rig.device->caps().atomic);
    CHECK(rig.device->caps().async_page_flip);
    CHECK(debug(rig.device->caps()) == "atomic async-flip");

    auto const props = rig.device->object_properties(basic_display::primary);
    REQUIRE(props.count("type"));
    CHECK(props.at("type").value == 1);
    CHECK(props.at("FB_ID").prop_id == rig.drm->prop_id("FB_ID"));
    CHECK_FALSE(props.count("zpos"));

    auto const drm = std::make_shared<FakeDrm>();
    drm->set_atomic(false);
    drm->set_async_cap(false);
    rig.sys->add_device("/dev/dri/card1", drm);
    auto const legacy = open_display_device(rig.sys, "/dev/dri/card1");
    CHECK_FALSE(legacy->caps().atomic);
    CHECK_FALSE(legacy->caps().async_page_flip);

    CHECK_THROWS_AS(
        open_display_device(rig.sys, "/dev/dri/card7"), std::system_error
    );
}

TEST_CASE("Display device listing") {
    FakeRig rig;
    auto const list = list_display_devices(rig.sys);
    REQUIRE(list.size() == 1);
    CHECK(list[0].dev_file == "/dev/dri/card0");
    CHECK(list[0].driver == "fake");
    CHECK(list[0].driver_desc == "Fake DRM");
    CHECK(list[0].driver_bus_id == "fake.0");
    CHECK(list[0].system_path.empty());
    CHECK(debug(list[0]) == "/dev/dri/card0 (fake):  (fake.0)");
}

TEST_CASE("Flip event routing") {
    FakeRig rig;
    auto const& device = rig.device;
    std::vector<FlipEvent> a_events, b_events;
    auto const a = device->add_flip_handler(
        [&](FlipEvent const& ev) { a_events.push_back(ev); }
    );
    auto const b = device->add_flip_handler(
        [&](FlipEvent const& ev) { b_events.push_back(ev); }
    );
    CHECK(a != 0);
    CHECK(b != 0);
    CHECK(a != b);

    CHECK(device->dispatch_events() == 0);

    rig.drm->queue_flip_event(a, 41);
    rig.drm->queue_flip_event(999);  // Nobody's
    rig.drm->queue_flip_event(b, 41);
    rig.drm->queue_flip_event(a, 41);
    CHECK(device->dispatch_events() == 3);
    CHECK(rig.drm->queued_events() == 0);

    REQUIRE(a_events.size() == 2);
    REQUIRE(b_events.size() == 1);
    CHECK(a_events[0].user_data == a);
    CHECK(a_events[0].crtc_id == 41);
    CHECK(a_events[0].time > 0);
    CHECK(b_events[0].sequence > a_events[0].sequence);
    CHECK(a_events[1].sequence > b_events[0].sequence);

    device->remove_flip_handler(a);
    rig.drm->queue_flip_event(a);
    CHECK(device->dispatch_events() == 0);
    CHECK(a_events.size() == 2);

    CHECK_THROWS_AS(device->add_flip_handler({}), std::invalid_argument);
}

TEST_CASE("Flip events mixed with other event types") {
    FakeRig rig;
    auto const& device = rig.device;
    int flips = 0;
    auto const cookie = device->add_flip_handler([&](FlipEvent const&) { ++flips; });

    // Other event types may be shorter or longer than a vblank event.
    rig.drm->queue_raw_event(DRM_EVENT_CRTC_SEQUENCE, 16);
    rig.drm->queue_flip_event(cookie);
    rig.drm->queue_raw_event(0x80000000, 64);
    rig.drm->queue_flip_event(cookie);
    rig.drm->queue_raw_event(DRM_EVENT_VBLANK, sizeof(drm_event_vblank));
    CHECK(device->dispatch_events() == 2);
    CHECK(flips == 2);
    CHECK(rig.drm->queued_events() == 0);
    CHECK(device->dispatch_events() == 0);

    SUBCASE("many events in one read") {
        for (int i = 0; i < 300; ++i) rig.drm->queue_flip_event(cookie);
        CHECK(device->dispatch_events() == 300);
        CHECK(flips == 302);
    }

    device->remove_flip_handler(cookie);
}

}  // namespace planeflip
