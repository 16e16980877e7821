#include "flip_engine.h"

#include <drm_fourcc.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <doctest/doctest.h>

#include "fake_drm.h"

namespace planeflip {

namespace {

using BufferPtr = std::shared_ptr<SharedBuffer>;

uint32_t constexpr event_flags =
    DRM_MODE_ATOMIC_NONBLOCK | DRM_MODE_PAGE_FLIP_EVENT;

struct EngineRig : FakeRig {
    PlaneProperties props = resolve_plane_properties(
        device.get(), basic_display::primary
    );

    std::unique_ptr<FlipEngine> start(
        FlipMode mode = FlipMode::kAtomicVblank, bool event_thread = false
    ) {
        FlipEngineConfig config;
        config.name = "test";
        config.crtc_id = basic_display::crtc;
        config.screen_size = {1920, 1080};
        config.mode = mode;
        config.event_thread = event_thread;
        config.poll_timeout = 0.01;
        return start_flip_engine(device, buffers, props, config, sys);
    }

    BufferPtr buffer() {
        return buffers->allocate_buffer({64, 32}, DRM_FORMAT_XRGB8888);
    }

    void flip() {
        REQUIRE(drm->complete_flip());
        CHECK(device->dispatch_events() == 1);
    }
};

}  // anonymous namespace

TEST_CASE("Flip engine: submit while idle") {
    EngineRig rig;
    auto engine = rig.start();
    CHECK(engine->state() == FlipState::kIdle);
    CHECK(engine->plane_id() == basic_display::primary);
    CHECK(engine->mode() == FlipMode::kAtomicVblank);

    auto const a = rig.buffer();
    CHECK(engine->submit(a));
    CHECK(engine->state() == FlipState::kCommitInFlight);

    auto const commits = rig.drm->commits();
    REQUIRE(commits.size() == 1);
    auto const& c = commits[0];
    auto const plane = basic_display::primary;
    CHECK(c.flags == event_flags);
    CHECK(c.value(plane, "FB_ID") == a->fb_id());
    CHECK(c.value(plane, "CRTC_ID") == basic_display::crtc);
    CHECK(c.value(plane, "CRTC_X") == 0);
    CHECK(c.value(plane, "CRTC_W") == 1920);
    CHECK(c.value(plane, "CRTC_H") == 1080);
    CHECK(c.value(plane, "SRC_W") == 64 << 16);
    CHECK(c.value(plane, "SRC_H") == 32 << 16);
    CHECK_FALSE(c.has(plane, "zpos"));

    rig.flip();
    CHECK(engine->state() == FlipState::kDisplayed);
    CHECK(engine->get_recycled_buffers().empty());
    CHECK(engine->stats().commits == 1);
    CHECK(engine->stats().flips == 1);
    CHECK(engine->stats().last_flip > 0);
}

TEST_CASE("Flip engine: submit during a pending flip") {
    EngineRig rig;
    auto engine = rig.start();
    auto const a = rig.buffer(), b = rig.buffer();
    CHECK(engine->submit(a));
    CHECK(engine->submit(b));
    CHECK(rig.drm->commits().size() == 1);
    CHECK(engine->get_recycled_buffers().empty());

    rig.flip();
    auto const commits = rig.drm->commits();
    REQUIRE(commits.size() == 2);
    CHECK(commits[1].value(basic_display::primary, "FB_ID") == b->fb_id());
    CHECK(engine->state() == FlipState::kCommitInFlight);
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{a});

    rig.flip();
    CHECK(engine->state() == FlipState::kDisplayed);
    CHECK(engine->get_recycled_buffers().empty());
    CHECK(rig.drm->max_pending_flips() == 1);
}

TEST_CASE("Flip engine: newest frame wins") {
    EngineRig rig;
    auto engine = rig.start();
    auto const a = rig.buffer(), b = rig.buffer(), c = rig.buffer();
    CHECK(engine->submit(a));
    CHECK(engine->submit(b));
    CHECK(engine->submit(c));
    CHECK(rig.drm->commits().size() == 1);
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{b});
    CHECK(engine->stats().dropped == 1);

    rig.flip();
    auto const commits = rig.drm->commits();
    REQUIRE(commits.size() == 2);
    CHECK(commits[1].value(basic_display::primary, "FB_ID") == c->fb_id());
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{a});

    rig.flip();
    CHECK(engine->get_recycled_buffers().empty());
    CHECK(rig.drm->max_pending_flips() == 1);

    // The displayed buffer is recycled once something replaces it.
    auto const d = rig.buffer();
    CHECK(engine->submit(d));
    rig.flip();
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{c});
}

TEST_CASE("Flip engine: cleanup during a pending flip") {
    EngineRig rig;
    auto engine = rig.start();
    auto const a = rig.buffer(), b = rig.buffer();
    CHECK(engine->submit(a));
    CHECK(engine->submit(b));
    CHECK(rig.drm->framebuffer_count() == 2);

    CHECK_NOTHROW(engine->cleanup());
    CHECK(engine->state() == FlipState::kIdle);
    CHECK(rig.drm->framebuffer_count() == 0);
    CHECK(a->fb_id() == 0);
    CHECK(b->fb_id() == 0);

    auto const commits = rig.drm->commits();
    REQUIRE(commits.size() == 2);
    CHECK(commits[1].flags == 0);
    CHECK(commits[1].value(basic_display::primary, "FB_ID") == 0);
    CHECK(commits[1].value(basic_display::primary, "CRTC_ID") == 0);

    auto const recycled = engine->get_recycled_buffers();
    CHECK(recycled == std::vector<BufferPtr>{a, b});

    // A late flip event finds no handler.
    rig.drm->complete_all_flips();
    CHECK(rig.device->dispatch_events() == 0);

    auto const removed = rig.drm->framebuffers_removed();
    CHECK_NOTHROW(engine->cleanup());
    CHECK(rig.drm->framebuffers_removed() == removed);
    CHECK(rig.drm->commits().size() == 2);

    auto const late = rig.buffer();
    CHECK_FALSE(engine->submit(late));
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{late});

    rig.buffers->dispose();
    for (auto const& buf : {a, b, late}) CHECK(buf->released());
}

TEST_CASE("Flip engine: cleanup of an unused engine") {
    EngineRig rig;
    auto engine = rig.start();
    engine.reset();
    CHECK(rig.drm->commits().empty());
}

TEST_CASE("Flip engine: kernel rejections") {
    EngineRig rig;
    auto engine = rig.start();
    auto const a = rig.buffer(), b = rig.buffer();

    SUBCASE("commit fails, then recovers") {
        rig.drm->fail_commits(1);
        CHECK_FALSE(engine->submit(a));
        CHECK(engine->state() == FlipState::kIdle);
        CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{a});
        CHECK(engine->stats().failed == 1);

        CHECK(engine->submit(b));
        CHECK(engine->state() == FlipState::kCommitInFlight);
        rig.flip();
        CHECK(engine->state() == FlipState::kDisplayed);
    }

    SUBCASE("queued commit fails at flip") {
        CHECK(engine->submit(a));
        CHECK(engine->submit(b));
        rig.drm->fail_commits(1);
        rig.flip();
        CHECK(engine->state() == FlipState::kDisplayed);
        CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{b});

        // The failed buffer may come right back.
        CHECK(engine->submit(b));
        CHECK(engine->state() == FlipState::kCommitInFlight);
    }

    SUBCASE("framebuffer rejected") {
        rig.drm->set_fail_addfb(true);
        CHECK_FALSE(engine->submit(a));
        CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{a});
        CHECK(rig.drm->commits().empty());
    }

    SUBCASE("buffer still held") {
        CHECK(engine->submit(a));
        CHECK_THROWS_AS(engine->submit(a), std::invalid_argument);
        CHECK_THROWS_AS(engine->submit(nullptr), std::invalid_argument);
    }
}

TEST_CASE("Flip engine: async flips") {
    EngineRig rig;
    auto engine = rig.start(FlipMode::kAtomicAsync);
    auto const a = rig.buffer(), b = rig.buffer();
    auto const plane = basic_display::primary;

    CHECK(engine->submit(a));
    rig.flip();

    SUBCASE("framebuffer-only commits") {
        CHECK(engine->submit(b));
        auto const commits = rig.drm->commits();
        REQUIRE(commits.size() == 2);
        CHECK(commits[0].flags == event_flags);
        CHECK(commits[0].has(plane, "SRC_W"));
        CHECK(commits[1].flags == (event_flags | DRM_MODE_PAGE_FLIP_ASYNC));
        CHECK(commits[1].value(plane, "FB_ID") == b->fb_id());
        CHECK_FALSE(commits[1].has(plane, "SRC_W"));
        CHECK(engine->mode() == FlipMode::kAtomicAsync);
    }

    SUBCASE("rejected async falls back to vblank") {
        rig.drm->set_reject_async(true);
        CHECK(engine->submit(b));
        auto const commits = rig.drm->commits();
        REQUIRE(commits.size() == 2);
        CHECK(commits[1].flags == event_flags);
        CHECK(commits[1].has(plane, "SRC_W"));
        CHECK(engine->mode() == FlipMode::kAtomicVblank);
        CHECK(engine->stats().failed == 0);
    }
}

TEST_CASE("Flip engine: legacy plane updates") {
    EngineRig rig;
    auto engine = rig.start(FlipMode::kLegacy);
    auto const a = rig.buffer(), b = rig.buffer();

    CHECK(engine->submit(a));
    CHECK(engine->state() == FlipState::kDisplayed);
    CHECK(engine->submit(b));
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{a});
    CHECK(engine->stats().flips == 2);

    auto sets = rig.drm->set_planes();
    REQUIRE(sets.size() == 2);
    CHECK(sets[1].plane_id == basic_display::primary);
    CHECK(sets[1].crtc_id == basic_display::crtc);
    CHECK(sets[1].fb_id == b->fb_id());
    CHECK(sets[1].crtc_w == 1920);
    CHECK(sets[1].src_w == 64 << 16);

    engine->cleanup();
    sets = rig.drm->set_planes();
    REQUIRE(sets.size() == 3);
    CHECK(sets[2].fb_id == 0);
    CHECK(rig.drm->commits().empty());
    CHECK(rig.drm->framebuffer_count() == 0);
}

TEST_CASE("Flip engine: blending") {
    EngineRig rig;
    FlipEngineConfig config;
    config.name = "overlay";
    config.crtc_id = basic_display::crtc;
    config.event_thread = false;
    config.blend = PlaneBlend{BlendMode::kCoverage, 128, 2};
    auto const overlay_props = resolve_plane_properties(
        rig.device.get(), basic_display::overlay
    );
    auto overlay = start_flip_engine(
        rig.device, rig.buffers, overlay_props, config, rig.sys
    );

    auto const buf = rig.buffers->allocate_buffer({320, 240}, DRM_FORMAT_NV12);
    CHECK(overlay->submit(buf));
    auto const commits = rig.drm->commits();
    REQUIRE(commits.size() == 1);
    auto const plane = basic_display::overlay;
    CHECK(commits[0].value(plane, "pixel blend mode") == 2);
    CHECK(commits[0].value(plane, "alpha") == 128 * 257);
    CHECK(commits[0].value(plane, "zpos") == 2);
    CHECK(commits[0].value(plane, "CRTC_W") == 320);  // No screen size given

    config.blend->alpha = 300;
    CHECK_THROWS_AS(
        start_flip_engine(rig.device, rig.buffers, overlay_props, config, rig.sys),
        std::invalid_argument
    );
}

TEST_CASE("Flip engine: initial buffer") {
    EngineRig rig;
    auto engine = rig.start();
    CHECK_THROWS_AS(engine->show_initial(rig.buffer()), std::invalid_argument);

    auto const initial = rig.buffer();
    REQUIRE(rig.buffers->create_framebuffer(initial.get()));
    engine->show_initial(initial);
    CHECK(engine->state() == FlipState::kDisplayed);

    auto const next = rig.buffer();
    CHECK(engine->submit(next));
    rig.flip();
    CHECK(engine->get_recycled_buffers() == std::vector<BufferPtr>{initial});
    CHECK_THROWS_AS(engine->show_initial(initial), std::invalid_argument);
}

TEST_CASE("Flip mode choice") {
    EngineRig rig;
    DisplayCaps caps = {true, true};
    auto const& props = rig.props;
    CHECK(choose_flip_mode(caps, props, FlipPreference::kAuto) == FlipMode::kAtomicVblank);
    CHECK(choose_flip_mode(caps, props, FlipPreference::kAsync) == FlipMode::kAtomicAsync);
    CHECK(choose_flip_mode(caps, props, FlipPreference::kLegacy) == FlipMode::kLegacy);

    caps.async_page_flip = false;
    CHECK(choose_flip_mode(caps, props, FlipPreference::kAsync) == FlipMode::kAtomicVblank);

    caps.atomic = false;
    CHECK(choose_flip_mode(caps, props, FlipPreference::kVblank) == FlipMode::kLegacy);

    rig.drm->set_atomic(false);
    auto const sys = std::make_shared<FakeSystem>();
    sys->add_device("/dev/dri/card0", rig.drm);
    auto const device = open_display_device(sys, "/dev/dri/card0");
    FlipEngineConfig config;
    config.crtc_id = basic_display::crtc;
    config.event_thread = false;
    CHECK_THROWS_AS(
        start_flip_engine(device, rig.buffers, props, config, sys),
        std::runtime_error
    );
}

TEST_CASE("Flip engine: event thread with a producer loop") {
    EngineRig rig;
    rig.drm->set_auto_flip(true);
    auto engine = rig.start(FlipMode::kAtomicVblank, true);

    std::vector<BufferPtr> free_list = {rig.buffer(), rig.buffer(), rig.buffer()};
    auto const deadline = rig.sys->clock(CLOCK_MONOTONIC) + 10.0;
    auto const wait = [&] {
        REQUIRE(rig.sys->clock(CLOCK_MONOTONIC) < deadline);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    };

    int constexpr frames = 60;
    for (int frame = 0; frame < frames; ++frame) {
        while (free_list.empty()) {
            for (auto& buf : engine->get_recycled_buffers())
                free_list.push_back(std::move(buf));
            if (free_list.empty()) wait();
        }
        auto buf = std::move(free_list.back());
        free_list.pop_back();
        CHECK(engine->submit(std::move(buf)));
    }

    while (engine->state() != FlipState::kDisplayed) wait();

    auto const stats = engine->stats();
    CHECK(stats.failed == 0);
    CHECK(stats.commits + stats.dropped == frames);
    CHECK(stats.flips == stats.commits);
    CHECK(rig.drm->max_pending_flips() == 1);

    engine->cleanup();
    CHECK(rig.drm->framebuffer_count() == 0);
    CHECK(engine->get_recycled_buffers().size() + free_list.size() == 3);
}

TEST_CASE("Flip engine: cleanup with a stuck event thread") {
    EngineRig rig;
    FlipEngineConfig config;
    config.name = "stuck";
    config.crtc_id = basic_display::crtc;
    config.poll_timeout = 0.01;
    config.stop_grace = 0.05;
    auto engine = start_flip_engine(rig.device, rig.buffers, rig.props, config, rig.sys);

    auto const a = rig.buffer();
    REQUIRE(engine->submit(a));
    auto const cookie = rig.drm->commits().back().user_data;

    rig.drm->set_poll_stall(true);
    REQUIRE(rig.drm->wait_for_stalled_polls(1, 5.0));
    CHECK_THROWS_AS(engine->cleanup(), std::runtime_error);

    // Teardown finished despite the abandoned thread.
    CHECK(engine->state() == FlipState::kIdle);
    CHECK(rig.drm->framebuffer_count() == 0);
    CHECK(engine->get_recycled_buffers().size() == 1);
    CHECK_NOTHROW(engine->cleanup());
    engine.reset();

    // A late flip for the destroyed engine finds no handler.
    rig.drm->queue_flip_event(cookie);
    CHECK(rig.device->dispatch_events() == 0);

    // The abandoned thread wakes, finds nothing to dispatch, and exits.
    rig.drm->queue_flip_event(cookie);
    rig.drm->set_poll_stall(false);
    auto const deadline = rig.sys->clock(CLOCK_MONOTONIC) + 5.0;
    while (rig.drm->queued_events() > 0) {
        REQUIRE(rig.sys->clock(CLOCK_MONOTONIC) < deadline);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

TEST_CASE("Flip engine: cleanup while a producer submits") {
    EngineRig rig;
    rig.drm->set_auto_flip(true);
    auto engine = rig.start(FlipMode::kAtomicVblank, true);

    std::vector<BufferPtr> free_list = {rig.buffer(), rig.buffer(), rig.buffer()};
    std::atomic<bool> done = false;
    std::thread producer([&] {
        while (!done) {
            for (auto& buf : engine->get_recycled_buffers())
                free_list.push_back(std::move(buf));
            if (free_list.empty()) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            auto buf = std::move(free_list.back());
            free_list.pop_back();
            engine->submit(std::move(buf));
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    engine->cleanup();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    done = true;
    producer.join();

    for (auto& buf : engine->get_recycled_buffers())
        free_list.push_back(std::move(buf));
    CHECK(free_list.size() == 3);
    CHECK(rig.drm->framebuffer_count() == 0);
    for (auto const& buf : free_list) CHECK(buf->fb_id() == 0);
}

}  // namespace planeflip
