#include "event_listener.h"

#include <atomic>
#include <condition_variable>
#include <mutex>

#include <doctest/doctest.h>

#include "fake_drm.h"

namespace planeflip {

TEST_CASE("Event listener dispatches flips") {
    FakeRig rig;
    auto const flag = rig.sys->make_flag(CLOCK_MONOTONIC);
    std::atomic<int> flips = 0;
    auto const cookie = rig.device->add_flip_handler([&](FlipEvent const&) {
        ++flips;
        flag->set();
    });

    EventListenerConfig config;
    config.name = "test";
    config.poll_timeout = 0.01;
    auto const listener = start_event_listener(rig.device, config, rig.sys);
    CHECK(listener->running());

    rig.drm->queue_flip_event(cookie);
    REQUIRE(flag->sleep_until(rig.sys->clock(CLOCK_MONOTONIC) + 5.0));
    CHECK(flips == 1);

    listener->stop(2.0);
    CHECK_FALSE(listener->running());
    CHECK_NOTHROW(listener->stop(2.0));

    rig.drm->queue_flip_event(cookie);
    CHECK(flips == 1);
    rig.device->remove_flip_handler(cookie);
}

TEST_CASE("Event listener keeps polling after errors") {
    FakeRig rig;
    auto const flag = rig.sys->make_flag(CLOCK_MONOTONIC);
    std::atomic<int> flips = 0;
    auto const cookie = rig.device->add_flip_handler([&](FlipEvent const&) {
        ++flips;
        flag->set();
    });

    rig.drm->fail_polls(3, EIO);
    EventListenerConfig config;
    config.poll_timeout = 0.01;
    auto const listener = start_event_listener(rig.device, config, rig.sys);

    rig.drm->queue_flip_event(cookie);
    REQUIRE(flag->sleep_until(rig.sys->clock(CLOCK_MONOTONIC) + 5.0));
    CHECK(flips == 1);
    CHECK(listener->running());

    SUBCASE("stop during backoff") {
        rig.drm->fail_polls(1000, EIO);
        double const start = rig.sys->clock(CLOCK_MONOTONIC);
        listener->stop(2.0);
        CHECK(rig.sys->clock(CLOCK_MONOTONIC) - start < 1.5);
    }

    listener->stop(2.0);
    rig.device->remove_flip_handler(cookie);
}

TEST_CASE("Event listener config") {
    FakeRig rig;
    EventListenerConfig config;
    config.poll_timeout = 0;
    CHECK_THROWS_AS(
        start_event_listener(rig.device, config, rig.sys), std::invalid_argument
    );
    CHECK_THROWS_AS(start_event_listener(nullptr), std::invalid_argument);
}

TEST_CASE("Event listener stuck in a handler") {
    FakeRig rig;
    std::mutex mutex;
    std::condition_variable cond;
    bool entered = false, release = false;
    auto const cookie = rig.device->add_flip_handler([&](FlipEvent const&) {
        std::unique_lock lock{mutex};
        entered = true;
        cond.notify_all();
        cond.wait(lock, [&] { return release; });
    });

    EventListenerConfig config;
    config.poll_timeout = 0.01;
    auto listener = start_event_listener(rig.device, config, rig.sys);
    rig.drm->queue_flip_event(cookie);
    {
        std::unique_lock lock{mutex};
        cond.wait(lock, [&] { return entered; });
    }

    CHECK_THROWS_AS(listener->stop(0.05), std::runtime_error);
    CHECK_FALSE(listener->running());

    // Let the abandoned thread finish before the handler's state goes away.
    {
        std::scoped_lock const lock{mutex};
        release = true;
    }
    cond.notify_all();
    rig.device->remove_flip_handler(cookie);
}

}  // namespace planeflip
