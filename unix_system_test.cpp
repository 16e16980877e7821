#include "unix_system.h"

#include <unistd.h>

#include <algorithm>
#include <thread>

#include <doctest/doctest.h>

namespace planeflip {

TEST_CASE("ErrnoOr") {
    ErrnoOr<int> const ok = {0, 42};
    CHECK(ok.ex("ok") == 42);
    CHECK_NOTHROW(ok.check("ok"));

    ErrnoOr<int> const bad = {EBUSY, -1};
    CHECK_THROWS_AS(bad.check("bad"), std::system_error);
    try {
        (void) bad.ex("Commit");
    } catch (std::system_error const& e) {
        CHECK(e.code().value() == EBUSY);
        CHECK(std::string(e.what()).find("Commit") != std::string::npos);
    }
}

TEST_CASE("FileDescriptor poll and read") {
    auto const sys = global_system();
    int fds[2];
    REQUIRE(::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0);
    auto const reader = sys->adopt(fds[0]);
    auto const writer = sys->adopt(fds[1]);

    SUBCASE("times out when idle") {
        double const start = sys->clock(CLOCK_MONOTONIC);
        CHECK(reader->poll(POLLIN, 0.05).ex("poll") == 0);
        CHECK(sys->clock(CLOCK_MONOTONIC) - start >= 0.04);

        char buf[4];
        CHECK(reader->read(buf, sizeof(buf)).err == EAGAIN);
    }

    SUBCASE("wakes when readable") {
        ssize_t wrote = 0;
        std::thread later([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            wrote = ::write(writer->raw_fd(), "hi", 2);
        });
        CHECK((reader->poll(POLLIN, 5.0).ex("poll") & POLLIN));
        later.join();
        CHECK(wrote == 2);

        char buf[4] = {};
        CHECK(reader->read(buf, sizeof(buf)).ex("read") == 2);
        CHECK(std::string(buf) == "hi");
    }
}

TEST_CASE("SyncFlag deadline") {
    auto const sys = global_system();
    auto const flag = sys->make_flag(CLOCK_MONOTONIC);
    CHECK_FALSE(flag->sleep_until(sys->clock(CLOCK_MONOTONIC) + 0.01));
    flag->set();
    CHECK(flag->sleep_until(sys->clock(CLOCK_MONOTONIC) + 1.0));
}

TEST_CASE("ls skips dot entries") {
    auto const names = global_system()->ls("/").ex("/");
    CHECK(std::find(names.begin(), names.end(), ".") == names.end());
    CHECK(std::is_sorted(names.begin(), names.end()));
}

}  // namespace planeflip
