#include "xy.h"

#include <doctest/doctest.h>

namespace planeflip {

TEST_CASE("XY basics") {
    CHECK(XY{3, 5}.x == 3);
    CHECK(XY{3, 5}.y == 5);

    CHECK(!XY<int>{});
    CHECK(XY{1, 0});
    CHECK(XY{3, 5} != XY{5, 3});
    CHECK(XY{3, 5} + XY{2, 1} == XY{5, 6});
    CHECK(XY{3, 5} - XY{2, 1} == XY{1, 4});
    CHECK(XY{1920, 1080} / 2 == XY{960, 540});
    CHECK(XY{3, 5} * 2 == XY{6, 10});
}

TEST_CASE("XY area and debug") {
    CHECK(area({1920, 1080}) == 2073600);
    CHECK(area({0, 1080}) == 0);
    CHECK(area({-4, 4}) == 0);
    CHECK(area({65536, 65536}) == 4294967296LL);
    CHECK(debug(XY<int>{640, 480}) == "640x480");
}

}  // namespace planeflip
