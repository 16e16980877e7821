#include "pixel_format.h"

#include <drm_fourcc.h>

#include <doctest/doctest.h>

namespace planeflip {

TEST_CASE("fourcc") {
    CHECK(fourcc("NV12") == DRM_FORMAT_NV12);
    CHECK(fourcc("XR24") == DRM_FORMAT_XRGB8888);
    CHECK(debug_fourcc(DRM_FORMAT_ARGB8888) == "AR24");
}

TEST_CASE("find_pixel_format") {
    CHECK(find_pixel_format(DRM_FORMAT_NV12).plane_count == 2);
    CHECK(find_pixel_format("XRGB8888").fourcc == DRM_FORMAT_XRGB8888);
    CHECK(find_pixel_format("RG24").name == "RGB888");
    CHECK_THROWS_AS(find_pixel_format(fourcc("ZZZZ")), std::invalid_argument);
    CHECK_THROWS_AS(find_pixel_format("bogus"), std::invalid_argument);
}

TEST_CASE("buffer_layout") {
    SUBCASE("NV12") {
        auto const l = buffer_layout({1920, 1080}, DRM_FORMAT_NV12);
        CHECK(l.full_size == 1920 * 1080 * 3 / 2);
        REQUIRE(l.plane_offsets.size() == 2);
        CHECK(l.plane_offsets[0] == 0);
        CHECK(l.plane_offsets[1] == 1920 * 1080);
        CHECK(l.stride == 1920);
    }

    SUBCASE("XRGB8888") {
        auto const l = buffer_layout({640, 480}, DRM_FORMAT_XRGB8888);
        CHECK(l.full_size == 640 * 480 * 4);
        CHECK(l.plane_offsets == std::vector<size_t>{0});
        CHECK(l.stride == 640 * 4);
    }

    SUBCASE("RGB888") {
        auto const l = buffer_layout({100, 10}, DRM_FORMAT_RGB888);
        CHECK(l.full_size == 3000);
        CHECK(l.stride == 300);
    }

    SUBCASE("empty size") {
        CHECK_THROWS_AS(
            buffer_layout({0, 480}, DRM_FORMAT_NV12), std::invalid_argument
        );
    }
}

TEST_CASE("buffer_layout sums planes for every format") {
    std::vector<XY<int>> const sizes = {{2, 2}, {1280, 720}, {33, 17}};
    for (auto const size : sizes) {
        for (auto const& format : pixel_formats()) {
            CAPTURE(format.name);
            auto const l = buffer_layout(size, format.fourcc);
            REQUIRE(int(l.plane_offsets.size()) == format.plane_count);

            size_t expected = 0;
            for (int p = 0; p < format.plane_count; ++p) {
                CHECK(l.plane_offsets[p] == expected);
                if (p > 0) CHECK(l.plane_offsets[p] > l.plane_offsets[p - 1]);
                expected += size_t(size.x) * size.y * format.plane_bpp[p] / 8;
            }
            CHECK(l.full_size == expected);
        }
    }
}

TEST_CASE("debug_size") {
    CHECK(debug_size(512) == "512B");
    CHECK(debug_size(4096) == "4.0K");
    CHECK(debug_size(3110400) == "3.0M");
}

}  // namespace planeflip
