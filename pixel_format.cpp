#include "pixel_format.h"

#include <drm_fourcc.h>

#include <fmt/core.h>

#include "logging_policy.h"

namespace planeflip {

std::vector<PixelFormat> const& pixel_formats() {
    static const std::vector<PixelFormat> formats = {
        {"NV12", DRM_FORMAT_NV12, 2, {8, 4}},
        {"NV21", DRM_FORMAT_NV21, 2, {8, 4}},
        {"NV16", DRM_FORMAT_NV16, 2, {8, 8}},
        {"YUYV", DRM_FORMAT_YUYV, 1, {16}},
        {"XRGB8888", DRM_FORMAT_XRGB8888, 1, {32}},
        {"ARGB8888", DRM_FORMAT_ARGB8888, 1, {32}},
        {"XBGR8888", DRM_FORMAT_XBGR8888, 1, {32}},
        {"ABGR8888", DRM_FORMAT_ABGR8888, 1, {32}},
        {"RGB888", DRM_FORMAT_RGB888, 1, {24}},
        {"BGR888", DRM_FORMAT_BGR888, 1, {24}},
        {"RGB565", DRM_FORMAT_RGB565, 1, {16}},
    };
    return formats;
}

PixelFormat const& find_pixel_format(uint32_t code) {
    PixelFormat const* found = nullptr;
    for (auto const& format : pixel_formats()) {
        if (format.fourcc == code) found = &format;
    }
    CHECK_ARG(found, "Unknown pixel format: {}", debug_fourcc(code));
    return *found;
}

PixelFormat const& find_pixel_format(std::string_view name) {
    PixelFormat const* found = nullptr;
    for (auto const& format : pixel_formats()) {
        if (format.name == name) found = &format;
        if (name.size() == 4 && format.fourcc == fourcc(name.data()))
            found = &format;
    }
    CHECK_ARG(found, "Unknown pixel format: \"{}\"", name);
    return *found;
}

BufferLayout buffer_layout(XY<int> size, uint32_t code) {
    auto const& format = find_pixel_format(code);
    CHECK_ARG(
        size.x > 0 && size.y > 0,
        "Bad buffer size {} for {}", debug(size), format.name
    );

    BufferLayout out = {};
    auto const pixels = size_t(area(size));
    for (int p = 0; p < format.plane_count; ++p) {
        out.plane_offsets.push_back(out.full_size);
        out.full_size += pixels * format.plane_bpp[p] / 8;
    }
    out.stride = ptrdiff_t(size.x) * format.plane_bpp[0] / 8;
    return out;
}

std::string debug_size(size_t s) {
    if (s < 1000) return fmt::format("{}B", s);
    if (s < 10240) return fmt::format("{:.1f}K", s / 1024.0);
    if (s < 1024000) return fmt::format("{}K", s / 1024);
    if (s < 10485760) return fmt::format("{:.1f}M", s / 1048576.0);
    if (s < 1048576000) return fmt::format("{}M", s / 1048576);
    return fmt::format("{:.1f}G", s / 1073741824.0);
}

std::string debug_fourcc(uint32_t fourcc) {
    std::string out;
    for (int i = 0; i < 4; ++i) {
        int const ch = (fourcc >> (i * 8)) & 0xFF;
        if (ch > 32) out.append(1, ch);
        if (ch > 0 && ch < 32) out.append(fmt::format("{}", ch));
    }
    return out;
}

std::string debug(BufferLayout const& layout) {
    std::string out = debug_size(layout.full_size);
    for (size_t p = 0; p < layout.plane_offsets.size(); ++p)
        out += fmt::format("{}@{}", p ? "," : " ", layout.plane_offsets[p]);
    return out + fmt::format(" /{}", layout.stride);
}

}  // namespace planeflip
