// Catalog of pixel formats and the memory layout of buffers using them.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "xy.h"

namespace planeflip {

// Read-only description of a DRM pixel format (see drm_fourcc.h).
// Multi-plane formats store their planes back to back in one buffer.
struct PixelFormat {
    std::string_view name;  // Like "NV12" or "XRGB8888"
    uint32_t fourcc = 0;    // DRM format code, like DRM_FORMAT_NV12
    int plane_count = 0;
    int plane_bpp[4] = {};  // Bits per pixel (averaged) for each plane
};

// Where each plane of a buffer lives. Returned by buffer_layout().
struct BufferLayout {
    size_t full_size = 0;               // Sum of all plane sizes
    std::vector<size_t> plane_offsets;  // Running sums of plane sizes
    ptrdiff_t stride = 0;               // Shared by all planes
};

// Assembles a fourcc uint32_t from text (like "NV12").
constexpr uint32_t fourcc(char const c[4]) {
    return uint32_t(uint8_t(c[0])) | (uint32_t(uint8_t(c[1])) << 8) |
        (uint32_t(uint8_t(c[2])) << 16) | (uint32_t(uint8_t(c[3])) << 24);
}

// All known formats.
std::vector<PixelFormat> const& pixel_formats();

// Looks up a format by DRM code, or by name ("XRGB8888") or fourcc text
// ("XR24"). Throws std::invalid_argument for unknown formats.
PixelFormat const& find_pixel_format(uint32_t fourcc);
PixelFormat const& find_pixel_format(std::string_view name);

// Computes plane offsets, stride and total size for a buffer.
// Throws std::invalid_argument for unknown formats or empty sizes.
BufferLayout buffer_layout(XY<int> size, uint32_t fourcc);

// Debugging descriptions of values and structures.
std::string debug_fourcc(uint32_t);
std::string debug_size(size_t);
std::string debug(BufferLayout const&);

}  // namespace planeflip
