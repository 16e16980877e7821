// X/Y coordinate pairs, mostly used for pixel sizes.

#pragma once

#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace planeflip {

// Convenience struct for coordinate pairs.
template <typename T>
struct XY {
    T x = {}, y = {};

    operator bool() const { return x || y; }
    bool operator==(XY const&) const = default;

    XY operator+(XY const other) const { return {x + other.x, y + other.y}; }
    XY operator-(XY const other) const { return {x - other.x, y - other.y}; }
    template <typename U> XY operator*(U m) const { return {x * m, y * m}; }
    template <typename U> XY operator/(U d) const { return {x / d, y / d}; }
};

// Pixel count of a size, zero for empty or negative sizes.
inline int64_t area(XY<int> size) {
    return (size.x > 0 && size.y > 0) ? int64_t(size.x) * size.y : 0;
}

// Debugging description of a size, like "1920x1080".
template <typename T>
std::string debug(XY<T> const& xy) { return fmt::format("{}x{}", xy.x, xy.y); }

}  // namespace planeflip
