// JSON configuration for a presenter (device, mode and planes).

#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "dual_plane_presenter.h"
#include "flip_engine.h"
#include "xy.h"

namespace planeflip {

struct PresenterConfig {
    std::string device;      // Empty for the first KMS device
    XY<int> mode;            // 0x0 for the preferred mode
    int buffers = 3;         // Buffers per plane for producers
    DualPlaneConfig planes;  // Formats, flip preferences, blending, timing
};

void from_json(nlohmann::json const&, PresenterPlaneConfig&);
void from_json(nlohmann::json const&, PresenterConfig&);

// Parses config text. Throws std::invalid_argument for bad JSON or values.
PresenterConfig parse_presenter_config(std::string_view text);

// Parses "auto", "async", "vblank" or "legacy".
FlipPreference parse_flip_preference(std::string_view);

// Parses "none", "premultiplied" or "coverage".
BlendMode parse_blend_mode(std::string_view);

}  // namespace planeflip
