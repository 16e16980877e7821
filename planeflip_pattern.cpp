// Command line tool to show moving test patterns on the primary plane and
// (optionally) an overlay plane, and report flip statistics.

#include <fstream>
#include <optional>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <fmt/core.h>

#include "buffer_manager.h"
#include "display_device.h"
#include "display_layout.h"
#include "dma_heap.h"
#include "dual_plane_presenter.h"
#include "logging_policy.h"
#include "pixel_format.h"
#include "presenter_config.h"
#include "test_pattern.h"

namespace planeflip {

namespace {

using BufferPtr = std::shared_ptr<SharedBuffer>;

std::shared_ptr<log::logger> const& pattern_logger() {
    static const auto logger = make_logger("planeflip_pattern");
    return logger;
}

std::shared_ptr<DisplayDevice> find_device(std::string const& dev_arg) {
    fmt::print("=== Display devices ===\n");
    std::optional<DisplayDeviceListing> found;
    for (auto const& d : list_display_devices(global_system())) {
        auto const text = debug(d);
        if (!found && text.find(dev_arg) != std::string::npos)
            found = d;
        fmt::print("{} {}\n", (found == d) ? "=>" : "  ", text);
    }
    fmt::print("\n");

    CHECK_RUNTIME(found, "No DRM device matching \"{}\"", dev_arg);
    return open_display_device(global_system(), found->dev_file);
}

PresenterConfig load_config(std::string const& config_file) {
    std::ifstream ifs;
    ifs.exceptions(~std::ifstream::goodbit);
    ifs.open(config_file, std::ios::binary);
    std::string const text(
        (std::istreambuf_iterator<char>(ifs)),
        (std::istreambuf_iterator<char>())
    );
    return parse_presenter_config(text);
}

// One plane's producer: buffers to draw into, and where they go.
struct PatternPlane {
    std::string name;
    std::vector<BufferPtr> free;
    int64_t drawn = 0;
    int64_t starved = 0;
};

void run_patterns(
    DualPlanePresenter* presenter,
    BufferManager* buffers,
    PresenterConfig const& config,
    double fps,
    double seconds
) {
    auto const& logger = pattern_logger();
    auto const sys = global_system();
    auto const waiter = sys->make_flag(CLOCK_MONOTONIC);
    auto const screen = presenter->layout().size();

    PatternPlane primary = {"primary"}, overlay = {"overlay"};
    for (int i = 0; i < config.buffers; ++i) {
        primary.free.push_back(
            buffers->allocate_buffer(screen, config.planes.primary.fourcc)
        );
        if (presenter->has_overlay()) {
            overlay.free.push_back(buffers->allocate_buffer(
                screen / 2, config.planes.overlay->fourcc
            ));
        }
    }

    auto const produce = [&](
        PatternPlane* plane, std::vector<BufferPtr> recycled, int64_t frame,
        bool (DualPlanePresenter::*submit)(BufferPtr)
    ) {
        for (auto& buf : recycled) plane->free.push_back(std::move(buf));
        if (plane->free.empty()) {
            ++plane->starved;
            TRACE(logger, "{} frame {}: no free buffer", plane->name, frame);
            return;
        }

        auto buf = std::move(plane->free.back());
        plane->free.pop_back();
        draw_test_pattern(buf.get(), frame);
        ++plane->drawn;
        (presenter->*submit)(std::move(buf));
    };

    logger->info("Showing patterns at {:.1f}fps for {:.1f}s", fps, seconds);
    double const start = sys->clock(CLOCK_MONOTONIC);
    for (int64_t frame = 0; frame < int64_t(fps * seconds); ++frame) {
        waiter->sleep_until(start + frame / fps);
        produce(
            &primary, presenter->recycled_primary(), frame,
            &DualPlanePresenter::submit_primary
        );
        if (presenter->has_overlay()) {
            produce(
                &overlay, presenter->recycled_overlay(), frame * 2,
                &DualPlanePresenter::submit_overlay
            );
        }
    }

    double const elapsed = sys->clock(CLOCK_MONOTONIC) - start;
    for (auto const* plane : {&primary, &overlay}) {
        auto const* engine = (plane == &primary)
            ? presenter->primary() : presenter->overlay();
        if (!engine) continue;
        auto const stats = engine->stats();
        fmt::print(
            "{:<7} {} drawn, {} starved; {} ({:.1f} flips/s, {})\n",
            plane->name, plane->drawn, plane->starved, debug(stats),
            elapsed > 0 ? stats.flips / elapsed : 0.0, debug(engine->mode())
        );
    }
}

}  // namespace

// Main program, parses flags and shows patterns.
extern "C" int main(int const argc, char const* const* const argv) {
    std::string config_arg;
    std::string dev_arg;
    std::string log_arg;
    std::string primary_arg = "XRGB8888";
    std::string overlay_arg;
    std::string flip_arg = "auto";
    XY<int> mode_arg = {0, 0};
    int buffers_arg = 3;
    double fps_arg = 30.0;
    double seconds_arg = 5.0;

    CLI::App app("Show moving test patterns on display planes");
    app.add_option("--config", config_arg, "JSON presenter config file");
    app.add_option("--dev", dev_arg, "DRM device description substring");
    app.add_option("--log", log_arg, "Log level/configuration");
    app.add_option("--mode_x", mode_arg.x, "Video pixels per line");
    app.add_option("--mode_y", mode_arg.y, "Video scan lines");
    app.add_option("--primary", primary_arg, "Primary plane pixel format");
    app.add_option("--overlay", overlay_arg, "Overlay plane pixel format");
    app.add_option("--flip", flip_arg, "auto, async, vblank or legacy");
    app.add_option("--buffers", buffers_arg, "Buffers per plane");
    app.add_option("--fps", fps_arg, "Frames per second to submit");
    app.add_option("--seconds", seconds_arg, "Seconds to run");
    CLI11_PARSE(app, argc, argv);

    configure_logging(log_arg);
    auto const logger = pattern_logger();

    try {
        PresenterConfig config;
        if (!config_arg.empty()) {
            logger->info("Config: {}", config_arg);
            config = load_config(config_arg);
        } else {
            config.device = dev_arg;
            config.mode = mode_arg;
            config.buffers = buffers_arg;
            auto const flip = parse_flip_preference(flip_arg);
            config.planes.primary.fourcc = find_pixel_format(primary_arg).fourcc;
            config.planes.primary.flip = flip;
            if (!overlay_arg.empty()) {
                auto& overlay = config.planes.overlay.emplace();
                overlay.fourcc = find_pixel_format(overlay_arg).fourcc;
                overlay.flip = flip;
                overlay.blend = PlaneBlend{};
                overlay.blend->zpos = 1;
            }
        }

        CHECK_ARG(fps_arg > 0 && seconds_arg >= 0, "Bad --fps or --seconds");
        CHECK_ARG(config.buffers >= 2, "Need 2+ buffers, not {}", config.buffers);

        auto const device = find_device(config.device);
        auto const overlay_fourcc =
            config.planes.overlay ? config.planes.overlay->fourcc : 0;
        auto const layout = find_display_layout(
            device.get(), config.mode, overlay_fourcc
        );

        auto const allocator = open_dma_heap_allocator(global_system());
        auto const buffers = make_buffer_manager(device, allocator);
        auto const presenter = open_dual_plane_presenter(
            device, buffers, layout, config.planes
        );

        run_patterns(presenter.get(), buffers.get(), config, fps_arg, seconds_arg);
        presenter->cleanup();
        buffers->dispose();
    } catch (std::exception const& e) {
        logger->critical("{}", e.what());
        return 1;
    }

    fmt::print("Done!\n\n");
    return 0;
}

}  // namespace planeflip
