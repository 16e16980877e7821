// Simple command line tool to print display devices, connectors, modes,
// CRTCs and planes.

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "display_device.h"
#include "display_layout.h"
#include "logging_policy.h"
#include "plane_properties.h"

namespace planeflip {

// Main program, parses flags and scans displays.
extern "C" int main(int const argc, char const* const* const argv) {
    std::string log_arg;

    CLI::App app("Print display devices, connectors, modes and planes");
    app.add_option("--log", log_arg, "Log level/configuration");
    CLI11_PARSE(app, argc, argv);

    configure_logging(log_arg);
    auto const logger = make_logger("planeflip_scan");

    try {
        std::shared_ptr sys = global_system();
        for (auto const& listing : list_display_devices(sys)) {
            fmt::print("=== {}\n", debug(listing));
            auto const device = open_display_device(sys, listing.dev_file);
            fmt::print("{}\n\n", debug(device->caps()));

            for (auto const& conn : scan_connectors(device.get())) {
                fmt::print(
                    "Connector #{:<3} {} {}\n", conn.id, conn.name,
                    conn.connected ? "[connected]" : "[no connection]"
                );
                for (auto const& mode : conn.modes) {
                    bool const preferred = mode.type & DRM_MODE_TYPE_PREFERRED;
                    fmt::print(
                        "  {}{}\n", debug(mode), preferred ? " [PREFERRED]" : ""
                    );
                }
            }

            fmt::print("\nCRTCs: {}\n", fmt::join(scan_crtcs(device.get()), " "));
            for (auto const& plane : scan_planes(device.get())) {
                auto const props = resolve_plane_properties(device.get(), plane.id);
                fmt::print("  {}\n", debug(plane));
                fmt::print("    {}", debug(props));
                if (!props.is_valid())
                    fmt::print(" (missing {})", fmt::join(props.missing(), ", "));
                fmt::print("\n");
            }
            fmt::print("\n");
        }
    } catch (std::exception const& e) {
        logger->critical("{}", e.what());
        return 1;
    }

    return 0;
}

}  // namespace planeflip
