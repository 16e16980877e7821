// Logging and error-check conventions shared by the planeflip modules,
// on top of spdlog (github.com/gabime/spdlog).

#pragma once

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/spdlog.h>

namespace planeflip {

namespace log = ::spdlog;
using log_level = ::spdlog::level::level_enum;

// Per-flip logging is frequent; these skip argument formatting when the
// level is off.
#define TRACE(l, ...) \
    [&]{ if (l->should_log(log_level::trace)) l->trace(__VA_ARGS__); }()

#define DEBUG(l, ...) \
    [&]{ if (l->should_log(log_level::debug)) l->debug(__VA_ARGS__); }()

// Argument checks throw std::invalid_argument; failed setup (no usable
// plane, kernel refusal) throws std::runtime_error.
#define CHECK_ARG(f, ...) \
    [&]{ if (!(f)) throw std::invalid_argument(fmt::format(__VA_ARGS__)); }()

#define CHECK_RUNTIME(f, ...) \
    [&]{ if (!(f)) throw std::runtime_error(fmt::format(__VA_ARGS__)); }()

// Sets the output pattern and log levels. Levels come from a --log style
// argument like "info,flip=trace,device=debug"; if that is empty, from the
// PLANEFLIP_LOG environment variable (same syntax).
inline void configure_logging(std::string const& config) {
    spdlog::set_pattern("%H:%M:%S.%e %6t %^%L [%n] %v%$");
    if (!config.empty()) {
        spdlog::cfg::helpers::load_levels(config);
    } else if (char const* env = std::getenv("PLANEFLIP_LOG")) {
        spdlog::cfg::helpers::load_levels(env);
    }
}

// Returns the named logger, creating it on first use with the default
// logger's sinks, so every module writes to one stream at its own level.
inline std::shared_ptr<spdlog::logger> make_logger(std::string const& name) {
    if (auto existing = spdlog::get(name)) return existing;
    auto const& sinks = spdlog::default_logger()->sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::initialize_logger(logger);
    return logger;
}

}  // namespace planeflip
