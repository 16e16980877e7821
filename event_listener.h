// Background thread that waits for kernel display events and dispatches
// them to flip handlers (see DisplayDevice::dispatch_events()).

#pragma once

#include <memory>
#include <string>

#include "display_device.h"
#include "logging_policy.h"
#include "unix_system.h"

namespace planeflip {

struct EventListenerConfig {
    std::string name = "events";  // For logs and the thread name
    double poll_timeout = 0.1;     // Max delay before noticing stop()
    std::shared_ptr<log::logger> logger;  // Defaults to "listener"
};

// Polls a display device and dispatches its events on a dedicated thread.
// The thread never commits anything; handlers do that. Poll errors are
// logged and retried with backoff (up to 1s) until stop().
// Returned by start_event_listener().
class EventListener {
  public:
    // Stops the thread if stop() was not called (see stop()).
    virtual ~EventListener() = default;

    // Stops the thread, waiting at most grace seconds. If the thread does
    // not exit in time it is abandoned and std::runtime_error is thrown,
    // since handlers may still be running. Later calls do nothing.
    virtual void stop(double grace) = 0;

    virtual bool running() const = 0;
};

std::unique_ptr<EventListener> start_event_listener(
    std::shared_ptr<DisplayDevice>,
    EventListenerConfig const& = {},
    std::shared_ptr<UnixSystem> = global_system()
);

}  // namespace planeflip
