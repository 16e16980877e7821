#include "event_listener.h"

#include <poll.h>
#include <pthread.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include <fmt/core.h>

namespace planeflip {

namespace {

auto const& listener_logger() {
    static const auto logger = make_logger("listener");
    return logger;
}

// Shared with the thread, so an abandoned thread never touches freed state.
struct ListenerState {
    std::atomic<bool> stop_requested = false;
    std::unique_ptr<SyncFlag> wakeup;  // Ends an error backoff early
    std::unique_ptr<SyncFlag> exited;
};

class EventListenerDef : public EventListener {
  public:
    // A stuck thread terminates the process from here (see stop()).
    virtual ~EventListenerDef() final { stop(default_grace); }

    virtual void stop(double grace) final {
        std::scoped_lock const lock{stop_mutex};
        if (!thread.joinable()) return;

        DEBUG(logger, "{} stopping event thread...", config.name);
        state->stop_requested = true;
        state->wakeup->set();
        double const deadline = sys->clock(CLOCK_MONOTONIC) + grace;
        if (!state->exited->sleep_until(deadline)) {
            thread.detach();
            logger->critical(
                "{} event thread stuck after {:.1f}s, abandoned",
                config.name, grace
            );
            CHECK_RUNTIME(
                false, "{} event thread did not stop in {:.1f}s",
                config.name, grace
            );
        }

        thread.join();
        DEBUG(logger, "{} event thread stopped", config.name);
    }

    virtual bool running() const final {
        std::scoped_lock const lock{stop_mutex};
        return thread.joinable();
    }

    void start(
        std::shared_ptr<DisplayDevice> device,
        EventListenerConfig const& conf,
        std::shared_ptr<UnixSystem> sys
    ) {
        config = conf;
        if (config.logger) logger = config.logger;
        this->sys = std::move(sys);
        state = std::make_shared<ListenerState>();
        state->wakeup = this->sys->make_flag(CLOCK_MONOTONIC);
        state->exited = this->sys->make_flag(CLOCK_MONOTONIC);

        DEBUG(logger, "{} launching event thread...", config.name);
        thread = std::thread(
            &EventListenerDef::listener_thread,
            std::move(device), this->sys, state, config, logger
        );
    }

  private:
    static constexpr double default_grace = 2.0;

    // Constant from start to ~
    std::shared_ptr<log::logger> logger = listener_logger();
    std::shared_ptr<UnixSystem> sys;
    EventListenerConfig config;
    std::shared_ptr<ListenerState> state;

    std::mutex mutable stop_mutex;  // Guards thread
    std::thread thread;

    static constexpr double max_backoff = 1.0;

    static void listener_thread(
        std::shared_ptr<DisplayDevice> device,
        std::shared_ptr<UnixSystem> sys,
        std::shared_ptr<ListenerState> state,
        EventListenerConfig config,
        std::shared_ptr<log::logger> logger
    ) {
        auto const thread_name = fmt::format("pf:{}", config.name);
        pthread_setname_np(pthread_self(), thread_name.substr(0, 15).c_str());
        DEBUG(logger, "{} event thread running...", config.name);

        auto const& fd = device->fd();
        int poll_errors = 0;
        double backoff = config.poll_timeout;
        while (!state->stop_requested) {
            auto const ready = fd->poll(POLLIN, config.poll_timeout);
            if (ready.err) {
                if (poll_errors++ == 0) {
                    logger->error("{} poll: {}", config.name, strerror(ready.err));
                } else {
                    DEBUG(logger, "{} poll: {}", config.name, strerror(ready.err));
                }
                double const now = sys->clock(CLOCK_MONOTONIC);
                state->wakeup->sleep_until(now + backoff);
                backoff = std::min(backoff * 2, max_backoff);
                continue;
            }

            if (poll_errors) {
                logger->info(
                    "{} poll recovered after {} errors", config.name, poll_errors
                );
                poll_errors = 0;
                backoff = config.poll_timeout;
            }

            if (!(ready.value & POLLIN)) continue;
            try {
                int const handled = device->dispatch_events();
                TRACE(logger, "{} dispatched {} flips", config.name, handled);
            } catch (std::runtime_error const& e) {
                logger->error("{} events: {}", config.name, e.what());
                // Continue; one bad event must not stop presentation
            }
        }

        DEBUG(logger, "{} event thread ending...", config.name);
        state->exited->set();
    }
};

}  // anonymous namespace

std::unique_ptr<EventListener> start_event_listener(
    std::shared_ptr<DisplayDevice> device,
    EventListenerConfig const& config,
    std::shared_ptr<UnixSystem> sys
) {
    CHECK_ARG(device, "No display device for event listener");
    CHECK_ARG(config.poll_timeout > 0, "Bad poll timeout {}", config.poll_timeout);
    auto listener = std::make_unique<EventListenerDef>();
    listener->start(std::move(device), config, std::move(sys));
    return listener;
}

}  // namespace planeflip
