#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/simulation/types.hpp>

#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace meridian::simulation {

/**
 * @brief Virtual clock plus a time-ordered queue of callbacks, drained by one
 *        dedicated dispatch thread.
 *
 * Callbacks dispatch in non-decreasing time order, with equal times in
 * insertion order. A callback carrying a repeat interval is re-enqueued
 * under the same token after it fires, unless it was cancelled meanwhile.
 * Callbacks run without the scheduler lock held; whatever events they
 * return are handed to the sink, also unlocked.
 *
 * Run modes: not started (STOPPED) -> RUNNING -> PAUSED <-> RUNNING -> STOPPED.
 * The clock moves only while RUNNING and only when an entry is dispatched.
 * Stopping is terminal and discards every pending entry without firing it.
 * A callback that throws is passed to the error handler; without one the
 * scheduler stops and pending breakpoints fail.
 *
 * Lock order for owners that hold their own mutex: owner first, scheduler second.
 * stop() joins the dispatch thread, so owners must not hold a mutex the
 * callbacks need when calling it.
 */
template<typename Event>
class EventScheduler {
public:
    using event_type = Event;
    using callback_type = std::function<std::vector<Event>(virtual_time)>;
    using sink_type = std::function<void(std::vector<Event>)>;
    using error_handler_type = std::function<void(const std::exception&)>;

    explicit EventScheduler(double pacing_factor = 0.0,
                            sink_type sink = {},
                            error_handler_type on_error = {})
        : _pacing_factor(pacing_factor)
        , _sink(std::move(sink))
        , _on_error(std::move(on_error))
    {}

    ~EventScheduler();

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    /**
     * Enqueues a callback. A time earlier than the clock is clamped to the
     * clock. After stop() the callback is dropped and the returned token
     * refers to nothing.
     */
    auto schedule(virtual_time at, callback_type callback,
                  std::optional<virtual_duration> repeat_interval = std::nullopt) -> ScheduleToken;

    // Idempotent; returns whether a pending entry was removed
    auto cancel(ScheduleToken token) -> bool;

    auto start() -> void;
    auto pause() -> void;
    auto resume() -> void;
    auto stop() -> void;

    /**
     * Breakpoint: when the dispatch loop reaches time t it sets the clock to
     * t, pauses and fulfils the future with t. Entries already queued at t
     * dispatch first. The future fails with InvalidStateError if the
     * scheduler stops before reaching t.
     */
    auto pause_at(virtual_time t) -> folly::SemiFuture<virtual_time>;

    auto now() const -> virtual_time;
    auto mode() const -> RunMode;
    auto has_started() const -> bool;
    auto pending_count() const -> std::size_t;
    auto dispatched_count() const -> std::size_t;

private:
    using queue_key = std::pair<virtual_time, std::uint64_t>;

    struct entry {
        ScheduleToken token;
        callback_type callback;
        std::optional<virtual_duration> repeat;
        std::shared_ptr<folly::Promise<virtual_time>> breakpoint;
    };

    auto run_loop() -> void;
    auto enqueue(virtual_time at, entry item) -> void;
    auto wait_for_pacing(std::unique_lock<std::mutex>& lock, virtual_time next) -> bool;
    // Called from the dispatch thread when a callback throws and no handler is set
    auto fail(const std::string& reason) -> void;
    auto take_breakpoints() -> std::vector<std::shared_ptr<folly::Promise<virtual_time>>>;

    double _pacing_factor;
    sink_type _sink;
    error_handler_type _on_error;

    mutable std::mutex _mutex;
    std::condition_variable _wakeup;
    std::thread _loop_thread;

    RunMode _mode{RunMode::STOPPED};
    bool _started{false};
    virtual_time _clock{0};
    std::uint64_t _next_token{1};
    std::uint64_t _next_sequence{0};
    // Bumped on every change the pacing wait must react to
    std::uint64_t _generation{0};
    std::size_t _dispatched{0};

    std::map<queue_key, entry> _queue;
    std::map<std::uint64_t, queue_key> _index;

    // Repeating entry currently executing outside the lock
    std::optional<std::uint64_t> _in_flight;
    bool _in_flight_cancelled{false};
};

} // namespace meridian::simulation

#include <meridian/simulation/scheduler_impl.hpp>
