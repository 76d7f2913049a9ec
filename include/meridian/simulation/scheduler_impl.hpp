#pragma once

#include <meridian/simulation/scheduler.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace meridian::simulation {

template<typename Event>
EventScheduler<Event>::~EventScheduler() {
    std::vector<std::shared_ptr<folly::Promise<virtual_time>>> breakpoints;
    {
        std::unique_lock lock(_mutex);
        if (_mode != RunMode::STOPPED) {
            _mode = RunMode::STOPPED;
        }
        breakpoints = take_breakpoints();
        _queue.clear();
        _index.clear();
        ++_generation;
    }
    _wakeup.notify_all();

    for (auto& breakpoint : breakpoints) {
        breakpoint->setException(InvalidStateError("Scheduler destroyed before breakpoint was reached"));
    }

    if (_loop_thread.joinable()) {
        if (_loop_thread.get_id() == std::this_thread::get_id()) {
            _loop_thread.detach();
        } else {
            _loop_thread.join();
        }
    }
}

template<typename Event>
auto EventScheduler<Event>::schedule(virtual_time at, callback_type callback,
                                     std::optional<virtual_duration> repeat_interval) -> ScheduleToken {
    if (repeat_interval && repeat_interval->count() <= 0) {
        throw std::invalid_argument("repeat interval must be positive");
    }

    std::unique_lock lock(_mutex);
    ScheduleToken token{_next_token++};

    // Stopped for good: nothing will ever fire
    if (_started && _mode == RunMode::STOPPED) {
        return token;
    }

    enqueue(std::max(at, _clock), entry{token, std::move(callback), repeat_interval, nullptr});
    return token;
}

template<typename Event>
auto EventScheduler<Event>::cancel(ScheduleToken token) -> bool {
    std::unique_lock lock(_mutex);

    auto it = _index.find(token.id());
    if (it != _index.end()) {
        _queue.erase(it->second);
        _index.erase(it);
        ++_generation;
        _wakeup.notify_all();
        return true;
    }

    if (_in_flight && *_in_flight == token.id()) {
        _in_flight_cancelled = true;
        return true;
    }

    return false;
}

template<typename Event>
auto EventScheduler<Event>::start() -> void {
    std::unique_lock lock(_mutex);

    if (_mode != RunMode::STOPPED) {
        throw InvalidStateError("Cannot start: simulation is already " + std::string(to_string(_mode)));
    }
    if (_started) {
        throw InvalidStateError("Cannot start: simulation has been stopped and cannot be restarted");
    }

    _started = true;
    _mode = RunMode::RUNNING;
    ++_generation;
    _loop_thread = std::thread([this]() { run_loop(); });
}

template<typename Event>
auto EventScheduler<Event>::pause() -> void {
    {
        std::unique_lock lock(_mutex);
        if (_mode != RunMode::RUNNING) {
            throw InvalidStateError("Cannot pause: simulation is " + std::string(to_string(_mode)));
        }
        _mode = RunMode::PAUSED;
        ++_generation;
    }
    _wakeup.notify_all();
}

template<typename Event>
auto EventScheduler<Event>::resume() -> void {
    {
        std::unique_lock lock(_mutex);
        if (_mode != RunMode::PAUSED) {
            throw InvalidStateError("Cannot resume: simulation is " + std::string(to_string(_mode)));
        }
        _mode = RunMode::RUNNING;
        ++_generation;
    }
    _wakeup.notify_all();
}

template<typename Event>
auto EventScheduler<Event>::stop() -> void {
    std::vector<std::shared_ptr<folly::Promise<virtual_time>>> breakpoints;
    {
        std::unique_lock lock(_mutex);
        if (_mode == RunMode::STOPPED) {
            throw InvalidStateError(_started
                ? "Cannot stop: simulation is already stopped"
                : "Cannot stop: simulation has not been started");
        }

        _mode = RunMode::STOPPED;
        breakpoints = take_breakpoints();
        _queue.clear();
        _index.clear();
        ++_generation;
    }
    _wakeup.notify_all();

    for (auto& breakpoint : breakpoints) {
        breakpoint->setException(InvalidStateError("Simulation stopped before breakpoint was reached"));
    }

    // A callback may stop the simulation from the dispatch thread itself
    if (_loop_thread.joinable() && _loop_thread.get_id() != std::this_thread::get_id()) {
        _loop_thread.join();
    }
}

template<typename Event>
auto EventScheduler<Event>::fail(const std::string& reason) -> void {
    std::vector<std::shared_ptr<folly::Promise<virtual_time>>> breakpoints;
    {
        std::unique_lock lock(_mutex);
        _mode = RunMode::STOPPED;
        _in_flight.reset();
        breakpoints = take_breakpoints();
        _queue.clear();
        _index.clear();
        ++_generation;
    }
    _wakeup.notify_all();

    for (auto& breakpoint : breakpoints) {
        breakpoint->setException(InvalidStateError(reason));
    }
}

template<typename Event>
auto EventScheduler<Event>::pause_at(virtual_time t) -> folly::SemiFuture<virtual_time> {
    auto promise = std::make_shared<folly::Promise<virtual_time>>();
    auto future = promise->getSemiFuture();

    {
        std::unique_lock lock(_mutex);
        if (!_started || _mode != RunMode::STOPPED) {
            enqueue(std::max(t, _clock), entry{ScheduleToken{0}, {}, std::nullopt, promise});
            return future;
        }
    }

    promise->setException(InvalidStateError("Cannot set a breakpoint on a stopped simulation"));
    return future;
}

template<typename Event>
auto EventScheduler<Event>::now() const -> virtual_time {
    std::unique_lock lock(_mutex);
    return _clock;
}

template<typename Event>
auto EventScheduler<Event>::mode() const -> RunMode {
    std::unique_lock lock(_mutex);
    return _mode;
}

template<typename Event>
auto EventScheduler<Event>::has_started() const -> bool {
    std::unique_lock lock(_mutex);
    return _started;
}

template<typename Event>
auto EventScheduler<Event>::pending_count() const -> std::size_t {
    std::unique_lock lock(_mutex);
    return _queue.size();
}

template<typename Event>
auto EventScheduler<Event>::dispatched_count() const -> std::size_t {
    std::unique_lock lock(_mutex);
    return _dispatched;
}

template<typename Event>
auto EventScheduler<Event>::enqueue(virtual_time at, entry item) -> void {
    queue_key key{at, _next_sequence++};
    if (item.token.id() != 0) {
        _index[item.token.id()] = key;
    }
    _queue.emplace(key, std::move(item));
    ++_generation;
    _wakeup.notify_all();
}

template<typename Event>
auto EventScheduler<Event>::take_breakpoints() -> std::vector<std::shared_ptr<folly::Promise<virtual_time>>> {
    std::vector<std::shared_ptr<folly::Promise<virtual_time>>> breakpoints;
    for (auto& [key, item] : _queue) {
        if (item.breakpoint) {
            breakpoints.push_back(std::move(item.breakpoint));
        }
    }
    return breakpoints;
}

// Returns true when the full pacing delay elapsed with the queue head unchanged
template<typename Event>
auto EventScheduler<Event>::wait_for_pacing(std::unique_lock<std::mutex>& lock, virtual_time next) -> bool {
    auto delay = std::chrono::duration<double, std::milli>(
        static_cast<double>((next - _clock).count()) * _pacing_factor);
    auto generation = _generation;

    auto interrupted = _wakeup.wait_for(lock, delay, [this, generation]() {
        return _generation != generation || _mode != RunMode::RUNNING;
    });
    return !interrupted;
}

template<typename Event>
auto EventScheduler<Event>::run_loop() -> void {
    std::unique_lock lock(_mutex);

    while (true) {
        _wakeup.wait(lock, [this]() {
            return _mode == RunMode::STOPPED || (_mode == RunMode::RUNNING && !_queue.empty());
        });

        if (_mode == RunMode::STOPPED) {
            return;
        }

        auto next_time = _queue.begin()->first.first;
        if (_pacing_factor > 0.0 && next_time > _clock && !wait_for_pacing(lock, next_time)) {
            continue;
        }

        auto node = _queue.extract(_queue.begin());
        auto item = std::move(node.mapped());
        _index.erase(item.token.id());
        _clock = std::max(_clock, node.key().first);
        auto at = _clock;

        if (item.breakpoint) {
            _mode = RunMode::PAUSED;
            ++_generation;
            lock.unlock();
            item.breakpoint->setValue(at);
            lock.lock();
            continue;
        }

        _in_flight = item.token.id();
        _in_flight_cancelled = false;
        ++_dispatched;
        lock.unlock();

        try {
            auto events = item.callback(at);
            if (_sink && !events.empty()) {
                _sink(std::move(events));
            }
        } catch (const std::exception& e) {
            if (!_on_error) {
                // Nobody to report to: halt instead of dispatching on top of a broken callback
                fail(std::string("Callback failed at t=") + std::to_string(at.count()) + "ms: " + e.what());
                return;
            }
            _on_error(e);
        } catch (...) {
            auto reason = std::string("Callback failed at t=") + std::to_string(at.count()) + "ms: non-standard exception";
            if (!_on_error) {
                fail(reason);
                return;
            }
            _on_error(MeridianError(reason));
        }

        lock.lock();
        auto cancelled = _in_flight_cancelled;
        _in_flight.reset();
        _in_flight_cancelled = false;

        if (item.repeat && !cancelled && _mode != RunMode::STOPPED) {
            enqueue(at + *item.repeat, std::move(item));
        }
    }
}

} // namespace meridian::simulation
