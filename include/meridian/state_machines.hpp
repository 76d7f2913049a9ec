#pragma once

#include <meridian/exceptions.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace meridian {

// ============================================================================
// Interface operational state
// ============================================================================

enum class InterfaceState : std::uint8_t {
    UP,
    DOWN,
    ADMIN_DOWN    // shut down in configuration, never changed by faults
};

enum class InterfaceEvent : std::uint8_t {
    FAULT_APPLIED,
    FAULT_RELEASED
};

inline auto to_string(InterfaceState state) -> std::string_view {
    switch (state) {
        case InterfaceState::UP:         return "up";
        case InterfaceState::DOWN:       return "down";
        case InterfaceState::ADMIN_DOWN: return "administratively-down";
    }
    return "unknown";
}

inline auto to_string(InterfaceEvent event) -> std::string_view {
    switch (event) {
        case InterfaceEvent::FAULT_APPLIED:  return "fault-applied";
        case InterfaceEvent::FAULT_RELEASED: return "fault-released";
    }
    return "unknown";
}

inline auto parse_interface_state(std::string_view text) -> std::optional<InterfaceState> {
    if (text == "up") return InterfaceState::UP;
    if (text == "down") return InterfaceState::DOWN;
    if (text == "administratively-down") return InterfaceState::ADMIN_DOWN;
    return std::nullopt;
}

/**
 * @brief Operational state of one interface, driven by fault holds.
 *
 * Every active fault covering the interface holds it down. The interface
 * comes back up only when the last hold is released. An administratively
 * down interface counts holds but never leaves ADMIN_DOWN.
 */
class InterfaceStateMachine {
public:
    explicit InterfaceStateMachine(bool admin_down = false)
        : _state(admin_down ? InterfaceState::ADMIN_DOWN : InterfaceState::UP)
        , _fault_holds(0) {}

    // Pure transition function. holds_after is the hold count once the event is applied.
    static auto next_state(InterfaceState current, InterfaceEvent event, std::size_t holds_after) -> InterfaceState {
        switch (event) {
            case InterfaceEvent::FAULT_APPLIED:
                return current == InterfaceState::ADMIN_DOWN ? InterfaceState::ADMIN_DOWN : InterfaceState::DOWN;
            case InterfaceEvent::FAULT_RELEASED:
                if (current == InterfaceState::UP) {
                    throw InvalidTransitionError("interface", std::string(to_string(current)), std::string(to_string(event)));
                }
                if (current == InterfaceState::ADMIN_DOWN) {
                    return InterfaceState::ADMIN_DOWN;
                }
                return holds_after == 0 ? InterfaceState::UP : InterfaceState::DOWN;
        }
        throw InvalidTransitionError("interface", std::string(to_string(current)), std::string(to_string(event)));
    }

    // Returns the state after the event
    auto apply(InterfaceEvent event) -> InterfaceState {
        std::size_t holds_after = _fault_holds;
        if (event == InterfaceEvent::FAULT_APPLIED) {
            ++holds_after;
        } else {
            if (_fault_holds == 0) {
                throw InvalidTransitionError("interface", std::string(to_string(_state)), std::string(to_string(event)));
            }
            --holds_after;
        }

        _state = next_state(_state, event, holds_after);
        _fault_holds = holds_after;
        return _state;
    }

    [[nodiscard]] auto state() const -> InterfaceState { return _state; }
    [[nodiscard]] auto fault_holds() const -> std::size_t { return _fault_holds; }
    [[nodiscard]] auto is_up() const -> bool { return _state == InterfaceState::UP; }

private:
    InterfaceState _state;
    std::size_t _fault_holds;
};

// ============================================================================
// Link operational state (derived from its two endpoints)
// ============================================================================

enum class LinkState : std::uint8_t {
    UP,
    DOWN
};

inline auto to_string(LinkState state) -> std::string_view {
    return state == LinkState::UP ? "up" : "down";
}

inline auto link_state(InterfaceState a, InterfaceState b) -> LinkState {
    return (a == InterfaceState::UP && b == InterfaceState::UP) ? LinkState::UP : LinkState::DOWN;
}

// ============================================================================
// Routing-protocol neighbor adjacency
// ============================================================================

enum class NeighborState : std::uint8_t {
    INIT,
    FULL
};

enum class NeighborEvent : std::uint8_t {
    HELLO_RECEIVED,
    ADJACENCY_RESET    // a fault took down the connecting interface
};

inline auto to_string(NeighborState state) -> std::string_view {
    return state == NeighborState::INIT ? "init" : "full";
}

inline auto to_string(NeighborEvent event) -> std::string_view {
    return event == NeighborEvent::HELLO_RECEIVED ? "hello-received" : "adjacency-reset";
}

/**
 * @brief Two-state adjacency with one peer.
 *
 * An adjacency only exists once a first hello has been seen, so it is born
 * in INIT and FULL is reachable only through INIT. It becomes FULL once
 * hellos_to_full hellos arrive without an intervening reset. A reset drops
 * it back to INIT and forgets the hellos seen so far.
 */
class NeighborStateMachine {
public:
    explicit NeighborStateMachine(std::size_t hellos_to_full)
        : _state(NeighborState::INIT)
        , _hellos_to_full(hellos_to_full == 0 ? 1 : hellos_to_full)
        , _hellos_seen(0) {}

    static auto next_state(NeighborState current, NeighborEvent event,
                           std::size_t hellos_seen_after, std::size_t hellos_to_full) -> NeighborState {
        switch (event) {
            case NeighborEvent::HELLO_RECEIVED:
                if (current == NeighborState::FULL) {
                    return NeighborState::FULL;
                }
                return hellos_seen_after >= hellos_to_full ? NeighborState::FULL : NeighborState::INIT;
            case NeighborEvent::ADJACENCY_RESET:
                return NeighborState::INIT;
        }
        throw InvalidTransitionError("neighbor", std::string(to_string(current)), std::string(to_string(event)));
    }

    // Returns true when this event moved the adjacency into a new state
    auto apply(NeighborEvent event) -> bool {
        auto previous = _state;
        std::size_t seen_after = event == NeighborEvent::HELLO_RECEIVED ? _hellos_seen + 1 : 0;
        _state = next_state(_state, event, seen_after, _hellos_to_full);
        _hellos_seen = seen_after;
        return previous != _state;
    }

    [[nodiscard]] auto state() const -> NeighborState { return _state; }
    [[nodiscard]] auto hellos_seen() const -> std::size_t { return _hellos_seen; }
    [[nodiscard]] auto hellos_to_full() const -> std::size_t { return _hellos_to_full; }

private:
    NeighborState _state;
    std::size_t _hellos_to_full;
    std::size_t _hellos_seen;
};

} // namespace meridian
