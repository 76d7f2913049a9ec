#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>

#include <bit>
#include <charconv>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace meridian::topology {

// IPv4 address held in host byte order so that masking and ordering are plain integer ops
struct Ipv4Address {
    std::uint32_t _value;

    Ipv4Address() : _value(0) {}
    explicit Ipv4Address(std::uint32_t host_order) : _value(host_order) {}
    explicit Ipv4Address(in_addr addr) : _value(ntohl(addr.s_addr)) {}

    auto value() const -> std::uint32_t { return _value; }

    auto to_in_addr() const -> in_addr {
        in_addr addr{};
        addr.s_addr = htonl(_value);
        return addr;
    }

    auto to_string() const -> std::string {
        char buffer[INET_ADDRSTRLEN] = {};
        auto addr = to_in_addr();
        inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
        return buffer;
    }

    auto operator<=>(const Ipv4Address&) const = default;
};

inline auto parse_ipv4(std::string_view text) -> std::optional<Ipv4Address> {
    std::string buffer(text);
    in_addr addr{};
    if (inet_pton(AF_INET, buffer.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return Ipv4Address(addr);
}

inline auto prefix_to_mask(std::uint8_t prefix_length) -> Ipv4Address {
    if (prefix_length == 0) {
        return Ipv4Address(0u);
    }
    return Ipv4Address(~std::uint32_t{0} << (32 - prefix_length));
}

// Rejects non-contiguous masks such as 255.0.255.0
inline auto mask_to_prefix_length(Ipv4Address mask) -> std::optional<std::uint8_t> {
    auto ones = std::popcount(mask.value());
    if (prefix_to_mask(static_cast<std::uint8_t>(ones)) != mask) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(ones);
}

// Accepts dotted-quad ("255.255.255.252") or prefix ("/30", "30") notation
inline auto parse_subnet_mask(std::string_view text) -> std::optional<std::uint8_t> {
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.find('.') != std::string_view::npos) {
        auto mask = parse_ipv4(text);
        if (!mask) {
            return std::nullopt;
        }
        return mask_to_prefix_length(*mask);
    }

    if (text.front() == '/') {
        text.remove_prefix(1);
    }

    unsigned int prefix = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), prefix);
    if (ec != std::errc{} || ptr != text.data() + text.size() || prefix > 32) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(prefix);
}

// Network address + prefix length; identifies the broadcast domain of an interface
struct SubnetKey {
    Ipv4Address _network;
    std::uint8_t _prefix_length{0};

    static auto of(Ipv4Address address, std::uint8_t prefix_length) -> SubnetKey {
        SubnetKey key;
        key._network = Ipv4Address(address.value() & prefix_to_mask(prefix_length).value());
        key._prefix_length = prefix_length;
        return key;
    }

    auto network() const -> Ipv4Address { return _network; }
    auto prefix_length() const -> std::uint8_t { return _prefix_length; }
    auto mask() const -> Ipv4Address { return prefix_to_mask(_prefix_length); }

    auto contains(Ipv4Address address) const -> bool {
        return (address.value() & mask().value()) == _network.value();
    }

    auto to_string() const -> std::string {
        return _network.to_string() + "/" + std::to_string(_prefix_length);
    }

    auto operator<=>(const SubnetKey&) const = default;
};

// Inverse of SubnetKey::to_string; host bits must be zero
inline auto parse_subnet_key(std::string_view text) -> std::optional<SubnetKey> {
    auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    auto address = parse_ipv4(text.substr(0, slash));
    auto prefix = parse_subnet_mask(text.substr(slash));
    if (!address || !prefix) {
        return std::nullopt;
    }

    auto key = SubnetKey::of(*address, *prefix);
    if (key.network() != *address) {
        return std::nullopt;
    }
    return key;
}

} // namespace meridian::topology
