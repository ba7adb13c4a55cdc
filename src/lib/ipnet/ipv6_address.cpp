#include <algorithm>
#include <stdexcept>

#include <arpa/inet.h>

#include "ipnet/ipv6_address.hpp"

namespace libipnet {

static bool set_octets_from_string(ipv6_address& ipv6, const std::string& input)
{
    return (inet_pton(AF_INET6, input.c_str(), ipv6.octets.data()) == 1);
}

ipv6_address::ipv6_address(const char* input)
    : ipv6_address(std::string(input))
{}

ipv6_address::ipv6_address(const std::string& input)
{
    if (!set_octets_from_string(*this, input)) {
        throw std::runtime_error("Invalid IPv6 address: " + input);
    }
}

ipv6_address::ipv6_address(std::initializer_list<uint8_t> data)
{
    store(data);
}

ipv6_address::ipv6_address(const uint8_t data[16]) noexcept
{
    std::copy_n(data, width, octets.data());
}

ipv6_address::ipv6_address(std::pair<uint64_t, uint64_t> value) noexcept
{
    store(static_cast<detail::uint128_t>(value.first) << 64 | value.second);
}

ipv6_address::ipv6_address(detail::uint128_t value) noexcept { store(value); }

std::optional<ipv6_address> parse_ipv6_address(std::string_view input)
{
    auto addr = ipv6_address{};
    if (!set_octets_from_string(addr, std::string(input))) {
        return (std::nullopt);
    }
    return (addr);
}

std::string to_string(const ipv6_address& addr)
{
    auto buffer = std::array<char, INET6_ADDRSTRLEN>{};
    const char* p = inet_ntop(AF_INET6,
                              reinterpret_cast<const void*>(addr.data()),
                              buffer.data(),
                              buffer.size());
    return (std::string(p));
}

} // namespace libipnet
