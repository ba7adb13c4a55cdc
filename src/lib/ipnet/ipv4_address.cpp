#include <algorithm>
#include <stdexcept>

#include <arpa/inet.h>

#include "ipnet/ipv4_address.hpp"

namespace libipnet {

static bool set_octets_from_string(ipv4_address& ipv4, const std::string& input)
{
    return (inet_pton(AF_INET, input.c_str(), ipv4.octets.data()) == 1);
}

ipv4_address::ipv4_address(const char* input)
    : ipv4_address(std::string(input))
{}

ipv4_address::ipv4_address(const std::string& input)
{
    if (!set_octets_from_string(*this, input)) {
        throw std::runtime_error("Invalid IPv4 address: " + input);
    }
}

ipv4_address::ipv4_address(std::initializer_list<uint8_t> data)
{
    store(data);
}

ipv4_address::ipv4_address(const uint8_t data[4]) noexcept
{
    std::copy_n(data, width, octets.data());
}

ipv4_address::ipv4_address(uint32_t addr) noexcept { store(addr); }

std::optional<ipv4_address> parse_ipv4_address(std::string_view input)
{
    auto addr = ipv4_address{};
    if (!set_octets_from_string(addr, std::string(input))) {
        return (std::nullopt);
    }
    return (addr);
}

std::string to_string(const ipv4_address& addr)
{
    auto buffer = std::array<char, INET_ADDRSTRLEN>{};
    const char* p = inet_ntop(AF_INET,
                              reinterpret_cast<const void*>(addr.data()),
                              buffer.data(),
                              buffer.size());
    return (std::string(p));
}

} // namespace libipnet
