#ifndef _LIB_IPNET_IPV4_ADDRESS_HPP_
#define _LIB_IPNET_IPV4_ADDRESS_HPP_

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "ipnet/endian.hpp"

namespace libipnet {

class ipv4_address final : public endian::field<4>
{
public:
    constexpr ipv4_address() noexcept
        : endian::field<4>()
    {}

    ipv4_address(const char*);
    ipv4_address(const std::string&);
    ipv4_address(std::initializer_list<uint8_t>);
    ipv4_address(const uint8_t[4]) noexcept;
    ipv4_address(uint32_t) noexcept;
};

/**
 * Non-throwing conversion from dotted quad notation.
 */
std::optional<ipv4_address> parse_ipv4_address(std::string_view);

std::string to_string(const ipv4_address&);

inline std::ostream& operator<<(std::ostream& os, const ipv4_address& addr)
{
    os << to_string(addr);
    return (os);
}

} // namespace libipnet

#endif /* _LIB_IPNET_IPV4_ADDRESS_HPP_ */
