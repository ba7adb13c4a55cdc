#ifndef _LIB_IPNET_IPV6_ADDRESS_HPP_
#define _LIB_IPNET_IPV6_ADDRESS_HPP_

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "ipnet/endian.hpp"
#include "ipnet/width.hpp"

namespace libipnet {

class ipv6_address final : public endian::field<16>
{
public:
    constexpr ipv6_address() noexcept
        : endian::field<16>()
    {}

    ipv6_address(const char*);
    ipv6_address(const std::string&);
    ipv6_address(std::initializer_list<uint8_t> data);
    ipv6_address(const uint8_t[16]) noexcept;
    ipv6_address(std::pair<uint64_t, uint64_t>) noexcept;
    ipv6_address(detail::uint128_t) noexcept;
};

/**
 * Non-throwing conversion from RFC 4291 text notation.
 */
std::optional<ipv6_address> parse_ipv6_address(std::string_view);

std::string to_string(const ipv6_address&);

inline std::ostream& operator<<(std::ostream& os, const ipv6_address& addr)
{
    os << to_string(addr);
    return (os);
}

} // namespace libipnet

#endif /* _LIB_IPNET_IPV6_ADDRESS_HPP_ */
