#ifndef _LIB_IPNET_IPV6_NETWORK_HPP_
#define _LIB_IPNET_IPV6_NETWORK_HPP_

#include <ostream>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

#include "ipnet/error.hpp"
#include "ipnet/host_iterator.hpp"
#include "ipnet/ipv6_address.hpp"
#include "ipnet/subnet_iterator.hpp"
#include "ipnet/width.hpp"

namespace libipnet {

/**
 * Immutable IPv6 Network
 *
 * The first address is always aligned to the size of the block, so
 * instances can only be created through the validating factories.
 */

class ipv6_network
{
    ipv6_address m_addr;
    uint8_t m_prefix;

    ipv6_network(const ipv6_address&, uint8_t) noexcept;

public:
    using address_type = ipv6_address;
    using value_type = width_traits<128>::value_type;
    using count_type = width_traits<128>::count_type;

    constexpr static uint8_t max_prefix_length = 128;

    static tl::expected<ipv6_network, error> make(const ipv6_address&,
                                                  uint8_t prefix);
    static tl::expected<ipv6_network, error> make(value_type, uint8_t prefix);

    /**
     * Parse `address/prefix-length` notation.
     *
     * Malformed text is a NETWORK_PARSE_ERROR; well formed text describing
     * a misaligned network is an INVALID_NETWORK.
     */
    static tl::expected<ipv6_network, error> parse(std::string_view);

    ipv6_address first() const;
    ipv6_address last() const;
    ipv6_address netmask() const;
    uint8_t prefix_length() const;
    count_type hostcount() const;

    /**
     * Check whether an address lies strictly inside the network; the
     * first and last addresses of the block are not contained.
     */
    bool contains(const ipv6_address&) const;

    /* True when this network's range encloses the other's range */
    bool is_subnet(const ipv6_network&) const;

    /* True when this network's range is enclosed by the other's range */
    bool is_supernet(const ipv6_network&) const;

    subnet_iterator<ipv6_network> into_subnets(uint8_t prefix) const;
    host_iterator<ipv6_network> into_hosts() const;
};

using ipv6_subnet_iterator = subnet_iterator<ipv6_network>;
using ipv6_host_iterator = host_iterator<ipv6_network>;

std::string to_string(const ipv6_network&);

inline std::ostream& operator<<(std::ostream& os, const ipv6_network& network)
{
    os << to_string(network);
    return (os);
}

int compare(const ipv6_network&, const ipv6_network&);

inline bool operator==(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) == 0;
}

inline bool operator!=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) != 0;
}

inline bool operator<(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) < 0;
}

inline bool operator>(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) > 0;
}

inline bool operator<=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) <= 0;
}

inline bool operator>=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) >= 0;
}

} // namespace libipnet

#endif /* _LIB_IPNET_IPV6_NETWORK_HPP_ */
