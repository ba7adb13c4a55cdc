#ifndef _LIB_IPNET_IP_NETWORK_HPP_
#define _LIB_IPNET_IP_NETWORK_HPP_

#include <string>
#include <string_view>
#include <variant>

#include "tl/expected.hpp"

#include "ipnet/error.hpp"
#include "ipnet/ipv4_network.hpp"
#include "ipnet/ipv6_network.hpp"

namespace libipnet {

/*
 * Family agnostic network and address values.  The standard variant
 * comparison operators apply: IPv4 values always sort before IPv6 values.
 */
using ip_network = std::variant<ipv4_network, ipv6_network>;
using ip_address = std::variant<ipv4_address, ipv6_address>;

/**
 * Parse an IPv4 or IPv6 network; the family is chosen by the address
 * text.
 */
tl::expected<ip_network, error> parse_ip_network(std::string_view);

bool is_ipv4(const ip_network&);
bool is_ipv6(const ip_network&);

ip_address first(const ip_network&);
ip_address last(const ip_network&);
ip_address netmask(const ip_network&);
uint8_t prefix_length(const ip_network&);

/* IPv6 /0 saturates; see cidr_to_hostcount */
detail::uint128_t hostcount(const ip_network&);

/*
 * Relationship tests across the variant.  Operands from different families
 * yield CIDR_MISMATCH.
 */
tl::expected<bool, error> contains(const ip_network&, const ip_address&);
tl::expected<bool, error> is_subnet(const ip_network&, const ip_network&);
tl::expected<bool, error> is_supernet(const ip_network&, const ip_network&);

std::string to_string(const ip_network&);
std::string to_string(const ip_address&);

} // namespace libipnet

#endif /* _LIB_IPNET_IP_NETWORK_HPP_ */
