#ifndef _LIB_IPNET_NET_TYPES_HPP_
#define _LIB_IPNET_NET_TYPES_HPP_

#include "ipnet/ip_network.hpp"
#include "ipnet/ipv4_address.hpp"
#include "ipnet/ipv4_network.hpp"
#include "ipnet/ipv6_address.hpp"
#include "ipnet/ipv6_network.hpp"

#endif /* _LIB_IPNET_NET_TYPES_HPP_ */
