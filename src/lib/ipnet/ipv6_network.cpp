#include "ipnet/cidr_text.hpp"
#include "ipnet/ipv6_network.hpp"

namespace libipnet {

using detail::uint128_t;

static constexpr auto max_value = static_cast<uint128_t>(~uint128_t{0});

static uint128_t hostmask(uint8_t prefix)
{
    return (cidr_to_hostmask<ipv6_network::max_prefix_length>(prefix));
}

ipv6_network::ipv6_network(const ipv6_address& addr, uint8_t prefix) noexcept
    : m_addr(addr)
    , m_prefix(prefix)
{}

tl::expected<ipv6_network, error> ipv6_network::make(const ipv6_address& addr,
                                                     uint8_t prefix)
{
    if (!is_valid<max_prefix_length>(addr.load<uint128_t>(), prefix)) {
        return (tl::make_unexpected(error::INVALID_NETWORK));
    }

    return (ipv6_network(addr, prefix));
}

tl::expected<ipv6_network, error> ipv6_network::make(value_type addr,
                                                     uint8_t prefix)
{
    return (make(ipv6_address(addr), prefix));
}

tl::expected<ipv6_network, error> ipv6_network::parse(std::string_view input)
{
    auto text = detail::split_cidr(input);
    if (!text) { return (tl::make_unexpected(error::NETWORK_PARSE_ERROR)); }

    auto addr = parse_ipv6_address(text->address);
    if (!addr) { return (tl::make_unexpected(error::NETWORK_PARSE_ERROR)); }

    return (make(*addr, text->prefix_length));
}

ipv6_address ipv6_network::first() const { return (m_addr); }

ipv6_address ipv6_network::last() const
{
    return (ipv6_address(m_addr.load<uint128_t>() | hostmask(m_prefix)));
}

ipv6_address ipv6_network::netmask() const
{
    return (ipv6_address(max_value ^ hostmask(m_prefix)));
}

uint8_t ipv6_network::prefix_length() const { return (m_prefix); }

ipv6_network::count_type ipv6_network::hostcount() const
{
    return (cidr_to_hostcount<max_prefix_length>(m_prefix));
}

bool ipv6_network::contains(const ipv6_address& addr) const
{
    return (first() < addr && addr < last());
}

bool ipv6_network::is_subnet(const ipv6_network& other) const
{
    return (first() <= other.first() && other.last() <= last());
}

bool ipv6_network::is_supernet(const ipv6_network& other) const
{
    return (first() >= other.first() && other.last() >= last());
}

subnet_iterator<ipv6_network> ipv6_network::into_subnets(uint8_t prefix) const
{
    return (subnet_iterator<ipv6_network>(*this, prefix));
}

host_iterator<ipv6_network> ipv6_network::into_hosts() const
{
    return (host_iterator<ipv6_network>(*this));
}

std::string to_string(const ipv6_network& network)
{
    return (to_string(network.first()) + "/"
            + std::to_string(network.prefix_length()));
}

int compare(const ipv6_network& lhs, const ipv6_network& rhs)
{
    if (lhs.first() < rhs.first()) {
        return (-1);
    } else if (lhs.first() > rhs.first()) {
        return (1);
    } else {
        if (lhs.prefix_length() < rhs.prefix_length()) {
            return (-1);
        } else if (lhs.prefix_length() > rhs.prefix_length()) {
            return (1);
        } else {
            return (0);
        }
    }
}

} // namespace libipnet
