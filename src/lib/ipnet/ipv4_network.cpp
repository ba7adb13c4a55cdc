#include "ipnet/cidr_text.hpp"
#include "ipnet/ipv4_network.hpp"

namespace libipnet {

static constexpr auto max_value = ~uint32_t{0};

static uint32_t hostmask(uint8_t prefix)
{
    return (cidr_to_hostmask<ipv4_network::max_prefix_length>(prefix));
}

ipv4_network::ipv4_network(const ipv4_address& addr, uint8_t prefix) noexcept
    : m_addr(addr)
    , m_prefix(prefix)
{}

tl::expected<ipv4_network, error> ipv4_network::make(const ipv4_address& addr,
                                                     uint8_t prefix)
{
    if (!is_valid<max_prefix_length>(addr.load<uint32_t>(), prefix)) {
        return (tl::make_unexpected(error::INVALID_NETWORK));
    }

    return (ipv4_network(addr, prefix));
}

tl::expected<ipv4_network, error> ipv4_network::make(value_type addr,
                                                     uint8_t prefix)
{
    return (make(ipv4_address(addr), prefix));
}

tl::expected<ipv4_network, error> ipv4_network::make(
    uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t prefix)
{
    return (make(ipv4_address{a, b, c, d}, prefix));
}

tl::expected<ipv4_network, error> ipv4_network::parse(std::string_view input)
{
    auto text = detail::split_cidr(input);
    if (!text) { return (tl::make_unexpected(error::NETWORK_PARSE_ERROR)); }

    auto addr = parse_ipv4_address(text->address);
    if (!addr) { return (tl::make_unexpected(error::NETWORK_PARSE_ERROR)); }

    return (make(*addr, text->prefix_length));
}

ipv4_address ipv4_network::first() const { return (m_addr); }

ipv4_address ipv4_network::last() const
{
    return (ipv4_address(m_addr.load<uint32_t>() | hostmask(m_prefix)));
}

ipv4_address ipv4_network::netmask() const
{
    return (ipv4_address(max_value ^ hostmask(m_prefix)));
}

uint8_t ipv4_network::prefix_length() const { return (m_prefix); }

ipv4_network::count_type ipv4_network::hostcount() const
{
    return (cidr_to_hostcount<max_prefix_length>(m_prefix));
}

bool ipv4_network::contains(const ipv4_address& addr) const
{
    return (first() < addr && addr < last());
}

bool ipv4_network::is_subnet(const ipv4_network& other) const
{
    return (first() <= other.first() && other.last() <= last());
}

bool ipv4_network::is_supernet(const ipv4_network& other) const
{
    return (first() >= other.first() && other.last() >= last());
}

subnet_iterator<ipv4_network> ipv4_network::into_subnets(uint8_t prefix) const
{
    return (subnet_iterator<ipv4_network>(*this, prefix));
}

host_iterator<ipv4_network> ipv4_network::into_hosts() const
{
    return (host_iterator<ipv4_network>(*this));
}

std::string to_string(const ipv4_network& network)
{
    return (to_string(network.first()) + "/"
            + std::to_string(network.prefix_length()));
}

int compare(const ipv4_network& lhs, const ipv4_network& rhs)
{
    if      (lhs.first()         < rhs.first()        ) return (-1);
    else if (lhs.first()         > rhs.first()        ) return (1);
    else if (lhs.prefix_length() < rhs.prefix_length()) return (-1);
    else if (lhs.prefix_length() > rhs.prefix_length()) return (1);
    else return (0);
}

} // namespace libipnet
