#include <type_traits>

#include "ipnet/ip_network.hpp"

namespace libipnet {

tl::expected<ip_network, error> parse_ip_network(std::string_view input)
{
    auto to_ip_network = [](const auto& network) -> ip_network {
        return (network);
    };

    auto address = input.substr(0, input.find('/'));
    if (address.find(':') != std::string_view::npos) {
        return (ipv6_network::parse(input).map(to_ip_network));
    }

    return (ipv4_network::parse(input).map(to_ip_network));
}

bool is_ipv4(const ip_network& network)
{
    return (std::holds_alternative<ipv4_network>(network));
}

bool is_ipv6(const ip_network& network)
{
    return (std::holds_alternative<ipv6_network>(network));
}

ip_address first(const ip_network& network)
{
    return (std::visit(
        [](const auto& net) -> ip_address { return (net.first()); },
        network));
}

ip_address last(const ip_network& network)
{
    return (std::visit(
        [](const auto& net) -> ip_address { return (net.last()); }, network));
}

ip_address netmask(const ip_network& network)
{
    return (std::visit(
        [](const auto& net) -> ip_address { return (net.netmask()); },
        network));
}

uint8_t prefix_length(const ip_network& network)
{
    return (std::visit([](const auto& net) { return (net.prefix_length()); },
                       network));
}

detail::uint128_t hostcount(const ip_network& network)
{
    return (std::visit(
        [](const auto& net) {
            return (static_cast<detail::uint128_t>(net.hostcount()));
        },
        network));
}

/*
 * Invoke a relationship test on two variants holding the same family;
 * mixed families are a CIDR_MISMATCH.
 */
template <typename Lhs, typename Rhs, typename Test>
static tl::expected<bool, error>
same_family(const Lhs& lhs, const Rhs& rhs, Test&& test)
{
    return (std::visit(
        [&](const auto& left, const auto& right) -> tl::expected<bool, error> {
            using left_type = std::decay_t<decltype(left)>;
            using right_type = std::decay_t<decltype(right)>;
            if constexpr (std::is_same_v<left_type, right_type>
                          || std::is_same_v<typename left_type::address_type,
                                            right_type>) {
                return (test(left, right));
            } else {
                return (tl::make_unexpected(error::CIDR_MISMATCH));
            }
        },
        lhs,
        rhs));
}

tl::expected<bool, error> contains(const ip_network& network,
                                   const ip_address& addr)
{
    return (same_family(
        network, addr, [](const auto& net, const auto& address) {
            return (net.contains(address));
        }));
}

tl::expected<bool, error> is_subnet(const ip_network& lhs,
                                    const ip_network& rhs)
{
    return (same_family(lhs, rhs, [](const auto& left, const auto& right) {
        return (left.is_subnet(right));
    }));
}

tl::expected<bool, error> is_supernet(const ip_network& lhs,
                                      const ip_network& rhs)
{
    return (same_family(lhs, rhs, [](const auto& left, const auto& right) {
        return (left.is_supernet(right));
    }));
}

std::string to_string(const ip_network& network)
{
    return (std::visit([](const auto& net) { return (to_string(net)); },
                       network));
}

std::string to_string(const ip_address& addr)
{
    return (std::visit([](const auto& a) { return (to_string(a)); }, addr));
}

} // namespace libipnet
