#ifndef _LIB_IPNET_HOST_ITERATOR_HPP_
#define _LIB_IPNET_HOST_ITERATOR_HPP_

#include <optional>

#include "ipnet/input_iterator.hpp"

namespace libipnet {

/**
 * Lazily produces the host addresses of a network in ascending order.
 *
 * Host addresses are exactly the addresses the network `contains()`: the
 * first and last addresses of the block are excluded.  Networks with fewer
 * than three addresses therefore have no hosts.
 */
template <typename Network> class host_iterator
{
public:
    using address_type = typename Network::address_type;
    using value_type = typename Network::value_type;
    using iterator = detail::input_iterator<host_iterator, address_type>;

    explicit host_iterator(const Network& network) noexcept
        : m_current(network.first().template load<value_type>())
        , m_max(network.last().template load<value_type>())
    {}

    std::optional<address_type> next()
    {
        if (m_max - m_current < 2) { return (std::nullopt); }

        ++m_current;
        return (address_type(m_current));
    }

    iterator begin() { return (iterator(*this)); }
    iterator end() { return (iterator()); }

private:
    value_type m_current; /**< last address produced */
    value_type m_max;     /**< last address of the network */
};

} // namespace libipnet

#endif /* _LIB_IPNET_HOST_ITERATOR_HPP_ */
