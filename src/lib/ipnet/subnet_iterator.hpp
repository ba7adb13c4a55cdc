#ifndef _LIB_IPNET_SUBNET_ITERATOR_HPP_
#define _LIB_IPNET_SUBNET_ITERATOR_HPP_

#include <cstdint>
#include <optional>

#include "ipnet/input_iterator.hpp"
#include "ipnet/width.hpp"

namespace libipnet {

/**
 * Lazily produces networks with a fixed prefix length, walking upward
 * from the parent network's first address.
 *
 * Each step adds the child block size before producing a network, so the
 * child that starts at the parent's first address is never produced and
 * the sequence ends once the cursor reaches the parent's last address.
 * For 1.1.1.0/24 split into /25 this yields 1.1.1.128/25 and 1.1.2.0/25.
 *
 * The sequence is empty when the requested prefix is shorter than the
 * parent's prefix, or is not a valid prefix for the address family.  It
 * ends early, instead of wrapping, when a step would leave the address
 * space, or when a child network fails validation.
 *
 * Iterators are single pass; advancing one is not thread safe.
 */
template <typename Network> class subnet_iterator
{
public:
    using value_type = typename Network::value_type;
    using iterator = detail::input_iterator<subnet_iterator, Network>;

    static constexpr unsigned width = Network::max_prefix_length;

    subnet_iterator(const Network& parent, uint8_t prefix) noexcept
        : m_current(parent.first().template load<value_type>())
        , m_max(parent.last().template load<value_type>())
        , m_stepping(0)
        , m_prefix(prefix)
        , m_done(prefix == 0 || prefix > width
                 || prefix < parent.prefix_length())
    {
        if (!m_done) { m_stepping = cidr_to_hostmask<width>(prefix) + 1; }
    }

    std::optional<Network> next()
    {
        if (m_done || !(m_current < m_max)) { return (std::nullopt); }

        if (m_current > static_cast<value_type>(max_value - m_stepping)) {
            m_done = true;
            return (std::nullopt);
        }

        m_current += m_stepping;
        auto network = Network::make(m_current, m_prefix);
        if (!network) {
            m_done = true;
            return (std::nullopt);
        }

        return (*network);
    }

    iterator begin() { return (iterator(*this)); }
    iterator end() { return (iterator()); }

    uint8_t prefix_length() const { return (m_prefix); }
    value_type stepping() const { return (m_stepping); }

private:
    static constexpr value_type max_value =
        static_cast<value_type>(~value_type{0});

    value_type m_current; /**< first address of the last network produced */
    value_type m_max;     /**< last address of the parent network */
    value_type m_stepping;
    uint8_t m_prefix;
    bool m_done;
};

} // namespace libipnet

#endif /* _LIB_IPNET_SUBNET_ITERATOR_HPP_ */
