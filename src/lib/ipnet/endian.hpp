#ifndef _LIB_IPNET_ENDIAN_HPP_
#define _LIB_IPNET_ENDIAN_HPP_

#include <array>
#include <climits>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace libipnet::endian {

static_assert(CHAR_BIT == 8, "char is wrong size!");

/*
 * Fields store data in big-endian (network) order.  Load/store operations
 * always convert to/from the native integer value, so lexicographic octet
 * comparison matches numeric comparison.
 */
template <size_t Octets> struct field
{
    static constexpr size_t width = Octets;
    using container = std::array<uint8_t, width>;

    container octets = {};

    using value_type = typename container::value_type;
    using size_type = typename container::size_type;
    using reference = typename container::reference;
    using const_reference = typename container::const_reference;
    using pointer = typename container::pointer;
    using const_pointer = typename container::const_pointer;

    void store(const std::initializer_list<value_type>& value)
    {
        if (value.size() != Octets) {
            throw std::runtime_error(std::to_string(Octets)
                                     + " items required");
        }

        auto idx = 0U;
        for (auto octet : value) { octets[idx++] = octet; }
    }

    template <typename T>
    constexpr std::enable_if_t<Octets <= sizeof(T), void>
    store(T value) noexcept
    {
        for (auto idx = Octets; idx > 0; idx--) {
            octets[idx - 1] = static_cast<value_type>(value & 0xff);
            value >>= CHAR_BIT;
        }
    }

    template <typename T>
    constexpr std::enable_if_t<Octets <= sizeof(T), T> load() const noexcept
    {
        auto value = T{0};
        for (auto octet : octets) {
            value = static_cast<T>(value << CHAR_BIT) | octet;
        }
        return (value);
    }

    constexpr pointer data() noexcept { return (octets.data()); }

    constexpr const_pointer data() const noexcept { return (octets.data()); }

    constexpr size_type size() const noexcept { return (octets.size()); }

    const_reference at(size_type idx) const
    {
        if (!(idx < size())) {
            throw std::out_of_range(std::to_string(idx)
                                    + " is larger than field size "
                                    + std::to_string(size()));
        }
        return (octets[idx]);
    }

    reference at(size_type idx)
    {
        return (const_cast<reference>(
            const_cast<const endian::field<Octets>&>(*this).at(idx)));
    }

    constexpr reference operator[](size_type idx) noexcept
    {
        return (octets[idx]);
    }

    constexpr const_reference operator[](size_type idx) const noexcept
    {
        return (octets[idx]);
    }
};

/***
 * Comparison functions
 ***/

template <size_t Octets>
inline bool operator==(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets == rhs.octets);
}

template <size_t Octets>
inline bool operator!=(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets != rhs.octets);
}

template <size_t Octets>
inline bool operator<(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets < rhs.octets);
}

template <size_t Octets>
inline bool operator<=(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets <= rhs.octets);
}

template <size_t Octets>
inline bool operator>(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets > rhs.octets);
}

template <size_t Octets>
inline bool operator>=(const field<Octets>& lhs, const field<Octets>& rhs)
{
    return (lhs.octets >= rhs.octets);
}

} // namespace libipnet::endian

#endif /* _LIB_IPNET_ENDIAN_HPP_ */
