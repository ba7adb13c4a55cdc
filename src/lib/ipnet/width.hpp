#ifndef _LIB_IPNET_WIDTH_HPP_
#define _LIB_IPNET_WIDTH_HPP_

#include <cstdint>

namespace libipnet {

namespace detail {

/**
 * Using 128 bit types makes arithmetic operations on IPv6 networks
 * much easier to implement.
 */
using uint128_t = unsigned __int128;

} // namespace detail

/**
 * Integer types used for address arithmetic at a given address width.
 *
 * The count type must hold 2^Width.  That works for IPv4, but there is no
 * wider native type for IPv6, so IPv6 host counts saturate at 2^128 - 1.
 */
template <unsigned Width> struct width_traits;

template <> struct width_traits<32>
{
    using value_type = uint32_t;
    using count_type = uint64_t;
};

template <> struct width_traits<128>
{
    using value_type = detail::uint128_t;
    using count_type = detail::uint128_t;
};

/**
 * Retrieve the host mask, i.e. 2^(Width - cidr) - 1, for a prefix length.
 * This value is representable for every cidr in [0, Width].
 */
template <unsigned Width>
constexpr typename width_traits<Width>::value_type
cidr_to_hostmask(uint8_t cidr) noexcept
{
    using value_type = typename width_traits<Width>::value_type;

    if (cidr >= Width) { return (0); }
    if (cidr == 0) { return (static_cast<value_type>(~value_type{0})); }
    return (static_cast<value_type>((value_type{1} << (Width - cidr)) - 1));
}

/**
 * Retrieve the number of addresses in a block with the given prefix length.
 * Prefix lengths larger than Width are a caller error; they report a count
 * of 1.
 */
template <unsigned Width>
constexpr typename width_traits<Width>::count_type
cidr_to_hostcount(uint8_t cidr) noexcept
{
    using count_type = typename width_traits<Width>::count_type;

    auto mask = static_cast<count_type>(cidr_to_hostmask<Width>(cidr));
    return (mask == static_cast<count_type>(~count_type{0}) ? mask : mask + 1);
}

/**
 * A network is valid when its prefix length fits the address width and
 * its first address lies on a block boundary for its own size.
 */
template <unsigned Width>
constexpr bool is_valid(typename width_traits<Width>::value_type first,
                        uint8_t cidr) noexcept
{
    return (cidr <= Width && (first & cidr_to_hostmask<Width>(cidr)) == 0);
}

} // namespace libipnet

#endif /* _LIB_IPNET_WIDTH_HPP_ */
