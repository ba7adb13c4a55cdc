#ifndef _LIB_IPNET_CIDR_TEXT_HPP_
#define _LIB_IPNET_CIDR_TEXT_HPP_

#include <cstdint>
#include <optional>
#include <string_view>

namespace libipnet::detail {

/**
 * The two halves of an `address/prefix-length` string.  The address is
 * not validated; the prefix length is a decimal that fits into 8 bits.
 */
struct cidr_text
{
    std::string_view address;
    uint8_t prefix_length;
};

std::optional<cidr_text> split_cidr(std::string_view input);

} // namespace libipnet::detail

#endif /* _LIB_IPNET_CIDR_TEXT_HPP_ */
