#ifndef _LIB_IPNET_ERROR_HPP_
#define _LIB_IPNET_ERROR_HPP_

#include <ostream>
#include <string_view>

namespace libipnet {

enum class error {
    INVALID_NETWORK = 1, /**< address is not aligned to the prefix */
    CIDR_MISMATCH,       /**< operands belong to different families */
    NETWORK_PARSE_ERROR, /**< malformed textual input */
};

std::string_view to_string(error);

inline std::ostream& operator<<(std::ostream& os, error e)
{
    os << to_string(e);
    return (os);
}

} // namespace libipnet

#endif /* _LIB_IPNET_ERROR_HPP_ */
