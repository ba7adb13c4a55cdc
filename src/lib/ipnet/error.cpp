#include "ipnet/error.hpp"

namespace libipnet {

std::string_view to_string(error e)
{
    switch (e) {
    case error::INVALID_NETWORK:
        return ("invalid network");
    case error::CIDR_MISMATCH:
        return ("cidr mismatch");
    case error::NETWORK_PARSE_ERROR:
        return ("network parse error");
    default:
        return ("unknown error");
    }
}

} // namespace libipnet
