#ifndef _IPNET_UTILS_OVERLOADED_VISITOR_H_
#define _IPNET_UTILS_OVERLOADED_VISITOR_H_

namespace ipnet::utils {

/**
 * Combine a set of callables into a single visitor object for std::visit;
 * overload resolution picks the callable for each variant alternative.
 */
template <typename... Ts> struct overloaded_visitor : Ts...
{
    overloaded_visitor(const Ts&... args)
        : Ts(args)...
    {}

    using Ts::operator()...;
};

} // namespace ipnet::utils

#endif /* _IPNET_UTILS_OVERLOADED_VISITOR_H_ */
