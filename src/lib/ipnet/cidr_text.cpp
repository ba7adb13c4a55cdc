#include <algorithm>
#include <charconv>

#include "ipnet/cidr_text.hpp"

namespace libipnet::detail {

static std::optional<uint8_t> parse_prefix_length(std::string_view input)
{
    auto value = uint8_t{0};
    const auto end = input.data() + input.size();
    auto [ptr, ec] = std::from_chars(input.data(), end, value);
    if (ec != std::errc{} || ptr != end) { return (std::nullopt); }

    return (value);
}

std::optional<cidr_text> split_cidr(std::string_view input)
{
    if (std::count(std::begin(input), std::end(input), '/') != 1) {
        return (std::nullopt);
    }

    auto slash = input.find('/');
    auto prefix = parse_prefix_length(input.substr(slash + 1));
    if (!prefix) { return (std::nullopt); }

    return (cidr_text{input.substr(0, slash), *prefix});
}

} // namespace libipnet::detail
