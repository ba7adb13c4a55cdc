#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <getopt.h>

#include "config/ipnet_config_file.hpp"
#include "core/ipnet_log.h"
#include "ipnet/net_types.hpp"
#include "utils/overloaded_visitor.h"

using namespace libipnet;

/**
 * Global parameters
 */

static std::string network_arg;       // Network to operate on.
static std::string other_arg;         // Second network for comparisons.
static std::optional<uint8_t> prefix; // Prefix length of generated subnets.
static uint64_t limit = 16;           // Maximum items to print; 0 for all.
static bool log_level_from_cli = false;

static enum class util_mode { INFO = 0, SUBNETS, HOSTS, COMPARE } mode;

static const std::unordered_map<std::string_view, util_mode> mode_names{
    {"info", util_mode::INFO},
    {"subnets", util_mode::SUBNETS},
    {"hosts", util_mode::HOSTS},
    {"compare", util_mode::COMPARE}};

/**
 * Command-line argument handling.
 */

struct cli_option
{
    struct option opt;
    std::string_view description;
};

static struct cli_option cli_options[] = {
    {{"mode", required_argument, 0, 'm'},
     "program operation mode (info, subnets, hosts or compare)"},
    {{"network", required_argument, 0, 'n'}, "network in CIDR notation"},
    {{"other", required_argument, 0, 'o'},
     "second network in CIDR notation, for compare mode"},
    {{"prefix", required_argument, 0, 'p'},
     "prefix length of the subnets to list, for subnets mode"},
    {{"limit", required_argument, 0, 'l'},
     "maximum number of subnets or hosts to list (0 for no limit)"},
    {{"config", required_argument, 0, 'c'}, "YAML configuration file"},
    {{"log-level", required_argument, 0, 'L'},
     "log level (critical, error, warning, info, debug, trace or 1-6)"},
    {{"help", no_argument, 0, 'h'}, "display this help text"},
    {{0, 0, 0, 0}, ""}};

static void print_usage()
{
    std::cout << std::endl
              << "Utility to inspect IPv4 and IPv6 networks." << std::endl
              << "It has four modes of operation:" << std::endl
              << "    1. info: show the derived properties of a network."
              << std::endl
              << "    2. subnets: list the subnets of a network." << std::endl
              << "    3. hosts: list the host addresses of a network."
              << std::endl
              << "    4. compare: show how two networks relate." << std::endl;

    std::cout << std::endl;

    static constexpr size_t space_fudge = 3;
    size_t max_len = 0;
    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;

        max_len = std::max(max_len, strlen(opt.opt.name));
    }

    std::cout << "Usage Info: " << std::endl;

    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;
        std::cout << "  "
                  << "-" << static_cast<unsigned char>(opt.opt.val) << ",  "
                  << "--" << std::left << std::setw(max_len + space_fudge)
                  << opt.opt.name << " " << opt.description << std::endl;
    }
}

static void set_mode(std::string_view mode_arg)
{
    auto mode_val = mode_names.find(mode_arg);

    if (mode_val == mode_names.end()) {
        IPNET_LOG(IPNET_LOG_CRITICAL,
                  "Invalid mode %.*s. Valid modes include: info, subnets, "
                  "hosts, compare\n",
                  static_cast<int>(mode_arg.size()),
                  mode_arg.data());
        exit(EXIT_FAILURE);
    }

    mode = mode_val->second;
}

static uint64_t parse_number(const char* name, const char* arg, uint64_t max)
{
    char* end = nullptr;
    errno = 0;
    auto value = strtoull(arg, &end, 10);
    if (errno != 0 || end == arg || *end != '\0' || value > max) {
        IPNET_LOG(IPNET_LOG_CRITICAL,
                  "Invalid %s value %s; must be between 0 and %" PRIu64 "\n",
                  name,
                  arg,
                  max);
        exit(EXIT_FAILURE);
    }

    return (value);
}

static std::string make_shortopts()
{
    std::string to_return;

    for (auto& opt : cli_options) {
        if (opt.opt.name != 0) {
            to_return.push_back(static_cast<char>(opt.opt.val));
            if (opt.opt.has_arg != no_argument) { to_return.append(":"); }
        }
    }

    return (to_return);
}

/*
 * Pick up defaults from the configuration file, if any.  Command line
 * arguments are parsed afterwards and take precedence.
 */
static void load_config_defaults()
{
    using namespace ipnet::config::file;

    try {
        if (auto level = ipnet_config_get_param<std::string>("core.log.level");
            level && !log_level_from_cli) {
            auto value = parse_log_optarg(level->c_str());
            if (value == IPNET_LOG_NONE) {
                IPNET_LOG(IPNET_LOG_WARNING,
                          "Ignoring invalid log level %s in %s\n",
                          level->c_str(),
                          ipnet_config_get_file_name().data());
            } else {
                ipnet_log_level_set(value);
            }
        }

        if (auto value = ipnet_config_get_param<std::string>("util.mode")) {
            set_mode(*value);
        }
        if (auto value = ipnet_config_get_param<std::string>("util.network")) {
            network_arg = *value;
        }
        if (auto value = ipnet_config_get_param<std::string>("util.other")) {
            other_arg = *value;
        }
        if (auto value = ipnet_config_get_param<unsigned>("util.prefix")) {
            if (*value > ipv6_network::max_prefix_length) {
                IPNET_LOG(IPNET_LOG_CRITICAL,
                          "Invalid util.prefix value %u\n",
                          *value);
                exit(EXIT_FAILURE);
            }
            prefix = static_cast<uint8_t>(*value);
        }
        if (auto value = ipnet_config_get_param<uint64_t>("util.limit")) {
            limit = *value;
        }
    } catch (const YAML::Exception& e) {
        IPNET_LOG(IPNET_LOG_CRITICAL,
                  "Invalid value in configuration file %s: %s\n",
                  ipnet_config_get_file_name().data(),
                  e.what());
        exit(EXIT_FAILURE);
    }
}

static void parse_arguments(int argc, char* argv[])
{
    std::vector<struct option> options;
    for (auto& opt : cli_options) { options.push_back(opt.opt); }

    auto short_opts = make_shortopts();

    int opt_index = 0;
    int opt = 0;
    while ((opt = getopt_long(
                argc, argv, short_opts.c_str(), options.data(), &opt_index))
           != -1) {
        switch (opt) {
        case 'm':
            set_mode(optarg);
            break;
        case 'n':
            network_arg = optarg;
            break;
        case 'o':
            other_arg = optarg;
            break;
        case 'p':
            prefix = static_cast<uint8_t>(parse_number(
                "prefix", optarg, ipv6_network::max_prefix_length));
            break;
        case 'l':
            limit = parse_number("limit", optarg, UINT64_MAX);
            break;
        case 'c':
        case 'L':
            /* Handled before argument parsing */
            break;
        case 'h':
            print_usage();
            exit(EXIT_SUCCESS);
        default:
            print_usage();
            exit(EXIT_FAILURE);
        }
    }

    if (network_arg.empty()) {
        IPNET_LOG(IPNET_LOG_CRITICAL, "A network must be specified\n");
        exit(EXIT_FAILURE);
    }

    if (mode == util_mode::SUBNETS && !prefix) {
        IPNET_LOG(IPNET_LOG_CRITICAL, "Subnets mode requires a prefix\n");
        exit(EXIT_FAILURE);
    }

    if (mode == util_mode::COMPARE && other_arg.empty()) {
        IPNET_LOG(IPNET_LOG_CRITICAL,
                  "Compare mode requires a second network\n");
        exit(EXIT_FAILURE);
    }
}

static std::string to_decimal(detail::uint128_t value)
{
    if (value == 0) { return ("0"); }

    std::string digits;
    while (value) {
        digits.push_back(static_cast<char>('0' + value % 10));
        value /= 10;
    }
    std::reverse(std::begin(digits), std::end(digits));
    return (digits);
}

static ip_network network_or_die(std::string_view text)
{
    auto network = parse_ip_network(text);
    if (!network) {
        IPNET_LOG(IPNET_LOG_CRITICAL,
                  "Could not use network %.*s: %s\n",
                  static_cast<int>(text.size()),
                  text.data(),
                  std::string(to_string(network.error())).c_str());
        exit(EXIT_FAILURE);
    }

    return (*network);
}

template <typename Cursor> static void print_sequence(Cursor&& cursor)
{
    uint64_t count = 0;
    for (const auto& item : cursor) {
        if (limit && count == limit) {
            IPNET_LOG(IPNET_LOG_INFO,
                      "Output truncated after %" PRIu64 " items\n",
                      limit);
            break;
        }
        std::cout << item << std::endl;
        count++;
    }

    IPNET_LOG(IPNET_LOG_DEBUG, "Printed %" PRIu64 " items\n", count);
}

static void show_info(const ip_network& network)
{
    std::cout << "network:   " << to_string(network) << std::endl
              << "first:     " << to_string(first(network)) << std::endl
              << "last:      " << to_string(last(network)) << std::endl
              << "netmask:   " << to_string(netmask(network)) << std::endl
              << "prefix:    " << static_cast<unsigned>(prefix_length(network))
              << std::endl
              << "hostcount: " << to_decimal(hostcount(network));

    /* The IPv6 count saturates for /0 */
    if (is_ipv6(network) && prefix_length(network) == 0) {
        std::cout << " (saturated)";
    }
    std::cout << std::endl;
}

static void show_subnets(const ip_network& network)
{
    IPNET_LOG(IPNET_LOG_DEBUG,
              "Listing /%u subnets of %s\n",
              static_cast<unsigned>(*prefix),
              to_string(network).c_str());

    std::visit(ipnet::utils::overloaded_visitor(
                   [](const ipv4_network& net) {
                       print_sequence(net.into_subnets(*prefix));
                   },
                   [](const ipv6_network& net) {
                       print_sequence(net.into_subnets(*prefix));
                   }),
               network);
}

static void show_hosts(const ip_network& network)
{
    IPNET_LOG(IPNET_LOG_DEBUG,
              "Listing hosts of %s\n",
              to_string(network).c_str());

    std::visit(ipnet::utils::overloaded_visitor(
                   [](const ipv4_network& net) {
                       print_sequence(net.into_hosts());
                   },
                   [](const ipv6_network& net) {
                       print_sequence(net.into_hosts());
                   }),
               network);
}

static int show_comparison(const ip_network& lhs, const ip_network& rhs)
{
    auto subnet = is_subnet(lhs, rhs);
    auto supernet = is_supernet(lhs, rhs);
    if (!subnet || !supernet) {
        auto err = !subnet ? subnet.error() : supernet.error();
        IPNET_LOG(IPNET_LOG_ERROR,
                  "Cannot compare %s and %s: %s\n",
                  to_string(lhs).c_str(),
                  to_string(rhs).c_str(),
                  std::string(to_string(err)).c_str());
        return (EXIT_FAILURE);
    }

    auto order = lhs < rhs ? "<" : rhs < lhs ? ">" : "==";

    std::cout << std::boolalpha << "is_subnet:   " << *subnet << std::endl
              << "is_supernet: " << *supernet << std::endl
              << "order:       " << to_string(lhs) << " " << order << " "
              << to_string(rhs) << std::endl;

    return (EXIT_SUCCESS);
}

int main(int argc, char* argv[])
{
    if (auto level = ipnet_log_level_find(argc, argv);
        level != IPNET_LOG_NONE) {
        ipnet_log_level_set(level);
        log_level_from_cli = true;
    }

    if (ipnet_config_file_find(argc, argv) != 0) { exit(EXIT_FAILURE); }

    load_config_defaults();
    parse_arguments(argc, argv);

    auto network = network_or_die(network_arg);

    switch (mode) {
    case util_mode::INFO:
        show_info(network);
        break;
    case util_mode::SUBNETS:
        show_subnets(network);
        break;
    case util_mode::HOSTS:
        show_hosts(network);
        break;
    case util_mode::COMPARE:
        return (show_comparison(network, network_or_die(other_arg)));
    }

    return (EXIT_SUCCESS);
}
