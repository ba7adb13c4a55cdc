#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <numeric>
#include <vector>

#include <unistd.h>

#include "core/ipnet_log.h"
#include "config/ipnet_config_file.hpp"

namespace ipnet::config::file {

using path_iterator = std::vector<std::string>::const_iterator;

static std::string config_file_name;
static std::optional<YAML::Node> config_root;
constexpr static std::string_view path_delimiter(".");

/* Top level nodes we know what to do with */
constexpr static std::array<std::string_view, 2> top_level_nodes = {"core",
                                                                   "util"};

std::string_view ipnet_config_get_file_name() { return (config_file_name); }

static std::vector<std::string> split_string(std::string_view input,
                                             std::string_view delimiters)
{
    std::vector<std::string> output;
    size_t beg = 0, pos = 0;
    while ((beg = input.find_first_not_of(delimiters, pos))
           != std::string::npos) {
        pos = input.find_first_of(delimiters, beg + 1);

        output.emplace_back(input.substr(beg, pos - beg));
    }
    return (output);
}

static std::optional<YAML::Node> get_param_by_path(
    const YAML::Node& parent_node, path_iterator pos, const path_iterator end)
{
    if (pos == end) { return (parent_node); }

    if (parent_node.IsMap() && parent_node[*pos]) {
        const YAML::Node child_node = parent_node[*pos];
        return (get_param_by_path(child_node, ++pos, end));
    }

    return (std::nullopt);
}

tl::expected<YAML::Node, std::string>
ipnet_config_file_load(std::string_view file_name)
{
    auto name = std::string(file_name);

    // Make sure the file exists and is readable.
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config "
                                      "file: "
                                    + name));
    }

    // yaml-cpp throws exceptions when the parser runs into invalid YAML.
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Error parsing configuration file: "
                                    + std::string(e.what())));
    }

    if (!root_node.IsNull() && !root_node.IsMap()) {
        return (tl::make_unexpected("Configuration file " + name
                                    + " does not contain a map"));
    }

    // Unrecognized nodes are not fatal, but the user probably made a typo.
    std::vector<std::string> unknown_nodes;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (std::find(std::begin(top_level_nodes), std::end(top_level_nodes),
                      key)
            == std::end(top_level_nodes)) {
            unknown_nodes.push_back(std::move(key));
        }
    }

    if (!unknown_nodes.empty()) {
        IPNET_LOG(
            IPNET_LOG_WARNING,
            "Ignoring %zu unrecognized top-level node%s in %s: %s\n",
            unknown_nodes.size(),
            unknown_nodes.size() == 1 ? "" : "s",
            name.c_str(),
            std::accumulate(
                std::begin(unknown_nodes),
                std::end(unknown_nodes),
                std::string(),
                [&](const std::string& a, const std::string& b) -> std::string {
                    return (a + (a.length() > 0 ? ", " : "") + b);
                })
                .c_str());
    }

    IPNET_LOG(IPNET_LOG_DEBUG, "Reading from configuration file %s\n",
              name.c_str());

    config_file_name = std::move(name);
    config_root.reset();
    config_root.emplace(root_node);

    return (root_node);
}

std::optional<YAML::Node> ipnet_config_get_param(std::string_view path)
{
    if (!config_root) { return (std::nullopt); }

    auto path_components = split_string(path, path_delimiter);

    return (get_param_by_path(
        *config_root, path_components.begin(), path_components.end()));
}

static const char* find_config_file_option(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--config") == 0
            || strcmp(argv[idx], "-c") == 0) {
            return (argv[idx + 1]);
        }
    }

    return (nullptr);
}

} // namespace ipnet::config::file

extern "C" {
int ipnet_config_file_find(int argc, char* const argv[])
{
    using namespace ipnet::config::file;

    auto file_name = find_config_file_option(argc, argv);
    if (!file_name) { return (0); }

    auto result = ipnet_config_file_load(file_name);
    if (!result) {
        std::cerr << result.error() << std::endl;
        return (EINVAL);
    }

    return (0);
}
}
