#ifndef _IPNET_CONFIG_FILE_HPP_
#define _IPNET_CONFIG_FILE_HPP_

#ifdef __cplusplus
#include <optional>
#include <string>
#include <string_view>
#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"
#endif /* ifdef __cplusplus */

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Find configuration file CLI argument and, if found, load it.
 * Function will load, parse, and run some sanity checks on the file.
 *
 * @param[in] argc
 *   number of cli arguments
 * @param[in] argv
 *   array of cli strings
 *
 * @return
 *  If no errors occur return 0, non-zero otherwise.
 *
 * @note users are allowed to not specify a configuration file.
 *   In this case the function returns 0.
 */
int ipnet_config_file_find(int argc, char* const argv[]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus
namespace ipnet::config::file {

/*
 * Get configuration file name.
 *
 * @return
 *  configuration file name as passed in on the command line; empty if
 *  no file has been loaded.
 */
std::string_view ipnet_config_get_file_name();

/*
 * Load and check a configuration file.  On success the file contents
 * become the source of all configuration parameters.
 *
 * @return
 *  the root node of the file, or a description of the failure.
 */
tl::expected<YAML::Node, std::string>
ipnet_config_file_load(std::string_view file_name);

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in]  period-delimited path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration parameters, if any.
 */
std::optional<YAML::Node> ipnet_config_get_param(std::string_view param);

/*
 * Get a specific configuration parameter.
 * @param[in]  period-delimited path to the requested parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.
 *
 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 */
template <typename T>
std::optional<T> ipnet_config_get_param(std::string_view param)
{
    auto res = ipnet_config_get_param(param);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    /* This can throw a YAML::BadConversion exception. */
    return (std::make_optional(node.as<T>()));
}

} // namespace ipnet::config::file

#endif /* ifdef __cplusplus */

#endif /* _IPNET_CONFIG_FILE_HPP_ */
