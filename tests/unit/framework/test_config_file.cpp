#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "catch.hpp"

#include "config/ipnet_config_file.hpp"

using namespace ipnet::config::file;

namespace {

/* Scratch YAML file that is removed when the test is done with it */
class temp_config
{
    std::filesystem::path m_path;

public:
    temp_config(const std::string& tag, const std::string& contents)
        : m_path(std::filesystem::temp_directory_path()
                 / ("ipnet_test_" + tag + "_" + std::to_string(getpid())
                    + ".yaml"))
    {
        std::ofstream out(m_path);
        out << contents;
    }

    ~temp_config()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string name() const { return (m_path.string()); }
};

} // namespace

TEST_CASE("check configuration file loading", "[config file]")
{
    SECTION("valid file")
    {
        temp_config file("valid",
                         "core:\n"
                         "  log:\n"
                         "    level: debug\n"
                         "util:\n"
                         "  network: 10.0.0.0/8\n"
                         "  prefix: 12\n"
                         "  limit: 4\n");

        auto result = ipnet_config_file_load(file.name());
        REQUIRE(result);
        REQUIRE(result->IsMap());
        REQUIRE(ipnet_config_get_file_name() == file.name());

        SECTION("parameters by path")
        {
            auto network = ipnet_config_get_param<std::string>("util.network");
            REQUIRE(network);
            REQUIRE(*network == "10.0.0.0/8");

            auto prefix = ipnet_config_get_param<int>("util.prefix");
            REQUIRE(prefix);
            REQUIRE(*prefix == 12);

            auto level = ipnet_config_get_param<std::string>("core.log.level");
            REQUIRE(level);
            REQUIRE(*level == "debug");

            auto util = ipnet_config_get_param("util");
            REQUIRE(util);
            REQUIRE(util->IsMap());
        }

        SECTION("missing parameters")
        {
            REQUIRE_FALSE(ipnet_config_get_param("util.mode"));
            REQUIRE_FALSE(ipnet_config_get_param("core.log.level.deeper"));
            REQUIRE_FALSE(ipnet_config_get_param<std::string>("nope"));
        }

        SECTION("bad conversions throw")
        {
            REQUIRE_THROWS_AS(ipnet_config_get_param<int>("util.network"),
                              YAML::BadConversion);
        }
    }

    SECTION("unknown top level nodes are not fatal")
    {
        temp_config file("unknown",
                         "util:\n"
                         "  mode: hosts\n"
                         "utils:\n"
                         "  mode: subnets\n");

        REQUIRE(ipnet_config_file_load(file.name()));
        auto mode = ipnet_config_get_param<std::string>("util.mode");
        REQUIRE(mode);
        REQUIRE(*mode == "hosts");
    }

    SECTION("missing file")
    {
        auto result = ipnet_config_file_load("/nonexistent/ipnet.yaml");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().find("/nonexistent/ipnet.yaml")
                != std::string::npos);
    }

    SECTION("invalid yaml")
    {
        temp_config file("invalid", "util: [10.0.0.0/8\n");
        auto result = ipnet_config_file_load(file.name());
        REQUIRE_FALSE(result);
        REQUIRE(result.error().find("Error parsing") != std::string::npos);
    }

    SECTION("file is not a map")
    {
        temp_config file("sequence", "- 10.0.0.0/8\n- 2001:db8::/32\n");
        auto result = ipnet_config_file_load(file.name());
        REQUIRE_FALSE(result);
        REQUIRE(result.error().find("does not contain a map")
                != std::string::npos);
    }
}

TEST_CASE("check configuration file command line handling", "[config file]")
{
    SECTION("no config option is not an error")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-n"),
                                   const_cast<char*>("10.0.0.0/8"), nullptr};
        REQUIRE(ipnet_config_file_find(args.size() - 1, args.data()) == 0);
    }

    SECTION("short option loads the file")
    {
        temp_config file("cli", "util:\n  limit: 7\n");
        auto name = file.name();
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-c"),
                                   name.data(), nullptr};
        REQUIRE(ipnet_config_file_find(args.size() - 1, args.data()) == 0);

        auto limit = ipnet_config_get_param<unsigned>("util.limit");
        REQUIRE(limit);
        REQUIRE(*limit == 7);
    }

    SECTION("missing file is an error")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("--config"),
                                   const_cast<char*>("/nonexistent/ipnet.yaml"),
                                   nullptr};
        REQUIRE(ipnet_config_file_find(args.size() - 1, args.data()) == EINVAL);
    }
}
