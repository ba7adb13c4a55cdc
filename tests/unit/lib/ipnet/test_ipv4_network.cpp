#include <vector>

#include "catch.hpp"

#include "ipnet/ipv4_network.hpp"

using namespace libipnet;

TEST_CASE("ipv4_network functionality checks", "[ipv4_network]")
{
    SECTION("constructor functionality checks")
    {
        auto test = ipv4_network::make(1, 1, 1, 0, 25);
        REQUIRE(test);
        REQUIRE(test->first().load<uint32_t>() == 16843008);
        REQUIRE(test->prefix_length() == 25);

        auto from_int = ipv4_network::make(16777216, 8);
        REQUIRE(from_int);
        REQUIRE(from_int->first() == ipv4_address("1.0.0.0"));
        REQUIRE(from_int->prefix_length() == 8);

        auto from_addr = ipv4_network::make(ipv4_address("192.0.2.0"), 24);
        REQUIRE(from_addr);
        REQUIRE(from_addr->first() == ipv4_address{192, 0, 2, 0});
    }

    SECTION("misaligned networks are rejected")
    {
        auto test = ipv4_network::make(1, 1, 1, 0, 23);
        REQUIRE_FALSE(test);
        REQUIRE(test.error() == error::INVALID_NETWORK);

        REQUIRE(ipv4_network::make(ipv4_address("10.0.0.1"), 31).error()
                == error::INVALID_NETWORK);
        REQUIRE(ipv4_network::make(ipv4_address("10.0.0.0"), 33).error()
                == error::INVALID_NETWORK);
    }

    SECTION("aligned networks round trip")
    {
        for (uint8_t prefix = 0; prefix <= 32; prefix++) {
            auto test = ipv4_network::make(ipv4_address("0.0.0.0"), prefix);
            REQUIRE(test);
            REQUIRE(test->first() == ipv4_address("0.0.0.0"));
            REQUIRE(test->prefix_length() == prefix);
        }

        for (uint8_t prefix = 1; prefix <= 32; prefix++) {
            auto first = uint32_t{1} << (32 - prefix);
            auto test = ipv4_network::make(first, prefix);
            REQUIRE(test);
            REQUIRE(test->first().load<uint32_t>() == first);
            REQUIRE(ipv4_network::make(first, prefix - 1).error()
                    == error::INVALID_NETWORK);
        }
    }

    SECTION("derived quantity checks")
    {
        auto test = ipv4_network::make(1, 1, 1, 0, 24);
        REQUIRE(test);
        REQUIRE(test->first() == ipv4_address("1.1.1.0"));
        REQUIRE(test->last() == ipv4_address("1.1.1.255"));
        REQUIRE(test->netmask() == ipv4_address("255.255.255.0"));
        REQUIRE(test->hostcount() == 256);

        REQUIRE(ipv4_network::make(1, 1, 1, 0, 25)->hostcount() == 128);

        /* repeated queries yield the same values */
        REQUIRE(test->first() == test->first());
        REQUIRE(test->last() == test->last());
        REQUIRE(test->hostcount() == test->hostcount());
    }

    SECTION("whole address space and single address checks")
    {
        auto all = ipv4_network::make(0, 0);
        REQUIRE(all);
        REQUIRE(all->hostcount() == 4294967296ULL);
        REQUIRE(all->first() == ipv4_address("0.0.0.0"));
        REQUIRE(all->last() == ipv4_address("255.255.255.255"));
        REQUIRE(all->netmask() == ipv4_address("0.0.0.0"));

        auto one = ipv4_network::make(ipv4_address("10.0.0.1"), 32);
        REQUIRE(one);
        REQUIRE(one->hostcount() == 1);
        REQUIRE(one->first() == one->last());
        REQUIRE(one->netmask() == ipv4_address("255.255.255.255"));
    }

    SECTION("containment is strict")
    {
        auto test = ipv4_network::make(1, 1, 1, 0, 24);
        REQUIRE(test);
        REQUIRE(test->contains(ipv4_address{1, 1, 1, 1}));
        REQUIRE(test->contains(ipv4_address{1, 1, 1, 254}));
        REQUIRE_FALSE(test->contains(ipv4_address{1, 1, 1, 0}));
        REQUIRE_FALSE(test->contains(ipv4_address{1, 1, 1, 255}));
        REQUIRE_FALSE(test->contains(ipv4_address{1, 1, 2, 1}));
        REQUIRE_FALSE(test->contains(ipv4_address{1, 1, 0, 255}));

        auto pair = ipv4_network::make(ipv4_address("10.0.0.0"), 31);
        REQUIRE_FALSE(pair->contains(ipv4_address("10.0.0.0")));
        REQUIRE_FALSE(pair->contains(ipv4_address("10.0.0.1")));
    }

    SECTION("subnet and supernet checks")
    {
        auto supernet = ipv4_network::parse("1.0.0.0/22");
        auto subnet = ipv4_network::parse("1.0.1.0/24");
        REQUIRE(supernet);
        REQUIRE(subnet);

        REQUIRE(supernet->is_subnet(*subnet));
        REQUIRE(subnet->is_supernet(*supernet));
        REQUIRE_FALSE(subnet->is_subnet(*supernet));
        REQUIRE_FALSE(supernet->is_supernet(*subnet));

        /* a network encloses, and is enclosed by, itself */
        REQUIRE(subnet->is_subnet(*subnet));
        REQUIRE(subnet->is_supernet(*subnet));

        auto disjoint = ipv4_network::parse("1.0.4.0/24");
        REQUIRE_FALSE(supernet->is_subnet(*disjoint));
        REQUIRE_FALSE(disjoint->is_supernet(*supernet));
    }

    SECTION("comparison operator checks")
    {
        auto supernet = ipv4_network::parse("1.0.0.0/22");
        auto subnet = ipv4_network::parse("1.0.1.0/24");
        REQUIRE(*subnet > *supernet);
        REQUIRE(*supernet < *subnet);
        REQUIRE(*supernet != *subnet);

        /* same first address: the shorter prefix sorts first */
        auto wide = ipv4_network::parse("10.0.0.0/8");
        auto narrow = ipv4_network::parse("10.0.0.0/16");
        REQUIRE(*wide < *narrow);
        REQUIRE(*narrow >= *wide);
        REQUIRE(compare(*wide, *narrow) == -1);
        REQUIRE(compare(*narrow, *wide) == 1);

        REQUIRE(*ipv4_network::make(1, 1, 1, 0, 24)
                == *ipv4_network::parse("1.1.1.0/24"));
        REQUIRE(compare(*wide, *wide) == 0);
    }

    SECTION("string conversion checks")
    {
        REQUIRE(to_string(*ipv4_network::make(1, 1, 1, 0, 24)) == "1.1.1.0/24");
        REQUIRE(to_string(*ipv4_network::make(0, 0)) == "0.0.0.0/0");
    }
}

TEST_CASE("ipv4_network parsing checks", "[ipv4_network]")
{
    SECTION("valid input")
    {
        auto test = ipv4_network::parse("1.1.1.0/24");
        REQUIRE(test);
        REQUIRE(test->first().load<uint32_t>() == 16843008);
        REQUIRE(test->prefix_length() == 24);
    }

    SECTION("malformed input is a parse error")
    {
        auto inputs = std::vector<const char*>{"1.1.1.1",
                                               "",
                                               "/24",
                                               "1.1.1.0/",
                                               "1.1.1.0/24/1",
                                               "1.1.1/24",
                                               "1.1.1.0/abc",
                                               "1.1.1.0/-1",
                                               "1.1.1.0/24 ",
                                               "1.1.1.0/256",
                                               "2001:db8::/32"};
        for (auto input : inputs) {
            INFO(input);
            auto test = ipv4_network::parse(input);
            REQUIRE_FALSE(test);
            REQUIRE(test.error() == error::NETWORK_PARSE_ERROR);
        }
    }

    SECTION("well formed but invalid input is an invalid network")
    {
        REQUIRE(ipv4_network::parse("1.1.1.1/24").error()
                == error::INVALID_NETWORK);
        REQUIRE(ipv4_network::parse("1.1.1.0/23").error()
                == error::INVALID_NETWORK);
        REQUIRE(ipv4_network::parse("1.1.1.0/33").error()
                == error::INVALID_NETWORK);
    }

    SECTION("string conversion round trips")
    {
        auto inputs = std::vector<const char*>{
            "0.0.0.0/0", "10.0.0.0/8", "192.0.2.128/25", "255.255.255.255/32"};
        for (auto input : inputs) {
            auto test = ipv4_network::parse(input);
            REQUIRE(test);
            REQUIRE(to_string(*test) == input);

            auto again = ipv4_network::parse(to_string(*test));
            REQUIRE(again);
            REQUIRE(*again == *test);
        }
    }
}
