#include <vector>

#include "catch.hpp"

#include "ipnet/ipv4_address.hpp"

using namespace libipnet;

TEST_CASE("ipv4 address", "[libipnet]")
{
    SECTION("constructor functionality")
    {
        /* valid */
        ipv4_address ref(0x0A000001); /* 10.0.0.1 */
        REQUIRE(ipv4_address("10.0.0.1") == ref);
        REQUIRE(ipv4_address{10, 0, 0, 1} == ref);
        REQUIRE(ref.load<uint32_t>() == 0x0A000001);

        std::vector<uint8_t> addr{10, 0, 0, 1};
        REQUIRE(ipv4_address(addr.data()) == ref);

        /* invalid */
        REQUIRE_THROWS(ipv4_address("203.0.113"));
        REQUIRE_THROWS(ipv4_address("203.0.113.0.1"));
        REQUIRE_THROWS(ipv4_address{224, 0, 0, 0, 1});
    }

    SECTION("non-throwing parse")
    {
        auto addr = parse_ipv4_address("198.51.100.7");
        REQUIRE(addr);
        REQUIRE(*addr == ipv4_address{198, 51, 100, 7});

        REQUIRE_FALSE(parse_ipv4_address(""));
        REQUIRE_FALSE(parse_ipv4_address("198.51.100"));
        REQUIRE_FALSE(parse_ipv4_address("198.51.100.256"));
        REQUIRE_FALSE(parse_ipv4_address("2001:db8::1"));
    }

    SECTION("access by index")
    {
        ipv4_address test{198, 51, 100, 10};

        REQUIRE(test[0] == 198);
        REQUIRE(test[1] == 51);
        REQUIRE(test[2] == 100);
        REQUIRE(test[3] == 10);
        REQUIRE_THROWS(test.at(4));
    }

    SECTION("check comparison operators")
    {
        ipv4_address a{198, 0, 2, 1};
        ipv4_address b{198, 51, 100, 12};
        ipv4_address c("198.51.100.12");

        REQUIRE(a < b);
        REQUIRE(a <= b);
        REQUIRE(b <= c);
        REQUIRE(b > a);
        REQUIRE(b >= a);
        REQUIRE(b >= c);
        REQUIRE(b == c);
        REQUIRE(a != b);

        /* octet order must match numeric order */
        REQUIRE(ipv4_address(0x000000ff) < ipv4_address(0x00000100));
    }

    SECTION("check string conversion")
    {
        REQUIRE(to_string(ipv4_address{203, 0, 113, 1}) == "203.0.113.1");
        REQUIRE(to_string(ipv4_address("203.0.113.2")) == "203.0.113.2");
        REQUIRE(to_string(ipv4_address(0xcb007103)) == "203.0.113.3");
    }
}
