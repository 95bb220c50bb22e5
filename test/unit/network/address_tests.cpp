// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "network/address.hpp"

#include <set>
#include <unordered_set>

using namespace meshwire::network;

TEST_CASE("Address: formatting", "[address]") {
    CHECK(Address("127.0.0.1", 1337).ToString() == "127.0.0.1:1337");
    CHECK(Address("::1", 80).ToString() == "[::1]:80");
    CHECK(Address("example.org", 443).ToString() == "example.org:443");
}

TEST_CASE("Address: parsing", "[address]") {
    SECTION("IPv4 and hostnames") {
        auto a = Address::Parse("10.0.0.7:9000");
        REQUIRE(a);
        CHECK(a->host == "10.0.0.7");
        CHECK(a->port == 9000);

        auto h = Address::Parse("localhost:1");
        REQUIRE(h);
        CHECK(h->host == "localhost");
    }

    SECTION("Bracketed IPv6") {
        auto a = Address::Parse("[fe80::1]:65535");
        REQUIRE(a);
        CHECK(a->host == "fe80::1");
        CHECK(a->port == 65535);
        CHECK(Address::Parse(a->ToString()) == a);
    }

    SECTION("Malformed input") {
        CHECK_FALSE(Address::Parse(""));
        CHECK_FALSE(Address::Parse("127.0.0.1"));
        CHECK_FALSE(Address::Parse(":80"));
        CHECK_FALSE(Address::Parse("host:"));
        CHECK_FALSE(Address::Parse("host:0"));
        CHECK_FALSE(Address::Parse("host:65536"));
        CHECK_FALSE(Address::Parse("host:12ab"));
        CHECK_FALSE(Address::Parse("::1:80"));
        CHECK_FALSE(Address::Parse("[::1]80"));
        CHECK_FALSE(Address::Parse("[[x]:1"));
        CHECK_FALSE(Address::Parse("a]:1"));
        CHECK_FALSE(Address::Parse("[::1"));
    }
}

TEST_CASE("Address: value semantics", "[address]") {
    Address a("127.0.0.1", 1000);
    Address b("127.0.0.1", 1000);
    Address c("127.0.0.1", 1001);

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a < c);

    std::unordered_set<Address> hashed{a, b, c};
    CHECK(hashed.size() == 2);

    std::set<Address> ordered{c, a, b};
    CHECK(ordered.size() == 2);
    CHECK(*ordered.begin() == a);
}
