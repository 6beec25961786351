// Unit tests for network address utilities
#include <catch2/catch_test_macros.hpp>
#include "util/netaddress.hpp"

using namespace palm::util;

TEST_CASE("IsValidIPAddress", "[util][netaddress]") {
    SECTION("IPv4") {
        REQUIRE(IsValidIPAddress("127.0.0.1"));
        REQUIRE(IsValidIPAddress("0.0.0.0"));
        REQUIRE(IsValidIPAddress("255.255.255.255"));
    }

    SECTION("IPv6") {
        REQUIRE(IsValidIPAddress("::1"));
        REQUIRE(IsValidIPAddress("::"));
        REQUIRE(IsValidIPAddress("2001:db8::1"));
        REQUIRE(IsValidIPAddress("::ffff:10.0.0.1"));
    }

    SECTION("Not an address") {
        REQUIRE_FALSE(IsValidIPAddress(""));
        REQUIRE_FALSE(IsValidIPAddress("localhost"));
        REQUIRE_FALSE(IsValidIPAddress("256.0.0.1"));
        REQUIRE_FALSE(IsValidIPAddress("1.2.3"));
        REQUIRE_FALSE(IsValidIPAddress("127.0.0.1:9000"));
        REQUIRE_FALSE(IsValidIPAddress("[::1]"));
    }
}

TEST_CASE("ValidateAndNormalizeIP", "[util][netaddress]") {
    SECTION("IPv4 passes through") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == "192.168.1.1");
    }

    SECTION("IPv4-mapped IPv6 becomes IPv4") {
        REQUIRE(ValidateAndNormalizeIP("::ffff:192.168.1.1") == "192.168.1.1");
        REQUIRE(ValidateAndNormalizeIP("::ffff:127.0.0.1") == "127.0.0.1");
    }

    SECTION("IPv6 is canonicalized") {
        REQUIRE(ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001") == "2001:db8::1");
        REQUIRE(ValidateAndNormalizeIP("::1") == "::1");
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("invalid").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.2.3.4.5").has_value());
    }
}

TEST_CASE("SplitHostPort - accepted forms", "[util][netaddress]") {
    std::string host;
    uint16_t port = 0;

    SECTION("IPv4 literal") {
        REQUIRE(SplitHostPort("127.0.0.1:9000", host, port));
        REQUIRE(host == "127.0.0.1");
        REQUIRE(port == 9000);
    }

    SECTION("Hostname is kept for asynchronous resolution") {
        REQUIRE(SplitHostPort("localhost:80", host, port));
        REQUIRE(host == "localhost");
        REQUIRE(port == 80);

        REQUIRE(SplitHostPort("echo.example.org:7", host, port));
        REQUIRE(host == "echo.example.org");
        REQUIRE(port == 7);
    }

    SECTION("Bracketed IPv6 literal") {
        REQUIRE(SplitHostPort("[::1]:9000", host, port));
        REQUIRE(host == "::1");
        REQUIRE(port == 9000);

        REQUIRE(SplitHostPort("[2001:db8::1]:65535", host, port));
        REQUIRE(host == "2001:db8::1");
        REQUIRE(port == 65535);
    }
}

TEST_CASE("SplitHostPort - rejected forms", "[util][netaddress]") {
    std::string host = "unchanged";
    uint16_t port = 1234;

    REQUIRE_FALSE(SplitHostPort("", host, port));
    REQUIRE_FALSE(SplitHostPort("127.0.0.1", host, port));       // no port
    REQUIRE_FALSE(SplitHostPort(":9000", host, port));           // no host
    REQUIRE_FALSE(SplitHostPort("127.0.0.1:", host, port));      // empty port
    REQUIRE_FALSE(SplitHostPort("127.0.0.1:0", host, port));     // port 0 cannot be dialed
    REQUIRE_FALSE(SplitHostPort("127.0.0.1:65536", host, port));
    REQUIRE_FALSE(SplitHostPort("127.0.0.1:http", host, port));
    REQUIRE_FALSE(SplitHostPort("::1:9000", host, port));        // unbracketed IPv6
    REQUIRE_FALSE(SplitHostPort("[::1]9000", host, port));
    REQUIRE_FALSE(SplitHostPort("[::1:9000", host, port));
    REQUIRE_FALSE(SplitHostPort("[]:9000", host, port));
    REQUIRE_FALSE(SplitHostPort("[localhost]:9000", host, port)); // brackets need an IP

    // Outputs untouched on failure
    REQUIRE(host == "unchanged");
    REQUIRE(port == 1234);
}

TEST_CASE("FormatEndpoint - registry key form", "[util][netaddress]") {
    REQUIRE(FormatEndpoint("127.0.0.1", 9000) == "127.0.0.1:9000");
    REQUIRE(FormatEndpoint("::1", 9000) == "[::1]:9000");
    REQUIRE(FormatEndpoint("::ffff:127.0.0.1", 5000) == "127.0.0.1:5000");
    REQUIRE(FormatEndpoint("2001:0db8::0001", 1) == "[2001:db8::1]:1");

    // Names are not resolved, just joined
    REQUIRE(FormatEndpoint("localhost", 80) == "localhost:80");

    // Round trip through SplitHostPort
    std::string host;
    uint16_t port = 0;
    REQUIRE(SplitHostPort(FormatEndpoint("::1", 4242), host, port));
    REQUIRE(host == "::1");
    REQUIRE(port == 4242);
}
