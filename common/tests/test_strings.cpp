#include <catch2/catch.hpp>
#include "strings.hpp"

using namespace mailhub;

TEST_CASE("String helpers", "[strings]") {
    SECTION("Case folding") {
        REQUIRE(strings::lower("Alice@Example.COM") == "alice@example.com");
        REQUIRE(strings::upper("mail from:") == "MAIL FROM:");
        REQUIRE(strings::lower("") == "");
    }

    SECTION("Trim defaults to blanks and tabs") {
        REQUIRE(strings::trim("  \tvalue \t") == "value");
        REQUIRE(strings::trim("   ") == "");
        REQUIRE(strings::trim("value\r\n") == "value\r\n");
    }

    SECTION("Trim with a character set") {
        REQUIRE(strings::trim(" value\r\n", " \t\r\n") == "value");
        REQUIRE(strings::trim("a b", " ") == "a b");
    }
}
