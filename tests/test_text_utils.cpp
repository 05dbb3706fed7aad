#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/text.hpp"

#include <string>

TEST_CASE("xml_escape replaces markup characters") {
    const std::string input = R"(<say "hi" & 'bye'>)";
    const std::string expected = "&lt;say &quot;hi&quot; &amp; &apos;bye&apos;&gt;";
    REQUIRE(voice_bridge::utils::xml_escape(input) == expected);
}

TEST_CASE("xml_escape leaves plain text untouched") {
    const std::string input = "Hey, how can I help you today?";
    REQUIRE(voice_bridge::utils::xml_escape(input) == input);
}

TEST_CASE("trim strips surrounding whitespace") {
    REQUIRE(voice_bridge::utils::trim("  +15551234567\t\n") == "+15551234567");
    REQUIRE(voice_bridge::utils::trim("   ").empty());
    REQUIRE(voice_bridge::utils::trim("a b") == "a b");
}
