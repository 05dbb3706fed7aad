#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <stdexcept>
#include <string>

using namespace voice_bridge::utils;

TEST_CASE("url_encode escapes reserved characters") {
    REQUIRE(url_encode("hello world!") == "hello%20world%21");
    REQUIRE(url_encode("a-b_c.d~e") == "a-b_c.d~e");
    REQUIRE(url_encode("you're \"gary\"") == "you%27re%20%22gary%22");
}

TEST_CASE("parse_url splits scheme host port and path") {
    const auto url = parse_url("HTTPS://example.com:8443/path/file?x=1");
    REQUIRE(url.scheme == "https");
    REQUIRE(url.host == "example.com");
    REQUIRE(url.port == 8443);
    REQUIRE(url.path == "/path/file?x=1");
    REQUIRE(url.origin() == "https://example.com:8443");
}

TEST_CASE("parse_url falls back to the scheme default port") {
    const auto wss = parse_url("wss://api.elevenlabs.io/v1/convai?token=abc");
    REQUIRE(wss.secure());
    REQUIRE(wss.port == 443);
    REQUIRE(wss.host == "api.elevenlabs.io");

    const auto local = parse_url("http://localhost");
    REQUIRE_FALSE(local.secure());
    REQUIRE(local.port == 80);
    REQUIRE(local.path.empty());
}

TEST_CASE("parse_url rejects a missing host or bad port") {
    REQUIRE_THROWS_AS(parse_url("https:///path"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("http://host:abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("http://host:70000"), std::invalid_argument);
}

TEST_CASE("form_encode keeps field order and escapes values") {
    const FormFields fields = {
        {"To", "+15551234567"},
        {"From", "+15557654321"},
        {"Url", "https://host/twiml?a=1&b=2"},
    };
    REQUIRE(form_encode(fields) ==
            "To=%2B15551234567&From=%2B15557654321&Url=https%3A%2F%2Fhost%2Ftwiml%3Fa%3D1%26b%3D2");
    REQUIRE(form_encode({}).empty());
}
