#include <catch2/catch_all.hpp>
#include "auth.hpp"

TEST_CASE("Open mode authorizes everything") {
    REQUIRE(authorize(std::nullopt, std::nullopt));
    REQUIRE(authorize(std::string("anything"), std::nullopt));
    REQUIRE(authorize(std::string(""), std::nullopt));
}

TEST_CASE("Configured secret requires an exact match") {
    std::optional<std::string> secret = "abc123";

    REQUIRE(authorize(std::string("abc123"), secret));

    REQUIRE_FALSE(authorize(std::nullopt, secret));
    REQUIRE_FALSE(authorize(std::string(""), secret));
    REQUIRE_FALSE(authorize(std::string("wrong"), secret));
    REQUIRE_FALSE(authorize(std::string("abc12"), secret));
    REQUIRE_FALSE(authorize(std::string("abc1234"), secret));
    REQUIRE_FALSE(authorize(std::string("ABC123"), secret));
    REQUIRE_FALSE(authorize(std::string("abc123 "), secret));
}

TEST_CASE("AccessGuard follows the configuration") {
    Config config;
    AccessGuard guard(config);

    REQUIRE(guard.is_open());
    REQUIRE(guard.authorize(std::nullopt));

    config.security_token = "s3cret";
    config.debug = true;
    REQUIRE_FALSE(guard.is_open());
    REQUIRE(guard.authorize(std::string("s3cret")));
    REQUIRE_FALSE(guard.authorize(std::string("nope")));
    REQUIRE_FALSE(guard.authorize(std::nullopt));
}
