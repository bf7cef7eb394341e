#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "kestrel/core/platform_utils.hpp"
#include "tests/support/example_factory.hpp"

using example_factory::ScopedEnv;
using kestrel::core::env_flag;
using kestrel::core::parse_number;
using kestrel::core::safe_getenv;

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    ScopedEnv env("KESTREL_TEST_SAFE_GETENV_UNSET", nullptr);
    REQUIRE_FALSE(safe_getenv("KESTREL_TEST_SAFE_GETENV_UNSET").has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    ScopedEnv env("KESTREL_TEST_SAFE_GETENV_VALUE", "hello_world");
    auto v = safe_getenv("KESTREL_TEST_SAFE_GETENV_VALUE");
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
}

TEST_CASE("env_flag treats empty and leading zero as off", "[platform][env]") {
    const char* key = "KESTREL_TEST_ENV_FLAG";
    {
        ScopedEnv env(key, "1");
        REQUIRE(env_flag(key));
    }
    {
        ScopedEnv env(key, "0");
        REQUIRE_FALSE(env_flag(key));
    }
    {
        ScopedEnv env(key, "");
        REQUIRE_FALSE(env_flag(key));
    }
    {
        ScopedEnv env(key, nullptr);
        REQUIRE_FALSE(env_flag(key));
    }
}

TEST_CASE("parse_number accepts whole strings only", "[platform][parse]") {
    REQUIRE(parse_number<std::uint32_t>("42") == std::optional<std::uint32_t>(42));
    REQUIRE_FALSE(parse_number<std::uint32_t>("42x").has_value());
    REQUIRE_FALSE(parse_number<std::uint32_t>("").has_value());
    REQUIRE_FALSE(parse_number<std::uint8_t>("300").has_value());
    auto f = parse_number<float>("0.25");
    REQUIRE(f.has_value());
    REQUIRE(*f == 0.25f);
}
