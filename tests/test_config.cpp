#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "logging.hpp"
#include "groupsig/scheme.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using grpsig::Config;
using grpsig::ConfigError;
using grpsig::ObjectKind;

TEST_CASE("Config env string", "[config]") {
    SECTION("Parse keys, comments and blank lines") {
        Config cfg = Config::from_env_string(
            "# group authority\n"
            "\n"
            "GRPSIG_SCHEME=cpy06\n"
            "GRPSIG_LOG_LEVEL = warn\n"
            "GRPSIG_GROUP_KEY=cpy06:group:AAAA\n"
            "UNRELATED=1\n");
        REQUIRE(cfg.scheme == "cpy06");
        REQUIRE(cfg.log_level == "warn");
        REQUIRE(cfg.group_key == "cpy06:group:AAAA");
        REQUIRE(cfg.manager_key.empty());
        REQUIRE(cfg.member_key.empty());
    }

    SECTION("Values may contain '='") {
        Config cfg = Config::from_env_string("GRPSIG_MEMBER_KEY=cpy06:member:AA==\n");
        REQUIRE(cfg.member_key == "cpy06:member:AA==");
    }

    SECTION("Round trip") {
        Config cfg;
        cfg.log_level = "info";
        cfg.group_key = "cpy06:group:Zm9v";
        cfg.revocation_key = "cpy06:revmanager:YmFy";

        Config back = Config::from_env_string(cfg.to_env_string());
        REQUIRE(back.scheme == cfg.scheme);
        REQUIRE(back.log_level == cfg.log_level);
        REQUIRE(back.group_key == cfg.group_key);
        REQUIRE(back.revocation_key == cfg.revocation_key);
        REQUIRE(back.manager_key.empty());
    }

    SECTION("A line without '=' is an error") {
        REQUIRE_THROWS_AS(Config::from_env_string("GRPSIG_SCHEME cpy06\n"), ConfigError);
    }
}

TEST_CASE("Config applied to a scheme", "[config]") {
    init_crypto();

    auto authority = grpsig::make_scheme(grpsig::SchemeId::Cpy06);
    authority->setup();

    Config cfg;
    cfg.group_key   = authority->export_key(ObjectKind::Group).value();
    cfg.manager_key = authority->export_key(ObjectKind::Manager).value();

    auto restored = grpsig::make_scheme(grpsig::SchemeId::Cpy06);
    Config::from_env_string(cfg.to_env_string()).apply(*restored);
    REQUIRE(restored->has_key(ObjectKind::Group));
    REQUIRE(restored->has_key(ObjectKind::Manager));
    REQUIRE_FALSE(restored->has_key(ObjectKind::RevocationManager));

    // The restored manager can run a join against the original group
    auto member = grpsig::make_scheme(grpsig::SchemeId::Cpy06);
    member->import_key(cfg.group_key);
    std::string key = join_via_scheme(*restored, *member);
    std::string sig = member->sign(msg("hello"), key).value();
    REQUIRE(authority->verify(msg("hello"), sig));

    SECTION("Scheme mismatch") {
        Config other;
        other.scheme = "ps16";
        REQUIRE_THROWS_AS(other.apply(*restored), ConfigError);
    }

    SECTION("Bad log level") {
        Config bad;
        bad.log_level = "loud";
        REQUIRE_THROWS_AS(bad.apply(*restored), ConfigError);
    }

    SECTION("Bad key envelope") {
        Config bad;
        bad.group_key = "cpy06:group:AAAA";
        REQUIRE_THROWS_AS(bad.apply(*restored), ecgroup::DecodeError);
    }

    SECTION("A bad envelope leaves the target untouched") {
        auto other = grpsig::make_scheme(grpsig::SchemeId::Cpy06);
        other->setup();

        Config mixed;
        mixed.group_key   = other->export_key(ObjectKind::Group).value();
        mixed.manager_key = "cpy06:manager:AAAA";
        mixed.log_level   = "trace";
        std::string level = grpsig::logging::get_log_level();

        auto fresh = grpsig::make_scheme(grpsig::SchemeId::Cpy06);
        REQUIRE_THROWS_AS(mixed.apply(*fresh), ecgroup::DecodeError);
        REQUIRE_FALSE(fresh->has_key(ObjectKind::Group));
        REQUIRE(grpsig::logging::get_log_level() == level);

        REQUIRE_THROWS_AS(mixed.apply(*restored), ecgroup::DecodeError);
        REQUIRE(restored->export_key(ObjectKind::Group).value() == cfg.group_key);
    }
}

TEST_CASE("Logging levels", "[logging]") {
    std::string before = grpsig::logging::get_log_level();

    grpsig::logging::set_log_level("debug");
    REQUIRE(grpsig::logging::get_log_level() == "debug");
    REQUIRE(grpsig::logging::get_logger("grpsig.test")->should_log(spdlog::level::debug));

    grpsig::logging::set_log_level("error");
    auto logger = grpsig::logging::get_logger("grpsig.test");
    REQUIRE_FALSE(logger->should_log(spdlog::level::info));
    REQUIRE(logger == grpsig::logging::get_logger("grpsig.test"));

    REQUIRE_THROWS_AS(grpsig::logging::set_log_level("chatty"), std::invalid_argument);
    grpsig::logging::set_log_level(before);
}
