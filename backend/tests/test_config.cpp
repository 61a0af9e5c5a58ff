#include <catch2/catch_test_macros.hpp>
#include "../src/utils/Config.hpp"

#include <cstdlib>

TEST_CASE("AppConfig - defaults and overrides", "[config]") {
    ::unsetenv("BUDGET_DB");
    ::unsetenv("BUDGET_KEY");
    ::unsetenv("BUDGET_LOG");
    ::unsetenv("BUDGET_LOG_LEVEL");

    SECTION("defaults") {
        const char* argv[] = {"budget"};
        auto cfg = AppConfig::load(1, argv);
        REQUIRE(cfg.db_path == "secure_budgets.db");
        REQUIRE(cfg.key_path == "budget_key.key");
        REQUIRE(cfg.log_path == "budget.log");
        REQUIRE(cfg.log_level == spdlog::level::info);
        REQUIRE_FALSE(cfg.show_help);
    }

    SECTION("environment overrides defaults") {
        ::setenv("BUDGET_DB", "/tmp/env.db", 1);
        ::setenv("BUDGET_LOG_LEVEL", "debug", 1);
        const char* argv[] = {"budget"};
        auto cfg = AppConfig::load(1, argv);
        REQUIRE(cfg.db_path == "/tmp/env.db");
        REQUIRE(cfg.log_level == spdlog::level::debug);
        ::unsetenv("BUDGET_DB");
        ::unsetenv("BUDGET_LOG_LEVEL");
    }

    SECTION("command line overrides environment") {
        ::setenv("BUDGET_KEY", "/tmp/env.key", 1);
        const char* argv[] = {"budget", "--key", "/tmp/cli.key", "--log-level", "warn"};
        auto cfg = AppConfig::load(5, argv);
        REQUIRE(cfg.key_path == "/tmp/cli.key");
        REQUIRE(cfg.log_level == spdlog::level::warn);
        ::unsetenv("BUDGET_KEY");
    }

    SECTION("help flag") {
        const char* argv[] = {"budget", "--help"};
        REQUIRE(AppConfig::load(2, argv).show_help);
    }

    SECTION("bad input") {
        const char* unknown[] = {"budget", "--verbose"};
        REQUIRE_THROWS_AS(AppConfig::load(2, unknown), ConfigError);

        const char* missing[] = {"budget", "--db"};
        REQUIRE_THROWS_AS(AppConfig::load(2, missing), ConfigError);

        const char* level[] = {"budget", "--log-level", "loud"};
        REQUIRE_THROWS_AS(AppConfig::load(3, level), ConfigError);
    }
}
