/*
 * Quadra Configuration Tests
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "quadra/config.h"
#include "quadra/error.h"
#include "quadra/log.h"
#include <cstring>

using Catch::Approx;

/* ============================================================================
 * Parsing
 * ============================================================================ */

TEST_CASE("Config defaults", "[config][default]") {
    Quadra_Config config = QUADRA_CONFIG_DEFAULT;

    REQUIRE(config.log_level == QUADRA_LOG_LEVEL_INFO);
    REQUIRE(config.log_console);
    REQUIRE(config.log_path[0] == '\0');
    REQUIRE(config.default_anchor_x == Approx(0.0f));
    REQUIRE(config.default_anchor_y == Approx(0.0f));
}

TEST_CASE("Config load from string", "[config][load]") {
    Quadra_Config config = QUADRA_CONFIG_DEFAULT;
    quadra_clear_error();

    SECTION("All known keys") {
        const char *toml =
            "[log]\n"
            "level = \"debug\"\n"
            "console = false\n"
            "path = \"/tmp/quadra_test.log\"\n"
            "\n"
            "[sprite]\n"
            "default_anchor_x = 0.5\n"
            "default_anchor_y = 1\n";

        REQUIRE(quadra_config_load_string(toml, &config));
        REQUIRE(config.log_level == QUADRA_LOG_LEVEL_DEBUG);
        REQUIRE_FALSE(config.log_console);
        REQUIRE(strcmp(config.log_path, "/tmp/quadra_test.log") == 0);
        REQUIRE(config.default_anchor_x == Approx(0.5f));
        REQUIRE(config.default_anchor_y == Approx(1.0f));
    }

    SECTION("Missing keys keep existing values") {
        config.default_anchor_y = 0.25f;
        REQUIRE(quadra_config_load_string("[sprite]\ndefault_anchor_x = 0.75\n", &config));
        REQUIRE(config.default_anchor_x == Approx(0.75f));
        REQUIRE(config.default_anchor_y == Approx(0.25f));
        REQUIRE(config.log_level == QUADRA_LOG_LEVEL_INFO);
    }

    SECTION("Unknown keys and tables are ignored") {
        const char *toml =
            "[log]\n"
            "colour = \"red\"\n"
            "[window]\n"
            "width = 1280\n";
        REQUIRE(quadra_config_load_string(toml, &config));
        REQUIRE(config.log_level == QUADRA_LOG_LEVEL_INFO);
    }

    SECTION("Level names are case-insensitive") {
        REQUIRE(quadra_config_load_string("[log]\nlevel = \"WARNING\"\n", &config));
        REQUIRE(config.log_level == QUADRA_LOG_LEVEL_WARNING);
    }

    SECTION("Unknown level is an error") {
        REQUIRE_FALSE(quadra_config_load_string("[log]\nlevel = \"loud\"\n", &config));
        REQUIRE(strstr(quadra_get_last_error(), "loud") != nullptr);
        REQUIRE(quadra_get_last_error_code() == QUADRA_ERROR_PARSE);
    }

    SECTION("Malformed TOML is an error") {
        REQUIRE_FALSE(quadra_config_load_string("[log\nlevel = ", &config));
        REQUIRE(strstr(quadra_get_last_error(), "TOML parse error") != nullptr);
    }

    SECTION("NULL arguments") {
        REQUIRE_FALSE(quadra_config_load_string(nullptr, &config));
        REQUIRE(quadra_get_last_error_code() == QUADRA_ERROR_INVALID_ARGUMENT);
        REQUIRE_FALSE(quadra_config_load_string("", nullptr));
    }

    quadra_clear_error();
}

TEST_CASE("Config load from missing file", "[config][load]") {
    Quadra_Config config = QUADRA_CONFIG_DEFAULT;
    quadra_clear_error();

    REQUIRE_FALSE(quadra_config_load("/nonexistent/quadra.toml", &config));
    REQUIRE(strstr(quadra_get_last_error(), "Cannot open file") != nullptr);
    REQUIRE(quadra_get_last_error_code() == QUADRA_ERROR_IO);

    quadra_clear_error();
}

/* ============================================================================
 * Apply
 * ============================================================================ */

TEST_CASE("Config apply", "[config][apply]") {
    Quadra_Config config = QUADRA_CONFIG_DEFAULT;
    config.log_level = QUADRA_LOG_LEVEL_WARNING;
    config.log_console = false;
    config.default_anchor_x = 0.5f;
    config.default_anchor_y = 0.5f;

    REQUIRE(quadra_config_apply(&config));
    REQUIRE(quadra_log_get_level() == QUADRA_LOG_LEVEL_WARNING);

    const Quadra_Config *active = quadra_config_get_active();
    REQUIRE(active != nullptr);
    REQUIRE(active->default_anchor_x == Approx(0.5f));
    REQUIRE(active->default_anchor_y == Approx(0.5f));

    Quadra_Config defaults = QUADRA_CONFIG_DEFAULT;
    REQUIRE(quadra_config_apply(&defaults));
    REQUIRE(quadra_log_get_level() == QUADRA_LOG_LEVEL_INFO);
    REQUIRE(quadra_config_get_active()->default_anchor_x == Approx(0.0f));
}
