/**
 * Quadra - Runtime Configuration Implementation
 */

#include "quadra/config.h"
#include "quadra/error.h"
#include "quadra/log.h"
#include "quadra/validate.h"
#include "toml.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static Quadra_Config s_active = QUADRA_CONFIG_DEFAULT;

/* ============================================================================
 * Parsing
 * ============================================================================ */

/* TOML numbers may be written as integers or floats */
static bool read_float(toml_table_t *table, const char *key, float *out) {
    toml_datum_t d = toml_double_in(table, key);
    if (d.ok) {
        *out = (float)d.u.d;
        return true;
    }
    d = toml_int_in(table, key);
    if (d.ok) {
        *out = (float)d.u.i;
        return true;
    }
    return false;
}

static bool parse_log_table(toml_table_t *log, Quadra_Config *config) {
    toml_datum_t d = toml_string_in(log, "level");
    if (d.ok) {
        Quadra_LogLevel level;
        if (!quadra_log_level_from_string(d.u.s, &level)) {
            quadra_set_error_code(QUADRA_ERROR_PARSE, "Unknown log level '%s'", d.u.s);
            free(d.u.s);
            return false;
        }
        config->log_level = level;
        free(d.u.s);
    }

    d = toml_bool_in(log, "console");
    if (d.ok) {
        config->log_console = d.u.b != 0;
    }

    d = toml_string_in(log, "path");
    if (d.ok) {
        snprintf(config->log_path, sizeof(config->log_path), "%s", d.u.s);
        free(d.u.s);
    }

    return true;
}

static void parse_sprite_table(toml_table_t *sprite, Quadra_Config *config) {
    read_float(sprite, "default_anchor_x", &config->default_anchor_x);
    read_float(sprite, "default_anchor_y", &config->default_anchor_y);
}

static bool parse_config_toml(toml_table_t *root, Quadra_Config *config) {
    toml_table_t *log = toml_table_in(root, "log");
    if (log && !parse_log_table(log, config)) {
        return false;
    }

    toml_table_t *sprite = toml_table_in(root, "sprite");
    if (sprite) {
        parse_sprite_table(sprite, config);
    }

    return true;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

bool quadra_config_load(const char *path, Quadra_Config *config) {
    QUADRA_VALIDATE_PTRS2_RET(path, config, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        quadra_set_error_code(QUADRA_ERROR_IO, "Cannot open file: %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        quadra_set_error_code(QUADRA_ERROR_PARSE, "TOML parse error in %s: %s", path, errbuf);
        return false;
    }

    bool ok = parse_config_toml(root, config);
    toml_free(root);

    if (ok) {
        quadra_log_info(QUADRA_LOG_CONFIG, "Loaded configuration from %s", path);
    }
    return ok;
}

bool quadra_config_load_string(const char *toml_string, Quadra_Config *config) {
    QUADRA_VALIDATE_PTRS2_RET(toml_string, config, false);

    /* toml_parse needs mutable string */
    char *copy = strdup(toml_string);
    if (!copy) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        quadra_set_error_code(QUADRA_ERROR_PARSE, "TOML parse error: %s", errbuf);
        return false;
    }

    bool ok = parse_config_toml(root, config);
    toml_free(root);
    return ok;
}

bool quadra_config_apply(const Quadra_Config *config) {
    QUADRA_VALIDATE_PTR_RET(config, false);

    s_active = *config;

    quadra_log_set_level(config->log_level);
    quadra_log_set_console_output(config->log_console);

    if (config->log_path[0] == '\0') {
        return true;
    }

    const char *current = quadra_log_get_path();
    if (quadra_log_is_initialized() && current && strcmp(current, config->log_path) == 0) {
        return true;
    }

    quadra_log_shutdown();
    if (!quadra_log_init_with_path(config->log_path)) {
        quadra_set_error_code(QUADRA_ERROR_IO, "Cannot open log file: %s", config->log_path);
        return false;
    }

    quadra_log_info(QUADRA_LOG_CONFIG, "Logging to %s", config->log_path);
    return true;
}

const Quadra_Config *quadra_config_get_active(void) {
    return &s_active;
}
