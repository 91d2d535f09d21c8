/**
 * Quadra - Runtime Configuration
 *
 * Settings loaded from a TOML file:
 *
 *   [log]
 *   level = "info"          # error | warning | info | debug
 *   console = true
 *   path = "/tmp/quadra.log"
 *
 *   [sprite]
 *   default_anchor_x = 0.0
 *   default_anchor_y = 0.0
 *
 * Keys missing from the file keep the value already in the output struct,
 * so start from QUADRA_CONFIG_DEFAULT. Unknown keys are ignored.
 *
 * Usage:
 *   Quadra_Config config = QUADRA_CONFIG_DEFAULT;
 *   if (!quadra_config_load("quadra.toml", &config)) {
 *       quadra_log_and_clear_error();
 *   }
 *   quadra_config_apply(&config);
 */

#ifndef QUADRA_CONFIG_H
#define QUADRA_CONFIG_H

#include "quadra/log.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Config {
    /* [log] */
    Quadra_LogLevel log_level;
    bool log_console;
    char log_path[512];         /* Empty = leave the log file alone */

    /* [sprite] */
    float default_anchor_x;
    float default_anchor_y;
} Quadra_Config;

#define QUADRA_CONFIG_DEFAULT {   \
    QUADRA_LOG_LEVEL_INFO,        \
    true,                         \
    "",                           \
    0.0f,                         \
    0.0f                          \
}

/**
 * Load settings from a TOML file into *config.
 *
 * @return false on I/O or parse errors, or an unknown log level
 *         (*config may be partially updated)
 */
bool quadra_config_load(const char *path, Quadra_Config *config);

/**
 * Load settings from a TOML string into *config.
 */
bool quadra_config_load_string(const char *toml_string, Quadra_Config *config);

/**
 * Make config the active configuration: pushes the log level and console
 * flag to the logger, opens the log file if a path is set, and stores the
 * sprite defaults used by quadra_sprite_create().
 *
 * @return false if the log file could not be opened (other settings still apply)
 */
bool quadra_config_apply(const Quadra_Config *config);

/**
 * Active configuration (QUADRA_CONFIG_DEFAULT until quadra_config_apply()).
 */
const Quadra_Config *quadra_config_get_active(void);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_CONFIG_H */
