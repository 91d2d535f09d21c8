#ifndef QUADRA_LOG_H
#define QUADRA_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Quadra Logger
 *
 * Leveled messages tagged with a subsystem name. Every message that passes
 * the level filter goes to the log file (when one is open), to the SDL
 * console (unless disabled) and to registered callbacks.
 *
 *   quadra_log_init_with_path("quadra.log");
 *   quadra_log_set_level(QUADRA_LOG_LEVEL_DEBUG);
 *   quadra_log_debug(QUADRA_LOG_GEOMETRY, "Sprite '%s' rebuilt", name);
 *   quadra_log_shutdown();
 *
 * File lines look like:
 *   [2024-01-15 14:30:22] [WARNING] [Texture   ] Frame not found: hero_idle
 */

#ifdef __cplusplus
extern "C" {
#endif

/** Filter order: a level admits itself and everything below it. */
typedef enum {
    QUADRA_LOG_LEVEL_ERROR = 0,    /**< Never filtered; flushes the file */
    QUADRA_LOG_LEVEL_WARNING = 1,
    QUADRA_LOG_LEVEL_INFO = 2,
    QUADRA_LOG_LEVEL_DEBUG = 3
} Quadra_LogLevel;

#define QUADRA_LOG_CORE       "Core"
#define QUADRA_LOG_CONFIG     "Config"
#define QUADRA_LOG_GEOMETRY   "Geometry"
#define QUADRA_LOG_TEXTURE    "Texture"
#define QUADRA_LOG_SCENE      "Scene"

#define QUADRA_LOG_MAX_CALLBACKS 8

/**
 * @param subsystem Subsystem name padded to 10 columns
 * @param message   Formatted text without timestamp or level
 */
typedef void (*Quadra_LogCallback)(Quadra_LogLevel level, const char *subsystem,
                                   const char *message, void *userdata);

/* File sink. Console output and callbacks work without it. */
bool quadra_log_init(void);   /* /tmp/quadra.log, or quadra.log on Windows */
bool quadra_log_init_with_path(const char *path);
void quadra_log_shutdown(void);
bool quadra_log_is_initialized(void);
void quadra_log_flush(void);

/**
 * Path of the open log file, or NULL when no file is open.
 */
const char *quadra_log_get_path(void);

void quadra_log_set_level(Quadra_LogLevel level);
Quadra_LogLevel quadra_log_get_level(void);
void quadra_log_set_console_output(bool enabled);

/**
 * Case-insensitive level lookup: "error", "warning"/"warn", "info", "debug".
 */
bool quadra_log_level_from_string(const char *name, Quadra_LogLevel *out_level);

void quadra_log_error(const char *subsystem, const char *fmt, ...);
void quadra_log_warning(const char *subsystem, const char *fmt, ...);
void quadra_log_info(const char *subsystem, const char *fmt, ...);
void quadra_log_debug(const char *subsystem, const char *fmt, ...);
void quadra_log_v(Quadra_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/**
 * Register a listener.
 *
 * @return Nonzero handle, or 0 when all QUADRA_LOG_MAX_CALLBACKS slots are taken
 */
uint32_t quadra_log_add_callback(Quadra_LogCallback callback, void *userdata);
void quadra_log_remove_callback(uint32_t handle);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_LOG_H */
