#ifndef QUADRA_ERROR_H
#define QUADRA_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

/**
 * Quadra Error Handling
 *
 * Thread-local last-error slot holding a category code and a formatted
 * message. Fallible functions return NULL/false and fill the slot; the slot
 * is not cleared on success.
 *
 * Usage:
 *   Quadra_Texture *tex = quadra_texture_cache_get(cache, "hero_idle");
 *   if (!tex) {
 *       if (quadra_get_last_error_code() == QUADRA_ERROR_NOT_FOUND) {
 *           // fall back to a placeholder frame
 *       }
 *       printf("Error: %s\n", quadra_get_last_error());
 *   }
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef enum Quadra_ErrorCode {
    QUADRA_ERROR_NONE = 0,
    QUADRA_ERROR_FAILED,            /**< Unclassified failure */
    QUADRA_ERROR_INVALID_ARGUMENT,  /**< NULL or out-of-range argument */
    QUADRA_ERROR_OUT_OF_MEMORY,
    QUADRA_ERROR_NOT_FOUND,         /**< Lookup of an unknown id */
    QUADRA_ERROR_ALREADY_EXISTS,    /**< Id registered twice */
    QUADRA_ERROR_IO,                /**< File could not be opened */
    QUADRA_ERROR_PARSE              /**< Malformed TOML or unexpected values */
} Quadra_ErrorCode;

/**
 * Set an unclassified error (QUADRA_ERROR_FAILED) with printf-style
 * formatting. A NULL format clears the slot.
 */
void quadra_set_error(const char *fmt, ...);

/**
 * Set an error with an explicit code.
 */
void quadra_set_error_code(Quadra_ErrorCode code, const char *fmt, ...);
void quadra_set_error_code_v(Quadra_ErrorCode code, const char *fmt, va_list args);

/**
 * Last error message, or an empty string.
 *
 * @return Thread-local buffer (do not free)
 */
const char *quadra_get_last_error(void);

/**
 * Code of the last error, QUADRA_ERROR_NONE if the slot is empty.
 */
Quadra_ErrorCode quadra_get_last_error_code(void);

/**
 * Stable name for a code ("NotFound", "Parse", ...).
 */
const char *quadra_error_code_name(Quadra_ErrorCode code);

void quadra_clear_error(void);
bool quadra_has_error(void);

/**
 * Set an unclassified error from SDL_GetError().
 *
 * @param prefix Optional prefix (can be NULL)
 */
void quadra_set_error_from_sdl(const char *prefix);

/**
 * Send the pending error to the logger at ERROR level, then clear it.
 * Does nothing when no error is set.
 */
void quadra_log_and_clear_error(void);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_ERROR_H */
