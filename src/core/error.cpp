/*
 * Quadra - Error Reporting
 */

#include "quadra/error.h"
#include "quadra/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>

#define ERROR_MESSAGE_SIZE 1024

#if defined(_MSC_VER)
    #define QUADRA_THREAD_LOCAL __declspec(thread)
#else
    #define QUADRA_THREAD_LOCAL thread_local
#endif

struct ErrorSlot {
    Quadra_ErrorCode code;
    char message[ERROR_MESSAGE_SIZE];
};

static QUADRA_THREAD_LOCAL ErrorSlot s_error = { QUADRA_ERROR_NONE, {0} };

static const char *const s_code_names[] = {
    "None",
    "Failed",
    "InvalidArgument",
    "OutOfMemory",
    "NotFound",
    "AlreadyExists",
    "IO",
    "Parse",
};

void quadra_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    quadra_set_error_code_v(QUADRA_ERROR_FAILED, fmt, args);
    va_end(args);
}

void quadra_set_error_code(Quadra_ErrorCode code, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    quadra_set_error_code_v(code, fmt, args);
    va_end(args);
}

void quadra_set_error_code_v(Quadra_ErrorCode code, const char *fmt, va_list args) {
    if (!fmt || code == QUADRA_ERROR_NONE) {
        quadra_clear_error();
        return;
    }
    s_error.code = code;
    vsnprintf(s_error.message, sizeof(s_error.message), fmt, args);
}

const char *quadra_get_last_error(void) {
    return s_error.message;
}

Quadra_ErrorCode quadra_get_last_error_code(void) {
    return s_error.code;
}

const char *quadra_error_code_name(Quadra_ErrorCode code) {
    size_t index = (size_t)code;
    if (index >= sizeof(s_code_names) / sizeof(s_code_names[0])) {
        return "Unknown";
    }
    return s_code_names[index];
}

void quadra_clear_error(void) {
    s_error.code = QUADRA_ERROR_NONE;
    s_error.message[0] = '\0';
}

bool quadra_has_error(void) {
    return s_error.code != QUADRA_ERROR_NONE;
}

void quadra_set_error_from_sdl(const char *prefix) {
    const char *sdl_error = SDL_GetError();
    if (!sdl_error || sdl_error[0] == '\0') {
        sdl_error = "Unknown SDL error";
    }

    if (prefix && prefix[0] != '\0') {
        quadra_set_error("%s: %s", prefix, sdl_error);
    } else {
        quadra_set_error("%s", sdl_error);
    }
}

void quadra_log_and_clear_error(void) {
    if (!quadra_has_error()) return;

    quadra_log_error(QUADRA_LOG_CORE, "%s", s_error.message);
    quadra_clear_error();
}
