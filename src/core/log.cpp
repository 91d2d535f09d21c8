/*
 * Quadra - Logger
 *
 * One process-wide sink: an optional append-mode file, the SDL console and
 * up to QUADRA_LOG_MAX_CALLBACKS listeners.
 */

#include "quadra/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <time.h>

#if defined(_WIN32)
    #define DEFAULT_LOG_PATH "quadra.log"
#else
    #define DEFAULT_LOG_PATH "/tmp/quadra.log"
#endif

#define LOG_MESSAGE_SIZE 1024

struct LogListener {
    Quadra_LogCallback fn;
    void *userdata;
    uint32_t handle;   /* 0 = free slot */
};

struct LogLevelInfo {
    const char *tag;          /* padded for column alignment */
    SDL_LogPriority priority;
};

struct LogState {
    FILE *file;
    char path[512];
    Quadra_LogLevel level;
    bool console;
    LogListener listeners[QUADRA_LOG_MAX_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = {
    NULL, {0}, QUADRA_LOG_LEVEL_INFO, true, {}, 1
};

static const LogLevelInfo s_levels[] = {
    { "ERROR  ", SDL_LOG_PRIORITY_ERROR },
    { "WARNING", SDL_LOG_PRIORITY_WARN },
    { "INFO   ", SDL_LOG_PRIORITY_INFO },
    { "DEBUG  ", SDL_LOG_PRIORITY_DEBUG },
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static bool level_passes(Quadra_LogLevel level) {
    return level == QUADRA_LOG_LEVEL_ERROR || level <= s_log.level;
}

static void format_clock(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *local = localtime(&now);
    if (!local) {
        snprintf(buf, size, "%lld", (long long)now);
        return;
    }
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", local);
}

static void file_banner(const char *what) {
    if (!s_log.file) return;

    char clock[32];
    format_clock(clock, sizeof(clock));
    fprintf(s_log.file, "---- Quadra %s %s ----\n", what, clock);
    fflush(s_log.file);
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

bool quadra_log_init(void) {
    return quadra_log_init_with_path(NULL);
}

bool quadra_log_init_with_path(const char *path) {
    if (s_log.file) {
        return true;
    }

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : DEFAULT_LOG_PATH);

    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_ERROR,
                       "Failed to open log file: %s", s_log.path);
        s_log.path[0] = '\0';
        return false;
    }

    file_banner("opened");
    return true;
}

void quadra_log_shutdown(void) {
    if (!s_log.file) return;

    file_banner("closed");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool quadra_log_is_initialized(void) {
    return s_log.file != NULL;
}

const char *quadra_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

void quadra_log_flush(void) {
    if (s_log.file) {
        fflush(s_log.file);
    }
}

/* ============================================================================
 * Filtering
 * ============================================================================ */

void quadra_log_set_level(Quadra_LogLevel level) {
    if ((int)level < (int)QUADRA_LOG_LEVEL_ERROR || (int)level > (int)QUADRA_LOG_LEVEL_DEBUG) {
        return;
    }
    s_log.level = level;

    /* SDL drops debug output for the application category unless raised. */
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION,
                       level == QUADRA_LOG_LEVEL_DEBUG ? SDL_LOG_PRIORITY_DEBUG
                                                       : SDL_LOG_PRIORITY_INFO);
}

Quadra_LogLevel quadra_log_get_level(void) {
    return s_log.level;
}

void quadra_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

bool quadra_log_level_from_string(const char *name, Quadra_LogLevel *out_level) {
    if (!name) return false;

    static const struct {
        const char *name;
        Quadra_LogLevel level;
    } aliases[] = {
        { "error",   QUADRA_LOG_LEVEL_ERROR },
        { "warning", QUADRA_LOG_LEVEL_WARNING },
        { "warn",    QUADRA_LOG_LEVEL_WARNING },
        { "info",    QUADRA_LOG_LEVEL_INFO },
        { "debug",   QUADRA_LOG_LEVEL_DEBUG },
    };

    for (const auto &alias : aliases) {
        if (strcasecmp(name, alias.name) == 0) {
            if (out_level) *out_level = alias.level;
            return true;
        }
    }
    return false;
}

/* ============================================================================
 * Emission
 * ============================================================================ */

void quadra_log_v(Quadra_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if ((int)level < (int)QUADRA_LOG_LEVEL_ERROR || (int)level > (int)QUADRA_LOG_LEVEL_DEBUG) return;
    if (!level_passes(level)) return;

    char message[LOG_MESSAGE_SIZE];
    vsnprintf(message, sizeof(message), fmt ? fmt : "", args);

    char tag[11];
    snprintf(tag, sizeof(tag), "%-10s", subsystem ? subsystem : "Unknown");

    const LogLevelInfo &info = s_levels[level];

    if (s_log.file) {
        char clock[32];
        format_clock(clock, sizeof(clock));
        fprintf(s_log.file, "[%s] [%s] [%s] %s\n", clock, info.tag, tag, message);
        if (level == QUADRA_LOG_LEVEL_ERROR) {
            fflush(s_log.file);
        }
    }

    if (s_log.console) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, info.priority, "[%s] %s", tag, message);
    }

    for (const LogListener &listener : s_log.listeners) {
        if (listener.handle != 0 && listener.fn) {
            listener.fn(level, tag, message, listener.userdata);
        }
    }
}

#define QUADRA_LOG_FORWARD(level) \
    do { \
        va_list args; \
        va_start(args, fmt); \
        quadra_log_v((level), subsystem, fmt, args); \
        va_end(args); \
    } while (0)

void quadra_log_error(const char *subsystem, const char *fmt, ...) {
    QUADRA_LOG_FORWARD(QUADRA_LOG_LEVEL_ERROR);
}

void quadra_log_warning(const char *subsystem, const char *fmt, ...) {
    QUADRA_LOG_FORWARD(QUADRA_LOG_LEVEL_WARNING);
}

void quadra_log_info(const char *subsystem, const char *fmt, ...) {
    QUADRA_LOG_FORWARD(QUADRA_LOG_LEVEL_INFO);
}

void quadra_log_debug(const char *subsystem, const char *fmt, ...) {
    QUADRA_LOG_FORWARD(QUADRA_LOG_LEVEL_DEBUG);
}

#undef QUADRA_LOG_FORWARD

/* ============================================================================
 * Listeners
 * ============================================================================ */

uint32_t quadra_log_add_callback(Quadra_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (LogListener &listener : s_log.listeners) {
        if (listener.handle == 0) {
            listener.fn = callback;
            listener.userdata = userdata;
            listener.handle = s_log.next_handle++;
            return listener.handle;
        }
    }
    return 0;
}

void quadra_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (LogListener &listener : s_log.listeners) {
        if (listener.handle == handle) {
            listener = LogListener{};
            return;
        }
    }
}
