/**
 * Quadra - Texture and Texture Cache Implementation
 */

#include "quadra/texture.h"
#include "quadra/quadra.h"
#include "quadra/error.h"
#include "quadra/generation.h"
#include "quadra/log.h"
#include "quadra/validate.h"
#include "toml.h"

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Constants
 * ============================================================================ */

#define INITIAL_CAPACITY 32

/* Hash table load factor threshold for resize */
#define HASH_LOAD_FACTOR 0.75f

/* ============================================================================
 * Internal Types
 * ============================================================================ */

struct Quadra_Texture {
    float orig_width;
    float orig_height;
    Quadra_Rect trim;
    bool has_trim;
    bool loaded;
    bool is_static;

    /* Frame promised by a frame file for a not-yet-loaded texture */
    bool has_declared;
    float declared_width;
    float declared_height;
    Quadra_Rect declared_trim;
    bool declared_has_trim;
};

/* Registered frame */
typedef struct CacheEntry {
    char *frame_id;              /* Heap-allocated id */
    uint32_t hash;
    Quadra_Texture *texture;     /* Owned */
} CacheEntry;

/* Hash table entry for id lookup */
typedef struct HashEntry {
    uint32_t hash;               /* Id hash (0 = empty slot) */
    uint32_t entry_index;        /* Index into entries array */
} HashEntry;

struct Quadra_TextureCache {
    CacheEntry *entries;
    size_t entry_count;
    size_t entry_capacity;

    HashEntry *hash_table;       /* Power-of-two size, linear probing */
    size_t hash_capacity;
};

static Quadra_Texture s_empty_texture = {
    1.0f, 1.0f,
    { 0.0f, 0.0f, 0.0f, 0.0f },
    false,
    true,
    true,
    false, 0.0f, 0.0f,
    { 0.0f, 0.0f, 0.0f, 0.0f },
    false,
};

/* ============================================================================
 * Texture Lifecycle
 * ============================================================================ */

static Quadra_Texture *texture_alloc(void) {
    Quadra_Texture *texture = QUADRA_ALLOC(Quadra_Texture);
    if (!texture) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Failed to allocate texture");
    }
    return texture;
}

Quadra_Texture *quadra_texture_create(float width, float height) {
    return quadra_texture_create_trimmed(width, height, NULL);
}

Quadra_Texture *quadra_texture_create_trimmed(float width, float height,
                                              const Quadra_Rect *trim) {
    Quadra_Texture *texture = texture_alloc();
    if (!texture) return NULL;

    texture->orig_width = width;
    texture->orig_height = height;
    if (trim) {
        texture->trim = *trim;
        texture->has_trim = true;
    }
    texture->loaded = true;
    return texture;
}

Quadra_Texture *quadra_texture_create_pending(void) {
    Quadra_Texture *texture = texture_alloc();
    if (!texture) return NULL;

    /* Placeholder frame until the real size arrives */
    texture->orig_width = 1.0f;
    texture->orig_height = 1.0f;
    texture->loaded = false;
    return texture;
}

Quadra_Texture *quadra_texture_create_declared(float width, float height,
                                               const Quadra_Rect *trim) {
    Quadra_Texture *texture = quadra_texture_create_pending();
    if (!texture) return NULL;

    texture->has_declared = true;
    texture->declared_width = width;
    texture->declared_height = height;
    if (trim) {
        texture->declared_trim = *trim;
        texture->declared_has_trim = true;
    }
    return texture;
}

void quadra_texture_destroy(Quadra_Texture *texture) {
    if (!texture || texture->is_static) return;
    free(texture);
}

Quadra_Texture *quadra_texture_get_empty(void) {
    return &s_empty_texture;
}

/* ============================================================================
 * Texture Queries
 * ============================================================================ */

void quadra_texture_get_orig(const Quadra_Texture *texture, float *width, float *height) {
    if (!texture) {
        if (width) *width = 0.0f;
        if (height) *height = 0.0f;
        return;
    }
    if (width) *width = texture->orig_width;
    if (height) *height = texture->orig_height;
}

bool quadra_texture_get_trim(const Quadra_Texture *texture, Quadra_Rect *out_trim) {
    if (!texture || !texture->has_trim) return false;
    if (out_trim) *out_trim = texture->trim;
    return true;
}

bool quadra_texture_has_trim(const Quadra_Texture *texture) {
    return texture ? texture->has_trim : false;
}

bool quadra_texture_has_loaded(const Quadra_Texture *texture) {
    return texture ? texture->loaded : false;
}

/* ============================================================================
 * Readiness
 * ============================================================================ */

bool quadra_texture_mark_loaded(Quadra_Texture *texture, float width, float height,
                                const Quadra_Rect *trim) {
    QUADRA_VALIDATE_PTR_RET(texture, false);

    if (texture->loaded) {
        quadra_log_warning(QUADRA_LOG_TEXTURE,
                           "Texture already loaded (%.0fx%.0f), ignoring mark_loaded",
                           texture->orig_width, texture->orig_height);
        return false;
    }

    texture->orig_width = width;
    texture->orig_height = height;
    if (trim) {
        texture->trim = *trim;
        texture->has_trim = true;
    } else {
        texture->has_trim = false;
    }
    texture->loaded = true;
    texture->has_declared = false;

    /* The frame grew from the placeholder; every cached bounds is stale */
    quadra_generation_bump();

    quadra_log_info(QUADRA_LOG_TEXTURE, "Texture loaded: %.0fx%.0f%s",
                    width, height, trim ? " (trimmed)" : "");
    return true;
}

bool quadra_texture_mark_loaded_declared(Quadra_Texture *texture) {
    QUADRA_VALIDATE_PTR_RET(texture, false);
    QUADRA_VALIDATE_COND_RET(texture->has_declared, "texture declares no frame", false);

    return quadra_texture_mark_loaded(texture, texture->declared_width, texture->declared_height,
                                      texture->declared_has_trim ? &texture->declared_trim : NULL);
}

bool quadra_texture_get_declared(const Quadra_Texture *texture, float *width, float *height,
                                 Quadra_Rect *out_trim, bool *has_trim) {
    if (!texture || !texture->has_declared) return false;

    if (width) *width = texture->declared_width;
    if (height) *height = texture->declared_height;
    if (has_trim) *has_trim = texture->declared_has_trim;
    if (out_trim && texture->declared_has_trim) *out_trim = texture->declared_trim;
    return true;
}

/* ============================================================================
 * Hash Functions
 * ============================================================================ */

/* FNV-1a hash for strings */
static uint32_t hash_string(const char *str) {
    uint32_t hash = 2166136261u;
    while (*str) {
        hash ^= (uint8_t)*str++;
        hash *= 16777619u;
    }
    /* Ensure hash is never 0 (reserved for empty slots) */
    return hash ? hash : 1;
}

static bool grow_hash_table(Quadra_TextureCache *cache) {
    size_t new_capacity = cache->hash_capacity * 2;
    HashEntry *new_table = QUADRA_ALLOC_ARRAY(HashEntry, new_capacity);
    if (!new_table) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "texture cache: failed to grow hash table");
        return false;
    }

    for (size_t i = 0; i < cache->hash_capacity; i++) {
        HashEntry *old_entry = &cache->hash_table[i];
        if (old_entry->hash == 0) continue;

        size_t idx = old_entry->hash & (new_capacity - 1);
        while (new_table[idx].hash != 0) {
            idx = (idx + 1) & (new_capacity - 1);
        }
        new_table[idx] = *old_entry;
    }

    free(cache->hash_table);
    cache->hash_table = new_table;
    cache->hash_capacity = new_capacity;
    return true;
}

/* Returns entry index, or SIZE_MAX if the id is not registered */
static size_t hash_find(const Quadra_TextureCache *cache, const char *frame_id) {
    if (cache->entry_count == 0) return SIZE_MAX;

    uint32_t hash = hash_string(frame_id);
    size_t idx = hash & (cache->hash_capacity - 1);

    while (cache->hash_table[idx].hash != 0) {
        const HashEntry *he = &cache->hash_table[idx];
        if (he->hash == hash) {
            const CacheEntry *entry = &cache->entries[he->entry_index];
            if (strcmp(entry->frame_id, frame_id) == 0) {
                return he->entry_index;
            }
        }
        idx = (idx + 1) & (cache->hash_capacity - 1);
    }
    return SIZE_MAX;
}

static bool grow_entries(Quadra_TextureCache *cache) {
    size_t new_capacity = cache->entry_capacity * 2;
    CacheEntry *new_entries = QUADRA_REALLOC(cache->entries, CacheEntry, new_capacity);
    if (!new_entries) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "texture cache: failed to grow entry array");
        return false;
    }
    cache->entries = new_entries;
    cache->entry_capacity = new_capacity;
    return true;
}

/* ============================================================================
 * Texture Cache
 * ============================================================================ */

Quadra_TextureCache *quadra_texture_cache_create(void) {
    Quadra_TextureCache *cache = QUADRA_ALLOC(Quadra_TextureCache);
    if (!cache) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Failed to allocate texture cache");
        return NULL;
    }

    cache->entries = QUADRA_ALLOC_ARRAY(CacheEntry, INITIAL_CAPACITY);
    cache->hash_table = QUADRA_ALLOC_ARRAY(HashEntry, INITIAL_CAPACITY * 2);
    if (!cache->entries || !cache->hash_table) {
        free(cache->entries);
        free(cache->hash_table);
        free(cache);
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Failed to allocate texture cache storage");
        return NULL;
    }

    cache->entry_capacity = INITIAL_CAPACITY;
    cache->hash_capacity = INITIAL_CAPACITY * 2;
    return cache;
}

void quadra_texture_cache_destroy(Quadra_TextureCache *cache) {
    if (!cache) return;

    for (size_t i = 0; i < cache->entry_count; i++) {
        free(cache->entries[i].frame_id);
        quadra_texture_destroy(cache->entries[i].texture);
    }

    free(cache->entries);
    free(cache->hash_table);
    free(cache);
}

bool quadra_texture_cache_add(Quadra_TextureCache *cache, const char *frame_id,
                              Quadra_Texture *texture) {
    QUADRA_VALIDATE_PTRS2_RET(cache, texture, false);
    QUADRA_VALIDATE_STRING_RET(frame_id, false);

    if (hash_find(cache, frame_id) != SIZE_MAX) {
        quadra_set_error_code(QUADRA_ERROR_ALREADY_EXISTS, "The frameId \"%s\" is already in the texture cache", frame_id);
        return false;
    }

    if ((float)(cache->entry_count + 1) / cache->hash_capacity > HASH_LOAD_FACTOR) {
        if (!grow_hash_table(cache)) return false;
    }
    if (cache->entry_count >= cache->entry_capacity) {
        if (!grow_entries(cache)) return false;
    }

    char *id_copy = strdup(frame_id);
    if (!id_copy) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Out of memory");
        return false;
    }

    uint32_t hash = hash_string(frame_id);
    uint32_t entry_index = (uint32_t)cache->entry_count;

    CacheEntry *entry = &cache->entries[entry_index];
    entry->frame_id = id_copy;
    entry->hash = hash;
    entry->texture = texture;
    cache->entry_count++;

    size_t idx = hash & (cache->hash_capacity - 1);
    while (cache->hash_table[idx].hash != 0) {
        idx = (idx + 1) & (cache->hash_capacity - 1);
    }
    cache->hash_table[idx].hash = hash;
    cache->hash_table[idx].entry_index = entry_index;

    return true;
}

Quadra_Texture *quadra_texture_cache_get(const Quadra_TextureCache *cache, const char *frame_id) {
    QUADRA_VALIDATE_PTRS2_RET(cache, frame_id, NULL);

    size_t index = hash_find(cache, frame_id);
    if (index == SIZE_MAX) {
        quadra_set_error_code(QUADRA_ERROR_NOT_FOUND, "The frameId \"%s\" does not exist in the texture cache", frame_id);
        quadra_log_warning(QUADRA_LOG_TEXTURE, "Unknown frame '%s'", frame_id);
        return NULL;
    }
    return cache->entries[index].texture;
}

bool quadra_texture_cache_has(const Quadra_TextureCache *cache, const char *frame_id) {
    if (!cache || !frame_id) return false;
    return hash_find(cache, frame_id) != SIZE_MAX;
}

size_t quadra_texture_cache_count(const Quadra_TextureCache *cache) {
    return cache ? cache->entry_count : 0;
}

/* ============================================================================
 * TOML Loading
 * ============================================================================ */

/* TOML numbers may be written as integers or floats */
static bool read_number(toml_table_t *table, const char *key, float *out) {
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

static bool parse_frame(Quadra_TextureCache *cache, toml_table_t *frame, int index) {
    toml_datum_t id = toml_string_in(frame, "id");
    if (!id.ok) {
        quadra_set_error_code(QUADRA_ERROR_PARSE, "frame %d: missing 'id'", index);
        return false;
    }

    float width = 0.0f;
    float height = 0.0f;
    if (!read_number(frame, "width", &width) || !read_number(frame, "height", &height)) {
        quadra_set_error_code(QUADRA_ERROR_PARSE, "frame '%s': missing 'width' or 'height'", id.u.s);
        free(id.u.s);
        return false;
    }

    Quadra_Rect trim;
    bool has_trim = false;
    toml_table_t *trim_table = toml_table_in(frame, "trim");
    if (trim_table) {
        if (!read_number(trim_table, "x", &trim.x) ||
            !read_number(trim_table, "y", &trim.y) ||
            !read_number(trim_table, "width", &trim.width) ||
            !read_number(trim_table, "height", &trim.height)) {
            quadra_set_error_code(QUADRA_ERROR_PARSE, "frame '%s': trim needs x, y, width and height", id.u.s);
            free(id.u.s);
            return false;
        }
        has_trim = true;
    }

    bool loaded = true;
    toml_datum_t loaded_d = toml_bool_in(frame, "loaded");
    if (loaded_d.ok) {
        loaded = loaded_d.u.b != 0;
    }

    Quadra_Texture *texture;
    if (loaded) {
        texture = quadra_texture_create_trimmed(width, height, has_trim ? &trim : NULL);
    } else {
        /* Size is known to the file but not yet to the renderer */
        texture = quadra_texture_create_declared(width, height, has_trim ? &trim : NULL);
    }
    if (!texture) {
        free(id.u.s);
        return false;
    }

    if (!quadra_texture_cache_add(cache, id.u.s, texture)) {
        quadra_texture_destroy(texture);
        free(id.u.s);
        return false;
    }

    quadra_log_debug(QUADRA_LOG_TEXTURE, "Registered frame '%s' (%.0fx%.0f%s)",
                     id.u.s, width, height, has_trim ? ", trimmed" : "");
    free(id.u.s);
    return true;
}

static bool parse_frames(Quadra_TextureCache *cache, toml_table_t *root) {
    toml_array_t *frames = toml_array_in(root, "frame");
    if (!frames) {
        /* A file without frames is valid */
        return true;
    }

    int count = toml_array_nelem(frames);
    for (int i = 0; i < count; i++) {
        toml_table_t *frame = toml_table_at(frames, i);
        if (!frame) {
            quadra_set_error_code(QUADRA_ERROR_PARSE, "frame %d: expected a table", i);
            return false;
        }
        if (!parse_frame(cache, frame, i)) {
            return false;
        }
    }
    return true;
}

bool quadra_texture_cache_load(Quadra_TextureCache *cache, const char *path) {
    QUADRA_VALIDATE_PTRS2_RET(cache, path, false);

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

    size_t before = cache->entry_count;
    bool ok = parse_frames(cache, root);
    toml_free(root);

    if (ok) {
        quadra_log_info(QUADRA_LOG_TEXTURE, "Loaded %zu frames from %s",
                        cache->entry_count - before, path);
    }
    return ok;
}

bool quadra_texture_cache_load_string(Quadra_TextureCache *cache, const char *toml_string) {
    QUADRA_VALIDATE_PTRS2_RET(cache, toml_string, false);

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

    bool ok = parse_frames(cache, root);
    toml_free(root);
    return ok;
}
