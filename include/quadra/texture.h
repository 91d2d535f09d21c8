/**
 * @file texture.h
 * @brief Texture frame metadata and the frame-id texture cache.
 *
 * A Quadra_Texture carries only what the geometry core reads from a
 * texture: the logical frame ("orig", the full untrimmed size), an optional
 * trim rectangle (the opaque sub-region packed into an atlas), and whether
 * its dimensions are known yet. Pixel data and GPU resources live with the
 * renderer and are not modelled here.
 *
 * @section texture_ready Readiness
 * A texture created with quadra_texture_create_pending() reports a 1x1
 * frame until quadra_texture_mark_loaded() supplies its real size. The
 * transition happens at most once; sprites poll for it (see sprite.h).
 *
 * @section texture_cache Texture Cache
 * @code
 *   Quadra_TextureCache *cache = quadra_texture_cache_create();
 *   quadra_texture_cache_load(cache, "assets/frames.toml");
 *
 *   Quadra_Texture *tex = quadra_texture_cache_get(cache, "hero_idle");
 *   if (!tex) {
 *       // quadra_get_last_error(): The frameId "hero_idle" does not exist ...
 *   }
 *
 *   quadra_texture_cache_destroy(cache);   // Destroys cached textures
 * @endcode
 *
 * Frame file format:
 * @code
 *   [[frame]]
 *   id = "hero_idle"
 *   width = 64
 *   height = 64
 *   trim = { x = 2, y = 3, width = 60, height = 58 }   # optional
 *   loaded = true                                      # optional, default true
 * @endcode
 *
 * @section texture_ownership Ownership
 * - Textures from quadra_texture_create*() are owned by the caller until
 *   handed to quadra_texture_cache_add(), which takes ownership.
 * - The empty texture from quadra_texture_get_empty() is static; never destroy it.
 * - Textures must outlive every sprite that references them.
 */

#ifndef QUADRA_TEXTURE_H
#define QUADRA_TEXTURE_H

#include "quadra/rect.h"
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Texture Quadra_Texture;
typedef struct Quadra_TextureCache Quadra_TextureCache;

/* ============================================================================
 * Texture Lifecycle
 * ============================================================================ */

/**
 * Create a loaded texture with an untrimmed logical frame.
 *
 * @return New texture, or NULL on allocation failure
 */
Quadra_Texture *quadra_texture_create(float width, float height);

/**
 * Create a loaded texture whose opaque content occupies `trim` inside the
 * logical frame. `trim` is not checked against the frame.
 *
 * @param trim Trim rectangle (NULL behaves like quadra_texture_create)
 */
Quadra_Texture *quadra_texture_create_trimmed(float width, float height,
                                              const Quadra_Rect *trim);

/**
 * Create a texture whose dimensions are not known yet.
 * It reports a 1x1 frame until quadra_texture_mark_loaded().
 */
Quadra_Texture *quadra_texture_create_pending(void);

/**
 * Create a pending texture that remembers the frame it is expected to have.
 * It still reports a 1x1 frame until loaded; quadra_texture_mark_loaded_declared()
 * applies the remembered frame.
 *
 * @param trim Expected trim rectangle, or NULL for untrimmed
 */
Quadra_Texture *quadra_texture_create_declared(float width, float height,
                                               const Quadra_Rect *trim);

/**
 * Destroy a texture. Safe to pass NULL. Destroying the empty texture is
 * ignored.
 */
void quadra_texture_destroy(Quadra_Texture *texture);

/**
 * Shared 1x1 loaded texture used when a sprite has no texture.
 */
Quadra_Texture *quadra_texture_get_empty(void);

/* ============================================================================
 * Texture Queries
 * ============================================================================ */

/**
 * Logical (untrimmed) frame size.
 */
void quadra_texture_get_orig(const Quadra_Texture *texture, float *width, float *height);

/**
 * @return true and fill out_trim if the texture is trimmed
 */
bool quadra_texture_get_trim(const Quadra_Texture *texture, Quadra_Rect *out_trim);

bool quadra_texture_has_trim(const Quadra_Texture *texture);

bool quadra_texture_has_loaded(const Quadra_Texture *texture);

/* ============================================================================
 * Readiness
 * ============================================================================ */

/**
 * Supply the real dimensions of a pending texture and flip it to loaded.
 * Fires at most once per texture.
 *
 * @param trim Trim rectangle, or NULL for untrimmed
 * @return false if the texture was already loaded (nothing changes)
 */
bool quadra_texture_mark_loaded(Quadra_Texture *texture, float width, float height,
                                const Quadra_Rect *trim);

/**
 * Load a texture made by quadra_texture_create_declared() with the frame it
 * declared. Fails with QUADRA_ERROR_INVALID_ARGUMENT when nothing was declared
 * or the texture already loaded.
 */
bool quadra_texture_mark_loaded_declared(Quadra_Texture *texture);

/**
 * Frame remembered by quadra_texture_create_declared().
 *
 * @param out_trim Filled when a trim was declared (can be NULL)
 * @return false if the texture declared no frame
 */
bool quadra_texture_get_declared(const Quadra_Texture *texture, float *width, float *height,
                                 Quadra_Rect *out_trim, bool *has_trim);

/* ============================================================================
 * Texture Cache
 * ============================================================================ */

Quadra_TextureCache *quadra_texture_cache_create(void);

/**
 * Destroy the cache and every texture it owns. Safe to pass NULL.
 */
void quadra_texture_cache_destroy(Quadra_TextureCache *cache);

/**
 * Register a texture under a frame id. The cache takes ownership.
 *
 * @return false if the id is empty or already registered (texture is not
 *         taken in that case)
 */
bool quadra_texture_cache_add(Quadra_TextureCache *cache, const char *frame_id,
                              Quadra_Texture *texture);

/**
 * Look up a texture by frame id.
 *
 * @return Texture (owned by the cache), or NULL with the error
 *         `The frameId "<id>" does not exist in the texture cache`
 */
Quadra_Texture *quadra_texture_cache_get(const Quadra_TextureCache *cache, const char *frame_id);

bool quadra_texture_cache_has(const Quadra_TextureCache *cache, const char *frame_id);

size_t quadra_texture_cache_count(const Quadra_TextureCache *cache);

/**
 * Load `[[frame]]` entries from a TOML file into the cache.
 *
 * @return false on I/O or parse failure, or if any frame was rejected
 *         (frames before the failure stay registered)
 */
bool quadra_texture_cache_load(Quadra_TextureCache *cache, const char *path);

bool quadra_texture_cache_load_string(Quadra_TextureCache *cache, const char *toml_string);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_TEXTURE_H */
