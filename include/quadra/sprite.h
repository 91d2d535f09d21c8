/**
 * @file sprite.h
 * @brief Textured quad geometry attached to a scene node.
 *
 * A sprite turns its node's world transform, its texture frame and an
 * anchor into:
 * - the four world-space corners of the render quad (trimmed content),
 * - the four corners of the bounds quad (always the full logical frame),
 * - an axis-aligned bounding rectangle merged with the node's children,
 * - point containment through the inverse world transform.
 *
 * @section sprite_usage Basic Usage
 * @code
 *   Quadra_Node *node = quadra_node_create("hero");
 *   Quadra_Sprite *sprite = quadra_sprite_create(node, texture);
 *   quadra_sprite_set_anchor(sprite, 0.5f, 0.5f);
 *   quadra_sprite_set_width(sprite, 128.0f);      // Scales to 128 units wide
 *
 *   // Each frame:
 *   quadra_node_update_transform(root);
 *   quadra_node_update_geometry(root);
 *   if (quadra_sprite_geometry_updated(sprite)) {
 *       upload(quadra_sprite_get_vertex_data(sprite));   // 8 floats, 4 corners
 *       quadra_sprite_clear_geometry_updated(sprite);
 *   }
 *
 *   Quadra_Rect bounds;
 *   quadra_sprite_get_bounds(sprite, &bounds);
 * @endcode
 *
 * @section sprite_vertex_layout Vertex Layout
 * 16 floats owned by the sprite. Slots 0-7 hold the render quad, slots 8-15
 * the bounds quad, each as x,y pairs in the order top-left, top-right,
 * bottom-right, bottom-left (in local orientation). The pointer returned by
 * quadra_sprite_get_vertex_data() stays valid for the sprite's lifetime;
 * its contents change on the next recomputation.
 *
 * @section sprite_ownership Ownership
 * - The sprite is owned by its node and destroyed with it.
 * - The texture is borrowed and must outlive the sprite.
 *
 * @section sprite_thread_safety Thread Safety
 * NOT thread-safe. Call from the render-loop thread only.
 */

#ifndef QUADRA_SPRITE_H
#define QUADRA_SPRITE_H

#include "quadra/node.h"
#include "quadra/rect.h"
#include "quadra/texture.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Sprite Quadra_Sprite;

/** Floats in a sprite's geometry buffer */
#define QUADRA_SPRITE_VERTEX_FLOATS 16

/** Offset of the bounds quad inside the geometry buffer */
#define QUADRA_SPRITE_BOUNDS_OFFSET 8

/** Tint value that leaves texture colors unchanged */
#define QUADRA_TINT_NONE 0xFFFFFFu

typedef enum Quadra_BlendMode {
    QUADRA_BLEND_NORMAL = 0,
    QUADRA_BLEND_ADD,
    QUADRA_BLEND_MULTIPLY,
    QUADRA_BLEND_SCREEN
} Quadra_BlendMode;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * Create a sprite and attach it to node as its renderable, replacing any
 * previous renderable. The anchor starts at the configured default
 * (see quadra_config_apply()).
 *
 * @param node    Host node (takes ownership of the sprite)
 * @param texture Texture to display, or NULL for the empty 1x1 texture
 * @return New sprite, or NULL on failure
 */
Quadra_Sprite *quadra_sprite_create(Quadra_Node *node, Quadra_Texture *texture);

/**
 * Create a sprite showing a frame registered in a texture cache.
 *
 * @return New sprite, or NULL with
 *         `The frameId "<id>" does not exist in the texture cache`
 */
Quadra_Sprite *quadra_sprite_from_frame(const Quadra_TextureCache *cache,
                                        Quadra_Node *node,
                                        const char *frame_id);

/**
 * Detach the sprite from its node and destroy it. Safe to pass NULL.
 */
void quadra_sprite_destroy(Quadra_Sprite *sprite);

/**
 * @return The sprite attached to node, or NULL if its renderable is not a sprite
 */
Quadra_Sprite *quadra_sprite_get(const Quadra_Node *node);

Quadra_Node *quadra_sprite_get_node(const Quadra_Sprite *sprite);

/* ============================================================================
 * Texture
 * ============================================================================ */

/**
 * Replace the texture. No-op when texture is already current.
 * Resets the cached tint and marks geometry dirty. A texture that has not
 * loaded yet is watched; its size is picked up by the next poll.
 *
 * @param texture New texture, or NULL for the empty 1x1 texture
 */
void quadra_sprite_set_texture(Quadra_Sprite *sprite, Quadra_Texture *texture);

Quadra_Texture *quadra_sprite_get_texture(const Quadra_Sprite *sprite);

/**
 * Consume a pending texture load, at most once per texture assignment.
 * Reapplies any width/height set while the texture was pending.
 *
 * @return true if the texture finished loading since the last poll
 */
bool quadra_sprite_poll_texture(Quadra_Sprite *sprite);

/* ============================================================================
 * Anchor
 * ============================================================================ */

/**
 * Set the anchor. (0,0) places the frame's top-left corner on the node's
 * origin, (0.5,0.5) its center. Not clamped.
 */
void quadra_sprite_set_anchor(Quadra_Sprite *sprite, float ax, float ay);
void quadra_sprite_get_anchor(const Quadra_Sprite *sprite, float *ax, float *ay);

/* ============================================================================
 * Geometry
 * ============================================================================ */

/**
 * Write the render quad (slots 0-7) from the current world transform,
 * frame, trim and anchor. Unconditional.
 */
void quadra_sprite_calculate_vertices(Quadra_Sprite *sprite);

/**
 * Write the bounds quad (slots 8-15). Copies the render quad when the
 * texture is untrimmed or the trim covers the whole frame, otherwise
 * recomputes from the logical frame. Requires slots 0-7 to be current.
 */
void quadra_sprite_calculate_bounds_vertices(Quadra_Sprite *sprite);

/**
 * Per-frame entry point. Polls the texture, then recomputes both quads if
 * the world transform changed since the last recomputation or the texture
 * is dirty.
 *
 * @return true if the geometry was recomputed
 */
bool quadra_sprite_update_geometry(Quadra_Sprite *sprite);

/**
 * Read-only geometry buffer (QUADRA_SPRITE_VERTEX_FLOATS floats).
 * Does not recompute; call quadra_sprite_update_geometry() first.
 */
const float *quadra_sprite_get_vertex_data(const Quadra_Sprite *sprite);

/**
 * "Geometry just recomputed" flag for the rendering backend.
 */
bool quadra_sprite_geometry_updated(const Quadra_Sprite *sprite);
void quadra_sprite_clear_geometry_updated(Quadra_Sprite *sprite);

/* ============================================================================
 * Bounds / Hit Testing
 * ============================================================================ */

/**
 * World-space axis-aligned bounds of the logical frame, merged with the
 * bounds of the node's visible children. Memoized until anything in the
 * scene changes. World transforms are used as last updated.
 */
void quadra_sprite_get_bounds(Quadra_Sprite *sprite, Quadra_Rect *out_bounds);

/**
 * Drop every memoized bounds rectangle.
 */
void quadra_sprite_invalidate_bounds(Quadra_Sprite *sprite);

/**
 * Logical frame in local space: (-W*ax, -H*ay, W, H).
 */
void quadra_sprite_get_local_bounds(const Quadra_Sprite *sprite, Quadra_Rect *out_bounds);

/**
 * Whether a world-space point lies strictly inside the logical frame.
 * Points on the edge are outside. Always false for a singular transform.
 */
bool quadra_sprite_contains_point(const Quadra_Sprite *sprite, const Quadra_Point *world_point);

/* ============================================================================
 * Sizing
 * ============================================================================ */

/** |scale_x| * frame width */
float quadra_sprite_get_width(const Quadra_Sprite *sprite);

/**
 * Scale the node so the frame is `width` units wide, keeping the sign of
 * scale_x (positive when scale_x is 0). The width is remembered and
 * reapplied when a pending texture loads.
 */
void quadra_sprite_set_width(Quadra_Sprite *sprite, float width);

float quadra_sprite_get_height(const Quadra_Sprite *sprite);
void quadra_sprite_set_height(Quadra_Sprite *sprite, float height);

/* ============================================================================
 * Render State
 * ============================================================================ */

/** 0xRRGGBB, QUADRA_TINT_NONE by default */
void quadra_sprite_set_tint(Quadra_Sprite *sprite, uint32_t tint);
uint32_t quadra_sprite_get_tint(const Quadra_Sprite *sprite);

/**
 * Tint last baked by the backend. Reset to QUADRA_TINT_NONE whenever the
 * texture changes.
 */
uint32_t quadra_sprite_get_cached_tint(const Quadra_Sprite *sprite);
void quadra_sprite_set_cached_tint(Quadra_Sprite *sprite, uint32_t tint);

void quadra_sprite_set_blend_mode(Quadra_Sprite *sprite, Quadra_BlendMode mode);
Quadra_BlendMode quadra_sprite_get_blend_mode(const Quadra_Sprite *sprite);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_SPRITE_H */
