/*
 * Quadra - Sprite Geometry Implementation
 */

#include "quadra/sprite.h"
#include "quadra/quadra.h"
#include "quadra/config.h"
#include "quadra/generation.h"
#include "quadra/log.h"
#include "quadra/transform.h"
#include "quadra/validate.h"
#include <math.h>
#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Internal Structure
 * ============================================================================ */

struct Quadra_Sprite {
    Quadra_Node *node;              /* Host node (owns this sprite) */
    Quadra_Texture *texture;        /* Borrowed, never NULL after create */

    float anchor_x;
    float anchor_y;

    /* Render quad in 0-7, bounds quad in 8-15 */
    float vertex_data[QUADRA_SPRITE_VERTEX_FLOATS];
    uint32_t transform_id;          /* World id baked into vertex_data */
    bool texture_dirty;
    bool pending_texture;           /* Waiting for the texture to load */
    bool geometry_updated;

    /* Size requested through set_width/height, reapplied on texture load */
    float desired_width;
    float desired_height;
    bool has_desired_width;
    bool has_desired_height;

    Quadra_Rect bounds;
    uint64_t bounds_generation;

    uint32_t tint;
    uint32_t cached_tint;
    Quadra_BlendMode blend_mode;
};

/* ============================================================================
 * Renderable Interface
 * ============================================================================ */

static void sprite_compute_vertices(void *impl)
{
    quadra_sprite_update_geometry((Quadra_Sprite *)impl);
}

static void sprite_compute_bounds(void *impl, Quadra_Rect *out_bounds)
{
    quadra_sprite_get_bounds((Quadra_Sprite *)impl, out_bounds);
}

static bool sprite_hit_test(void *impl, const Quadra_Point *world_point)
{
    return quadra_sprite_contains_point((const Quadra_Sprite *)impl, world_point);
}

static void sprite_destroy(void *impl)
{
    free(impl);
}

static const Quadra_RenderableVTable s_sprite_vtable = {
    "Sprite",
    sprite_compute_vertices,
    sprite_compute_bounds,
    sprite_hit_test,
    sprite_destroy,
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static float sign_or_one(float v)
{
    if (v < 0.0f) return -1.0f;
    return 1.0f;
}

/* Transform the local box (w1,h1)-(w0,h0) into 8 floats, clockwise from top-left */
static void write_quad(float *out, const Quadra_Matrix *wt,
                       float w0, float w1, float h0, float h1)
{
    const float a = wt->a, b = wt->b, c = wt->c, d = wt->d;
    const float tx = wt->tx, ty = wt->ty;

    out[0] = a * w1 + c * h1 + tx;
    out[1] = d * h1 + b * w1 + ty;

    out[2] = a * w0 + c * h1 + tx;
    out[3] = d * h1 + b * w0 + ty;

    out[4] = a * w0 + c * h0 + tx;
    out[5] = d * h0 + b * w0 + ty;

    out[6] = a * w1 + c * h0 + tx;
    out[7] = d * h0 + b * w1 + ty;
}

/* Untrimmed box around the anchor */
static void write_frame_quad(const Quadra_Sprite *sprite, float *out)
{
    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);

    const float w0 = width * (1.0f - sprite->anchor_x);
    const float w1 = width * -sprite->anchor_x;
    const float h0 = height * (1.0f - sprite->anchor_y);
    const float h1 = height * -sprite->anchor_y;

    write_quad(out, &quadra_node_get_transform_const(sprite->node)->world, w0, w1, h0, h1);
}

/* The texture's frame is now known: refresh geometry and reapply requested size */
static void sprite_on_texture_update(Quadra_Sprite *sprite)
{
    sprite->texture_dirty = true;

    if (!sprite->has_desired_width && !sprite->has_desired_height) {
        return;
    }

    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);
    Quadra_Transform *t = quadra_node_get_transform(sprite->node);

    if (sprite->has_desired_width) {
        quadra_transform_set_scale_x(t, sign_or_one(t->scale_x) * sprite->desired_width / width);
    }
    if (sprite->has_desired_height) {
        quadra_transform_set_scale_y(t, sign_or_one(t->scale_y) * sprite->desired_height / height);
    }
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Quadra_Sprite *quadra_sprite_create(Quadra_Node *node, Quadra_Texture *texture)
{
    QUADRA_VALIDATE_PTR_RET(node, NULL);

    Quadra_Sprite *sprite = QUADRA_ALLOC(Quadra_Sprite);
    if (!sprite) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Failed to allocate sprite");
        return NULL;
    }

    const Quadra_Config *config = quadra_config_get_active();

    sprite->node = node;
    sprite->anchor_x = config->default_anchor_x;
    sprite->anchor_y = config->default_anchor_y;
    sprite->tint = QUADRA_TINT_NONE;
    sprite->cached_tint = QUADRA_TINT_NONE;
    sprite->blend_mode = QUADRA_BLEND_NORMAL;
    sprite->bounds_generation = QUADRA_GENERATION_NONE;

    quadra_sprite_set_texture(sprite, texture);
    sprite->texture_dirty = true;

    Quadra_Renderable renderable = { &s_sprite_vtable, sprite };
    quadra_node_set_renderable(node, renderable);

    return sprite;
}

Quadra_Sprite *quadra_sprite_from_frame(const Quadra_TextureCache *cache,
                                        Quadra_Node *node,
                                        const char *frame_id)
{
    QUADRA_VALIDATE_PTRS2_RET(cache, node, NULL);

    Quadra_Texture *texture = quadra_texture_cache_get(cache, frame_id);
    if (!texture) {
        return NULL;
    }

    return quadra_sprite_create(node, texture);
}

void quadra_sprite_destroy(Quadra_Sprite *sprite)
{
    if (!sprite) return;

    /* The node releases the sprite through the vtable */
    Quadra_Renderable none = { NULL, NULL };
    quadra_node_set_renderable(sprite->node, none);
}

Quadra_Sprite *quadra_sprite_get(const Quadra_Node *node)
{
    const Quadra_Renderable *renderable = quadra_node_get_renderable(node);
    if (!renderable || renderable->vtable != &s_sprite_vtable) {
        return NULL;
    }
    return (Quadra_Sprite *)renderable->impl;
}

Quadra_Node *quadra_sprite_get_node(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->node : NULL;
}

/* ============================================================================
 * Texture
 * ============================================================================ */

void quadra_sprite_set_texture(Quadra_Sprite *sprite, Quadra_Texture *texture)
{
    QUADRA_VALIDATE_PTR(sprite);

    if (!texture) {
        texture = quadra_texture_get_empty();
    }
    if (sprite->texture == texture) {
        return;
    }

    sprite->texture = texture;
    sprite->cached_tint = QUADRA_TINT_NONE;
    sprite->texture_dirty = true;
    sprite->pending_texture = false;

    if (quadra_texture_has_loaded(texture)) {
        sprite_on_texture_update(sprite);
    } else {
        sprite->pending_texture = true;
        quadra_log_debug(QUADRA_LOG_TEXTURE, "Node '%s' waiting for texture to load",
                         quadra_node_get_name(sprite->node));
    }

    quadra_generation_bump();
}

Quadra_Texture *quadra_sprite_get_texture(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->texture : NULL;
}

bool quadra_sprite_poll_texture(Quadra_Sprite *sprite)
{
    if (!sprite || !sprite->pending_texture) return false;
    if (!quadra_texture_has_loaded(sprite->texture)) return false;

    sprite->pending_texture = false;
    sprite_on_texture_update(sprite);
    quadra_generation_bump();

    quadra_log_info(QUADRA_LOG_TEXTURE, "Node '%s' texture ready",
                    quadra_node_get_name(sprite->node));
    return true;
}

/* ============================================================================
 * Anchor
 * ============================================================================ */

void quadra_sprite_set_anchor(Quadra_Sprite *sprite, float ax, float ay)
{
    QUADRA_VALIDATE_PTR(sprite);

    sprite->anchor_x = ax;
    sprite->anchor_y = ay;
    sprite->texture_dirty = true;
    quadra_generation_bump();
}

void quadra_sprite_get_anchor(const Quadra_Sprite *sprite, float *ax, float *ay)
{
    if (!sprite) return;
    if (ax) *ax = sprite->anchor_x;
    if (ay) *ay = sprite->anchor_y;
}

/* ============================================================================
 * Geometry
 * ============================================================================ */

void quadra_sprite_calculate_vertices(Quadra_Sprite *sprite)
{
    QUADRA_VALIDATE_PTR(sprite);

    Quadra_Rect trim;
    if (!quadra_texture_get_trim(sprite->texture, &trim)) {
        write_frame_quad(sprite, sprite->vertex_data);
        return;
    }

    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);

    /* Offset the trimmed content inside the logical frame */
    const float w1 = trim.x - sprite->anchor_x * width;
    const float w0 = w1 + trim.width;
    const float h1 = trim.y - sprite->anchor_y * height;
    const float h0 = h1 + trim.height;

    write_quad(sprite->vertex_data, &quadra_node_get_transform_const(sprite->node)->world,
               w0, w1, h0, h1);
}

void quadra_sprite_calculate_bounds_vertices(Quadra_Sprite *sprite)
{
    QUADRA_VALIDATE_PTR(sprite);

    float *bounds_quad = &sprite->vertex_data[QUADRA_SPRITE_BOUNDS_OFFSET];

    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);

    Quadra_Rect trim;
    if (!quadra_texture_get_trim(sprite->texture, &trim) ||
        (trim.width == width && trim.height == height)) {
        memcpy(bounds_quad, sprite->vertex_data, QUADRA_SPRITE_BOUNDS_OFFSET * sizeof(float));
        return;
    }

    write_frame_quad(sprite, bounds_quad);
}

bool quadra_sprite_update_geometry(Quadra_Sprite *sprite)
{
    if (!sprite) return false;

    quadra_sprite_poll_texture(sprite);

    const Quadra_Transform *t = quadra_node_get_transform_const(sprite->node);
    bool moved = quadra_transform_changed_since(t, &sprite->transform_id);
    if (!moved && !sprite->texture_dirty) {
        return false;
    }

    sprite->texture_dirty = false;
    quadra_sprite_calculate_vertices(sprite);
    quadra_sprite_calculate_bounds_vertices(sprite);
    sprite->geometry_updated = true;

    quadra_log_debug(QUADRA_LOG_GEOMETRY, "Node '%s' geometry recomputed (world %u)",
                     quadra_node_get_name(sprite->node), (unsigned)sprite->transform_id);
    return true;
}

const float *quadra_sprite_get_vertex_data(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->vertex_data : NULL;
}

bool quadra_sprite_geometry_updated(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->geometry_updated : false;
}

void quadra_sprite_clear_geometry_updated(Quadra_Sprite *sprite)
{
    if (sprite) sprite->geometry_updated = false;
}

/* ============================================================================
 * Bounds / Hit Testing
 * ============================================================================ */

void quadra_sprite_get_bounds(Quadra_Sprite *sprite, Quadra_Rect *out_bounds)
{
    QUADRA_VALIDATE_PTRS2(sprite, out_bounds);

    quadra_sprite_update_geometry(sprite);

    if (sprite->bounds_generation == quadra_generation_current()) {
        *out_bounds = sprite->bounds;
        return;
    }

    Quadra_Rect rect;
    quadra_rect_from_quad(&sprite->vertex_data[QUADRA_SPRITE_BOUNDS_OFFSET], &rect);

    if (quadra_node_get_child_count(sprite->node) > 0) {
        Quadra_Rect child_bounds;
        if (quadra_node_get_children_bounds(sprite->node, &child_bounds)) {
            quadra_rect_union(&rect, &child_bounds, &rect);
        }
    }

    sprite->bounds = rect;
    sprite->bounds_generation = quadra_generation_current();
    *out_bounds = rect;
}

void quadra_sprite_invalidate_bounds(Quadra_Sprite *sprite)
{
    QUADRA_VALIDATE_PTR(sprite);

    sprite->bounds_generation = QUADRA_GENERATION_NONE;
    quadra_generation_bump();
}

void quadra_sprite_get_local_bounds(const Quadra_Sprite *sprite, Quadra_Rect *out_bounds)
{
    QUADRA_VALIDATE_PTRS2(sprite, out_bounds);

    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);

    out_bounds->x = -width * sprite->anchor_x;
    out_bounds->y = -height * sprite->anchor_y;
    out_bounds->width = width;
    out_bounds->height = height;
}

bool quadra_sprite_contains_point(const Quadra_Sprite *sprite, const Quadra_Point *world_point)
{
    if (!sprite || !world_point) return false;

    Quadra_Point local;
    if (!quadra_transform_world_to_local(quadra_node_get_transform_const(sprite->node),
                                         world_point, &local)) {
        return false;
    }

    float width, height;
    quadra_texture_get_orig(sprite->texture, &width, &height);

    const float x1 = -width * sprite->anchor_x;
    if (local.x > x1 && local.x < x1 + width) {
        const float y1 = -height * sprite->anchor_y;
        if (local.y > y1 && local.y < y1 + height) {
            return true;
        }
    }

    return false;
}

/* ============================================================================
 * Sizing
 * ============================================================================ */

float quadra_sprite_get_width(const Quadra_Sprite *sprite)
{
    if (!sprite) return 0.0f;

    float width;
    quadra_texture_get_orig(sprite->texture, &width, NULL);
    return fabsf(quadra_node_get_transform_const(sprite->node)->scale_x) * width;
}

void quadra_sprite_set_width(Quadra_Sprite *sprite, float width)
{
    QUADRA_VALIDATE_PTR(sprite);

    float orig_width;
    quadra_texture_get_orig(sprite->texture, &orig_width, NULL);

    Quadra_Transform *t = quadra_node_get_transform(sprite->node);
    quadra_transform_set_scale_x(t, sign_or_one(t->scale_x) * width / orig_width);

    sprite->desired_width = width;
    sprite->has_desired_width = true;
}

float quadra_sprite_get_height(const Quadra_Sprite *sprite)
{
    if (!sprite) return 0.0f;

    float height;
    quadra_texture_get_orig(sprite->texture, NULL, &height);
    return fabsf(quadra_node_get_transform_const(sprite->node)->scale_y) * height;
}

void quadra_sprite_set_height(Quadra_Sprite *sprite, float height)
{
    QUADRA_VALIDATE_PTR(sprite);

    float orig_height;
    quadra_texture_get_orig(sprite->texture, NULL, &orig_height);

    Quadra_Transform *t = quadra_node_get_transform(sprite->node);
    quadra_transform_set_scale_y(t, sign_or_one(t->scale_y) * height / orig_height);

    sprite->desired_height = height;
    sprite->has_desired_height = true;
}

/* ============================================================================
 * Render State
 * ============================================================================ */

void quadra_sprite_set_tint(Quadra_Sprite *sprite, uint32_t tint)
{
    if (sprite) sprite->tint = tint & 0xFFFFFFu;
}

uint32_t quadra_sprite_get_tint(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->tint : QUADRA_TINT_NONE;
}

uint32_t quadra_sprite_get_cached_tint(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->cached_tint : QUADRA_TINT_NONE;
}

void quadra_sprite_set_cached_tint(Quadra_Sprite *sprite, uint32_t tint)
{
    if (sprite) sprite->cached_tint = tint & 0xFFFFFFu;
}

void quadra_sprite_set_blend_mode(Quadra_Sprite *sprite, Quadra_BlendMode mode)
{
    if (sprite) sprite->blend_mode = mode;
}

Quadra_BlendMode quadra_sprite_get_blend_mode(const Quadra_Sprite *sprite)
{
    return sprite ? sprite->blend_mode : QUADRA_BLEND_NORMAL;
}
