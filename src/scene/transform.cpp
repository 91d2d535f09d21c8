/**
 * Quadra - Node Transform Implementation
 */

#include "quadra/transform.h"
#include "quadra/generation.h"
#include <stdint.h>

/* Parent id that no real world_id matches, forcing the first composition */
#define PARENT_ID_UNSET UINT32_MAX

/* ============================================================================
 * Internal
 * ============================================================================ */

static void mark_local_dirty(Quadra_Transform *t) {
    t->local_id++;
    quadra_generation_bump();
}

/* ============================================================================
 * Init / Setters
 * ============================================================================ */

void quadra_transform_init(Quadra_Transform *t) {
    if (!t) return;

    t->x = 0.0f;
    t->y = 0.0f;
    t->scale_x = 1.0f;
    t->scale_y = 1.0f;
    t->rotation = 0.0f;
    t->pivot_x = 0.0f;
    t->pivot_y = 0.0f;

    quadra_matrix_identity(&t->local);
    quadra_matrix_identity(&t->world);

    t->local_id = 1;
    t->current_local_id = 0;
    t->parent_id = PARENT_ID_UNSET;
    t->world_id = 0;
}

void quadra_transform_set_position(Quadra_Transform *t, float x, float y) {
    if (!t) return;
    t->x = x;
    t->y = y;
    mark_local_dirty(t);
}

void quadra_transform_set_scale(Quadra_Transform *t, float sx, float sy) {
    if (!t) return;
    t->scale_x = sx;
    t->scale_y = sy;
    mark_local_dirty(t);
}

void quadra_transform_set_scale_x(Quadra_Transform *t, float sx) {
    if (!t) return;
    t->scale_x = sx;
    mark_local_dirty(t);
}

void quadra_transform_set_scale_y(Quadra_Transform *t, float sy) {
    if (!t) return;
    t->scale_y = sy;
    mark_local_dirty(t);
}

void quadra_transform_set_rotation(Quadra_Transform *t, float radians) {
    if (!t) return;
    t->rotation = radians;
    mark_local_dirty(t);
}

void quadra_transform_set_pivot(Quadra_Transform *t, float px, float py) {
    if (!t) return;
    t->pivot_x = px;
    t->pivot_y = py;
    mark_local_dirty(t);
}

void quadra_transform_set_world(Quadra_Transform *t, const Quadra_Matrix *world) {
    if (!t || !world) return;
    t->world = *world;
    t->world_id++;
    quadra_generation_bump();
}

void quadra_transform_mark_parent_changed(Quadra_Transform *t) {
    if (!t) return;
    t->parent_id = PARENT_ID_UNSET;
    quadra_generation_bump();
}

/* ============================================================================
 * Update
 * ============================================================================ */

bool quadra_transform_update(Quadra_Transform *t, const Quadra_Transform *parent) {
    if (!t) return false;

    bool local_changed = false;
    if (t->local_id != t->current_local_id) {
        quadra_matrix_compose(&t->local,
                              t->x, t->y,
                              t->rotation,
                              t->scale_x, t->scale_y,
                              t->pivot_x, t->pivot_y);
        t->current_local_id = t->local_id;
        local_changed = true;
    }

    uint32_t parent_world_id = parent ? parent->world_id : 0;
    if (!local_changed && t->parent_id == parent_world_id) {
        return false;
    }

    if (parent) {
        quadra_matrix_multiply(&parent->world, &t->local, &t->world);
    } else {
        t->world = t->local;
    }

    t->parent_id = parent_world_id;
    t->world_id++;
    quadra_generation_bump();
    return true;
}

bool quadra_transform_changed_since(const Quadra_Transform *t, uint32_t *last_id) {
    if (!t || !last_id) return true;

    bool changed = *last_id != t->world_id;
    *last_id = t->world_id;
    return changed;
}

/* ============================================================================
 * Coordinate Conversion
 * ============================================================================ */

void quadra_transform_local_to_world(const Quadra_Transform *t,
                                     const Quadra_Point *local,
                                     Quadra_Point *out_world) {
    if (!t || !local || !out_world) return;
    quadra_matrix_apply(&t->world, local, out_world);
}

bool quadra_transform_world_to_local(const Quadra_Transform *t,
                                     const Quadra_Point *world,
                                     Quadra_Point *out_local) {
    if (!t || !world || !out_local) return false;
    return quadra_matrix_apply_inverse(&t->world, world, out_local);
}
