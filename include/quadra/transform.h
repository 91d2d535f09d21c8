/**
 * Quadra - Node Transform
 *
 * Local position / rotation / scale / pivot plus the accumulated world
 * matrix handed to the geometry core.
 *
 * Key Concepts:
 * - Local values are changed only through the setters, which mark the
 *   local matrix stale.
 * - quadra_transform_update() composes world = parent.world * local, and
 *   only when the local matrix or the parent's world matrix changed.
 * - world_id increments every time the world matrix is rewritten. Readers
 *   keep the last id they consumed and ask quadra_transform_changed_since().
 *
 * Usage:
 *   Quadra_Transform t;
 *   quadra_transform_init(&t);
 *   quadra_transform_set_position(&t, 100.0f, 50.0f);
 *   quadra_transform_update(&t, NULL);           // Root transform
 *
 *   uint32_t seen = 0;
 *   if (quadra_transform_changed_since(&t, &seen)) {
 *       // rebuild anything derived from t.world
 *   }
 */

#ifndef QUADRA_TRANSFORM_H
#define QUADRA_TRANSFORM_H

#include "quadra/matrix.h"
#include "quadra/rect.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Transform {
    /* Local values (read freely, write through setters) */
    float x, y;             /* Position in parent space */
    float scale_x, scale_y; /* 1.0 = normal, negative flips */
    float rotation;         /* Radians */
    float pivot_x, pivot_y; /* Local point placed at (x, y) */

    /* Derived matrices */
    Quadra_Matrix local;
    Quadra_Matrix world;

    /* Change tracking */
    uint32_t local_id;          /* Bumped by setters */
    uint32_t current_local_id;  /* local_id baked into `local` */
    uint32_t parent_id;         /* Parent world_id baked into `world` */
    uint32_t world_id;          /* Bumped whenever `world` is rewritten */
} Quadra_Transform;

/**
 * Reset to identity (scale 1, no rotation, no pivot) with matrices marked
 * stale so the first update computes them.
 */
void quadra_transform_init(Quadra_Transform *t);

/* ============================================================================
 * Local Setters
 * ============================================================================ */

void quadra_transform_set_position(Quadra_Transform *t, float x, float y);
void quadra_transform_set_scale(Quadra_Transform *t, float sx, float sy);
void quadra_transform_set_scale_x(Quadra_Transform *t, float sx);
void quadra_transform_set_scale_y(Quadra_Transform *t, float sy);
void quadra_transform_set_rotation(Quadra_Transform *t, float radians);
void quadra_transform_set_pivot(Quadra_Transform *t, float px, float py);

/**
 * Overwrite the world matrix directly, bypassing local composition.
 * Intended for transforms driven by an external hierarchy. The next
 * quadra_transform_update() recomputes `world` only if the local values
 * or the parent changed afterwards.
 */
void quadra_transform_set_world(Quadra_Transform *t, const Quadra_Matrix *world);

/**
 * Force the next update to recompose against the parent. Called when the
 * transform is moved under a different parent.
 */
void quadra_transform_mark_parent_changed(Quadra_Transform *t);

/* ============================================================================
 * Update / Change Signal
 * ============================================================================ */

/**
 * Recompute the world matrix if needed.
 *
 * @param t      Transform to update
 * @param parent Parent transform (NULL for a root, world = local)
 * @return true if the world matrix was rewritten
 */
bool quadra_transform_update(Quadra_Transform *t, const Quadra_Transform *parent);

/**
 * "Changed since last read" signal.
 *
 * @param t       Transform to query
 * @param last_id In: world_id the caller last consumed. Out: current world_id.
 * @return true if the world matrix changed since *last_id
 */
bool quadra_transform_changed_since(const Quadra_Transform *t, uint32_t *last_id);

/* ============================================================================
 * Coordinate Conversion
 * ============================================================================ */

void quadra_transform_local_to_world(const Quadra_Transform *t,
                                     const Quadra_Point *local,
                                     Quadra_Point *out_world);

/**
 * @return false if the world matrix is singular (out is NaN)
 */
bool quadra_transform_world_to_local(const Quadra_Transform *t,
                                     const Quadra_Point *world,
                                     Quadra_Point *out_local);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_TRANSFORM_H */
