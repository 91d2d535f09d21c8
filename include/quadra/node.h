/**
 * Quadra - Scene Node
 *
 * Minimal scene-graph host for the geometry core. A node has a transform,
 * an ordered list of children, a visibility flag and an optional
 * renderable capability. Behavior such as "is a textured quad" is attached
 * as a Quadra_Renderable rather than by specializing the node.
 *
 * Usage:
 *   Quadra_Node *root = quadra_node_create("root");
 *   Quadra_Node *hero = quadra_node_create("hero");
 *   quadra_node_add_child(root, hero);
 *
 *   quadra_sprite_create(hero, texture);   // Attaches a renderable to hero
 *
 *   // Each frame:
 *   quadra_node_update_transform(root);
 *   quadra_node_update_geometry(root);
 *
 *   Quadra_Rect bounds;
 *   quadra_node_get_bounds(root, &bounds);
 *
 *   quadra_node_destroy(root);             // Destroys hero and its sprite
 *
 * Ownership:
 * - A node owns its children and its renderable.
 * - quadra_node_remove_child() hands ownership of the child back to the caller.
 *
 * Thread Safety:
 * NOT thread-safe. All calls happen on the render-loop thread.
 */

#ifndef QUADRA_NODE_H
#define QUADRA_NODE_H

#include "quadra/rect.h"
#include "quadra/transform.h"
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Node Quadra_Node;

/* ============================================================================
 * Renderable Capability
 * ============================================================================ */

/**
 * Fixed interface a node delegates geometry to.
 * `impl` is the object passed back to every entry.
 */
typedef struct Quadra_RenderableVTable {
    const char *type_name;

    /** Bring render geometry up to date (may be a no-op when clean) */
    void (*compute_vertices)(void *impl);

    /** World-space bounds including descendants */
    void (*compute_bounds)(void *impl, Quadra_Rect *out_bounds);

    /** Containment test for a world-space point */
    bool (*hit_test)(void *impl, const Quadra_Point *world_point);

    /** Release impl (called when the node is destroyed or the renderable replaced) */
    void (*destroy)(void *impl);
} Quadra_RenderableVTable;

typedef struct Quadra_Renderable {
    const Quadra_RenderableVTable *vtable;
    void *impl;
} Quadra_Renderable;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * Create a node with an identity transform and no children.
 *
 * @param name Debug name (may be NULL, truncated to 63 chars)
 * @return New node, or NULL on allocation failure
 */
Quadra_Node *quadra_node_create(const char *name);

/**
 * Destroy a node, its renderable and all of its children.
 * Detaches it from its parent first. Safe to pass NULL.
 */
void quadra_node_destroy(Quadra_Node *node);

const char *quadra_node_get_name(const Quadra_Node *node);

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

/**
 * Append child at the end of parent's child list. A child that already has
 * a parent is moved.
 *
 * @return false on NULL arguments, allocation failure, or when child is
 *         parent itself or one of its ancestors
 */
bool quadra_node_add_child(Quadra_Node *parent, Quadra_Node *child);

/**
 * Insert child at index (0 = first, count = append).
 */
bool quadra_node_add_child_at(Quadra_Node *parent, Quadra_Node *child, size_t index);

/**
 * Detach child from parent without destroying it.
 *
 * @return false if child is not a direct child of parent
 */
bool quadra_node_remove_child(Quadra_Node *parent, Quadra_Node *child);

Quadra_Node *quadra_node_get_parent(const Quadra_Node *node);
size_t quadra_node_get_child_count(const Quadra_Node *node);
Quadra_Node *quadra_node_get_child_at(const Quadra_Node *node, size_t index);

/* ============================================================================
 * State
 * ============================================================================ */

/**
 * Get the node's transform. The pointer is owned by the node.
 */
Quadra_Transform *quadra_node_get_transform(Quadra_Node *node);
const Quadra_Transform *quadra_node_get_transform_const(const Quadra_Node *node);

void quadra_node_set_visible(Quadra_Node *node, bool visible);
bool quadra_node_is_visible(const Quadra_Node *node);

/**
 * Attach a renderable. Any previous renderable is destroyed.
 * Pass a renderable with a NULL vtable to clear.
 */
void quadra_node_set_renderable(Quadra_Node *node, Quadra_Renderable renderable);

/**
 * @return The attached renderable, or NULL if none
 */
const Quadra_Renderable *quadra_node_get_renderable(const Quadra_Node *node);

/* ============================================================================
 * Per-frame Operations
 * ============================================================================ */

/**
 * Recompute world transforms for node and all descendants.
 * A root node composes against identity.
 */
void quadra_node_update_transform(Quadra_Node *node);

/**
 * Run compute_vertices on every visible renderable, parents before children.
 */
void quadra_node_update_geometry(Quadra_Node *node);

/**
 * World-space bounds of node: its renderable's bounds when it has one,
 * otherwise the union of its visible children's bounds (or an empty rect).
 */
void quadra_node_get_bounds(Quadra_Node *node, Quadra_Rect *out_bounds);

/**
 * Union of the bounds of node's visible children.
 *
 * @return false if no visible child contributed (out is set to an empty rect)
 */
bool quadra_node_get_children_bounds(Quadra_Node *node, Quadra_Rect *out_bounds);

/**
 * Whether node's renderable contains the world point. Nodes without a
 * renderable contain nothing.
 */
bool quadra_node_contains_point(Quadra_Node *node, const Quadra_Point *world_point);

/**
 * Top-most visible node under a world point: children are tested last to
 * first (last drawn wins) before the node itself.
 *
 * @return Hit node, or NULL
 */
Quadra_Node *quadra_node_hit_test(Quadra_Node *root, const Quadra_Point *world_point);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_NODE_H */
