/*
 * Quadra - Scene Node Implementation
 */

#include "quadra/node.h"
#include "quadra/quadra.h"
#include "quadra/generation.h"
#include "quadra/log.h"
#include "quadra/validate.h"
#include <stdio.h>
#include <string.h>

/* ============================================================================
 * Internal Structure
 * ============================================================================ */

struct Quadra_Node {
    char name[64];

    /* Hierarchy */
    Quadra_Node *parent;
    Quadra_Node *first_child;
    Quadra_Node *last_child;
    Quadra_Node *next_sibling;
    Quadra_Node *prev_sibling;
    size_t child_count;

    Quadra_Transform transform;
    bool visible;

    Quadra_Renderable renderable;
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static void node_release_renderable(Quadra_Node *node)
{
    if (node->renderable.vtable && node->renderable.vtable->destroy) {
        node->renderable.vtable->destroy(node->renderable.impl);
    }
    node->renderable.vtable = NULL;
    node->renderable.impl = NULL;
}

static void node_unlink(Quadra_Node *parent, Quadra_Node *child)
{
    if (child->prev_sibling) {
        child->prev_sibling->next_sibling = child->next_sibling;
    } else {
        parent->first_child = child->next_sibling;
    }

    if (child->next_sibling) {
        child->next_sibling->prev_sibling = child->prev_sibling;
    } else {
        parent->last_child = child->prev_sibling;
    }

    child->parent = NULL;
    child->prev_sibling = NULL;
    child->next_sibling = NULL;
    parent->child_count--;
}

static bool node_is_ancestor_or_self(const Quadra_Node *candidate, const Quadra_Node *node)
{
    for (const Quadra_Node *n = node; n; n = n->parent) {
        if (n == candidate) return true;
    }
    return false;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Quadra_Node *quadra_node_create(const char *name)
{
    Quadra_Node *node = QUADRA_ALLOC(Quadra_Node);
    if (!node) {
        quadra_set_error_code(QUADRA_ERROR_OUT_OF_MEMORY, "Failed to allocate node");
        return NULL;
    }

    snprintf(node->name, sizeof(node->name), "%s", name ? name : "");
    quadra_transform_init(&node->transform);
    node->visible = true;

    return node;
}

void quadra_node_destroy(Quadra_Node *node)
{
    if (!node) return;

    if (node->parent) {
        quadra_node_remove_child(node->parent, node);
    }

    Quadra_Node *child = node->first_child;
    while (child) {
        Quadra_Node *next = child->next_sibling;
        /* Detach first so the recursive call does not walk back up */
        child->parent = NULL;
        quadra_node_destroy(child);
        child = next;
    }

    node_release_renderable(node);
    free(node);
}

const char *quadra_node_get_name(const Quadra_Node *node)
{
    return node ? node->name : NULL;
}

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

bool quadra_node_add_child(Quadra_Node *parent, Quadra_Node *child)
{
    QUADRA_VALIDATE_PTRS2_RET(parent, child, false);
    return quadra_node_add_child_at(parent, child, parent->child_count);
}

bool quadra_node_add_child_at(Quadra_Node *parent, Quadra_Node *child, size_t index)
{
    QUADRA_VALIDATE_PTRS2_RET(parent, child, false);

    if (node_is_ancestor_or_self(child, parent)) {
        quadra_set_error_code(QUADRA_ERROR_INVALID_ARGUMENT, "Cannot add node '%s' under itself or its descendant '%s'",
                         child->name, parent->name);
        return false;
    }

    if (child->parent) {
        quadra_node_remove_child(child->parent, child);
    }

    if (index > parent->child_count) {
        index = parent->child_count;
    }

    /* Find the sibling that will follow the child */
    Quadra_Node *after = parent->first_child;
    for (size_t i = 0; i < index && after; i++) {
        after = after->next_sibling;
    }

    child->parent = parent;
    child->next_sibling = after;

    if (after) {
        child->prev_sibling = after->prev_sibling;
        if (after->prev_sibling) {
            after->prev_sibling->next_sibling = child;
        } else {
            parent->first_child = child;
        }
        after->prev_sibling = child;
    } else {
        child->prev_sibling = parent->last_child;
        if (parent->last_child) {
            parent->last_child->next_sibling = child;
        } else {
            parent->first_child = child;
        }
        parent->last_child = child;
    }

    parent->child_count++;

    quadra_transform_mark_parent_changed(&child->transform);
    quadra_generation_bump();
    return true;
}

bool quadra_node_remove_child(Quadra_Node *parent, Quadra_Node *child)
{
    QUADRA_VALIDATE_PTRS2_RET(parent, child, false);

    if (child->parent != parent) {
        quadra_set_error_code(QUADRA_ERROR_NOT_FOUND, "Node '%s' is not a child of '%s'", child->name, parent->name);
        return false;
    }

    node_unlink(parent, child);

    quadra_transform_mark_parent_changed(&child->transform);
    quadra_generation_bump();
    return true;
}

Quadra_Node *quadra_node_get_parent(const Quadra_Node *node)
{
    return node ? node->parent : NULL;
}

size_t quadra_node_get_child_count(const Quadra_Node *node)
{
    return node ? node->child_count : 0;
}

Quadra_Node *quadra_node_get_child_at(const Quadra_Node *node, size_t index)
{
    if (!node || index >= node->child_count) return NULL;

    Quadra_Node *child = node->first_child;
    for (size_t i = 0; i < index && child; i++) {
        child = child->next_sibling;
    }
    return child;
}

/* ============================================================================
 * State
 * ============================================================================ */

Quadra_Transform *quadra_node_get_transform(Quadra_Node *node)
{
    return node ? &node->transform : NULL;
}

const Quadra_Transform *quadra_node_get_transform_const(const Quadra_Node *node)
{
    return node ? &node->transform : NULL;
}

void quadra_node_set_visible(Quadra_Node *node, bool visible)
{
    if (!node) return;
    node->visible = visible;
    quadra_generation_bump();
}

bool quadra_node_is_visible(const Quadra_Node *node)
{
    return node ? node->visible : false;
}

void quadra_node_set_renderable(Quadra_Node *node, Quadra_Renderable renderable)
{
    QUADRA_VALIDATE_PTR(node);

    if (node->renderable.impl == renderable.impl &&
        node->renderable.vtable == renderable.vtable) {
        return;
    }

    node_release_renderable(node);
    node->renderable = renderable;

    if (renderable.vtable) {
        quadra_log_debug(QUADRA_LOG_SCENE, "Node '%s' renderable set to %s",
                         node->name,
                         renderable.vtable->type_name ? renderable.vtable->type_name : "?");
    }
    quadra_generation_bump();
}

const Quadra_Renderable *quadra_node_get_renderable(const Quadra_Node *node)
{
    if (!node || !node->renderable.vtable) return NULL;
    return &node->renderable;
}

/* ============================================================================
 * Per-frame Operations
 * ============================================================================ */

static void node_update_transform_recursive(Quadra_Node *node, const Quadra_Transform *parent)
{
    quadra_transform_update(&node->transform, parent);

    for (Quadra_Node *child = node->first_child; child; child = child->next_sibling) {
        node_update_transform_recursive(child, &node->transform);
    }
}

void quadra_node_update_transform(Quadra_Node *node)
{
    if (!node) return;
    node_update_transform_recursive(node, node->parent ? &node->parent->transform : NULL);
}

void quadra_node_update_geometry(Quadra_Node *node)
{
    if (!node || !node->visible) return;

    if (node->renderable.vtable && node->renderable.vtable->compute_vertices) {
        node->renderable.vtable->compute_vertices(node->renderable.impl);
    }

    for (Quadra_Node *child = node->first_child; child; child = child->next_sibling) {
        quadra_node_update_geometry(child);
    }
}

void quadra_node_get_bounds(Quadra_Node *node, Quadra_Rect *out_bounds)
{
    if (!out_bounds) return;

    Quadra_Rect empty = QUADRA_RECT_EMPTY;
    *out_bounds = empty;
    if (!node) return;

    if (node->renderable.vtable && node->renderable.vtable->compute_bounds) {
        node->renderable.vtable->compute_bounds(node->renderable.impl, out_bounds);
        return;
    }

    quadra_node_get_children_bounds(node, out_bounds);
}

bool quadra_node_get_children_bounds(Quadra_Node *node, Quadra_Rect *out_bounds)
{
    if (!out_bounds) return false;

    Quadra_Rect empty = QUADRA_RECT_EMPTY;
    *out_bounds = empty;
    if (!node) return false;

    bool any_visible = false;
    Quadra_Rect total = QUADRA_RECT_EMPTY;

    for (Quadra_Node *child = node->first_child; child; child = child->next_sibling) {
        if (!child->visible) continue;

        Quadra_Rect child_bounds;
        quadra_node_get_bounds(child, &child_bounds);

        if (!any_visible) {
            total = child_bounds;
            any_visible = true;
        } else {
            quadra_rect_union(&total, &child_bounds, &total);
        }
    }

    if (any_visible) {
        *out_bounds = total;
    }
    return any_visible;
}

bool quadra_node_contains_point(Quadra_Node *node, const Quadra_Point *world_point)
{
    if (!node || !world_point) return false;
    if (!node->renderable.vtable || !node->renderable.vtable->hit_test) return false;
    return node->renderable.vtable->hit_test(node->renderable.impl, world_point);
}

Quadra_Node *quadra_node_hit_test(Quadra_Node *root, const Quadra_Point *world_point)
{
    if (!root || !root->visible || !world_point) return NULL;

    /* Children in reverse order (front to back) */
    for (Quadra_Node *child = root->last_child; child; child = child->prev_sibling) {
        Quadra_Node *hit = quadra_node_hit_test(child, world_point);
        if (hit) return hit;
    }

    if (quadra_node_contains_point(root, world_point)) {
        return root;
    }

    return NULL;
}
