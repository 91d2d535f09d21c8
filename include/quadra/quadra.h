#ifndef QUADRA_H
#define QUADRA_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

// Zeroed allocation helpers (callers free with free())
#define QUADRA_ALLOC(type) (type*)calloc(1, sizeof(type))
#define QUADRA_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define QUADRA_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))

// Version info
#define QUADRA_VERSION_MAJOR 0
#define QUADRA_VERSION_MINOR 1
#define QUADRA_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    Functions named `quadra_*_create()` return pointers the caller OWNS and
 *    MUST release with the matching `quadra_*_destroy()`.
 *
 *      Quadra_Node *root = quadra_node_create("root");  // Caller owns
 *      quadra_node_destroy(root);                     // Must call
 *
 * 2. ATTACHED OBJECTS:
 *    A node owns its children and its renderable. A sprite created with
 *    quadra_sprite_create() is attached to its node and destroyed with it.
 *
 * 3. BORROWED TEXTURES:
 *    Sprites borrow their texture. Textures (or the cache that owns them)
 *    must outlive every sprite that references them.
 *
 * 4. GET FUNCTIONS:
 *    `quadra_*_get_*()` returning pointers hand out internally-owned data.
 *    Pointers into a sprite's vertex data are valid until the next
 *    geometry recomputation.
 *
 * 5. NULL ON FAILURE:
 *    Allocating and lookup functions return NULL on failure. Use
 *    quadra_get_last_error() for details.
 *
 *============================================================================*/

// Core infrastructure
#include "quadra/error.h"
#include "quadra/log.h"
#include "quadra/validate.h"
#include "quadra/config.h"

// Math
#include "quadra/rect.h"
#include "quadra/matrix.h"

// Scene
#include "quadra/generation.h"
#include "quadra/transform.h"
#include "quadra/node.h"

// Graphics
#include "quadra/texture.h"
#include "quadra/sprite.h"

#endif // QUADRA_H
