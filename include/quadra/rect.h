#ifndef QUADRA_RECT_H
#define QUADRA_RECT_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct Quadra_Point {
    float x, y;
} Quadra_Point;

/**
 * Axis-aligned rectangle. x/y is the top-left corner.
 */
typedef struct Quadra_Rect {
    float x, y;
    float width, height;
} Quadra_Rect;

/** Zero rectangle, returned for empty containers */
#define QUADRA_RECT_EMPTY { 0.0f, 0.0f, 0.0f, 0.0f }

/* ============================================================================
 * Helpers
 * ============================================================================ */

/**
 * Smallest rectangle enclosing both a and b.
 * out may alias a or b.
 */
void quadra_rect_union(const Quadra_Rect *a, const Quadra_Rect *b, Quadra_Rect *out);

/**
 * Reduce four corner points (x0,y0 .. x3,y3 interleaved) to their
 * axis-aligned bounding rectangle.
 */
void quadra_rect_from_quad(const float *quad, Quadra_Rect *out);

bool quadra_rect_equals(const Quadra_Rect *a, const Quadra_Rect *b);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_RECT_H */
