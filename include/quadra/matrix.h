/**
 * Quadra - 2D Affine Matrix
 *
 * Row form of the affine map used throughout the geometry core:
 *
 *   | a  c  tx |
 *   | b  d  ty |
 *   | 0  0  1  |
 *
 *   x' = a * x + c * y + tx
 *   y' = b * x + d * y + ty
 *
 * Composition and inversion go through cglm's mat3 affine helpers; apply and
 * apply_inverse are written out directly since they run per point.
 */

#ifndef QUADRA_MATRIX_H
#define QUADRA_MATRIX_H

#include "quadra/rect.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Quadra_Matrix {
    float a, b, c, d;
    float tx, ty;
} Quadra_Matrix;

#define QUADRA_MATRIX_IDENTITY { 1.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f }

void quadra_matrix_identity(Quadra_Matrix *m);

void quadra_matrix_set(Quadra_Matrix *m,
                       float a, float b, float c, float d,
                       float tx, float ty);

/**
 * Build a local matrix from translation, rotation (radians), scale and a
 * pivot. The pivot is the local point that lands on (x, y).
 *
 *   M = T(x, y) * R(rotation) * S(sx, sy) * T(-pivot_x, -pivot_y)
 */
void quadra_matrix_compose(Quadra_Matrix *out,
                           float x, float y,
                           float rotation,
                           float sx, float sy,
                           float pivot_x, float pivot_y);

/**
 * out = lhs * rhs (rhs applied first). out may alias either input.
 */
void quadra_matrix_multiply(const Quadra_Matrix *lhs, const Quadra_Matrix *rhs,
                            Quadra_Matrix *out);

/**
 * Invert m into out.
 *
 * @return false if m is singular (out is left untouched)
 */
bool quadra_matrix_invert(const Quadra_Matrix *m, Quadra_Matrix *out);

/**
 * Determinant of the linear part (a*d - b*c).
 */
float quadra_matrix_determinant(const Quadra_Matrix *m);

void quadra_matrix_apply(const Quadra_Matrix *m, const Quadra_Point *in, Quadra_Point *out);

/**
 * Map a point through the inverse of m without building the inverse.
 *
 * @return false if m is singular; out is then set to NaN so that any
 *         containment test against it fails
 */
bool quadra_matrix_apply_inverse(const Quadra_Matrix *m, const Quadra_Point *in, Quadra_Point *out);

bool quadra_matrix_equals(const Quadra_Matrix *lhs, const Quadra_Matrix *rhs);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_MATRIX_H */
