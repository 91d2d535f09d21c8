/*
 * Quadra - 2D Affine Matrix Implementation
 */

#include "quadra/matrix.h"
#include <cglm/cglm.h>
#include <math.h>

/* ============================================================================
 * Internal: cglm conversion
 *
 * cglm is column-major: m[column][row].
 * ============================================================================ */

static void matrix_to_mat3(const Quadra_Matrix *m, mat3 dest)
{
    dest[0][0] = m->a;  dest[0][1] = m->b;  dest[0][2] = 0.0f;
    dest[1][0] = m->c;  dest[1][1] = m->d;  dest[1][2] = 0.0f;
    dest[2][0] = m->tx; dest[2][1] = m->ty; dest[2][2] = 1.0f;
}

static void matrix_from_mat3(mat3 src, Quadra_Matrix *m)
{
    m->a = src[0][0];
    m->b = src[0][1];
    m->c = src[1][0];
    m->d = src[1][1];
    m->tx = src[2][0];
    m->ty = src[2][1];
}

/* ============================================================================
 * Construction
 * ============================================================================ */

void quadra_matrix_identity(Quadra_Matrix *m)
{
    if (!m) return;
    quadra_matrix_set(m, 1.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f);
}

void quadra_matrix_set(Quadra_Matrix *m,
                       float a, float b, float c, float d,
                       float tx, float ty)
{
    if (!m) return;
    m->a = a;
    m->b = b;
    m->c = c;
    m->d = d;
    m->tx = tx;
    m->ty = ty;
}

void quadra_matrix_compose(Quadra_Matrix *out,
                           float x, float y,
                           float rotation,
                           float sx, float sy,
                           float pivot_x, float pivot_y)
{
    if (!out) return;

    mat3 local;
    glm_mat3_identity(local);

    vec2 position = {x, y};
    glm_translate2d(local, position);

    if (rotation != 0.0f) {
        glm_rotate2d(local, rotation);
    }

    vec2 scale = {sx, sy};
    glm_scale2d(local, scale);

    if (pivot_x != 0.0f || pivot_y != 0.0f) {
        vec2 pivot = {-pivot_x, -pivot_y};
        glm_translate2d(local, pivot);
    }

    matrix_from_mat3(local, out);
}

/* ============================================================================
 * Composition / Inversion
 * ============================================================================ */

void quadra_matrix_multiply(const Quadra_Matrix *lhs, const Quadra_Matrix *rhs,
                            Quadra_Matrix *out)
{
    if (!lhs || !rhs || !out) return;

    mat3 l, r, result;
    matrix_to_mat3(lhs, l);
    matrix_to_mat3(rhs, r);
    glm_mat3_mul(l, r, result);

    matrix_from_mat3(result, out);
}

float quadra_matrix_determinant(const Quadra_Matrix *m)
{
    if (!m) return 0.0f;
    return m->a * m->d - m->b * m->c;
}

bool quadra_matrix_invert(const Quadra_Matrix *m, Quadra_Matrix *out)
{
    if (!m || !out) return false;
    if (quadra_matrix_determinant(m) == 0.0f) return false;

    mat3 src, inv;
    matrix_to_mat3(m, src);
    glm_mat3_inv(src, inv);

    matrix_from_mat3(inv, out);
    return true;
}

/* ============================================================================
 * Point Mapping
 * ============================================================================ */

void quadra_matrix_apply(const Quadra_Matrix *m, const Quadra_Point *in, Quadra_Point *out)
{
    if (!m || !in || !out) return;

    float x = in->x;
    float y = in->y;

    out->x = m->a * x + m->c * y + m->tx;
    out->y = m->b * x + m->d * y + m->ty;
}

bool quadra_matrix_apply_inverse(const Quadra_Matrix *m, const Quadra_Point *in, Quadra_Point *out)
{
    if (!m || !in || !out) return false;

    float det = quadra_matrix_determinant(m);
    if (det == 0.0f) {
        out->x = NAN;
        out->y = NAN;
        return false;
    }

    float id = 1.0f / det;
    float x = in->x;
    float y = in->y;

    out->x = m->d * id * x + -m->c * id * y + (m->ty * m->c - m->tx * m->d) * id;
    out->y = m->a * id * y + -m->b * id * x + (-m->ty * m->a + m->tx * m->b) * id;
    return true;
}

bool quadra_matrix_equals(const Quadra_Matrix *lhs, const Quadra_Matrix *rhs)
{
    if (!lhs || !rhs) return false;
    return lhs->a == rhs->a && lhs->b == rhs->b &&
           lhs->c == rhs->c && lhs->d == rhs->d &&
           lhs->tx == rhs->tx && lhs->ty == rhs->ty;
}
