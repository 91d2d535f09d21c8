/*
 * Quadra - Rectangle helpers
 */

#include "quadra/rect.h"

void quadra_rect_union(const Quadra_Rect *a, const Quadra_Rect *b, Quadra_Rect *out) {
    if (!a || !b || !out) return;

    float min_x = a->x < b->x ? a->x : b->x;
    float min_y = a->y < b->y ? a->y : b->y;

    float a_max_x = a->x + a->width;
    float b_max_x = b->x + b->width;
    float a_max_y = a->y + a->height;
    float b_max_y = b->y + b->height;

    float max_x = a_max_x > b_max_x ? a_max_x : b_max_x;
    float max_y = a_max_y > b_max_y ? a_max_y : b_max_y;

    out->x = min_x;
    out->y = min_y;
    out->width = max_x - min_x;
    out->height = max_y - min_y;
}

void quadra_rect_from_quad(const float *quad, Quadra_Rect *out) {
    if (!quad || !out) return;

    float x1 = quad[0], y1 = quad[1];
    float x2 = quad[2], y2 = quad[3];
    float x3 = quad[4], y3 = quad[5];
    float x4 = quad[6], y4 = quad[7];

    /* Fixed count of four corners: compare unrolled */
    float min_x = x1;
    min_x = x2 < min_x ? x2 : min_x;
    min_x = x3 < min_x ? x3 : min_x;
    min_x = x4 < min_x ? x4 : min_x;

    float min_y = y1;
    min_y = y2 < min_y ? y2 : min_y;
    min_y = y3 < min_y ? y3 : min_y;
    min_y = y4 < min_y ? y4 : min_y;

    float max_x = x1;
    max_x = x2 > max_x ? x2 : max_x;
    max_x = x3 > max_x ? x3 : max_x;
    max_x = x4 > max_x ? x4 : max_x;

    float max_y = y1;
    max_y = y2 > max_y ? y2 : max_y;
    max_y = y3 > max_y ? y3 : max_y;
    max_y = y4 > max_y ? y4 : max_y;

    out->x = min_x;
    out->y = min_y;
    out->width = max_x - min_x;
    out->height = max_y - min_y;
}

bool quadra_rect_equals(const Quadra_Rect *a, const Quadra_Rect *b) {
    if (!a || !b) return false;
    return a->x == b->x && a->y == b->y &&
           a->width == b->width && a->height == b->height;
}
