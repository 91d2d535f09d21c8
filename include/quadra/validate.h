#ifndef QUADRA_VALIDATE_H
#define QUADRA_VALIDATE_H

#include "quadra/error.h"

/**
 * Argument guards for public entry points. A failed guard records
 * QUADRA_ERROR_INVALID_ARGUMENT naming the calling function and the
 * offending expression, then returns.
 *
 *   bool quadra_node_add_child(Quadra_Node *parent, Quadra_Node *child) {
 *       QUADRA_VALIDATE_PTRS2_RET(parent, child, false);
 *       ...
 *   }
 */

#define QUADRA_INVALID_ARG(what, expr) \
    quadra_set_error_code(QUADRA_ERROR_INVALID_ARGUMENT, "%s: %s: %s", __func__, (what), (expr))

#define QUADRA_VALIDATE_PTR(ptr) \
    do { if (!(ptr)) { QUADRA_INVALID_ARG("null pointer", #ptr); return; } } while (0)

#define QUADRA_VALIDATE_PTR_RET(ptr, ret) \
    do { if (!(ptr)) { QUADRA_INVALID_ARG("null pointer", #ptr); return (ret); } } while (0)

#define QUADRA_VALIDATE_PTRS2(p1, p2) \
    do { \
        QUADRA_VALIDATE_PTR(p1); \
        QUADRA_VALIDATE_PTR(p2); \
    } while (0)

#define QUADRA_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        QUADRA_VALIDATE_PTR_RET(p1, ret); \
        QUADRA_VALIDATE_PTR_RET(p2, ret); \
    } while (0)

/* Rejects NULL and "" alike. */
#define QUADRA_VALIDATE_STRING_RET(str, ret) \
    do { \
        if (!(str) || (str)[0] == '\0') { QUADRA_INVALID_ARG("empty string", #str); return (ret); } \
    } while (0)

#define QUADRA_VALIDATE_COND_RET(cond, msg, ret) \
    do { \
        if (!(cond)) { \
            quadra_set_error_code(QUADRA_ERROR_INVALID_ARGUMENT, "%s: %s", __func__, (msg)); \
            return (ret); \
        } \
    } while (0)

#endif /* QUADRA_VALIDATE_H */
