/**
 * Quadra - Bounds Generation Counter
 *
 * A single monotonically increasing counter shared by every node. Anything
 * that can move a bounding box (transform change, texture change, child-set
 * change, visibility change) bumps it; a memoized bounds rectangle is valid
 * only while the generation it was computed at is still current.
 *
 * Bumping is conservative: callers bump on every setter, whether or not the
 * value actually changed.
 *
 * NOT thread-safe. Scene mutation happens on the render-loop thread.
 */

#ifndef QUADRA_GENERATION_H
#define QUADRA_GENERATION_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Never returned by quadra_generation_current(); use for "never computed" */
#define QUADRA_GENERATION_NONE 0u

uint64_t quadra_generation_current(void);

/**
 * Advance the generation.
 *
 * @return The new generation
 */
uint64_t quadra_generation_bump(void);

#ifdef __cplusplus
}
#endif

#endif /* QUADRA_GENERATION_H */
