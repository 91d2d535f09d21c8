#include "quadra/generation.h"

/* Starts at 1 so that QUADRA_GENERATION_NONE is always stale */
static uint64_t s_generation = 1;

uint64_t quadra_generation_current(void) {
    return s_generation;
}

uint64_t quadra_generation_bump(void) {
    return ++s_generation;
}
