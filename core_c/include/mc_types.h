// mc_types.h - Basic types for Mosaic Core
#ifndef MC_TYPES_H
#define MC_TYPES_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro
#ifdef _WIN32
    #ifdef MC_EXPORTS
        #define MC_API __declspec(dllexport)
    #else
        #define MC_API __declspec(dllimport)
    #endif
#else
    #define MC_API
#endif

// ============================================================================
// EntityId - generational index
// ============================================================================

typedef struct {
    uint32_t index;
    uint32_t generation;
} mc_entity_id;

#ifdef __cplusplus
    #define MC_ENTITY_ID_INVALID (mc_entity_id{0xFFFFFFFF, 0})
#else
    #define MC_ENTITY_ID_INVALID ((mc_entity_id){0xFFFFFFFF, 0})
#endif

static inline bool mc_entity_id_valid(mc_entity_id id) {
    return id.index != 0xFFFFFFFF;
}

static inline bool mc_entity_id_eq(mc_entity_id a, mc_entity_id b) {
    return a.index == b.index && a.generation == b.generation;
}

#ifdef __cplusplus
}
#endif

#endif // MC_TYPES_H
