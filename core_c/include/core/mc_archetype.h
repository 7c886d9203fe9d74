// mc_archetype.h - SoA archetype storage for data-only components
#pragma once

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include "mc_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// SoA Type Registry - tracks registered data-only component types
// ============================================================================

typedef uint8_t mc_soa_type_id;
#define MC_SOA_TYPE_INVALID 0xFF
#define MC_SOA_MAX_TYPES 64

// Descriptor for registering a SoA component type
typedef struct mc_soa_type_desc {
    const char* name;              // type name (copied on register)
    size_t element_size;           // sizeof one element
    size_t alignment;              // alignof one element (0 = default)
    void (*init)(void* ptr);       // default initializer (NULL = zero-init)
    void (*destroy)(void* ptr);    // destructor (NULL = no-op)
    void (*relocate)(void* dst, void* src);  // move src into raw dst, end src (NULL = memcpy)
} mc_soa_type_desc;

// Registry holding up to 64 SoA types
typedef struct {
    mc_soa_type_desc types[MC_SOA_MAX_TYPES];
    size_t count;
} mc_soa_type_registry;

// Register a new SoA type. Returns type id (0..63) or MC_SOA_TYPE_INVALID if
// full or the descriptor is unusable (no name, zero size).
// If a type with the same name is already registered, returns the existing id.
MC_API mc_soa_type_id mc_soa_register_type(mc_soa_type_registry* reg, const mc_soa_type_desc* desc);

// Get type descriptor by id. Returns NULL if invalid.
MC_API const mc_soa_type_desc* mc_soa_get_type(const mc_soa_type_registry* reg, mc_soa_type_id id);

// Find type id by name. Returns MC_SOA_TYPE_INVALID if not registered.
MC_API mc_soa_type_id mc_soa_find_type(const mc_soa_type_registry* reg, const char* name);

// Global SoA type registry (singleton, zero-initialized).
MC_API mc_soa_type_registry* mc_soa_global_registry(void);

// ============================================================================
// Archetype - dense storage for entities sharing same SoA component set
// ============================================================================

#define MC_ROW_INVALID 0xFFFFFFFFu

typedef struct mc_archetype {
    uint64_t type_mask;            // bitmask of which SoA types are present

    mc_soa_type_id* type_ids;      // [type_count], in creation order
    size_t type_count;

    size_t capacity;               // allocated slots
    size_t count;                  // occupied slots

    mc_entity_id* entities;        // [capacity] entity in each row
    void** data;                   // [type_count] pointers to data arrays
} mc_archetype;

// Create archetype for given type set. Types keep the given order.
// Returns NULL for invalid or duplicate ids. Initial capacity = 16.
MC_API mc_archetype* mc_archetype_create(
    const mc_soa_type_id* type_ids,
    size_t type_count,
    const mc_soa_type_registry* reg
);

// Destroy archetype: call destroy on all live elements, free memory.
MC_API void mc_archetype_destroy(mc_archetype* arch, const mc_soa_type_registry* reg);

// Allocate a row for entity. Returns row index, or MC_ROW_INVALID if growth
// failed. Grows if needed; growth moves every column.
MC_API uint32_t mc_archetype_alloc_row(
    mc_archetype* arch,
    mc_entity_id entity,
    const mc_soa_type_registry* reg
);

// Free a row (swap-remove + destroy). Returns entity_id of the entity that was
// swapped into the freed row, or MC_ENTITY_ID_INVALID if row was last.
MC_API mc_entity_id mc_archetype_free_row(
    mc_archetype* arch,
    uint32_t row,
    const mc_soa_type_registry* reg
);

// Column position of a type in this archetype, or -1 if not present.
MC_API int mc_archetype_column_index(const mc_archetype* arch, mc_soa_type_id type_id);

// Get pointer to data array for a given type in this archetype.
// Returns NULL if type not present.
MC_API void* mc_archetype_get_array(const mc_archetype* arch, mc_soa_type_id type_id);

// Get pointer to element at row for a given type.
// Returns NULL if type not present or row >= count.
MC_API void* mc_archetype_get_element(
    const mc_archetype* arch,
    uint32_t row,
    mc_soa_type_id type_id,
    const mc_soa_type_registry* reg
);

// Entity stored at row, or MC_ENTITY_ID_INVALID if row >= count.
MC_API mc_entity_id mc_archetype_entity(const mc_archetype* arch, uint32_t row);

#ifdef __cplusplus
}
#endif
