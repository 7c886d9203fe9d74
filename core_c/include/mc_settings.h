// mc_settings.h - Process-wide settings accessible from C/C++
#ifndef MC_SETTINGS_H
#define MC_SETTINGS_H

#include "mc_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Borrow Violation Mode
// ============================================================================

// What happens after a failed release-time consistency check has been logged.
// Only consulted when borrow checks are compiled in (MC_BORROW_CHECKS).
typedef enum mc_borrow_violation_mode {
    MC_BORROW_VIOLATION_ABORT = 0,  // log, then abort (default)
    MC_BORROW_VIOLATION_LOG = 1     // log and continue
} mc_borrow_violation_mode;

// ============================================================================
// Borrow Policy
// ============================================================================

// Whether handle factories honour a denied grant.
typedef enum mc_borrow_policy {
    MC_BORROW_POLICY_CHECKED = 0,   // denied grant -> no handle (default)
    MC_BORROW_POLICY_UNCHECKED = 1  // grant outcome ignored, handle always built
} mc_borrow_policy;

// ============================================================================
// Settings API
// ============================================================================

MC_API mc_borrow_violation_mode mc_settings_get_borrow_violation_mode(void);
MC_API void mc_settings_set_borrow_violation_mode(mc_borrow_violation_mode mode);

// Policy used by EntityRef::get / EntityRef::get_mut
MC_API mc_borrow_policy mc_settings_get_default_borrow_policy(void);
MC_API void mc_settings_set_default_borrow_policy(mc_borrow_policy policy);

#ifdef __cplusplus
}
#endif

#endif // MC_SETTINGS_H
