#include "atomic_borrow.hpp"

#include <cstdlib>

extern "C" {
#include "mc_log.h"
#include "mc_settings.h"
}

namespace mosaic {

void report_borrow_violation(const char* what) {
    mc_log_error("borrow violation: %s", what);
    if (mc_settings_get_borrow_violation_mode() == MC_BORROW_VIOLATION_ABORT) {
        std::abort();
    }
}

void borrow_overflow() {
    mc_log_error("borrow counter overflow: shared increment wrapped to 0, state is corrupt");
    std::abort();
}

} // namespace mosaic
