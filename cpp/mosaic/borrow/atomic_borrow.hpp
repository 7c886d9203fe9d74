// atomic_borrow.hpp - Lock-free shared/exclusive borrow counter
//
// One counter guards one (archetype, component type) column. The word holds
// either N shared holders in the low bits or the exclusive flag in the high
// bit. Never both while the protocol is followed: every release must match a
// successful acquire of the same kind.
#pragma once

#include <atomic>
#include <cstddef>
#include <limits>

#include "../export.hpp"

// Release-time consistency checks. Defaults to on in builds without NDEBUG.
#ifndef MC_BORROW_CHECKS
    #ifdef NDEBUG
        #define MC_BORROW_CHECKS 0
    #else
        #define MC_BORROW_CHECKS 1
    #endif
#endif

namespace mosaic {

// Logs a failed consistency check, then aborts or returns according to
// mc_settings_get_borrow_violation_mode().
MOSAIC_API void report_borrow_violation(const char* what);

// Shared increment wrapped the whole word to 0. Counter state is corrupt;
// logs and aborts.
[[noreturn]] MOSAIC_API void borrow_overflow();

class AtomicBorrow {
public:
    static constexpr size_t UNIQUE_BIT = ~(std::numeric_limits<size_t>::max() >> 1);
    static constexpr size_t COUNT_MASK = ~UNIQUE_BIT;

    AtomicBorrow() = default;
    AtomicBorrow(const AtomicBorrow&) = delete;
    AtomicBorrow& operator=(const AtomicBorrow&) = delete;

    // Optimistic increment; a conflicting exclusive holder is undone with one
    // corrective decrement.
    bool acquire_shared() {
        size_t value = state_.fetch_add(1, std::memory_order_acquire) + 1;
        if (value == 0) {
            borrow_overflow();
        }
        if (value & UNIQUE_BIT) {
            state_.fetch_sub(1, std::memory_order_release);
            return false;
        }
        return true;
    }

    // Succeeds only from the unborrowed state.
    bool acquire_exclusive() {
        size_t expected = 0;
        return state_.compare_exchange_strong(
            expected, UNIQUE_BIT, std::memory_order_acquire, std::memory_order_relaxed);
    }

    void release_shared() {
        size_t prev = state_.fetch_sub(1, std::memory_order_release);
#if MC_BORROW_CHECKS
        if (prev == 0) {
            report_borrow_violation("unbalanced release");
        } else if (prev & UNIQUE_BIT) {
            report_borrow_violation("shared release of unique borrow");
        }
#else
        (void)prev;
#endif
    }

    void release_exclusive() {
        size_t prev = state_.fetch_and(~UNIQUE_BIT, std::memory_order_release);
#if MC_BORROW_CHECKS
        if (!(prev & UNIQUE_BIT)) {
            report_borrow_violation("unique release of shared borrow");
        }
#else
        (void)prev;
#endif
    }

    // Snapshot accessors. Values may be stale by the time they are read.
    size_t state() const { return state_.load(std::memory_order_acquire); }
    size_t shared_count() const { return state() & COUNT_MASK; }
    bool is_exclusive() const { return (state() & UNIQUE_BIT) != 0; }
    bool is_free() const { return state() == 0; }

private:
    std::atomic<size_t> state_{0};
};

} // namespace mosaic
