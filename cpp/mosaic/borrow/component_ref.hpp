// component_ref.hpp - Scoped shared/exclusive references to one component
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "../soa/archetype.hpp"

extern "C" {
#include "mc_settings.h"
}

namespace mosaic {

// What a handle factory does with the grant outcome.
enum class BorrowPolicy {
    // Denied grant -> ComponentBorrowed, no handle.
    Checked = MC_BORROW_POLICY_CHECKED,
    // Grant outcome is ignored and the handle is built anyway. A conflicting
    // pair of handles can then coexist; only the release-time checks
    // (MC_BORROW_CHECKS) notice it.
    Unchecked = MC_BORROW_POLICY_UNCHECKED,
};

inline BorrowPolicy default_borrow_policy() {
    return static_cast<BorrowPolicy>(mc_settings_get_default_borrow_policy());
}

// The archetype has no column for the requested type.
struct MissingComponent {
    mc_soa_type_id type_id = MC_SOA_TYPE_INVALID;
    const char* type_name = "<unregistered>";

    template<typename T>
    static MissingComponent of() {
        mc_soa_type_id id = soa_type_id<T>();
        return MissingComponent{id, soa_type_name(id)};
    }

    std::string message() const {
        return std::string("missing component '") + type_name + "'";
    }
};

// The column exists but the requested grant conflicts with a live one.
struct ComponentBorrowed {
    mc_soa_type_id type_id = MC_SOA_TYPE_INVALID;
    const char* type_name = "<unregistered>";
    bool exclusive = false;  // kind that was requested

    template<typename T>
    static ComponentBorrowed of(bool exclusive) {
        mc_soa_type_id id = soa_type_id<T>();
        return ComponentBorrowed{id, soa_type_name(id), exclusive};
    }

    std::string message() const {
        return std::string(exclusive ? "exclusive" : "shared") +
               " borrow of '" + type_name + "' denied";
    }
};

template<typename H>
using BorrowResult = std::variant<H, MissingComponent, ComponentBorrowed>;

// Ref<T> - shared borrow of one entity's component.
//
// Holds one shared grant on the (archetype, T) counter for its whole lifetime
// and releases it in the destructor. Copies take their own grant; a moved-from
// Ref holds nothing.
//
// A Ref may be handed to another thread and read from several threads at
// once. That is sound only because of the AtomicBorrow invariant: while any
// shared grant on the counter is live no exclusive grant exists, so nothing
// writes the column. Refs built with BorrowPolicy::Unchecked are outside that
// argument when their grant was denied.
template<typename T>
class Ref {
public:
    static BorrowResult<Ref> make(const Archetype& archetype, uint32_t row,
                                  BorrowPolicy policy = BorrowPolicy::Checked);

    Ref(const Ref& other) : archetype_(other.archetype_), target_(other.target_) {
        if (archetype_ && !archetype_->acquire_shared<T>()) {
            throw std::runtime_error("Ref copy: " + ComponentBorrowed::of<T>(false).message());
        }
    }

    Ref(Ref&& other) noexcept : archetype_(other.archetype_), target_(other.target_) {
        other.archetype_ = nullptr;
        other.target_ = nullptr;
    }

    Ref& operator=(Ref other) noexcept {
        std::swap(archetype_, other.archetype_);
        std::swap(target_, other.target_);
        return *this;
    }

    ~Ref() {
        if (archetype_) {
            archetype_->release_shared<T>();
        }
    }

    const T& operator*() const { return *target_; }
    const T* operator->() const { return target_; }
    const T* get() const { return target_; }

    const Archetype* archetype() const { return archetype_; }

private:
    Ref(const Archetype* archetype, const T* target) : archetype_(archetype), target_(target) {}

    const Archetype* archetype_ = nullptr;
    const T* target_ = nullptr;
};

// RefMut<T> - exclusive borrow of one entity's component.
//
// Holds the exclusive grant on the (archetype, T) counter and releases it in
// the destructor. Move-only.
//
// A RefMut may be moved to another thread and used there: under the
// AtomicBorrow invariant it is the only live grant on the column, so no other
// handle reads or writes it meanwhile.
template<typename T>
class RefMut {
public:
    static BorrowResult<RefMut> make(const Archetype& archetype, uint32_t row,
                                     BorrowPolicy policy = BorrowPolicy::Checked);

    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;

    RefMut(RefMut&& other) noexcept : archetype_(other.archetype_), target_(other.target_) {
        other.archetype_ = nullptr;
        other.target_ = nullptr;
    }

    RefMut& operator=(RefMut&& other) noexcept {
        RefMut tmp(std::move(other));
        std::swap(archetype_, tmp.archetype_);
        std::swap(target_, tmp.target_);
        return *this;
    }

    ~RefMut() {
        if (archetype_) {
            archetype_->release_exclusive<T>();
        }
    }

    T& operator*() const { return *target_; }
    T* operator->() const { return target_; }
    T* get() const { return target_; }

    const Archetype* archetype() const { return archetype_; }

private:
    RefMut(const Archetype* archetype, T* target) : archetype_(archetype), target_(target) {}

    const Archetype* archetype_ = nullptr;
    T* target_ = nullptr;
};

template<typename T>
BorrowResult<Ref<T>> Ref<T>::make(const Archetype& archetype, uint32_t row, BorrowPolicy policy) {
    const T* base = archetype.column_base<T>();
    if (!base) {
        return MissingComponent::of<T>();
    }
    archetype.check_row(row);

    bool granted = archetype.acquire_shared<T>();
    if (!granted && policy == BorrowPolicy::Checked) {
        return ComponentBorrowed::of<T>(false);
    }
    return Ref<T>(&archetype, base + row);
}

template<typename T>
BorrowResult<RefMut<T>> RefMut<T>::make(const Archetype& archetype, uint32_t row, BorrowPolicy policy) {
    T* base = archetype.column_base<T>();
    if (!base) {
        return MissingComponent::of<T>();
    }
    archetype.check_row(row);

    bool granted = archetype.acquire_exclusive<T>();
    if (!granted && policy == BorrowPolicy::Checked) {
        return ComponentBorrowed::of<T>(true);
    }
    return RefMut<T>(&archetype, base + row);
}

} // namespace mosaic
