// soa_type.hpp - SOA_COMPONENT macro for registering SoA data components
//
// Usage:
//   struct Velocity {
//       float dx = 0.0f;
//       float dy = 0.0f;
//       float dz = 0.0f;
//   };
//   SOA_COMPONENT(Velocity);
//
// The macro registers the type in the global SoA registry at static init time.
// Use mosaic::SoaTypeId<T>::id to get the type id after registration.
#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

extern "C" {
#include "core/mc_archetype.h"
}

namespace mosaic {

// Maps C++ type to mc_soa_type_id. Filled by SoaRegistrar at static init.
template<typename T>
struct SoaTypeId {
    static mc_soa_type_id id;
};

// Types without SOA_COMPONENT keep the invalid id.
template<typename T>
mc_soa_type_id SoaTypeId<T>::id = MC_SOA_TYPE_INVALID;

// Static registrar - constructed at static init time, registers type in global registry.
template<typename T>
struct SoaRegistrar {
    static_assert(std::is_object_v<T> && !std::is_const_v<T>,
                  "SoA components must be plain, non-const value types");

    SoaRegistrar(const char* name) {
        mc_soa_type_desc desc = {};
        desc.name = name;
        desc.element_size = sizeof(T);
        desc.alignment = alignof(T);
        if constexpr (!std::is_trivially_default_constructible_v<T>) {
            desc.init = [](void* ptr) { new (ptr) T(); };
        }
        if constexpr (!std::is_trivially_destructible_v<T>) {
            desc.destroy = [](void* ptr) { static_cast<T*>(ptr)->~T(); };
        }
        if constexpr (!std::is_trivially_copyable_v<T>) {
            desc.relocate = [](void* dst, void* src) {
                T* from = static_cast<T*>(src);
                new (dst) T(std::move(*from));
                from->~T();
            };
        }
        SoaTypeId<T>::id = mc_soa_register_type(mc_soa_global_registry(), &desc);
    }
};

// Type id of T, MC_SOA_TYPE_INVALID if T was never registered.
template<typename T>
inline mc_soa_type_id soa_type_id() {
    return SoaTypeId<std::remove_cv_t<T>>::id;
}

// Registered name of a type id, or "<unregistered>".
inline const char* soa_type_name(mc_soa_type_id id) {
    const mc_soa_type_desc* desc = mc_soa_get_type(mc_soa_global_registry(), id);
    return desc ? desc->name : "<unregistered>";
}

// One resident column type of an archetype.
class SoaTypeInfo {
public:
    SoaTypeInfo(mc_soa_type_id type_id, const mc_soa_type_desc* desc)
        : type_id_(type_id), desc_(desc) {}

    // Stable runtime identifier
    mc_soa_type_id id() const { return type_id_; }
    const char* name() const { return desc_->name; }
    size_t size() const { return desc_->element_size; }
    size_t alignment() const { return desc_->alignment; }

private:
    mc_soa_type_id type_id_;
    const mc_soa_type_desc* desc_;
};

} // namespace mosaic

// Place after struct definition at global scope (outside any namespace).
// Registers the type in the global SoA type registry at static init time.
// Safe to include in multiple translation units (dedup by name in registry).
#define SOA_COMPONENT(T) \
    template<> inline mc_soa_type_id mosaic::SoaTypeId<T>::id = MC_SOA_TYPE_INVALID; \
    static mosaic::SoaRegistrar<T> _soa_reg_##T(#T)
