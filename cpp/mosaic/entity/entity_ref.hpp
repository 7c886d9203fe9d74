// entity_ref.hpp - Type-erased view of one entity inside an archetype
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

#include "mc_log.hpp"
#include "../borrow/component_ref.hpp"

namespace mosaic {

// Lazily walks the type ids of an archetype's columns in registration order.
// Holds no state besides a pointer to the type list, so begin() can be called
// any number of times and always yields the same sequence.
class ComponentTypeRange {
public:
    // Yields ids by value, so it is an input iterator only.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = mc_soa_type_id;
        using difference_type = std::ptrdiff_t;
        using pointer = const mc_soa_type_id*;
        using reference = mc_soa_type_id;

        iterator() = default;
        explicit iterator(const SoaTypeInfo* pos) : pos_(pos) {}

        mc_soa_type_id operator*() const { return pos_->id(); }

        iterator& operator++() {
            ++pos_;
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++pos_;
            return tmp;
        }

        bool operator==(const iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const iterator& other) const { return pos_ != other.pos_; }

    private:
        const SoaTypeInfo* pos_ = nullptr;
    };

    ComponentTypeRange() = default;
    explicit ComponentTypeRange(const std::vector<SoaTypeInfo>* types) : types_(types) {}

    iterator begin() const {
        return types_ ? iterator(types_->data()) : iterator();
    }

    iterator end() const {
        return types_ ? iterator(types_->data() + types_->size()) : iterator();
    }

    size_t size() const { return types_ ? types_->size() : 0; }
    bool empty() const { return size() == 0; }

    std::vector<mc_soa_type_id> to_vector() const {
        return std::vector<mc_soa_type_id>(begin(), end());
    }

private:
    const std::vector<SoaTypeInfo>* types_ = nullptr;
};

// EntityRef - handle to an entity with any set of components.
//
// A null archetype means the entity has no components at all; row is then
// meaningless. The view itself holds no grant: each get/get_mut call
// acquires one for the returned handle only. Copying an EntityRef or passing
// it between threads is therefore always safe; the handles it produces carry
// their own thread-safety argument (see Ref and RefMut).
class EntityRef {
public:
    EntityRef() = default;
    EntityRef(const Archetype& archetype, uint32_t row) : archetype_(&archetype), row_(row) {}

    // View of an entity with no components.
    static EntityRef empty() { return EntityRef(); }

    bool is_empty() const { return archetype_ == nullptr; }
    const Archetype* archetype() const { return archetype_; }
    uint32_t row() const { return row_; }

    mc_entity_id entity() const {
        return archetype_ ? archetype_->entity(row_) : MC_ENTITY_ID_INVALID;
    }

    template<typename T>
    bool has() const {
        return archetype_ && archetype_->has<T>();
    }

    // --- Full results ---

    template<typename T>
    BorrowResult<Ref<T>> fetch(BorrowPolicy policy = BorrowPolicy::Checked) const {
        if (!archetype_) return MissingComponent::of<T>();
        return Ref<T>::make(*archetype_, row_, policy);
    }

    template<typename T>
    BorrowResult<RefMut<T>> fetch_mut(BorrowPolicy policy = BorrowPolicy::Checked) const {
        if (!archetype_) return MissingComponent::of<T>();
        return RefMut<T>::make(*archetype_, row_, policy);
    }

    // --- Convenience accessors ---

    // Shared borrow of T, if present. With the default (checked) policy an
    // outstanding exclusive borrow of T anywhere in this archetype also
    // yields nullopt.
    template<typename T>
    std::optional<Ref<T>> get() const { return get<T>(default_borrow_policy()); }

    template<typename T>
    std::optional<Ref<T>> get(BorrowPolicy policy) const {
        return to_optional(fetch<T>(policy));
    }

    // Exclusive borrow of T, if present. With the default (checked) policy any
    // outstanding borrow of T in this archetype yields nullopt.
    template<typename T>
    std::optional<RefMut<T>> get_mut() const { return get_mut<T>(default_borrow_policy()); }

    template<typename T>
    std::optional<RefMut<T>> get_mut(BorrowPolicy policy) const {
        return to_optional(fetch_mut<T>(policy));
    }

    // Ungated variants: a denied grant does not stop the handle from being
    // built. Kept for callers that depend on that behaviour.
    template<typename T>
    std::optional<Ref<T>> get_unchecked() const { return get<T>(BorrowPolicy::Unchecked); }

    template<typename T>
    std::optional<RefMut<T>> get_mut_unchecked() const { return get_mut<T>(BorrowPolicy::Unchecked); }

    // Type ids of the entity's components, empty for a component-less entity.
    //
    // Handy for per-type dispatch on a single entity, e.g. with an
    // unordered_map<mc_soa_type_id, Handler> after spawn or before despawn.
    ComponentTypeRange component_types() const {
        return archetype_ ? ComponentTypeRange(&archetype_->types()) : ComponentTypeRange();
    }

private:
    template<typename H>
    static std::optional<H> to_optional(BorrowResult<H>&& result) {
        if (H* handle = std::get_if<H>(&result)) {
            return std::optional<H>(std::move(*handle));
        }
        if (const ComponentBorrowed* denied = std::get_if<ComponentBorrowed>(&result)) {
            mc::log_debug(denied->message());
        }
        return std::nullopt;
    }

    const Archetype* archetype_ = nullptr;
    uint32_t row_ = 0;
};

} // namespace mosaic
