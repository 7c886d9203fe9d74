// archetype.hpp - Owner of one archetype's columns and their borrow counters
#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "soa_type.hpp"
#include "../borrow/atomic_borrow.hpp"
#include "../export.hpp"

namespace mosaic {

// Archetype - dense SoA storage plus one AtomicBorrow per column.
//
// Column memory is owned here and addressed by row index. Its base address is
// stable for as long as any grant on any column is live: alloc_row() and
// free_row() first take the exclusive grant of every column and refuse with
// std::runtime_error when one is borrowed.
//
// Handles keep a pointer to the archetype, so it is neither copyable nor
// movable and must outlive every Ref/RefMut/EntityRef made from it.
class MOSAIC_API Archetype {
public:
    explicit Archetype(const std::vector<mc_soa_type_id>& type_ids,
                       const mc_soa_type_registry* reg = mc_soa_global_registry());
    ~Archetype();

    Archetype(const Archetype&) = delete;
    Archetype& operator=(const Archetype&) = delete;

    // Archetype over registered C++ types, in the given order.
    template<typename... Ts>
    static Archetype of() {
        return Archetype(std::vector<mc_soa_type_id>{soa_type_id<Ts>()...});
    }

    const mc_archetype* c_archetype() const { return arch_; }
    const mc_soa_type_registry* registry() const { return reg_; }

    size_t size() const { return arch_->count; }
    size_t capacity() const { return arch_->capacity; }
    size_t type_count() const { return types_.size(); }

    // Resident types in registration order.
    const std::vector<SoaTypeInfo>& types() const { return types_; }

    int column_index(mc_soa_type_id type_id) const {
        return mc_archetype_column_index(arch_, type_id);
    }

    bool has(mc_soa_type_id type_id) const { return column_index(type_id) >= 0; }

    template<typename T>
    bool has() const { return has(soa_type_id<T>()); }

    mc_entity_id entity(uint32_t row) const { return mc_archetype_entity(arch_, row); }

    // --- Column access ---

    // Base of the column for T, nullptr if the archetype has no such column.
    template<typename T>
    T* column_base() const {
        return static_cast<T*>(mc_archetype_get_array(arch_, soa_type_id<T>()));
    }

    // Element of T at row. Throws std::out_of_range for row >= size().
    template<typename T>
    T* element(uint32_t row) const {
        T* base = column_base<T>();
        if (!base) return nullptr;
        check_row(row);
        return base + row;
    }

    void check_row(uint32_t row) const {
        if (row >= arch_->count) {
            throw std::out_of_range("Archetype: row " + std::to_string(row) +
                                    " out of range (size " + std::to_string(arch_->count) + ")");
        }
    }

    // --- Borrow protocol ---
    // A type without a column is never granted; releasing it is a no-op.

    const AtomicBorrow* borrow_state(mc_soa_type_id type_id) const {
        int col = column_index(type_id);
        return col < 0 ? nullptr : &borrows_[col];
    }

    template<typename T>
    const AtomicBorrow* borrow_state() const { return borrow_state(soa_type_id<T>()); }

    bool acquire_shared(mc_soa_type_id type_id) const {
        AtomicBorrow* b = counter(type_id);
        return b && b->acquire_shared();
    }

    bool acquire_exclusive(mc_soa_type_id type_id) const {
        AtomicBorrow* b = counter(type_id);
        return b && b->acquire_exclusive();
    }

    void release_shared(mc_soa_type_id type_id) const {
        if (AtomicBorrow* b = counter(type_id)) b->release_shared();
    }

    void release_exclusive(mc_soa_type_id type_id) const {
        if (AtomicBorrow* b = counter(type_id)) b->release_exclusive();
    }

    template<typename T>
    bool acquire_shared() const { return acquire_shared(soa_type_id<T>()); }

    template<typename T>
    bool acquire_exclusive() const { return acquire_exclusive(soa_type_id<T>()); }

    template<typename T>
    void release_shared() const { release_shared(soa_type_id<T>()); }

    template<typename T>
    void release_exclusive() const { release_exclusive(soa_type_id<T>()); }

    // True when no column has a live grant.
    bool borrows_idle() const;

    // --- Structural mutation ---

    // Append a default-initialized row for entity. Returns the row index.
    uint32_t alloc_row(mc_entity_id entity);

    // Swap-remove row. Returns the entity moved into row, or
    // MC_ENTITY_ID_INVALID if row was the last one.
    mc_entity_id free_row(uint32_t row);

private:
    AtomicBorrow* counter(mc_soa_type_id type_id) const {
        int col = column_index(type_id);
        return col < 0 ? nullptr : &borrows_[col];
    }

    bool lock_columns(const char* op);
    void unlock_columns(size_t count);

    mc_archetype* arch_ = nullptr;
    const mc_soa_type_registry* reg_ = nullptr;
    std::vector<SoaTypeInfo> types_;
    std::unique_ptr<AtomicBorrow[]> borrows_;
};

} // namespace mosaic
