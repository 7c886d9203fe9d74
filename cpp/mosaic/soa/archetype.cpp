#include "archetype.hpp"

#include "mc_log.hpp"

namespace mosaic {

Archetype::Archetype(const std::vector<mc_soa_type_id>& type_ids, const mc_soa_type_registry* reg)
    : reg_(reg)
{
    if (!reg_) {
        throw std::runtime_error("Archetype: null type registry");
    }

    arch_ = mc_archetype_create(type_ids.data(), type_ids.size(), reg_);
    if (!arch_) {
        throw std::runtime_error("Archetype: invalid component type set");
    }

    types_.reserve(type_ids.size());
    for (mc_soa_type_id id : type_ids) {
        types_.emplace_back(id, mc_soa_get_type(reg_, id));
    }
    borrows_ = std::make_unique<AtomicBorrow[]>(type_ids.size());

    mc_log_debug("archetype created with %zu column(s)", types_.size());
}

Archetype::~Archetype() {
#if MC_BORROW_CHECKS
    if (!borrows_idle()) {
        report_borrow_violation("archetype destroyed while borrowed");
    }
#endif
    mc_archetype_destroy(arch_, reg_);
}

bool Archetype::borrows_idle() const {
    for (size_t i = 0; i < types_.size(); ++i) {
        if (!borrows_[i].is_free()) return false;
    }
    return true;
}

bool Archetype::lock_columns(const char* op) {
    for (size_t i = 0; i < types_.size(); ++i) {
        if (!borrows_[i].acquire_exclusive()) {
            unlock_columns(i);
            mc_log_warn("Archetype::%s refused: column '%s' is borrowed", op, types_[i].name());
            return false;
        }
    }
    return true;
}

void Archetype::unlock_columns(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        borrows_[i].release_exclusive();
    }
}

uint32_t Archetype::alloc_row(mc_entity_id entity) {
    if (!lock_columns("alloc_row")) {
        throw std::runtime_error("Archetype::alloc_row: column is borrowed");
    }
    uint32_t row = mc_archetype_alloc_row(arch_, entity, reg_);
    unlock_columns(types_.size());

    if (row == MC_ROW_INVALID) {
        throw std::runtime_error("Archetype::alloc_row: allocation failed");
    }
    return row;
}

mc_entity_id Archetype::free_row(uint32_t row) {
    check_row(row);
    if (!lock_columns("free_row")) {
        throw std::runtime_error("Archetype::free_row: column is borrowed");
    }
    mc_entity_id swapped = mc_archetype_free_row(arch_, row, reg_);
    unlock_columns(types_.size());
    return swapped;
}

} // namespace mosaic
