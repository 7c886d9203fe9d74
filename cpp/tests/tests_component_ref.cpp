#include "guard/guard.h"
#include "mosaic/borrow/component_ref.hpp"
#include "test_components.hpp"

#include <atomic>
#include <thread>
#include <utility>
#include <variant>

using mosaic::Archetype;
using mosaic::BorrowPolicy;
using mosaic::ComponentBorrowed;
using mosaic::MissingComponent;
using mosaic::Ref;
using mosaic::RefMut;
using mosaic::soa_type_id;
using mosaic_test::LogCapture;
using mosaic_test::make_entity;

namespace {

void fill_positions(Archetype& arch, uint32_t rows) {
    for (uint32_t i = 0; i < rows; ++i) {
        uint32_t row = arch.alloc_row(make_entity(i));
        arch.element<Position>(row)->x = static_cast<float>(i);
        arch.element<Position>(row)->y = static_cast<float>(i) * 2.0f;
    }
}

} // namespace

// ==================== Construction ====================

TEST_CASE("Ref make points at the row")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 4);

    auto result = Ref<Position>::make(arch, 3);
    auto* ref = std::get_if<Ref<Position>>(&result);
    CHECK(ref != nullptr);
    CHECK_EQ((*ref)->x, 3.0f);
    CHECK_EQ((**ref).y, 6.0f);
    CHECK(ref->get() == arch.column_base<Position>() + 3);
    CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
}

TEST_CASE("Ref releases its grant on scope exit")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 1);
    {
        auto result = Ref<Position>::make(arch, 0);
        CHECK(std::holds_alternative<Ref<Position>>(result));
        CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
    }
    CHECK(arch.borrows_idle());
}

TEST_CASE("Ref make reports missing component")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 1);

    auto result = Ref<Velocity>::make(arch, 0);
    auto* missing = std::get_if<MissingComponent>(&result);
    CHECK(missing != nullptr);
    CHECK_EQ(missing->type_id, soa_type_id<Velocity>());
    CHECK_EQ(missing->message(), std::string("missing component 'Velocity'"));
    CHECK(arch.borrows_idle());
}

TEST_CASE("Handle for a type without SOA_COMPONENT is a missing component")
{
    CHECK_EQ(soa_type_id<Unregistered>(), MC_SOA_TYPE_INVALID);
    CHECK_EQ(soa_type_id<const Unregistered>(), MC_SOA_TYPE_INVALID);

    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 1);
    CHECK(!arch.has<Unregistered>());

    auto shared = Ref<Unregistered>::make(arch, 0);
    auto* missing = std::get_if<MissingComponent>(&shared);
    CHECK(missing != nullptr);
    CHECK_EQ(missing->type_id, MC_SOA_TYPE_INVALID);
    CHECK_EQ(missing->message(), std::string("missing component '<unregistered>'"));

    auto exclusive = RefMut<Unregistered>::make(arch, 0);
    CHECK(std::holds_alternative<MissingComponent>(exclusive));
    CHECK(arch.borrows_idle());
}

TEST_CASE("RefMut mutates through the column")
{
    Archetype arch = Archetype::of<Position, Health>();
    fill_positions(arch, 3);
    {
        auto result = RefMut<Health>::make(arch, 2);
        auto* health = std::get_if<RefMut<Health>>(&result);
        CHECK(health != nullptr);
        CHECK(arch.borrow_state<Health>()->is_exclusive());
        (*health)->value -= 25;
    }
    CHECK(arch.borrows_idle());
    CHECK_EQ(arch.element<Health>(2)->value, 75);
    CHECK_EQ(arch.element<Health>(1)->value, 100);
}

TEST_CASE("Ref make with out of range row throws without borrowing")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);

    bool thrown = false;
    try {
        auto result = Ref<Position>::make(arch, 2);
        (void)result;
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(arch.borrows_idle());
}

// ==================== Checked policy ====================

TEST_CASE("Checked RefMut denied while Ref is live")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);

    auto shared = Ref<Position>::make(arch, 0);
    CHECK(std::holds_alternative<Ref<Position>>(shared));

    auto exclusive = RefMut<Position>::make(arch, 1, BorrowPolicy::Checked);
    auto* denied = std::get_if<ComponentBorrowed>(&exclusive);
    CHECK(denied != nullptr);
    CHECK(denied->exclusive);
    CHECK_EQ(denied->message(), std::string("exclusive borrow of 'Position' denied"));
    CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
}

TEST_CASE("Checked Ref denied while RefMut is live")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);

    auto exclusive = RefMut<Position>::make(arch, 0);
    CHECK(std::holds_alternative<RefMut<Position>>(exclusive));

    auto shared = Ref<Position>::make(arch, 1);
    auto* denied = std::get_if<ComponentBorrowed>(&shared);
    CHECK(denied != nullptr);
    CHECK(!denied->exclusive);
    CHECK_EQ(arch.borrow_state<Position>()->state(), mosaic::AtomicBorrow::UNIQUE_BIT);
}

TEST_CASE("Different types of one archetype borrow independently")
{
    Archetype arch = Archetype::of<Position, Velocity>();
    fill_positions(arch, 1);

    auto pos = RefMut<Position>::make(arch, 0);
    auto vel = RefMut<Velocity>::make(arch, 0);
    CHECK(std::holds_alternative<RefMut<Position>>(pos));
    CHECK(std::holds_alternative<RefMut<Velocity>>(vel));
}

// ==================== Unchecked policy ====================

TEST_CASE("Unchecked RefMut is built despite a live Ref")
{
    LogCapture capture;
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);

    auto shared = Ref<Position>::make(arch, 0);
    CHECK(std::holds_alternative<Ref<Position>>(shared));
    {
        auto exclusive = RefMut<Position>::make(arch, 1, BorrowPolicy::Unchecked);
        CHECK(std::holds_alternative<RefMut<Position>>(exclusive));
        // The grant was never obtained; the counter still shows one reader
        CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
        CHECK(!arch.borrow_state<Position>()->is_exclusive());
    }
#if MC_BORROW_CHECKS
    CHECK(LogCapture::contains("unique release of shared borrow"));
#endif
    CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
}

TEST_CASE("Unchecked Ref is built despite a live RefMut")
{
    LogCapture capture;
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);
    const mosaic::AtomicBorrow* counter = arch.borrow_state<Position>();

    {
        auto exclusive = RefMut<Position>::make(arch, 0);
        CHECK(std::holds_alternative<RefMut<Position>>(exclusive));

        auto shared = Ref<Position>::make(arch, 1, BorrowPolicy::Unchecked);
        auto* ref = std::get_if<Ref<Position>>(&shared);
        CHECK(ref != nullptr);
        CHECK_EQ((*ref)->x, 1.0f);
        // Denied increment was undone
        CHECK_EQ(counter->state(), mosaic::AtomicBorrow::UNIQUE_BIT);
    }
    // The Ref went first and took one off the exclusive bit
#if MC_BORROW_CHECKS
    CHECK(LogCapture::contains("shared release of unique borrow"));
    CHECK(LogCapture::contains("unique release of shared borrow"));
#endif
    CHECK_EQ(counter->state(), mosaic::AtomicBorrow::COUNT_MASK);

    auto later = Ref<Position>::make(arch, 0);
    auto* denied = std::get_if<ComponentBorrowed>(&later);
    CHECK(denied != nullptr);
    CHECK(!denied->exclusive);
    CHECK(!arch.acquire_shared<Position>());
    CHECK(std::holds_alternative<ComponentBorrowed>(RefMut<Position>::make(arch, 0)));
    CHECK_EQ(counter->state(), mosaic::AtomicBorrow::COUNT_MASK);
    CHECK(!LogCapture::contains("overflow"));
}

// ==================== Copy and move ====================

TEST_CASE("Ref copy takes its own grant")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 1);
    {
        auto result = Ref<Position>::make(arch, 0);
        Ref<Position>& original = std::get<Ref<Position>>(result);
        {
            Ref<Position> copy = original;
            CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 2u);
            CHECK(copy.get() == original.get());
        }
        CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
    }
    CHECK(arch.borrows_idle());
}

TEST_CASE("Moved-from handles release nothing")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 1);
    {
        auto result = RefMut<Position>::make(arch, 0);
        RefMut<Position> first = std::move(std::get<RefMut<Position>>(result));
        RefMut<Position> second = std::move(first);
        CHECK(first.get() == nullptr);
        CHECK(second.get() != nullptr);
        CHECK(arch.borrow_state<Position>()->is_exclusive());
    }
    CHECK(arch.borrows_idle());
}

TEST_CASE("Ref assignment swaps grants")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 2);
    {
        auto a = Ref<Position>::make(arch, 0);
        auto b = Ref<Position>::make(arch, 1);
        Ref<Position>& ra = std::get<Ref<Position>>(a);
        Ref<Position>& rb = std::get<Ref<Position>>(b);
        CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 2u);

        ra = rb;
        CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 2u);
        CHECK_EQ(ra->x, 1.0f);
    }
    CHECK(arch.borrows_idle());
}

// ==================== Threads ====================

TEST_CASE("RefMut moved to another thread is released there")
{
    Archetype arch = Archetype::of<Health>();
    arch.alloc_row(make_entity(0));

    auto result = RefMut<Health>::make(arch, 0);
    RefMut<Health> health = std::move(std::get<RefMut<Health>>(result));

    std::thread worker([h = std::move(health)]() mutable {
        h->value = 7;
    });
    worker.join();

    CHECK(arch.borrows_idle());
    CHECK_EQ(arch.element<Health>(0)->value, 7);
}

TEST_CASE("One Ref read from several threads")
{
    Archetype arch = Archetype::of<Position>();
    fill_positions(arch, 3);

    auto result = Ref<Position>::make(arch, 2);
    const Ref<Position>& ref = std::get<Ref<Position>>(result);

    std::atomic<int> mismatches{0};
    std::thread t1([&]() { if (ref->x != 2.0f) mismatches.fetch_add(1); });
    std::thread t2([&]() { if (ref->y != 4.0f) mismatches.fetch_add(1); });
    t1.join();
    t2.join();

    CHECK_EQ(mismatches.load(), 0);
    CHECK_EQ(arch.borrow_state<Position>()->shared_count(), 1u);
}
