#include <catch2/catch_test_macros.hpp>

#include <blockflow/types/sparse_block_store.h>
#include <blockflow/util/errors.h>

#include <cstdint>
#include <stdexcept>

using namespace blockflow;

namespace {
    struct CountingObserver : BlockNotifiable {
        int count{0};
        block_index_t last{0};
        void notify(block_index_t block_index) override {
            ++count;
            last = block_index;
        }
    };

    BlockConfig small_config() { return BlockConfig{.fill_value = 0.5f, .block_size = 4, .capacity = 10}; }
}

// ============================================================================
// Allocation
// ============================================================================

TEST_CASE("SparseBlockStore - sparse blocks start absent", "[sparse_block_store]") {
    SparseBlockStore store{small_config()};
    CHECK(store.block_count() == 3);
    CHECK(store.allocated_block_count() == 0);
    CHECK_FALSE(store.has_block(0));
    CHECK_FALSE(store.try_get_block(2).has_value());
}

TEST_CASE("SparseBlockStore - allocate fills with the fill value", "[sparse_block_store]") {
    SparseBlockStore store{small_config()};
    auto block = store.allocate_block(1);
    REQUIRE(block.size() == 4);
    for (auto v : block) { CHECK(v == 0.5f); }
    CHECK(reinterpret_cast<std::uintptr_t>(block.data()) % LANE_ALIGNMENT == 0);

    block[2] = 7.0f;
    // get-or-allocate keeps existing content
    CHECK(store.allocate_block(1)[2] == 7.0f);
    CHECK(store.allocated_block_count() == 1);
}

TEST_CASE("SparseBlockStore - dense blocks are present from construction", "[sparse_block_store]") {
    SparseBlockStore store{small_config().with_allocation(AllocationMode::Dense)};
    CHECK(store.allocated_block_count() == store.block_count());
    auto block = store.try_get_block(0);
    REQUIRE(block.has_value());
    CHECK((*block)[3] == 0.5f);
}

TEST_CASE("SparseBlockStore - reset releases sparse and refills dense", "[sparse_block_store]") {
    SparseBlockStore sparse{small_config()};
    sparse.allocate_block(0)[0] = 2.0f;
    sparse.reset_block(0);
    CHECK_FALSE(sparse.has_block(0));

    SparseBlockStore dense{small_config().with_allocation(AllocationMode::Dense)};
    dense.allocate_block(0)[0] = 2.0f;
    dense.reset_block(0);
    REQUIRE(dense.has_block(0));
    CHECK((*dense.try_get_block(0))[0] == 0.5f);
}

TEST_CASE("SparseBlockStore - bounds", "[sparse_block_store][errors]") {
    SparseBlockStore store{small_config()};
    CHECK(store.locate(9) == BlockAddress{2, 1});
    CHECK_THROWS_AS(store.locate(10), std::out_of_range);
    CHECK_THROWS_AS(store.has_block(3), std::out_of_range);
    CHECK_THROWS_AS(store.mark_stale(3), std::out_of_range);
    CHECK_THROWS_AS(SparseBlockStore{BlockConfig{.block_size = 0}}, ConfigurationError);
}

// ============================================================================
// Staleness
// ============================================================================

TEST_CASE("SparseBlockStore - every block starts stale", "[sparse_block_store][staleness]") {
    SparseBlockStore store{small_config()};
    for (block_index_t i = 0; i < store.block_count(); ++i) { CHECK(store.is_stale(i)); }
}

TEST_CASE("SparseBlockStore - one announcement per pull", "[sparse_block_store][staleness]") {
    SparseBlockStore store{small_config()};
    CountingObserver observer;
    store.subscribe(&observer);

    // Nothing has consumed the block yet
    CHECK_FALSE(store.mark_stale(1));
    CHECK(observer.count == 0);

    store.rearm(1);
    store.clear_stale(1);
    CHECK_FALSE(store.is_stale(1));

    CHECK(store.mark_stale(1));
    CHECK(store.is_stale(1));
    CHECK(observer.count == 1);
    CHECK(observer.last == 1);

    CHECK_FALSE(store.mark_stale(1));
    CHECK(observer.count == 1);

    // A pull that leaves the block stale still re-arms the announcement
    store.rearm(1);
    CHECK(store.mark_stale(1));
    CHECK(observer.count == 2);
}

TEST_CASE("SparseBlockStore - blocks are announced independently", "[sparse_block_store][staleness]") {
    SparseBlockStore store{small_config()};
    CountingObserver observer;
    store.subscribe(&observer);
    store.rearm(0);
    store.rearm(2);

    CHECK(store.mark_stale(0));
    CHECK(store.mark_stale(2));
    CHECK(observer.count == 2);

    store.unsubscribe(&observer);
    CHECK(store.subscriber_count() == 0);
    store.rearm(0);
    store.mark_stale(0);
    CHECK(observer.count == 2);
}
