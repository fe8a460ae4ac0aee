#include <catch2/catch_test_macros.hpp>

#include <blockflow/nodes/binary_nodes.h>
#include <blockflow/nodes/reduce_nodes.h>
#include <blockflow/nodes/scalar_operand_nodes.h>
#include <blockflow/runtime/block_graph.h>

using namespace blockflow;

namespace {
    constexpr uint16_t L = 16;

    BlockConfig two_blocks() { return BlockConfig{.block_size = L, .capacity = 2 * L}; }
}

// ============================================================================
// End-to-end behaviour of small graphs
// ============================================================================

TEST_CASE("Scenario - add-scalar over a sparse leaf", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto leaf = graph.add_input("leaf");
    auto five = graph.add_scalar("five", 5.0f);
    auto shifted = graph.add<AddScalarBlockNode>("shifted", leaf, five);

    leaf->set(0, 10.0f);
    leaf->set(1, 20.0f);
    leaf->set(17, 99.0f);

    auto block0 = shifted->recalculate_block(0);
    REQUIRE(block0.has_value());
    CHECK((*block0)[0] == 15.0f);
    CHECK((*block0)[1] == 25.0f);
    for (std::size_t lane = 2; lane < L; ++lane) { CHECK((*block0)[lane] == 5.0f); }

    auto block1 = shifted->recalculate_block(1);
    REQUIRE(block1.has_value());
    CHECK((*block1)[1] == 104.0f);
    CHECK((*block1)[0] == 5.0f);
    for (std::size_t lane = 2; lane < L; ++lane) { CHECK((*block1)[lane] == 5.0f); }
}

TEST_CASE("Scenario - read after write at the block boundary", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto leaf = graph.add_input("leaf");
    for (entity_index_t i : {entity_index_t{0}, entity_index_t{L - 1}, entity_index_t{L}, entity_index_t{2 * L - 1}}) {
        leaf->set(i, static_cast<lane_value_t>(i) + 0.5f);
        CHECK(leaf->value_at(i) == static_cast<lane_value_t>(i) + 0.5f);
    }
}

TEST_CASE("Scenario - redundant write costs nothing downstream", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto a = graph.add_input("a");
    auto b = graph.add_input("b");
    auto sum = graph.add<AddBlockNode>("sum", a, b);
    a->set(3, 1.0f);
    b->set(3, 1.0f);
    graph.recalculate();
    const auto baseline = sum->recompute_count();

    a->set(3, 1.0f);
    b->set(3, 1.0f);
    graph.recalculate();
    CHECK(sum->recompute_count() - baseline == 0);
}

TEST_CASE("Scenario - add follows its operands lane by lane", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto a = graph.add_input("a");
    auto b = graph.add_input("b");
    auto sum = graph.add<AddBlockNode>("sum", a, b);

    a->set(20, 3.0f);
    b->set(20, 4.0f);
    a->set(21, 1.0f);
    b->set(21, 1.0f);
    (void)sum->recalculate_block(1);
    CHECK(sum->value_at(20) == 7.0f);

    a->set(20, 5.0f);
    (void)sum->recalculate_block(1);
    CHECK(sum->value_at(20) == 9.0f);
    CHECK(sum->value_at(21) == 2.0f);
}

TEST_CASE("Scenario - multiply by scalar over a full block", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto leaf = graph.add_input("leaf", 2.0f);
    auto three = graph.add_scalar("three", 3.0f);
    auto product = graph.add<MultiplyScalarBlockNode>("product", leaf, three);

    for (entity_index_t i = 0; i < L; ++i) { leaf->set(i, 2.0f); }
    auto block = product->recalculate_block(0);
    REQUIRE(block.has_value());
    for (auto v : *block) { CHECK(v == 6.0f); }
}

TEST_CASE("Scenario - mean of a single present block", "[scenario]") {
    BlockGraph graph{two_blocks()};
    auto leaf = graph.add_input("leaf");
    auto mean = graph.add_scalar_node<MeanReduceNode>("mean", leaf);

    CHECK_FALSE(mean->recalculate().has_value());

    float total = 0.0f;
    for (entity_index_t i = 0; i < L; ++i) {
        const auto value = 10.0f * static_cast<float>(i + 1);
        leaf->set(i, value);
        total += value;
    }
    CHECK(mean->recalculate() == total / L);
    CHECK(mean->recalculate() == 85.0f);
}
