#include <catch2/catch_test_macros.hpp>

#include <blockflow/nodes/binary_nodes.h>
#include <blockflow/nodes/reduce_nodes.h>
#include <blockflow/nodes/scalar_operand_nodes.h>
#include <blockflow/runtime/block_graph.h>

using namespace blockflow;

namespace {
    BlockConfig config_16x32() { return BlockConfig{.block_size = 16, .capacity = 32}; }
}

TEST_CASE("BlockGraph - nodes share the graph geometry", "[block_graph]") {
    BlockGraph graph{config_16x32(), "test"};
    auto a = graph.add_input("a");
    auto b = graph.add_input("b", 1.0f);
    auto sum = graph.add<AddBlockNode>("sum", a, b);

    CHECK(graph.label() == "test");
    CHECK(a->config().compatible_with(graph.config()));
    CHECK(b->config().fill_value == 1.0f);
    CHECK(sum->label() == "sum");
    CHECK(sum->block_count() == 2);
    CHECK(graph.block_nodes().size() == 3);
}

TEST_CASE("BlockGraph - recalculate pulls every node", "[block_graph]") {
    BlockGraph graph{config_16x32()};
    auto a = graph.add_input("a");
    auto offset = graph.add_scalar("offset", 1.0f);
    auto shifted = graph.add<AddScalarBlockNode>("shifted", a, offset);
    auto total = graph.add_scalar_node<SumReduceNode>("total", shifted);

    a->set(0, 2.0f);
    graph.recalculate();

    CHECK(shifted->value_at(0) == 3.0f);
    CHECK_FALSE(shifted->is_stale(0));
    CHECK(total->value() == 3.0f + 15.0f);
    CHECK(graph.scalar_node_count() == 2);

    offset->set(2.0f);
    CHECK(total->is_stale());
    graph.recalculate();
    CHECK(total->value() == 4.0f + 30.0f);
}

TEST_CASE("BlockGraph - add_configured only accepts matching geometry", "[block_graph][errors]") {
    BlockGraph graph{config_16x32()};
    auto a = graph.add_input("a");

    auto dense = graph.add_configured<AddBlockNode>(graph.config().with_allocation(AllocationMode::Dense), "dense", a, a);
    CHECK(dense->allocated_block_count() == 2);

    CHECK_THROWS_AS(graph.add_configured<AddBlockNode>(BlockConfig{.block_size = 8, .capacity = 32}, "narrow", a, a),
                    ConfigurationError);
}

TEST_CASE("BlockGraph - invalid configuration is rejected", "[block_graph][errors]") {
    CHECK_THROWS_AS(BlockGraph{BlockConfig{.block_size = 0}}, ConfigurationError);
}

TEST_CASE("BlockGraph - dense inputs", "[block_graph][dense]") {
    BlockGraph graph{config_16x32()};
    auto a = graph.add_input("a", 2.0f, AllocationMode::Dense);
    auto b = graph.add_input("b", 3.0f, AllocationMode::Dense);
    auto product = graph.add<MultiplyBlockNode>("product", a, b);

    CHECK(product->recalculate_block(1).has_value());
    CHECK(product->value_at(31) == 6.0f);
}

TEST_CASE("BlockGraph - nodes held by the caller outlive the graph", "[block_graph]") {
    input_block_node_ptr a;
    block_node_ptr sum;
    {
        BlockGraph graph{config_16x32()};
        a = graph.add_input("a");
        sum = graph.add<AddBlockNode>("sum", a, a);
    }
    a->set(1, 4.0f);
    CHECK(sum->recalculate_block(0).has_value());
    CHECK(sum->value_at(1) == 8.0f);
}

TEST_CASE("BlockGraph - independent graphs do not interact", "[block_graph]") {
    BlockGraph first{config_16x32()};
    BlockGraph second{config_16x32()};
    auto a = first.add_input("a");
    auto b = second.add_input("a");
    auto first_sum = first.add<AddBlockNode>("sum", a, a);

    b->set(0, 1.0f);
    CHECK_FALSE(first_sum->recalculate_block(0).has_value());
    CHECK(a->subscriber_count() == 1);
    CHECK(b->subscriber_count() == 0);
}
