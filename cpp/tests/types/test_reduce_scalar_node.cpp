#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <blockflow/nodes/binary_nodes.h>
#include <blockflow/nodes/reduce_nodes.h>
#include <blockflow/types/input_block_node.h>
#include <blockflow/util/errors.h>

#include <memory>

using namespace blockflow;

namespace {
    BlockConfig config_4x8() { return BlockConfig{.block_size = 4, .capacity = 8}; }

    struct CountingObserver : ScalarNotifiable {
        int count{0};
        void notify() override { ++count; }
    };

    // Reduces each block to its first lane and records how many blocks it looked at.
    class FirstLaneReduce final : public ReduceScalarNode<lane_value_t> {
    public:
        explicit FirstLaneReduce(block_node_ptr input) : ReduceScalarNode(std::move(input), "first_lane") {}

        mutable int reduced{0};

    protected:
        [[nodiscard]] lane_value_t reduce_block(ConstLaneSpan block) const override {
            ++reduced;
            return block.front();
        }

        [[nodiscard]] std::optional<lane_value_t> aggregate(std::span<const lane_value_t> results) const override {
            return results.back();
        }
    };
}

// ============================================================================
// Concrete reductions
// ============================================================================

TEST_CASE("MeanReduceNode - absent with no present block", "[reduce_scalar_node]") {
    auto input = std::make_shared<InputBlockNode>(config_4x8());
    MeanReduceNode mean{input};
    CHECK_FALSE(mean.recalculate().has_value());
}

TEST_CASE("MeanReduceNode - mean of one block", "[reduce_scalar_node]") {
    auto input = std::make_shared<InputBlockNode>(BlockConfig{.block_size = 16, .capacity = 16});
    input->set(0, 3.0f);
    input->set(5, 4.0f);
    MeanReduceNode mean{input};
    CHECK(mean.recalculate() == 7.0f / 16.0f);
}

TEST_CASE("Reductions - over two present blocks", "[reduce_scalar_node]") {
    auto input = std::make_shared<InputBlockNode>(config_4x8());
    input->set(0, 4.0f);
    input->set(4, 8.0f);

    MeanReduceNode mean{input};
    SumReduceNode sum{input};
    MinReduceNode min{input};
    MaxReduceNode max{input};
    CountNonZeroReduceNode count{input};

    CHECK(mean.recalculate() == 1.5f);
    CHECK(sum.recalculate() == 12.0f);
    CHECK(min.recalculate() == 0.0f);
    CHECK(max.recalculate() == 8.0f);
    CHECK(count.recalculate() == int64_t{2});
}

TEST_CASE("Reductions - absent blocks are skipped", "[reduce_scalar_node][sparsity]") {
    auto input = std::make_shared<InputBlockNode>(config_4x8().with_fill(2.0f));
    input->set(5, 6.0f);

    MeanReduceNode mean{input};
    MinReduceNode min{input};
    CHECK(mean.recalculate() == Catch::Approx(3.0));
    CHECK(min.recalculate() == 2.0f);
}

// ============================================================================
// Incremental behaviour
// ============================================================================

TEST_CASE("ReduceScalarNode - follows input changes", "[reduce_scalar_node][staleness]") {
    auto input = std::make_shared<InputBlockNode>(config_4x8());
    SumReduceNode sum{input};
    CountingObserver observer;
    sum.subscribe(&observer);

    input->set(1, 2.0f);
    CHECK(sum.recalculate() == 2.0f);

    input->set(6, 3.0f);
    CHECK(sum.is_stale());
    CHECK(observer.count == 1);
    CHECK(sum.recalculate() == 5.0f);
    CHECK_FALSE(sum.is_stale());

    sum.unsubscribe(&observer);
}

TEST_CASE("ReduceScalarNode - re-reduces only announced blocks", "[reduce_scalar_node]") {
    auto input = std::make_shared<InputBlockNode>(config_4x8());
    input->set(0, 1.0f);
    input->set(4, 2.0f);

    FirstLaneReduce reduce{input};
    CHECK(reduce.recalculate() == 2.0f);
    CHECK(reduce.reduced == 2);

    input->set(4, 9.0f);
    CHECK(reduce.recalculate() == 9.0f);
    CHECK(reduce.reduced == 3);

    // Nothing changed
    CHECK(reduce.recalculate() == 9.0f);
    CHECK(reduce.reduced == 3);
}

TEST_CASE("ReduceScalarNode - absence propagates through a derived input", "[reduce_scalar_node][sparsity]") {
    auto config = BlockConfig{.block_size = 16, .capacity = 16};
    auto a = std::make_shared<InputBlockNode>(config, "a");
    auto b = std::make_shared<InputBlockNode>(config, "b");
    auto sum = std::make_shared<AddBlockNode>(a, b, config);
    MeanReduceNode mean{sum};

    a->set(0, 3.0f);
    CHECK_FALSE(mean.recalculate().has_value());

    b->set(0, 4.0f);
    CHECK(mean.is_stale());
    CHECK(mean.recalculate() == 7.0f / 16.0f);
}

TEST_CASE("ReduceScalarNode - construction", "[reduce_scalar_node][errors]") {
    CHECK_THROWS_AS(MeanReduceNode{nullptr}, ConfigurationError);

    auto input = std::make_shared<InputBlockNode>(config_4x8());
    {
        CountNonZeroReduceNode count{input, "nz"};
        CHECK(input->subscriber_count() == 1);
        CHECK(count.label() == "nz");
        CHECK(count.input() == input);
    }
    CHECK(input->subscriber_count() == 0);
}
