#pragma once

/**
 * @file reduce_nodes.h
 * @brief Concrete reductions of a block node to a scalar.
 *
 * Lanes that were never written still hold the input's fill value and take part in the reduction.
 */

#include <blockflow/kernels/lane_kernels.h>
#include <blockflow/types/reduce_scalar_node.h>

#include <algorithm>
#include <cstdint>
#include <numeric>

namespace blockflow {

// Mean of each block, then mean of the block means.
class MeanReduceNode final : public ReduceScalarNode<lane_value_t> {
public:
    explicit MeanReduceNode(block_node_ptr input, std::string label = "mean")
        : ReduceScalarNode(std::move(input), std::move(label)) {}

protected:
    [[nodiscard]] lane_value_t reduce_block(ConstLaneSpan block) const override {
        return std::accumulate(block.begin(), block.end(), 0.0f) / static_cast<lane_value_t>(block.size());
    }

    [[nodiscard]] std::optional<lane_value_t> aggregate(std::span<const lane_value_t> results) const override {
        return std::accumulate(results.begin(), results.end(), 0.0f) / static_cast<lane_value_t>(results.size());
    }
};

class SumReduceNode final : public ReduceScalarNode<lane_value_t> {
public:
    explicit SumReduceNode(block_node_ptr input, std::string label = "sum")
        : ReduceScalarNode(std::move(input), std::move(label)) {}

protected:
    [[nodiscard]] lane_value_t reduce_block(ConstLaneSpan block) const override {
        return std::accumulate(block.begin(), block.end(), 0.0f);
    }

    [[nodiscard]] std::optional<lane_value_t> aggregate(std::span<const lane_value_t> results) const override {
        return std::accumulate(results.begin(), results.end(), 0.0f);
    }
};

class MinReduceNode final : public ReduceScalarNode<lane_value_t> {
public:
    explicit MinReduceNode(block_node_ptr input, std::string label = "min")
        : ReduceScalarNode(std::move(input), std::move(label)) {}

protected:
    [[nodiscard]] lane_value_t reduce_block(ConstLaneSpan block) const override {
        return std::reduce(block.begin() + 1, block.end(), block.front(), kernels::ieee_min);
    }

    [[nodiscard]] std::optional<lane_value_t> aggregate(std::span<const lane_value_t> results) const override {
        return std::reduce(results.begin() + 1, results.end(), results.front(), kernels::ieee_min);
    }
};

class MaxReduceNode final : public ReduceScalarNode<lane_value_t> {
public:
    explicit MaxReduceNode(block_node_ptr input, std::string label = "max")
        : ReduceScalarNode(std::move(input), std::move(label)) {}

protected:
    [[nodiscard]] lane_value_t reduce_block(ConstLaneSpan block) const override {
        return std::reduce(block.begin() + 1, block.end(), block.front(), kernels::ieee_max);
    }

    [[nodiscard]] std::optional<lane_value_t> aggregate(std::span<const lane_value_t> results) const override {
        return std::reduce(results.begin() + 1, results.end(), results.front(), kernels::ieee_max);
    }
};

// Number of lanes holding a non-zero value across all present blocks.
class CountNonZeroReduceNode final : public ReduceScalarNode<int64_t> {
public:
    explicit CountNonZeroReduceNode(block_node_ptr input, std::string label = "count_non_zero")
        : ReduceScalarNode(std::move(input), std::move(label)) {}

protected:
    [[nodiscard]] int64_t reduce_block(ConstLaneSpan block) const override {
        return std::count_if(block.begin(), block.end(), [](lane_value_t v) { return v != 0.0f; });
    }

    [[nodiscard]] std::optional<int64_t> aggregate(std::span<const int64_t> results) const override {
        return std::accumulate(results.begin(), results.end(), int64_t{0});
    }
};

} // namespace blockflow
