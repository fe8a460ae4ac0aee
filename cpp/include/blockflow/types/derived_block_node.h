#pragma once

/**
 * @file derived_block_node.h
 * @brief DerivedBlockNode - recomputes one block at a time from 1-3 upstream block nodes and an optional scalar.
 *
 * The contract decides whether and how to recompute a block; the numeric operation lives entirely in the
 * kernel a concrete node plugs in through compute_block(). Pull algorithm for recalculate_block(i):
 *
 *  1. If block i is not stale, serve it from cache.
 *  2. Pull block i of every upstream block node (bottom-up freshness).
 *  3. If any upstream block i is absent, abandon: block i returns to its initial state (released when sparse,
 *     refilled when dense) and stays stale. Sparsity propagates by omission; this is not an error.
 *  4. If there is a scalar operand, pull it; abandon the same way when it is absent.
 *  5. Otherwise obtain (allocating lazily) the output block, run the kernel, clear the staleness of block i.
 *
 * An upstream block announcement invalidates only the matching block index. A scalar announcement invalidates
 * every block.
 */

#include <blockflow/types/block_node.h>
#include <blockflow/types/scalar_node.h>

#include <array>
#include <initializer_list>
#include <vector>

namespace blockflow {

inline constexpr std::size_t MAX_BLOCK_INPUTS = 3;

class BLOCKFLOW_EXPORT DerivedBlockNode : public BlockNode, public BlockNotifiable, public ScalarNotifiable {
public:
    ~DerivedBlockNode() override;

    BlockResult recalculate_block(block_index_t block_index) override;

    // BlockNotifiable
    void notify(block_index_t block_index) override;

    // ScalarNotifiable
    void notify() override;

    [[nodiscard]] const std::vector<block_node_ptr> &inputs() const { return inputs_; }

    [[nodiscard]] const scalar_node_ptr &scalar() const { return scalar_; }

    /**
     * Number of times a kernel ran on this node. Diagnostic only.
     */
    [[nodiscard]] std::size_t recompute_count() const { return recompute_count_; }

protected:
    /**
     * @throws ConfigurationError when an input is null, when there are not 1-3 inputs, or when an input's block
     *         geometry differs from config.
     */
    DerivedBlockNode(std::initializer_list<block_node_ptr> inputs, scalar_node_ptr scalar, const BlockConfig &config,
                     std::string label);

    /**
     * Runs the kernel: inputs holds one fully populated block per upstream (in construction order), scalar is
     * engaged exactly when the node was built with a scalar operand. output has block_size() lanes.
     */
    virtual void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                               LaneSpan output) = 0;

private:
    BlockResult abandon(block_index_t block_index, std::string_view reason);

    std::vector<block_node_ptr> inputs_;
    scalar_node_ptr scalar_;
    std::size_t recompute_count_{0};
};

/**
 * output[i] = f(x[i])
 */
class BLOCKFLOW_EXPORT UnaryBlockNode : public DerivedBlockNode {
public:
    UnaryBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "unary");

protected:
    virtual void compute(ConstLaneSpan x, LaneSpan output) = 0;

private:
    void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                       LaneSpan output) final;
};

/**
 * output[i] = f(a[i], b[i])
 */
class BLOCKFLOW_EXPORT BinaryBlockNode : public DerivedBlockNode {
public:
    BinaryBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "binary");

protected:
    virtual void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) = 0;

private:
    void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                       LaneSpan output) final;
};

/**
 * output[i] = f(a[i], b[i], c[i])
 */
class BLOCKFLOW_EXPORT TernaryBlockNode : public DerivedBlockNode {
public:
    TernaryBlockNode(block_node_ptr a, block_node_ptr b, block_node_ptr c, const BlockConfig &config = {},
                     std::string label = "ternary");

protected:
    virtual void compute(ConstLaneSpan a, ConstLaneSpan b, ConstLaneSpan c, LaneSpan output) = 0;

private:
    void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                       LaneSpan output) final;
};

/**
 * output[i] = f(x[i], s). Every block is stale at construction and again on every change of s.
 */
class BLOCKFLOW_EXPORT UnaryScalarBlockNode : public DerivedBlockNode {
public:
    UnaryScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                         std::string label = "unary_scalar");

protected:
    virtual void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) = 0;

private:
    void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                       LaneSpan output) final;
};

/**
 * output[i] = f(a[i], b[i], s). Every block is stale at construction and again on every change of s.
 */
class BLOCKFLOW_EXPORT BinaryScalarBlockNode : public DerivedBlockNode {
public:
    BinaryScalarBlockNode(block_node_ptr a, block_node_ptr b, scalar_node_ptr s, const BlockConfig &config = {},
                          std::string label = "binary_scalar");

protected:
    virtual void compute(ConstLaneSpan a, ConstLaneSpan b, lane_value_t s, LaneSpan output) = 0;

private:
    void compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                       LaneSpan output) final;
};

} // namespace blockflow
