#pragma once

#include <blockflow/kernels/lane_kernels.h>
#include <blockflow/types/derived_block_node.h>

namespace blockflow {

/**
 * output[i] = x[i] * y[i] + addend[i], rounded once.
 */
class FusedMultiplyAddBlockNode final : public TernaryBlockNode {
public:
    FusedMultiplyAddBlockNode(block_node_ptr x, block_node_ptr y, block_node_ptr addend, const BlockConfig &config = {},
                              std::string label = "fused_multiply_add")
        : TernaryBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) override {
        kernels::fused_multiply_add(x, y, addend, output);
    }
};

/**
 * output[i] = x[i] * y[i] + addend[i]
 */
class MultiplyAddBlockNode final : public TernaryBlockNode {
public:
    MultiplyAddBlockNode(block_node_ptr x, block_node_ptr y, block_node_ptr addend, const BlockConfig &config = {},
                         std::string label = "multiply_add")
        : TernaryBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) override {
        kernels::multiply_add(x, y, addend, output);
    }
};

/**
 * output[i] = x[i] * y[i] + addend[i], fused when the target has an FMA instruction.
 */
class MultiplyAddEstimateBlockNode final : public TernaryBlockNode {
public:
    MultiplyAddEstimateBlockNode(block_node_ptr x, block_node_ptr y, block_node_ptr addend,
                                 const BlockConfig &config = {}, std::string label = "multiply_add_estimate")
        : TernaryBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) override {
        kernels::multiply_add_estimate(x, y, addend, output);
    }
};

/**
 * output[i] = (x[i] + y[i]) * multiplier[i]
 */
class AddMultiplyBlockNode final : public TernaryBlockNode {
public:
    AddMultiplyBlockNode(block_node_ptr x, block_node_ptr y, block_node_ptr multiplier, const BlockConfig &config = {},
                         std::string label = "add_multiply")
        : TernaryBlockNode(std::move(x), std::move(y), std::move(multiplier), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan multiplier, LaneSpan output) override {
        kernels::add_multiply(x, y, multiplier, output);
    }
};

} // namespace blockflow
