#pragma once

/**
 * @file scalar_operand_nodes.h
 * @brief Operators that combine block inputs with one scalar operand.
 *
 * The class name says where the scalar sits in a non-commutative expression: SubtractScalar is x - s,
 * ScalarSubtract is s - x. For the two-block forms the scalar replaces the named operand (ScalarY, ScalarAdd,
 * ScalarMultiplier) and the constructor takes the operands in expression order.
 */

#include <blockflow/kernels/lane_kernels.h>
#include <blockflow/types/derived_block_node.h>

namespace blockflow {

// ========== One block and a scalar ==========

// output[i] = x[i] + s
class AddScalarBlockNode final : public UnaryScalarBlockNode {
public:
    AddScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                       std::string label = "add_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::add(x, s, output); }
};

// output[i] = x[i] - s
class SubtractScalarBlockNode final : public UnaryScalarBlockNode {
public:
    SubtractScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                            std::string label = "subtract_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::subtract(x, s, output); }
};

// output[i] = s - x[i]
class ScalarSubtractBlockNode final : public UnaryScalarBlockNode {
public:
    ScalarSubtractBlockNode(scalar_node_ptr s, block_node_ptr x, const BlockConfig &config = {},
                            std::string label = "scalar_subtract")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::subtract(s, x, output); }
};

// output[i] = x[i] * s
class MultiplyScalarBlockNode final : public UnaryScalarBlockNode {
public:
    MultiplyScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                            std::string label = "multiply_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::multiply(x, s, output); }
};

// output[i] = x[i] / s
class DivideScalarBlockNode final : public UnaryScalarBlockNode {
public:
    DivideScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                          std::string label = "divide_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::divide(x, s, output); }
};

// output[i] = max(x[i], s)
class MaxScalarBlockNode final : public UnaryScalarBlockNode {
public:
    MaxScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                       std::string label = "max_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::max(x, s, output); }
};

// output[i] = max_magnitude(x[i], s)
class MaxMagnitudeScalarBlockNode final : public UnaryScalarBlockNode {
public:
    MaxMagnitudeScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config = {},
                                std::string label = "max_magnitude_scalar")
        : UnaryScalarBlockNode(std::move(x), std::move(s), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, lane_value_t s, LaneSpan output) override { kernels::max_magnitude(x, s, output); }
};

// ========== Two blocks and a scalar ==========

// output[i] = (x[i] + y[i]) * multiplier
class AddMultiplyScalarMultiplierBlockNode final : public BinaryScalarBlockNode {
public:
    AddMultiplyScalarMultiplierBlockNode(block_node_ptr x, block_node_ptr y, scalar_node_ptr multiplier,
                                         const BlockConfig &config = {},
                                         std::string label = "add_multiply_scalar_multiplier")
        : BinaryScalarBlockNode(std::move(x), std::move(y), std::move(multiplier), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, lane_value_t multiplier, LaneSpan output) override {
        kernels::add_multiply(x, y, multiplier, output);
    }
};

// output[i] = (x[i] + y) * multiplier[i]
class AddMultiplyScalarYBlockNode final : public BinaryScalarBlockNode {
public:
    AddMultiplyScalarYBlockNode(block_node_ptr x, scalar_node_ptr y, block_node_ptr multiplier,
                                const BlockConfig &config = {}, std::string label = "add_multiply_scalar_y")
        : BinaryScalarBlockNode(std::move(x), std::move(multiplier), std::move(y), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan multiplier, lane_value_t y, LaneSpan output) override {
        kernels::add_multiply(x, y, multiplier, output);
    }
};

// output[i] = x[i] * y[i] + addend
class MultiplyAddScalarAddBlockNode final : public BinaryScalarBlockNode {
public:
    MultiplyAddScalarAddBlockNode(block_node_ptr x, block_node_ptr y, scalar_node_ptr addend,
                                  const BlockConfig &config = {}, std::string label = "multiply_add_scalar_add")
        : BinaryScalarBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) override {
        kernels::multiply_add(x, y, addend, output);
    }
};

// output[i] = x[i] * y + addend[i]
class MultiplyAddScalarYBlockNode final : public BinaryScalarBlockNode {
public:
    MultiplyAddScalarYBlockNode(block_node_ptr x, scalar_node_ptr y, block_node_ptr addend,
                                const BlockConfig &config = {}, std::string label = "multiply_add_scalar_y")
        : BinaryScalarBlockNode(std::move(x), std::move(addend), std::move(y), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan addend, lane_value_t y, LaneSpan output) override {
        kernels::multiply_add(x, y, addend, output);
    }
};

// output[i] = x[i] * y[i] + addend, rounded once
class FusedMultiplyAddScalarAddBlockNode final : public BinaryScalarBlockNode {
public:
    FusedMultiplyAddScalarAddBlockNode(block_node_ptr x, block_node_ptr y, scalar_node_ptr addend,
                                       const BlockConfig &config = {},
                                       std::string label = "fused_multiply_add_scalar_add")
        : BinaryScalarBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) override {
        kernels::fused_multiply_add(x, y, addend, output);
    }
};

// output[i] = x[i] * y + addend[i], rounded once
class FusedMultiplyAddScalarYBlockNode final : public BinaryScalarBlockNode {
public:
    FusedMultiplyAddScalarYBlockNode(block_node_ptr x, scalar_node_ptr y, block_node_ptr addend,
                                     const BlockConfig &config = {}, std::string label = "fused_multiply_add_scalar_y")
        : BinaryScalarBlockNode(std::move(x), std::move(addend), std::move(y), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan addend, lane_value_t y, LaneSpan output) override {
        kernels::fused_multiply_add(x, y, addend, output);
    }
};

// output[i] = x[i] * y[i] + addend, fused when the target has FMA
class MultiplyAddEstimateScalarAddBlockNode final : public BinaryScalarBlockNode {
public:
    MultiplyAddEstimateScalarAddBlockNode(block_node_ptr x, block_node_ptr y, scalar_node_ptr addend,
                                          const BlockConfig &config = {},
                                          std::string label = "multiply_add_estimate_scalar_add")
        : BinaryScalarBlockNode(std::move(x), std::move(y), std::move(addend), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) override {
        kernels::multiply_add_estimate(x, y, addend, output);
    }
};

// output[i] = x[i] * y + addend[i], fused when the target has FMA
class MultiplyAddEstimateScalarYBlockNode final : public BinaryScalarBlockNode {
public:
    MultiplyAddEstimateScalarYBlockNode(block_node_ptr x, scalar_node_ptr y, block_node_ptr addend,
                                        const BlockConfig &config = {},
                                        std::string label = "multiply_add_estimate_scalar_y")
        : BinaryScalarBlockNode(std::move(x), std::move(addend), std::move(y), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, ConstLaneSpan addend, lane_value_t y, LaneSpan output) override {
        kernels::multiply_add_estimate(x, y, addend, output);
    }
};

} // namespace blockflow
