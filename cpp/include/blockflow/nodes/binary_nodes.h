#pragma once

#include <blockflow/kernels/lane_kernels.h>
#include <blockflow/types/derived_block_node.h>

namespace blockflow {

// output[i] = a[i] + b[i]
class AddBlockNode final : public BinaryBlockNode {
public:
    AddBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "add")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::add(a, b, output); }
};

// output[i] = a[i] - b[i]
class SubtractBlockNode final : public BinaryBlockNode {
public:
    SubtractBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "subtract")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::subtract(a, b, output); }
};

// output[i] = a[i] * b[i]
class MultiplyBlockNode final : public BinaryBlockNode {
public:
    MultiplyBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "multiply")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::multiply(a, b, output); }
};

// output[i] = a[i] / b[i]
class DivideBlockNode final : public BinaryBlockNode {
public:
    DivideBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "divide")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::divide(a, b, output); }
};

class MinBlockNode final : public BinaryBlockNode {
public:
    MinBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "min")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::min(a, b, output); }
};

class MaxBlockNode final : public BinaryBlockNode {
public:
    MaxBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "max")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::max(a, b, output); }
};

// The operand with the smaller absolute value, NaN propagates.
class MinMagnitudeBlockNode final : public BinaryBlockNode {
public:
    MinMagnitudeBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "min_magnitude")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::min_magnitude(a, b, output); }
};

// The operand with the larger absolute value, NaN propagates.
class MaxMagnitudeBlockNode final : public BinaryBlockNode {
public:
    MaxMagnitudeBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "max_magnitude")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::max_magnitude(a, b, output); }
};

// As MinMagnitude, but a NaN operand loses to a number.
class MinMagnitudeNumberBlockNode final : public BinaryBlockNode {
public:
    MinMagnitudeNumberBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "min_magnitude_number")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::min_magnitude_number(a, b, output); }
};

// As MaxMagnitude, but a NaN operand loses to a number.
class MaxMagnitudeNumberBlockNode final : public BinaryBlockNode {
public:
    MaxMagnitudeNumberBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "max_magnitude_number")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::max_magnitude_number(a, b, output); }
};

// Bitwise AND of the float representations.
class AndBlockNode final : public BinaryBlockNode {
public:
    AndBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "bitwise_and")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::bitwise_and(a, b, output); }
};

// Bitwise OR of the float representations.
class OrBlockNode final : public BinaryBlockNode {
public:
    OrBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config = {}, std::string label = "bitwise_or")
        : BinaryBlockNode(std::move(a), std::move(b), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) override { kernels::bitwise_or(a, b, output); }
};

} // namespace blockflow
