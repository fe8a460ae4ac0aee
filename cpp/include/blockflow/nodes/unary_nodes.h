#pragma once

#include <blockflow/kernels/lane_kernels.h>
#include <blockflow/types/derived_block_node.h>

namespace blockflow {

// output[i] = asinh(x[i])
class AsinhBlockNode final : public UnaryBlockNode {
public:
    explicit AsinhBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "asinh")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::asinh(x, output); }
};

// output[i] = asin(x[i]) / pi
class AsinPiBlockNode final : public UnaryBlockNode {
public:
    explicit AsinPiBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "asin_pi")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::asin_pi(x, output); }
};

// output[i] = atan(x[i])
class AtanBlockNode final : public UnaryBlockNode {
public:
    explicit AtanBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "atan")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::atan(x, output); }
};

// output[i] = atan(x[i]) / pi
class AtanPiBlockNode final : public UnaryBlockNode {
public:
    explicit AtanPiBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "atan_pi")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::atan_pi(x, output); }
};

// output[i] = e^x[i]
class ExpBlockNode final : public UnaryBlockNode {
public:
    explicit ExpBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "exp")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::exp(x, output); }
};

// output[i] = 2^x[i] - 1
class Exp2M1BlockNode final : public UnaryBlockNode {
public:
    explicit Exp2M1BlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "exp2_m1")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::exp2_m1(x, output); }
};

// output[i] = 10^x[i] - 1
class Exp10M1BlockNode final : public UnaryBlockNode {
public:
    explicit Exp10M1BlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "exp10_m1")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::exp10_m1(x, output); }
};

class FloorBlockNode final : public UnaryBlockNode {
public:
    explicit FloorBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "floor")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::floor(x, output); }
};

class Log10BlockNode final : public UnaryBlockNode {
public:
    explicit Log10BlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "log10")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::log10(x, output); }
};

// output[i] = log10(1 + x[i])
class Log10P1BlockNode final : public UnaryBlockNode {
public:
    explicit Log10P1BlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "log10_p1")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::log10_p1(x, output); }
};

// output[i] = 1 / sqrt(x[i])
class ReciprocalSqrtBlockNode final : public UnaryBlockNode {
public:
    explicit ReciprocalSqrtBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "reciprocal_sqrt")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::reciprocal_sqrt(x, output); }
};

// Rounds to the nearest integer, half-way cases to even.
class RoundBlockNode final : public UnaryBlockNode {
public:
    explicit RoundBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "round")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::round(x, output); }
};

// output[i] = 1 / (1 + e^-x[i])
class SigmoidBlockNode final : public UnaryBlockNode {
public:
    explicit SigmoidBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "sigmoid")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::sigmoid(x, output); }
};

// output[i] = sin(pi * x[i])
class SinPiBlockNode final : public UnaryBlockNode {
public:
    explicit SinPiBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "sin_pi")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::sin_pi(x, output); }
};

// Softmax across the lanes of each block. Lanes that still hold the fill value take part.
class SoftMaxBlockNode final : public UnaryBlockNode {
public:
    explicit SoftMaxBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "softmax")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::softmax(x, output); }
};

// Rounds toward zero.
class TruncateBlockNode final : public UnaryBlockNode {
public:
    explicit TruncateBlockNode(block_node_ptr x, const BlockConfig &config = {}, std::string label = "truncate")
        : UnaryBlockNode(std::move(x), config, std::move(label)) {}

protected:
    void compute(ConstLaneSpan x, LaneSpan output) override { kernels::truncate(x, output); }
};

} // namespace blockflow
