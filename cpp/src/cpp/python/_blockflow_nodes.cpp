#include <blockflow/python/bindings.h>
#include <blockflow/nodes/binary_nodes.h>
#include <blockflow/nodes/reduce_nodes.h>
#include <blockflow/nodes/scalar_operand_nodes.h>
#include <blockflow/nodes/ternary_nodes.h>
#include <blockflow/nodes/unary_nodes.h>
#include <blockflow/util/errors.h>

namespace {
    using namespace blockflow;

    // A node built from Python takes the block geometry of its first input unless a config is given.
    BlockConfig config_for(const std::optional<BlockConfig> &config, const block_node_ptr &first) {
        if (config) { return *config; }
        if (!first) { throw_error<ConfigurationError>("node input must not be None"); }
        return BlockConfig{.block_size = first->config().block_size, .capacity = first->config().capacity};
    }

    template<typename Node>
    void def_unary(nb::module_ &m, const char *name) {
        m.def(name,
              [](block_node_ptr x, std::optional<BlockConfig> config, std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                  auto cfg = config_for(config, x);
                  return label ? std::make_shared<Node>(std::move(x), cfg, std::move(*label)) : std::make_shared<Node>(std::move(x), cfg);
              },
              "x"_a, "config"_a = nb::none(), "label"_a = nb::none());
    }

    template<typename Node>
    void def_binary(nb::module_ &m, const char *name) {
        m.def(name,
              [](block_node_ptr a, block_node_ptr b, std::optional<BlockConfig> config,
                 std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                  auto cfg = config_for(config, a);
                  return label ? std::make_shared<Node>(std::move(a), std::move(b), cfg, std::move(*label))
                               : std::make_shared<Node>(std::move(a), std::move(b), cfg);
              },
              "a"_a, "b"_a, "config"_a = nb::none(), "label"_a = nb::none());
    }

    template<typename Node>
    void def_ternary(nb::module_ &m, const char *name) {
        m.def(name,
              [](block_node_ptr a, block_node_ptr b, block_node_ptr c, std::optional<BlockConfig> config,
                 std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                  auto cfg = config_for(config, a);
                  return label ? std::make_shared<Node>(std::move(a), std::move(b), std::move(c), cfg, std::move(*label))
                               : std::make_shared<Node>(std::move(a), std::move(b), std::move(c), cfg);
              },
              "a"_a, "b"_a, "c"_a, "config"_a = nb::none(), "label"_a = nb::none());
    }

    template<typename Node>
    void def_block_scalar(nb::module_ &m, const char *name) {
        m.def(name,
              [](block_node_ptr x, scalar_node_ptr s, std::optional<BlockConfig> config,
                 std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                  auto cfg = config_for(config, x);
                  return label ? std::make_shared<Node>(std::move(x), std::move(s), cfg, std::move(*label))
                               : std::make_shared<Node>(std::move(x), std::move(s), cfg);
              },
              "x"_a, "s"_a, "config"_a = nb::none(), "label"_a = nb::none());
    }

    // Two blocks and a scalar, in the node's own constructor order: (x, y, s) or (x, s, y).
    template<typename Node, bool ScalarSecond>
    void def_two_block_scalar(nb::module_ &m, const char *name) {
        if constexpr (ScalarSecond) {
            m.def(name,
                  [](block_node_ptr x, scalar_node_ptr s, block_node_ptr y, std::optional<BlockConfig> config,
                     std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                      auto cfg = config_for(config, x);
                      return label ? std::make_shared<Node>(std::move(x), std::move(s), std::move(y), cfg, std::move(*label))
                                   : std::make_shared<Node>(std::move(x), std::move(s), std::move(y), cfg);
                  },
                  "x"_a, "s"_a, "y"_a, "config"_a = nb::none(), "label"_a = nb::none());
        } else {
            m.def(name,
                  [](block_node_ptr x, block_node_ptr y, scalar_node_ptr s, std::optional<BlockConfig> config,
                     std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
                      auto cfg = config_for(config, x);
                      return label ? std::make_shared<Node>(std::move(x), std::move(y), std::move(s), cfg, std::move(*label))
                                   : std::make_shared<Node>(std::move(x), std::move(y), std::move(s), cfg);
                  },
                  "x"_a, "y"_a, "s"_a, "config"_a = nb::none(), "label"_a = nb::none());
        }
    }

    template<typename Node>
    void def_reduce(nb::module_ &m, const char *name) {
        m.def(name,
              [](block_node_ptr input, std::optional<std::string> label) {
                  return label ? std::make_shared<Node>(std::move(input), std::move(*label)) : std::make_shared<Node>(std::move(input));
              },
              "input"_a, "label"_a = nb::none());
    }
} // namespace

void export_nodes(nb::module_ &m) {
    using namespace blockflow;

    nb::class_<DerivedBlockNode, BlockNode>(m, "DerivedBlockNode")
        .def_prop_ro("recompute_count", &DerivedBlockNode::recompute_count)
        .def_prop_ro("inputs", &DerivedBlockNode::inputs)
        .def_prop_ro("scalar", &DerivedBlockNode::scalar);

    nb::class_<MeanReduceNode, ScalarNode<lane_value_t>>(m, "MeanReduceNode");
    nb::class_<SumReduceNode, ScalarNode<lane_value_t>>(m, "SumReduceNode");
    nb::class_<MinReduceNode, ScalarNode<lane_value_t>>(m, "MinReduceNode");
    nb::class_<MaxReduceNode, ScalarNode<lane_value_t>>(m, "MaxReduceNode");
    nb::class_<CountNonZeroReduceNode, ScalarNode<int64_t>>(m, "CountNonZeroReduceNode");

    // Unary
    def_unary<AsinhBlockNode>(m, "asinh");
    def_unary<AsinPiBlockNode>(m, "asin_pi");
    def_unary<AtanBlockNode>(m, "atan");
    def_unary<AtanPiBlockNode>(m, "atan_pi");
    def_unary<ExpBlockNode>(m, "exp");
    def_unary<Exp2M1BlockNode>(m, "exp2m1");
    def_unary<Exp10M1BlockNode>(m, "exp10m1");
    def_unary<FloorBlockNode>(m, "floor");
    def_unary<Log10BlockNode>(m, "log10");
    def_unary<Log10P1BlockNode>(m, "log10p1");
    def_unary<ReciprocalSqrtBlockNode>(m, "reciprocal_sqrt");
    def_unary<RoundBlockNode>(m, "round");
    def_unary<SigmoidBlockNode>(m, "sigmoid");
    def_unary<SinPiBlockNode>(m, "sin_pi");
    def_unary<SoftMaxBlockNode>(m, "softmax");
    def_unary<TruncateBlockNode>(m, "truncate");

    // Binary
    def_binary<AddBlockNode>(m, "add");
    def_binary<SubtractBlockNode>(m, "subtract");
    def_binary<MultiplyBlockNode>(m, "multiply");
    def_binary<DivideBlockNode>(m, "divide");
    def_binary<MinBlockNode>(m, "min");
    def_binary<MaxBlockNode>(m, "max");
    def_binary<MinMagnitudeBlockNode>(m, "min_magnitude");
    def_binary<MaxMagnitudeBlockNode>(m, "max_magnitude");
    def_binary<MinMagnitudeNumberBlockNode>(m, "min_magnitude_number");
    def_binary<MaxMagnitudeNumberBlockNode>(m, "max_magnitude_number");
    def_binary<AndBlockNode>(m, "bitwise_and");
    def_binary<OrBlockNode>(m, "bitwise_or");

    // Ternary
    def_ternary<FusedMultiplyAddBlockNode>(m, "fused_multiply_add");
    def_ternary<MultiplyAddBlockNode>(m, "multiply_add");
    def_ternary<MultiplyAddEstimateBlockNode>(m, "multiply_add_estimate");
    def_ternary<AddMultiplyBlockNode>(m, "add_multiply");

    // Block and scalar
    def_block_scalar<AddScalarBlockNode>(m, "add_scalar");
    def_block_scalar<SubtractScalarBlockNode>(m, "subtract_scalar");
    def_block_scalar<MultiplyScalarBlockNode>(m, "multiply_scalar");
    def_block_scalar<DivideScalarBlockNode>(m, "divide_scalar");
    def_block_scalar<MaxScalarBlockNode>(m, "max_scalar");
    def_block_scalar<MaxMagnitudeScalarBlockNode>(m, "max_magnitude_scalar");
    m.def("scalar_subtract",
          [](scalar_node_ptr s, block_node_ptr x, std::optional<BlockConfig> config,
             std::optional<std::string> label) -> std::shared_ptr<DerivedBlockNode> {
              auto cfg = config_for(config, x);
              return label ? std::make_shared<ScalarSubtractBlockNode>(std::move(s), std::move(x), cfg, std::move(*label))
                           : std::make_shared<ScalarSubtractBlockNode>(std::move(s), std::move(x), cfg);
          },
          "s"_a, "x"_a, "config"_a = nb::none(), "label"_a = nb::none());

    // Two blocks and a scalar
    def_two_block_scalar<AddMultiplyScalarMultiplierBlockNode, false>(m, "add_multiply_scalar_multiplier");
    def_two_block_scalar<AddMultiplyScalarYBlockNode, true>(m, "add_multiply_scalar_y");
    def_two_block_scalar<MultiplyAddScalarAddBlockNode, false>(m, "multiply_add_scalar_add");
    def_two_block_scalar<MultiplyAddScalarYBlockNode, true>(m, "multiply_add_scalar_y");
    def_two_block_scalar<FusedMultiplyAddScalarAddBlockNode, false>(m, "fused_multiply_add_scalar_add");
    def_two_block_scalar<FusedMultiplyAddScalarYBlockNode, true>(m, "fused_multiply_add_scalar_y");
    def_two_block_scalar<MultiplyAddEstimateScalarAddBlockNode, false>(m, "multiply_add_estimate_scalar_add");
    def_two_block_scalar<MultiplyAddEstimateScalarYBlockNode, true>(m, "multiply_add_estimate_scalar_y");

    // Reductions
    def_reduce<MeanReduceNode>(m, "mean_reduce");
    def_reduce<SumReduceNode>(m, "sum_reduce");
    def_reduce<MinReduceNode>(m, "min_reduce");
    def_reduce<MaxReduceNode>(m, "max_reduce");
    def_reduce<CountNonZeroReduceNode>(m, "count_non_zero_reduce");
}
