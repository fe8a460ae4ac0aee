#include <blockflow/types/derived_block_node.h>
#include <blockflow/util/debug_log.h>
#include <blockflow/util/errors.h>

namespace blockflow {

    DerivedBlockNode::DerivedBlockNode(std::initializer_list<block_node_ptr> inputs, scalar_node_ptr scalar,
                                       const BlockConfig &config, std::string label)
        : BlockNode(config, std::move(label)), inputs_{inputs}, scalar_{std::move(scalar)} {
        if (inputs_.empty() || inputs_.size() > MAX_BLOCK_INPUTS) {
            throw_error<ConfigurationError>("{}: a derived block node takes 1 to {} block inputs, got {}", this->label(),
                                            MAX_BLOCK_INPUTS, inputs_.size());
        }
        for (std::size_t i = 0; i < inputs_.size(); ++i) {
            const auto &input = inputs_[i];
            if (!input) { throw_error<ConfigurationError>("{}: block input {} is null", this->label(), i); }
            if (!input->config().compatible_with(this->config())) {
                throw_error<ConfigurationError>("{}: block input {} ('{}') has {} but this node has {}", this->label(), i,
                                                input->label(), input->config().to_string(), this->config().to_string());
            }
        }

        // Subscribe only once every check has passed, a throwing constructor runs no destructor.
        for (const auto &input : inputs_) { input->subscribe(this); }
        if (scalar_) { scalar_->subscribe(this); }
    }

    DerivedBlockNode::~DerivedBlockNode() {
        for (const auto &input : inputs_) { input->unsubscribe(this); }
        if (scalar_) { scalar_->unsubscribe(this); }
    }

    BlockResult DerivedBlockNode::recalculate_block(block_index_t block_index) {
        auto &blocks = store();
        blocks.rearm(block_index);
        if (!blocks.is_stale(block_index)) { return blocks.try_get_block(block_index); }

        for (const auto &input : inputs_) { (void)input->recalculate_block(block_index); }

        std::array<ConstLaneSpan, MAX_BLOCK_INPUTS> gathered{};
        for (std::size_t i = 0; i < inputs_.size(); ++i) {
            auto block = inputs_[i]->try_get_block(block_index);
            if (!block) { return abandon(block_index, inputs_[i]->label()); }
            gathered[i] = *block;
        }

        std::optional<lane_value_t> scalar_value;
        if (scalar_) {
            scalar_value = scalar_->recalculate();
            if (!scalar_value) { return abandon(block_index, scalar_->label()); }
        }

        auto output = blocks.allocate_block(block_index);
        compute_block(std::span<const ConstLaneSpan>{gathered.data(), inputs_.size()}, scalar_value, output);
        blocks.clear_stale(block_index);
        ++recompute_count_;
        debug_log(DebugChannel::Recompute, "{} block {} recomputed", label(), block_index);
        return ConstLaneSpan{output};
    }

    BlockResult DerivedBlockNode::abandon(block_index_t block_index, std::string_view reason) {
        debug_log(DebugChannel::Sparsity, "{} block {} skipped, '{}' has no data", label(), block_index, reason);
        store().reset_block(block_index);
        return store().try_get_block(block_index);
    }

    void DerivedBlockNode::notify(block_index_t block_index) { mark_stale(block_index); }

    void DerivedBlockNode::notify() { mark_all_stale(); }

    UnaryBlockNode::UnaryBlockNode(block_node_ptr x, const BlockConfig &config, std::string label)
        : DerivedBlockNode({std::move(x)}, nullptr, config, std::move(label)) {}

    void UnaryBlockNode::compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t>,
                                       LaneSpan output) {
        compute(inputs[0], output);
    }

    BinaryBlockNode::BinaryBlockNode(block_node_ptr a, block_node_ptr b, const BlockConfig &config, std::string label)
        : DerivedBlockNode({std::move(a), std::move(b)}, nullptr, config, std::move(label)) {}

    void BinaryBlockNode::compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t>,
                                        LaneSpan output) {
        compute(inputs[0], inputs[1], output);
    }

    TernaryBlockNode::TernaryBlockNode(block_node_ptr a, block_node_ptr b, block_node_ptr c, const BlockConfig &config,
                                       std::string label)
        : DerivedBlockNode({std::move(a), std::move(b), std::move(c)}, nullptr, config, std::move(label)) {}

    void TernaryBlockNode::compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t>,
                                         LaneSpan output) {
        compute(inputs[0], inputs[1], inputs[2], output);
    }

    UnaryScalarBlockNode::UnaryScalarBlockNode(block_node_ptr x, scalar_node_ptr s, const BlockConfig &config,
                                               std::string label)
        : DerivedBlockNode({std::move(x)}, std::move(s), config, std::move(label)) {
        if (!scalar()) { throw_error<ConfigurationError>("{}: scalar operand is null", this->label()); }
    }

    void UnaryScalarBlockNode::compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                                             LaneSpan output) {
        compute(inputs[0], *scalar, output);
    }

    BinaryScalarBlockNode::BinaryScalarBlockNode(block_node_ptr a, block_node_ptr b, scalar_node_ptr s,
                                                 const BlockConfig &config, std::string label)
        : DerivedBlockNode({std::move(a), std::move(b)}, std::move(s), config, std::move(label)) {
        if (!scalar()) { throw_error<ConfigurationError>("{}: scalar operand is null", this->label()); }
    }

    void BinaryScalarBlockNode::compute_block(std::span<const ConstLaneSpan> inputs, std::optional<lane_value_t> scalar,
                                              LaneSpan output) {
        compute(inputs[0], inputs[1], *scalar, output);
    }

} // namespace blockflow
