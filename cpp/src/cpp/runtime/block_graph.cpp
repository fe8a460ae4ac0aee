#include <blockflow/runtime/block_graph.h>

namespace blockflow {

    BlockGraph::BlockGraph(const BlockConfig &config, std::string label) : config_{config}, label_{std::move(label)} {
        config_.validate();
    }

    BlockGraph::~BlockGraph() {
        // Reverse construction order: consumers are released before the nodes they read from.
        scalar_pulls_.clear();
        while (!scalar_nodes_.empty()) { scalar_nodes_.pop_back(); }
        while (!block_nodes_.empty()) { block_nodes_.pop_back(); }
    }

    input_block_node_ptr BlockGraph::add_input(std::string label, std::optional<lane_value_t> fill_value,
                                               std::optional<AllocationMode> allocation) {
        auto config{config_};
        if (fill_value) { config.fill_value = *fill_value; }
        if (allocation) { config.allocation = *allocation; }
        return track(std::make_shared<InputBlockNode>(config, std::move(label)));
    }

    input_scalar_node_ptr BlockGraph::add_scalar(std::string label, std::optional<lane_value_t> initial) {
        return add_scalar_node<InputScalarNode<lane_value_t>>(std::move(label), initial);
    }

    void BlockGraph::recalculate() {
        for (const auto &node : block_nodes_) { node->recalculate(); }
        for (const auto &pull : scalar_pulls_) { pull(); }
    }

    void BlockGraph::check_compatible(const BlockConfig &config, const std::string &label) const {
        if (!config.compatible_with(config_)) {
            throw_error<ConfigurationError>("{}: node '{}' has {} but the graph uses {}", label_, label,
                                            config.to_string(), config_.to_string());
        }
    }

} // namespace blockflow
