#pragma once

/**
 * @file block_graph.h
 * @brief BlockGraph - a caller-owned container that builds and owns the nodes of one block subgraph.
 *
 * Every node a graph builds receives the graph's BlockConfig (optionally with a per-node fill value or
 * allocation mode), so the whole subgraph shares one block size and capacity. Since a node can only be built
 * from nodes that already exist and edges never change after construction, a graph is acyclic by
 * construction. Independent graphs share nothing.
 */

#include <blockflow/types/block_node.h>
#include <blockflow/types/input_block_node.h>
#include <blockflow/types/scalar_node.h>
#include <blockflow/util/errors.h>

#include <functional>
#include <string>
#include <type_traits>
#include <vector>

namespace blockflow {

class BLOCKFLOW_EXPORT BlockGraph {
public:
    explicit BlockGraph(const BlockConfig &config = {}, std::string label = "graph");

    ~BlockGraph();

    BlockGraph(const BlockGraph&) = delete;
    BlockGraph& operator=(const BlockGraph&) = delete;

    [[nodiscard]] const BlockConfig &config() const { return config_; }

    [[nodiscard]] const std::string &label() const { return label_; }

    // ========== Leaves ==========

    input_block_node_ptr add_input(std::string label, std::optional<lane_value_t> fill_value = std::nullopt,
                                   std::optional<AllocationMode> allocation = std::nullopt);

    input_scalar_node_ptr add_scalar(std::string label, std::optional<lane_value_t> initial = std::nullopt);

    // ========== Derived nodes ==========

    /**
     * Builds Node(args..., config(), label) and takes ownership of it.
     */
    template<typename Node, typename... Args>
        requires std::is_base_of_v<BlockNode, Node>
    std::shared_ptr<Node> add(std::string label, Args&&... args) {
        return track(std::make_shared<Node>(std::forward<Args>(args)..., config_, std::move(label)));
    }

    /**
     * As add(), with a node-specific config. Only the fill value and allocation mode may differ from the graph.
     * @throws ConfigurationError when the block geometry differs from the graph's
     */
    template<typename Node, typename... Args>
        requires std::is_base_of_v<BlockNode, Node>
    std::shared_ptr<Node> add_configured(const BlockConfig &config, std::string label, Args&&... args) {
        check_compatible(config, label);
        return track(std::make_shared<Node>(std::forward<Args>(args)..., config, std::move(label)));
    }

    /**
     * Builds a scalar node Node(args..., label), typically a reduction, and takes ownership of it.
     */
    template<typename Node, typename... Args>
        requires (!std::is_base_of_v<BlockNode, Node>)
    std::shared_ptr<Node> add_scalar_node(std::string label, Args&&... args) {
        auto node = std::make_shared<Node>(std::forward<Args>(args)..., std::move(label));
        scalar_nodes_.push_back(node);
        scalar_pulls_.emplace_back([raw = node.get()] { (void)raw->recalculate(); });
        return node;
    }

    // ========== Evaluation ==========

    /**
     * Pulls every block of every block node, then every scalar node, in construction order.
     */
    void recalculate();

    [[nodiscard]] const std::vector<block_node_ptr> &block_nodes() const { return block_nodes_; }

    [[nodiscard]] std::size_t scalar_node_count() const { return scalar_nodes_.size(); }

private:
    void check_compatible(const BlockConfig &config, const std::string &label) const;

    template<typename Node>
    std::shared_ptr<Node> track(std::shared_ptr<Node> node) {
        block_nodes_.push_back(node);
        return node;
    }

    BlockConfig config_;
    std::string label_;
    std::vector<block_node_ptr> block_nodes_;
    std::vector<std::shared_ptr<void>> scalar_nodes_;
    std::vector<std::function<void()>> scalar_pulls_;
};

} // namespace blockflow
