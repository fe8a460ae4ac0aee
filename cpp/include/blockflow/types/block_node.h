#pragma once

/**
 * @file block_node.h
 * @brief BlockNode - the pull interface shared by mutable leaves and derived block nodes.
 */

#include <blockflow/types/sparse_block_store.h>

#include <string>

namespace blockflow {

/**
 * A per-entity float stream stored in fixed-size lane blocks.
 *
 * The node exclusively owns its SparseBlockStore. Downstream nodes hold shared ownership of their upstreams
 * and subscribe to their staleness announcements; an upstream never references its consumers other than
 * through the non-owning subscriber list.
 *
 * Nodes are neither copyable nor movable: subscribers hold their address.
 */
class BLOCKFLOW_EXPORT BlockNode {
public:
    virtual ~BlockNode() = default;

    BlockNode(const BlockNode&) = delete;
    BlockNode& operator=(const BlockNode&) = delete;
    BlockNode(BlockNode&&) = delete;
    BlockNode& operator=(BlockNode&&) = delete;

    [[nodiscard]] const BlockConfig &config() const { return store_.config(); }

    [[nodiscard]] block_index_t block_count() const { return store_.block_count(); }

    [[nodiscard]] std::size_t block_size() const { return store_.block_size(); }

    [[nodiscard]] BlockAddress locate(entity_index_t entity_index) const { return store_.locate(entity_index); }

    /**
     * Brings block_index up to date with its upstreams, recomputing only when it is stale.
     * @return the block, or std::nullopt when the block has no data (an operand was absent)
     */
    virtual BlockResult recalculate_block(block_index_t block_index) = 0;

    /**
     * Pulls every block index.
     */
    void recalculate();

    /**
     * The cached block without any recomputation.
     */
    [[nodiscard]] BlockResult try_get_block(block_index_t block_index) const { return store_.try_get_block(block_index); }

    /**
     * The cached lane for an entity, std::nullopt when its block is absent. Does not recompute.
     */
    [[nodiscard]] std::optional<lane_value_t> value_at(entity_index_t entity_index) const;

    [[nodiscard]] bool is_stale(block_index_t block_index) const { return store_.is_stale(block_index); }

    [[nodiscard]] std::size_t allocated_block_count() const { return store_.allocated_block_count(); }

    void subscribe(BlockNotifiable *observer) { store_.subscribe(observer); }

    void unsubscribe(BlockNotifiable *observer) { store_.unsubscribe(observer); }

    [[nodiscard]] std::size_t subscriber_count() const { return store_.subscriber_count(); }

    [[nodiscard]] const std::string &label() const { return label_; }

    void set_label(std::string label) { label_ = std::move(label); }

protected:
    explicit BlockNode(const BlockConfig &config, std::string label);

    /**
     * Flags the block stale and announces it to subscribers (once per pull).
     */
    void mark_stale(block_index_t block_index);

    void mark_all_stale();

    [[nodiscard]] SparseBlockStore &store() { return store_; }

    [[nodiscard]] const SparseBlockStore &store() const { return store_; }

private:
    SparseBlockStore store_;
    std::string label_;
};

} // namespace blockflow
