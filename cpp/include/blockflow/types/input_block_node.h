#pragma once

#include <blockflow/types/block_node.h>
#include <blockflow/types/lane_handle.h>

namespace blockflow {

/**
 * A mutable leaf: per-entity values written by the caller.
 *
 * Writing a lane allocates its block lazily (unless dense). A write that leaves the block unchanged does not
 * mark it stale, so a redundant write never cascades. Allocating a block counts as a change even when the
 * written value equals the fill value, since the block went from absent to present.
 */
class BLOCKFLOW_EXPORT InputBlockNode final : public BlockNode {
public:
    explicit InputBlockNode(const BlockConfig &config = {}, std::string label = "input");

    void set(entity_index_t entity_index, lane_value_t value);

    void set(const BlockAddress &address, lane_value_t value);

    /**
     * Writes a whole block. Raises staleness once when any lane changed.
     * @throws std::invalid_argument when values.size() != block_size()
     */
    void assign_block(block_index_t block_index, ConstLaneSpan values);

    /**
     * Allocates the entity's block and returns a handle bound to its lane.
     */
    [[nodiscard]] LaneHandle instance_for(entity_index_t entity_index);

    /**
     * A leaf has nothing to recompute; a pull only acknowledges the pending staleness.
     */
    BlockResult recalculate_block(block_index_t block_index) override;

private:
    friend class LaneHandle;

    [[nodiscard]] lane_value_t lane(const BlockAddress &address) const;
};

} // namespace blockflow
