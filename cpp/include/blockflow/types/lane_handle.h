#pragma once

#include <blockflow/types/block_address.h>

namespace blockflow {

/**
 * A direct read/write handle on one entity's lane of an InputBlockNode.
 *
 * The address translation is done once when the handle is created and the block is allocated at that
 * point, so reads never observe an absent block. Writes go through the leaf and keep the identity
 * short-circuit and staleness announcement.
 *
 * Only InputBlockNode::instance_for creates handles. The handle does not own the node; it is valid for as long as the node is.
 */
class BLOCKFLOW_EXPORT LaneHandle {
public:
    [[nodiscard]] lane_value_t value() const;

    void set(lane_value_t value);

    [[nodiscard]] const BlockAddress &address() const { return address_; }

    operator lane_value_t() const { return value(); }

    LaneHandle &operator=(lane_value_t value) {
        set(value);
        return *this;
    }

private:
    friend class InputBlockNode;

    LaneHandle(InputBlockNode &node, BlockAddress address) : node_{&node}, address_{address} {}

    InputBlockNode *node_;
    BlockAddress address_;
};

} // namespace blockflow
