#include <blockflow/types/input_block_node.h>
#include <blockflow/util/errors.h>

#include <algorithm>

namespace blockflow {

    InputBlockNode::InputBlockNode(const BlockConfig &config, std::string label) : BlockNode(config, std::move(label)) {}

    void InputBlockNode::set(entity_index_t entity_index, lane_value_t value) { set(locate(entity_index), value); }

    void InputBlockNode::set(const BlockAddress &address, lane_value_t value) {
        if (address.lane_index >= block_size()) {
            throw_error<std::out_of_range>("{}: lane index {} is outside the block size {}", label(), address.lane_index,
                                           block_size());
        }
        auto &blocks = store();
        const bool newly_allocated = !blocks.has_block(address.block_index);
        auto block = blocks.allocate_block(address.block_index);
        if (!newly_allocated && same_value(block[address.lane_index], value)) { return; }
        block[address.lane_index] = value;
        mark_stale(address.block_index);
    }

    void InputBlockNode::assign_block(block_index_t block_index, ConstLaneSpan values) {
        if (values.size() != block_size()) {
            throw_error<std::invalid_argument>("{}: assign_block expects {} lanes, got {}", label(), block_size(),
                                               values.size());
        }
        auto &blocks = store();
        bool changed = !blocks.has_block(block_index);
        auto block = blocks.allocate_block(block_index);
        for (std::size_t lane = 0; lane < block.size(); ++lane) {
            if (same_value(block[lane], values[lane])) { continue; }
            block[lane] = values[lane];
            changed = true;
        }
        if (changed) { mark_stale(block_index); }
    }

    LaneHandle InputBlockNode::instance_for(entity_index_t entity_index) {
        auto address = locate(entity_index);
        if (!store().has_block(address.block_index)) {
            (void)store().allocate_block(address.block_index);
            mark_stale(address.block_index);
        }
        return LaneHandle{*this, address};
    }

    BlockResult InputBlockNode::recalculate_block(block_index_t block_index) {
        auto &blocks = store();
        blocks.rearm(block_index);
        blocks.clear_stale(block_index);
        return blocks.try_get_block(block_index);
    }

    lane_value_t InputBlockNode::lane(const BlockAddress &address) const {
        // instance_for allocated the block and leaves never release blocks
        return (*store().try_get_block(address.block_index))[address.lane_index];
    }

    lane_value_t LaneHandle::value() const { return node_->lane(address_); }

    void LaneHandle::set(lane_value_t value) { node_->set(address_, value); }

} // namespace blockflow
