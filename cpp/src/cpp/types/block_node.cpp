#include <blockflow/types/block_node.h>
#include <blockflow/util/debug_log.h>

namespace blockflow {

    BlockNode::BlockNode(const BlockConfig &config, std::string label) : store_{config}, label_{std::move(label)} {}

    void BlockNode::recalculate() {
        for (block_index_t block_index = 0; block_index < block_count(); ++block_index) {
            (void)recalculate_block(block_index);
        }
    }

    std::optional<lane_value_t> BlockNode::value_at(entity_index_t entity_index) const {
        auto address = store_.locate(entity_index);
        auto block = store_.try_get_block(address.block_index);
        if (!block) { return std::nullopt; }
        return (*block)[address.lane_index];
    }

    void BlockNode::mark_stale(block_index_t block_index) {
        if (debug_enabled(DebugChannel::Staleness) && !store_.is_stale(block_index)) {
            debug_log(DebugChannel::Staleness, "{} block {} stale", label_, block_index);
        }
        store_.mark_stale(block_index);
    }

    void BlockNode::mark_all_stale() {
        for (block_index_t block_index = 0; block_index < block_count(); ++block_index) { mark_stale(block_index); }
    }

} // namespace blockflow
