#include <blockflow/types/sparse_block_store.h>
#include <blockflow/util/errors.h>

#include <algorithm>

namespace blockflow {

    SparseBlockStore::SparseBlockStore(const BlockConfig &config) : config_{config} {
        config_.validate();
        auto count = config_.block_count();
        blocks_.resize(count);
        stale_.assign(count, 1);
        announced_.assign(count, 1);
        if (config_.dense()) {
            for (auto &block : blocks_) { block = make_block(); }
        }
    }

    BlockAddress SparseBlockStore::locate(entity_index_t entity_index) const {
        if (entity_index >= config_.capacity) {
            throw_error<std::out_of_range>("Entity index {} is outside the capacity {}", entity_index, config_.capacity);
        }
        return blockflow::locate(entity_index, config_.block_size);
    }

    void SparseBlockStore::check_block_index(block_index_t block_index) const {
        if (block_index >= blocks_.size()) {
            throw_error<std::out_of_range>("Block index {} is outside the block count {}", block_index, blocks_.size());
        }
    }

    bool SparseBlockStore::has_block(block_index_t block_index) const {
        check_block_index(block_index);
        return blocks_[block_index] != nullptr;
    }

    BlockResult SparseBlockStore::try_get_block(block_index_t block_index) const {
        check_block_index(block_index);
        const auto &block = blocks_[block_index];
        if (!block) { return std::nullopt; }
        return ConstLaneSpan{block.get(), config_.block_size};
    }

    LaneSpan SparseBlockStore::allocate_block(block_index_t block_index) {
        check_block_index(block_index);
        auto &block = blocks_[block_index];
        if (!block) { block = make_block(); }
        return LaneSpan{block.get(), config_.block_size};
    }

    void SparseBlockStore::reset_block(block_index_t block_index) {
        check_block_index(block_index);
        auto &block = blocks_[block_index];
        if (!block) { return; }
        if (config_.dense()) {
            std::fill_n(block.get(), config_.block_size, config_.fill_value);
        } else {
            block.reset();
        }
    }

    std::size_t SparseBlockStore::allocated_block_count() const {
        return static_cast<std::size_t>(
            std::count_if(blocks_.begin(), blocks_.end(), [](const LaneBuffer &block) { return block != nullptr; }));
    }

    bool SparseBlockStore::is_stale(block_index_t block_index) const {
        check_block_index(block_index);
        return stale_[block_index] != 0;
    }

    bool SparseBlockStore::mark_stale(block_index_t block_index) {
        check_block_index(block_index);
        stale_[block_index] = 1;
        if (announced_[block_index] != 0) { return false; }
        announced_[block_index] = 1;
        observers_.notify(block_index);
        return true;
    }

    void SparseBlockStore::clear_stale(block_index_t block_index) {
        check_block_index(block_index);
        stale_[block_index] = 0;
    }

    void SparseBlockStore::rearm(block_index_t block_index) {
        check_block_index(block_index);
        announced_[block_index] = 0;
    }

    LaneBuffer SparseBlockStore::make_block() const {
        auto *lanes = static_cast<lane_value_t *>(
            ::operator new[](config_.block_size * sizeof(lane_value_t), std::align_val_t{LANE_ALIGNMENT}));
        std::fill_n(lanes, config_.block_size, config_.fill_value);
        return LaneBuffer{lanes};
    }

} // namespace blockflow
