#pragma once

/**
 * @file sparse_block_store.h
 * @brief SparseBlockStore - per-node lane storage with per-block staleness.
 *
 * The store owns block_count optional lane blocks plus two flags per block:
 *
 * - stale:     the cached block (or its absence) does not reflect the upstream state. A block is only
 *              served from cache when this is clear.
 * - announced: the staleness has been announced to subscribers and no pull of this block has happened
 *              since. mark_stale() only notifies when this is clear, so a burst of writes between two pulls
 *              costs one notification, while a block left stale by an abandoned pull still re-announces
 *              on the next upstream change.
 *
 * Every block starts stale and announced: nothing downstream can have consumed it yet.
 */

#include <blockflow/types/block_address.h>
#include <blockflow/types/block_config.h>
#include <blockflow/types/observer_list.h>

#include <cstdint>
#include <memory>
#include <new>
#include <vector>

namespace blockflow {

inline constexpr std::size_t LANE_ALIGNMENT = 64;

struct AlignedLaneDeleter {
    void operator()(lane_value_t *lanes) const noexcept {
        ::operator delete[](lanes, std::align_val_t{LANE_ALIGNMENT});
    }
};

using LaneBuffer = std::unique_ptr<lane_value_t[], AlignedLaneDeleter>;

class BLOCKFLOW_EXPORT SparseBlockStore {
public:
    explicit SparseBlockStore(const BlockConfig &config);

    SparseBlockStore(const SparseBlockStore&) = delete;
    SparseBlockStore& operator=(const SparseBlockStore&) = delete;
    SparseBlockStore(SparseBlockStore&&) noexcept = default;
    SparseBlockStore& operator=(SparseBlockStore&&) noexcept = default;

    [[nodiscard]] const BlockConfig &config() const { return config_; }

    [[nodiscard]] block_index_t block_count() const { return blocks_.size(); }

    [[nodiscard]] std::size_t block_size() const { return config_.block_size; }

    /**
     * @throws std::out_of_range when entity_index is beyond the configured capacity.
     */
    [[nodiscard]] BlockAddress locate(entity_index_t entity_index) const;

    /**
     * @throws std::out_of_range when block_index >= block_count().
     */
    void check_block_index(block_index_t block_index) const;

    // ========== Blocks ==========

    [[nodiscard]] bool has_block(block_index_t block_index) const;

    /**
     * The block's lanes, or std::nullopt when the block has never been allocated.
     */
    [[nodiscard]] BlockResult try_get_block(block_index_t block_index) const;

    /**
     * Returns the block, allocating it filled with the configured fill value when absent.
     */
    LaneSpan allocate_block(block_index_t block_index);

    /**
     * Returns a block to its initial state: released when sparse, refilled with the fill value when dense.
     */
    void reset_block(block_index_t block_index);

    [[nodiscard]] std::size_t allocated_block_count() const;

    // ========== Staleness ==========

    [[nodiscard]] bool is_stale(block_index_t block_index) const;

    /**
     * Flags the block stale. Subscribers are notified only when the staleness has not already been announced
     * since the last pull of this block.
     * @return true when subscribers were notified
     */
    bool mark_stale(block_index_t block_index);

    void clear_stale(block_index_t block_index);

    /**
     * Called at the start of every pull of block_index, successful or not.
     */
    void rearm(block_index_t block_index);

    // ========== Subscribers ==========

    void subscribe(BlockNotifiable *observer) { observers_.add_observer(observer); }

    void unsubscribe(BlockNotifiable *observer) { observers_.remove_observer(observer); }

    [[nodiscard]] std::size_t subscriber_count() const { return observers_.size(); }

private:
    [[nodiscard]] LaneBuffer make_block() const;

    BlockConfig config_;
    std::vector<LaneBuffer> blocks_;
    std::vector<uint8_t> stale_;
    std::vector<uint8_t> announced_;
    BlockObserverList observers_;
};

} // namespace blockflow
