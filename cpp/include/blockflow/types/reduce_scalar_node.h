#pragma once

/**
 * @file reduce_scalar_node.h
 * @brief ReduceScalarNode - reduces a block node to one optional value.
 */

#include <blockflow/types/block_node.h>
#include <blockflow/types/scalar_node.h>
#include <blockflow/util/errors.h>

#include <cstdint>
#include <span>
#include <vector>

namespace blockflow {

/**
 * Reduces every present block of the input with reduce_block(), then folds the per-block results with
 * aggregate(). Absent blocks are skipped; with no present block the value is absent, never a computed zero.
 *
 * Per-block results are cached: a pull re-reduces only the blocks the input announced stale since they were
 * last reduced, but still pulls every block index so the input is brought up to date.
 *
 * T is the reduced numeric type (a float mean, an integer count, ...).
 */
template<typename T>
class ReduceScalarNode : public ScalarNode<T>, public BlockNotifiable {
public:
    ~ReduceScalarNode() override { input_->unsubscribe(this); }

    std::optional<T> recalculate() override {
        this->rearm();
        if (!this->is_stale()) { return this->value(); }

        present_.clear();
        for (block_index_t block_index = 0; block_index < input_->block_count(); ++block_index) {
            auto block = input_->recalculate_block(block_index);
            if (!block) {
                block_results_[block_index].reset();
                continue;
            }
            if (block_stale_[block_index] != 0 || !block_results_[block_index].has_value()) {
                block_results_[block_index] = reduce_block(*block);
                block_stale_[block_index] = 0;
            }
            present_.push_back(*block_results_[block_index]);
        }

        this->store_value(present_.empty() ? std::nullopt : aggregate(std::span<const T>{present_}));
        this->clear_stale();
        debug_log(DebugChannel::Recompute, "{} reduced {} present blocks", this->label(), present_.size());
        return this->value();
    }

    void notify(block_index_t block_index) override {
        block_stale_[block_index] = 1;
        this->mark_stale();
    }

    [[nodiscard]] const block_node_ptr &input() const { return input_; }

protected:
    explicit ReduceScalarNode(block_node_ptr input, std::string label)
        : ScalarNode<T>(std::nullopt, std::move(label)), input_{std::move(input)} {
        if (!input_) { throw_error<ConfigurationError>("{}: reduction input must not be null", this->label()); }
        block_results_.resize(input_->block_count());
        block_stale_.assign(input_->block_count(), 1);
        present_.reserve(input_->block_count());
        input_->subscribe(this);
    }

    /**
     * Reduces one present block to one value.
     */
    [[nodiscard]] virtual T reduce_block(ConstLaneSpan block) const = 0;

    /**
     * Folds the per-block results of the present blocks, in block order. Never called with an empty span.
     */
    [[nodiscard]] virtual std::optional<T> aggregate(std::span<const T> results) const = 0;

private:
    block_node_ptr input_;
    std::vector<std::optional<T>> block_results_;
    std::vector<uint8_t> block_stale_;
    std::vector<T> present_;
};

} // namespace blockflow
