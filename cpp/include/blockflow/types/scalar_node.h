#pragma once

/**
 * @file scalar_node.h
 * @brief ScalarNode - a single optional value with staleness, and its mutable leaf InputScalarNode.
 */

#include <blockflow/types/block_config.h>
#include <blockflow/types/observer_list.h>
#include <blockflow/util/debug_log.h>

#include <optional>
#include <string>
#include <utility>

namespace blockflow {

/**
 * Pull interface for one optional value of type T.
 *
 * Staleness follows the same rules as a block: the value is recomputed only when stale, and subscribers
 * hear about staleness at most once between two pulls.
 */
template<typename T>
class ScalarNode {
public:
    using value_type = T;

    virtual ~ScalarNode() = default;

    ScalarNode(const ScalarNode&) = delete;
    ScalarNode& operator=(const ScalarNode&) = delete;
    ScalarNode(ScalarNode&&) = delete;
    ScalarNode& operator=(ScalarNode&&) = delete;

    /**
     * Brings the value up to date, recomputing only when stale.
     * @return the value, or std::nullopt when there is no data
     */
    virtual std::optional<T> recalculate() = 0;

    /**
     * The cached value without any recomputation.
     */
    [[nodiscard]] const std::optional<T> &value() const { return value_; }

    [[nodiscard]] bool is_stale() const { return stale_; }

    void subscribe(ScalarNotifiable *observer) { observers_.add_observer(observer); }

    void unsubscribe(ScalarNotifiable *observer) { observers_.remove_observer(observer); }

    [[nodiscard]] std::size_t subscriber_count() const { return observers_.size(); }

    [[nodiscard]] const std::string &label() const { return label_; }

    void set_label(std::string label) { label_ = std::move(label); }

protected:
    explicit ScalarNode(std::optional<T> value, std::string label)
        : value_{std::move(value)}, label_{std::move(label)} {}

    void mark_stale() {
        if (!stale_) { debug_log(DebugChannel::Staleness, "{} stale", label_); }
        stale_ = true;
        if (announced_) { return; }
        announced_ = true;
        observers_.notify();
    }

    // Start of every pull, successful or not.
    void rearm() { announced_ = false; }

    void clear_stale() { stale_ = false; }

    void store_value(std::optional<T> value) { value_ = std::move(value); }

private:
    std::optional<T> value_;
    std::string label_;
    bool stale_{true};
    bool announced_{true};
    ScalarObserverList observers_;
};

/**
 * A mutable scalar leaf. set() is a no-op when the value is unchanged; otherwise it stores the value and
 * announces staleness to every subscriber, which invalidates all of their blocks.
 */
template<typename T>
class InputScalarNode final : public ScalarNode<T> {
public:
    explicit InputScalarNode(std::optional<T> initial = std::nullopt, std::string label = "scalar")
        : ScalarNode<T>(std::move(initial), std::move(label)) {}

    void set(T value) {
        const auto &current = this->value();
        if (current.has_value() && same_value(*current, value)) { return; }
        this->store_value(value);
        this->mark_stale();
    }

    /**
     * Makes the value absent again. Consumers drop the blocks computed from it on their next pull.
     */
    void reset() {
        if (!this->value().has_value()) { return; }
        this->store_value(std::nullopt);
        this->mark_stale();
    }

    std::optional<T> recalculate() override {
        this->rearm();
        this->clear_stale();
        return this->value();
    }
};

template<typename T>
using input_scalar_node_ptr_t = std::shared_ptr<InputScalarNode<T>>;
using input_scalar_node_ptr = input_scalar_node_ptr_t<lane_value_t>;

} // namespace blockflow
