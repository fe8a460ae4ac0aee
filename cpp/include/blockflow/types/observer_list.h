#pragma once

/**
 * @file observer_list.h
 * @brief ObserverList - List of subscribers for staleness announcements.
 *
 * Each block store and each scalar node owns one ObserverList. Subscribers are the downstream nodes
 * that were constructed over it; the list never owns them. Downstream nodes subscribe in their
 * constructor and unsubscribe in their destructor, and since they hold shared ownership of their
 * upstreams the list always outlives its subscribers.
 */

#include <blockflow/types/notifiable.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace blockflow {

/**
 * @brief Non-owning list of observers of type Observer.
 *
 * Key characteristics:
 * - Maintains a list of Observer pointers (non-owning)
 * - Supports add/remove of observers
 * - notify(args...) forwards to Observer::notify(args...) on every entry, in subscription order
 * - Safe to notify on empty list (no-op)
 */
template<typename Observer>
class ObserverList {
public:
    ObserverList() = default;

    ObserverList(const ObserverList&) = default;
    ObserverList(ObserverList&&) noexcept = default;
    ObserverList& operator=(const ObserverList&) = default;
    ObserverList& operator=(ObserverList&&) noexcept = default;

    // ========== Observer Management ==========

    /**
     * @brief Add an observer to the list.
     * @param obs The observer to add (caller retains ownership)
     * @note Adding the same observer multiple times results in multiple notifications
     */
    void add_observer(Observer* obs) {
        if (obs) { observers_.push_back(obs); }
    }

    /**
     * @brief Remove an observer from the list.
     * @note If the observer was added multiple times, only the first instance is removed
     */
    void remove_observer(Observer* obs) {
        auto it = std::find(observers_.begin(), observers_.end(), obs);
        if (it != observers_.end()) { observers_.erase(it); }
    }

    // ========== Notification ==========

    template<typename... Args>
    void notify(Args... args) const {
        for (auto* obs : observers_) { obs->notify(args...); }
    }

    void clear() { observers_.clear(); }

    [[nodiscard]] bool empty() const { return observers_.empty(); }

    [[nodiscard]] size_t size() const { return observers_.size(); }

private:
    std::vector<Observer*> observers_;
};

using BlockObserverList = ObserverList<BlockNotifiable>;
using ScalarObserverList = ObserverList<ScalarNotifiable>;

} // namespace blockflow
