#include <catch2/catch_test_macros.hpp>

#include <blockflow/types/scalar_node.h>

using namespace blockflow;

namespace {
    struct CountingObserver : ScalarNotifiable {
        int count{0};
        void notify() override { ++count; }
    };
}

TEST_CASE("InputScalarNode - initial value", "[scalar_node]") {
    InputScalarNode<lane_value_t> present{2.0f, "present"};
    InputScalarNode<lane_value_t> absent;

    CHECK(present.recalculate() == 2.0f);
    CHECK(present.label() == "present");
    CHECK_FALSE(absent.recalculate().has_value());
    CHECK(absent.label() == "scalar");
}

TEST_CASE("InputScalarNode - set announces once per pull", "[scalar_node][staleness]") {
    InputScalarNode<lane_value_t> node{1.0f};
    CountingObserver observer;
    node.subscribe(&observer);
    (void)node.recalculate();
    CHECK_FALSE(node.is_stale());

    node.set(1.0f);
    CHECK_FALSE(node.is_stale());
    CHECK(observer.count == 0);

    node.set(2.0f);
    node.set(3.0f);
    CHECK(node.is_stale());
    CHECK(observer.count == 1);
    CHECK(node.value() == 3.0f);

    CHECK(node.recalculate() == 3.0f);
    node.set(4.0f);
    CHECK(observer.count == 2);

    node.unsubscribe(&observer);
    CHECK(node.subscriber_count() == 0);
}

TEST_CASE("InputScalarNode - reset makes the value absent", "[scalar_node]") {
    InputScalarNode<lane_value_t> node{5.0f};
    CountingObserver observer;
    node.subscribe(&observer);
    (void)node.recalculate();

    node.reset();
    CHECK(observer.count == 1);
    CHECK_FALSE(node.recalculate().has_value());

    // Already absent
    node.reset();
    CHECK(observer.count == 1);
    CHECK_FALSE(node.is_stale());

    node.unsubscribe(&observer);
}

TEST_CASE("InputScalarNode - integer values", "[scalar_node]") {
    InputScalarNode<int64_t> node{int64_t{7}};
    node.set(8);
    CHECK(node.recalculate() == int64_t{8});
}
