#pragma once

#include <blockflow/blockflow_base.h>

namespace blockflow
{
    /**
     * Receives a staleness announcement for one block index of an upstream block node.
     * Implementations must only record the staleness; recomputation happens on the next pull.
     */
    struct BlockNotifiable {
        virtual ~BlockNotifiable() = default;

        virtual void notify(block_index_t block_index) = 0;
    };

    /**
     * Receives a staleness announcement from an upstream scalar node. A scalar change affects every
     * block of a consumer, so there is no index.
     */
    struct ScalarNotifiable {
        virtual ~ScalarNotifiable() = default;

        virtual void notify() = 0;
    };
}
