//
// Forward declarations and the small set of aliases shared by every blockflow header.
//

#ifndef BLOCKFLOW_FORWARD_DECLARATIONS_H
#define BLOCKFLOW_FORWARD_DECLARATIONS_H

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

namespace blockflow {
    using entity_index_t = std::size_t;
    using block_index_t = std::size_t;
    using lane_index_t = std::size_t;

    // Every lane in a block stream holds one of these.
    using lane_value_t = float;

    using LaneSpan = std::span<lane_value_t>;
    using ConstLaneSpan = std::span<const lane_value_t>;

    /**
     * The result of a block query: the block's lanes when present, std::nullopt when no entity
     * in the block's range has populated the node yet. Absence is never reported as zeros.
     */
    using BlockResult = std::optional<ConstLaneSpan>;

    struct BlockConfig;
    struct BlockAddress;
    class SparseBlockStore;

    struct BlockNotifiable;
    struct ScalarNotifiable;

    class BlockNode;
    class InputBlockNode;
    class LaneHandle;
    class DerivedBlockNode;
    class UnaryBlockNode;
    class BinaryBlockNode;
    class TernaryBlockNode;
    class UnaryScalarBlockNode;
    class BinaryScalarBlockNode;

    template<typename T>
    class ScalarNode;
    template<typename T>
    class InputScalarNode;
    template<typename T>
    class ReduceScalarNode;

    class BlockGraph;
    class LocalTransformGraph;

    using block_node_ptr = std::shared_ptr<BlockNode>;
    using input_block_node_ptr = std::shared_ptr<InputBlockNode>;

    template<typename T>
    using scalar_node_ptr_t = std::shared_ptr<ScalarNode<T>>;
    using scalar_node_ptr = scalar_node_ptr_t<lane_value_t>;
} // namespace blockflow

#endif //BLOCKFLOW_FORWARD_DECLARATIONS_H
