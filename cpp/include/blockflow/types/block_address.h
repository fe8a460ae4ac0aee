#pragma once

#include <blockflow/blockflow_base.h>

namespace blockflow {

/**
 * Block coordinates of an entity: entity_index == block_index * block_size + lane_index.
 */
struct BlockAddress {
    block_index_t block_index{0};
    lane_index_t lane_index{0};

    [[nodiscard]] entity_index_t entity_index(std::size_t block_size) const {
        return block_index * block_size + lane_index;
    }

    bool operator==(const BlockAddress &) const = default;
};

/**
 * Pure division / modulo. Every node sharing a subgraph uses the same block_size, so the same entity maps
 * to the same coordinates on every node.
 */
[[nodiscard]] constexpr BlockAddress locate(entity_index_t entity_index, std::size_t block_size) noexcept {
    return BlockAddress{entity_index / block_size, entity_index % block_size};
}

} // namespace blockflow

template<>
struct fmt::formatter<blockflow::BlockAddress> : fmt::formatter<std::string_view> {
    auto format(const blockflow::BlockAddress &addr, format_context &ctx) const {
        return fmt::format_to(ctx.out(), "(block={}, lane={})", addr.block_index, addr.lane_index);
    }
};
