#pragma once

/**
 * @file block_config.h
 * @brief BlockConfig - geometry and fill policy shared by a connected block subgraph.
 */

#include <blockflow/blockflow_base.h>

#include <bit>
#include <cstdint>
#include <string>
#include <type_traits>

#ifndef BLOCKFLOW_MAX_ENTITIES
#define BLOCKFLOW_MAX_ENTITIES 8192
#endif

namespace blockflow {

enum class AllocationMode : uint8_t {
    Sparse = 0,  // a block is allocated on its first successful write or recompute
    Dense = 1,   // every block is allocated at construction
};

inline constexpr std::size_t MAX_ENTITIES = BLOCKFLOW_MAX_ENTITIES;

/**
 * Number of float lanes in the widest vector register the build targets.
 */
constexpr uint16_t host_simd_lanes() noexcept {
#if defined(__AVX512F__)
    return 64 / sizeof(lane_value_t);
#elif defined(__AVX__)
    return 32 / sizeof(lane_value_t);
#else
    return 16 / sizeof(lane_value_t);
#endif
}

struct BLOCKFLOW_EXPORT BlockConfig {
    lane_value_t fill_value{0.0f};
    AllocationMode allocation{AllocationMode::Sparse};
    uint16_t block_size{host_simd_lanes()};
    std::size_t capacity{MAX_ENTITIES};

    [[nodiscard]] bool dense() const { return allocation == AllocationMode::Dense; }

    /**
     * ceil(capacity / block_size)
     */
    [[nodiscard]] block_index_t block_count() const;

    /**
     * Two configs may be joined by a dependency edge when their block geometry agrees.
     * The fill value and allocation mode are per node and do not take part.
     */
    [[nodiscard]] bool compatible_with(const BlockConfig &other) const;

    /**
     * @throws ConfigurationError when block_size or capacity is zero.
     */
    void validate() const;

    [[nodiscard]] std::string to_string() const;

    // Convenience copies used when wiring a graph.
    [[nodiscard]] BlockConfig with_fill(lane_value_t fill) const;
    [[nodiscard]] BlockConfig with_allocation(AllocationMode mode) const;
};

/**
 * Identity test used by the mutable leaves: two values are the same when their representation is the same.
 * This keeps a NaN write idempotent and treats -0.0 and +0.0 as different values.
 */
template<typename T>
[[nodiscard]] constexpr bool same_value(T lhs, T rhs) noexcept {
    if constexpr (std::is_same_v<T, float>) {
        return std::bit_cast<uint32_t>(lhs) == std::bit_cast<uint32_t>(rhs);
    } else if constexpr (std::is_same_v<T, double>) {
        return std::bit_cast<uint64_t>(lhs) == std::bit_cast<uint64_t>(rhs);
    } else {
        return lhs == rhs;
    }
}

} // namespace blockflow

template<>
struct fmt::formatter<blockflow::AllocationMode> : fmt::formatter<std::string_view> {
    auto format(blockflow::AllocationMode mode, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(
            mode == blockflow::AllocationMode::Dense ? "dense" : "sparse", ctx);
    }
};
