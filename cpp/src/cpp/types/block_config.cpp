#include <blockflow/types/block_config.h>
#include <blockflow/util/errors.h>

namespace blockflow {

    block_index_t BlockConfig::block_count() const {
        return (capacity + block_size - 1) / block_size;
    }

    bool BlockConfig::compatible_with(const BlockConfig &other) const {
        return block_size == other.block_size && capacity == other.capacity;
    }

    void BlockConfig::validate() const {
        if (block_size == 0) { throw_error<ConfigurationError>("BlockConfig: block_size must be positive, got {}", to_string()); }
        if (capacity == 0) { throw_error<ConfigurationError>("BlockConfig: capacity must be positive, got {}", to_string()); }
    }

    std::string BlockConfig::to_string() const {
        return fmt::format("BlockConfig(block_size={}, capacity={}, fill={}, {})", block_size, capacity, fill_value,
                           allocation);
    }

    BlockConfig BlockConfig::with_fill(lane_value_t fill) const {
        auto copy{*this};
        copy.fill_value = fill;
        return copy;
    }

    BlockConfig BlockConfig::with_allocation(AllocationMode mode) const {
        auto copy{*this};
        copy.allocation = mode;
        return copy;
    }

} // namespace blockflow
